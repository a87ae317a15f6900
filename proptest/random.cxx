#include "random.hxx"

#include <stdexcept>


namespace treewalk::proptest
{

std::size_t random_source::draw_index(std::size_t bound)
{
    if (bound == 0)
        throw std::invalid_argument("draw_index: empty range");

    std::uniform_int_distribution<std::size_t> dist(0, bound - 1);
    return dist(engine_);
}

std::size_t random_source::draw_between(std::size_t lo, std::size_t hi)
{
    if (lo > hi)
        throw std::invalid_argument("draw_between: inverted range");

    std::uniform_int_distribution<std::size_t> dist(lo, hi);
    return dist(engine_);
}

bool random_source::draw_bool(double probability)
{
    std::bernoulli_distribution dist(probability);
    return dist(engine_);
}


std::uint64_t derive_seed(std::uint64_t base, std::uint64_t stream) noexcept
{
    std::uint64_t z = base + (stream + 1) * 0x9e3779b97f4a7c15ull;
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ull;
    z = (z ^ (z >> 27)) * 0x94d049bb133111ebull;
    return z ^ (z >> 31);
}

std::uint64_t fresh_seed()
{
    std::random_device rd;
    return (std::uint64_t(rd()) << 32) | rd();
}


test_value value_source::next()
{
    for (;;)
    {
        auto candidate = draws_.draw_u64();
        if (used_.insert(candidate).second)
            return candidate;

        Verbose("value_source: collision on {}, redrawing", candidate);
    }
}


} // namespace treewalk::proptest {}
