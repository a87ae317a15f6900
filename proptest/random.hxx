#pragma once

#include "common.hxx"

#include <random>
#include <unordered_set>


namespace treewalk::proptest
{

using test_value = std::uint64_t;


// Seeded draw source. One instance per case; never shared between threads.
class random_source
{
public:
    explicit random_source(std::uint64_t seed)
        : seed_(seed)
        , engine_(seed)
    {
    }

    std::uint64_t seed() const noexcept
    {
        return seed_;
    }

    std::uint64_t draw_u64()
    {
        return engine_();
    }

    // uniform in [0, bound); bound must be positive
    std::size_t draw_index(std::size_t bound);

    // uniform in [lo, hi]
    std::size_t draw_between(std::size_t lo, std::size_t hi);

    bool draw_bool(double probability);

private:
    std::uint64_t seed_;
    std::mt19937_64 engine_;
};


// splitmix64 step; derives independent per-case seeds from a run seed
std::uint64_t derive_seed(std::uint64_t base, std::uint64_t stream) noexcept;

std::uint64_t fresh_seed();


// Hands out values that are unique within one tree instance.
class value_source
{
public:
    explicit value_source(random_source& draws)
        : draws_(draws)
    {
    }

    test_value next();

private:
    random_source& draws_;
    std::unordered_set<test_value> used_;
};


} // namespace treewalk::proptest {}
