#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include "runner.hxx"
#include "describe.hxx"
#include "shrink.hxx"

#include <algorithm>
#include <atomic>
#include <limits>
#include <stdexcept>
#include <thread>


namespace treewalk::proptest
{

namespace
{

constexpr std::size_t NoFailure = std::numeric_limits<std::size_t>::max();
constexpr std::uint64_t AuxStream = 0xa0761d6478bd642full;


struct case_seeds
{
    std::uint64_t tree;
    std::uint64_t aux;
};

case_seeds seeds_for(std::uint64_t run_seed, std::size_t index) noexcept
{
    auto tree = derive_seed(run_seed, index);
    return { tree, derive_seed(tree, AuxStream) };
}

// violation text, or nothing when the property held
std::optional<std::string> evaluate(const property& prop, const test_node& tree, std::uint64_t aux_seed)
{
    random_source draws(aux_seed);

    try
    {
        prop.check(tree, draws);
    }
    catch (const property_violation& e)
    {
        return std::string(e.what());
    }
    catch (const std::exception& e)
    {
        return fmt::format("unexpected exception: {}", e.what());
    }
    catch (...)
    {
        return std::string("unexpected exception: unknown");
    }

    return std::nullopt;
}

void lower_to(std::atomic<std::size_t>& lowest, std::size_t index) noexcept
{
    auto current = lowest.load();
    while (index < current && !lowest.compare_exchange_weak(current, index))
    {
    }
}

std::size_t worker_count(const run_config& config)
{
    if (config.workers)
        return config.workers;

    return std::max(1u, std::thread::hardware_concurrency());
}

} // namespace {}


void validate(const run_config& config)
{
    if (config.cases == 0)
        throw std::invalid_argument("run config: at least one case is required");

    validate(config.bounds);
}


std::vector<property> standard_properties(traversal_fn candidate, traversal_fn reference)
{
    return {
        { "completeness", [candidate](const test_node& tree, random_source&) { check_completeness(tree, candidate); } },
        { "ordering", [candidate](const test_node& tree, random_source& draws) { check_ordering(tree, draws, candidate); } },
        { "ordering (exhaustive)", [candidate](const test_node& tree, random_source&) { check_ordering_exhaustive(tree, candidate); } },
        { "equivalence", [candidate, reference](const test_node& tree, random_source&) { check_equivalence(tree, candidate, reference); } },
    };
}


std::string format_report(const report& r)
{
    if (r.passed())
        return fmt::format("{}: OK, {} cases (seed {})", r.property, r.cases_run, r.seed);

    const auto& f = *r.failed;
    return fmt::format(
        "{}: FAILED (seed {})\n"
        "    case #{} (case seed {}) shrunk from {} to {} nodes in {} steps\n"
        "    tree: {}\n"
        "    {}",
        r.property, r.seed,
        f.case_index, f.case_seed, f.original_size, f.shrunk_size, f.shrink_steps,
        f.tree,
        f.message
    );
}


report run_property(const property& prop, const run_config& config)
{
    validate(config);

    report result;
    result.property = prop.name;
    result.seed = config.seed ? config.seed : fresh_seed();

    InfoBlock("{}: running {} cases (seed {})", prop.name, config.cases, result.seed);

    std::atomic<std::size_t> lowest{ NoFailure };
    std::atomic<std::size_t> ran{ 0 };

    {
        boost::asio::thread_pool pool(worker_count(config));

        for (std::size_t i = 0; i < config.cases; ++i)
        {
            boost::asio::post(pool, [&, i]()
            {
                if (i > lowest.load())
                    return; // a lower-index case already failed

                auto seeds = seeds_for(result.seed, i);

                try
                {
                    random_source draws(seeds.tree);
                    auto tree = generate_tree(draws, config.bounds);

                    ++ran;

                    if (evaluate(prop, *tree, seeds.aux))
                    {
                        Verbose("case #{} failed", i);
                        lower_to(lowest, i);
                    }
                }
                catch (const std::exception& e)
                {
                    // replayed below on the calling thread, where it propagates
                    Error("case #{}: {}", i, e.what());
                    lower_to(lowest, i);
                }
                catch (...)
                {
                    Error("case #{}: unknown exception", i);
                    lower_to(lowest, i);
                }
            });
        }

        pool.join();
    }

    result.cases_run = ran.load();

    auto index = lowest.load();
    if (index == NoFailure)
    {
        Info("{}: passed", prop.name);
        return result;
    }

    auto seeds = seeds_for(result.seed, index);
    random_source draws(seeds.tree);
    auto tree = generate_tree(draws, config.bounds);

    failure f;
    f.case_index = index;
    f.case_seed = seeds.tree;
    f.original_size = size(tree.get());

    if (!evaluate(prop, *tree, seeds.aux))
        throw std::runtime_error(fmt::format("{}: case #{} did not fail again on replay", prop.name, index));

    auto shrunk = minimize(
        std::move(tree),
        [&prop, &seeds](const test_node& candidate) { return evaluate(prop, candidate, seeds.aux).has_value(); },
        config.max_shrink_steps
    );

    f.shrunk_size = size(shrunk.tree.get());
    f.shrink_steps = shrunk.steps;
    f.tree = describe(shrunk.tree.get());
    f.message = evaluate(prop, *shrunk.tree, seeds.aux).value_or(std::string{});

    Error("{}: case #{} failed, shrunk to {} nodes: {}", prop.name, index, f.shrunk_size, f.message);

    result.failed = std::move(f);
    return result;
}

std::vector<report> run_properties(const std::vector<property>& props, const run_config& config)
{
    std::vector<report> reports;
    reports.reserve(props.size());

    for (const auto& prop : props)
        reports.push_back(run_property(prop, config));

    return reports;
}


} // namespace treewalk::proptest {}
