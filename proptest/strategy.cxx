#include "strategy.hxx"

#include <stdexcept>


namespace treewalk::proptest
{

namespace
{

class tree_builder
{
public:
    tree_builder(random_source& draws, const tree_bounds& bounds, std::size_t budget)
        : draws_(draws)
        , bounds_(bounds)
        , values_(draws)
        , budget_(budget)
    {
    }

    test_tree build(std::size_t depth)
    {
        assert(budget_ > 0);
        --budget_;

        auto value = values_.next();

        if (depth >= bounds_.max_depth)
            return make_node(value);

        auto left = expand(depth + 1);
        auto right = expand(depth + 1);

        return make_node(value, std::move(left), std::move(right));
    }

    std::size_t remaining() const noexcept
    {
        return budget_;
    }

private:
    test_tree expand(std::size_t depth)
    {
        if (budget_ == 0)
            return {};

        if (!draws_.draw_bool(bounds_.branch_probability))
            return {};

        return build(depth);
    }

    random_source& draws_;
    const tree_bounds& bounds_;
    value_source values_;
    std::size_t budget_;
};

} // namespace {}


void validate(const tree_bounds& bounds)
{
    if (bounds.max_depth == 0)
        throw std::invalid_argument("tree bounds: max_depth must be positive");

    if (bounds.max_depth > MaxDepthLimit)
        throw std::invalid_argument(fmt::format("tree bounds: max_depth {} exceeds the limit of {}", bounds.max_depth, MaxDepthLimit));

    if (bounds.max_nodes == 0)
        throw std::invalid_argument("tree bounds: max_nodes must be positive");

    if (!(bounds.branch_probability >= 0.0 && bounds.branch_probability <= 1.0))
        throw std::invalid_argument(fmt::format("tree bounds: branch_probability {} is outside [0, 1]", bounds.branch_probability));
}

test_tree generate_tree(random_source& draws, const tree_bounds& bounds)
{
    validate(bounds);

    auto budget = draws.draw_between(1, bounds.max_nodes);
    tree_builder builder(draws, bounds, budget);

    auto tree = builder.build(1);

    Verbose("generate_tree: budget {}, built {} nodes", budget, budget - builder.remaining());
    return tree;
}


} // namespace treewalk::proptest {}
