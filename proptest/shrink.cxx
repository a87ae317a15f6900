#include "shrink.hxx"
#include "describe.hxx"


namespace treewalk::proptest
{

generator<test_tree> shrink_candidates(const test_node* tree)
{
    if (!tree)
        co_return;

    if (tree->left())
        co_yield clone(tree->left());

    if (tree->right())
        co_yield clone(tree->right());

    if (tree->left())
        co_yield make_node(tree->value(), test_tree{}, clone(tree->right()));

    if (tree->right())
        co_yield make_node(tree->value(), clone(tree->left()), test_tree{});

    for (auto& smaller : shrink_candidates(tree->left()))
        co_yield make_node(tree->value(), std::move(smaller), clone(tree->right()));

    for (auto& smaller : shrink_candidates(tree->right()))
        co_yield make_node(tree->value(), clone(tree->left()), std::move(smaller));
}


shrink_result minimize(test_tree tree, const failure_predicate& still_fails, std::size_t max_steps)
{
    VerboseBlock("minimize({} nodes)", size(tree.get()));

    shrink_result result;
    result.tree = std::move(tree);

    while (result.steps < max_steps)
    {
        test_tree better;

        {
            auto candidates = shrink_candidates(result.tree.get());
            while (auto candidate = candidates.next())
            {
                ++result.attempts;

                if (still_fails(**candidate))
                {
                    better = std::move(*candidate);
                    break;
                }
            }
        }

        if (!better)
            break;

        result.tree = std::move(better);
        ++result.steps;

        Verbose("step {}: {}", result.steps, describe(result.tree.get()));
    }

    return result;
}


} // namespace treewalk::proptest {}
