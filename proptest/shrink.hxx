#pragma once

#include "generator.hxx"
#include "strategy.hxx"

#include <functional>


namespace treewalk::proptest
{

//
// Lazily yields trees strictly smaller than `tree`, most aggressive first:
// each child subtree on its own, the tree without its left or right child,
// then the tree with one child replaced by each of that child's candidates.
// Every candidate is built from pieces of `tree`, so value uniqueness holds.
//
generator<test_tree> shrink_candidates(const test_node* tree);


using failure_predicate = std::function<bool(const test_node& tree)>;

struct shrink_result
{
    test_tree tree;
    std::size_t steps = 0;      // accepted candidates
    std::size_t attempts = 0;   // candidates evaluated
};

//
// Greedy descent: move to the first candidate that still fails until none
// does or max_steps candidates have been accepted.
//
shrink_result minimize(test_tree tree, const failure_predicate& still_fails, std::size_t max_steps);


} // namespace treewalk::proptest {}
