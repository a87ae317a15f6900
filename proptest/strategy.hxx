#pragma once

#include "node.hxx"
#include "random.hxx"


namespace treewalk::proptest
{

using test_node = node<test_value>;
using test_tree = node_ptr<test_value>;


// Generation, cloning and rendering recurse once per level.
constexpr std::size_t MaxDepthLimit = 1000;

struct tree_bounds
{
    std::size_t max_depth = 10;     // nodes on the longest root-to-leaf path
    std::size_t max_nodes = 64;     // upper limit of the per-tree node budget
    double branch_probability = 0.6;
};

// throws std::invalid_argument; max_depth is limited to MaxDepthLimit
void validate(const tree_bounds& bounds);


//
// Draws one finite tree with values unique across the tree.
//
// Base rule: a fresh value and no children. Recursive rule: a fresh value
// and two independently chosen children, each either absent or drawn by the
// same rules one level deeper. Expansion stops at max_depth and when a
// node budget, drawn uniformly from [1, max_nodes], is spent.
//
test_tree generate_tree(random_source& draws, const tree_bounds& bounds);


} // namespace treewalk::proptest {}
