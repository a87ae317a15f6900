#pragma once

#include "generator.hxx"
#include "node.hxx"

#include <unordered_set>
#include <vector>


namespace treewalk
{

//
// In-place (in-order) traversal: left subtree, the node, right subtree.
//
// One generator per level, each delegating its subtrees with co_yield.
// Elements go straight from the innermost generator to the consumer, so the
// walk is O(n). Depth still costs: one live coroutine frame per level of the
// current path, and finished levels hand control back to their parents by
// symmetric transfer, which stays off the host stack only where the compiler
// turns it into a tail call. traverse_stack() has neither cost.
//
template <typename _ValueType>
generator<const node<_ValueType>*> traverse_recursive(const node<_ValueType>* root)
{
    if (!root)
        co_return;

    if (root->left())
        co_yield traverse_recursive(root->left());

    co_yield root;

    if (root->right())
        co_yield traverse_recursive(root->right());
}

//
// Same sequence as traverse_recursive(), produced from an explicit stack.
//
// A node is visited twice: the first pop opens it and pushes
// [right, node, left], the second pop finds it opened and emits it.
// The opened set is keyed by address; values need not be unique.
//
template <typename _ValueType>
generator<const node<_ValueType>*> traverse_stack(const node<_ValueType>* root)
{
    if (!root)
        co_return;

    using node_type = node<_ValueType>;

    std::vector<const node_type*> stack{ root };
    std::unordered_set<const node_type*> opened;

    while (!stack.empty())
    {
        auto top = stack.back();
        stack.pop_back();

        if (opened.contains(top))
        {
            co_yield top;
            continue;
        }

        Verbose("traverse_stack: open {} (depth {})", fmt::ptr(top), stack.size());

        opened.insert(top);

        if (top->right())
            stack.push_back(top->right());

        stack.push_back(top);

        if (top->left())
            stack.push_back(top->left());
    }
}

template <typename _ValueType>
generator<const node<_ValueType>*> traverse(const node<_ValueType>* root)
{
    return traverse_stack(root);
}


// values of an in-order sequence, in emission order
template <typename _ValueType>
std::vector<_ValueType> values_of(generator<const node<_ValueType>*>&& seq)
{
    std::vector<_ValueType> out;

    while (auto n = seq.next())
        out.push_back((*n)->value());

    return out;
}


} // namespace treewalk {}
