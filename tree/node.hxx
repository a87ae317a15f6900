#pragma once

#include "common.hxx"

#include <algorithm>
#include <memory>
#include <utility>
#include <vector>


namespace treewalk
{

//
// Binary tree node. A node exclusively owns its children and is never
// modified after construction; there are no parent links.
//
template <typename _ValueType>
class node
{
public:
    using value_type = _ValueType;
    using ptr = std::unique_ptr<node>;

    explicit node(value_type value, ptr left = {}, ptr right = {})
        : value_(std::move(value))
        , left_(std::move(left))
        , right_(std::move(right))
    {
    }

    // children are unlinked into a work list first so that tearing down
    // a tall tree does not recurse once per level
    ~node()
    {
        std::vector<ptr> pending;
        detach(pending);

        while (!pending.empty())
        {
            auto victim = std::move(pending.back());
            pending.pop_back();
            victim->detach(pending);
        }
    }

    node(const node&) = delete;
    node& operator=(const node&) = delete;

    const value_type& value() const noexcept
    {
        return value_;
    }

    const node* left() const noexcept
    {
        return left_.get();
    }

    const node* right() const noexcept
    {
        return right_.get();
    }

    bool leaf() const noexcept
    {
        return !left_ && !right_;
    }

private:
    void detach(std::vector<ptr>& to)
    {
        if (left_)
            to.push_back(std::move(left_));
        if (right_)
            to.push_back(std::move(right_));
    }

    value_type value_;
    ptr left_;
    ptr right_;
};


template <typename _ValueType>
using node_ptr = typename node<_ValueType>::ptr;


template <typename _ValueType>
node_ptr<_ValueType> make_node(_ValueType value, node_ptr<_ValueType> left = {}, node_ptr<_ValueType> right = {})
{
    return std::make_unique<node<_ValueType>>(std::move(value), std::move(left), std::move(right));
}


// 1 + size(left) + size(right); an absent tree has size 0
template <typename _ValueType>
std::size_t size(const node<_ValueType>* root)
{
    if (!root)
        return 0;

    std::size_t count = 0;
    std::vector<const node<_ValueType>*> stack{ root };

    while (!stack.empty())
    {
        auto top = stack.back();
        stack.pop_back();
        ++count;

        if (top->left())
            stack.push_back(top->left());
        if (top->right())
            stack.push_back(top->right());
    }

    return count;
}

// nodes on the longest root-to-leaf path
template <typename _ValueType>
std::size_t height(const node<_ValueType>* root)
{
    if (!root)
        return 0;

    std::size_t tallest = 0;
    std::vector<std::pair<const node<_ValueType>*, std::size_t>> stack{ { root, 1 } };

    while (!stack.empty())
    {
        auto [top, depth] = stack.back();
        stack.pop_back();
        tallest = std::max(tallest, depth);

        if (top->left())
            stack.emplace_back(top->left(), depth + 1);
        if (top->right())
            stack.emplace_back(top->right(), depth + 1);
    }

    return tallest;
}

template <typename _ValueType>
node_ptr<_ValueType> clone(const node<_ValueType>* root)
{
    if (!root)
        return {};

    return make_node(root->value(), clone(root->left()), clone(root->right()));
}

// structural and value equality; identity plays no part
template <typename _ValueType>
bool same_shape(const node<_ValueType>* a, const node<_ValueType>* b)
{
    if (!a || !b)
        return a == b;

    return a->value() == b->value()
        && same_shape(a->left(), b->left())
        && same_shape(a->right(), b->right());
}


} // namespace treewalk {}
