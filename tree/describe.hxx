#pragma once

#include "node.hxx"

#include <iterator>
#include <string>

#include <fmt/format.h>


namespace treewalk
{

namespace detail
{

template <typename _ValueType, typename _Out>
_Out describe_to(_Out out, const node<_ValueType>* n)
{
    out = fmt::format_to(out, "node({}", n->value());

    if (n->left())
    {
        out = fmt::format_to(out, ", left=");
        out = describe_to(out, n->left());
    }

    if (n->right())
    {
        out = fmt::format_to(out, ", right=");
        out = describe_to(out, n->right());
    }

    *out++ = ')';
    return out;
}

} // namespace detail {}


// Renders a tree in literal notation, e.g. "node(1, left=node(2), right=node(5))".
template <typename _ValueType>
std::string describe(const node<_ValueType>* root)
{
    if (!root)
        return "None";

    std::string out;
    detail::describe_to(std::back_inserter(out), root);
    return out;
}


} // namespace treewalk {}
