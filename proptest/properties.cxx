#include "properties.hxx"
#include "traverse.hxx"

#include <algorithm>
#include <string_view>
#include <unordered_map>
#include <unordered_set>


namespace treewalk::proptest
{

namespace
{

constexpr std::string_view Completeness = "completeness";
constexpr std::string_view Ordering = "ordering";
constexpr std::string_view Equivalence = "equivalence";


using position_map = std::unordered_map<const test_node*, std::size_t>;

position_map positions(const std::vector<const test_node*>& seq)
{
    position_map at;
    at.reserve(seq.size());

    for (std::size_t i = 0; i < seq.size(); ++i)
        at.emplace(seq[i], i);

    return at;
}

std::size_t position(const position_map& at, const test_node* n, std::string_view role)
{
    auto it = at.find(n);
    if (it == at.end())
        throw property_violation(std::string(Ordering), fmt::format("{} node {} is missing from the full traversal", role, n->value()));

    return it->second;
}

// S must precede/follow the sampled nodes; absent sides are skipped
void check_sides(const position_map& at, const test_node* s, const test_node* l, const test_node* r)
{
    auto s_at = position(at, s, "subtree root");

    if (l)
    {
        auto l_at = position(at, l, "left");
        if (!(l_at < s_at))
        {
            throw property_violation(
                std::string(Ordering),
                fmt::format("left node {} at index {} does not precede subtree root {} at index {}", l->value(), l_at, s->value(), s_at)
            );
        }
    }

    if (r)
    {
        auto r_at = position(at, r, "right");
        if (!(s_at < r_at))
        {
            throw property_violation(
                std::string(Ordering),
                fmt::format("subtree root {} at index {} does not precede right node {} at index {}", s->value(), s_at, r->value(), r_at)
            );
        }
    }
}

const test_node* sample_from(const traversal_fn& traversal, const test_node* subtree, random_source& draws, std::string_view side, const test_node* s)
{
    if (!subtree)
        return nullptr;

    auto seq = collect(traversal(subtree));
    if (seq.empty())
    {
        throw property_violation(
            std::string(Ordering),
            fmt::format("traversal of the {} subtree of {} is empty", side, s->value())
        );
    }

    return seq[draws.draw_index(seq.size())];
}

// structural enumeration, independent of any traversal under test
std::vector<const test_node*> nodes_of(const test_node* root)
{
    std::vector<const test_node*> out;
    if (!root)
        return out;

    std::vector<const test_node*> stack{ root };
    while (!stack.empty())
    {
        auto top = stack.back();
        stack.pop_back();
        out.push_back(top);

        if (top->right())
            stack.push_back(top->right());
        if (top->left())
            stack.push_back(top->left());
    }

    return out;
}

std::string show(const test_node* const* n)
{
    if (!n)
        return "<end>";

    return fmt::format("{}", (*n)->value());
}

} // namespace {}


traversal_fn recursive_traversal()
{
    return [](const test_node* root) { return traverse_recursive(root); };
}

traversal_fn stack_traversal()
{
    return [](const test_node* root) { return traverse_stack(root); };
}


void check_completeness(const test_node& tree, const traversal_fn& traversal)
{
    auto seq = collect(traversal(&tree));

    std::unordered_set<test_value> distinct;
    for (auto n : seq)
        distinct.insert(n->value());

    auto expected = size(&tree);

    if (seq.size() != distinct.size() || seq.size() != expected)
    {
        throw property_violation(
            std::string(Completeness),
            fmt::format("traversal emitted {} nodes with {} distinct values, tree size is {}", seq.size(), distinct.size(), expected)
        );
    }
}

void check_ordering(const test_node& tree, random_source& draws, const traversal_fn& traversal)
{
    auto full = collect(traversal(&tree));

    if (std::all_of(full.begin(), full.end(), [](const test_node* n) { return n->leaf(); }))
        return; // no subtree of size > 1

    const test_node* s = nullptr;
    do
    {
        s = full[draws.draw_index(full.size())];
    } while (s->leaf());

    auto l = sample_from(traversal, s->left(), draws, "left", s);
    auto r = sample_from(traversal, s->right(), draws, "right", s);

    Verbose("check_ordering: S={} L={} R={}", s->value(), l ? l->value() : 0, r ? r->value() : 0);

    check_sides(positions(full), s, l, r);
}

void check_ordering_exhaustive(const test_node& tree, const traversal_fn& traversal)
{
    auto at = positions(collect(traversal(&tree)));

    for (auto s : nodes_of(&tree))
    {
        for (auto l : nodes_of(s->left()))
            check_sides(at, s, l, nullptr);

        for (auto r : nodes_of(s->right()))
            check_sides(at, s, nullptr, r);
    }
}

void check_equivalence(const test_node& tree, const traversal_fn& candidate, const traversal_fn& reference)
{
    auto a = candidate(&tree);
    auto b = reference(&tree);

    for (std::size_t i = 0;; ++i)
    {
        auto x = a.next();
        auto y = b.next();

        if (!x && !y)
            return;

        if (!x || !y || *x != *y)
        {
            throw property_violation(
                std::string(Equivalence),
                fmt::format("sequences diverge at index {}: candidate emitted {}, reference emitted {}", i, show(x), show(y))
            );
        }
    }
}


} // namespace treewalk::proptest {}
