#pragma once

#include "generator.hxx"
#include "strategy.hxx"

#include <functional>
#include <stdexcept>
#include <string>


namespace treewalk::proptest
{

// A traversal under test: root in, in-order node sequence out.
using traversal_fn = std::function<generator<const test_node*>(const test_node* root)>;

traversal_fn recursive_traversal();
traversal_fn stack_traversal();


class property_violation
    : public std::runtime_error
{
public:
    property_violation(std::string property, const std::string& message)
        : std::runtime_error(message)
        , property_(std::move(property))
    {
    }

    const std::string& property() const noexcept
    {
        return property_;
    }

private:
    std::string property_;
};


//
// count(traverse(T)) == count(distinct values in traverse(T)) == size(T).
// Relies on the generator's value uniqueness: a node emitted twice shows up
// as fewer distinct values than emissions.
//
void check_completeness(const test_node& tree, const traversal_fn& traversal);

//
// Samples a subtree root S of size > 1 from the traversal of T, then one
// node from each present side of S, and checks their positions in the full
// traversal: left sample < S < right sample. Holds vacuously when T has no
// node with a child.
//
void check_ordering(const test_node& tree, random_source& draws, const traversal_fn& traversal);

// check_ordering() over every S and every node on either side of it.
void check_ordering_exhaustive(const test_node& tree, const traversal_fn& traversal);

// Element-for-element identity of the two sequences.
void check_equivalence(const test_node& tree, const traversal_fn& candidate, const traversal_fn& reference);


} // namespace treewalk::proptest {}
