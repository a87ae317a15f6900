#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "properties.hxx"
#include "traverse.hxx"

#include <unordered_set>
#include <vector>


using namespace treewalk::proptest;
using treewalk::generator;
using treewalk::make_node;
using ::testing::HasSubstr;


namespace
{

// node, left, right
generator<const test_node*> preorder(const test_node* root)
{
    if (!root)
        co_return;

    co_yield root;

    for (auto n : preorder(root->left()))
        co_yield n;

    for (auto n : preorder(root->right()))
        co_yield n;
}

// right, node, left
generator<const test_node*> reverse_inorder(const test_node* root)
{
    if (!root)
        co_return;

    for (auto n : reverse_inorder(root->right()))
        co_yield n;

    co_yield root;

    for (auto n : reverse_inorder(root->left()))
        co_yield n;
}

generator<const test_node*> skip_right(const test_node* root)
{
    if (!root)
        co_return;

    for (auto n : skip_right(root->left()))
        co_yield n;

    co_yield root;
}

generator<const test_node*> root_twice(const test_node* root)
{
    for (auto n : treewalk::traverse_recursive(root))
        co_yield n;

    if (root)
        co_yield root;
}

// stack traversal whose opened set is keyed by value instead of identity
generator<const test_node*> value_keyed_stack(const test_node* root)
{
    if (!root)
        co_return;

    std::vector<const test_node*> stack{ root };
    std::unordered_set<test_value> opened;

    while (!stack.empty())
    {
        auto top = stack.back();
        stack.pop_back();

        if (opened.contains(top->value()))
        {
            co_yield top;
            continue;
        }

        opened.insert(top->value());

        if (top->right())
            stack.push_back(top->right());
        stack.push_back(top);
        if (top->left())
            stack.push_back(top->left());
    }
}

test_tree example()
{
    return make_node<test_value>(1,
        make_node<test_value>(2,
            make_node<test_value>(3),
            make_node<test_value>(4, make_node<test_value>(6))),
        make_node<test_value>(5));
}

test_tree left_only()
{
    return make_node<test_value>(1, make_node<test_value>(2));
}

test_tree right_only()
{
    return make_node<test_value>(1, test_tree{}, make_node<test_value>(2));
}

} // namespace {}


TEST(Completeness, HoldsForBothTraversals) {
  auto tree = example();
  ASSERT_NO_THROW(check_completeness(*tree, recursive_traversal()));
  ASSERT_NO_THROW(check_completeness(*tree, stack_traversal()));
}


TEST(Completeness, DetectsSkippedNodes) {
  auto tree = example();
  try {
    check_completeness(*tree, skip_right);
    FAIL() << "skipped nodes went unnoticed";
  } catch (const property_violation& e) {
    ASSERT_EQ(e.property(), "completeness");
    ASSERT_THAT(e.what(), HasSubstr("emitted 3 nodes with 3 distinct values"));
    ASSERT_THAT(e.what(), HasSubstr("tree size is 6"));
  }
}


TEST(Completeness, DetectsDuplicateEmission) {
  auto tree = example();
  try {
    check_completeness(*tree, root_twice);
    FAIL() << "duplicate emission went unnoticed";
  } catch (const property_violation& e) {
    ASSERT_THAT(e.what(), HasSubstr("emitted 7 nodes with 6 distinct values"));
  }
}


TEST(Completeness, SingleNode) {
  auto tree = make_node<test_value>(9);
  ASSERT_NO_THROW(check_completeness(*tree, stack_traversal()));
}


TEST(Ordering, HoldsForEverySample) {
  auto tree = example();
  for (std::uint64_t seed = 1; seed <= 200; ++seed) {
    random_source draws(seed);
    ASSERT_NO_THROW(check_ordering(*tree, draws, stack_traversal()));
  }
}


TEST(Ordering, VacuousWithoutInnerNodes) {
  auto tree = make_node<test_value>(9);
  random_source draws(1);
  ASSERT_NO_THROW(check_ordering(*tree, draws, preorder));
}


TEST(Ordering, LeftOnlyUsesLeftBranch) {
  auto tree = left_only();
  random_source draws(1);
  ASSERT_NO_THROW(check_ordering(*tree, draws, recursive_traversal()));

  random_source again(1);
  try {
    check_ordering(*tree, again, preorder);
    FAIL() << "preorder passed on a left-only tree";
  } catch (const property_violation& e) {
    ASSERT_EQ(e.property(), "ordering");
    ASSERT_THAT(e.what(), HasSubstr("left node 2 at index 1 does not precede subtree root 1 at index 0"));
  }
}


TEST(Ordering, RightOnlyUsesRightBranch) {
  auto tree = right_only();
  random_source draws(1);
  ASSERT_NO_THROW(check_ordering(*tree, draws, recursive_traversal()));

  // preorder agrees with in-order when no node has a left child
  random_source second(1);
  ASSERT_NO_THROW(check_ordering(*tree, second, preorder));

  random_source third(1);
  try {
    check_ordering(*tree, third, reverse_inorder);
    FAIL() << "reverse order passed on a right-only tree";
  } catch (const property_violation& e) {
    ASSERT_THAT(e.what(), HasSubstr("subtree root 1 at index 1 does not precede right node 2 at index 0"));
  }
}


TEST(Ordering, DetectsPreorder) {
  auto tree = example();
  random_source draws(5);
  ASSERT_THROW(check_ordering(*tree, draws, preorder), property_violation);
}


TEST(Ordering, ReportsMissingNodes) {
  auto tree = example();
  try {
    check_ordering_exhaustive(*tree, skip_right);
    FAIL() << "missing nodes went unnoticed";
  } catch (const property_violation& e) {
    ASSERT_THAT(e.what(), HasSubstr("missing from the full traversal"));
  }
}


TEST(OrderingExhaustive, HoldsAndDetects) {
  auto tree = example();
  ASSERT_NO_THROW(check_ordering_exhaustive(*tree, recursive_traversal()));
  ASSERT_NO_THROW(check_ordering_exhaustive(*tree, stack_traversal()));
  ASSERT_THROW(check_ordering_exhaustive(*tree, preorder), property_violation);
  ASSERT_THROW(check_ordering_exhaustive(*tree, reverse_inorder), property_violation);
}


TEST(Equivalence, StackMatchesRecursive) {
  auto tree = example();
  ASSERT_NO_THROW(check_equivalence(*tree, stack_traversal(), recursive_traversal()));
}


TEST(Equivalence, ReportsDivergence) {
  auto tree = example();
  try {
    check_equivalence(*tree, preorder, recursive_traversal());
    FAIL() << "preorder matched in-order";
  } catch (const property_violation& e) {
    ASSERT_EQ(e.property(), "equivalence");
    ASSERT_THAT(e.what(), HasSubstr("diverge at index 0: candidate emitted 1, reference emitted 3"));
  }
}


TEST(Equivalence, ReportsShortSequence) {
  auto tree = example();
  try {
    check_equivalence(*tree, skip_right, recursive_traversal());
    FAIL() << "truncated sequence matched";
  } catch (const property_violation& e) {
    ASSERT_THAT(e.what(), HasSubstr("diverge at index 2: candidate emitted 1, reference emitted 6"));
  }

  auto shorter = right_only();
  try {
    check_equivalence(*shorter, skip_right, recursive_traversal());
    FAIL() << "truncated sequence matched";
  } catch (const property_violation& e) {
    ASSERT_THAT(e.what(), HasSubstr("diverge at index 1: candidate emitted <end>, reference emitted 2"));
  }
}


// Two nodes share a value. Identity-keyed opening handles it; keying by
// value conflates the two nodes and drops the child of the second one.
TEST(Equivalence, DuplicateValuesNeedIdentityKeys) {
  auto tree = make_node<test_value>(1,
      make_node<test_value>(2),
      make_node<test_value>(1, make_node<test_value>(3)));

  ASSERT_NO_THROW(check_equivalence(*tree, stack_traversal(), recursive_traversal()));
  ASSERT_NO_THROW(check_ordering_exhaustive(*tree, stack_traversal()));

  auto wrong = treewalk::values_of(value_keyed_stack(tree.get()));
  ASSERT_EQ(wrong, (std::vector<test_value>{ 2, 1, 1 }));
  ASSERT_THROW(check_equivalence(*tree, value_keyed_stack, recursive_traversal()), property_violation);

  // the value-based uniqueness check cannot vouch for such a tree
  ASSERT_THROW(check_completeness(*tree, recursive_traversal()), property_violation);
}
