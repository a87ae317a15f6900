#include <gtest/gtest.h>

#include "describe.hxx"
#include "properties.hxx"
#include "shrink.hxx"
#include "traverse.hxx"

#include <vector>


using namespace treewalk::proptest;
using treewalk::make_node;


namespace
{

test_tree example()
{
    return make_node<test_value>(1,
        make_node<test_value>(2,
            make_node<test_value>(3),
            make_node<test_value>(4, make_node<test_value>(6))),
        make_node<test_value>(5));
}

bool contains(const test_node& tree, test_value value)
{
    for (auto n : treewalk::traverse(&tree))
        if (n->value() == value)
            return true;

    return false;
}

bool has_full_node(const test_node& tree)
{
    for (auto n : treewalk::traverse(&tree))
        if (n->left() && n->right())
            return true;

    return false;
}

} // namespace {}


TEST(ShrinkCandidates, StrictlySmaller) {
  auto tree = example();
  auto original = treewalk::size(tree.get());

  std::size_t count = 0;
  for (auto& candidate : shrink_candidates(tree.get())) {
    ASSERT_NE(candidate.get(), nullptr);
    ASSERT_LT(treewalk::size(candidate.get()), original) << treewalk::describe(candidate.get());
    ++count;
  }
  ASSERT_GT(count, 0u);
}


TEST(ShrinkCandidates, MostAggressiveFirst) {
  auto tree = example();
  auto candidates = treewalk::collect(shrink_candidates(tree.get()));

  ASSERT_GE(candidates.size(), 4u);
  ASSERT_EQ(treewalk::describe(candidates[0].get()), "node(2, left=node(3), right=node(4, left=node(6)))");
  ASSERT_EQ(treewalk::describe(candidates[1].get()), "node(5)");
  ASSERT_EQ(treewalk::describe(candidates[2].get()), "node(1, right=node(5))");
  ASSERT_EQ(treewalk::describe(candidates[3].get()), "node(1, left=node(2, left=node(3), right=node(4, left=node(6))))");
}


TEST(ShrinkCandidates, LeafHasNone) {
  auto leaf = make_node<test_value>(1);
  ASSERT_TRUE(treewalk::collect(shrink_candidates(leaf.get())).empty());
}


TEST(ShrinkCandidates, OriginalUntouched) {
  auto tree = example();
  auto before = treewalk::describe(tree.get());

  for ([[maybe_unused]] auto& candidate : shrink_candidates(tree.get())) {
  }

  ASSERT_EQ(treewalk::describe(tree.get()), before);
}


TEST(Minimize, DownToSingleNode) {
  auto result = minimize(example(), [](const test_node& t) { return contains(t, 6); }, 100);
  ASSERT_EQ(treewalk::describe(result.tree.get()), "node(6)");
  ASSERT_GT(result.steps, 0u);
  ASSERT_GE(result.attempts, result.steps);
}


TEST(Minimize, KeepsStructureTheFailureNeeds) {
  auto result = minimize(example(), has_full_node, 100);
  ASSERT_EQ(treewalk::size(result.tree.get()), 3u);
  ASSERT_TRUE(has_full_node(*result.tree));
}


TEST(Minimize, StepLimit) {
  auto result = minimize(example(), [](const test_node& t) { return contains(t, 6); }, 0);
  ASSERT_EQ(result.steps, 0u);
  ASSERT_EQ(treewalk::size(result.tree.get()), 6u);
}


TEST(Minimize, NothingSmallerFails) {
  auto result = minimize(example(), [](const test_node& t) { return treewalk::size(&t) == 6; }, 100);
  ASSERT_EQ(result.steps, 0u);
  ASSERT_EQ(treewalk::size(result.tree.get()), 6u);
}


TEST(Minimize, PropertyCounterexample) {
  auto preorder = [](const test_node* root) -> treewalk::generator<const test_node*> {
    std::vector<const test_node*> stack;
    if (root)
      stack.push_back(root);
    while (!stack.empty()) {
      auto top = stack.back();
      stack.pop_back();
      co_yield top;
      if (top->right())
        stack.push_back(top->right());
      if (top->left())
        stack.push_back(top->left());
    }
  };

  auto fails = [&preorder](const test_node& t) {
    try {
      check_equivalence(t, preorder, recursive_traversal());
    } catch (const property_violation&) {
      return true;
    }
    return false;
  };

  auto result = minimize(example(), fails, 100);
  ASSERT_EQ(treewalk::size(result.tree.get()), 2u);
  ASSERT_NE(result.tree->left(), nullptr);
}
