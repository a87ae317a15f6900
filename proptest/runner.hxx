#pragma once

#include "properties.hxx"

#include <functional>
#include <optional>
#include <string>
#include <vector>


namespace treewalk::proptest
{

struct run_config
{
    std::size_t cases = 200;
    std::uint64_t seed = 0;             // 0 draws a fresh seed per run
    tree_bounds bounds;
    std::size_t workers = 0;            // 0 uses the hardware concurrency
    std::size_t max_shrink_steps = 1000;
};

void validate(const run_config& config);


// Raises property_violation when the tree breaks the property. `draws`
// supplies any auxiliary samples; it is seeded identically every time the
// same case is replayed, so shrinking sees the same samples.
using property_fn = std::function<void(const test_node& tree, random_source& draws)>;

struct property
{
    std::string name;
    property_fn check;
};

std::vector<property> standard_properties(traversal_fn candidate, traversal_fn reference);


struct failure
{
    std::size_t case_index = 0;
    std::uint64_t case_seed = 0;
    std::size_t original_size = 0;
    std::size_t shrunk_size = 0;
    std::size_t shrink_steps = 0;
    std::string tree;           // shrunk tree, literal notation
    std::string message;        // violation raised by the shrunk tree
};

struct report
{
    std::string property;
    std::uint64_t seed = 0;
    std::size_t cases_run = 0;
    std::optional<failure> failed;

    bool passed() const noexcept
    {
        return !failed.has_value();
    }
};

std::string format_report(const report& r);


report run_property(const property& prop, const run_config& config);

std::vector<report> run_properties(const std::vector<property>& props, const run_config& config);


} // namespace treewalk::proptest {}
