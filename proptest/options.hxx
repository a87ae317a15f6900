#pragma once

#include "runner.hxx"

#include <optional>
#include <string>
#include <string_view>


namespace treewalk::proptest
{

struct command_line
{
    run_config config;
    bool help = false;              // -h/--help anywhere; nothing else is validated then
    std::optional<Level> threshold; // --quiet or --log-level
};

//
// [--cases N] [--seed S] [--max-depth D] [--max-nodes N] [--branch P]
// [--workers W] [--shrink-steps K] [--log-level L] [--quiet] [-h|--help]
//
// Throws std::invalid_argument on unknown options, missing or malformed
// values, and on a configuration that run_property() would reject.
//
command_line parse_command_line(int argc, const char* const* argv);

std::string usage(std::string_view self);


} // namespace treewalk::proptest {}
