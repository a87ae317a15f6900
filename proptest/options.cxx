#include "options.hxx"

#include <charconv>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <system_error>


namespace treewalk::proptest
{

namespace
{

template <typename _Number>
_Number parse_number(std::string_view option, const char* text)
{
    _Number value{};
    auto end = text + std::strlen(text);
    auto [ptr, ec] = std::from_chars(text, end, value);
    if (ec != std::errc{} || ptr != end)
        throw std::invalid_argument(fmt::format("{}: '{}' is not a valid number", option, text));

    return value;
}

double parse_probability(std::string_view option, const char* text)
{
    char* end = nullptr;
    auto value = std::strtod(text, &end);
    if (end == text || *end != '\0')
        throw std::invalid_argument(fmt::format("{}: '{}' is not a valid probability", option, text));

    return value;
}

bool is_help(std::string_view option) noexcept
{
    return option == "-h" || option == "--help";
}

} // namespace {}


command_line parse_command_line(int argc, const char* const* argv)
{
    command_line cl;

    for (int i = 1; i < argc; ++i)
    {
        if (is_help(argv[i]))
        {
            cl.help = true;
            return cl;
        }
    }

    auto& config = cl.config;

    for (int i = 1; i < argc; ++i)
    {
        std::string_view option{ argv[i] };

        if (option == "--quiet")
        {
            cl.threshold = Level::Error;
            continue;
        }

        if (i + 1 >= argc)
            throw std::invalid_argument(fmt::format("{}: missing value", option));

        const char* value = argv[++i];

        if (option == "--cases")
            config.cases = parse_number<std::size_t>(option, value);
        else if (option == "--seed")
            config.seed = parse_number<std::uint64_t>(option, value);
        else if (option == "--max-depth")
            config.bounds.max_depth = parse_number<std::size_t>(option, value);
        else if (option == "--max-nodes")
            config.bounds.max_nodes = parse_number<std::size_t>(option, value);
        else if (option == "--branch")
            config.bounds.branch_probability = parse_probability(option, value);
        else if (option == "--workers")
            config.workers = parse_number<std::size_t>(option, value);
        else if (option == "--shrink-steps")
            config.max_shrink_steps = parse_number<std::size_t>(option, value);
        else if (option == "--log-level")
            cl.threshold = parseLevel(value);
        else
            throw std::invalid_argument(fmt::format("unknown option {}", option));
    }

    validate(config);
    return cl;
}

std::string usage(std::string_view self)
{
    return fmt::format(
        "Usage: {} [--cases N] [--seed S] [--max-depth D] [--max-nodes N] [--branch P] "
        "[--workers W] [--shrink-steps K] [--log-level verbose|info|error] [--quiet] [-h|--help]",
        self
    );
}


} // namespace treewalk::proptest {}
