#include "common.hxx"

#include <atomic>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <syncstream>
#include <thread>

#include <fmt/std.h>


namespace treewalk
{

namespace
{

const auto g_start = std::chrono::steady_clock::now();

constexpr char Tags[] = { 'V', 'I', 'E' };

void defaultTracer(Level level, std::uint32_t indent, std::string_view message)
{
    auto line = formatTraceLine(level, indent, message);
    line.push_back('\n');

    if (level < Level::Error)
        std::osyncstream(std::cout) << line;
    else
        std::osyncstream(std::cerr) << line;
}

TraceFn g_Tracer = defaultTracer;

std::atomic<Level> g_threshold{ Level::Verbose };

thread_local std::uint32_t g_indent = 0;

constexpr std::uint32_t MaxIndent = 32;

} // namespace {}


void IndentScope::indent() noexcept
{
    if (g_indent < MaxIndent)
        ++g_indent;
}

void IndentScope::unindent() noexcept
{
    if (g_indent > 0)
        --g_indent;
}


TREEWALK_EXPORT std::string_view levelName(Level level) noexcept
{
    switch (level)
    {
    case Level::Verbose: return "verbose";
    case Level::Info: return "info";
    case Level::Error: return "error";
    }

    return "?";
}

TREEWALK_EXPORT Level parseLevel(std::string_view name)
{
    for (auto level : { Level::Verbose, Level::Info, Level::Error })
    {
        if (name == levelName(level))
            return level;
    }

    throw std::invalid_argument(fmt::format("unknown log level '{}'", name));
}

// "I +12.345ms @140093 |     message"
TREEWALK_EXPORT std::string formatTraceLine(Level level, std::uint32_t indent, std::string_view message)
{
    std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - g_start;

    return fmt::format(
        "{} +{:.3f}ms @{} | {:{}}{}",
        Tags[static_cast<std::size_t>(level)],
        elapsed.count(),
        std::this_thread::get_id(),
        "", indent * 4,
        message
    );
}


TREEWALK_EXPORT TraceFn setTracer(TraceFn&& f)
{
    auto prev = std::move(g_Tracer);

    if (!f)
        g_Tracer = defaultTracer;
    else
        g_Tracer = std::move(f);

    return prev;
}

TREEWALK_EXPORT Level setThreshold(Level level) noexcept
{
    return g_threshold.exchange(level);
}

TREEWALK_EXPORT Level threshold() noexcept
{
    return g_threshold.load(std::memory_order_relaxed);
}

TREEWALK_EXPORT void writeln(Level level, std::string_view message)
{
    if (level < threshold())
        return;

    g_Tracer(level, g_indent, message);
}


} // namespace treewalk {}
