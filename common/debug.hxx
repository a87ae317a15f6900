#pragma once

#ifndef TREEWALK_COMMON_HXX_INCLUDED
#include "common.hxx"
#endif

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include <fmt/format.h>


namespace treewalk
{

enum class Level
{
    Verbose,
    Info,
    Error
};

using TraceFn = std::function<void(Level level, std::uint32_t indent, std::string_view message)>;


TREEWALK_EXPORT TraceFn setTracer(TraceFn&& f); // NOT thread-safe

// messages below this level are dropped before reaching the tracer
TREEWALK_EXPORT Level setThreshold(Level level) noexcept;

TREEWALK_EXPORT Level threshold() noexcept;

// "verbose", "info" or "error"; throws std::invalid_argument otherwise
TREEWALK_EXPORT Level parseLevel(std::string_view name);

TREEWALK_EXPORT std::string_view levelName(Level level) noexcept;

// one line as the default tracer prints it, without the trailing newline
TREEWALK_EXPORT std::string formatTraceLine(Level level, std::uint32_t indent, std::string_view message);

TREEWALK_EXPORT void writeln(Level level, std::string_view message);

template <class... Args>
void write(Level level, std::string_view format, Args&&... args)
{
    writeln(level, fmt::vformat(format, fmt::make_format_args(args...)));
}

template <class... Args>
void verbose(std::string_view format, Args&&... args)
{
    writeln(Level::Verbose, fmt::vformat(format, fmt::make_format_args(args...)));
}

template <class... Args>
void info(std::string_view format, Args&&... args)
{
    writeln(Level::Info, fmt::vformat(format, fmt::make_format_args(args...)));
}

template <class... Args>
void error(std::string_view format, Args&&... args)
{
    writeln(Level::Error, fmt::vformat(format, fmt::make_format_args(args...)));
}


struct TREEWALK_EXPORT IndentScope
{
    ~IndentScope()
    {
        unindent();
    }

    template <class... Args>
    IndentScope(Level level, std::string_view format, Args&&... args)
    {
        writeln(level, fmt::vformat(format, fmt::make_format_args(args...)));

        indent();
    }

private:
    void indent() noexcept;
    void unindent() noexcept;
};

} // namespace treewalk {}


#if TREEWALK_ENABLE_LOG

#if TREEWALK_VERBOSE_LOG

#define Verbose(format, ...) \
    ::treewalk::verbose(format, ##__VA_ARGS__)


#define  VerboseBlock(format, ...) \
    ::treewalk::IndentScope __is(::treewalk::Level::Verbose, format, ##__VA_ARGS__)

#else

#define Verbose(format, ...)                 ((void)0)
#define VerboseBlock(format, ...)            ((void)0)

#endif

#define Info(format, ...) \
    ::treewalk::info(format, ##__VA_ARGS__)

#define  InfoBlock(format, ...) \
    ::treewalk::IndentScope __is(::treewalk::Level::Info, format, ##__VA_ARGS__)


#define Error(format, ...) \
    ::treewalk::error(format, ##__VA_ARGS__)

#define  ErrorBlock(format, ...) \
    ::treewalk::IndentScope __is(::treewalk::Level::Error, format, ##__VA_ARGS__)

#else // !TREEWALK_ENABLE_LOG

#define Verbose(format, ...)                 ((void)0)
#define VerboseBlock(format, ...)            ((void)0)

#define Info(format, ...)                    ((void)0)
#define InfoBlock(format, ...)               ((void)0)

#define Error(format, ...)                   ((void)0)
#define ErrorBlock(format, ...)              ((void)0)

#endif // !TREEWALK_ENABLE_LOG
