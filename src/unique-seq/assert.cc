#include "assert.hh"

#include <unique-seq/assert-handler.hh>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <stacktrace>
#include <utility>
#include <vector>

#if defined(UQ_OS_LINUX)
#include <fstream>
#include <string>
#elif defined(UQ_OS_WINDOWS)
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

namespace
{
std::vector<uq::impl::assertion_handler>& handler_stack()
{
    static std::vector<uq::impl::assertion_handler> handlers;
    return handlers;
}

void print_to_stderr(uq::impl::assertion_info const& info)
{
    auto const& loc = info.location;
    std::cerr << loc.file_name() << ':' << loc.line() << ':' << loc.column() << ": assertion `" << info.expression
              << "` failed: " << info.message << '\n'
              << "  in " << loc.function_name() << '\n'
              << std::stacktrace::current(1) << std::endl;
}
} // namespace

void uq::impl::push_assertion_handler(assertion_handler handler)
{
    handler_stack().push_back(std::move(handler));
}

void uq::impl::pop_assertion_handler()
{
    auto& handlers = handler_stack();
    UQ_ASSERT_ALWAYS(!handlers.empty(), "unbalanced pop_assertion_handler()");
    handlers.pop_back();
}

uq::impl::scoped_assertion_handler::scoped_assertion_handler(assertion_handler handler)
{
    push_assertion_handler(std::move(handler));
}

uq::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    pop_assertion_handler();
}

void uq::impl::report_assertion_failure(char const* expression, char const* message, uq::source_location location)
{
    auto const info = assertion_info{expression, message, location};

    auto& handlers = handler_stack();
    if (handlers.empty())
        print_to_stderr(info);
    else
        handlers.back()(info);
}

bool uq::impl::is_debugger_attached() noexcept
{
#if defined(UQ_OS_LINUX)
    // "TracerPid:\t<pid>" is non-zero while a tracer (gdb, lldb, strace) is attached
    try
    {
        auto status = std::ifstream("/proc/self/status");
        std::string line;
        while (std::getline(status, line))
            if (line.starts_with("TracerPid:"))
                return std::atoi(line.c_str() + 10) != 0;
    }
    catch (std::exception const&)
    {
        return false;
    }
    return false;
#elif defined(UQ_OS_WINDOWS)
    return ::IsDebuggerPresent() != 0;
#else
    return false;
#endif
}

void uq::impl::abort_after_assertion() noexcept
{
    std::abort();
}
