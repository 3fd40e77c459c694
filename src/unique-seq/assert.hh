#pragma once

#include <unique-seq/macros.hh>
#include <unique-seq/source_location.hh>

// UQ_ASSERT(cond, "literal message")
//
//   Checks a precondition of the container API: valid index, non-empty container, engaged optional.
//   Compiled in whenever UQ_ASSERT_ENABLED is 1 (every configuration by default, see macros.hh).
//   A failed check goes to the active assertion handler (<unique-seq/assert-handler.hh>),
//   then breaks into an attached debugger and aborts.
//   Handlers may throw instead of returning, which is how the tests observe failures.
//
//   Duplicates are never asserted on. Rejecting an element is a regular insertion result.
//
// UQ_ASSERT_ALWAYS(cond, "literal message")
//
//   Same, but independent of UQ_ASSERT_ENABLED.
//
// For messages with arguments see UQ_ASSERTF in <unique-seq/assertf.hh>.

namespace uq::impl
{
/// Hands a failed check to the innermost handler, or prints it to stderr.
/// Only returns if no handler threw. The caller aborts afterwards.
UQ_COLD_FUNC void report_assertion_failure(char const* expression, char const* message, uq::source_location location);

[[nodiscard]] bool is_debugger_attached() noexcept;

[[noreturn]] void abort_after_assertion() noexcept;
} // namespace uq::impl

#ifdef UQ_COMPILER_MSVC
#define UQ_IMPL_TRAP() __debugbreak()
#else
// SIGTRAP, declared here so that <csignal> stays out of every container header
extern "C" int raise(int) noexcept;
#define UQ_IMPL_TRAP() (void)::raise(5)
#endif

#define UQ_DEBUG_BREAK() (::uq::impl::is_debugger_attached() ? UQ_IMPL_TRAP() : void(0))

#define UQ_IMPL_FAIL(expression_str, message)                                                       \
    (::uq::impl::report_assertion_failure(expression_str, message, ::uq::source_location::current()), \
     UQ_DEBUG_BREAK(), ::uq::impl::abort_after_assertion())

#define UQ_ASSERT_ALWAYS(cond, msg)   \
    do                                \
    {                                 \
        if (!(cond)) [[unlikely]]     \
            UQ_IMPL_FAIL(#cond, msg); \
    } while (false)

#if UQ_ASSERT_ENABLED
#define UQ_ASSERT(cond, msg) UQ_ASSERT_ALWAYS(cond, msg)
#else
#define UQ_ASSERT(cond, msg) UQ_UNUSED(cond)
#endif
