#pragma once

#include <unique-seq/assert.hh>

#include <format>
#include <string>

// UQ_ASSERTF(cond, "format {}", args...)
//
//   UQ_ASSERT with a std::format message, used where the message should carry values,
//   e.g. "index 7 out of bounds (size: 3)".
//   The arguments are neither evaluated nor formatted unless the check fails.
//
// UQ_ASSERTF_ALWAYS(cond, "format {}", args...)
//
//   Same, but independent of UQ_ASSERT_ENABLED.

#define UQ_ASSERTF_ALWAYS(cond, fmt, ...)                                              \
    do                                                                                 \
    {                                                                                  \
        if (!(cond)) [[unlikely]]                                                      \
            UQ_IMPL_FAIL(#cond, std::format(fmt __VA_OPT__(, ) __VA_ARGS__).c_str()); \
    } while (false)

#if UQ_ASSERT_ENABLED
#define UQ_ASSERTF(cond, fmt, ...) UQ_ASSERTF_ALWAYS(cond, fmt __VA_OPT__(, ) __VA_ARGS__)
#else
#define UQ_ASSERTF(cond, fmt, ...) UQ_UNUSED(cond)
#endif
