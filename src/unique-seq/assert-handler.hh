#pragma once

#include <unique-seq/source_location.hh>

#include <functional>
#include <string>

namespace uq::impl
{
/// Everything known about a failed UQ_ASSERT / UQ_ASSERTF.
struct assertion_info
{
    std::string expression; // stringified condition
    std::string message;    // literal or formatted message
    uq::source_location location;
};

using assertion_handler = std::move_only_function<void(assertion_info const&)>;

// Handlers form a stack, the innermost one receives every failure.
// A handler that returns lets the program abort. A handler that throws unwinds out of the failed call,
// the container is left as it was before the call.
// The stack is global and not synchronized.
//
//   struct out_of_bounds {};
//   auto guard = uq::impl::scoped_assertion_handler([](uq::impl::assertion_info const&) { throw out_of_bounds{}; });
//   seq[seq.size()]; // throws out_of_bounds

void push_assertion_handler(assertion_handler handler);
void pop_assertion_handler();

/// Pushes on construction, pops on destruction (including unwinding).
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(assertion_handler handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};
} // namespace uq::impl
