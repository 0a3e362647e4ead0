#pragma once

#include <large-collections/macros.hh>
#include <large-collections/source_location.hh>

#include <functional>
#include <string>
#include <string_view>

namespace lc
{
/// Category of a reported failure
/// Everything except `assertion` is a caller contract violation and is checked in every build
enum class error_kind
{
    assertion,             ///< internal invariant (LC_ASSERT)
    range,                 ///< index, offset or count outside the valid range
    capacity,              ///< capacity outside [0, max_capacity] or count limit reached
    not_found,             ///< dictionary lookup of a missing key
    invalid_configuration, ///< growth or load factor policy out of bounds
};

/// Stable lowercase name, e.g. "range" or "invalid_configuration"
[[nodiscard]] char const* to_string(error_kind kind);
} // namespace lc

namespace lc::impl
{
// Customizable assertion handler system
// NOTE: Handler functions are global state and must be externally synchronized
//
// Usage example:
//   {
//       auto handler = lc::impl::scoped_assertion_handler([](lc::impl::assertion_info const& info) {
//           if (info.kind == lc::error_kind::range)
//               throw index_error{info.message};
//       });
//
//       // Any failed check in this scope will use the custom handler
//       list.remove_at(idx);
//   } // handler is automatically popped here

struct assertion_info
{
    error_kind kind = error_kind::assertion;
    std::string expression;
    std::string message;
    lc::source_location location;
};

// Push a custom assertion handler onto the handler stack
// The handler will be called for all assertion failures and contract violations until it is popped
// Handlers are allowed to throw exceptions as a way to unwind to some recovery point
// If a handler returns normally, the process breaks into the debugger (if any) and aborts
void push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);

// Pop the topmost assertion handler from the stack
// NOTE: prefer scoped_assertion_handler, which pops even if a handler threw
void pop_assertion_handler();

// Routes a failure to the topmost handler, or to the default stderr handler if the stack is empty
// Note: does not abort, caller must follow with LC_BREAK_AND_ABORT()
LC_COLD_FUNC void dispatch_assertion(assertion_info const& info);

// RAII wrapper for pushing/popping assertion handlers
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};
} // namespace lc::impl
