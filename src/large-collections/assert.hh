#pragma once

// Lean header with minimal dependencies, included by every container header.
// Contract checks with typed error kinds and formatted messages live in <large-collections/contract.hh>.
#include <large-collections/macros.hh>
#include <large-collections/source_location.hh>

// =========================================================================================================
// LC_ASSERT - Runtime assertion for internal invariants
//
// Validates a condition at runtime and triggers a debugger break + abort on failure.
// The failure is first routed through the assertion handler stack (see assert-handler.hh),
// so a handler may throw and unwind instead.
//
// When assertions are active:
//   Enabled in LC_DEBUG and LC_RELWITHDEBINFO builds.
//   In LC_RELEASE builds, assertions are disabled unless LC_ENABLE_ASSERT_IN_RELEASE is defined.
//
// What LC_ASSERT is for:
//   Invariants of the chunk layout, hash chains and allocations that only a library bug can break.
//
// What LC_ASSERT is NOT for:
//   Caller errors such as out-of-range indices or invalid policies.
//   Those are contract checks (lc::check_index, lc::check_range, ...) and stay active in release.
//
// Usage:
//   LC_ASSERT(chunk_index < chunk_count(), "chunk index out of bounds");
//
#define LC_ASSERT(cond, msg) LC_IMPL_ASSERT(cond, msg)

// =========================================================================================================
// LC_ASSERT_ALWAYS - Always-active assertion
//
// Like LC_ASSERT but remains active in all build configurations, including release builds.
//
// Usage:
//   LC_ASSERT_ALWAYS(p != nullptr, "allocation failed");
//
#define LC_ASSERT_ALWAYS(cond, msg) LC_IMPL_ASSERT_ALWAYS(cond, msg)

// =========================================================================================================
// LC_DEBUG_BREAK - Conditional debugger breakpoint
//
// Triggers a debugger break if a debugger is attached, otherwise does nothing.
// Executes inline (not in a function) so the debugger breaks at the exact location.
//
#define LC_DEBUG_BREAK() LC_IMPL_DEBUG_BREAK()

// =========================================================================================================
// LC_BREAK_AND_ABORT - Debug break followed by program termination
//
// Used after the handler stack has been notified of a failure.
// If a handler threw, this is never reached.
//
#define LC_BREAK_AND_ABORT() (LC_DEBUG_BREAK(), ::lc::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace lc::impl
{
// Called when an assertion fails
// Dispatches to the topmost assertion handler (default: print to stderr)
// Note: does not abort, caller must follow with LC_BREAK_AND_ABORT()
LC_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, lc::source_location location);

// Checks if a debugger is currently attached to the process
// Platform-specific implementation (Windows: IsDebuggerPresent, Linux: /proc)
bool is_debugger_connected() noexcept;

// Terminates the program
[[noreturn]] void perform_abort() noexcept;
} // namespace lc::impl

// Platform-specific debugger break implementation
// The debugger should break right in the assert macro, so this cannot hide in a function call

#ifdef LC_COMPILER_MSVC

// __debugbreak() terminates immediately without an attached debugger
#define LC_IMPL_DEBUG_BREAK() (::lc::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(LC_COMPILER_POSIX)

// SIGTRAP (5) signals a trace/breakpoint to an attached debugger
// NOTE: we don't want to pull in any posix header here, so we simply declare raise
extern "C" int raise(int) noexcept;
#define LC_IMPL_DEBUG_BREAK() (::lc::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define LC_IMPL_DEBUG_BREAK() void(0)

#endif

// LC_ASSERT_ALWAYS implementation - always enabled regardless of build configuration
#define LC_IMPL_ASSERT_ALWAYS(cond, msg)                                                     \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::lc::impl::handle_assert_failure(#cond, msg, ::lc::source_location::current()); \
            LC_BREAK_AND_ABORT();                                                            \
        }                                                                                    \
    } while (false)

#if LC_ASSERT_ENABLED

#define LC_IMPL_ASSERT(cond, msg) LC_IMPL_ASSERT_ALWAYS(cond, msg)

#else

// In release builds without LC_ENABLE_ASSERT_IN_RELEASE, assertions are stripped
// We still type-check both operands
#define LC_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        LC_UNUSED(cond);          \
        LC_UNUSED(msg);           \
    } while (false)

#endif
