#include "assert.hh"

#include <large-collections/assert-handler.hh>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <vector>

#ifdef LC_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

#ifdef LC_COMPILER_POSIX
#include <cstring>
#endif

namespace
{
// Global stack of assertion handlers
// NOTE: This is not thread-safe and must be externally synchronized
std::vector<std::move_only_function<void(lc::impl::assertion_info const&)>> g_assertion_handlers;

// Default handler: diagnostic to stderr, the caller aborts afterwards
void default_assert_handler(lc::impl::assertion_info const& info)
{
    if (info.kind == lc::error_kind::assertion)
        std::cerr << "Assertion failed: " << info.expression << '\n';
    else
        std::cerr << "Contract violation (" << lc::to_string(info.kind) << "): " << info.expression << '\n';
    std::cerr << "  Message: " << info.message << '\n';
    std::cerr << "  Location: " << info.location.file_name() << ':' << info.location.line() << ':'
              << info.location.column() << " (" << info.location.function_name() << ")\n";
}
} // namespace

char const* lc::to_string(error_kind kind)
{
    switch (kind)
    {
    case error_kind::assertion:
        return "assertion";
    case error_kind::range:
        return "range";
    case error_kind::capacity:
        return "capacity";
    case error_kind::not_found:
        return "not_found";
    case error_kind::invalid_configuration:
        return "invalid_configuration";
    }
    return "unknown";
}

void lc::impl::push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    g_assertion_handlers.push_back(std::move(handler));
}

void lc::impl::pop_assertion_handler()
{
    if (!g_assertion_handlers.empty())
        g_assertion_handlers.pop_back();
}

lc::impl::scoped_assertion_handler::scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    push_assertion_handler(std::move(handler));
}

lc::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    pop_assertion_handler();
}

LC_COLD_FUNC void lc::impl::dispatch_assertion(assertion_info const& info)
{
    // Call the topmost handler if available, otherwise use default handler
    if (!g_assertion_handlers.empty())
        g_assertion_handlers.back()(info);
    else
        default_assert_handler(info);

    // no abort here, it's outside
}

LC_COLD_FUNC void lc::impl::handle_assert_failure(char const* expression, char const* message, lc::source_location location)
{
    assertion_info const info{
        .kind = error_kind::assertion,
        .expression = expression,
        .message = message,
        .location = location,
    };
    dispatch_assertion(info);
}

bool lc::impl::is_debugger_connected() noexcept
{
#ifdef LC_COMPILER_MSVC
    return ::IsDebuggerPresent() != 0;
#elif defined(LC_OS_LINUX)
    // Check /proc/self/status for TracerPid
    if (auto* f = std::fopen("/proc/self/status", "r"))
    {
        char buf[1024];
        while (std::fgets(buf, sizeof(buf), f))
        {
            if (std::strncmp(buf, "TracerPid:", 10) == 0)
            {
                int pid = 0;
                std::sscanf(buf + 10, "%d", &pid);
                std::fclose(f);
                return pid != 0;
            }
        }
        std::fclose(f);
    }
    return false;
#else
    return false;
#endif
}

[[noreturn]] void lc::impl::perform_abort() noexcept
{
    std::abort();
}
