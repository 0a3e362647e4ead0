#pragma once

#include <source_location>

namespace lc
{
/// Type alias for std::source_location
/// Every contract check captures the call site through a defaulted parameter of this type
/// Usage:
///   void check(lc::source_location site = lc::source_location::current());
using source_location = std::source_location;
} // namespace lc
