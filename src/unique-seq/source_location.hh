#pragma once

#include <source_location>

namespace uq
{
/// Source position (file, line, column, function) captured by the assertion macros.
using source_location = std::source_location;
} // namespace uq
