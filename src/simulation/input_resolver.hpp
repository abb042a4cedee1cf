#pragma once

/// @file input_resolver.hpp
/// @brief Combines one or more sources driving a single logical input into one Signal

#include "simulation/signal.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace latchwork {

/// Raised when HIGH and LOW drivers are active on the same logical input
class ConflictError : public std::runtime_error {
  public:
    explicit ConflictError(const std::string& what) : std::runtime_error(what) {}
};

/// Evaluates a single source.
[[nodiscard]] Signal resolve(const Source& source);

/// Evaluates every source and combines the results:
///   HIGH and LOW both present -> ConflictError
///   any HIGH                  -> HIGH
///   any LOW                   -> LOW
///   otherwise                 -> FLOATING (includes an empty list)
/// @throws ConflictError on disagreeing drivers
[[nodiscard]] Signal resolve(const std::vector<Source>& sources);

/// Joins several drivers onto one connection. The returned source resolves
/// all of them each time it is evaluated, so a disagreement surfaces as a
/// ConflictError in whichever device pulls the junction.
[[nodiscard]] Source junction(std::vector<Source> drivers);

} // namespace latchwork
