#pragma once

namespace micro {
namespace domain {

// -----------------------------------------------------------------------------
// Direction
// -----------------------------------------------------------------------------
// Responsibility: Encodes the side of a position (long or short).
// Strongly typed so that it cannot be confused with an order side or an int.
// -----------------------------------------------------------------------------
enum class Direction {
  Long,
  Short,
};

inline const char* directionToString(Direction d) {
  switch (d) {
    case Direction::Long:  return "Long";
    case Direction::Short: return "Short";
  }
  return "Unknown";
}

}  // namespace domain
}  // namespace micro
