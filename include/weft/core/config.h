#ifndef WEFT_CORE_CONFIG_H
#define WEFT_CORE_CONFIG_H

#include <cstddef>

namespace weft::core::config {

// Default cap on retained diagnostic events, failure traces and defect
// records; the oldest are dropped first.
inline constexpr std::size_t kMaxDiagnosticEvents = 4096;

// Data of the comment nodes used as insertion anchors.
inline constexpr const char kChildrenMarker[] = "weft:children";
inline constexpr const char kChildMarker[] = "weft:child";
inline constexpr const char kSlotMarker[] = "weft:slot";

}  // namespace weft::core::config

#endif  // WEFT_CORE_CONFIG_H
