#pragma once

namespace weft {

// Result of a Modifier that produces nothing of interest.
struct Unit {
    bool operator==(const Unit&) const = default;
};

} // namespace weft
