#pragma once

#include <array>
#include <cstdint>
#include <vector>

#include "types.hpp"

namespace cubefour {

// One of the 76 winning lines: four cell indices in order along a direction,
// plus the matching occupancy mask.
struct Line {
    std::array<uint8_t, SIZE> cells{};
    uint64_t mask = 0;
};

// Every winning line, built once for the process lifetime.
const std::vector<Line>& all_lines();

// Indices into all_lines() of the lines passing through `cell`.
const std::vector<int>& lines_through(int cell);

} // namespace cubefour
