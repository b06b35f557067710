#include "lines.hpp"

namespace cubefour {
namespace {

struct LineCatalog {
    std::vector<Line> lines;
    std::array<std::vector<int>, CELLS> by_cell;
};

// A line spans the whole board along one of the 13 directions whose first
// non-zero component is positive; walking from every cell that can still fit
// four steps yields each line exactly once.
static LineCatalog build_catalog() {
    LineCatalog cat;
    cat.lines.reserve(LINE_COUNT);
    for (int dz = -1; dz <= 1; dz++) {
        for (int dy = -1; dy <= 1; dy++) {
            for (int dx = -1; dx <= 1; dx++) {
                int first = dx != 0 ? dx : (dy != 0 ? dy : dz);
                if (first <= 0) continue;
                for (int z = 0; z < SIZE; z++) {
                    for (int y = 0; y < SIZE; y++) {
                        for (int x = 0; x < SIZE; x++) {
                            int ex = x + dx * (SIZE - 1);
                            int ey = y + dy * (SIZE - 1);
                            int ez = z + dz * (SIZE - 1);
                            if (ex < 0 || ex >= SIZE || ey < 0 || ey >= SIZE || ez < 0 || ez >= SIZE)
                                continue;
                            Line ln;
                            for (int i = 0; i < SIZE; i++) {
                                int c = cell_index(x + dx * i, y + dy * i, z + dz * i);
                                ln.cells[i] = (uint8_t)c;
                                ln.mask |= cell_bit(c);
                            }
                            cat.lines.push_back(ln);
                        }
                    }
                }
            }
        }
    }
    for (int i = 0; i < (int)cat.lines.size(); i++) {
        for (uint8_t c : cat.lines[i].cells) cat.by_cell[c].push_back(i);
    }
    return cat;
}

static const LineCatalog& catalog() {
    static const LineCatalog cat = build_catalog();
    return cat;
}

} // namespace

const std::vector<Line>& all_lines() {
    return catalog().lines;
}

const std::vector<int>& lines_through(int cell) {
    return catalog().by_cell[cell];
}

} // namespace cubefour
