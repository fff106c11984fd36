#ifndef GENERATOR_H
#define GENERATOR_H

#include <cstdint>
#include "Grid.hpp"

struct Puzzle {
  Grid puzzle;
  Grid solution;
  int hints;
};

// Complete, valid grid: a shuffled first row expanded by band rotations, then
// rows shuffled within bands, columns within stacks, and digits relabelled.
// Same seed, same grid.
Grid generateCompleteGrid(uint64_t seed);

// Clears k distinct random cells, k uniform in [minHints, maxHints), and
// returns the remaining hint count 81 - k. Throws std::invalid_argument
// unless 0 <= minHints < maxHints <= 81.
int removeCells(Grid &grid, uint64_t seed, int minHints, int maxHints);

Puzzle generatePuzzle(uint64_t gridSeed, uint64_t removalSeed, int minHints, int maxHints);

#endif // GENERATOR_H
