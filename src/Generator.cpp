#include <algorithm>
#include <random>
#include <stdexcept>

#include "Generator.hpp"
#include "utils.hpp"

typedef Digit Rows[9][9];

static void rotateLeft(const Digit *src, Digit *dst, int by) {
  for (int k = 0; k < 9; k++) {
    dst[k] = src[(k + by) % 9];
  }
}

// order[k] = which of 0..8 ends up at position k, shuffled only inside groups of 3
static void shuffleWithinGroups(int order[9], std::mt19937_64 &rng) {
  for (int k = 0; k < 9; k++) {
    order[k] = k;
  }
  for (int g = 0; g < 9; g += 3) {
    std::shuffle(order + g, order + g + 3, rng);
  }
}

Grid generateCompleteGrid(uint64_t seed) {
  std::mt19937_64 rng(seed);

  Digit digits[9] = { 1, 2, 3, 4, 5, 6, 7, 8, 9 };
  std::shuffle(digits, digits + 9, rng);

  // 1) band construction: shifts 0,3,6 | 7,1,4 | 5,8,2
  Rows base;
  std::copy(digits, digits + 9, base[0]);
  for (int r = 1; r < 9; r++) {
    rotateLeft(base[r - 1], base[r], (r % 3 == 0) ? 1 : 3);
  }

  // 2) rows within bands, columns within stacks
  int rowOrder[9];
  int colOrder[9];
  shuffleWithinGroups(rowOrder, rng);
  shuffleWithinGroups(colOrder, rng);

  // 3) relabel: digit d becomes relabel[d - 1]
  Digit relabel[9] = { 1, 2, 3, 4, 5, 6, 7, 8, 9 };
  std::shuffle(relabel, relabel + 9, rng);

  Grid grid;
  for (int r = 0; r < 9; r++) {
    for (int c = 0; c < 9; c++) {
      const Digit d = base[rowOrder[r]][colOrder[c]];
      grid.setValue(toIndex(r, c), relabel[d - 1]);
    }
  }
  return grid;
}

int removeCells(Grid &grid, uint64_t seed, int minHints, int maxHints) {
  if (minHints >= maxHints) {
    throw std::invalid_argument("removeCells() requires minHints < maxHints");
  }
  if (minHints < 0 || maxHints > CELL_COUNT) {
    throw std::invalid_argument("removeCells() bounds must lie within 0..81");
  }

  std::mt19937_64 rng(seed);
  std::uniform_int_distribution<int> countDist(minHints, maxHints - 1);
  std::uniform_int_distribution<Index> cellDist(0, CELL_COUNT - 1);

  const int target = countDist(rng);
  bool cleared[CELL_COUNT] = { false };
  int clearedCount = 0;

  while (clearedCount < target) {
    const Index idx = cellDist(rng);
    if (cleared[idx]) {
      continue;
    }
    cleared[idx] = true;
    grid.clearValue(idx);
    clearedCount++;
  }

  return CELL_COUNT - clearedCount;
}

Puzzle generatePuzzle(uint64_t gridSeed, uint64_t removalSeed, int minHints, int maxHints) {
  Puzzle p;
  p.solution = generateCompleteGrid(gridSeed);
  p.puzzle = p.solution;
  p.hints = removeCells(p.puzzle, removalSeed, minHints, maxHints);
  return p;
}
