#ifndef GRID_H
#define GRID_H

#include <cstddef>
#include <cstdint>
#include <string>
#include "utils.hpp"

// one row, column or 3x3 tile, copied out of the grid
struct Unit {
  Digit cells[9];

  Mask presentMask() const;
};

// least-candidate cell as reported by Grid::findLeastEntropy
struct Entropy {
  Index idx;
  Mask candidates;

  int row() const { return idxRow(idx); }
  int col() const { return idxCol(idx); }
  size_t size() const { return countBits9(candidates); }
};

class Grid
{
public:
  Grid();

  // exactly 81 chars '0'..'9'; returns 0 and leaves an empty grid otherwise
  int importFromString(const char *values);

  int importFromString(const std::string &values);

  // writes 81 chars plus terminator; empty cells are written as `emptyChar`
  void exportToString(char *out81, char emptyChar = '0') const;

  std::string toString() const;

  // --- values API ---
  // accessors and mutators throw std::out_of_range on bad coordinates
  Digit getValue(Index idx) const;

  Digit getValue(int row, int col) const;

  void setValue(Index idx, Digit digit);

  void clearValue(Index idx);

  bool isComplete() const;

  int countFilled() const;

  // --- views ---
  Unit getRow(int row) const;

  Unit getColumn(int col) const;

  Unit getTile(int tileRow, int tileCol) const;

  // --- entropy API ---
  // false if the cell is filled, otherwise `out` = digits free in row, column and tile
  bool candidatesAt(int row, int col, Mask &out) const;

  // false if no cell is empty; `out.candidates` may be 0 (contradiction)
  bool findLeastEntropy(Entropy &out) const;

  bool operator==(const Grid &other) const;

  bool operator!=(const Grid &other) const;

private:
  Digit cells[CELL_COUNT];

  static inline bool isValidIndex(Index idx);

  // row or column number
  static inline bool isValidLine(int n);
};

#endif // GRID_H
