#include "Grid.hpp"
#include <cstring>
#include <stdexcept>

// =========================================================
// Unit
// =========================================================

Mask Unit::presentMask() const {
  Mask present = 0;
  for (int k = 0; k < 9; k++) {
    if (cells[k] != 0) {
      present |= digitToBit(cells[k]);
    }
  }
  return present;
}

// =========================================================
// Grid
// =========================================================

// empty grid
Grid::Grid() {
  std::memset(cells, 0, sizeof(cells));
}

int Grid::importFromString(const char *values) {
  if (values == nullptr) {
    return 0;
  }

  Digit parsed[CELL_COUNT];
  int count = 0;
  for (int i = 0; values[i] != '\0'; i++) {
    const char ch = values[i];
    if (count == CELL_COUNT || ch < '0' || ch > '9') {
      // too long or not a digit
      std::memset(cells, 0, sizeof(cells));
      return 0;
    }
    parsed[count++] = (Digit)(ch - '0');
  }

  if (count != CELL_COUNT) {
    std::memset(cells, 0, sizeof(cells));
    return 0;
  }

  std::memcpy(cells, parsed, sizeof(cells));
  return 1;
}

int Grid::importFromString(const std::string &values) {
  // embedded NULs would be cut by the C-string overload
  if (values.size() != (size_t)CELL_COUNT) {
    std::memset(cells, 0, sizeof(cells));
    return 0;
  }
  return importFromString(values.c_str());
}

void Grid::exportToString(char *out81, char emptyChar) const {
  for (Index i = 0; i < CELL_COUNT; i++) {
    const Digit value = cells[i];
    out81[i] = value ? (char)('0' + value) : emptyChar;
  }
  out81[CELL_COUNT] = '\0';
}

std::string Grid::toString() const {
  char buf[CELL_COUNT + 1];
  exportToString(buf);
  return std::string(buf, CELL_COUNT);
}

// --- values API ---
Digit Grid::getValue(Index idx) const {
  if (!isValidIndex(idx)) {
    throw std::out_of_range("Grid::getValue() index out of range");
  }
  return cells[idx];
}

Digit Grid::getValue(int row, int col) const {
  if (!isValidLine(row) || !isValidLine(col)) {
    throw std::out_of_range("Grid::getValue() row or column out of range");
  }
  return cells[toIndex(row, col)];
}

void Grid::setValue(Index idx, Digit digit) {
  if (!isValidIndex(idx) || digit > 9) {
    throw std::out_of_range("Grid::setValue() index or digit out of range");
  }
  cells[idx] = digit;
}

void Grid::clearValue(Index idx) {
  if (!isValidIndex(idx)) {
    throw std::out_of_range("Grid::clearValue() index out of range");
  }
  cells[idx] = 0;
}

bool Grid::isComplete() const {
  for (Index i = 0; i < CELL_COUNT; i++) {
    if (cells[i] == 0) {
      return false;
    }
  }
  return true;
}

int Grid::countFilled() const {
  int filled = 0;
  for (Index i = 0; i < CELL_COUNT; i++) {
    if (cells[i] != 0) {
      filled++;
    }
  }
  return filled;
}

// --- views ---
Unit Grid::getRow(int row) const {
  if (!isValidLine(row)) {
    throw std::out_of_range("Grid::getRow() row out of range");
  }
  Unit u;
  for (int k = 0; k < 9; k++) {
    u.cells[k] = cells[ROW_CELLS[row][k]];
  }
  return u;
}

Unit Grid::getColumn(int col) const {
  if (!isValidLine(col)) {
    throw std::out_of_range("Grid::getColumn() column out of range");
  }
  Unit u;
  for (int k = 0; k < 9; k++) {
    u.cells[k] = cells[COL_CELLS[col][k]];
  }
  return u;
}

Unit Grid::getTile(int tileRow, int tileCol) const {
  if (tileRow < 0 || tileRow > 2 || tileCol < 0 || tileCol > 2) {
    throw std::out_of_range("Grid::getTile() tile out of range");
  }
  Unit u;
  const int b = tileRow * 3 + tileCol;
  for (int k = 0; k < 9; k++) {
    u.cells[k] = cells[BOX_CELLS[b][k]];
  }
  return u;
}

// --- entropy API ---
bool Grid::candidatesAt(int row, int col, Mask &out) const {
  if (!isValidLine(row) || !isValidLine(col)) {
    throw std::out_of_range("Grid::candidatesAt() row or column out of range");
  }
  if (cells[toIndex(row, col)] != 0) {
    return false;
  }

  const Mask used = (Mask)(getRow(row).presentMask() |
                           getColumn(col).presentMask() |
                           getTile(row / 3, col / 3).presentMask());
  out = (Mask)(ALL_DIGITS & ~used);
  return true;
}

bool Grid::findLeastEntropy(Entropy &out) const {
  bool found = false;
  size_t best = 10; // larger than any candidate set

  for (int row = 0; row < 9; row++) {
    for (int col = 0; col < 9; col++) {
      Mask cands;
      if (!candidatesAt(row, col, cands)) {
        continue;
      }
      // strictly smaller: ties keep the earliest cell in scan order
      const size_t n = countBits9(cands);
      if (n < best) {
        best = n;
        out.idx = toIndex(row, col);
        out.candidates = cands;
        found = true;
      }
    }
  }

  return found;
}

bool Grid::operator==(const Grid &other) const {
  return std::memcmp(cells, other.cells, sizeof(cells)) == 0;
}

bool Grid::operator!=(const Grid &other) const {
  return !(*this == other);
}

inline bool Grid::isValidIndex(Index idx) {
  return idx >= 0 && idx < CELL_COUNT;
}

inline bool Grid::isValidLine(int n) {
  return n >= 0 && n < 9;
}
