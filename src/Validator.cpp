#include <sstream>

#include "Validator.hpp"
#include "utils.hpp"

static bool checkUnit(const Unit &unit, std::string *why) {
  Mask seen = 0;
  for (int k = 0; k < 9; k++) {
    const Digit d = unit.cells[k];
    if (d == 0) {
      continue;
    }
    const Mask b = digitToBit(d);
    if ((seen & b) != 0) {
      if (why) {
        std::ostringstream oss;
        oss << "Duplicate digit " << (int)d << " in unit";
        *why = oss.str();
      }
      return false;
    }
    seen = (Mask)(seen | b);
  }
  return true;
}

bool validateGrid(const Grid &grid, std::string *why) {
  for (int u = 0; u < 9; u++) {
    std::string w;
    if (!checkUnit(grid.getRow(u), &w)) {
      if (why) {
        std::ostringstream oss;
        oss << "Row " << u << " invalid: " << w;
        *why = oss.str();
      }
      return false;
    }
    if (!checkUnit(grid.getColumn(u), &w)) {
      if (why) {
        std::ostringstream oss;
        oss << "Col " << u << " invalid: " << w;
        *why = oss.str();
      }
      return false;
    }
    if (!checkUnit(grid.getTile(u / 3, u % 3), &w)) {
      if (why) {
        std::ostringstream oss;
        oss << "Box " << u << " invalid: " << w;
        *why = oss.str();
      }
      return false;
    }
  }
  return true;
}

bool validateSolution(const Grid &puzzle, const Grid &solution, std::string *why) {
  // givens are preserved
  for (Index i = 0; i < CELL_COUNT; i++) {
    const Digit given = puzzle.getValue(i);
    if (given != 0 && solution.getValue(i) != given) {
      if (why) {
        std::ostringstream oss;
        oss << "Given mismatch at idx=" << i << " (in=" << (int)given
            << ", out=" << (int)solution.getValue(i) << ")";
        *why = oss.str();
      }
      return false;
    }
  }

  if (!solution.isComplete()) {
    if (why) {
      std::ostringstream oss;
      oss << "Solution incomplete: " << (CELL_COUNT - solution.countFilled()) << " empty cells";
      *why = oss.str();
    }
    return false;
  }

  // complete and duplicate-free means every unit holds 1..9 once
  return validateGrid(solution, why);
}
