#include "MoveHistory.hpp"
#include <stdexcept>

// =========================================================
// Move history (LIFO of ambiguous decisions)
// =========================================================

MoveHistory::MoveHistory() {
  moves.reserve(CELL_COUNT);
}

void MoveHistory::push(const Move &x) {
  moves.push_back(x);
}

Move MoveHistory::pop() {
  if (moves.empty()) {
    throw std::logic_error("MoveHistory::pop() on empty history");
  }

  Move last = moves.back();
  moves.pop_back();
  return last;
}

Move &MoveHistory::top() {
  if (moves.empty()) {
    throw std::logic_error("MoveHistory::top() on empty history");
  }

  return moves.back();
}

std::size_t MoveHistory::size() const noexcept {
  return moves.size();
}

bool MoveHistory::empty() const noexcept {
  return moves.empty();
}

bool MoveHistory::addCascade(Index idx) {
  if (moves.empty()) {
    return false;
  }

  moves.back().addCascade(idx);
  return true;
}

Move MoveHistory::rewind(Grid &grid) {
  Move last = pop();
  for (Index idx : last.getCascades()) {
    grid.clearValue(idx);
  }
  grid.clearValue(last.idx);
  return last;
}
