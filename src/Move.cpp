#include "Move.hpp"

// =========================================================
// Moves
// =========================================================

Move::Move(Index idx, Digit newValue, Mask tried)
  : idx(idx), newValue(newValue), tried((Mask)(tried | digitToBit(newValue))) { }

Mask Move::getTriedMask() const {
  return tried;
}

const std::vector<Index> &Move::getCascades() const {
  return cascades;
}

size_t Move::getNumberOfCascades() const {
  return cascades.size();
}

void Move::addCascade(Index idx) {
  cascades.push_back(idx);
}
