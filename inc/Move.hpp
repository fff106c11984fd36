#ifndef MOVE_H
#define MOVE_H

#include <cstdint>
#include <vector>
#include "utils.hpp"

// one ambiguous decision of the solver, plus every forced fill it caused
class Move
{
public:
  Move(Index idx, Digit newValue, Mask tried = 0);

  Index idx;
  Digit newValue;

  // values already attempted at idx from the same grid state, newValue included
  Mask getTriedMask() const;

  const std::vector<Index> &getCascades() const;
  size_t getNumberOfCascades() const;
  void addCascade(Index idx);

private:
  Mask tried;
  // a move owns the cells it forced, so they are undone together
  std::vector<Index> cascades;
};

#endif // MOVE_H
