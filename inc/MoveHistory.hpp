#ifndef MOVE_HISTORY_H
#define MOVE_HISTORY_H

#include <vector>
#include "Move.hpp"
#include "Grid.hpp"

class MoveHistory
{
public:
  MoveHistory();

  void push(const Move &x);

  Move pop();

  Move &top();

  std::size_t size() const noexcept;

  bool empty() const noexcept;

  // records a forced fill on the latest move; no-op before the first decision
  bool addCascade(Index idx);

  // clears the cascades and the cell of the latest move, then pops it
  Move rewind(Grid &grid);

private:
  std::vector<Move> moves;
};

#endif // MOVE_HISTORY_H
