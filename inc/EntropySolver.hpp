#ifndef ENTROPY_SOLVER_H
#define ENTROPY_SOLVER_H

#include <cstdint>
#include <random>
#include "Grid.hpp"
#include "MoveHistory.hpp"

enum class SolveStatus : uint8_t {
  Solved = 0,
  Unsolvable = 1, // backtracking ran out of history
  StepLimit = 2   // SolverConfig::maxSteps reached
};

const char *solveStatusName(SolveStatus status);

struct SolverConfig {
  uint32_t maxSteps = 200000; // 0 = unlimited
  bool verbose = false;       // log rewinds and substitutions
};

struct SolverStats {
  uint32_t steps = 0;
  uint32_t decisions = 0;   // ambiguous collapses (moves pushed from propagation)
  uint32_t forcedFills = 0; // single-candidate collapses
  uint32_t backtracks = 0;  // moves rewound
};

// Least-entropy solver: repeatedly collapses the most constrained empty cell,
// picking between several candidates with a one-ply lookahead, and rewinds the
// latest ambiguous decision when some cell is left without candidates.
//
// The random generator is only used to pick a substitute value while
// backtracking; the same seed and puzzle always give the same run.
class EntropySolver
{
public:
  explicit EntropySolver(std::mt19937_64 &rng, const SolverConfig &config = SolverConfig());

  // Mutates `grid` in place. On Unsolvable/StepLimit the grid holds the
  // partial state reached when the engine stopped.
  SolveStatus solve(Grid &grid);

  const SolverStats &getStats() const;

private:
  enum class Phase : uint8_t {
    Propagating,
    Backtracking,
    Done,
    Failed
  };

  // `open` is false once the selector found no empty cell; otherwise
  // `current` is the selector result for the present grid.
  Phase propagate(Grid &grid, MoveHistory &history, Entropy &current, bool &open);

  Phase backtrack(Grid &grid, MoveHistory &history, Entropy &current, bool &open);

  std::mt19937_64 &rng;
  SolverConfig config;
  SolverStats stats;
};

#endif // ENTROPY_SOLVER_H
