#include <stdexcept>

#include "EntropySolver.hpp"
#include "platform.hpp"
#include "utils.hpp"

const char *solveStatusName(SolveStatus status) {
  switch (status) {
    case SolveStatus::Solved:
      return "solved";
    case SolveStatus::Unsolvable:
      return "unsolvable";
    case SolveStatus::StepLimit:
      return "step limit reached";
  }
  return "unknown";
}

EntropySolver::EntropySolver(std::mt19937_64 &rng, const SolverConfig &config)
  : rng(rng), config(config) { }

const SolverStats &EntropySolver::getStats() const {
  return stats;
}

SolveStatus EntropySolver::solve(Grid &grid) {
  stats = SolverStats();

  MoveHistory history;
  Entropy current;
  bool open = grid.findLeastEntropy(current);
  Phase phase = Phase::Propagating;

  for (;;) {
    if (phase == Phase::Done) {
      return SolveStatus::Solved;
    }
    if (phase == Phase::Failed) {
      return SolveStatus::Unsolvable;
    }
    if (config.maxSteps != 0 && stats.steps >= config.maxSteps) {
      if (config.verbose) {
        emscripten_log(EM_LOG_WARN, "Step limit %u reached with %d cells filled",
                       config.maxSteps, grid.countFilled());
      }
      return SolveStatus::StepLimit;
    }
    stats.steps++;

    if (phase == Phase::Propagating) {
      phase = propagate(grid, history, current, open);
    } else {
      phase = backtrack(grid, history, current, open);
    }
  }
}

// =========================================================
// Propagation
// =========================================================

EntropySolver::Phase EntropySolver::propagate(Grid &grid, MoveHistory &history,
                                              Entropy &current, bool &open) {
  if (!open) {
    return Phase::Done;
  }
  if (current.candidates == 0) {
    return Phase::Backtracking;
  }

  const Index idx = current.idx;

  if (current.size() == 1) {
    // forced: belongs to the latest decision, if there is one
    grid.setValue(idx, bitToDigitSingle(current.candidates));
    history.addCascade(idx);
    stats.forcedFills++;
    open = grid.findLeastEntropy(current);
    return Phase::Propagating;
  }

  // several candidates: keep the one leaving the most constrained next cell
  bool chosen = false;
  Digit choice = 0;
  size_t choiceEntropy = 0;

  for (Digit d = 1; d <= 9; d++) {
    if ((current.candidates & digitToBit(d)) == 0) {
      continue;
    }

    grid.setValue(idx, d);
    Entropy next;
    if (!grid.findLeastEntropy(next)) {
      // last empty cell
      stats.decisions++;
      open = false;
      return Phase::Done;
    }
    if (next.candidates == 0) {
      continue;
    }
    if (!chosen || next.size() < choiceEntropy) {
      chosen = true;
      choice = d;
      choiceEntropy = next.size();
    }
  }

  if (!chosen) {
    // every candidate empties another cell: this cell is a contradiction too
    grid.clearValue(idx);
    return Phase::Backtracking;
  }

  grid.setValue(idx, choice);
  history.push(Move(idx, choice));
  stats.decisions++;
  open = grid.findLeastEntropy(current);
  return Phase::Propagating;
}

// =========================================================
// Backtracking
// =========================================================

EntropySolver::Phase EntropySolver::backtrack(Grid &grid, MoveHistory &history,
                                              Entropy &current, bool &open) {
  // rewinds one decision per iteration until a substitute value is found
  for (;;) {
    if (history.empty()) {
      if (config.verbose) {
        emscripten_log(EM_LOG_WARN, "Backtracking exhausted the move history");
      }
      return Phase::Failed;
    }

    const Move last = history.rewind(grid);
    stats.backtracks++;

    const Index idx = last.idx;
    Mask cands;
    if (!grid.candidatesAt(idx / 9, idx % 9, cands)) {
      throw std::logic_error("EntropySolver::backtrack() rewound cell is not empty");
    }
    cands = (Mask)(cands & ~last.getTriedMask());

    Digit survivors[9];
    int survivorCount = 0;
    for (Digit d = 1; d <= 9; d++) {
      if ((cands & digitToBit(d)) == 0) {
        continue;
      }

      grid.setValue(idx, d);
      Entropy next;
      if (!grid.findLeastEntropy(next)) {
        open = false;
        return Phase::Done;
      }
      if (next.candidates != 0) {
        survivors[survivorCount++] = d;
      }
    }
    grid.clearValue(idx);

    if (survivorCount > 0) {
      std::uniform_int_distribution<int> pick(0, survivorCount - 1);
      const Digit substitute = survivors[pick(rng)];

      grid.setValue(idx, substitute);
      history.push(Move(idx, substitute, last.getTriedMask()));
      open = grid.findLeastEntropy(current);

      if (config.verbose) {
        emscripten_log(EM_LOG_CONSOLE, "Substitute at r%dc%d: %d -> %d (tried %s, depth %u)",
                       idx / 9, idx % 9, last.newValue, substitute,
                       maskToString(last.getTriedMask()).c_str(), (unsigned)history.size());
      }
      return Phase::Propagating;
    }

    if (config.verbose) {
      emscripten_log(EM_LOG_CONSOLE, "No substitute at r%dc%d, rewinding further (depth %u)",
                     idx / 9, idx % 9, (unsigned)history.size());
    }
  }
}
