// Sudowave Core (C++)
// Entropy-driven Sudoku solver and puzzle generator behind a plain C API,
// exportable to WASM or linked natively.
//
// Exported functions:
//   int sudowave_solve_full(const char *in81, uint64_t seed, char *out81);
//   int sudowave_generate(uint64_t gridSeed, uint64_t removalSeed, int minHints, int maxHints, char *out81);
//   int sudowave_validate(const char *in81);
//
// Input string:
//   in81[81]   : char      ('0' = empty, '1'..'9' = digit), exactly 81 chars
//
// Output string (out81[82] as char, NUL-terminated):
//   sudowave_solve_full : '.' = not solved, '1'..'9' = digit
//   sudowave_generate   : '0' = empty, '1'..'9' = hint (same format as in81)
//
// Return values:
//   sudowave_solve_full : 1 = solved, 0 = malformed/conflicting input or solver failure
//   sudowave_generate   : number of hints, 0 = invalid hint bounds
//   sudowave_validate   : 1 = no duplicate digit in any unit, 0 = duplicate or malformed
//
// Notes:
//   - Every call is self-contained; no state is kept between calls.
//   - The seed only drives backtracking substitutions; a fixed seed reproduces a run.
//   - Cells of a failed solve are exported as far as the solver got.

#include <cstdint>
#include <cstddef>
#include <random>
#include <stdexcept>
#include <string>

#include "sudowave.hpp"
#include "EntropySolver.hpp"
#include "Generator.hpp"
#include "Grid.hpp"
#include "Validator.hpp"
#include "platform.hpp"

// =========================================================
// Public API
// =========================================================

extern "C"
{
  // Solves an entire Sudoku given its initial representation in one shot.
  // Returns 0 in case of error, else 1.
  EMSCRIPTEN_KEEPALIVE
  int sudowave_solve_full(const char *in81, uint64_t seed, char *out81) {
    if (in81 == nullptr || out81 == nullptr) {
      return 0;
    }

    Grid grid;
    if (!grid.importFromString(in81)) {
      emscripten_log(EM_LOG_ERROR, "sudowave_solve_full: expected 81 digits");
      return 0;
    }

    // conflicting givens would survive the solver untouched
    std::string why;
    if (!validateGrid(grid, &why)) {
      emscripten_log(EM_LOG_ERROR, "sudowave_solve_full: invalid puzzle: %s", why.c_str());
      grid.exportToString(out81, '.');
      return 0;
    }

    std::mt19937_64 rng(seed);
    EntropySolver solver(rng);
    SolveStatus status;
    try {
      status = solver.solve(grid);
    } catch (const std::logic_error &e) {
      emscripten_log(EM_LOG_ERROR, "sudowave_solve_full: internal error: %s", e.what());
      grid.exportToString(out81, '.');
      return 0;
    }

    grid.exportToString(out81, '.');
    if (status != SolveStatus::Solved) {
      emscripten_log(EM_LOG_WARN, "sudowave_solve_full: %s after %u steps",
                     solveStatusName(status), solver.getStats().steps);
      return 0;
    }
    return 1;
  }

  // Generates a puzzle from two independent seeds.
  // Returns the number of hints, 0 in case of error.
  EMSCRIPTEN_KEEPALIVE
  int sudowave_generate(uint64_t gridSeed, uint64_t removalSeed, int minHints, int maxHints, char *out81) {
    if (out81 == nullptr) {
      return 0;
    }

    try {
      const Puzzle p = generatePuzzle(gridSeed, removalSeed, minHints, maxHints);
      p.puzzle.exportToString(out81);
      return p.hints;
    } catch (const std::invalid_argument &e) {
      emscripten_log(EM_LOG_ERROR, "sudowave_generate: %s", e.what());
      return 0;
    }
  }

  // Checks rows, columns and tiles for duplicate digits (empty cells allowed).
  // Returns 1 if valid, else 0.
  EMSCRIPTEN_KEEPALIVE
  int sudowave_validate(const char *in81) {
    Grid grid;
    if (!grid.importFromString(in81)) {
      return 0;
    }
    return validateGrid(grid) ? 1 : 0;
  }
} // extern "C"
