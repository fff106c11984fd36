#ifndef VALIDATOR_H
#define VALIDATOR_H

#include <string>
#include "Grid.hpp"

// No row, column or tile holds the same non-zero digit twice.
// Empty cells are allowed. On failure `why` (if given) names the unit.
bool validateGrid(const Grid &grid, std::string *why = nullptr);

// `solution` is complete, valid, and keeps every given of `puzzle`.
bool validateSolution(const Grid &puzzle, const Grid &solution, std::string *why = nullptr);

#endif // VALIDATOR_H
