#ifndef SUDOWAVE_H
#define SUDOWAVE_H

#include <cstdint>

extern "C"
{
  int sudowave_solve_full(const char *in81, uint64_t seed, char *out81);

  int sudowave_generate(uint64_t gridSeed, uint64_t removalSeed, int minHints, int maxHints, char *out81);

  int sudowave_validate(const char *in81);
} // extern "C"

#endif // SUDOWAVE_H
