#pragma once

#include <cstdint>

// Weight initialisation draws from one process-wide generator. Training is
// single-threaded, so there is no per-thread stream bookkeeping.
void set_global_seed(uint32_t seed);
void set_nondeterministic_seed();

bool has_deterministic_seed();
uint32_t get_global_seed();

// uniform in [0, 1)
double random_uniform();
