#include "gatenet/rng.hpp"

#include <random>
#include <stdexcept>

using std::mt19937;
using std::random_device;
using std::runtime_error;
using std::seed_seq;
using std::uniform_real_distribution;

static uint32_t g_seed_value = 0;
static bool g_use_deterministic_seed = false;
static bool g_generator_seeded = false;

static mt19937& generator()
{
    static mt19937 rng;

    if (!g_generator_seeded) {
        if (g_use_deterministic_seed) {
            seed_seq seq{g_seed_value, 0x9e3779b9u, 0x85ebca6bu};
            rng.seed(seq);
        } else {
            random_device rd;
            seed_seq seq{rd(), rd(), 0x9e3779b9u, 0x85ebca6bu};
            rng.seed(seq);
        }
        g_generator_seeded = true;
    }

    return rng;
}

void set_global_seed(uint32_t seed)
{
    g_seed_value = seed;
    g_use_deterministic_seed = true;
    g_generator_seeded = false;
}

void set_nondeterministic_seed()
{
    g_use_deterministic_seed = false;
    g_generator_seeded = false;
}

bool has_deterministic_seed()
{
    return g_use_deterministic_seed;
}

uint32_t get_global_seed()
{
    if (!g_use_deterministic_seed) {
        throw runtime_error("get_global_seed: generator is not in deterministic mode");
    }
    return g_seed_value;
}

double random_uniform()
{
    uniform_real_distribution<double> uniform(0.0, 1.0);
    return uniform(generator());
}
