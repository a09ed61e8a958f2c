#include "bench_data.h"

#include <benchmark/benchmark.h>

// Global cache of encoded streams
std::map<size_t, std::string> stream_cache;

BENCHMARK_MAIN();
