/**
 * @file decode_benchmarks.cpp
 * @brief Benchmarks for boundary scanning, record decoding and encoding.
 */

#include "bench_data.h"

#include <benchmark/benchmark.h>

namespace {

const uint8_t* bytes_of(const std::string& s) {
  return reinterpret_cast<const uint8_t*>(s.data());
}

} // namespace

// =============================================================================
// Boundary scanning: SIMD against the scalar reference
// =============================================================================

static void BM_ScanBoundaries(benchmark::State& state) {
  const std::string& stream = bench::cached_stream(static_cast<size_t>(state.range(0)));
  for (auto _ : state) {
    auto boundaries = libmarc::scan_boundaries(bytes_of(stream), stream.size());
    benchmark::DoNotOptimize(boundaries);
  }
  state.SetBytesProcessed(static_cast<int64_t>(stream.size() * state.iterations()));
}
BENCHMARK(BM_ScanBoundaries)->Arg(1000)->Arg(100000)->Unit(benchmark::kMicrosecond);

static void BM_ScanBoundariesScalar(benchmark::State& state) {
  const std::string& stream = bench::cached_stream(static_cast<size_t>(state.range(0)));
  for (auto _ : state) {
    auto boundaries = libmarc::scan_boundaries_scalar(bytes_of(stream), stream.size());
    benchmark::DoNotOptimize(boundaries);
  }
  state.SetBytesProcessed(static_cast<int64_t>(stream.size() * state.iterations()));
}
BENCHMARK(BM_ScanBoundariesScalar)->Arg(1000)->Arg(100000)->Unit(benchmark::kMicrosecond);

static void BM_CountRecords(benchmark::State& state) {
  const std::string& stream = bench::cached_stream(100000);
  for (auto _ : state) {
    benchmark::DoNotOptimize(libmarc::count_records(bytes_of(stream), stream.size()));
  }
  state.SetBytesProcessed(static_cast<int64_t>(stream.size() * state.iterations()));
}
BENCHMARK(BM_CountRecords)->Unit(benchmark::kMicrosecond);

// =============================================================================
// Single-record codec
// =============================================================================

static void BM_DecodeRecord(benchmark::State& state) {
  auto encoded = libmarc::encode_record(bench::catalog_record(1));
  if (!encoded) {
    state.SkipWithError(encoded.error.c_str());
    return;
  }
  libmarc::DecodeOptions options;
  options.validate_utf8 = state.range(0) != 0;
  for (auto _ : state) {
    auto result = libmarc::decode_record(bytes_of(encoded.value), encoded.value.size(), options);
    benchmark::DoNotOptimize(result);
  }
  state.SetBytesProcessed(static_cast<int64_t>(encoded.value.size() * state.iterations()));
  state.counters["RecordBytes"] = static_cast<double>(encoded.value.size());
}
BENCHMARK(BM_DecodeRecord)->Arg(0)->Arg(1);

static void BM_EncodeRecord(benchmark::State& state) {
  const libmarc::Record record = bench::catalog_record(1);
  for (auto _ : state) {
    auto encoded = libmarc::encode_record(record);
    benchmark::DoNotOptimize(encoded);
  }
}
BENCHMARK(BM_EncodeRecord);

// =============================================================================
// Parallel decode of a whole buffer
// =============================================================================

static void BM_DecodePool_Threads(benchmark::State& state) {
  const std::string& stream = bench::cached_stream(20000);
  auto boundaries = libmarc::scan_boundaries(bytes_of(stream), stream.size());

  libmarc::ThreadOptions threads;
  threads.num_threads = static_cast<size_t>(state.range(0));
  libmarc::DecodePool pool(threads);

  for (auto _ : state) {
    auto results = pool.decode_batch(boundaries, bytes_of(stream), stream.size());
    benchmark::DoNotOptimize(results);
  }
  state.SetBytesProcessed(static_cast<int64_t>(stream.size() * state.iterations()));
  state.SetItemsProcessed(static_cast<int64_t>(boundaries.size() * state.iterations()));
  state.counters["Threads"] = static_cast<double>(pool.num_threads());
}
BENCHMARK(BM_DecodePool_Threads)->RangeMultiplier(2)->Range(1, 16)->Unit(benchmark::kMillisecond);
