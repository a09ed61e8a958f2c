/**
 * @file stream_benchmarks.cpp
 * @brief End-to-end throughput of the batched reader and the pipeline.
 */

#include "bench_data.h"

#include <benchmark/benchmark.h>
#include <cstdio>
#include <fstream>
#include <string>
#include <unistd.h>

namespace {

constexpr size_t kRecords = 50000;

// The shared stream written to a file once for the file-backed benchmarks,
// removed at exit
struct StreamFile {
  std::string path;

  StreamFile() : path("/tmp/libmarc_bench_" + std::to_string(getpid()) + ".mrc") {
    std::ofstream out(path, std::ios::binary);
    const std::string& data = bench::cached_stream(kRecords);
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
  }
  ~StreamFile() { std::remove(path.c_str()); }
};

const std::string& stream_file() {
  static StreamFile file;
  return file.path;
}

template <typename Reader> size_t drain(Reader& reader) {
  size_t records = 0;
  for (auto item = reader.next(); !item.is_exhausted(); item = reader.next()) {
    if (item.is_record())
      ++records;
  }
  return records;
}

void report(benchmark::State& state, size_t records) {
  const std::string& stream = bench::cached_stream(kRecords);
  state.SetBytesProcessed(static_cast<int64_t>(stream.size() * state.iterations()));
  state.SetItemsProcessed(static_cast<int64_t>(kRecords * state.iterations()));
  if (records != kRecords)
    state.SkipWithError("record count mismatch");
}

} // namespace

// =============================================================================
// BatchedReader
// =============================================================================

static void BM_BatchedReader_Memory(benchmark::State& state) {
  const std::string& stream = bench::cached_stream(kRecords);
  libmarc::ReaderOptions options;
  options.batch_size = static_cast<size_t>(state.range(0));
  size_t records = 0;
  for (auto _ : state) {
    libmarc::BatchedReader reader(options);
    if (!reader.open_from_buffer(stream)) {
      state.SkipWithError("open failed");
      return;
    }
    records = drain(reader);
  }
  report(state, records);
}
BENCHMARK(BM_BatchedReader_Memory)->Arg(10)->Arg(100)->Arg(200)->Unit(benchmark::kMillisecond);

static void BM_BatchedReader_File(benchmark::State& state) {
  const std::string& path = stream_file();
  size_t records = 0;
  for (auto _ : state) {
    libmarc::BatchedReader reader;
    if (!reader.open(path)) {
      state.SkipWithError("open failed");
      return;
    }
    records = drain(reader);
  }
  report(state, records);
}
BENCHMARK(BM_BatchedReader_File)->Unit(benchmark::kMillisecond);

// =============================================================================
// Pipeline
// =============================================================================

static void BM_Pipeline_Memory_Threads(benchmark::State& state) {
  const std::string& stream = bench::cached_stream(kRecords);
  libmarc::PipelineOptions options;
  options.threads.num_threads = static_cast<size_t>(state.range(0));
  size_t records = 0;
  for (auto _ : state) {
    libmarc::Pipeline pipeline(options);
    if (!pipeline.open_from_buffer(stream)) {
      state.SkipWithError("open failed");
      return;
    }
    records = drain(pipeline);
  }
  report(state, records);
  state.counters["Threads"] = static_cast<double>(state.range(0));
}
BENCHMARK(BM_Pipeline_Memory_Threads)->RangeMultiplier(2)->Range(1, 16)->Unit(benchmark::kMillisecond);

static void BM_Pipeline_File(benchmark::State& state) {
  const std::string& path = stream_file();
  size_t records = 0;
  for (auto _ : state) {
    libmarc::Pipeline pipeline;
    if (!pipeline.open(path)) {
      state.SkipWithError("open failed");
      return;
    }
    records = drain(pipeline);
  }
  report(state, records);
}
BENCHMARK(BM_Pipeline_File)->Unit(benchmark::kMillisecond);

static void BM_Pipeline_MappedFile(benchmark::State& state) {
  const std::string& path = stream_file();
  size_t records = 0;
  for (auto _ : state) {
    libmarc::Pipeline pipeline;
    if (!pipeline.open_mapped(path)) {
      state.SkipWithError("open failed");
      return;
    }
    records = drain(pipeline);
  }
  report(state, records);
}
BENCHMARK(BM_Pipeline_MappedFile)->Unit(benchmark::kMillisecond);
