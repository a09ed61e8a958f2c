#include "libmarc/options.h"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <string>
#include <thread>

namespace libmarc {

size_t resolve_num_threads(const ThreadOptions& options) {
  if (options.num_threads > 0) {
    return options.num_threads;
  }

  if (const char* env = std::getenv(ThreadOptions::ENV_NUM_THREADS); env && *env) {
    char* end = nullptr;
    // strtoul accepts a sign; only plain digits are a thread count
    unsigned long value = (*env >= '0' && *env <= '9') ? std::strtoul(env, &end, 10) : 0;
    if (end != nullptr && *end == '\0' && value > 0) {
      return static_cast<size_t>(value);
    }
    SPDLOG_WARN("Ignoring {}='{}': expected a positive integer", ThreadOptions::ENV_NUM_THREADS,
                env);
  }

  size_t n = std::thread::hardware_concurrency();
  if (n == 0)
    n = 4;
  return n;
}

} // namespace libmarc
