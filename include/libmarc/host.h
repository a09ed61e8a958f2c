#pragma once

#include "types.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <utility>

/**
 * @file host.h
 * @brief Cooperation with hosts that serialize calls behind one global lock.
 *
 * Some embedding runtimes let only one thread at a time call into objects
 * they own. Reading from such a host's stream takes three phases:
 *
 * 1. Read raw bytes from the host stream. The host lock is held.
 * 2. Decode them. The lock is released, so other host threads can run.
 * 3. Hand the records to the host adapter. The lock is held again.
 *
 * Phases 1 and 3 take a HostLockToken. Only a live HostLockGuard can produce
 * one, so an operation that needs the host lock cannot be called without it.
 * Phase 2 functions take no token and hold no host objects, which means they
 * cannot call into the host. HostUnlock releases the lock for the length of
 * one scope.
 */

namespace libmarc {

/// The embedding environment's global execution lock.
class HostRuntime {
public:
  virtual ~HostRuntime() = default;

  virtual void acquire() = 0;
  virtual void release() = 0;
};

/// HostRuntime backed by a process-local mutex. Suitable for hosts whose
/// lock is a plain mutual-exclusion lock, and for tests.
class MutexHostRuntime : public HostRuntime {
public:
  void acquire() override { mutex_.lock(); }
  void release() override { mutex_.unlock(); }

private:
  std::mutex mutex_;
};

class HostLockGuard;

/// Proof that the calling thread holds the host lock.
/// Neither copyable nor movable; obtainable only from a HostLockGuard.
class HostLockToken {
public:
  HostLockToken(const HostLockToken&) = delete;
  HostLockToken& operator=(const HostLockToken&) = delete;
  HostLockToken(HostLockToken&&) = delete;
  HostLockToken& operator=(HostLockToken&&) = delete;

  HostRuntime& runtime() const { return runtime_; }

private:
  friend class HostLockGuard;
  explicit HostLockToken(HostRuntime& runtime) : runtime_(runtime) {}

  HostRuntime& runtime_;
};

/// Holds the host lock for its lifetime.
///
/// Use the std::adopt_lock constructor when the calling thread already holds
/// the lock, e.g. inside a host callback; the guard then neither acquires nor
/// releases it.
class HostLockGuard {
public:
  explicit HostLockGuard(HostRuntime& runtime) : token_(runtime), owns_(true) { runtime.acquire(); }
  HostLockGuard(HostRuntime& runtime, std::adopt_lock_t) : token_(runtime), owns_(false) {}

  ~HostLockGuard() {
    if (owns_)
      token_.runtime().release();
  }

  HostLockGuard(const HostLockGuard&) = delete;
  HostLockGuard& operator=(const HostLockGuard&) = delete;

  const HostLockToken& token() const { return token_; }

private:
  HostLockToken token_;
  bool owns_;
};

/// Releases the host lock for one scope and reacquires it on exit, including
/// exit by exception.
class HostUnlock {
public:
  explicit HostUnlock(const HostLockToken& token) : runtime_(token.runtime()) { runtime_.release(); }
  ~HostUnlock() { runtime_.acquire(); }

  HostUnlock(const HostUnlock&) = delete;
  HostUnlock& operator=(const HostUnlock&) = delete;

private:
  HostRuntime& runtime_;
};

/// Runs fn with the host lock released.
template <typename F> decltype(auto) without_host_lock(const HostLockToken& token, F&& fn) {
  HostUnlock unlock(token);
  return std::forward<F>(fn)();
}

/**
 * @brief A byte stream owned by the host.
 *
 * Not thread-safe. Every read requires the host lock, witnessed by the
 * token argument.
 */
class HostStream {
public:
  virtual ~HostStream() = default;

  /// Reads up to max_bytes into buffer. Returns 0 at end of stream.
  virtual Result<size_t> read(const HostLockToken& token, uint8_t* buffer, size_t max_bytes) = 0;
};

/// HostStream over a host-provided read callback.
class CallbackHostStream : public HostStream {
public:
  using ReadFn = std::function<Result<size_t>(uint8_t* buffer, size_t max_bytes)>;

  explicit CallbackHostStream(ReadFn read_fn) : read_fn_(std::move(read_fn)) {}

  Result<size_t> read(const HostLockToken&, uint8_t* buffer, size_t max_bytes) override {
    return read_fn_(buffer, max_bytes);
  }

private:
  ReadFn read_fn_;
};

} // namespace libmarc
