#pragma once

#include "error.h"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace libmarc {

/// Thread-safe bounded FIFO between the pipeline's producer and its consumer.
///
/// Backpressure: push() blocks while the channel holds capacity items.
/// pop() blocks while the channel is empty and still open.
/// close() lets the consumer drain what is buffered; pop() then returns nullopt.
/// close_with_error() does the same and leaves a StreamError that take_error()
/// hands out exactly once.
/// cancel() discards buffered items and unblocks every waiting thread.
template <typename T> class RecordChannel {
public:
  explicit RecordChannel(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

  RecordChannel(const RecordChannel&) = delete;
  RecordChannel& operator=(const RecordChannel&) = delete;

  /// Producer: append an item, blocking while the channel is full.
  /// Returns false if the channel was closed or cancelled.
  bool push(T&& item) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_full_.wait(lock, [this] { return items_.size() < capacity_ || closed_ || cancelled_; });

    if (closed_ || cancelled_)
      return false;

    items_.push_back(std::move(item));
    if (items_.size() > high_water_mark_)
      high_water_mark_ = items_.size();
    not_empty_.notify_one();
    return true;
  }

  /// Consumer: remove the oldest item, blocking while the channel is empty
  /// and open. Returns nullopt once closed and drained, or after cancel().
  std::optional<T> pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait(lock, [this] { return !items_.empty() || closed_ || cancelled_; });
    return pop_locked();
  }

  enum class TryPop { ITEM, EMPTY, DONE };

  /// Consumer: non-blocking pop. EMPTY means nothing is buffered yet but more
  /// may arrive; DONE means the channel is closed and drained, or cancelled.
  TryPop try_pop(std::optional<T>& out) {
    std::unique_lock<std::mutex> lock(mutex_);
    out = pop_locked();
    if (out.has_value())
      return TryPop::ITEM;
    return (closed_ || cancelled_) ? TryPop::DONE : TryPop::EMPTY;
  }

  /// Signal that no more items will be added. Unblocks all waiting threads.
  void close() {
    std::unique_lock<std::mutex> lock(mutex_);
    closed_ = true;
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  /// Close, recording the failure that ended production. Only the first
  /// error is kept.
  void close_with_error(StreamError error) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!closed_ && !cancelled_)
      error_ = std::move(error);
    closed_ = true;
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  /// Drop buffered items and wake everyone. Later pushes fail and pops
  /// return nullopt.
  void cancel() {
    std::unique_lock<std::mutex> lock(mutex_);
    cancelled_ = true;
    items_.clear();
    error_.reset();
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  /// The terminal error, once. Empty until the channel is closed and drained.
  std::optional<StreamError> take_error() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!items_.empty())
      return std::nullopt;
    return std::exchange(error_, std::nullopt);
  }

  bool is_closed() const {
    std::unique_lock<std::mutex> lock(mutex_);
    return closed_;
  }

  bool is_cancelled() const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cancelled_;
  }

  size_t size() const {
    std::unique_lock<std::mutex> lock(mutex_);
    return items_.size();
  }

  size_t capacity() const { return capacity_; }

  /// Largest number of items ever buffered at once
  size_t high_water_mark() const {
    std::unique_lock<std::mutex> lock(mutex_);
    return high_water_mark_;
  }

private:
  std::optional<T> pop_locked() {
    if (cancelled_ || items_.empty())
      return std::nullopt;
    std::optional<T> item(std::move(items_.front()));
    items_.pop_front();
    not_full_.notify_one();
    return item;
  }

  std::deque<T> items_;
  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  size_t capacity_;
  size_t high_water_mark_ = 0;
  std::optional<StreamError> error_;
  bool closed_ = false;
  bool cancelled_ = false;
};

} // namespace libmarc
