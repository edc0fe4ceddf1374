#pragma once
/*
 * EventQueue
 *
 * Purpose: unbounded multi-producer / single-consumer channel.
 * Order: pop() returns items in push order; each producer's own items stay ordered.
 */
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

template <typename T>
class EventQueue {
public:
  void push(T v) {
    {
      std::lock_guard<std::mutex> lk(mu_);
      q_.push_back(std::move(v));
    }
    cv_.notify_one();
  }

  T pop() {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait(lk, [this]{ return !q_.empty(); });
    T v = std::move(q_.front());
    q_.pop_front();
    return v;
  }

  std::optional<T> pop_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mu_);
    if (!cv_.wait_for(lk, timeout, [this]{ return !q_.empty(); })) return std::nullopt;
    T v = std::move(q_.front());
    q_.pop_front();
    return v;
  }

private:
  std::mutex mu_;
  std::condition_variable cv_;
  std::deque<T> q_;
};
