/**
 * @file channel.hpp
 * @brief Multi-producer/single-consumer in-process channel (unbounded).
 *
 * Design goals:
 *  - Sender handles are copyable: every neighbor of a node holds its own copy.
 *  - The Receiver is move-only: only the owning node drains it.
 *  - Errors are values (expected<_, ChannelError>), never exceptions.
 *  - Dropping the Receiver disconnects the channel: later sends fail with
 *    ChannelError::Disconnected. Dropping every Sender lets the Receiver drain
 *    what is left and then report Disconnected.
 *
 * Construction:
 *  - Use make_channel<T>() to obtain a connected {Sender, Receiver} pair.
 *
 * @tparam T Element type. Must be move-constructible.
 */
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <type_traits>
#include <utility>

#include "dronet/compat/expected.hpp"  // dronet_detail::expected / unexpected

namespace dronet::chan {

/**
 * @brief Error codes reported by channel operations.
 */
enum class ChannelError : std::uint8_t {
  Disconnected = 1,  ///< Other side is gone (receiver dropped, or all senders dropped and queue drained)
  Empty,             ///< try_recv found nothing queued
  Timeout            ///< recv_for waited the full duration
};

namespace detail {

/// @brief State shared by all handles of one channel.
template <class T>
struct Shared final {
  std::mutex              mu;
  std::condition_variable cv;
  std::deque<T>           queue;
  std::size_t             senders{0};
  bool                    receiver_alive{true};
};

} // namespace detail

template <class T> class Receiver;

/**
 * @brief Cloneable sending half.
 */
template <class T>
class Sender final {
  static_assert(std::is_move_constructible_v<T>, "channel element must be movable");

public:
  /// @brief Detached sender; every send fails with Disconnected.
  Sender() noexcept = default;

  explicit Sender(std::shared_ptr<detail::Shared<T>> s) noexcept : s_(std::move(s)) {
    attach();
  }

  Sender(const Sender& other) noexcept : s_(other.s_) { attach(); }

  Sender(Sender&& other) noexcept : s_(std::move(other.s_)) {}

  Sender& operator=(const Sender& other) noexcept {
    if (this != &other) {
      detach();
      s_ = other.s_;
      attach();
    }
    return *this;
  }

  Sender& operator=(Sender&& other) noexcept {
    if (this != &other) {
      detach();
      s_ = std::move(other.s_);
    }
    return *this;
  }

  ~Sender() { detach(); }

  /**
   * @brief Enqueue one element. Never blocks beyond the internal lock.
   * @return ChannelError::Disconnected if the receiver is gone.
   */
  dronet_detail::expected<void, ChannelError> send(T v) const {
    if (!s_) return dronet_detail::unexpected(ChannelError::Disconnected);
    {
      std::lock_guard<std::mutex> lk(s_->mu);
      if (!s_->receiver_alive) return dronet_detail::unexpected(ChannelError::Disconnected);
      s_->queue.push_back(std::move(v));
    }
    s_->cv.notify_one();
    return {};
  }

  /// @brief True while the receiving half exists.
  bool connected() const noexcept {
    if (!s_) return false;
    std::lock_guard<std::mutex> lk(s_->mu);
    return s_->receiver_alive;
  }

  /// @brief True if both handles feed the same receiver.
  bool same_channel(const Sender& other) const noexcept { return s_ && s_ == other.s_; }

private:
  void attach() noexcept {
    if (!s_) return;
    std::lock_guard<std::mutex> lk(s_->mu);
    ++s_->senders;
  }

  void detach() noexcept {
    if (!s_) return;
    bool last = false;
    {
      std::lock_guard<std::mutex> lk(s_->mu);
      last = (--s_->senders == 0);
    }
    if (last) s_->cv.notify_all(); // wake a blocked receiver so it can observe Disconnected
    s_.reset();
  }

  std::shared_ptr<detail::Shared<T>> s_{};
};

/**
 * @brief Single-owner receiving half.
 */
template <class T>
class Receiver final {
public:
  /// @brief Detached receiver; every receive reports Disconnected.
  Receiver() noexcept = default;

  explicit Receiver(std::shared_ptr<detail::Shared<T>> s) noexcept : s_(std::move(s)) {}

  Receiver(const Receiver&)            = delete; ///< Non-copyable
  Receiver& operator=(const Receiver&) = delete; ///< Non-assignable

  Receiver(Receiver&& other) noexcept : s_(std::move(other.s_)) {}

  Receiver& operator=(Receiver&& other) noexcept {
    if (this != &other) {
      close();
      s_ = std::move(other.s_);
    }
    return *this;
  }

  ~Receiver() { close(); }

  /**
   * @brief Pop one element without waiting.
   * @return Empty if nothing is queued, Disconnected if nothing is queued and no sender is left.
   */
  dronet_detail::expected<T, ChannelError> try_recv() {
    if (!s_) return dronet_detail::unexpected(ChannelError::Disconnected);
    std::lock_guard<std::mutex> lk(s_->mu);
    return pop_locked();
  }

  /**
   * @brief Pop one element, waiting up to @p timeout.
   * @return Timeout if nothing arrived, Disconnected if no sender is left.
   */
  template <class Rep, class Period>
  dronet_detail::expected<T, ChannelError> recv_for(std::chrono::duration<Rep, Period> timeout) {
    if (!s_) return dronet_detail::unexpected(ChannelError::Disconnected);
    std::unique_lock<std::mutex> lk(s_->mu);
    s_->cv.wait_for(lk, timeout, [&]{ return !s_->queue.empty() || s_->senders == 0; });
    auto r = pop_locked();
    if (!r && r.error() == ChannelError::Empty) {
      return dronet_detail::unexpected(ChannelError::Timeout);
    }
    return r;
  }

  /// @brief Pop one element, blocking until one arrives or all senders are gone.
  dronet_detail::expected<T, ChannelError> recv() {
    if (!s_) return dronet_detail::unexpected(ChannelError::Disconnected);
    std::unique_lock<std::mutex> lk(s_->mu);
    s_->cv.wait(lk, [&]{ return !s_->queue.empty() || s_->senders == 0; });
    return pop_locked();
  }

  /// @brief Queued elements (snapshot).
  std::size_t size() const noexcept {
    if (!s_) return 0;
    std::lock_guard<std::mutex> lk(s_->mu);
    return s_->queue.size();
  }

  /// @brief True if nothing is queued (snapshot).
  bool empty() const noexcept { return size() == 0; }

private:
  dronet_detail::expected<T, ChannelError> pop_locked() {
    if (s_->queue.empty()) {
      return dronet_detail::unexpected(s_->senders == 0 ? ChannelError::Disconnected
                                                        : ChannelError::Empty);
    }
    T v = std::move(s_->queue.front());
    s_->queue.pop_front();
    return v;
  }

  void close() noexcept {
    if (!s_) return;
    std::deque<T> dropped;
    {
      std::lock_guard<std::mutex> lk(s_->mu);
      s_->receiver_alive = false;
      dropped.swap(s_->queue); // destroy queued elements outside the lock
    }
    s_.reset();
  }

  std::shared_ptr<detail::Shared<T>> s_{};
};

/**
 * @brief Create a connected channel.
 * @return {sender, receiver}; clone the sender freely.
 */
template <class T>
std::pair<Sender<T>, Receiver<T>> make_channel() {
  auto s = std::make_shared<detail::Shared<T>>();
  return {Sender<T>(s), Receiver<T>(s)};
}

} // namespace dronet::chan
