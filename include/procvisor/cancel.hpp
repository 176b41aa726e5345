#pragma once

#include <chrono>
#include <memory>
#include <utility>

namespace procvisor {

namespace internal {
/// @brief Shared single-slot state behind a cancellation channel.
struct CancelState;
class CancelScope;
}  // namespace internal

class CancelReceiver;

/// @brief Producing end of a cancellation channel.
class CancelSender {
 public:
  /// @brief Fill the slot. Returns false if a signal is already pending or
  /// the channel's runs have all finished.
  bool send() const;

 private:
  explicit CancelSender(std::shared_ptr<internal::CancelState> state) : state_(std::move(state)) {}

  std::shared_ptr<internal::CancelState> state_;

  friend std::pair<CancelSender, CancelReceiver> make_cancel_channel();
};

/// @brief Consuming end of a cancellation channel.
///
/// Copies share the same slot: a single send is consumed by exactly one
/// receiver, whichever polls first. Once a supervised run using the channel
/// has finished, signals sent while no run is active are dropped.
class CancelReceiver {
 public:
  /// @brief Consume a pending signal, if any.
  [[nodiscard]] bool try_recv() const;
  /// @brief Block up to timeout for a signal and consume it.
  [[nodiscard]] bool recv_for(std::chrono::milliseconds timeout) const;
  /// @brief True if a signal is waiting in the slot (does not consume).
  [[nodiscard]] bool pending() const;

 private:
  explicit CancelReceiver(std::shared_ptr<internal::CancelState> state)
      : state_(std::move(state)) {}

  std::shared_ptr<internal::CancelState> state_;

  friend std::pair<CancelSender, CancelReceiver> make_cancel_channel();
  friend class internal::CancelScope;
};

namespace internal {

/// @brief Attaches a receiver to one supervised run for the scope's lifetime.
///
/// When the last attached run ends, an unconsumed signal is discarded and later
/// sends are refused until another run attaches.
class CancelScope {
 public:
  explicit CancelScope(const CancelReceiver& receiver);
  ~CancelScope();
  CancelScope(const CancelScope&) = delete;
  CancelScope& operator=(const CancelScope&) = delete;

 private:
  std::shared_ptr<CancelState> state_;
};

}  // namespace internal

/// @brief Create a connected single-slot, single-fire cancellation channel.
std::pair<CancelSender, CancelReceiver> make_cancel_channel();

}  // namespace procvisor
