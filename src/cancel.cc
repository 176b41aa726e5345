#include "procvisor/cancel.hpp"

#include <condition_variable>
#include <mutex>
#include <utility>

namespace procvisor {

namespace internal {

struct CancelState {
  std::mutex mutex;
  std::condition_variable signaled;
  bool slot = false;
  int attached_runs = 0;
  // Set when the last attached run ends; cleared again by the next attach.
  bool retired = false;
};

CancelScope::CancelScope(const CancelReceiver& receiver) : state_(receiver.state_) {
  std::lock_guard lock(state_->mutex);
  ++state_->attached_runs;
  state_->retired = false;
}

CancelScope::~CancelScope() {
  std::lock_guard lock(state_->mutex);
  if (--state_->attached_runs == 0) {
    state_->slot = false;
    state_->retired = true;
  }
}

}  // namespace internal

bool CancelSender::send() const {
  {
    std::lock_guard lock(state_->mutex);
    if (state_->slot || state_->retired) {
      return false;
    }
    state_->slot = true;
  }
  state_->signaled.notify_one();
  return true;
}

bool CancelReceiver::try_recv() const {
  std::lock_guard lock(state_->mutex);
  return std::exchange(state_->slot, false);
}

bool CancelReceiver::recv_for(std::chrono::milliseconds timeout) const {
  std::unique_lock lock(state_->mutex);
  if (!state_->signaled.wait_for(lock, timeout, [this] { return state_->slot; })) {
    return false;
  }
  state_->slot = false;
  return true;
}

bool CancelReceiver::pending() const {
  std::lock_guard lock(state_->mutex);
  return state_->slot;
}

std::pair<CancelSender, CancelReceiver> make_cancel_channel() {
  auto state = std::make_shared<internal::CancelState>();
  return {CancelSender(state), CancelReceiver(state)};
}

}  // namespace procvisor
