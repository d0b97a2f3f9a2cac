#include "cancel_token.h"

#include <algorithm>

namespace sous {

void cancel_token::cancel() {
  std::vector<std::weak_ptr<cancel_token>> children;
  {
    std::lock_guard const lock(mutex_);
    if (cancelled_.exchange(true)) { return; }
    children.swap(children_);
  }
  cv_.notify_all();

  for (auto const &weak : children) {
    if (auto child{ weak.lock() }) { child->cancel(); }
  }
}

bool cancel_token::cancelled() const { return cancelled_.load(); }

bool cancel_token::wait_for(std::chrono::duration<double> duration) const {
  auto const timeout{ util_seconds_to_duration(duration.count()) };
  std::unique_lock lock(mutex_);
  return !cv_.wait_for(lock, timeout, [this] { return cancelled_.load(); });
}

std::shared_ptr<cancel_token> cancel_token::make_child() {
  auto child{ std::make_shared<cancel_token>() };
  {
    std::lock_guard const lock(mutex_);
    if (!cancelled_) {
      std::erase_if(children_, [](auto const &weak) { return weak.expired(); });
      children_.push_back(child);
      return child;
    }
  }
  child->cancel();
  return child;
}

}  // namespace sous
