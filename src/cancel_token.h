#pragma once

#include "util.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>

namespace sous {

// Cooperative cancellation flag. Cancelling a token cancels every child made from it.
class cancel_token : unmovable {
 public:
  cancel_token() = default;

  void cancel();
  bool cancelled() const;

  // Sleeps for `duration` unless cancelled first; returns false when cancelled.
  bool wait_for(std::chrono::duration<double> duration) const;

  std::shared_ptr<cancel_token> make_child();

 private:
  std::atomic_bool cancelled_{ false };
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  std::vector<std::weak_ptr<cancel_token>> children_;
};

}  // namespace sous
