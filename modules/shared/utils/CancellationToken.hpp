#pragma once

#include <atomic>

namespace HotbarScan::Shared {

// Cooperative cancellation flag shared between a caller and a running detection.
class CancellationToken {
  public:
    void cancel() { cancelled_.store(true); }
    bool isCancelled() const { return cancelled_.load(); }
    void reset() { cancelled_.store(false); }

  private:
    std::atomic<bool> cancelled_{false};
};

}  // namespace HotbarScan::Shared
