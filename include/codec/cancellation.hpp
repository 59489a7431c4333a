#ifndef CHUNKVAULT_CODEC_CANCELLATION_HPP
#define CHUNKVAULT_CODEC_CANCELLATION_HPP

#include <atomic>

namespace chunkvault::codec {

// Caller-owned flag polled between chunks by long-running reads.
class CancellationToken {
public:
  void cancel() { cancelled_.store(true, std::memory_order_release); }
  bool is_cancelled() const { return cancelled_.load(std::memory_order_acquire); }

private:
  std::atomic<bool> cancelled_{false};
};

} // namespace chunkvault::codec

#endif // CHUNKVAULT_CODEC_CANCELLATION_HPP
