#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

namespace ferry {

// Raw progress snapshot reported by the engine
struct TransferProgress {
  uint64_t upload_now = 0;
  uint64_t upload_total = 0;
  uint64_t download_now = 0;
  uint64_t download_total = 0;
  uint64_t upload_speed = 0;    // bytes/second
  uint64_t download_speed = 0;  // bytes/second

  // Phase timestamps, measured from the start of the transfer
  std::chrono::microseconds namelookup{0};
  std::chrono::microseconds connect{0};
  std::chrono::microseconds appconnect{0};
  std::chrono::microseconds pretransfer{0};
  std::chrono::microseconds starttransfer{0};
  std::chrono::microseconds total{0};
  std::chrono::microseconds redirect{0};
};

// Progress statistics of a single transfer.
//
// Copies share the same counters. The agent thread posts updates while
// callers read concurrently; values may be stale but are never torn.
class Metrics {
 public:
  Metrics();

  // Bytes uploaded so far / expected total
  std::pair<uint64_t, uint64_t> upload_progress() const {
    return {inner_->upload_now.load(), inner_->upload_total.load()};
  }

  // Bytes downloaded so far / expected total
  std::pair<uint64_t, uint64_t> download_progress() const {
    return {inner_->download_now.load(), inner_->download_total.load()};
  }

  // Average upload speed so far in bytes/second
  uint64_t upload_speed() const {
    return inner_->upload_speed.load();
  }

  // Average download speed so far in bytes/second
  uint64_t download_speed() const {
    return inner_->download_speed.load();
  }

  // Time until name resolution completed. When a redirect is followed the
  // times of each request are added together; the same holds for the other
  // phases below.
  std::chrono::microseconds namelookup_time() const {
    return load(inner_->namelookup_us);
  }

  // Time until the connection to the remote host (or proxy) completed
  std::chrono::microseconds connect_time() const {
    return load(inner_->connect_us);
  }

  // Time until the TLS handshake completed
  std::chrono::microseconds appconnect_time() const {
    return load(inner_->appconnect_us);
  }

  // Time until the transfer was about to begin, after all protocol
  // negotiation
  std::chrono::microseconds pretransfer_time() const {
    return load(inner_->pretransfer_us);
  }

  // Time until the first response byte arrived
  std::chrono::microseconds starttransfer_time() const {
    return load(inner_->starttransfer_us);
  }

  // Total time of the transfer so far
  std::chrono::microseconds total_time() const {
    return load(inner_->total_us);
  }

  // Time spent in all redirection steps before the final request started
  std::chrono::microseconds redirect_time() const {
    return load(inner_->redirect_us);
  }

  // Called from the agent thread
  void record(const TransferProgress& progress);

  std::string to_string() const;

 private:
  struct Inner {
    std::atomic<uint64_t> upload_now{0};
    std::atomic<uint64_t> upload_total{0};
    std::atomic<uint64_t> download_now{0};
    std::atomic<uint64_t> download_total{0};
    std::atomic<uint64_t> upload_speed{0};
    std::atomic<uint64_t> download_speed{0};
    std::atomic<int64_t> namelookup_us{0};
    std::atomic<int64_t> connect_us{0};
    std::atomic<int64_t> appconnect_us{0};
    std::atomic<int64_t> pretransfer_us{0};
    std::atomic<int64_t> starttransfer_us{0};
    std::atomic<int64_t> total_us{0};
    std::atomic<int64_t> redirect_us{0};
  };

  static std::chrono::microseconds load(const std::atomic<int64_t>& value) {
    return std::chrono::microseconds(value.load());
  }

  std::shared_ptr<Inner> inner_;
};

}  // namespace ferry
