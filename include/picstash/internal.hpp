#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <random>
#include <string>
#include <string_view>
#include <thread>

#include <rocksdb/status.h>

namespace picstash::internal {

// Monotonic timestamp helper for metrics (microseconds).
inline uint64_t NowMicros() {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<microseconds>(steady_clock::now().time_since_epoch()).count());
}

// Wall-clock timestamp (microseconds since epoch). Persisted in records, so
// it must survive restarts; NowMicros() does not.
inline uint64_t WallClockMicros() {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<microseconds>(system_clock::now().time_since_epoch()).count());
}

inline std::string EncodeU64LE(uint64_t v) {
  std::string s(8, '\0');
  for (int i = 0; i < 8; ++i) {
    s[i] = static_cast<char>(v & 0xffu);
    v >>= 8;
  }
  return s;
}

inline bool DecodeU64LE(std::string_view s, uint64_t* out) {
  if (s.size() != 8) return false;
  uint64_t v = 0;
  // little endian decode
  for (int i = 7; i >= 0; --i) {
    v <<= 8;
    v |= static_cast<uint8_t>(s[static_cast<size_t>(i)]);
  }
  *out = v;
  return true;
}

inline void AppendU32LE(std::string* out, uint32_t v) {
  out->push_back(static_cast<char>(v & 0xff));
  out->push_back(static_cast<char>((v >> 8) & 0xff));
  out->push_back(static_cast<char>((v >> 16) & 0xff));
  out->push_back(static_cast<char>((v >> 24) & 0xff));
}

inline bool DecodeU32LE(std::string_view s, uint32_t* out) {
  if (s.size() != 4) return false;
  *out = static_cast<uint32_t>(static_cast<uint8_t>(s[0])) |
         (static_cast<uint32_t>(static_cast<uint8_t>(s[1])) << 8) |
         (static_cast<uint32_t>(static_cast<uint8_t>(s[2])) << 16) |
         (static_cast<uint32_t>(static_cast<uint8_t>(s[3])) << 24);
  return true;
}

// Per-thread generator, seeded once from random_device and the thread id.
inline std::mt19937_64& ThreadRng() {
  thread_local std::mt19937_64 rng([]{
    std::random_device rd;
    uint64_t seed = (static_cast<uint64_t>(rd()) << 32) ^ static_cast<uint64_t>(rd());
    seed ^= static_cast<uint64_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
    return seed;
  }());
  return rng;
}

// Lock conflicts inside a TransactionDB: somebody else holds the key.
inline bool IsRetryableTxnStatus(const rocksdb::Status& s) {
  return s.IsBusy() || s.IsTimedOut() || s.IsTryAgain() || s.IsAborted();
}

// ---------------------------------------------------------------------------
// Bounded access slots
// ---------------------------------------------------------------------------

// Counting semaphore with a bounded wait. Caps how many callers touch the
// registry at once, independently of how many request threads exist.
class SlotPool {
 public:
  explicit SlotPool(int slots) : free_(slots > 0 ? slots : 1) {}

  bool AcquireFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mu_);
    if (!cv_.wait_for(lock, timeout, [this] { return free_ > 0; })) {
      return false;
    }
    --free_;
    return true;
  }

  void Release() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      ++free_;
    }
    cv_.notify_one();
  }

  int Available() const {
    std::lock_guard<std::mutex> lock(mu_);
    return free_;
  }

 private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  int free_;
};

// RAII slot holder. Check acquired() before touching the registry.
class SlotGuard {
 public:
  SlotGuard(SlotPool* pool, std::chrono::milliseconds timeout)
      : pool_(pool), acquired_(pool->AcquireFor(timeout)) {}

  ~SlotGuard() {
    if (acquired_) pool_->Release();
  }

  SlotGuard(const SlotGuard&) = delete;
  SlotGuard& operator=(const SlotGuard&) = delete;

  bool acquired() const { return acquired_; }

 private:
  SlotPool* pool_;
  bool acquired_;
};

}  // namespace picstash::internal
