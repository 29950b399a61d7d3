#pragma once

#include <picstash/clock.hpp>
#include <picstash/internal.hpp>
#include <picstash/object_store.hpp>
#include <picstash/registry.hpp>

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace picstash::testing {

// =============================================================================
// Deterministic Clock for Sweep Testing
// =============================================================================

/**
 * Clock that only moves when told to. Starts at the real wall clock so that
 * records and files created by real code line up with it.
 */
class FakeClock : public Clock {
 public:
  FakeClock() : current_time_us_(internal::WallClockMicros()) {}
  explicit FakeClock(uint64_t initial_time_us) : current_time_us_(initial_time_us) {}

  uint64_t WallClockMicros() const override { return current_time_us_.load(); }

  void AdvanceSec(uint64_t delta_sec) { current_time_us_.fetch_add(delta_sec * 1000000ULL); }
  void SetTimeUs(uint64_t time_us) { current_time_us_.store(time_us); }

 private:
  std::atomic<uint64_t> current_time_us_;
};

// =============================================================================
// In-memory Registry
// =============================================================================

/**
 * Registry backed by a mutex-protected map. Claim() is atomic under the
 * mutex, which is all a single-process test needs.
 *
 * Fault injection: set `unavailable` to make every call fail with
 * RegistryUnavailable, `fail_erase` to fail only Erase().
 */
class MemoryRegistry : public Registry {
 public:
  Status Claim(std::string_view id, std::string_view extension) override {
    claim_calls.fetch_add(1);
    if (unavailable.load()) return Status::RegistryUnavailable("injected");

    std::lock_guard<std::mutex> lock(mu_);
    std::string key(id);
    if (records_.count(key)) return Status::DuplicateCandidate(key);

    ImageRecord rec;
    rec.id = key;
    rec.extension = std::string(extension);
    rec.created_at_us = created_at_us_override ? created_at_us_override
                                               : internal::WallClockMicros();
    records_.emplace(key, rec.Serialize());
    return Status::OK();
  }

  Status Erase(std::string_view id) override {
    if (unavailable.load() || fail_erase.load()) return Status::RegistryUnavailable("injected");
    std::lock_guard<std::mutex> lock(mu_);
    if (records_.erase(std::string(id)) == 0) return Status::NotFound(std::string(id));
    return Status::OK();
  }

  Status Get(std::string_view id, ImageRecord* out) const override {
    if (unavailable.load()) return Status::RegistryUnavailable("injected");
    std::lock_guard<std::mutex> lock(mu_);
    auto it = records_.find(std::string(id));
    if (it == records_.end()) return Status::NotFound(std::string(id));
    if (!ImageRecord::Deserialize(it->first, it->second, out)) return Status::Corruption("record");
    return Status::OK();
  }

  Status MultiGet(const std::vector<std::string>& ids,
                  std::vector<std::optional<ImageRecord>>* out) const override {
    if (unavailable.load()) return Status::RegistryUnavailable("injected");
    std::lock_guard<std::mutex> lock(mu_);
    out->clear();
    for (const auto& id : ids) {
      auto it = records_.find(id);
      if (it == records_.end()) {
        out->emplace_back(std::nullopt);
        continue;
      }
      ImageRecord rec;
      if (!ImageRecord::Deserialize(it->first, it->second, &rec)) return Status::Corruption("record");
      out->emplace_back(std::move(rec));
    }
    return Status::OK();
  }

  Status SetSource(std::string_view id,
                   std::string_view source,
                   std::string* previous_out) override {
    if (unavailable.load()) return Status::RegistryUnavailable("injected");
    std::lock_guard<std::mutex> lock(mu_);
    auto it = records_.find(std::string(id));
    if (it == records_.end()) return Status::NotFound(std::string(id));

    ImageRecord rec;
    if (!ImageRecord::Deserialize(it->first, it->second, &rec)) return Status::Corruption("record");
    if (previous_out) *previous_out = rec.source;
    rec.source = std::string(source);
    it->second = rec.Serialize();
    return Status::OK();
  }

  Status ForEach(const std::function<bool(const ImageRecord&)>& fn) const override {
    if (unavailable.load()) return Status::RegistryUnavailable("injected");
    std::map<std::string, std::string> copy;
    {
      std::lock_guard<std::mutex> lock(mu_);
      copy = records_;
    }
    for (const auto& [id, raw] : copy) {
      ImageRecord rec;
      if (!ImageRecord::Deserialize(id, raw, &rec)) return Status::Corruption("record");
      if (!fn(rec)) break;
    }
    return Status::OK();
  }

  Status Count(uint64_t* out) const override {
    if (unavailable.load()) return Status::RegistryUnavailable("injected");
    std::lock_guard<std::mutex> lock(mu_);
    *out = records_.size();
    return Status::OK();
  }

  Status IncrementStatusCount(int status_code) override {
    std::lock_guard<std::mutex> lock(mu_);
    ++status_counts_[status_code];
    return Status::OK();
  }

  Status ListStatusCounts(std::vector<StatusCount>* out) const override {
    std::lock_guard<std::mutex> lock(mu_);
    out->clear();
    for (const auto& [code, count] : status_counts_) out->push_back({code, count});
    return Status::OK();
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return records_.size();
  }

  std::atomic<uint64_t> claim_calls{0};
  std::atomic<bool> unavailable{false};
  std::atomic<bool> fail_erase{false};
  uint64_t created_at_us_override = 0;

 private:
  mutable std::mutex mu_;
  std::map<std::string, std::string> records_;
  std::map<int, uint64_t> status_counts_;
};

// =============================================================================
// In-memory ObjectStore
// =============================================================================

/**
 * ObjectStore on a map of "<id><ext>" -> bytes.
 *
 * Fault injection: `fail_writes` makes Write() fail, `fail_removes` makes
 * Remove() fail with IOError.
 */
class MemoryObjectStore : public ObjectStore {
 public:
  bool Exists(std::string_view id, std::string_view extension) const override {
    std::lock_guard<std::mutex> lock(mu_);
    return objects_.count(Key(id, extension)) > 0;
  }

  Status Write(std::string_view id,
               std::string_view extension,
               std::string_view bytes) override {
    write_calls.fetch_add(1);
    if (fail_writes.load()) return Status::ObjectStoreWriteFailed("injected");
    std::lock_guard<std::mutex> lock(mu_);
    objects_[Key(id, extension)] = Entry{std::string(bytes), internal::WallClockMicros()};
    return Status::OK();
  }

  Status Read(std::string_view id,
              std::string_view extension,
              std::string* bytes_out) const override {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = objects_.find(Key(id, extension));
    if (it == objects_.end()) return Status::NotFound(Key(id, extension));
    *bytes_out = it->second.bytes;
    return Status::OK();
  }

  Status Remove(std::string_view id, std::string_view extension) override {
    return RemoveFile(Key(id, extension));
  }

  Status RemoveFile(std::string_view filename) override {
    if (fail_removes.load()) return Status::IOError("injected");
    std::lock_guard<std::mutex> lock(mu_);
    if (objects_.erase(std::string(filename)) == 0) return Status::NotFound(std::string(filename));
    return Status::OK();
  }

  Status List(std::vector<ObjectEntry>* out) const override {
    std::lock_guard<std::mutex> lock(mu_);
    out->clear();
    for (const auto& [name, entry] : objects_) {
      out->push_back({name, entry.bytes.size(), entry.modified_at_us});
    }
    return Status::OK();
  }

  std::string PathFor(std::string_view id, std::string_view extension) const override {
    return "mem://" + Key(id, extension);
  }

  /** Put a file directly, bypassing Write(), last modified `age_seconds` ago. */
  void Inject(const std::string& filename, std::string bytes, uint64_t age_seconds) {
    std::lock_guard<std::mutex> lock(mu_);
    objects_[filename] = Entry{std::move(bytes), internal::WallClockMicros() - age_seconds * 1000000ULL};
  }

  /** Age every stored object by `seconds`. */
  void AgeAll(uint64_t seconds) {
    std::lock_guard<std::mutex> lock(mu_);
    for (auto& [name, entry] : objects_) entry.modified_at_us -= seconds * 1000000ULL;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return objects_.size();
  }

  std::atomic<uint64_t> write_calls{0};
  std::atomic<bool> fail_writes{false};
  std::atomic<bool> fail_removes{false};

 private:
  struct Entry {
    std::string bytes;
    uint64_t modified_at_us = 0;
  };

  static std::string Key(std::string_view id, std::string_view extension) {
    std::string key(id);
    key.append(extension);
    return key;
  }

  mutable std::mutex mu_;
  std::map<std::string, Entry> objects_;
};

}  // namespace picstash::testing
