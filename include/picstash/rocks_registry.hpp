#pragma once

#include <picstash/internal.hpp>
#include <picstash/observability.hpp>
#include <picstash/registry.hpp>

#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include <rocksdb/cache.h>
#include <rocksdb/options.h>
#include <rocksdb/statistics.h>
#include <rocksdb/utilities/transaction_db.h>

namespace picstash {

/**
 * Options for the RocksDB-backed registry.
 */
struct RegistryOptions {
  // RocksDB performance knobs
  size_t block_cache_bytes = 64ull * 1024ull * 1024ull;
  int bloom_bits_per_key = 10;

  // Maximum wait for a key lock held by another transaction.
  int lock_timeout_ms = 2000;

  // Bounded access pool: at most max_concurrent_ops registry calls run at
  // once; a caller waits at most acquire_timeout_ms for a slot and then gets
  // RegistryUnavailable.
  int max_concurrent_ops = 16;
  int acquire_timeout_ms = 2000;

  // Optional; receives cache gauges from EmitCacheMetrics().
  std::shared_ptr<MetricsSink> metrics;
};

/**
 * picstash::RocksRegistry
 *
 * Registry on a RocksDB TransactionDB. Claim() is a pessimistic transaction:
 * GetForUpdate() on the candidate key takes the key lock inside RocksDB, so
 * two concurrent claims of the same id serialise in the storage layer and
 * exactly one of them observes "absent".
 *
 * Column families:
 *   picstash_images         id -> ImageRecord
 *   picstash_status_counts  decimal status code -> uint64_le count
 */
class RocksRegistry : public Registry {
 public:
  ~RocksRegistry() override;

  RocksRegistry(const RocksRegistry&) = delete;
  RocksRegistry& operator=(const RocksRegistry&) = delete;

  /** Open or create the registry at db_path. */
  static Status Open(const std::string& db_path,
                     std::unique_ptr<RocksRegistry>* out,
                     const RegistryOptions& opt = RegistryOptions{});

  Status Claim(std::string_view id, std::string_view extension) override;
  Status Erase(std::string_view id) override;
  Status Get(std::string_view id, ImageRecord* out) const override;
  Status MultiGet(const std::vector<std::string>& ids,
                  std::vector<std::optional<ImageRecord>>* out) const override;
  Status SetSource(std::string_view id,
                   std::string_view source,
                   std::string* previous_out) override;
  Status ForEach(const std::function<bool(const ImageRecord&)>& fn) const override;
  Status Count(uint64_t* out) const override;
  Status IncrementStatusCount(int status_code) override;
  Status ListStatusCounts(std::vector<StatusCount>* out) const override;

  /**
   * Close the registry and release RocksDB resources. Blocks until calls
   * already running have returned; calls made afterwards get
   * RegistryUnavailable. Safe to call multiple times.
   */
  void Close() override;

  /** Flush memtables to disk. */
  Status Flush();

  /** Emit block cache usage gauges to the metrics sink, if any. */
  void EmitCacheMetrics();

 private:
  explicit RocksRegistry(const RegistryOptions& opt);

  // Maps a RocksDB failure to RegistryUnavailable with context.
  static Status Unavailable(const char* what, const rocksdb::Status& s);

  RegistryOptions opt_;

  rocksdb::TransactionDB* db_ = nullptr;
  std::vector<rocksdb::ColumnFamilyHandle*> handles_;
  std::shared_ptr<rocksdb::Cache> block_cache_;
  std::shared_ptr<rocksdb::Statistics> statistics_;

  rocksdb::ColumnFamilyHandle* images_cf_ = nullptr;
  rocksdb::ColumnFamilyHandle* counts_cf_ = nullptr;

  mutable internal::SlotPool slots_;

  // Held shared by every call that touches db_, exclusively by Close().
  mutable std::shared_mutex lifecycle_mu_;
};

}  // namespace picstash
