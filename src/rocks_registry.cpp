#include <picstash/rocks_registry.hpp>

#include <rocksdb/filter_policy.h>
#include <rocksdb/table.h>
#include <rocksdb/utilities/transaction.h>

#include <trantor/utils/Logger.h>

#include <algorithm>
#include <cctype>
#include <mutex>

namespace picstash {

namespace {

constexpr const char* kImagesCF       = "picstash_images";
constexpr const char* kStatusCountsCF = "picstash_status_counts";

constexpr const char* kClosedMessage = "registry is closed";
constexpr const char* kNoSlotMessage = "timed out waiting for a registry slot";

// Helper: build a ColumnFamilyOptions with shared cache + bloom
rocksdb::ColumnFamilyOptions MakeCFOptions(const std::shared_ptr<rocksdb::Cache>& cache,
                                           int bloom_bits_per_key) {
  rocksdb::BlockBasedTableOptions table;
  table.block_cache = cache;
  table.filter_policy.reset(rocksdb::NewBloomFilterPolicy(bloom_bits_per_key, false));
  table.whole_key_filtering = true;

  rocksdb::ColumnFamilyOptions cfo;
  cfo.table_factory.reset(rocksdb::NewBlockBasedTableFactory(table));
  return cfo;
}

rocksdb::Slice ToSlice(std::string_view s) {
  return rocksdb::Slice(s.data(), s.size());
}

bool IsDecimal(std::string_view s) {
  if (s.empty() || s.size() > 9) return false;
  return std::all_of(s.begin(), s.end(),
                     [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
}

}  // namespace

RocksRegistry::RocksRegistry(const RegistryOptions& opt)
    : opt_(opt), slots_(opt.max_concurrent_ops) {}

RocksRegistry::~RocksRegistry() { Close(); }

Status RocksRegistry::Unavailable(const char* what, const rocksdb::Status& s) {
  return Status::RegistryUnavailable(std::string(what) + ": " + s.ToString());
}

Status RocksRegistry::Open(const std::string& db_path,
                           std::unique_ptr<RocksRegistry>* out,
                           const RegistryOptions& opt) {
  if (!out) return Status::InvalidArgument("out is null");
  if (opt.max_concurrent_ops <= 0) {
    return Status::InvalidArgument("max_concurrent_ops must be positive");
  }

  auto registry = std::unique_ptr<RocksRegistry>(new RocksRegistry(opt));

  rocksdb::Options options;
  options.create_if_missing = true;
  options.create_missing_column_families = true;

  auto statistics = rocksdb::CreateDBStatistics();
  options.statistics = statistics;

  rocksdb::TransactionDBOptions txn_opts;
  txn_opts.transaction_lock_timeout = opt.lock_timeout_ms;

  // Shared cache for all CFs
  auto cache = rocksdb::NewLRUCache(opt.block_cache_bytes);
  registry->block_cache_ = cache;
  registry->statistics_ = statistics;

  std::vector<rocksdb::ColumnFamilyDescriptor> cfs;
  cfs.emplace_back(rocksdb::kDefaultColumnFamilyName, MakeCFOptions(cache, opt.bloom_bits_per_key));
  cfs.emplace_back(kImagesCF, MakeCFOptions(cache, opt.bloom_bits_per_key));
  cfs.emplace_back(kStatusCountsCF, MakeCFOptions(cache, opt.bloom_bits_per_key));

  std::vector<rocksdb::ColumnFamilyHandle*> handles;
  rocksdb::TransactionDB* db = nullptr;

  rocksdb::Status s = rocksdb::TransactionDB::Open(options, txn_opts, db_path, cfs, &handles, &db);
  if (!s.ok()) {
    for (auto* h : handles) delete h;
    return Unavailable("open failed", s);
  }

  registry->db_ = db;
  registry->handles_ = std::move(handles);

  // Descriptor order = handle order
  registry->images_cf_ = registry->handles_[1];
  registry->counts_cf_ = registry->handles_[2];

  LOG_DEBUG << "Registry opened at " << db_path;
  *out = std::move(registry);
  return Status::OK();
}

Status RocksRegistry::Claim(std::string_view id, std::string_view extension) {
  std::shared_lock<std::shared_mutex> lifecycle(lifecycle_mu_);
  if (!db_) return Status::RegistryUnavailable(kClosedMessage);
  if (id.empty()) return Status::InvalidArgument("id is empty");

  internal::SlotGuard slot(&slots_, std::chrono::milliseconds(opt_.acquire_timeout_ms));
  if (!slot.acquired()) return Status::RegistryUnavailable(kNoSlotMessage);

  rocksdb::WriteOptions wo;
  rocksdb::ReadOptions ro;
  rocksdb::TransactionOptions to;
  to.lock_timeout = opt_.lock_timeout_ms;

  std::unique_ptr<rocksdb::Transaction> txn(db_->BeginTransaction(wo, to));
  if (!txn) return Status::RegistryUnavailable("BeginTransaction returned null");

  // Lock the candidate key. Absent keys are locked too, so a concurrent
  // claimer of the same id blocks here until we commit or roll back.
  std::string existing;
  rocksdb::Status s = txn->GetForUpdate(ro, images_cf_, ToSlice(id), &existing);
  if (s.ok()) {
    return Status::DuplicateCandidate(std::string(id));
  }
  if (!s.IsNotFound()) {
    if (internal::IsRetryableTxnStatus(s)) {
      return Status::DuplicateCandidate("key locked by concurrent claim: " + s.ToString());
    }
    return Unavailable("claim lookup failed", s);
  }

  ImageRecord rec;
  rec.id = std::string(id);
  rec.extension = std::string(extension);
  rec.created_at_us = internal::WallClockMicros();

  s = txn->Put(images_cf_, ToSlice(id), rocksdb::Slice(rec.Serialize()));
  if (!s.ok()) return Unavailable("claim write failed", s);

  s = txn->Commit();
  if (!s.ok()) {
    if (internal::IsRetryableTxnStatus(s)) {
      return Status::DuplicateCandidate("claim commit conflicted: " + s.ToString());
    }
    return Unavailable("claim commit failed", s);
  }
  return Status::OK();
}

Status RocksRegistry::Erase(std::string_view id) {
  std::shared_lock<std::shared_mutex> lifecycle(lifecycle_mu_);
  if (!db_) return Status::RegistryUnavailable(kClosedMessage);

  internal::SlotGuard slot(&slots_, std::chrono::milliseconds(opt_.acquire_timeout_ms));
  if (!slot.acquired()) return Status::RegistryUnavailable(kNoSlotMessage);

  rocksdb::WriteOptions wo;
  rocksdb::ReadOptions ro;
  rocksdb::TransactionOptions to;
  to.lock_timeout = opt_.lock_timeout_ms;

  std::unique_ptr<rocksdb::Transaction> txn(db_->BeginTransaction(wo, to));
  if (!txn) return Status::RegistryUnavailable("BeginTransaction returned null");

  std::string existing;
  rocksdb::Status s = txn->GetForUpdate(ro, images_cf_, ToSlice(id), &existing);
  if (s.IsNotFound()) return Status::NotFound(std::string(id));
  if (!s.ok()) return Unavailable("erase lookup failed", s);

  s = txn->Delete(images_cf_, ToSlice(id));
  if (!s.ok()) return Unavailable("erase failed", s);

  s = txn->Commit();
  if (!s.ok()) return Unavailable("erase commit failed", s);
  return Status::OK();
}

Status RocksRegistry::Get(std::string_view id, ImageRecord* out) const {
  std::shared_lock<std::shared_mutex> lifecycle(lifecycle_mu_);
  if (!db_) return Status::RegistryUnavailable(kClosedMessage);
  if (!out) return Status::InvalidArgument("out is null");

  internal::SlotGuard slot(&slots_, std::chrono::milliseconds(opt_.acquire_timeout_ms));
  if (!slot.acquired()) return Status::RegistryUnavailable(kNoSlotMessage);

  std::string raw;
  rocksdb::Status s = db_->Get(rocksdb::ReadOptions(), images_cf_, ToSlice(id), &raw);
  if (s.IsNotFound()) return Status::NotFound(std::string(id));
  if (!s.ok()) return Unavailable("get failed", s);

  if (!ImageRecord::Deserialize(id, raw, out)) {
    return Status::Corruption("undecodable record for " + std::string(id));
  }
  return Status::OK();
}

Status RocksRegistry::MultiGet(const std::vector<std::string>& ids,
                               std::vector<std::optional<ImageRecord>>* out) const {
  std::shared_lock<std::shared_mutex> lifecycle(lifecycle_mu_);
  if (!db_) return Status::RegistryUnavailable(kClosedMessage);
  if (!out) return Status::InvalidArgument("out is null");

  out->clear();
  if (ids.empty()) return Status::OK();

  internal::SlotGuard slot(&slots_, std::chrono::milliseconds(opt_.acquire_timeout_ms));
  if (!slot.acquired()) return Status::RegistryUnavailable(kNoSlotMessage);

  std::vector<rocksdb::ColumnFamilyHandle*> cfs(ids.size(), images_cf_);
  std::vector<rocksdb::Slice> keys;
  keys.reserve(ids.size());
  for (const auto& id : ids) keys.emplace_back(id);

  std::vector<std::string> values;
  std::vector<rocksdb::Status> statuses =
      db_->MultiGet(rocksdb::ReadOptions(), cfs, keys, &values);

  out->reserve(ids.size());
  for (size_t i = 0; i < ids.size(); ++i) {
    if (statuses[i].IsNotFound()) {
      out->emplace_back(std::nullopt);
      continue;
    }
    if (!statuses[i].ok()) {
      out->clear();
      return Unavailable("multiget failed", statuses[i]);
    }
    ImageRecord rec;
    if (!ImageRecord::Deserialize(ids[i], values[i], &rec)) {
      out->clear();
      return Status::Corruption("undecodable record for " + ids[i]);
    }
    out->emplace_back(std::move(rec));
  }
  return Status::OK();
}

Status RocksRegistry::SetSource(std::string_view id,
                                std::string_view source,
                                std::string* previous_out) {
  std::shared_lock<std::shared_mutex> lifecycle(lifecycle_mu_);
  if (!db_) return Status::RegistryUnavailable(kClosedMessage);

  internal::SlotGuard slot(&slots_, std::chrono::milliseconds(opt_.acquire_timeout_ms));
  if (!slot.acquired()) return Status::RegistryUnavailable(kNoSlotMessage);

  rocksdb::WriteOptions wo;
  rocksdb::ReadOptions ro;
  rocksdb::TransactionOptions to;
  to.lock_timeout = opt_.lock_timeout_ms;

  std::unique_ptr<rocksdb::Transaction> txn(db_->BeginTransaction(wo, to));
  if (!txn) return Status::RegistryUnavailable("BeginTransaction returned null");

  std::string raw;
  rocksdb::Status s = txn->GetForUpdate(ro, images_cf_, ToSlice(id), &raw);
  if (s.IsNotFound()) return Status::NotFound(std::string(id));
  if (!s.ok()) return Unavailable("set-source lookup failed", s);

  ImageRecord rec;
  if (!ImageRecord::Deserialize(id, raw, &rec)) {
    return Status::Corruption("undecodable record for " + std::string(id));
  }

  std::string previous = std::move(rec.source);
  rec.source = std::string(source);

  s = txn->Put(images_cf_, ToSlice(id), rocksdb::Slice(rec.Serialize()));
  if (!s.ok()) return Unavailable("set-source write failed", s);

  s = txn->Commit();
  if (!s.ok()) return Unavailable("set-source commit failed", s);

  if (previous_out) *previous_out = std::move(previous);
  return Status::OK();
}

Status RocksRegistry::ForEach(const std::function<bool(const ImageRecord&)>& fn) const {
  std::shared_lock<std::shared_mutex> lifecycle(lifecycle_mu_);
  if (!db_) return Status::RegistryUnavailable(kClosedMessage);

  internal::SlotGuard slot(&slots_, std::chrono::milliseconds(opt_.acquire_timeout_ms));
  if (!slot.acquired()) return Status::RegistryUnavailable(kNoSlotMessage);

  const rocksdb::Snapshot* snapshot = db_->GetSnapshot();
  rocksdb::ReadOptions ro;
  ro.snapshot = snapshot;

  Status result;
  {
    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(ro, images_cf_));
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
      std::string_view key(it->key().data(), it->key().size());
      std::string_view value(it->value().data(), it->value().size());

      ImageRecord rec;
      if (!ImageRecord::Deserialize(key, value, &rec)) {
        result = Status::Corruption("undecodable record for " + std::string(key));
        break;
      }
      if (!fn(rec)) break;
    }
    if (result.ok() && !it->status().ok()) {
      result = Unavailable("scan failed", it->status());
    }
  }

  db_->ReleaseSnapshot(snapshot);
  return result;
}

Status RocksRegistry::Count(uint64_t* out) const {
  if (!out) return Status::InvalidArgument("out is null");

  uint64_t count = 0;
  Status s = ForEach([&count](const ImageRecord&) {
    ++count;
    return true;
  });
  if (!s.ok()) return s;

  *out = count;
  return Status::OK();
}

Status RocksRegistry::IncrementStatusCount(int status_code) {
  std::shared_lock<std::shared_mutex> lifecycle(lifecycle_mu_);
  if (!db_) return Status::RegistryUnavailable(kClosedMessage);
  if (status_code < 0) return Status::InvalidArgument("negative status code");

  internal::SlotGuard slot(&slots_, std::chrono::milliseconds(opt_.acquire_timeout_ms));
  if (!slot.acquired()) return Status::RegistryUnavailable(kNoSlotMessage);

  rocksdb::WriteOptions wo;
  rocksdb::ReadOptions ro;
  rocksdb::TransactionOptions to;
  to.lock_timeout = opt_.lock_timeout_ms;

  std::unique_ptr<rocksdb::Transaction> txn(db_->BeginTransaction(wo, to));
  if (!txn) return Status::RegistryUnavailable("BeginTransaction returned null");

  const std::string key = std::to_string(status_code);
  std::string cur;
  rocksdb::Status s = txn->GetForUpdate(ro, counts_cf_, rocksdb::Slice(key), &cur);

  uint64_t v = 0;
  if (s.ok()) {
    if (!internal::DecodeU64LE(cur, &v)) {
      return Status::Corruption("status count is not uint64_le");
    }
  } else if (!s.IsNotFound()) {
    return Unavailable("status count lookup failed", s);
  }

  s = txn->Put(counts_cf_, rocksdb::Slice(key), rocksdb::Slice(internal::EncodeU64LE(v + 1)));
  if (!s.ok()) return Unavailable("status count write failed", s);

  s = txn->Commit();
  if (!s.ok()) return Unavailable("status count commit failed", s);
  return Status::OK();
}

Status RocksRegistry::ListStatusCounts(std::vector<StatusCount>* out) const {
  std::shared_lock<std::shared_mutex> lifecycle(lifecycle_mu_);
  if (!db_) return Status::RegistryUnavailable(kClosedMessage);
  if (!out) return Status::InvalidArgument("out is null");

  out->clear();

  internal::SlotGuard slot(&slots_, std::chrono::milliseconds(opt_.acquire_timeout_ms));
  if (!slot.acquired()) return Status::RegistryUnavailable(kNoSlotMessage);

  std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(rocksdb::ReadOptions(), counts_cf_));
  for (it->SeekToFirst(); it->Valid(); it->Next()) {
    std::string_view key(it->key().data(), it->key().size());
    std::string_view value(it->value().data(), it->value().size());

    StatusCount entry;
    if (!IsDecimal(key) || !internal::DecodeU64LE(value, &entry.count)) {
      out->clear();
      return Status::Corruption("bad status count entry");
    }
    entry.status_code = std::stoi(std::string(key));
    out->push_back(entry);
  }
  if (!it->status().ok()) {
    out->clear();
    return Unavailable("status count scan failed", it->status());
  }

  // Keys sort lexicographically; present them numerically.
  std::sort(out->begin(), out->end(),
            [](const StatusCount& a, const StatusCount& b) {
              return a.status_code < b.status_code;
            });
  return Status::OK();
}

Status RocksRegistry::Flush() {
  std::shared_lock<std::shared_mutex> lifecycle(lifecycle_mu_);
  if (!db_) return Status::RegistryUnavailable(kClosedMessage);

  rocksdb::FlushOptions fo;
  fo.wait = true;
  rocksdb::Status s = db_->Flush(fo, handles_);
  if (!s.ok()) return Unavailable("flush failed", s);
  return Status::OK();
}

void RocksRegistry::EmitCacheMetrics() {
  if (!opt_.metrics) return;

  if (block_cache_) {
    size_t usage = block_cache_->GetUsage();
    size_t capacity = block_cache_->GetCapacity();
    double fill_ratio = capacity > 0 ? static_cast<double>(usage) / capacity : 0.0;

    internal::EmitGauge(opt_.metrics, "picstash.registry.cache_fill_ratio", fill_ratio);
    internal::EmitGauge(opt_.metrics, "picstash.registry.cache_usage_bytes",
                        static_cast<double>(usage));
  }

  if (statistics_) {
    internal::EmitGauge(opt_.metrics, "picstash.registry.cache_hit_total",
                        static_cast<double>(statistics_->getTickerCount(rocksdb::BLOCK_CACHE_HIT)));
    internal::EmitGauge(opt_.metrics, "picstash.registry.cache_miss_total",
                        static_cast<double>(statistics_->getTickerCount(rocksdb::BLOCK_CACHE_MISS)));
  }

  internal::EmitGauge(opt_.metrics, "picstash.registry.free_slots",
                      static_cast<double>(slots_.Available()));
}

void RocksRegistry::Close() {
  // Waits for in-flight calls; later calls see db_ == nullptr.
  std::unique_lock<std::shared_mutex> lock(lifecycle_mu_);
  if (!db_) return;

  for (auto* h : handles_) delete h;
  handles_.clear();
  delete db_;
  db_ = nullptr;
  images_cf_ = counts_cf_ = nullptr;
}

}  // namespace picstash
