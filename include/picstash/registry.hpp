#pragma once

#include <picstash/status.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace picstash {

/**
 * One registry entry: identifier -> extension + attribution.
 *
 * Serialization format (value bytes; the id is the key):
 *   [ext_len:4 LE][ext bytes][source_len:4 LE][source bytes][created_at_us:8 LE]
 */
struct ImageRecord {
  std::string id;
  std::string extension;       // ".png", lower-case, recorded at claim time
  std::string source;          // empty = no attribution
  uint64_t created_at_us = 0;  // wall clock, set at claim time

  /** "<id><extension>", the object store key. */
  std::string Filename() const { return id + extension; }
  bool HasSource() const { return !source.empty(); }

  std::string Serialize() const;
  static bool Deserialize(std::string_view id, std::string_view data, ImageRecord* out);
};

/** Persistent per-HTTP-status counter. */
struct StatusCount {
  int status_code = 0;
  uint64_t count = 0;
};

/**
 * Uniqueness Registry.
 *
 * A persistent key-value mapping identifier -> ImageRecord. The only
 * shared-mutation point of the system: Claim() must be atomic
 * (insert-if-absent, visible to all concurrent callers immediately), and
 * that guarantee has to come from the storage layer itself.
 *
 * Implementations: RocksRegistry (production), MemoryRegistry (tests).
 */
class Registry {
 public:
  virtual ~Registry() = default;

  /**
   * Insert a new record for `id` with no attribution.
   * @return OK if claimed; DuplicateCandidate if the id already exists (or
   *         is being claimed concurrently); RegistryUnavailable on any
   *         infrastructure failure. A failed claim leaves nothing behind.
   */
  virtual Status Claim(std::string_view id, std::string_view extension) = 0;

  /**
   * Remove the record for `id`.
   * @return OK, NotFound if absent, RegistryUnavailable on failure.
   */
  virtual Status Erase(std::string_view id) = 0;

  /** Point lookup. NotFound if absent. */
  virtual Status Get(std::string_view id, ImageRecord* out) const = 0;

  /**
   * Order-preserving batch lookup. out[i] is empty when ids[i] is absent.
   * Fails only on infrastructure errors.
   */
  virtual Status MultiGet(const std::vector<std::string>& ids,
                          std::vector<std::optional<ImageRecord>>* out) const = 0;

  /**
   * Replace the attribution of an existing record.
   * @param previous_out Optional; receives the old source.
   * @return OK, NotFound if absent (nothing is created).
   */
  virtual Status SetSource(std::string_view id,
                           std::string_view source,
                           std::string* previous_out) = 0;

  /** Visit every record (consistent snapshot). Stop early by returning false. */
  virtual Status ForEach(const std::function<bool(const ImageRecord&)>& fn) const = 0;

  virtual Status Count(uint64_t* out) const = 0;

  /** Bump the persisted counter for an HTTP status code. */
  virtual Status IncrementStatusCount(int status_code) = 0;

  virtual Status ListStatusCounts(std::vector<StatusCount>* out) const = 0;

  /** Release underlying resources. Safe to call multiple times. */
  virtual void Close() {}
};

}  // namespace picstash
