#pragma once

#include <picstash/allocator.hpp>
#include <picstash/clock.hpp>
#include <picstash/object_store.hpp>
#include <picstash/observability.hpp>
#include <picstash/registry.hpp>
#include <picstash/status.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace picstash {

/**
 * Reduce a caller-supplied identifier to a bare id.
 *
 * Accepts "abc123" and "abc123.png". Rejects with InvalidArgument anything
 * containing '/' or '\\', ".", "..", empty input, and ids outside
 * [a-zA-Z0-9].
 *
 * @param ext_out Optional; receives the normalised suffix (".png"), or ""
 *        for a bare id. Service calls treat a suffix that differs from the
 *        recorded extension as naming a different, absent image.
 */
Status SanitizeIdentifier(std::string_view raw, std::string* id_out,
                          std::string* ext_out = nullptr);

/**
 * Split "<id><ext>" into a sanitised id and normalised extension.
 * InvalidArgument if the name is unsafe or has no extension.
 */
Status ParseFilename(std::string_view filename, std::string* id_out, std::string* ext_out);

// Smallest grace period Sweep accepts. An upload holds an unfulfilled
// reservation for as long as its object write takes; a shorter grace would
// let Sweep reclaim reservations of uploads still in flight.
inline constexpr uint64_t kMinSweepGraceSeconds = 60;

struct ServiceOptions {
  AllocatorOptions allocator;

  // Sweep only touches records and files older than this. Must be at least
  // kMinSweepGraceSeconds.
  uint64_t sweep_grace_seconds = 3600;

  std::shared_ptr<MetricsSink> metrics;

  // Age reference for Sweep; null means SystemClock.
  std::shared_ptr<const Clock> clock;
};

struct UploadResult {
  std::string id;
  std::string extension;
  std::string filename;  // id + extension
};

/** Outcome of ResolveSource(). Callers must keep the three cases apart. */
struct Resolution {
  enum class Kind {
    kRedirect,    // record has a source; target = source URL
    kServeLocal,  // record without source; target = object path
    kNotFound,    // no record
  };

  Kind kind = Kind::kNotFound;
  std::string target;
  std::string filename;
};

struct SweepStats {
  uint64_t records_scanned = 0;
  uint64_t objects_scanned = 0;
  uint64_t orphan_records_removed = 0;
  uint64_t orphan_objects_removed = 0;
};

/**
 * picstash::ImageService
 *
 * Upload pipeline and metadata operations over a Registry and an
 * ObjectStore, keeping the two consistent:
 *  - Upload: claim an id, write the object, release the claim if the write
 *    fails.
 *  - Delete: object first, then record; a missing object does not block
 *    removal of the record.
 *
 * Both handles are borrowed and must outlive the service. All methods are
 * thread-safe as long as the handles are.
 */
class ImageService {
 public:
  ImageService(Registry* registry, ObjectStore* objects,
               ServiceOptions opt = ServiceOptions{});

  ImageService(const ImageService&) = delete;
  ImageService& operator=(const ImageService&) = delete;

  /**
   * Store `bytes` under a freshly allocated identifier.
   * @return OK, or any Allocate() error, or ObjectStoreWriteFailed (the
   *         claimed id has been released, or the reservation disappeared
   *         while the object was being written and the object was removed).
   */
  Status Upload(std::string_view extension, std::string_view bytes, UploadResult* out);

  /** Drop a reservation whose object was never written. */
  Status Release(std::string_view id);

  /**
   * Update attribution for an existing id.
   * @param previous_out Optional; receives the old source (empty if none).
   * @return OK, NotFound (nothing created), InvalidArgument for unsafe ids.
   */
  Status SetSource(std::string_view id, std::string_view source, std::string* previous_out);

  /**
   * Order-preserving batch lookup. (*out)[i] is null when ids[i] is
   * unknown, malformed, or has no source.
   */
  Status GetSources(const std::vector<std::string>& ids,
                    std::vector<std::optional<std::string>>* out) const;

  /**
   * Remove the object, then the record.
   * @return OK (also when the object was already missing), NotFound (object
   *         store untouched), InvalidArgument for unsafe ids.
   */
  Status Delete(std::string_view id);

  /** Redirect / serve locally / not found. Non-OK only on infrastructure errors. */
  Status ResolveSource(std::string_view id, Resolution* out) const;

  /**
   * Remove records whose object is missing and objects without a record,
   * both only when older than `grace_seconds`.
   * @return InvalidArgument if grace_seconds < kMinSweepGraceSeconds.
   */
  Status Sweep(uint64_t grace_seconds, SweepStats* stats);
  Status Sweep(SweepStats* stats) { return Sweep(opt_.sweep_grace_seconds, stats); }

  Registry* registry() const { return registry_; }
  ObjectStore* objects() const { return objects_; }
  const Allocator& allocator() const { return allocator_; }

 private:
  // Get() that also honours an extension suffix on the caller's id.
  Status Lookup(std::string_view raw_id, ImageRecord* rec) const;

  uint64_t WallNow() const;

  Registry* registry_;
  ObjectStore* objects_;
  ServiceOptions opt_;
  Allocator allocator_;
};

}  // namespace picstash
