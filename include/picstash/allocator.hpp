#pragma once

#include <picstash/id_generator.hpp>
#include <picstash/observability.hpp>
#include <picstash/registry.hpp>
#include <picstash/status.hpp>

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace picstash {

/** Candidate source; GenerateIdentifier unless a test injects one. */
using IdSource = std::function<std::string(size_t length)>;

struct AllocatorOptions {
  size_t id_length = kDefaultIdentifierLength;

  // Claim attempts per allocation. Every attempt is a persistent write, so
  // this is a hard bound, not a backoff.
  int max_tries = 10;

  // Lower-case, with leading dot.
  std::vector<std::string> allowed_extensions = {
      ".png", ".jpg", ".jpeg", ".gif", ".webp", ".bmp"};

  IdSource id_source;

  std::shared_ptr<MetricsSink> metrics;
};

/**
 * Lower-case `extension` and prefix a dot if missing ("PNG" -> ".png").
 * Returns an empty string for an empty input.
 */
std::string NormalizeExtension(std::string_view extension);

/**
 * Allocation Coordinator.
 *
 * Produces a claimed, collision-free identifier: generate a candidate,
 * claim it in the registry, retry only on DuplicateCandidate, at most
 * max_tries times. The registry is borrowed and must outlive the allocator.
 */
class Allocator {
 public:
  explicit Allocator(Registry* registry, AllocatorOptions opt = AllocatorOptions{});

  /**
   * Claim a fresh identifier for an upload with `extension`.
   *
   * @param id_out Receives the claimed id on success.
   * @param normalized_extension_out Optional; the extension as recorded.
   * @return OK; InvalidExtension (registry untouched); RegistryUnavailable
   *         (not retried); AllocationExhausted after max_tries collisions.
   *
   * On success exactly one new record exists. The caller owns it as a
   * reservation: write the object, or Erase() the record.
   */
  Status Allocate(std::string_view extension,
                  std::string* id_out,
                  std::string* normalized_extension_out = nullptr);

  bool IsAllowedExtension(std::string_view normalized_extension) const;

  const AllocatorOptions& options() const { return opt_; }

 private:
  Registry* registry_;
  AllocatorOptions opt_;
};

}  // namespace picstash
