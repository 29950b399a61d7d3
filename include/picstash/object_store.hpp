#pragma once

#include <picstash/status.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace picstash {

/** One entry of ObjectStore::List(). */
struct ObjectEntry {
  std::string filename;        // "<id><ext>"
  uint64_t size_bytes = 0;
  uint64_t modified_at_us = 0;  // wall clock, microseconds since epoch
};

/**
 * Binary Object Store, keyed by identifier + extension.
 *
 * Writes for different keys are independent and may run in parallel.
 */
class ObjectStore {
 public:
  virtual ~ObjectStore() = default;

  virtual bool Exists(std::string_view id, std::string_view extension) const = 0;

  /** Store bytes; ObjectStoreWriteFailed on any failure. */
  virtual Status Write(std::string_view id,
                       std::string_view extension,
                       std::string_view bytes) = 0;

  virtual Status Read(std::string_view id,
                      std::string_view extension,
                      std::string* bytes_out) const = 0;

  /** Delete the object. NotFound if it does not exist. */
  virtual Status Remove(std::string_view id, std::string_view extension) = 0;

  /** Remove by full filename, for entries found by List(). */
  virtual Status RemoveFile(std::string_view filename) = 0;

  virtual Status List(std::vector<ObjectEntry>* out) const = 0;

  /** Location of the object, for serving it directly. */
  virtual std::string PathFor(std::string_view id, std::string_view extension) const = 0;
};

/**
 * Object store on a local directory: `<root>/<id><extension>`.
 *
 * Writes go to a hidden temporary file in the root and are renamed into
 * place, so a reader never sees a partially written object.
 */
class FileObjectStore : public ObjectStore {
 public:
  /** @throws std::runtime_error if root cannot be created. */
  explicit FileObjectStore(std::filesystem::path root);

  bool Exists(std::string_view id, std::string_view extension) const override;
  Status Write(std::string_view id,
               std::string_view extension,
               std::string_view bytes) override;
  Status Read(std::string_view id,
              std::string_view extension,
              std::string* bytes_out) const override;
  Status Remove(std::string_view id, std::string_view extension) override;
  Status RemoveFile(std::string_view filename) override;
  Status List(std::vector<ObjectEntry>* out) const override;
  std::string PathFor(std::string_view id, std::string_view extension) const override;

  const std::filesystem::path& root() const { return root_; }

 private:
  std::filesystem::path Resolve(std::string_view filename) const;

  std::filesystem::path root_;
};

}  // namespace picstash
