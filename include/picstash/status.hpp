#pragma once

#include <string>
#include <string_view>

namespace picstash {

/**
 * Result of a picstash operation.
 *
 * Shaped after rocksdb::Status: a code plus a human readable message, cheap
 * to copy, checked with ok() / IsXxx(). Every core operation returns one of
 * these; none of them throw.
 */
class Status {
 public:
  enum class Code {
    kOk = 0,
    kInvalidExtension,
    kDuplicateCandidate,
    kAllocationExhausted,
    kRegistryUnavailable,
    kNotFound,
    kObjectStoreWriteFailed,
    kInvalidArgument,
    kIOError,
    kCorruption,
  };

  Status() = default;

  static Status OK() { return Status(); }
  static Status InvalidExtension(std::string_view msg = {}) {
    return Status(Code::kInvalidExtension, msg);
  }
  static Status DuplicateCandidate(std::string_view msg = {}) {
    return Status(Code::kDuplicateCandidate, msg);
  }
  static Status AllocationExhausted(std::string_view msg = {}) {
    return Status(Code::kAllocationExhausted, msg);
  }
  static Status RegistryUnavailable(std::string_view msg = {}) {
    return Status(Code::kRegistryUnavailable, msg);
  }
  static Status NotFound(std::string_view msg = {}) {
    return Status(Code::kNotFound, msg);
  }
  static Status ObjectStoreWriteFailed(std::string_view msg = {}) {
    return Status(Code::kObjectStoreWriteFailed, msg);
  }
  static Status InvalidArgument(std::string_view msg = {}) {
    return Status(Code::kInvalidArgument, msg);
  }
  static Status IOError(std::string_view msg = {}) {
    return Status(Code::kIOError, msg);
  }
  static Status Corruption(std::string_view msg = {}) {
    return Status(Code::kCorruption, msg);
  }

  bool ok() const { return code_ == Code::kOk; }
  Code code() const { return code_; }
  const std::string& message() const { return message_; }

  bool IsInvalidExtension() const { return code_ == Code::kInvalidExtension; }
  bool IsDuplicateCandidate() const { return code_ == Code::kDuplicateCandidate; }
  bool IsAllocationExhausted() const { return code_ == Code::kAllocationExhausted; }
  bool IsRegistryUnavailable() const { return code_ == Code::kRegistryUnavailable; }
  bool IsNotFound() const { return code_ == Code::kNotFound; }
  bool IsObjectStoreWriteFailed() const { return code_ == Code::kObjectStoreWriteFailed; }
  bool IsInvalidArgument() const { return code_ == Code::kInvalidArgument; }
  bool IsIOError() const { return code_ == Code::kIOError; }
  bool IsCorruption() const { return code_ == Code::kCorruption; }

  /** "OK", or "<Kind>: <message>". */
  std::string ToString() const;

  /** Low-cardinality name of the code, suitable for metric labels. */
  static std::string_view CodeName(Code code);

 private:
  Status(Code code, std::string_view msg) : code_(code), message_(msg) {}

  Code code_ = Code::kOk;
  std::string message_;
};

}  // namespace picstash
