#include <picstash/status.hpp>

namespace picstash {

std::string_view Status::CodeName(Code code) {
  switch (code) {
    case Code::kOk: return "ok";
    case Code::kInvalidExtension: return "invalid_extension";
    case Code::kDuplicateCandidate: return "duplicate_candidate";
    case Code::kAllocationExhausted: return "allocation_exhausted";
    case Code::kRegistryUnavailable: return "registry_unavailable";
    case Code::kNotFound: return "not_found";
    case Code::kObjectStoreWriteFailed: return "object_store_write_failed";
    case Code::kInvalidArgument: return "invalid_argument";
    case Code::kIOError: return "io_error";
    case Code::kCorruption: return "corruption";
  }
  return "unknown";
}

std::string Status::ToString() const {
  if (ok()) return "OK";

  std::string out;
  switch (code_) {
    case Code::kInvalidExtension: out = "Invalid extension"; break;
    case Code::kDuplicateCandidate: out = "Duplicate candidate"; break;
    case Code::kAllocationExhausted: out = "Allocation exhausted"; break;
    case Code::kRegistryUnavailable: out = "Registry unavailable"; break;
    case Code::kNotFound: out = "NotFound"; break;
    case Code::kObjectStoreWriteFailed: out = "Object store write failed"; break;
    case Code::kInvalidArgument: out = "Invalid argument"; break;
    case Code::kIOError: out = "IO error"; break;
    case Code::kCorruption: out = "Corruption"; break;
    default: out = "Unknown"; break;
  }
  if (!message_.empty()) {
    out += ": ";
    out += message_;
  }
  return out;
}

}  // namespace picstash
