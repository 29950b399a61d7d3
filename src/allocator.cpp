#include <picstash/allocator.hpp>

#include <picstash/internal.hpp>

#include <trantor/utils/Logger.h>

#include <algorithm>
#include <cctype>

namespace picstash {

std::string NormalizeExtension(std::string_view extension) {
  if (extension.empty()) return {};

  std::string out;
  out.reserve(extension.size() + 1);
  if (extension.front() != '.') out.push_back('.');
  for (char c : extension) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

Allocator::Allocator(Registry* registry, AllocatorOptions opt)
    : registry_(registry), opt_(std::move(opt)) {
  if (!opt_.id_source) {
    opt_.id_source = [](size_t length) { return GenerateIdentifier(length); };
  }
  for (auto& ext : opt_.allowed_extensions) {
    ext = NormalizeExtension(ext);
  }
}

bool Allocator::IsAllowedExtension(std::string_view normalized_extension) const {
  return std::find(opt_.allowed_extensions.begin(), opt_.allowed_extensions.end(),
                   normalized_extension) != opt_.allowed_extensions.end();
}

Status Allocator::Allocate(std::string_view extension,
                           std::string* id_out,
                           std::string* normalized_extension_out) {
  if (!id_out) return Status::InvalidArgument("id_out is null");
  if (!registry_) return Status::RegistryUnavailable("no registry");
  if (opt_.id_length == 0) return Status::InvalidArgument("id_length must be positive");

  internal::EmitCounter(opt_.metrics, "picstash.allocate.calls", 1);

  std::string ext = NormalizeExtension(extension);
  if (ext.empty() || !IsAllowedExtension(ext)) {
    internal::EmitCounter(opt_.metrics, "picstash.allocate.invalid_extension_total", 1);
    return Status::InvalidExtension("unsupported extension '" + std::string(extension) + "'");
  }

  const uint64_t op_start_us = internal::NowMicros();
  int attempts_used = 0;

  auto finish = [&](const Status& st) -> Status {
    internal::EmitHistogram(opt_.metrics, "picstash.allocate.latency_us",
                            internal::NowMicros() - op_start_us);
    internal::EmitHistogram(opt_.metrics, "picstash.allocate.attempts",
                            static_cast<uint64_t>(attempts_used));
    if (st.ok()) {
      internal::EmitCounter(opt_.metrics, "picstash.allocate.ok_total", 1);
    } else if (st.IsAllocationExhausted()) {
      internal::EmitCounter(opt_.metrics, "picstash.allocate.exhausted_total", 1);
    } else {
      internal::EmitCounter(opt_.metrics, "picstash.allocate.error_total", 1);
    }
    return st;
  };

  for (int attempt = 0; attempt < opt_.max_tries; ++attempt) {
    attempts_used = attempt + 1;
    std::string candidate = opt_.id_source(opt_.id_length);

    Status s = registry_->Claim(candidate, ext);
    if (s.ok()) {
      *id_out = std::move(candidate);
      if (normalized_extension_out) *normalized_extension_out = ext;
      return finish(s);
    }

    if (s.IsDuplicateCandidate()) {
      internal::EmitCounter(opt_.metrics, "picstash.allocate.collision_total", 1);
      LOG_DEBUG << "Identifier collision on attempt " << attempts_used << ": " << candidate;
      continue;
    }

    // Infrastructure failure: surface it, never convert it into exhaustion.
    if (!s.IsRegistryUnavailable()) {
      s = Status::RegistryUnavailable(s.ToString());
    }
    LOG_ERROR << "Allocation aborted: " << s.ToString();
    return finish(s);
  }

  LOG_WARN << "Allocation exhausted after " << opt_.max_tries << " collisions (id_length="
           << opt_.id_length << ")";
  return finish(Status::AllocationExhausted(
      "no free identifier after " + std::to_string(opt_.max_tries) + " tries"));
}

}  // namespace picstash
