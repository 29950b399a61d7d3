#include <picstash/image_service.hpp>

#include <picstash/id_generator.hpp>
#include <picstash/internal.hpp>

#include <trantor/utils/Logger.h>

namespace picstash {

namespace {

constexpr size_t kMaxIdentifierLength = 64;

bool HasSeparator(std::string_view s) {
  return s.find('/') != std::string_view::npos ||
         s.find('\\') != std::string_view::npos;
}

AllocatorOptions WithMetrics(AllocatorOptions opt, const std::shared_ptr<MetricsSink>& metrics) {
  if (!opt.metrics) opt.metrics = metrics;
  return opt;
}

}  // namespace

Status SanitizeIdentifier(std::string_view raw, std::string* id_out, std::string* ext_out) {
  if (!id_out) return Status::InvalidArgument("id_out is null");
  if (raw.empty()) return Status::InvalidArgument("empty identifier");
  if (HasSeparator(raw)) {
    return Status::InvalidArgument("identifier contains a path separator");
  }

  const size_t dot = raw.find('.');
  std::string_view id = raw.substr(0, dot);
  if (id.empty()) return Status::InvalidArgument("identifier is empty or a dot name");
  if (id.size() > kMaxIdentifierLength) return Status::InvalidArgument("identifier too long");
  if (!IsIdentifierCharset(id)) {
    return Status::InvalidArgument("identifier has characters outside [a-zA-Z0-9]");
  }

  *id_out = std::string(id);
  if (ext_out) {
    *ext_out = dot == std::string_view::npos ? std::string() : NormalizeExtension(raw.substr(dot));
  }
  return Status::OK();
}

Status ParseFilename(std::string_view filename, std::string* id_out, std::string* ext_out) {
  if (!id_out || !ext_out) return Status::InvalidArgument("output is null");
  if (HasSeparator(filename)) {
    return Status::InvalidArgument("filename contains a path separator");
  }

  size_t dot = filename.rfind('.');
  if (dot == std::string_view::npos || dot == 0 || dot + 1 == filename.size()) {
    return Status::InvalidArgument("filename has no extension");
  }

  std::string id;
  Status s = SanitizeIdentifier(filename.substr(0, dot), &id);
  if (!s.ok()) return s;
  // SanitizeIdentifier strips at the first dot; "a.b.png" must not pass as "a".
  if (id.size() != dot) return Status::InvalidArgument("filename has more than one extension");

  *id_out = std::move(id);
  *ext_out = NormalizeExtension(filename.substr(dot));
  return Status::OK();
}

ImageService::ImageService(Registry* registry, ObjectStore* objects, ServiceOptions opt)
    : registry_(registry),
      objects_(objects),
      opt_(std::move(opt)),
      allocator_(registry, WithMetrics(opt_.allocator, opt_.metrics)) {}

uint64_t ImageService::WallNow() const {
  return opt_.clock ? opt_.clock->WallClockMicros() : internal::WallClockMicros();
}

Status ImageService::Lookup(std::string_view raw_id, ImageRecord* rec) const {
  std::string clean;
  std::string ext;
  Status s = SanitizeIdentifier(raw_id, &clean, &ext);
  if (!s.ok()) return s;

  s = registry_->Get(clean, rec);
  if (!s.ok()) return s;
  if (!ext.empty() && ext != rec->extension) return Status::NotFound(std::string(raw_id));
  return Status::OK();
}

Status ImageService::Upload(std::string_view extension,
                            std::string_view bytes,
                            UploadResult* out) {
  if (!out) return Status::InvalidArgument("out is null");
  if (!objects_) return Status::ObjectStoreWriteFailed("no object store");

  internal::EmitCounter(opt_.metrics, "picstash.upload.calls", 1);
  internal::EmitHistogram(opt_.metrics, "picstash.upload.bytes", static_cast<uint64_t>(bytes.size()));
  const uint64_t op_start_us = internal::NowMicros();

  std::string id;
  std::string ext;
  Status s = allocator_.Allocate(extension, &id, &ext);
  if (!s.ok()) {
    internal::EmitCounter(opt_.metrics, "picstash.upload.error_total", 1);
    return s;
  }

  s = objects_->Write(id, ext, bytes);
  if (!s.ok()) {
    internal::EmitCounter(opt_.metrics, "picstash.upload.write_failed_total", 1);
    LOG_ERROR << "Object write failed for " << id << ext << ": " << s.ToString();

    Status released = Release(id);
    if (!released.ok()) {
      // Sweep reclaims the record once it is older than the grace period.
      LOG_ERROR << "Could not release reservation " << id << ": " << released.ToString();
    }
    if (!s.IsObjectStoreWriteFailed()) s = Status::ObjectStoreWriteFailed(s.ToString());
    return s;
  }

  // The reservation must still be ours. Sweep reclaims reservations older
  // than its grace period, so a write that outlasted it may have lost the id.
  ImageRecord rec;
  Status held = registry_->Get(id, &rec);
  if (held.IsNotFound() || (held.ok() && rec.extension != ext)) {
    internal::EmitCounter(opt_.metrics, "picstash.upload.reservation_lost_total", 1);
    LOG_ERROR << "Reservation " << id << ext << " vanished during the object write";

    Status removed = objects_->Remove(id, ext);
    if (!removed.ok() && !removed.IsNotFound()) {
      LOG_ERROR << "Could not remove unreserved object " << id << ext << ": "
                << removed.ToString();
    }
    return Status::ObjectStoreWriteFailed("reservation " + id + " was reclaimed during the write");
  }
  if (!held.ok()) {
    // The claim committed; keep the object rather than fail a stored upload.
    LOG_WARN << "Could not re-check reservation " << id << ": " << held.ToString();
  }

  out->id = id;
  out->extension = ext;
  out->filename = id + ext;

  internal::EmitCounter(opt_.metrics, "picstash.upload.ok_total", 1);
  internal::EmitHistogram(opt_.metrics, "picstash.upload.latency_us",
                          internal::NowMicros() - op_start_us);
  LOG_INFO << "Stored " << out->filename << " (" << bytes.size() << " bytes)";
  return Status::OK();
}

Status ImageService::Release(std::string_view id) {
  Status s = registry_->Erase(id);
  if (s.IsNotFound()) return Status::OK();
  if (s.ok()) internal::EmitCounter(opt_.metrics, "picstash.upload.released_total", 1);
  return s;
}

Status ImageService::SetSource(std::string_view id,
                               std::string_view source,
                               std::string* previous_out) {
  std::string clean;
  std::string ext;
  Status s = SanitizeIdentifier(id, &clean, &ext);
  if (!s.ok()) return s;

  if (!ext.empty()) {
    ImageRecord rec;
    s = Lookup(id, &rec);
    if (s.IsNotFound()) internal::EmitCounter(opt_.metrics, "picstash.source.not_found_total", 1);
    if (!s.ok()) return s;
  }

  s = registry_->SetSource(clean, source, previous_out);
  if (s.ok()) {
    internal::EmitCounter(opt_.metrics, "picstash.source.updated_total", 1);
  } else if (s.IsNotFound()) {
    internal::EmitCounter(opt_.metrics, "picstash.source.not_found_total", 1);
  }
  return s;
}

Status ImageService::GetSources(const std::vector<std::string>& ids,
                                std::vector<std::optional<std::string>>* out) const {
  if (!out) return Status::InvalidArgument("out is null");
  out->assign(ids.size(), std::nullopt);

  // Malformed ids are misses; only well-formed ones go to the registry.
  std::vector<std::string> lookup;
  std::vector<std::string> suffixes;
  std::vector<size_t> positions;
  lookup.reserve(ids.size());
  suffixes.reserve(ids.size());
  positions.reserve(ids.size());
  for (size_t i = 0; i < ids.size(); ++i) {
    std::string clean;
    std::string ext;
    if (SanitizeIdentifier(ids[i], &clean, &ext).ok()) {
      lookup.push_back(std::move(clean));
      suffixes.push_back(std::move(ext));
      positions.push_back(i);
    }
  }

  std::vector<std::optional<ImageRecord>> records;
  Status s = registry_->MultiGet(lookup, &records);
  if (!s.ok()) {
    out->clear();
    return s;
  }

  for (size_t j = 0; j < records.size(); ++j) {
    if (!records[j]) continue;
    if (!suffixes[j].empty() && suffixes[j] != records[j]->extension) continue;
    if (records[j]->HasSource()) {
      (*out)[positions[j]] = records[j]->source;
    }
  }
  return Status::OK();
}

Status ImageService::Delete(std::string_view id) {
  ImageRecord rec;
  Status s = Lookup(id, &rec);
  if (!s.ok()) {
    if (s.IsNotFound()) internal::EmitCounter(opt_.metrics, "picstash.delete.not_found_total", 1);
    return s;
  }

  // Object first: a crash after this leaves a record without a file, which
  // Delete and Sweep can both clean up. The reverse would leave a file that
  // nothing points to.
  Status os = objects_->Remove(rec.id, rec.extension);
  if (os.IsNotFound()) {
    LOG_WARN << "Object " << rec.Filename() << " already missing; removing record";
  } else if (!os.ok()) {
    LOG_ERROR << "Object delete failed for " << rec.Filename() << ": " << os.ToString()
              << "; removing record anyway";
    internal::EmitCounter(opt_.metrics, "picstash.delete.object_error_total", 1);
  }

  s = registry_->Erase(rec.id);
  if (!s.ok()) return s;

  internal::EmitCounter(opt_.metrics, "picstash.delete.ok_total", 1);
  LOG_INFO << "Deleted " << rec.Filename();
  return Status::OK();
}

Status ImageService::ResolveSource(std::string_view id, Resolution* out) const {
  if (!out) return Status::InvalidArgument("out is null");
  *out = Resolution{};

  ImageRecord rec;
  Status s = Lookup(id, &rec);
  if (s.IsNotFound() || s.IsInvalidArgument()) return Status::OK();  // kNotFound
  if (!s.ok()) return s;

  out->filename = rec.Filename();
  if (rec.HasSource()) {
    out->kind = Resolution::Kind::kRedirect;
    out->target = rec.source;
  } else {
    out->kind = Resolution::Kind::kServeLocal;
    out->target = objects_->PathFor(rec.id, rec.extension);
  }
  return Status::OK();
}

Status ImageService::Sweep(uint64_t grace_seconds, SweepStats* stats) {
  if (!stats) return Status::InvalidArgument("stats is null");
  *stats = SweepStats{};
  if (grace_seconds < kMinSweepGraceSeconds) {
    return Status::InvalidArgument("sweep grace must be at least " +
                                   std::to_string(kMinSweepGraceSeconds) + "s");
  }

  const uint64_t now_us = WallNow();
  const uint64_t grace_us = grace_seconds * 1000000ULL;

  // 1) Records whose object never arrived (or was lost).
  std::vector<ImageRecord> stale;
  Status s = registry_->ForEach([&](const ImageRecord& rec) {
    ++stats->records_scanned;
    if (now_us >= rec.created_at_us && now_us - rec.created_at_us >= grace_us) {
      stale.push_back(rec);
    }
    return true;
  });
  if (!s.ok()) return s;

  for (const auto& rec : stale) {
    if (objects_->Exists(rec.id, rec.extension)) continue;

    s = registry_->Erase(rec.id);
    if (s.ok()) {
      ++stats->orphan_records_removed;
      LOG_WARN << "Sweep removed record " << rec.Filename() << " (object missing)";
    } else if (!s.IsNotFound()) {
      return s;
    }
  }

  // 2) Objects nothing points to. Each is re-checked against the registry,
  // so uploads that started after the scan above are left alone.
  std::vector<ObjectEntry> entries;
  s = objects_->List(&entries);
  if (!s.ok()) return s;

  for (const auto& entry : entries) {
    ++stats->objects_scanned;
    if (now_us < entry.modified_at_us || now_us - entry.modified_at_us < grace_us) continue;

    std::string id;
    std::string ext;
    bool orphan = false;
    if (!ParseFilename(entry.filename, &id, &ext).ok()) {
      orphan = true;  // temporaries and foreign files
    } else {
      ImageRecord rec;
      Status gs = registry_->Get(id, &rec);
      if (gs.IsNotFound()) {
        orphan = true;
      } else if (!gs.ok()) {
        return gs;
      } else {
        orphan = rec.extension != ext;
      }
    }
    if (!orphan) continue;

    Status rs = objects_->RemoveFile(entry.filename);
    if (rs.ok()) {
      ++stats->orphan_objects_removed;
      LOG_WARN << "Sweep removed object " << entry.filename << " (no record)";
    } else if (!rs.IsNotFound()) {
      LOG_ERROR << "Sweep could not remove " << entry.filename << ": " << rs.ToString();
    }
  }

  internal::EmitCounter(opt_.metrics, "picstash.sweep.records_removed_total",
                        stats->orphan_records_removed);
  internal::EmitCounter(opt_.metrics, "picstash.sweep.objects_removed_total",
                        stats->orphan_objects_removed);
  return Status::OK();
}

}  // namespace picstash
