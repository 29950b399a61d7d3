#include <picstash/object_store.hpp>

#include <picstash/id_generator.hpp>
#include <picstash/internal.hpp>

#include <trantor/utils/Logger.h>

#include <fstream>
#include <stdexcept>

namespace picstash {

namespace fs = std::filesystem;

namespace {

constexpr const char* kTempPrefix = ".tmp-";

bool IsPlainFilename(std::string_view name) {
  if (name.empty() || name == "." || name == "..") return false;
  return name.find('/') == std::string_view::npos &&
         name.find('\\') == std::string_view::npos &&
         name.find('\0') == std::string_view::npos;
}

}  // namespace

FileObjectStore::FileObjectStore(fs::path root) : root_(std::move(root)) {
  std::error_code ec;
  fs::create_directories(root_, ec);
  if (ec) {
    throw std::runtime_error("Cannot create object store root " + root_.string() +
                             ": " + ec.message());
  }
}

fs::path FileObjectStore::Resolve(std::string_view filename) const {
  if (!IsPlainFilename(filename)) return {};
  return root_ / fs::path(std::string(filename));
}

std::string FileObjectStore::PathFor(std::string_view id, std::string_view extension) const {
  std::string filename(id);
  filename.append(extension);
  return Resolve(filename).string();
}

bool FileObjectStore::Exists(std::string_view id, std::string_view extension) const {
  std::string filename(id);
  filename.append(extension);
  fs::path path = Resolve(filename);
  if (path.empty()) return false;

  std::error_code ec;
  return fs::is_regular_file(path, ec);
}

Status FileObjectStore::Write(std::string_view id,
                              std::string_view extension,
                              std::string_view bytes) {
  std::string filename(id);
  filename.append(extension);
  fs::path path = Resolve(filename);
  if (path.empty()) {
    return Status::ObjectStoreWriteFailed("unsafe object name: " + filename);
  }

  fs::path tmp = root_ / (kTempPrefix + filename + "-" + GenerateIdentifier(8));
  {
    std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
    if (!file) {
      return Status::ObjectStoreWriteFailed("cannot open " + tmp.string());
    }
    file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    file.flush();
    if (!file) {
      file.close();
      std::error_code ec;
      fs::remove(tmp, ec);
      return Status::ObjectStoreWriteFailed("short write to " + tmp.string());
    }
  }

  std::error_code ec;
  fs::rename(tmp, path, ec);
  if (ec) {
    std::error_code rm_ec;
    fs::remove(tmp, rm_ec);
    return Status::ObjectStoreWriteFailed("rename to " + path.string() + " failed: " +
                                          ec.message());
  }

  LOG_TRACE << "Wrote " << bytes.size() << " bytes to " << path.string();
  return Status::OK();
}

Status FileObjectStore::Read(std::string_view id,
                             std::string_view extension,
                             std::string* bytes_out) const {
  if (!bytes_out) return Status::InvalidArgument("bytes_out is null");

  std::string filename(id);
  filename.append(extension);
  fs::path path = Resolve(filename);
  if (path.empty()) return Status::InvalidArgument("unsafe object name: " + filename);

  std::ifstream file(path, std::ios::binary | std::ios::ate);
  if (!file) return Status::NotFound(filename);

  auto size = file.tellg();
  if (size < 0) return Status::IOError("cannot stat " + path.string());
  file.seekg(0, std::ios::beg);

  std::string buffer(static_cast<size_t>(size), '\0');
  file.read(buffer.data(), size);
  if (!file) return Status::IOError("failed to read " + path.string());

  *bytes_out = std::move(buffer);
  return Status::OK();
}

Status FileObjectStore::Remove(std::string_view id, std::string_view extension) {
  std::string filename(id);
  filename.append(extension);
  return RemoveFile(filename);
}

Status FileObjectStore::RemoveFile(std::string_view filename) {
  fs::path path = Resolve(filename);
  if (path.empty()) return Status::InvalidArgument("unsafe object name: " + std::string(filename));

  std::error_code ec;
  bool removed = fs::remove(path, ec);
  if (ec) return Status::IOError("failed to delete " + path.string() + ": " + ec.message());
  if (!removed) return Status::NotFound(std::string(filename));
  return Status::OK();
}

Status FileObjectStore::List(std::vector<ObjectEntry>* out) const {
  if (!out) return Status::InvalidArgument("out is null");
  out->clear();

  std::error_code ec;
  fs::directory_iterator it(root_, ec);
  if (ec) return Status::IOError("cannot list " + root_.string() + ": " + ec.message());

  // file_time_type has no portable conversion to system_clock in C++17;
  // go through the age instead.
  const auto now = fs::file_time_type::clock::now();
  const uint64_t wall_now_us = internal::WallClockMicros();
  for (const auto& entry : it) {
    std::error_code entry_ec;
    if (!entry.is_regular_file(entry_ec)) continue;

    ObjectEntry obj;
    obj.filename = entry.path().filename().string();
    obj.size_bytes = static_cast<uint64_t>(entry.file_size(entry_ec));

    obj.modified_at_us = wall_now_us;
    auto mtime = entry.last_write_time(entry_ec);
    if (!entry_ec && mtime < now) {
      const auto age_us = static_cast<uint64_t>(
          std::chrono::duration_cast<std::chrono::microseconds>(now - mtime).count());
      obj.modified_at_us = age_us < wall_now_us ? wall_now_us - age_us : 0;
    }
    out->push_back(std::move(obj));
  }
  return Status::OK();
}

}  // namespace picstash
