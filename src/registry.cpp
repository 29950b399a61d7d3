#include <picstash/registry.hpp>

#include <picstash/internal.hpp>

namespace picstash {

std::string ImageRecord::Serialize() const {
  std::string out;
  out.reserve(4 + extension.size() + 4 + source.size() + 8);

  internal::AppendU32LE(&out, static_cast<uint32_t>(extension.size()));
  out.append(extension);
  internal::AppendU32LE(&out, static_cast<uint32_t>(source.size()));
  out.append(source);
  out.append(internal::EncodeU64LE(created_at_us));
  return out;
}

bool ImageRecord::Deserialize(std::string_view id, std::string_view data, ImageRecord* out) {
  if (!out) return false;

  size_t offset = 0;
  auto read_string = [&](std::string* dst) -> bool {
    uint32_t len = 0;
    if (data.size() < offset + 4) return false;
    if (!internal::DecodeU32LE(data.substr(offset, 4), &len)) return false;
    offset += 4;
    if (data.size() < offset + len) return false;
    dst->assign(data.substr(offset, len));
    offset += len;
    return true;
  };

  ImageRecord rec;
  rec.id = std::string(id);
  if (!read_string(&rec.extension)) return false;
  if (!read_string(&rec.source)) return false;
  if (data.size() != offset + 8) return false;
  if (!internal::DecodeU64LE(data.substr(offset, 8), &rec.created_at_us)) return false;

  *out = std::move(rec);
  return true;
}

}  // namespace picstash
