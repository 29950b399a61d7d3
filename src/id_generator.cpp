#include <picstash/id_generator.hpp>

#include <picstash/internal.hpp>

#include <random>

namespace picstash {

std::string GenerateIdentifier(size_t length) {
  std::uniform_int_distribution<size_t> pick(0, kIdentifierAlphabet.size() - 1);
  auto& rng = internal::ThreadRng();

  std::string id;
  id.reserve(length);
  for (size_t i = 0; i < length; ++i) {
    id.push_back(kIdentifierAlphabet[pick(rng)]);
  }
  return id;
}

bool IsIdentifierCharset(std::string_view s) {
  for (char c : s) {
    bool alnum = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                 (c >= '0' && c <= '9');
    if (!alnum) return false;
  }
  return true;
}

}  // namespace picstash
