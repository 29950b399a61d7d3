#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace picstash {

/** Identifier alphabet: [a-zA-Z0-9], 62 characters. */
inline constexpr std::string_view kIdentifierAlphabet =
    "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";

/** Default identifier length; 62^6 ~= 5.68e10 possible values. */
inline constexpr size_t kDefaultIdentifierLength = 6;

/**
 * Generate a random identifier of `length` characters, each drawn
 * independently and uniformly from kIdentifierAlphabet.
 *
 * Thread-safe (per-thread generator). Not suitable for secrets.
 */
std::string GenerateIdentifier(size_t length = kDefaultIdentifierLength);

/** True if every character of `s` is in kIdentifierAlphabet. */
bool IsIdentifierCharset(std::string_view s);

}  // namespace picstash
