#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace glyphseed::util {

// True for U+0000..U+10FFFF excluding the surrogate range.
bool IsUnicodeScalar(char32_t code_point);

// Strict UTF-8 decoding: rejects overlong forms, surrogates, truncated
// sequences and code points above U+10FFFF. `out` is only written on success.
bool DecodeUtf8(std::string_view text, std::u32string* out);

bool IsValidUtf8(std::string_view text);

// Appends the UTF-8 encoding of `code_point`; returns false (leaving `out`
// untouched) when it is not a Unicode scalar value.
bool AppendUtf8(char32_t code_point, std::string* out);

// Non-scalar code points are replaced with U+FFFD.
std::string EncodeUtf8(std::u32string_view text);

// Number of scalar values in a valid UTF-8 string, or std::string::npos when
// the input is malformed.
std::size_t CountScalars(std::string_view text);

}  // namespace glyphseed::util
