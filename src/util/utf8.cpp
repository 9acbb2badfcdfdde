#include "util/utf8.hpp"

#include <cstdint>

namespace glyphseed::util {

namespace {

bool IsContinuation(unsigned char byte) { return (byte & 0xC0u) == 0x80u; }

// Decodes one scalar starting at `pos`, advancing it. Returns false on any
// malformed sequence.
bool DecodeOne(std::string_view text, std::size_t* pos, char32_t* out) {
  const auto lead = static_cast<unsigned char>(text[*pos]);
  std::size_t length = 0;
  char32_t value = 0;
  char32_t minimum = 0;
  if (lead < 0x80u) {
    *out = lead;
    ++*pos;
    return true;
  } else if ((lead & 0xE0u) == 0xC0u) {
    length = 2;
    value = lead & 0x1Fu;
    minimum = 0x80;
  } else if ((lead & 0xF0u) == 0xE0u) {
    length = 3;
    value = lead & 0x0Fu;
    minimum = 0x800;
  } else if ((lead & 0xF8u) == 0xF0u) {
    length = 4;
    value = lead & 0x07u;
    minimum = 0x10000;
  } else {
    return false;
  }
  if (text.size() - *pos < length) {
    return false;
  }
  for (std::size_t i = 1; i < length; ++i) {
    const auto byte = static_cast<unsigned char>(text[*pos + i]);
    if (!IsContinuation(byte)) {
      return false;
    }
    value = (value << 6) | (byte & 0x3Fu);
  }
  if (value < minimum || !IsUnicodeScalar(value)) {
    return false;
  }
  *out = value;
  *pos += length;
  return true;
}

}  // namespace

bool IsUnicodeScalar(char32_t code_point) {
  return code_point <= 0x10FFFF && (code_point < 0xD800 || code_point > 0xDFFF);
}

bool DecodeUtf8(std::string_view text, std::u32string* out) {
  std::u32string decoded;
  decoded.reserve(text.size());
  std::size_t pos = 0;
  while (pos < text.size()) {
    char32_t scalar = 0;
    if (!DecodeOne(text, &pos, &scalar)) {
      return false;
    }
    decoded.push_back(scalar);
  }
  *out = std::move(decoded);
  return true;
}

bool IsValidUtf8(std::string_view text) { return CountScalars(text) != std::string::npos; }

bool AppendUtf8(char32_t code_point, std::string* out) {
  if (!IsUnicodeScalar(code_point)) {
    return false;
  }
  const auto cp = static_cast<std::uint32_t>(code_point);
  if (cp < 0x80) {
    out->push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out->push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out->push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out->push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out->push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
  return true;
}

std::string EncodeUtf8(std::u32string_view text) {
  std::string out;
  out.reserve(text.size());
  for (const char32_t cp : text) {
    if (!AppendUtf8(cp, &out)) {
      out.append("\xEF\xBF\xBD");
    }
  }
  return out;
}

std::size_t CountScalars(std::string_view text) {
  std::size_t count = 0;
  std::size_t pos = 0;
  while (pos < text.size()) {
    char32_t scalar = 0;
    if (!DecodeOne(text, &pos, &scalar)) {
      return std::string::npos;
    }
    ++count;
  }
  return count;
}

}  // namespace glyphseed::util
