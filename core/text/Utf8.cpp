#include "core/text/Utf8.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>

#include <unicode/uchar.h>
#include <unicode/ustring.h>
#include <unicode/utf16.h>
#include <unicode/utf8.h>

/**
 * @file Utf8.cpp
 * @brief 基于 ICU utf8.h 宏与 uchar.h 属性查询的实现。
 */

namespace {

constexpr CodePoint kByteOrderMark = 0xFEFF;

CodePoint rawByteUnit(std::uint8_t b) {
  return -1 - static_cast<CodePoint>(b);
}

std::uint8_t rawByteValue(CodePoint unit) {
  return static_cast<std::uint8_t>(-1 - unit);
}

} // namespace

CodePoints decodeUtf8(std::string_view text) {
  CodePoints units;
  units.reserve(text.size());

  const auto* bytes = reinterpret_cast<const std::uint8_t*>(text.data());
  std::size_t pos = 0;
  while (pos < text.size()) {
    // 一个 UTF-8 序列最多 4 字节，逐个序列解码可避免 int32 偏移溢出
    const auto window = static_cast<std::int32_t>(std::min<std::size_t>(4, text.size() - pos));
    std::int32_t consumed = 0;
    UChar32 c = 0;
    U8_NEXT(bytes + pos, consumed, window, c);
    if (c < 0) {
      for (std::int32_t k = 0; k < consumed; ++k) {
        units.push_back(rawByteUnit(bytes[pos + static_cast<std::size_t>(k)]));
      }
    } else {
      units.push_back(c);
    }
    pos += static_cast<std::size_t>(consumed);
  }
  return units;
}

std::string encodeUtf8(const CodePoints& units) {
  std::string out;
  out.reserve(units.size());
  for (CodePoint unit : units) {
    if (isRawByte(unit)) {
      out.push_back(static_cast<char>(rawByteValue(unit)));
      continue;
    }
    std::uint8_t buffer[U8_MAX_LENGTH];
    std::int32_t length = 0;
    U8_APPEND_UNSAFE(buffer, length, unit);
    out.append(reinterpret_cast<const char*>(buffer), static_cast<std::size_t>(length));
  }
  return out;
}

bool isLetter(CodePoint c) {
  if (isRawByte(c)) return false;
  return (U_GET_GC_MASK(c) & U_GC_L_MASK) != 0;
}

bool isWhitespace(CodePoint c) {
  if (isRawByte(c)) return false;
  return u_isUWhiteSpace(c) || c == kByteOrderMark;
}

bool isUpperCase(CodePoint c) {
  if (isRawByte(c)) return true;
  UChar source[U16_MAX_LENGTH];
  std::int32_t length = 0;
  U16_APPEND_UNSAFE(source, length, c);

  // 完整映射：ß 的大写是 "SS"，与自身不同
  UChar upper[8];
  UErrorCode status = U_ZERO_ERROR;
  const std::int32_t upperLength = u_strToUpper(upper, 8, source, length, "", &status);
  if (U_FAILURE(status)) {
    return false;
  }
  return upperLength == length && std::equal(source, source + length, upper);
}

CodePoint toLowerCase(CodePoint c) {
  return isRawByte(c) ? c : u_tolower(c);
}

CodePoint toUpperCase(CodePoint c) {
  return isRawByte(c) ? c : u_toupper(c);
}
