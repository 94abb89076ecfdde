#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

inline constexpr const char ELLIPSIS[] = "\xE2\x80\xA6";  // U+2026
inline constexpr size_t LEN_ELLIPSIS = sizeof(ELLIPSIS) - 1;

// 10xxxxxx; never starts a character
inline bool Utf8_IsContinuation(uint8_t byte) {
  return (byte & 0xC0) == 0x80;
}

// Length of the sequence announced by a lead byte, 0 if `byte` cannot lead one
inline size_t Utf8_LeadLength(uint8_t byte) {
  if ((byte & 0x80) == 0x00) {
    return 1;
  } else if ((byte & 0xE0) == 0xC0) {
    return 2;
  } else if ((byte & 0xF0) == 0xE0) {
    return 3;
  } else if ((byte & 0xF8) == 0xF0) {
    return 4;
  }

  return 0;
}

// Number of bytes of the character starting at `off`. A byte that doesn't
// begin a well-formed sequence is a character of its own.
inline size_t Utf8_CharLength(std::string_view s, size_t off) {
  auto len = Utf8_LeadLength(uint8_t(s[off]));
  if (len <= 1 || off + len > s.size()) {
    return 1;
  }

  for (size_t i = 1; i < len; i++) {
    if (!Utf8_IsContinuation(uint8_t(s[off + i]))) {
      return 1;
    }
  }

  return len;
}

// Moves `off` back onto the start of the character containing it
inline size_t Utf8_AlignBack(std::string_view s, size_t off) {
  if (off >= s.size()) {
    return s.size();
  }

  auto cur = off;
  while (cur > 0 && off - cur < 3 && Utf8_IsContinuation(uint8_t(s[cur]))) {
    cur--;
  }

  if (cur + Utf8_CharLength(s, cur) > off) {
    return cur;
  }

  return off;
}

// Moves `off` forward onto the next character boundary at or after it
inline size_t Utf8_AlignForward(std::string_view s, size_t off) {
  if (off >= s.size()) {
    return s.size();
  }

  auto start = Utf8_AlignBack(s, off);
  if (start == off) {
    return off;
  }

  return start + Utf8_CharLength(s, start);
}

// Steps back over at most `n` characters; `stepped` receives the count taken
inline size_t Utf8_StepBack(std::string_view s,
                            size_t off,
                            size_t n,
                            size_t &stepped) {
  stepped = 0;
  while (stepped < n && off > 0) {
    off = Utf8_AlignBack(s, off - 1);
    stepped++;
  }

  return off;
}

// Steps forward over at most `n` characters
inline size_t Utf8_StepForward(std::string_view s,
                               size_t off,
                               size_t n,
                               size_t &stepped) {
  stepped = 0;
  while (stepped < n && off < s.size()) {
    off += Utf8_CharLength(s, off);
    stepped++;
  }

  return off;
}
