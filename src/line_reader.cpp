#include "line_reader.hpp"

#include <algorithm>
#include <cstring>

#include <Tracy.hpp>

LineReader::LineReader(size_t sizBuffer)
    : sizBuffer(std::max<size_t>(sizBuffer, 2)) {}

LineReader::~LineReader() {
  if (file != nullptr) {
    Mmap_Unmap(file);
    Mmap_Close(file);
  }
}

LineReadStatus LineReader::Open(const std::string &path, std::string *err) {
  if (file != nullptr) {
    if (err) {
      *err = "reader already open";
    }
    return LineRead_Error;
  }

  if (Mmap_Open(file, path, err) != Mmap_OK) {
    file = nullptr;
    return LineRead_Error;
  }

  offCursor = 0;
  return LineRead_OK;
}

LineReadStatus LineReader::MapWindow(size_t offset,
                                     size_t len,
                                     std::string *err) {
  ZoneScoped;
  Mmap_Unmap(file);
  bufWindow = nullptr;
  offWindow = offset;
  lenWindow = 0;

  if (Mmap_Map(bufWindow, lenWindow, file, offset, len, err) != Mmap_OK) {
    bufWindow = nullptr;
    lenWindow = 0;
    return LineRead_Error;
  }

  return LineRead_OK;
}

LineReadStatus LineReader::Peek(std::string_view &out,
                                size_t n,
                                std::string *err) {
  if (file == nullptr) {
    if (err) {
      *err = "reader not open";
    }
    return LineRead_Error;
  }

  auto len = std::min(n, Size());
  auto rc = MapWindow(0, len, err);
  if (rc != LineRead_OK) {
    return rc;
  }

  out = std::string_view(bufWindow, lenWindow);
  return LineRead_OK;
}

LineReadStatus LineReader::ReadFragment(std::string_view &fragment,
                                        bool &isPrefix,
                                        std::string *err) {
  if (file == nullptr) {
    if (err) {
      *err = "reader not open";
    }
    return LineRead_Error;
  }

  const auto size = Size();
  if (offCursor >= size) {
    return LineRead_EOF;
  }

  const auto offReachable = std::min(size, offCursor + sizBuffer);
  auto offWindowEnd = offWindow + lenWindow;

  // Remap when the cursor left the window, or when the window ends short of
  // what one fragment may span
  if (bufWindow == nullptr || offCursor < offWindow ||
      offWindowEnd <= offCursor) {
    auto rc = MapWindow(offCursor, offReachable - offCursor, err);
    if (rc != LineRead_OK) {
      return rc;
    }
    offWindowEnd = offWindow + lenWindow;
  }

  auto offLimit = std::min(offWindowEnd, offReachable);
  const char *pStart = bufWindow + (offCursor - offWindow);
  auto *pNewline = (const char *)std::memchr(pStart, '\n', offLimit - offCursor);

  if (pNewline == nullptr && offLimit < offReachable) {
    auto rc = MapWindow(offCursor, offReachable - offCursor, err);
    if (rc != LineRead_OK) {
      return rc;
    }
    offLimit = offWindow + lenWindow;
    pStart = bufWindow;
    pNewline = (const char *)std::memchr(pStart, '\n', offLimit - offCursor);
  }

  if (pNewline != nullptr) {
    size_t len = pNewline - pStart;
    offCursor += len + 1;
    if (len > 0 && pStart[len - 1] == '\r') {
      len--;
    }
    fragment = std::string_view(pStart, len);
    isPrefix = false;
    return LineRead_OK;
  }

  size_t len = offLimit - offCursor;
  if (offLimit == size) {
    // Last line, no terminator
    fragment = std::string_view(pStart, len);
    offCursor = size;
    isPrefix = false;
    return LineRead_OK;
  }

  // Buffer full. A trailing '\r' may belong to a "\r\n" in the next window.
  if (len > 1 && pStart[len - 1] == '\r') {
    len--;
  }
  fragment = std::string_view(pStart, len);
  offCursor += len;
  isPrefix = true;
  return LineRead_OK;
}
