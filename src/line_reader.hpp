#pragma once

#include <string>
#include <string_view>

#include "mmap.hpp"

enum LineReadStatus {
  LineRead_OK,
  LineRead_EOF,
  LineRead_Error,
};

// Hands out raw line fragments from read-only windows of a file. A window
// never exceeds `sizBuffer` bytes; a longer line comes out as several
// fragments, all but the last flagged as prefixes.
struct LineReader {
  explicit LineReader(size_t sizBuffer);
  LineReader(const LineReader &) = delete;
  LineReader &operator=(const LineReader &) = delete;
  ~LineReader();

  LineReadStatus Open(const std::string &path, std::string *err = nullptr);

  // Up to `n` bytes from the start of the file; the cursor doesn't move
  LineReadStatus Peek(std::string_view &out, size_t n, std::string *err = nullptr);

  // The returned view stays valid until the next Peek or ReadFragment
  LineReadStatus ReadFragment(std::string_view &fragment,
                              bool &isPrefix,
                              std::string *err = nullptr);

  void Rewind() { offCursor = 0; }
  size_t Size() const { return Mmap_Size(file); }

 private:
  LineReadStatus MapWindow(size_t offset, size_t len, std::string *err);

  MemoryMapHandle file = nullptr;
  size_t sizBuffer;

  const char *bufWindow = nullptr;
  size_t offWindow = 0;
  size_t lenWindow = 0;

  size_t offCursor = 0;
};
