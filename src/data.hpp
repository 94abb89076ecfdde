#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

enum {
  SIZ_SAMPLE_TEXT = 1024,
  SIZ_READ_BUFFER_DEFAULT = 1024 * 1024,
  NUM_MAX_CHARS_DEFAULT = 200,
  NUM_CONTEXT_CHARS_DEFAULT = 20,
};

// Half-open [offStart, offEnd) byte range inside a line
struct MatchSpan {
  size_t offStart;
  size_t offEnd;
};

struct FileCandidate {
  std::string path;
  uintmax_t size = 0;
};

struct MatchRecord {
  std::string path;
  size_t lineNo;  // 1-based
  std::string excerpt;
};

// Raw option values as they come from the command line
struct GrepRequest {
  std::string pattern;
  std::vector<std::string> paths;
  bool recursive = true;
  bool ignoreCase = false;
  std::string patternInclude;
  std::string patternExclude;
  int maxChars = NUM_MAX_CHARS_DEFAULT;
  int contextChars = NUM_CONTEXT_CHARS_DEFAULT;
  bool textOnly = true;
  size_t sizReadBuffer = SIZ_READ_BUFFER_DEFAULT;

  bool showLineNo = false;
  bool hideFilename = false;
};

enum SearchStatus {
  Search_OK = 0,
  Search_BadPattern,
  Search_BadFilenamePattern,
  Search_BadArgument,
};
