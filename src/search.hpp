#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "config.hpp"
#include "data.hpp"
#include "diag.hpp"

enum FileOutcome {
  File_Scanned,
  File_SkippedBinary,
  File_OpenFailed,
  File_ReadFailed,
};

struct SearchSummary {
  size_t numScanned = 0;
  size_t numSkippedBinary = 0;
  size_t numFailed = 0;
  size_t numMatches = 0;
};

using Search_PfnEmit = std::function<void(const MatchRecord &record)>;

// Joins reader fragments back into logical lines
struct LineAssembler {
  std::string buf;

  // True once `line` holds a whole line. The view may point into `buf` and
  // lives until the next Push or Reset.
  bool Push(std::string_view fragment, bool isPrefix, std::string_view &line);
  void Reset() { buf.clear(); }
};

// Scans one file and emits a record per match, in line order. A file that
// fails midway keeps the records already emitted.
FileOutcome Search_File(const SearchConfig &config,
                        const FileCandidate &file,
                        WarningLog &warnings,
                        const Search_PfnEmit &emit);

// Scans `files` one after the other
SearchSummary Search_Files(const SearchConfig &config,
                           const std::vector<FileCandidate> &files,
                           WarningLog &warnings,
                           const Search_PfnEmit &emit);
