#include "output.hpp"

#include <fmt/core.h>

bool Output_ShowFilename(size_t numFiles, bool hideFilename) {
  return numFiles > 1 && !hideFilename;
}

std::string Output_FormatMatch(const MatchRecord &record,
                               bool showFilename,
                               bool showLineNo) {
  std::string ret;
  if (showFilename) {
    ret += fmt::format("{}:", record.path);
  }
  if (showLineNo) {
    ret += fmt::format("{}:", record.lineNo);
  }
  ret += record.excerpt;
  return ret;
}

void Output_PrintMatch(FILE *out,
                       const MatchRecord &record,
                       bool showFilename,
                       bool showLineNo) {
  fmt::print(out, "{}\n", Output_FormatMatch(record, showFilename, showLineNo));
}

std::string Output_FormatSummary(const SearchSummary &summary) {
  if (summary.numFailed == 0) {
    return std::string();
  }

  return fmt::format("{} of {} file(s) could not be read",
                     summary.numFailed,
                     summary.numScanned + summary.numSkippedBinary +
                         summary.numFailed);
}
