#include "search.hpp"

#include <fmt/core.h>

#include <Tracy.hpp>

#include "classify.hpp"
#include "context.hpp"
#include "line_reader.hpp"

bool LineAssembler::Push(std::string_view fragment,
                         bool isPrefix,
                         std::string_view &line) {
  if (isPrefix) {
    buf.append(fragment);
    return false;
  }

  if (buf.empty()) {
    // Common case, the line never left the reader's window
    line = fragment;
  } else {
    buf.append(fragment);
    line = buf;
  }

  return true;
}

FileOutcome Search_File(const SearchConfig &config,
                        const FileCandidate &file,
                        WarningLog &warnings,
                        const Search_PfnEmit &emit) {
  ZoneScoped;
  ZoneText(file.path.c_str(), file.path.size());

  std::string err;
  LineReader reader(config.sizReadBuffer);
  if (reader.Open(file.path, &err) != LineRead_OK) {
    warnings.Push(file.path, fmt::format("cannot open file: {}", err));
    return File_OpenFailed;
  }

  if (config.textOnly && !Text_LooksLikeText(reader, &err)) {
    if (!err.empty()) {
      warnings.Push(file.path, fmt::format("cannot read file: {}", err));
      return File_ReadFailed;
    }
    return File_SkippedBinary;
  }

  auto scratch = config.pattern.NewMatchData();
  std::vector<MatchSpan> spans;
  LineAssembler assembler;
  size_t lineNo = 0;

  while (true) {
    std::string_view fragment;
    bool isPrefix = false;
    auto rc = reader.ReadFragment(fragment, isPrefix, &err);
    if (rc == LineRead_EOF) {
      break;
    }

    if (rc == LineRead_Error) {
      warnings.Push(file.path, fmt::format("read error: {}", err));
      return File_ReadFailed;
    }

    std::string_view line;
    if (!assembler.Push(fragment, isPrefix, line)) {
      continue;
    }

    lineNo++;

    if (config.pattern.FindAll(line, scratch, spans, &err) != Match_OK) {
      warnings.Push(file.path,
                    fmt::format("match error on line {}: {}", lineNo, err));
    } else {
      for (auto &span : spans) {
        MatchRecord record;
        record.path = file.path;
        record.lineNo = lineNo;
        record.excerpt = Context_Extract(line, span.offStart, span.offEnd,
                                         config.maxChars, config.contextChars);
        emit(record);
      }
    }

    assembler.Reset();
  }

  return File_Scanned;
}

SearchSummary Search_Files(const SearchConfig &config,
                           const std::vector<FileCandidate> &files,
                           WarningLog &warnings,
                           const Search_PfnEmit &emit) {
  ZoneScoped;
  SearchSummary summary;

  auto counting = [&](const MatchRecord &record) {
    summary.numMatches++;
    emit(record);
  };

  for (auto &file : files) {
    switch (Search_File(config, file, warnings, counting)) {
      case File_Scanned:
        summary.numScanned++;
        break;
      case File_SkippedBinary:
        summary.numSkippedBinary++;
        break;
      case File_OpenFailed:
      case File_ReadFailed:
        summary.numFailed++;
        break;
    }
  }

  return summary;
}
