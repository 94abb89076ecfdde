#pragma once

#define PCRE2_CODE_UNIT_WIDTH 8
#include <pcre2.h>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "data.hpp"

using Pattern_PfnError = std::function<void(const std::string &err)>;

enum MatchStatus {
  Match_OK,
  Match_Failure,
};

// Scratch space for one scan; not shared between files
struct MatchData {
  pcre2_match_data *matchData = nullptr;

  explicit MatchData(pcre2_match_data *matchData) : matchData(matchData) {}
  MatchData(const MatchData &) = delete;
  MatchData(MatchData &&other) : matchData(nullptr) {
    std::swap(matchData, other.matchData);
  }
  ~MatchData() { pcre2_match_data_free(matchData); }
};

struct Matcher {
  pcre2_code *code = nullptr;

  explicit Matcher(pcre2_code *code) : code(code) {}

  Matcher(const Matcher &) = delete;
  Matcher &operator=(const Matcher &) = delete;
  Matcher(Matcher &&other) : code(nullptr) { std::swap(code, other.code); }
  Matcher &operator=(Matcher &&other) {
    std::swap(code, other.code);
    return *this;
  }

  ~Matcher() { pcre2_code_free(code); }

  MatchData NewMatchData() const;

  // Every non-overlapping match in `subject`, leftmost first. An empty match
  // abutting the previous match is dropped.
  MatchStatus FindAll(std::string_view subject,
                      MatchData &scratch,
                      std::vector<MatchSpan> &out,
                      std::string *err = nullptr) const;

  static std::optional<Matcher> Make(const std::string &pattern,
                                     bool ignoreCase,
                                     const Pattern_PfnError &onError);
};

struct PathMatcher {
  pcre2_code *code = nullptr;
  // Reused by every Matches call
  pcre2_match_data *matchData = nullptr;

  PathMatcher(pcre2_code *code, pcre2_match_data *matchData)
      : code(code), matchData(matchData) {}

  PathMatcher(const PathMatcher &) = delete;
  PathMatcher &operator=(const PathMatcher &) = delete;
  PathMatcher(PathMatcher &&other) : code(nullptr), matchData(nullptr) {
    std::swap(code, other.code);
    std::swap(matchData, other.matchData);
  }
  PathMatcher &operator=(PathMatcher &&other) {
    std::swap(code, other.code);
    std::swap(matchData, other.matchData);
    return *this;
  }

  ~PathMatcher() {
    pcre2_match_data_free(matchData);
    pcre2_code_free(code);
  }

  // Tests a bare filename, never a full path
  bool Matches(std::string_view filename) const;

  static std::optional<PathMatcher> Make(const std::string &glob,
                                         const Pattern_PfnError &onError);
};

// "(?i)" + pattern when folding case
std::string Pattern_Prepare(const std::string &pattern, bool ignoreCase);

// *.go -> ^.*\.go$
std::string Pattern_GlobToRegex(const std::string &glob);

// Exclude wins over include; an absent include accepts everything
bool Pattern_AcceptFilename(std::string_view filename,
                            const std::optional<PathMatcher> &include,
                            const std::optional<PathMatcher> &exclude);
