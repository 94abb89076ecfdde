#include "pattern.hpp"

#include <fmt/core.h>

#include <Tracy.hpp>

#include "utf8.hpp"

enum {
  LEN_BUF_ERROR_MESSAGE = 256,
};

static constexpr uint32_t PATTERN_COMPILE_FLAGS =
    PCRE2_UTF | PCRE2_MATCH_INVALID_UTF | PCRE2_DOLLAR_ENDONLY;

static std::string GetErrorMessage(int rc) {
  PCRE2_UCHAR8 buffer[LEN_BUF_ERROR_MESSAGE];
  if (pcre2_get_error_message(rc, buffer, LEN_BUF_ERROR_MESSAGE) < 0) {
    return fmt::format("PCRE2 error {}", rc);
  }
  return std::string((const char *)buffer);
}

static pcre2_code *Compile(const std::string &pattern,
                           const Pattern_PfnError &onError) {
  int rc;
  PCRE2_SIZE offError;
  auto code = pcre2_compile((PCRE2_SPTR8)pattern.c_str(), pattern.size(),
                            PATTERN_COMPILE_FLAGS, &rc, &offError, nullptr);

  if (code == nullptr) {
    onError(fmt::format("{} at offset {}", GetErrorMessage(rc), offError));
    return nullptr;
  }

  return code;
}

static int pcre2_match_w(const pcre2_code_8 *code,
                         std::string_view subject,
                         size_t offset,
                         pcre2_match_data_8 *matchData) {
  return pcre2_match(code, (PCRE2_SPTR8)subject.data(), subject.size(), offset,
                     0, matchData, nullptr);
}

std::string Pattern_Prepare(const std::string &pattern, bool ignoreCase) {
  if (ignoreCase) {
    return "(?i)" + pattern;
  }
  return pattern;
}

std::string Pattern_GlobToRegex(const std::string &glob) {
  std::string ret;
  ret.reserve(glob.size() + 8);
  ret += '^';
  for (auto ch : glob) {
    switch (ch) {
      case '.':
        ret += "\\.";
        break;
      case '*':
        ret += ".*";
        break;
      case '?':
        ret += '.';
        break;
      default:
        ret += ch;
        break;
    }
  }
  ret += '$';
  return ret;
}

bool Pattern_AcceptFilename(std::string_view filename,
                            const std::optional<PathMatcher> &include,
                            const std::optional<PathMatcher> &exclude) {
  if (exclude && exclude->Matches(filename)) {
    return false;
  }

  if (include && !include->Matches(filename)) {
    return false;
  }

  return true;
}

MatchData Matcher::NewMatchData() const {
  return MatchData(pcre2_match_data_create_from_pattern(code, nullptr));
}

MatchStatus Matcher::FindAll(std::string_view subject,
                             MatchData &scratch,
                             std::vector<MatchSpan> &out,
                             std::string *err) const {
  ZoneScoped;
  out.clear();

  if (scratch.matchData == nullptr) {
    if (err) {
      *err = "no match data";
    }
    return Match_Failure;
  }

  size_t offset = 0;
  bool hasPrevious = false;
  size_t offPrevEnd = 0;

  while (offset <= subject.size()) {
    auto rc = pcre2_match_w(code, subject, offset, scratch.matchData);
    if (rc == PCRE2_ERROR_NOMATCH) {
      break;
    }

    if (rc < 0) {
      if (err) {
        *err = GetErrorMessage(rc);
      }
      return Match_Failure;
    }

    auto ovector = pcre2_get_ovector_pointer(scratch.matchData);
    MatchSpan m = {ovector[0], ovector[1]};
    if (m.offStart > m.offEnd) {
      // \K inside a lookaround can report a start past the end
      m.offStart = m.offEnd;
    }

    bool accept = true;
    if (m.offEnd == offset) {
      // Empty match; never directly after the previous one
      if (hasPrevious && m.offStart == offPrevEnd) {
        accept = false;
      }

      if (offset < subject.size()) {
        offset += Utf8_CharLength(subject, offset);
      } else {
        offset += 1;
      }
    } else {
      offset = m.offEnd;
    }

    hasPrevious = true;
    offPrevEnd = m.offEnd;

    if (accept) {
      out.push_back(m);
    }
  }

  return Match_OK;
}

std::optional<Matcher> Matcher::Make(const std::string &pattern,
                                     bool ignoreCase,
                                     const Pattern_PfnError &onError) {
  auto code = Compile(Pattern_Prepare(pattern, ignoreCase), onError);
  if (code == nullptr) {
    return std::nullopt;
  }

  return std::optional<Matcher>(Matcher(code));
}

bool PathMatcher::Matches(std::string_view filename) const {
  int rc = pcre2_match_w(code, filename, 0, matchData);
  if (rc < 0) {
    switch (rc) {
      case PCRE2_ERROR_NOMATCH:
        break;
      default:
        fmt::print(stderr, "Filename match error {}\n", GetErrorMessage(rc));
        break;
    }
    return false;
  }

  return true;
}

std::optional<PathMatcher> PathMatcher::Make(const std::string &glob,
                                             const Pattern_PfnError &onError) {
  auto code = Compile(Pattern_GlobToRegex(glob), onError);
  if (code == nullptr) {
    return std::nullopt;
  }

  auto matchData = pcre2_match_data_create_from_pattern(code, nullptr);
  if (matchData == nullptr) {
    pcre2_code_free(code);
    onError("cannot allocate match data");
    return std::nullopt;
  }

  return std::optional<PathMatcher>(PathMatcher(code, matchData));
}
