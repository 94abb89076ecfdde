#pragma once

#include <optional>

#include "data.hpp"
#include "pattern.hpp"

// Built once by Config_Build and only ever handed out by const reference
struct SearchConfig {
  Matcher pattern;
  bool recursive = true;
  bool ignoreCase = false;
  std::optional<PathMatcher> include;
  std::optional<PathMatcher> exclude;
  size_t maxChars = NUM_MAX_CHARS_DEFAULT;
  size_t contextChars = NUM_CONTEXT_CHARS_DEFAULT;
  bool textOnly = true;
  size_t sizReadBuffer = SIZ_READ_BUFFER_DEFAULT;

  explicit SearchConfig(Matcher &&pattern) : pattern(std::move(pattern)) {}
};

// Compiles the patterns and validates the numeric options. On failure
// `status` says which input was bad and `onError` receives the reason.
std::optional<SearchConfig> Config_Build(const GrepRequest &request,
                                         SearchStatus &status,
                                         const Pattern_PfnError &onError);
