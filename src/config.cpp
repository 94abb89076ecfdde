#include "config.hpp"

#include <fmt/core.h>

static std::optional<PathMatcher> MakeFilter(const std::string &glob,
                                             const char *name,
                                             bool &ok,
                                             const Pattern_PfnError &onError) {
  ok = true;
  if (glob.empty()) {
    return std::nullopt;
  }

  auto ret = PathMatcher::Make(glob, [&](const std::string &err) {
    onError(fmt::format("invalid {} pattern '{}': {}", name, glob, err));
  });
  ok = ret.has_value();
  return ret;
}

std::optional<SearchConfig> Config_Build(const GrepRequest &request,
                                         SearchStatus &status,
                                         const Pattern_PfnError &onError) {
  if (request.maxChars < 0) {
    status = Search_BadArgument;
    onError(fmt::format("max-chars must not be negative, got {}",
                        request.maxChars));
    return std::nullopt;
  }

  if (request.contextChars < 0) {
    status = Search_BadArgument;
    onError(fmt::format("context must not be negative, got {}",
                        request.contextChars));
    return std::nullopt;
  }

  if (request.sizReadBuffer == 0) {
    status = Search_BadArgument;
    onError("read buffer size must be positive");
    return std::nullopt;
  }

  auto pattern = Matcher::Make(
      request.pattern, request.ignoreCase, [&](const std::string &err) {
        onError(fmt::format("invalid regular expression '{}': {}",
                            request.pattern, err));
      });
  if (!pattern) {
    status = Search_BadPattern;
    return std::nullopt;
  }

  bool ok;
  auto include = MakeFilter(request.patternInclude, "include", ok, onError);
  if (!ok) {
    status = Search_BadFilenamePattern;
    return std::nullopt;
  }

  auto exclude = MakeFilter(request.patternExclude, "exclude", ok, onError);
  if (!ok) {
    status = Search_BadFilenamePattern;
    return std::nullopt;
  }

  std::optional<SearchConfig> ret(std::in_place, std::move(*pattern));
  ret->recursive = request.recursive;
  ret->ignoreCase = request.ignoreCase;
  ret->include = std::move(include);
  ret->exclude = std::move(exclude);
  ret->maxChars = size_t(request.maxChars);
  ret->contextChars = size_t(request.contextChars);
  ret->textOnly = request.textOnly;
  ret->sizReadBuffer = request.sizReadBuffer;

  status = Search_OK;
  return ret;
}
