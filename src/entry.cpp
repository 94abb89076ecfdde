#include <getopt.h>

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <string>

#include <fmt/core.h>

#include "collector.hpp"
#include "config.hpp"
#include "data.hpp"
#include "diag.hpp"
#include "mmap.hpp"
#include "output.hpp"
#include "search.hpp"

#if !defined(SNIPGREP_VERSION)
#define SNIPGREP_VERSION "unknown"
#endif

enum {
  EXIT_RUN = 0,
  EXIT_ERROR = 1,
};

enum {
  OPT_NO_RECURSIVE = 256,
  OPT_INCLUDE,
  OPT_EXCLUDE,
  OPT_MAX_CHARS,
  OPT_CONTEXT,
  OPT_TEXT_ONLY,
  OPT_HELP,
  OPT_VERSION,
};

static const struct option long_options[] = {
    // name, has_arg, *flag, val
    {"no-recursive", no_argument, nullptr, OPT_NO_RECURSIVE},
    {"ignore-case", no_argument, nullptr, 'i'},
    {"line-number", no_argument, nullptr, 'n'},
    {"no-filename", no_argument, nullptr, 'h'},
    {"include", required_argument, nullptr, OPT_INCLUDE},
    {"exclude", required_argument, nullptr, OPT_EXCLUDE},
    {"max-chars", required_argument, nullptr, OPT_MAX_CHARS},
    {"context", required_argument, nullptr, OPT_CONTEXT},
    {"text-only", optional_argument, nullptr, OPT_TEXT_ONLY},
    {"binary", no_argument, nullptr, 'a'},
    {"help", no_argument, nullptr, OPT_HELP},
    {"version", no_argument, nullptr, OPT_VERSION},
    {nullptr, 0, nullptr, 0},
};

static void PrintUsage(FILE *out, const char *argv0) {
  fmt::print(out, "Usage: {} [OPTION...] PATTERN [PATH...]\n\n", argv0);
  fmt::print(out,
             "Options:\n"
             "  -i, --ignore-case       ignore case distinctions in PATTERN\n"
             "  -n, --line-number       prefix each match with its line number\n"
             "  -h, --no-filename       never prefix matches with the file name\n"
             "      --no-recursive      don't descend into subdirectories\n"
             "      --include=GLOB      only search files whose name matches GLOB\n"
             "      --exclude=GLOB      skip files whose name matches GLOB\n"
             "      --max-chars=N       cap excerpts at N characters (default {})\n"
             "      --context=N         keep N characters around a match (default {})\n"
             "      --text-only[=BOOL]  skip binary files (default true)\n"
             "  -a, --binary            same as --text-only=false\n"
             "      --help              print this help and exit\n"
             "      --version           print the version and exit\n",
             int(NUM_MAX_CHARS_DEFAULT), int(NUM_CONTEXT_CHARS_DEFAULT));
  fmt::print(out,
             "\nBy default directories are searched recursively and only text "
             "files are read.\n");
  fmt::print(out,
             "\nExamples:\n  {0} 'error' src/\n  {0} -n --include='*.go' 'func "
             "main'\n",
             argv0);
}

static bool ParseInt(const char *s, int &out) {
  if (s == nullptr || *s == '\0') {
    return false;
  }

  char *end = nullptr;
  errno = 0;
  long value = std::strtol(s, &end, 10);
  if (errno != 0 || *end != '\0' || value < INT_MIN || value > INT_MAX) {
    return false;
  }

  out = int(value);
  return true;
}

static bool ParseBool(const char *s, bool &out) {
  if (s == nullptr) {
    out = true;
    return true;
  }

  if (!strcmp(s, "true") || !strcmp(s, "1") || !strcmp(s, "yes")) {
    out = true;
    return true;
  }

  if (!strcmp(s, "false") || !strcmp(s, "0") || !strcmp(s, "no")) {
    out = false;
    return true;
  }

  return false;
}

int main(int argc, char **argv) {
  GrepRequest request;

  while (true) {
    int c = getopt_long(argc, argv, "inha", long_options, nullptr);
    if (c == -1) {
      break;
    }

    switch (c) {
      case 'i':
        request.ignoreCase = true;
        break;
      case 'n':
        request.showLineNo = true;
        break;
      case 'h':
        request.hideFilename = true;
        break;
      case 'a':
        request.textOnly = false;
        break;
      case OPT_NO_RECURSIVE:
        request.recursive = false;
        break;
      case OPT_INCLUDE:
        request.patternInclude = optarg;
        break;
      case OPT_EXCLUDE:
        request.patternExclude = optarg;
        break;
      case OPT_MAX_CHARS:
        if (!ParseInt(optarg, request.maxChars)) {
          fmt::print(stderr, "snipgrep: invalid number for --max-chars: '{}'\n",
                     optarg);
          return EXIT_ERROR;
        }
        break;
      case OPT_CONTEXT:
        if (!ParseInt(optarg, request.contextChars)) {
          fmt::print(stderr, "snipgrep: invalid number for --context: '{}'\n",
                     optarg);
          return EXIT_ERROR;
        }
        break;
      case OPT_TEXT_ONLY:
        if (!ParseBool(optarg, request.textOnly)) {
          fmt::print(stderr,
                     "snipgrep: invalid value for --text-only: '{}'. "
                     "Candidates are: true, false\n",
                     optarg);
          return EXIT_ERROR;
        }
        break;
      case OPT_HELP:
        PrintUsage(stdout, argv[0]);
        return EXIT_RUN;
      case OPT_VERSION:
        fmt::print("snipgrep {}\n", SNIPGREP_VERSION);
        return EXIT_RUN;
      default:
        PrintUsage(stderr, argv[0]);
        return EXIT_ERROR;
    }
  }

  if (optind >= argc) {
    PrintUsage(stderr, argv[0]);
    return EXIT_ERROR;
  }

  request.pattern = argv[optind++];
  for (; optind < argc; optind++) {
    request.paths.push_back(argv[optind]);
  }
  if (request.paths.empty()) {
    request.paths.push_back(".");
  }

  SearchStatus status;
  std::string errMsg;
  auto config = Config_Build(request, status,
                             [&](const std::string &err) { errMsg = err; });
  if (!config) {
    fmt::print(stderr, "snipgrep: {}\n", errMsg);
    return EXIT_ERROR;
  }

  WarningLog warnings;
  warnings.echo = stderr;

  auto files = Collect_Files(request.paths, config->recursive, config->include,
                             config->exclude, warnings);
  if (files.empty()) {
    fmt::print("no matching files\n");
    return EXIT_ERROR;
  }

  const bool showFilename =
      Output_ShowFilename(files.size(), request.hideFilename);
  const bool showLineNo = request.showLineNo;

  auto summary =
      Search_Files(*config, files, warnings, [&](const MatchRecord &record) {
        Output_PrintMatch(stdout, record, showFilename, showLineNo);
      });

  auto trailer = Output_FormatSummary(summary);
  if (!trailer.empty()) {
    fmt::print(stderr, "snipgrep: {}\n", trailer);
  }

  if (Mmap_CheckLeaks() != Mmap_OK) {
    return EXIT_ERROR;
  }

  return EXIT_RUN;
}
