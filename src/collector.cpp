#include "collector.hpp"

#include <algorithm>
#include <filesystem>

#include <fmt/core.h>

#include <Tracy.hpp>

namespace fs = std::filesystem;

struct CollectState {
  const std::optional<PathMatcher> &include;
  const std::optional<PathMatcher> &exclude;
  WarningLog &warnings;
  std::vector<FileCandidate> files;
};

static void AddCandidate(CollectState &S,
                         const fs::path &path,
                         uintmax_t size) {
  if (!Pattern_AcceptFilename(path.filename().u8string(), S.include,
                              S.exclude)) {
    return;
  }

  FileCandidate file;
  file.path = path.u8string();
  file.size = size;
  S.files.push_back(std::move(file));
}

// Reads every entry of `dir` sorted by name. Entries read before an error are
// kept, the rest of the directory is skipped.
static std::vector<fs::directory_entry> ListDirectory(CollectState &S,
                                                      const fs::path &dir) {
  std::vector<fs::directory_entry> entries;

  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if (ec) {
    S.warnings.Push(dir.u8string(),
                    fmt::format("cannot read directory: {}", ec.message()));
    return entries;
  }

  while (it != fs::directory_iterator()) {
    entries.push_back(*it);
    it.increment(ec);
    if (ec) {
      S.warnings.Push(dir.u8string(),
                      fmt::format("cannot read directory: {}", ec.message()));
      break;
    }
  }

  std::sort(entries.begin(), entries.end(),
            [](const fs::directory_entry &lhs, const fs::directory_entry &rhs) {
              return lhs.path().filename().native() <
                     rhs.path().filename().native();
            });

  return entries;
}

static void WalkDirectory(CollectState &S,
                          const fs::path &dir,
                          bool recursive) {
  ZoneScoped;
  for (auto &entry : ListDirectory(S, dir)) {
    std::error_code ec;
    auto linkStatus = entry.symlink_status(ec);
    if (ec) {
      S.warnings.Push(entry.path().u8string(), ec.message());
      continue;
    }

    if (fs::is_directory(linkStatus)) {
      if (recursive) {
        WalkDirectory(S, entry.path(), recursive);
      }
      continue;
    }

    // Symlinks count when they lead to a regular file; linked directories
    // are not entered
    auto status = linkStatus;
    if (fs::is_symlink(linkStatus)) {
      status = entry.status(ec);
      if (ec || !fs::exists(status)) {
        auto reason =
            ec ? ec.message() : std::string("no such file or directory");
        S.warnings.Push(entry.path().u8string(),
                        fmt::format("cannot resolve link: {}", reason));
        continue;
      }
    }

    if (!fs::is_regular_file(status)) {
      continue;
    }

    auto size = entry.file_size(ec);
    if (ec) {
      size = 0;
    }

    AddCandidate(S, entry.path().lexically_normal(), size);
  }
}

std::vector<FileCandidate> Collect_Files(
    const std::vector<std::string> &roots,
    bool recursive,
    const std::optional<PathMatcher> &include,
    const std::optional<PathMatcher> &exclude,
    WarningLog &warnings) {
  ZoneScoped;
  CollectState S{include, exclude, warnings, {}};

  for (auto &root : roots) {
    auto pathRoot = fs::u8path(root);

    std::error_code ec;
    auto status = fs::status(pathRoot, ec);
    if (ec || !fs::exists(status)) {
      auto reason = ec ? ec.message() : std::string("no such file or directory");
      warnings.Push(root, fmt::format("cannot access path: {}", reason));
      continue;
    }

    if (fs::is_directory(status)) {
      WalkDirectory(S, pathRoot, recursive);
    } else if (fs::is_regular_file(status)) {
      auto size = fs::file_size(pathRoot, ec);
      if (ec) {
        size = 0;
      }

      // The root is reported as given, only its name is filtered
      if (Pattern_AcceptFilename(pathRoot.filename().u8string(), include,
                                 exclude)) {
        S.files.push_back({root, size});
      }
    } else {
      warnings.Push(root, "not a regular file or directory");
    }
  }

  return std::move(S.files);
}
