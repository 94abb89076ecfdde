#pragma once

#include <optional>
#include <string>
#include <vector>

#include "data.hpp"
#include "diag.hpp"
#include "pattern.hpp"

// Resolves the search roots into the list of files to scan. Problems with a
// single root or entry go to `warnings` and that entry is skipped; the
// collection itself never fails.
//
// Directory entries are visited in byte-wise name order, depth-first when
// `recursive` is set. Results follow the order of `roots`.
std::vector<FileCandidate> Collect_Files(
    const std::vector<std::string> &roots,
    bool recursive,
    const std::optional<PathMatcher> &include,
    const std::optional<PathMatcher> &exclude,
    WarningLog &warnings);
