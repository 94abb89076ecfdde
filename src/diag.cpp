#include "diag.hpp"

#include <fmt/core.h>

void WarningLog::Push(const std::string &path, const std::string &message) {
  if (echo != nullptr) {
    fmt::print(echo, "snipgrep: {}: {}\n", path, message);
  }

  entries.push_back({path, message});
}
