#pragma once

#include <cstdio>
#include <string>
#include <vector>

struct Warning {
  std::string path;
  std::string message;
};

// Per-path problems that don't stop the run. Entries are always kept;
// `echo` additionally prints each one as it arrives.
struct WarningLog {
  std::vector<Warning> entries;
  FILE *echo = nullptr;

  void Push(const std::string &path, const std::string &message);
  bool Empty() const { return entries.empty(); }
};
