#pragma once

#include <cstdio>
#include <string>

#include "data.hpp"
#include "search.hpp"

// Filenames only add information when more than one file is searched
bool Output_ShowFilename(size_t numFiles, bool hideFilename);

// [path:][line:]excerpt
std::string Output_FormatMatch(const MatchRecord &record,
                               bool showFilename,
                               bool showLineNo);
void Output_PrintMatch(FILE *out,
                       const MatchRecord &record,
                       bool showFilename,
                       bool showLineNo);

// Trailer for stderr; empty when every file could be read
std::string Output_FormatSummary(const SearchSummary &summary);
