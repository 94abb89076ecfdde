#pragma once

#include <cstddef>
#include <string>
#include <string_view>

// Builds the excerpt shown for the match [offStart, offEnd) of `line`.
//
// First `contextChars` characters are kept on each side of the match, with an
// ellipsis wherever the line continues past the window. If that is still
// longer than `maxChars`, it is cut again around the match alone: what is left
// of `maxChars` after the match is split evenly before and after it, and each
// cut side gets an ellipsis. Ellipses added by the second cut are not counted
// against `maxChars`.
//
// Lengths are counted in characters and cuts never fall inside a UTF-8
// sequence; the byte offsets are widened to whole characters first. A match
// longer than `maxChars` is itself cut to `maxChars` characters.
std::string Context_Extract(std::string_view line,
                            size_t offStart,
                            size_t offEnd,
                            size_t maxChars,
                            size_t contextChars);
