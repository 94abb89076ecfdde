#include "context.hpp"

#include <algorithm>
#include <cstddef>

#include "utf8.hpp"

static size_t CountChars(std::string_view s, size_t offStart, size_t offEnd) {
  size_t ret = 0;
  auto off = offStart;
  while (off < offEnd) {
    off += Utf8_CharLength(s, off);
    ret++;
  }
  return ret;
}

std::string Context_Extract(std::string_view line,
                            size_t offStart,
                            size_t offEnd,
                            size_t maxChars,
                            size_t contextChars) {
  offStart = Utf8_AlignBack(line, std::min(offStart, line.size()));
  offEnd = Utf8_AlignForward(line, std::clamp(offEnd, offStart, line.size()));

  // Stage 1: the context window
  size_t numBefore, numAfter;
  auto offWindowStart = Utf8_StepBack(line, offStart, contextChars, numBefore);
  auto offWindowEnd = Utf8_StepForward(line, offEnd, contextChars, numAfter);
  auto numMatch = CountChars(line, offStart, offEnd);

  const bool hasLeading = offWindowStart > 0;
  const bool hasTrailing = offWindowEnd < line.size();

  // Unit layout of the window: […] before, match, after […]
  const ptrdiff_t idxMatchStart = (hasLeading ? 1 : 0) + ptrdiff_t(numBefore);
  const ptrdiff_t idxMatchEnd = idxMatchStart + ptrdiff_t(numMatch);
  const ptrdiff_t numUnits =
      idxMatchEnd + ptrdiff_t(numAfter) + (hasTrailing ? 1 : 0);

  std::string ret;
  if (size_t(numUnits) <= maxChars) {
    ret.reserve(offWindowEnd - offWindowStart + 2 * LEN_ELLIPSIS);
    if (hasLeading) {
      ret += ELLIPSIS;
    }
    ret.append(line.substr(offWindowStart, offWindowEnd - offWindowStart));
    if (hasTrailing) {
      ret += ELLIPSIS;
    }
    return ret;
  }

  // Stage 2: cap the window around the match itself
  const ptrdiff_t available = ptrdiff_t(maxChars) - ptrdiff_t(numMatch);
  const ptrdiff_t before = available / 2;
  const ptrdiff_t after = available - before;

  auto idxTrimStart = std::clamp<ptrdiff_t>(idxMatchStart - before, 0, numUnits);
  auto idxTrimEnd =
      std::clamp<ptrdiff_t>(idxMatchEnd + after, idxTrimStart, numUnits);

  // Map unit indices back onto the line; the window's own ellipses are the
  // first and last unit
  const ptrdiff_t idxFirstChar = hasLeading ? 1 : 0;
  const ptrdiff_t numChars = ptrdiff_t(numBefore + numMatch + numAfter);
  bool keepLeading = hasLeading && idxTrimStart == 0;
  bool keepTrailing = hasTrailing && idxTrimEnd == numUnits;

  auto numSkip = std::clamp<ptrdiff_t>(idxTrimStart - idxFirstChar, 0, numChars);
  auto numTake =
      std::clamp<ptrdiff_t>(idxTrimEnd - idxFirstChar, numSkip, numChars) -
      numSkip;

  size_t stepped;
  auto offSliceStart = Utf8_StepForward(line, offWindowStart, numSkip, stepped);
  auto offSliceEnd = Utf8_StepForward(line, offSliceStart, numTake, stepped);

  if (idxTrimStart > 0) {
    ret += ELLIPSIS;
  }
  if (keepLeading) {
    ret += ELLIPSIS;
  }
  ret.append(line.substr(offSliceStart, offSliceEnd - offSliceStart));
  if (keepTrailing) {
    ret += ELLIPSIS;
  }
  if (idxTrimEnd < numUnits) {
    ret += ELLIPSIS;
  }

  return ret;
}
