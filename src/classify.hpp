#pragma once

#include <string>
#include <string_view>

#include "line_reader.hpp"

// Byte counts as non-text: NUL, a UTF-8 continuation byte, or a control byte
// other than \t \n \r
bool Text_IsNonTextByte(unsigned char byte);

// Below 10% non-text bytes is text; an empty sample is text
bool Text_ClassifySample(std::string_view sample);

// Samples the first SIZ_SAMPLE_TEXT bytes and rewinds the reader. A sample
// that can't be read is not text.
bool Text_LooksLikeText(LineReader &reader, std::string *err = nullptr);
