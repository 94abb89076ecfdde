#include "classify.hpp"

#include <Tracy.hpp>

#include "data.hpp"
#include "utf8.hpp"

bool Text_IsNonTextByte(unsigned char byte) {
  if (byte == 0) {
    return true;
  }

  if (Utf8_IsContinuation(byte)) {
    return true;
  }

  return byte < 0x20 && byte != '\t' && byte != '\n' && byte != '\r';
}

bool Text_ClassifySample(std::string_view sample) {
  if (sample.empty()) {
    return true;
  }

  size_t numNonText = 0;
  for (auto ch : sample) {
    if (Text_IsNonTextByte((unsigned char)ch)) {
      numNonText++;
    }
  }

  // numNonText / size < 0.1
  return numNonText * 10 < sample.size();
}

bool Text_LooksLikeText(LineReader &reader, std::string *err) {
  ZoneScoped;
  std::string_view sample;
  auto rc = reader.Peek(sample, SIZ_SAMPLE_TEXT, err);
  reader.Rewind();

  if (rc != LineRead_OK) {
    return false;
  }

  return Text_ClassifySample(sample);
}
