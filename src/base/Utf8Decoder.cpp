#include "Utf8Decoder.hpp"

namespace pe {
namespace {
const char* REPLACEMENT_CHARACTER = "\xEF\xBF\xBD";

// Expected length of the sequence introduced by a lead byte, 0 if invalid.
int sequenceLength(unsigned char lead) {
  if (lead < 0x80) return 1;
  if (lead >= 0xC2 && lead <= 0xDF) return 2;
  if (lead >= 0xE0 && lead <= 0xEF) return 3;
  if (lead >= 0xF0 && lead <= 0xF4) return 4;
  return 0;
}

bool validContinuation(unsigned char lead, int position, unsigned char c) {
  if (position == 1) {
    // Reject overlong encodings, surrogates and code points above U+10FFFF
    if (lead == 0xE0) return c >= 0xA0 && c <= 0xBF;
    if (lead == 0xED) return c >= 0x80 && c <= 0x9F;
    if (lead == 0xF0) return c >= 0x90 && c <= 0xBF;
    if (lead == 0xF4) return c >= 0x80 && c <= 0x8F;
  }
  return c >= 0x80 && c <= 0xBF;
}
}  // namespace

Utf8Decoder::Utf8Decoder(const string& errors) : strict(errors != "replace") {}

string Utf8Decoder::invalid(const string& context) {
  if (strict) {
    throw DecodeError("Invalid UTF-8 in child output " + context);
  }
  return REPLACEMENT_CHARACTER;
}

string Utf8Decoder::decode(const string& bytes) {
  string input = tail + bytes;
  tail.clear();

  string output;
  output.reserve(input.size());
  size_t i = 0;
  while (i < input.size()) {
    unsigned char lead = (unsigned char)input[i];
    int length = sequenceLength(lead);
    if (length == 0) {
      output += invalid("(bad lead byte)");
      i++;
      continue;
    }
    int available = 1;
    bool ok = true;
    while (available < length && i + available < input.size()) {
      if (!validContinuation(lead, available,
                             (unsigned char)input[i + available])) {
        ok = false;
        break;
      }
      available++;
    }
    if (!ok) {
      // One replacement for the lead and the continuations that fit it
      output += invalid("(bad continuation byte)");
      i += available;
      continue;
    }
    if (available < length) {
      // Incomplete but so far valid, wait for the rest
      tail = input.substr(i);
      break;
    }
    output.append(input, i, length);
    i += length;
  }
  return output;
}

string Utf8Decoder::flush() {
  if (tail.empty()) {
    return "";
  }
  tail.clear();
  return invalid("(truncated sequence at end of stream)");
}
}  // namespace pe
