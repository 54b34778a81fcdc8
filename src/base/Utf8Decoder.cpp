#include "Utf8Decoder.hpp"

namespace agt {
namespace {
const char REPLACEMENT_CHARACTER[] = "\xEF\xBF\xBD";

// Length of the sequence announced by a lead byte, or 0 if it cannot start one.
int sequenceLength(unsigned char lead) {
  if (lead < 0x80) return 1;
  if (lead >= 0xC2 && lead <= 0xDF) return 2;
  if (lead >= 0xE0 && lead <= 0xEF) return 3;
  if (lead >= 0xF0 && lead <= 0xF4) return 4;
  return 0;
}

// Valid range of the second byte, which excludes overlongs, surrogates and
// code points above U+10FFFF.
bool validSecondByte(unsigned char lead, unsigned char second) {
  switch (lead) {
    case 0xE0:
      return second >= 0xA0 && second <= 0xBF;
    case 0xED:
      return second >= 0x80 && second <= 0x9F;
    case 0xF0:
      return second >= 0x90 && second <= 0xBF;
    case 0xF4:
      return second >= 0x80 && second <= 0x8F;
    default:
      return second >= 0x80 && second <= 0xBF;
  }
}

bool isContinuation(unsigned char c) { return (c & 0xC0) == 0x80; }
}  // namespace

string Utf8Decoder::decode(const char* data, size_t len) {
  string input = pending;
  input.append(data, len);
  pending.clear();

  string out;
  out.reserve(input.size());
  size_t i = 0;
  while (i < input.size()) {
    unsigned char lead = (unsigned char)input[i];
    int needed = sequenceLength(lead);
    if (needed == 0) {
      out.append(REPLACEMENT_CHARACTER);
      i++;
      continue;
    }
    if (needed == 1) {
      out.push_back(input[i]);
      i++;
      continue;
    }

    // Count how many continuation bytes are present and well formed
    int have = 1;
    bool broken = false;
    while (have < needed && i + have < input.size()) {
      unsigned char c = (unsigned char)input[i + have];
      bool ok = (have == 1) ? validSecondByte(lead, c) : isContinuation(c);
      if (!ok) {
        broken = true;
        break;
      }
      have++;
    }

    if (broken) {
      // Replace the maximal valid prefix, resume at the offending byte
      out.append(REPLACEMENT_CHARACTER);
      i += have;
      continue;
    }
    if (have < needed) {
      // Truncated by the chunk boundary
      pending = input.substr(i);
      break;
    }
    out.append(input, i, needed);
    i += needed;
  }
  return out;
}

string Utf8Decoder::flush() {
  if (pending.empty()) {
    return "";
  }
  pending.clear();
  return REPLACEMENT_CHARACTER;
}
}  // namespace agt
