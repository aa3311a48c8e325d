#include "mycelic/text.hpp"

#include <cctype>
#include <cstdint>
#include <utility>

namespace mycelic {
namespace {

// Base letters for U+00C0..U+00FF; 0 marks a separator, '*' keeps the code
// point (lower-cased) as a letter of its own.
constexpr char kLatin1Fold[64 + 1] =
    "aaaaaa*ceeeeiiii*nooooo\0ouuuuy**"
    "aaaaaa*ceeeeiiii*nooooo\0ouuuuy*y";

struct CodePoint {
  std::uint32_t value = 0;
  std::size_t length = 1;
  bool valid = false;
};

CodePoint Decode(std::string_view text, std::size_t pos) {
  const auto lead = static_cast<unsigned char>(text[pos]);
  std::size_t length = 0;
  std::uint32_t value = 0;
  if (lead < 0x80) {
    return CodePoint{.value = lead, .length = 1, .valid = true};
  } else if ((lead & 0xE0) == 0xC0) {
    length = 2;
    value = lead & 0x1F;
  } else if ((lead & 0xF0) == 0xE0) {
    length = 3;
    value = lead & 0x0F;
  } else if ((lead & 0xF8) == 0xF0) {
    length = 4;
    value = lead & 0x07;
  } else {
    return CodePoint{};
  }
  if (pos + length > text.size()) {
    return CodePoint{};
  }
  for (std::size_t i = 1; i < length; ++i) {
    const auto next = static_cast<unsigned char>(text[pos + i]);
    if ((next & 0xC0) != 0x80) {
      return CodePoint{};
    }
    value = (value << 6) | (next & 0x3F);
  }
  return CodePoint{.value = value, .length = length, .valid = true};
}

bool IsSeparator(std::uint32_t cp) {
  return (cp >= 0x80 && cp <= 0xBF) || (cp >= 0x2000 && cp <= 0x206F) || (cp >= 0x3000 && cp <= 0x303F) ||
         cp == 0xFEFF;
}

void AppendTwoByte(std::string& out, std::uint32_t cp) {
  out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
  out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
}

}  // namespace

std::string Trim(std::string_view text) {
  std::size_t begin = 0;
  std::size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
    --end;
  }
  return std::string(text.substr(begin, end - begin));
}

std::vector<std::string> TokenizeWords(std::string_view text) {
  std::vector<std::string> tokens{};
  std::string current{};
  current.reserve(32);

  const auto flush = [&]() {
    if (!current.empty()) {
      tokens.push_back(std::move(current));
      current.clear();
      current.reserve(32);
    }
  };

  std::size_t pos = 0;
  while (pos < text.size()) {
    const auto cp = Decode(text, pos);
    if (!cp.valid) {
      flush();
      ++pos;
      continue;
    }
    if (cp.value < 0x80) {
      const auto ch = static_cast<unsigned char>(cp.value);
      if (std::isalnum(ch) != 0) {
        current.push_back(static_cast<char>(std::tolower(ch)));
      } else {
        flush();
      }
    } else if (cp.value >= 0xC0 && cp.value <= 0xFF) {
      const char base = kLatin1Fold[cp.value - 0xC0];
      if (base == '\0') {
        flush();
      } else if (base == '*') {
        // Upper-case forms sit 0x20 below their lower-case partner; sharp s
        // has none.
        AppendTwoByte(current, cp.value < 0xDF ? cp.value + 0x20 : cp.value);
      } else {
        current.push_back(base);
      }
    } else if (IsSeparator(cp.value)) {
      flush();
    } else {
      current.append(text.substr(pos, cp.length));
    }
    pos += cp.length;
  }
  flush();
  return tokens;
}

}  // namespace mycelic
