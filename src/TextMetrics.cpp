#include "TextMetrics.hpp"

#include "PageGeometry.hpp"

#include <cstring>
#include <sstream>
#include <vector>

namespace triage {

namespace {

struct CodePoint {
  char32_t value; ///< Decoded value (the raw byte for malformed input)
  size_t offset;  ///< Byte offset of the first byte
  size_t length;  ///< Encoded length in bytes
};

std::vector<CodePoint> decodeUtf8(const std::string &text) {
  std::vector<CodePoint> codePoints;
  codePoints.reserve(text.size());

  size_t i = 0;
  while (i < text.size()) {
    unsigned char c = static_cast<unsigned char>(text[i]);
    size_t length = 1;
    char32_t value = c;

    if ((c & 0xE0) == 0xC0) {
      length = 2;
      value = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      length = 3;
      value = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      length = 4;
      value = c & 0x07;
    }

    bool valid = i + length <= text.size();
    for (size_t k = 1; valid && k < length; k++) {
      unsigned char next = static_cast<unsigned char>(text[i + k]);
      if ((next & 0xC0) != 0x80) {
        valid = false;
      } else {
        value = (value << 6) | (next & 0x3F);
      }
    }

    if (!valid) {
      length = 1;
      value = c;
    }

    codePoints.push_back({value, i, length});
    i += length;
  }

  return codePoints;
}

// Unicode White_Space plus the ASCII information separators
bool isUnicodeSpace(char32_t c) {
  if (c == ' ' || (c >= 0x09 && c <= 0x0D) || (c >= 0x1C && c <= 0x1F)) {
    return true;
  }
  switch (c) {
  case 0x85:
  case 0xA0:
  case 0x1680:
  case 0x2028:
  case 0x2029:
  case 0x202F:
  case 0x205F:
  case 0x3000:
    return true;
  default:
    return c >= 0x2000 && c <= 0x200A;
  }
}

bool isAlphanumeric(char32_t c) {
  if (c < 0x80) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') ||
           (c >= 'A' && c <= 'Z');
  }
  if (isUnicodeSpace(c)) {
    return false;
  }
  // C1 controls, Latin-1 symbols, general punctuation, CJK punctuation,
  // private use
  if ((c >= 0x80 && c <= 0xBF) || c == 0xD7 || c == 0xF7 ||
      (c >= 0x2000 && c <= 0x2BFF) || (c >= 0x3000 && c <= 0x303F) ||
      (c >= 0xE000 && c <= 0xF8FF) || c == 0xFFFD) {
    return false;
  }
  return true;
}

bool isCommonPunctuation(char32_t c) {
  static const char punctuation[] = ".,:;-'\"?!/@() ";
  return c < 0x80 && c != 0 &&
         std::strchr(punctuation, static_cast<char>(c)) != nullptr;
}

} // anonymous namespace

size_t countCodePoints(const std::string &text) {
  return decodeUtf8(text).size();
}

std::string stripWhitespace(const std::string &text) {
  std::vector<CodePoint> codePoints = decodeUtf8(text);

  size_t first = 0;
  while (first < codePoints.size() && isUnicodeSpace(codePoints[first].value)) {
    first++;
  }

  size_t last = codePoints.size();
  while (last > first && isUnicodeSpace(codePoints[last - 1].value)) {
    last--;
  }

  if (first == last) {
    return std::string();
  }

  size_t begin = codePoints[first].offset;
  size_t end = codePoints[last - 1].offset + codePoints[last - 1].length;
  return text.substr(begin, end - begin);
}

size_t strippedLength(const std::string &text) {
  return countCodePoints(stripWhitespace(text));
}

std::string textOutsideImages(const PageContent &page) {
  if (page.images.empty()) {
    return page.text;
  }

  std::string filtered;
  for (const auto &character : page.characters) {
    bool covered = false;
    for (const auto &image : page.images) {
      if (boxesOverlap(character.box, image.box)) {
        covered = true;
        break;
      }
    }

    if (!covered) {
      filtered += character.text;
    }
  }
  return filtered;
}

bool isGarbageLine(const std::string &line) {
  if (strippedLength(line) < 3) {
    return false;
  }

  std::vector<CodePoint> codePoints = decodeUtf8(line);
  size_t alnum = 0;
  size_t punctuation = 0;
  for (const auto &cp : codePoints) {
    if (isAlphanumeric(cp.value)) {
      alnum++;
    } else if (isCommonPunctuation(cp.value)) {
      punctuation++;
    }
  }

  double total = static_cast<double>(codePoints.size());
  double noise = total - alnum - punctuation;

  if (noise / total > 0.3) {
    return true;
  }
  return alnum / total < 0.5;
}

double garbageLineRatio(const std::string &text) {
  std::istringstream stream(text);
  std::string line;
  size_t totalLines = 0;
  size_t badLines = 0;

  while (std::getline(stream, line)) {
    std::string stripped = stripWhitespace(line);
    if (stripped.empty()) {
      continue;
    }
    totalLines++;
    if (isGarbageLine(stripped)) {
      badLines++;
    }
  }

  if (totalLines == 0) {
    return 0.0;
  }
  return static_cast<double>(badLines) / totalLines;
}

} // namespace triage
