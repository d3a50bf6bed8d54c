#include "text_utils.h"
#include <vector>

namespace {

constexpr char32_t kReplacement = 0xFFFD;

bool isSpace(char32_t c) {
  return c == U' ' || c == U'\t' || c == U'\r' || c == U'\n' || c == U'\v' ||
         c == U'\f' || c == 0x3000 || c == 0x00A0;
}

bool isControl(char32_t c) {
  return (c < 0x20 && c != U'\n') || c == 0x7F || (c >= 0x80 && c < 0xA0);
}

std::u32string trimU32(const std::u32string &s) {
  size_t begin = 0;
  size_t end = s.size();
  while (begin < end && isSpace(s[begin]))
    ++begin;
  while (end > begin && isSpace(s[end - 1]))
    --end;
  return s.substr(begin, end - begin);
}

std::u32string collapseRepeats(const std::u32string &line) {
  std::u32string out;
  size_t i = 0;
  while (i < line.size()) {
    size_t j = i;
    while (j < line.size() && line[j] == line[i])
      ++j;
    size_t run = j - i;
    if (run >= 4) {
      out.push_back(line[i]);
    } else {
      out.append(line, i, run);
    }
    i = j;
  }
  return out;
}

} // namespace

std::u32string utf8ToU32(const std::string &text) {
  std::u32string out;
  out.reserve(text.size());
  const size_t n = text.size();
  size_t i = 0;
  while (i < n) {
    unsigned char c = static_cast<unsigned char>(text[i]);
    int extra = 0;
    char32_t cp = 0;
    if (c < 0x80) {
      cp = c;
    } else if ((c & 0xE0) == 0xC0) {
      cp = c & 0x1F;
      extra = 1;
    } else if ((c & 0xF0) == 0xE0) {
      cp = c & 0x0F;
      extra = 2;
    } else if ((c & 0xF8) == 0xF0) {
      cp = c & 0x07;
      extra = 3;
    } else {
      out.push_back(kReplacement);
      ++i;
      continue;
    }

    bool ok = true;
    for (int k = 1; k <= extra; ++k) {
      if (i + k >= n ||
          (static_cast<unsigned char>(text[i + k]) & 0xC0) != 0x80) {
        ok = false;
        break;
      }
      cp = (cp << 6) | (static_cast<unsigned char>(text[i + k]) & 0x3F);
    }
    if (!ok) {
      out.push_back(kReplacement);
      ++i;
      continue;
    }
    out.push_back(cp);
    i += static_cast<size_t>(extra) + 1;
  }
  return out;
}

std::string u32ToUtf8(const std::u32string &text) {
  std::string out;
  out.reserve(text.size());
  for (char32_t cp : text) {
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
      cp = kReplacement;
    if (cp < 0x80) {
      out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
      out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
      out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
      out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
  }
  return out;
}

size_t utf8Length(const std::string &text) {
  size_t count = 0;
  for (unsigned char c : text) {
    if ((c & 0xC0) != 0x80)
      ++count;
  }
  return count;
}

bool isBlank(const std::string &text) {
  for (char32_t c : utf8ToU32(text)) {
    if (!isSpace(c))
      return false;
  }
  return true;
}

std::string trim(const std::string &text) {
  return u32ToUtf8(trimU32(utf8ToU32(text)));
}

std::string cleanRecognizedText(const std::string &text) {
  std::u32string filtered;
  for (char32_t c : utf8ToU32(text)) {
    if (!isControl(c))
      filtered.push_back(c);
  }

  std::vector<std::u32string> lines;
  size_t start = 0;
  while (start <= filtered.size()) {
    size_t end = filtered.find(U'\n', start);
    if (end == std::u32string::npos)
      end = filtered.size();
    std::u32string line = trimU32(collapseRepeats(
        filtered.substr(start, end - start)));
    if (!line.empty())
      lines.push_back(line);
    start = end + 1;
  }

  std::u32string joined;
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i > 0)
      joined.push_back(U'\n');
    joined += lines[i];
  }
  return u32ToUtf8(joined);
}
