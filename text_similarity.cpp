#include "text_similarity.h"
#include "text_utils.h"
#include <algorithm>
#include <utility>
#include <vector>

namespace {

// 小写假名拗音被误识别为大写
const std::pair<std::u32string, std::u32string> kSequenceFixes[] = {
    {U"シヤ", U"シャ"}, {U"シユ", U"シュ"}, {U"シヨ", U"ショ"},
    {U"チヤ", U"チャ"}, {U"チユ", U"チュ"}, {U"チヨ", U"チョ"},
};

char32_t canonicalGlyph(char32_t c) {
  switch (c) {
  case U'口': // 汉字 "口" 与片假名 "ロ"
    return U'ロ';
  case U'コ':
    return U'ニ';
  case U'O':
    return U'0';
  case U'l':
  case U'I':
    return U'1';
  default:
    return c;
  }
}

void replaceAll(std::u32string &text, const std::u32string &from,
                const std::u32string &to) {
  size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::u32string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
}

} // namespace

std::u32string TextSimilarity::normalize(const std::string &text) {
  std::u32string out;
  for (char32_t c : utf8ToU32(text)) {
    if (c == U'。' || c == U'、' || c == U'．' || c == U'，')
      continue;
    if (c >= 0xFF01 && c <= 0xFF5E) {
      c = c - 0xFF01 + 0x21;
    } else if (c == 0x3000) {
      c = U' ';
    }
    if (c >= U'A' && c <= U'Z') {
      c = c - U'A' + U'a';
    }
    switch (c) {
    case U' ':
    case U'\t':
    case U'\n':
    case U'\r':
    case U'\v':
    case U'\f':
      continue;
    default:
      out.push_back(c);
    }
  }
  return out;
}

std::u32string
TextSimilarity::canonicalizeConfusables(const std::u32string &text) {
  std::u32string out = text;
  for (const auto &fix : kSequenceFixes) {
    replaceAll(out, fix.first, fix.second);
  }
  for (auto &c : out) {
    c = canonicalGlyph(c);
  }
  return out;
}

size_t TextSimilarity::levenshtein(const std::u32string &a,
                                   const std::u32string &b) {
  const std::u32string &longer = a.size() >= b.size() ? a : b;
  const std::u32string &shorter = a.size() >= b.size() ? b : a;
  if (shorter.empty())
    return longer.size();

  std::vector<size_t> previous(shorter.size() + 1);
  std::vector<size_t> current(shorter.size() + 1);
  for (size_t j = 0; j <= shorter.size(); ++j)
    previous[j] = j;

  for (size_t i = 0; i < longer.size(); ++i) {
    current[0] = i + 1;
    for (size_t j = 0; j < shorter.size(); ++j) {
      size_t insertion = previous[j + 1] + 1;
      size_t deletion = current[j] + 1;
      size_t substitution = previous[j] + (longer[i] != shorter[j] ? 1 : 0);
      current[j + 1] = std::min({insertion, deletion, substitution});
    }
    std::swap(previous, current);
  }
  return previous[shorter.size()];
}

double TextSimilarity::similarity(const std::string &a, const std::string &b) {
  std::u32string na = normalize(a);
  std::u32string nb = normalize(b);

  if (na == nb)
    return 1.0;
  if (na.empty() || nb.empty())
    return 0.0;

  const double len_ratio =
      static_cast<double>(std::min(na.size(), nb.size())) /
      static_cast<double>(std::max(na.size(), nb.size()));
  if (len_ratio < 0.7)
    return 0.0;

  std::u32string ca = canonicalizeConfusables(na);
  std::u32string cb = canonicalizeConfusables(nb);
  if (ca == cb)
    return 1.0;

  const size_t distance = levenshtein(ca, cb);
  const size_t max_len = std::max(ca.size(), cb.size());
  double score = 1.0 - static_cast<double>(distance) / max_len;

  // 1-2 字差异视为同一字幕的误识别
  if (distance <= 2 && len_ratio >= 0.9) {
    score = std::max(score, 0.92);
  }
  return std::max(0.0, std::min(1.0, score));
}
