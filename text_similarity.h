#pragma once
#include <string>

// OCR 误识别感知的文本相似度, 结果对称, 取值 [0, 1]
class TextSimilarity {
public:
  static double similarity(const std::string &a, const std::string &b);

  // Lowercase, fullwidth ASCII to halfwidth, punctuation folding and
  // whitespace removal. Exposed for tests.
  static std::u32string normalize(const std::string &text);

  // Maps every confusable glyph class to one canonical symbol.
  static std::u32string canonicalizeConfusables(const std::u32string &text);

  static size_t levenshtein(const std::u32string &a, const std::u32string &b);
};
