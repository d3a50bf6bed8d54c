#pragma once
#include <string>

// UTF-8 <-> UTF-32. Invalid sequences decode to U+FFFD.
std::u32string utf8ToU32(const std::string &text);
std::string u32ToUtf8(const std::u32string &text);

// 码点数 (非字节数)
size_t utf8Length(const std::string &text);

bool isBlank(const std::string &text);
std::string trim(const std::string &text);

// Removes control characters (keeps '\n') and collapses runs of four or more
// identical characters to a single one. Lines are trimmed, empty lines
// dropped.
std::string cleanRecognizedText(const std::string &text);
