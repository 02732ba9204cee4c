#ifndef STRING_UTILS_H
#define STRING_UTILS_H

#include <string>
#include <vector>

// Helper functions for string manipulation
size_t replaceAllInPlace(std::string& s, const std::string& from, const std::string& to);
size_t replaceCharInPlace(std::string& s, char from, char to);

std::vector<std::string> splitString(const std::string& s, char delim);
std::vector<std::string> splitLines(const std::string& s);
std::string joinLines(const std::vector<std::string>& lines);
std::string trimString(const std::string& s);
std::string trimRight(const std::string& s);
std::string toLowerAscii(std::string s);

// Decode UTF-8 into code points. Returns false on malformed input.
bool decodeUtf8(const std::string& s, std::vector<char32_t>& out);

// Remove control characters (newlines survive when keepNewlines is set), trim,
// and cut to at most maxLength code points (0 = no limit)
std::string sanitizeText(const std::string& s, size_t maxLength, bool keepNewlines = true);

// Number of code points in a UTF-8 string (display width for box-drawing and ASCII art)
size_t utf8Length(const std::string& s);

#endif // STRING_UTILS_H
