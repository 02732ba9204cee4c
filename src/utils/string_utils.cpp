#include "string_utils.h"
#include <algorithm>
#include <cctype>

size_t replaceAllInPlace(std::string& s, const std::string& from, const std::string& to) {
    if (from.empty()) return 0;
    size_t count = 0;
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
        count++;
    }
    return count;
}

size_t replaceCharInPlace(std::string& s, char from, char to) {
    size_t count = 0;
    for (auto& ch : s) {
        if (ch == from) {
            ch = to;
            count++;
        }
    }
    return count;
}

std::vector<std::string> splitString(const std::string& s, char delim) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = s.find(delim, start);
        if (pos == std::string::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

std::vector<std::string> splitLines(const std::string& s) {
    std::vector<std::string> lines = splitString(s, '\n');
    for (auto& line : lines) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
    }
    // A trailing newline does not start another line
    if (lines.size() > 1 && lines.back().empty()) {
        lines.pop_back();
    }
    return lines;
}

std::string joinLines(const std::vector<std::string>& lines) {
    std::string out;
    for (const auto& line : lines) {
        out += line;
        out += '\n';
    }
    return out;
}

std::string trimString(const std::string& s) {
    size_t begin = 0;
    while (begin < s.size() && std::isspace(static_cast<unsigned char>(s[begin]))) {
        begin++;
    }
    size_t end = s.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        end--;
    }
    return s.substr(begin, end - begin);
}

std::string trimRight(const std::string& s) {
    size_t end = s.size();
    while (end > 0 && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        end--;
    }
    return s.substr(0, end);
}

std::string toLowerAscii(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool decodeUtf8(const std::string& s, std::vector<char32_t>& out) {
    size_t i = 0;
    while (i < s.size()) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        char32_t cp = 0;
        size_t extra = 0;
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
            return false;
        }
        if (i + extra >= s.size() && extra > 0) {
            return false;
        }
        for (size_t k = 1; k <= extra; k++) {
            unsigned char cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }
        out.push_back(cp);
        i += extra + 1;
    }
    return true;
}

size_t utf8Length(const std::string& s) {
    size_t count = 0;
    for (char ch : s) {
        if ((static_cast<unsigned char>(ch) & 0xC0) != 0x80) {
            count++;
        }
    }
    return count;
}

std::string sanitizeText(const std::string& s, size_t maxLength, bool keepNewlines) {
    std::string cleaned;
    cleaned.reserve(s.size());
    for (char ch : s) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (ch == '\n' && keepNewlines) {
            cleaned += ch;
        } else if (ch == '\t') {
            cleaned += ' ';
        } else if (c >= 0x20 && c != 0x7F) {
            cleaned += ch;
        }
    }
    cleaned = trimString(cleaned);

    if (maxLength == 0 || utf8Length(cleaned) <= maxLength) {
        return cleaned;
    }
    // Cut on a code point boundary
    size_t count = 0;
    size_t i = 0;
    for (; i < cleaned.size(); i++) {
        if ((static_cast<unsigned char>(cleaned[i]) & 0xC0) != 0x80) {
            if (count == maxLength) {
                break;
            }
            count++;
        }
    }
    return trimRight(cleaned.substr(0, i));
}
