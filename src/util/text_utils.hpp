#ifndef PIISHIELD_UTIL_TEXT_UTILS_HPP
#define PIISHIELD_UTIL_TEXT_UTILS_HPP

#include <cctype>
#include <cstddef>
#include <string>
#include <vector>

/**
 * @file text_utils.hpp
 * @brief Byte-level helpers for UTF-8 German text.
 *
 * Input strings are UTF-8. All offsets handled by piishield are byte offsets.
 * Case folding covers ASCII and the German umlauts (Ä Ö Ü), which is all the
 * configured locale needs; other multi-byte sequences pass through untouched.
 */

namespace piishield {
namespace util {
namespace text {

/// Bytes belonging to a word: ASCII alphanumerics and any UTF-8 lead/continuation byte.
inline bool isWordByte(char c)
{
    unsigned char u = static_cast<unsigned char>(c);
    return u >= 0x80 || std::isalnum(u) != 0;
}

inline bool isDigit(char c)
{
    return c >= '0' && c <= '9';
}

inline bool isSpace(char c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

/**
 * @brief True if the word starting at @p pos begins with an uppercase letter
 *        (A-Z, Ä, Ö, Ü).
 */
inline bool startsUppercase(const std::string &s, std::size_t pos)
{
    if (pos >= s.size()) {
        return false;
    }
    unsigned char c = static_cast<unsigned char>(s[pos]);
    if (c >= 'A' && c <= 'Z') {
        return true;
    }
    if (c == 0xC3 && pos + 1 < s.size()) {
        unsigned char n = static_cast<unsigned char>(s[pos + 1]);
        return n == 0x84 || n == 0x96 || n == 0x9C;
    }
    return false;
}

/**
 * @brief Lowercase ASCII letters and German umlauts.
 */
inline std::string toLower(const std::string &s)
{
    std::string out(s);
    for (std::size_t i = 0; i < out.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(out[i]);
        if (c >= 'A' && c <= 'Z') {
            out[i] = static_cast<char>(c + ('a' - 'A'));
        } else if (c == 0xC3 && i + 1 < out.size()) {
            unsigned char n = static_cast<unsigned char>(out[i + 1]);
            if (n == 0x84 || n == 0x96 || n == 0x9C) {
                out[i + 1] = static_cast<char>(n + 0x20);
            }
            ++i;
        }
    }
    return out;
}

inline std::string toUpperAscii(const std::string &s)
{
    std::string out(s);
    for (char &c : out) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return out;
}

/**
 * @brief Trim ASCII whitespace on both ends.
 */
inline std::string trim(const std::string &s)
{
    static const char *whitespace = " \t\r\n\f\v";
    auto first = s.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return std::string();
    }
    auto last = s.find_last_not_of(whitespace);
    return s.substr(first, last - first + 1);
}

/**
 * @brief Trim, then replace every whitespace run with a single space.
 */
inline std::string collapseWhitespace(const std::string &s)
{
    std::string out;
    out.reserve(s.size());
    bool pendingSpace = false;
    for (char c : s) {
        if (isSpace(c)) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out += ' ';
            pendingSpace = false;
        }
        out += c;
    }
    return out;
}

/**
 * @brief Keep only ASCII digits.
 */
inline std::string digitsOnly(const std::string &s)
{
    std::string out;
    for (char c : s) {
        if (isDigit(c)) {
            out += c;
        }
    }
    return out;
}

/**
 * @brief Remove every character contained in @p chars.
 */
inline std::string removeChars(const std::string &s, const std::string &chars)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (chars.find(c) == std::string::npos) {
            out += c;
        }
    }
    return out;
}

/**
 * @brief Split on @p delimiter, trimming each piece and dropping empty ones.
 */
inline std::vector<std::string> splitList(const std::string &s, char delimiter)
{
    std::vector<std::string> out;
    std::size_t begin = 0;
    while (begin <= s.size()) {
        std::size_t end = s.find(delimiter, begin);
        if (end == std::string::npos) {
            end = s.size();
        }
        std::string piece = trim(s.substr(begin, end - begin));
        if (!piece.empty()) {
            out.push_back(piece);
        }
        begin = end + 1;
    }
    return out;
}

/**
 * @brief A word inside a larger string, addressed by byte offsets.
 */
struct WordSpan
{
    std::size_t start;
    std::size_t end;
    std::string text;
};

/**
 * @brief Byte length of a multi-byte separator at @p pos (typographic quotes,
 *        dashes, no-break space, guillemets), 0 otherwise.
 */
inline std::size_t separatorSequenceLength(const std::string &s, std::size_t pos)
{
    unsigned char c = static_cast<unsigned char>(s[pos]);
    if (c == 0xE2 && pos + 2 < s.size() && static_cast<unsigned char>(s[pos + 1]) == 0x80) {
        return 3;
    }
    if (c == 0xC2 && pos + 1 < s.size()) {
        unsigned char n = static_cast<unsigned char>(s[pos + 1]);
        if (n == 0xA0 || n == 0xAB || n == 0xBB || n == 0xA7) {
            return 2;
        }
    }
    return 0;
}

/**
 * @brief Split @p s into maximal runs of word bytes (see isWordByte).
 */
inline std::vector<WordSpan> wordSpans(const std::string &s)
{
    std::vector<WordSpan> words;
    std::size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && (!isWordByte(s[i]) || separatorSequenceLength(s, i) > 0)) {
            std::size_t skip = separatorSequenceLength(s, i);
            i += skip > 0 ? skip : 1;
        }
        std::size_t start = i;
        while (i < s.size() && isWordByte(s[i]) && separatorSequenceLength(s, i) == 0) {
            ++i;
        }
        if (i > start) {
            words.push_back({start, i, s.substr(start, i - start)});
        }
    }
    return words;
}

} // namespace text
} // namespace util
} // namespace piishield

#endif // PIISHIELD_UTIL_TEXT_UTILS_HPP
