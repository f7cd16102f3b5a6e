#ifndef PIISHIELD_VALIDATION_ID_VALIDATORS_HPP
#define PIISHIELD_VALIDATION_ID_VALIDATORS_HPP

#include <array>
#include <cstddef>
#include <string>
#include "../util/text_utils.hpp"

/**
 * @file id_validators.hpp
 * @brief Format and check-digit rules for German government identifiers.
 *
 * Covered:
 *   - Steuerliche Identifikationsnummer (11 digits, ISO 7064 MOD 11,10)
 *   - Rentenversicherungsnummer (12 chars, weighted cross-sum check digit)
 *   - Personalausweis / Reisepass serial (9 chars, optional ICAO 7-3-1 digit)
 *   - Führerschein number (11 chars, 9..1 weighted check character)
 *
 * Everything here is a pure predicate. Unknown or malformed formats return
 * false (or DocumentKind::NONE) and never throw.
 */

namespace piishield {
namespace validation {

namespace detail {

inline bool allDigits(const std::string &s, std::size_t from, std::size_t to)
{
    for (std::size_t i = from; i < to; ++i) {
        if (!util::text::isDigit(s[i])) {
            return false;
        }
    }
    return true;
}

inline int twoDigits(const std::string &s, std::size_t pos)
{
    return (s[pos] - '0') * 10 + (s[pos + 1] - '0');
}

inline bool isUpperAscii(char c)
{
    return c >= 'A' && c <= 'Z';
}

} // namespace detail

/**
 * @brief Steuer-ID: 11 digits, first digit non-zero; in the first ten digits
 *        exactly one digit occurs two or three times and no other repeats;
 *        digit 11 is the ISO 7064 MOD 11,10 check digit.
 */
inline bool isValidTaxId(const std::string &value)
{
    if (value.size() != 11 || !detail::allDigits(value, 0, 11) || value[0] == '0') {
        return false;
    }

    std::array<int, 10> counts{};
    for (std::size_t i = 0; i < 10; ++i) {
        ++counts[value[i] - '0'];
    }
    int repeated = 0;
    for (int c : counts) {
        if (c > 3) {
            return false;
        }
        if (c >= 2) {
            ++repeated;
        }
    }
    if (repeated != 1) {
        return false;
    }

    int product = 10;
    for (std::size_t i = 0; i < 10; ++i) {
        int sum = (value[i] - '0' + product) % 10;
        if (sum == 0) {
            sum = 10;
        }
        product = (sum * 2) % 11;
    }
    int check = 11 - product;
    if (check == 10) {
        check = 0;
    }
    return check == value[10] - '0';
}

/**
 * @brief Rentenversicherungsnummer, e.g. "15070649C103".
 *
 * Layout: area (2 digits), birth date DDMMYY, initial letter, serial
 * (2 digits), check digit. The letter counts as its two-digit alphabet
 * position; the twelve resulting digits are weighted 2,1,2,5,7,1,2,1,2,1,2,1
 * and the cross sums of the products are added up modulo 10.
 */
inline bool isValidPensionInsuranceNumber(const std::string &value)
{
    if (value.size() != 12) {
        return false;
    }
    if (!detail::allDigits(value, 0, 8) || !detail::isUpperAscii(value[8])
        || !detail::allDigits(value, 9, 12)) {
        return false;
    }

    int day = detail::twoDigits(value, 2);
    int month = detail::twoDigits(value, 4);
    if (day < 1 || day > 31 || month < 1 || month > 12) {
        return false;
    }

    int letter = value[8] - 'A' + 1;
    std::string digits = value.substr(0, 8);
    digits += static_cast<char>('0' + letter / 10);
    digits += static_cast<char>('0' + letter % 10);
    digits += value.substr(9, 2);

    static const int weights[12] = {2, 1, 2, 5, 7, 1, 2, 1, 2, 1, 2, 1};
    int sum = 0;
    for (std::size_t i = 0; i < 12; ++i) {
        int product = (digits[i] - '0') * weights[i];
        sum += product / 10 + product % 10;
    }
    return sum % 10 == value[11] - '0';
}

/**
 * @brief Which identity document a serial number belongs to.
 */
enum class DocumentKind {
    NONE,
    PASSPORT,
    ID_CARD
};

/**
 * @brief ICAO 9303 check digit (weights 7,3,1; A=10 .. Z=35).
 * @return -1 if the input contains a character outside [0-9A-Z].
 */
inline int icaoCheckDigit(const std::string &value)
{
    static const int weights[3] = {7, 3, 1};
    int sum = 0;
    for (std::size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        int v;
        if (util::text::isDigit(c)) {
            v = c - '0';
        } else if (detail::isUpperAscii(c)) {
            v = c - 'A' + 10;
        } else {
            return -1;
        }
        sum += v * weights[i % 3];
    }
    return sum % 10;
}

/**
 * @brief Classify a Personalausweis / Reisepass serial.
 *
 * Nine characters from the document alphabet (CFGHJKLMNPRTVWXYZ and digits)
 * with at least two digits, optionally followed by the ICAO check digit. The
 * first character decides the kind: C F G H J K passport, L M N P R T V W X Y
 * identity card.
 */
inline DocumentKind classifyDocumentNumber(const std::string &value)
{
    static const std::string alphabet = "CFGHJKLMNPRTVWXYZ0123456789";
    static const std::string passportLeads = "CFGHJK";
    static const std::string idCardLeads = "LMNPRTVWXY";

    if (value.size() != 9 && value.size() != 10) {
        return DocumentKind::NONE;
    }
    std::string serial = value.substr(0, 9);
    int digitCount = 0;
    for (char c : serial) {
        if (alphabet.find(c) == std::string::npos) {
            return DocumentKind::NONE;
        }
        if (util::text::isDigit(c)) {
            ++digitCount;
        }
    }
    if (digitCount < 2) {
        return DocumentKind::NONE;
    }
    if (value.size() == 10) {
        if (!util::text::isDigit(value[9]) || icaoCheckDigit(serial) != value[9] - '0') {
            return DocumentKind::NONE;
        }
    }

    if (passportLeads.find(serial[0]) != std::string::npos) {
        return DocumentKind::PASSPORT;
    }
    if (idCardLeads.find(serial[0]) != std::string::npos) {
        return DocumentKind::ID_CARD;
    }
    return DocumentKind::NONE;
}

/**
 * @brief Führerschein number, e.g. "B072R6U5359".
 *
 * Eleven characters of [0-9A-Z] with at least one letter. Character 10 is the
 * check character: the first nine weighted 9..1 (digits by value, letters
 * A=1 .. Z=26), summed modulo 11, with 10 written as 'X'.
 */
inline bool isValidDriverLicense(const std::string &value)
{
    if (value.size() != 11) {
        return false;
    }
    bool hasLetter = false;
    for (char c : value) {
        if (detail::isUpperAscii(c)) {
            hasLetter = true;
        } else if (!util::text::isDigit(c)) {
            return false;
        }
    }
    if (!hasLetter) {
        return false;
    }

    int sum = 0;
    for (std::size_t i = 0; i < 9; ++i) {
        char c = value[i];
        int v = util::text::isDigit(c) ? c - '0' : c - 'A' + 1;
        sum += v * static_cast<int>(9 - i);
    }
    int check = sum % 11;
    char expected = check == 10 ? 'X' : static_cast<char>('0' + check);
    return value[9] == expected;
}

} // namespace validation
} // namespace piishield

#endif // PIISHIELD_VALIDATION_ID_VALIDATORS_HPP
