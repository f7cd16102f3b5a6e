#ifndef PIISHIELD_VALIDATION_VALIDATORS_HPP
#define PIISHIELD_VALIDATION_VALIDATORS_HPP

#include <cstddef>
#include <map>
#include <string>
#include "../util/text_utils.hpp"

/**
 * @file validators.hpp
 * @brief Checksum validators for financial identifiers (Luhn, IBAN Mod-97).
 *
 * DESIGN GOALS:
 *   - Pure functions, no state, no exceptions. A failing value returns false
 *     and the extractor that matched it drops the candidate.
 *   - Cheap structural rejection (length, charset, country) before any
 *     arithmetic.
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace piishield::validation;
 *   bool ok = isValidIban("DE89 3704 0044 0532 0130 00");   // true
 *   bool card = luhnValid("4111 1111 1111 1111");           // true
 *   @endcode
 */

namespace piishield {
namespace validation {

static constexpr std::size_t CARD_MIN_DIGITS = 13;
static constexpr std::size_t CARD_MAX_DIGITS = 19;

/**
 * @brief Luhn mod-10 check over a card number.
 *
 * Spaces and dashes are separators and ignored. Any other non-digit, or a
 * digit count outside [13, 19], fails.
 */
inline bool luhnValid(const std::string &number)
{
    std::string digits = util::text::removeChars(number, " -");
    if (digits.size() < CARD_MIN_DIGITS || digits.size() > CARD_MAX_DIGITS) {
        return false;
    }

    int sum = 0;
    bool alternate = false;
    for (std::size_t i = digits.size(); i-- > 0;) {
        if (!util::text::isDigit(digits[i])) {
            return false;
        }
        int digit = digits[i] - '0';
        if (alternate) {
            digit *= 2;
            if (digit > 9) {
                digit -= 9;
            }
        }
        sum += digit;
        alternate = !alternate;
    }
    return sum % 10 == 0;
}

/**
 * @brief IBAN length per country code (ISO 13616 registry).
 */
inline const std::map<std::string, std::size_t> &ibanCountryLengths()
{
    static const std::map<std::string, std::size_t> lengths = {
        {"AD", 24}, {"AE", 23}, {"AL", 28}, {"AT", 20}, {"AZ", 28}, {"BA", 20},
        {"BE", 16}, {"BG", 22}, {"BH", 22}, {"BR", 29}, {"CH", 21}, {"CR", 22},
        {"CY", 28}, {"CZ", 24}, {"DE", 22}, {"DK", 18}, {"DO", 28}, {"EE", 20},
        {"ES", 24}, {"FI", 18}, {"FO", 18}, {"FR", 27}, {"GB", 22}, {"GE", 22},
        {"GI", 23}, {"GL", 18}, {"GR", 27}, {"GT", 28}, {"HR", 21}, {"HU", 28},
        {"IE", 22}, {"IL", 23}, {"IS", 26}, {"IT", 27}, {"JO", 30}, {"KW", 30},
        {"KZ", 20}, {"LB", 28}, {"LI", 21}, {"LT", 20}, {"LU", 20}, {"LV", 21},
        {"MC", 27}, {"MD", 24}, {"ME", 22}, {"MK", 19}, {"MR", 27}, {"MT", 31},
        {"MU", 30}, {"NL", 18}, {"NO", 15}, {"PK", 24}, {"PL", 28}, {"PS", 29},
        {"PT", 25}, {"QA", 29}, {"RO", 24}, {"RS", 22}, {"SA", 24}, {"SE", 24},
        {"SI", 19}, {"SK", 24}, {"SM", 27}, {"TN", 24}, {"TR", 26}, {"UA", 29},
        {"VG", 24}, {"XK", 20}
    };
    return lengths;
}

/**
 * @brief Expected IBAN length for a two-letter country code, 0 if unknown.
 */
inline std::size_t ibanLengthFor(const std::string &countryCode)
{
    const auto &lengths = ibanCountryLengths();
    auto it = lengths.find(countryCode);
    return it == lengths.end() ? 0 : it->second;
}

/**
 * @brief Full IBAN validation: country length table first, then Mod-97.
 *
 * Whitespace is ignored and letters are compared case-insensitively.
 */
inline bool isValidIban(const std::string &candidate)
{
    std::string iban = util::text::toUpperAscii(util::text::removeChars(candidate, " \t"));
    if (iban.size() < 5) {
        return false;
    }
    std::size_t expected = ibanLengthFor(iban.substr(0, 2));
    if (expected == 0 || iban.size() != expected) {
        return false;
    }
    if (!util::text::isDigit(iban[2]) || !util::text::isDigit(iban[3])) {
        return false;
    }

    // Move the first four characters to the end, expand letters to 10..35 and
    // reduce piecewise so the numeral never has to be materialised.
    std::string rearranged = iban.substr(4) + iban.substr(0, 4);
    int remainder = 0;
    for (char c : rearranged) {
        if (util::text::isDigit(c)) {
            remainder = (remainder * 10 + (c - '0')) % 97;
        } else if (c >= 'A' && c <= 'Z') {
            int value = c - 'A' + 10;
            remainder = (remainder * 100 + value) % 97;
        } else {
            return false;
        }
    }
    return remainder == 1;
}

/**
 * @brief Card brand from the leading digits of a digit-only number, empty if
 *        no supported brand matches.
 */
inline std::string cardBrand(const std::string &digits)
{
    auto prefix = [&digits](std::size_t n) -> int {
        if (digits.size() < n) {
            return -1;
        }
        return std::stoi(digits.substr(0, n));
    };

    std::size_t len = digits.size();
    if (!digits.empty() && digits[0] == '4' && (len == 13 || len == 16 || len == 19)) {
        return "visa";
    }
    int p2 = prefix(2);
    int p4 = prefix(4);
    if (len == 16 && ((p2 >= 51 && p2 <= 55) || (p4 >= 2221 && p4 <= 2720))) {
        return "mastercard";
    }
    if (len == 15 && (p2 == 34 || p2 == 37)) {
        return "amex";
    }
    int p3 = prefix(3);
    if ((len == 16 || len == 19) && (p4 == 6011 || p2 == 65 || (p3 >= 644 && p3 <= 649))) {
        return "discover";
    }
    return std::string();
}

} // namespace validation
} // namespace piishield

#endif // PIISHIELD_VALIDATION_VALIDATORS_HPP
