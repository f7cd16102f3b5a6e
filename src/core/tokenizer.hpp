#ifndef PIISHIELD_CORE_TOKENIZER_HPP
#define PIISHIELD_CORE_TOKENIZER_HPP

#include <cstddef>
#include <string>
#include <utility>
#include "candidate.hpp"
#include "pii_type.hpp"
#include "../util/hashing.hpp"
#include "../util/text_utils.hpp"

/**
 * @file tokenizer.hpp
 * @brief Deterministic placeholder tokens: [PII:{TYPE}_ID_{8 hex}].
 *
 * The digest is the first 8 hex characters of MD5 over the normalized value.
 * Normalization depends on the type, so that "DE89 3704 0044 0532 0130 00"
 * and "DE89370400440532013000" or "+49 30 1234567" and "030 1234567" map to
 * the same token. No table is kept: the token is a pure function of
 * (type, normalized value), stable across strings, batches and processes.
 *
 * Token format is parsed by downstream consumers. Do not change it.
 */

namespace piishield {
namespace core {

static constexpr std::size_t TOKEN_DIGEST_HEX_CHARS = 8;

namespace detail {

inline std::string replaceAll(std::string s, const std::string &from, const std::string &to)
{
    std::size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
    return s;
}

// "+49 30 123", "+49 (0)30 123" and "0049-30-123" become "030123".
inline std::string normalizePhone(const std::string &value)
{
    std::string compact = util::text::removeChars(replaceAll(value, "(0)", ""), " \t-/().");
    if (compact.compare(0, 3, "+49") == 0) {
        compact = "0" + compact.substr(3);
    } else if (compact.compare(0, 4, "0049") == 0) {
        compact = "0" + compact.substr(4);
    }
    return util::text::digitsOnly(compact);
}

// "1.4.1985" and "01.04.1985" become "01041985".
inline std::string normalizeDate(const std::string &value)
{
    std::string out;
    std::string field;
    auto flush = [&out, &field]() {
        if (field.size() == 1) {
            out += '0';
        }
        out += field;
        field.clear();
    };
    for (char c : value) {
        if (util::text::isDigit(c)) {
            field += c;
        } else if (!field.empty()) {
            flush();
        }
    }
    if (!field.empty()) {
        flush();
    }
    return out;
}

} // namespace detail

/**
 * @brief Canonical form of a matched value, used as digest input.
 */
inline std::string normalizeValue(PiiType type, const std::string &value)
{
    using namespace util::text;
    switch (type) {
        case PiiType::FINANCIAL_IBAN:
        case PiiType::ID_TAX_ID:
        case PiiType::ID_SOCIAL_SECURITY:
        case PiiType::ID_PASSPORT:
        case PiiType::ID_ID_CARD:
        case PiiType::ID_DRIVER_LICENSE:
            return toUpperAscii(removeChars(value, " \t\r\n-"));

        case PiiType::FINANCIAL_CREDIT_CARD:
        case PiiType::AGE_SENIOR:
        case PiiType::AGE_ADULT:
        case PiiType::AGE_TEEN:
        case PiiType::AGE_CHILD:
            return digitsOnly(value);

        case PiiType::CONTACT_PHONE:
            return detail::normalizePhone(value);

        case PiiType::DATE_BIRTH:
            return detail::normalizeDate(value);

        case PiiType::LOCATION_ADDRESS: {
            std::string s = collapseWhitespace(toLower(value));
            s = detail::replaceAll(s, "strasse", "stra\xC3\x9F" "e");
            return detail::replaceAll(s, "str.", "stra\xC3\x9F" "e");
        }

        case PiiType::CONTACT_EMAIL:
        case PiiType::CONTACT_URL:
        case PiiType::PERSON:
        case PiiType::LOCATION:
        case PiiType::MEDICAL_CONDITION:
        case PiiType::MEDICAL_MEDICATION:
        case PiiType::MEDICAL_PROCEDURE:
            return collapseWhitespace(toLower(value));
    }
    return collapseWhitespace(value);
}

/**
 * @brief Token for a value of the given type.
 */
inline std::string makeToken(PiiType type, const std::string &value)
{
    std::string digest = util::hashing::digestPrefix(
        util::hashing::md5Hex(normalizeValue(type, value)), TOKEN_DIGEST_HEX_CHARS);
    return "[PII:" + typeName(type) + "_ID_" + digest + "]";
}

/**
 * @brief Promote an accepted candidate to a detection.
 */
inline Detection tokenize(Candidate candidate)
{
    Detection d;
    static_cast<Candidate &>(d) = std::move(candidate);
    d.token = makeToken(d.type, d.text);
    return d;
}

} // namespace core
} // namespace piishield

#endif // PIISHIELD_CORE_TOKENIZER_HPP
