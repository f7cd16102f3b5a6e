#ifndef PIISHIELD_EXTRACTORS_ADDRESS_EXTRACTOR_HPP
#define PIISHIELD_EXTRACTORS_ADDRESS_EXTRACTOR_HPP

#include <cstddef>
#include <regex>
#include <string>
#include <vector>
#include "extractor.hpp"

/**
 * @file address_extractor.hpp
 * @brief Street name plus house number ("Musterstraße 12", "Alte Str. 4a",
 *        "Konrad-Adenauer-Allee 3-5").
 *
 * City names on their own are never matched: a bare "Hamburg" stays in the
 * output. Only the street and the house number are covered, so postal code
 * and city after the comma survive as well.
 *
 * std::regex works on bytes, so umlauts and ß are spelled out as UTF-8
 * alternations rather than placed in bracket expressions.
 */

namespace piishield {
namespace extractors {

class AddressExtractor : public CandidateExtractor
{
public:
    static constexpr double ADDRESS_CONFIDENCE = 0.85;

    core::ExtractorKind kind() const override { return core::ExtractorKind::ADDRESS; }

    std::vector<core::Candidate> extract(const std::string &text) const override
    {
        std::vector<core::Candidate> out;
        for (const std::regex *re : {&compoundStreetRegex(), &adjectiveStreetRegex()}) {
            forEachMatch(text, *re, [&](const std::smatch &, std::size_t start, std::size_t end) {
                if (!isolated(text, start, end)) {
                    return;
                }
                out.push_back(core::makeCandidate(text, start, end, core::PiiType::LOCATION_ADDRESS,
                                                  ADDRESS_CONFIDENCE, kind()));
            });
        }
        return out;
    }

private:
    // "Musterstraße 12", "Konrad-Adenauer-Straße 5", "Lindenweg 3b"
    static const std::regex &compoundStreetRegex()
    {
        static const std::regex re(
            "(?:(?:" + upper() + lower() + "+-)+"
            "(?:Stra\xC3\x9F" "e|Strasse|Str\\.|Weg|Allee|Platz|Gasse|Ring|Damm|Ufer)"
            "|(?:" + upper() + lower() + "+-)*" + upper() + lower() + "+"
            "(?:stra\xC3\x9F" "e|strasse|str\\.|weg|allee|platz|gasse|ring|damm|ufer))"
            + houseNumber());
        return re;
    }

    // "Lange Straße 3", "Alte Str. 4", "Breiter Weg 10"
    static const std::regex &adjectiveStreetRegex()
    {
        static const std::regex re(
            upper() + lower() + "*e[rs]? "
            "(?:Stra\xC3\x9F" "e|Strasse|Str\\.|Weg|Allee|Platz)"
            + houseNumber());
        return re;
    }

    // Lowercase letter including umlauts and ß.
    static std::string lower() { return "(?:[a-z]|\xC3\xA4|\xC3\xB6|\xC3\xBC|\xC3\x9F)"; }

    // Uppercase letter including umlauts.
    static std::string upper() { return "(?:[A-Z]|\xC3\x84|\xC3\x96|\xC3\x9C)"; }

    // "12", "12a", "12 a", "3-5"
    static std::string houseNumber() { return " ?\\d{1,4}(?: ?[a-zA-Z](?![a-zA-Z]))?(?: ?- ?\\d{1,4})?"; }
};

} // namespace extractors
} // namespace piishield

#endif // PIISHIELD_EXTRACTORS_ADDRESS_EXTRACTOR_HPP
