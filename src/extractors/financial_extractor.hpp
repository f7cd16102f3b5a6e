#ifndef PIISHIELD_EXTRACTORS_FINANCIAL_EXTRACTOR_HPP
#define PIISHIELD_EXTRACTORS_FINANCIAL_EXTRACTOR_HPP

#include <algorithm>
#include <cstddef>
#include <regex>
#include <string>
#include <vector>
#include "extractor.hpp"
#include "../validation/validators.hpp"

/**
 * @file financial_extractor.hpp
 * @brief IBANs and payment card numbers, each gated by its checksum.
 *
 * IBANs may be written in groups of four ("DE89 3704 0044 0532 0130 00") and
 * in either case. The pattern is greedy and can run into a following IBAN, so
 * the span is cut back to the length the country table prescribes and the
 * scan resumes at the cut.
 *
 * Card numbers are read as runs of digit groups. The longest group-aligned
 * prefix with 13 to 19 digits, a passing Luhn check and a known brand prefix
 * (Visa, Mastercard, American Express, Discover) is taken, which keeps a
 * trailing expiry date or a second card out of the span.
 */

namespace piishield {
namespace extractors {

class FinancialExtractor : public CandidateExtractor
{
public:
    static constexpr double IBAN_CONFIDENCE = 0.99;
    static constexpr double CARD_CONFIDENCE = 0.95;

    core::ExtractorKind kind() const override { return core::ExtractorKind::FINANCIAL; }

    std::vector<core::Candidate> extract(const std::string &text) const override
    {
        std::vector<core::Candidate> out;
        extractIbans(text, out);
        extractCards(text, out);
        return out;
    }

private:
    void extractIbans(const std::string &text, std::vector<core::Candidate> &out) const
    {
        static const std::regex ibanRegex(R"([A-Z]{2}\d{2}(?: ?[A-Z0-9]){11,30})", std::regex::icase);

        scanMatches(text, ibanRegex, [&](const std::smatch &, std::size_t start, std::size_t end) -> std::size_t {
            if (start > 0 && util::text::isWordByte(text[start - 1])) {
                return start + 1;
            }
            std::string country = util::text::toUpperAscii(text.substr(start, 2));
            std::size_t expected = validation::ibanLengthFor(country);
            if (expected == 0) {
                return start + 1;
            }

            // Walk forward until `expected` alphanumerics have been seen.
            std::size_t seen = 0;
            std::size_t cut = start;
            while (cut < end && seen < expected) {
                if (text[cut] != ' ') {
                    ++seen;
                }
                ++cut;
            }
            if (seen != expected || (cut < text.size() && util::text::isWordByte(text[cut]))) {
                return start + 1;
            }
            if (!validation::isValidIban(text.substr(start, cut - start))) {
                return start + 1;
            }
            out.push_back(core::makeCandidate(text, start, cut, core::PiiType::FINANCIAL_IBAN,
                                              IBAN_CONFIDENCE, kind(), {{"country", country}}));
            return cut;
        });
    }

    void extractCards(const std::string &text, std::vector<core::Candidate> &out) const
    {
        static const std::regex groupsRegex(R"(\d+(?:[ \-]\d+)*)");
        static const int maxDigitGroups = 5;

        scanMatches(text, groupsRegex, [&](const std::smatch &, std::size_t start, std::size_t end) -> std::size_t {
            // End offset of every digit group in the run.
            std::vector<std::size_t> groupEnds;
            for (std::size_t i = start; i < end; ++i) {
                if (i + 1 == end || !util::text::isDigit(text[i + 1])) {
                    if (util::text::isDigit(text[i])) {
                        groupEnds.push_back(i + 1);
                    }
                }
            }
            std::size_t nextGroup = groupEnds.front();
            if (start > 0 && util::text::isWordByte(text[start - 1])) {
                return nextGroup;
            }

            std::size_t limit = std::min(groupEnds.size(), static_cast<std::size_t>(maxDigitGroups));
            for (std::size_t k = limit; k > 0; --k) {
                std::size_t cut = groupEnds[k - 1];
                if (cut == end && cut < text.size() && util::text::isWordByte(text[cut])) {
                    continue;
                }
                std::string raw = text.substr(start, cut - start);
                if (!validation::luhnValid(raw)) {
                    continue;
                }
                std::string brand = validation::cardBrand(util::text::digitsOnly(raw));
                if (brand.empty()) {
                    continue;
                }
                out.push_back(core::makeCandidate(text, start, cut, core::PiiType::FINANCIAL_CREDIT_CARD,
                                                  CARD_CONFIDENCE, kind(), {{"card_brand", brand}}));
                return cut;
            }
            return nextGroup;
        });
    }
};

} // namespace extractors
} // namespace piishield

#endif // PIISHIELD_EXTRACTORS_FINANCIAL_EXTRACTOR_HPP
