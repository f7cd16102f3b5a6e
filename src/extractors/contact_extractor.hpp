#ifndef PIISHIELD_EXTRACTORS_CONTACT_EXTRACTOR_HPP
#define PIISHIELD_EXTRACTORS_CONTACT_EXTRACTOR_HPP

#include <cstddef>
#include <regex>
#include <string>
#include <utility>
#include <vector>
#include "extractor.hpp"

/**
 * @file contact_extractor.hpp
 * @brief E-mail addresses, URLs and German phone numbers.
 *
 * DESIGN GOALS:
 *   - Strict, fixed-structure patterns with fixed confidences. A loose match
 *     is not reported at a lower confidence; it is not reported at all.
 *   - Phone numbers must carry a German prefix (0, +49 or 0049) and have
 *     6 to 15 national digits. The national form decides the metadata:
 *     number_type (mobile for 015x/016x/017x, landline otherwise) and region
 *     for well-known area codes.
 *   - A phone match that runs on into a following digit group (a second
 *     number, a postcode) is cut back at a separator and the scan resumes
 *     at the cut.
 *
 * USAGE EXAMPLE:
 *   @code
 *   ContactExtractor contact;
 *   auto found = contact.extract("Schreib an max@example.de oder ruf 040-12345678 an.");
 *   // CONTACT:EMAIL "max@example.de", CONTACT:PHONE "040-12345678"
 *   @endcode
 */

namespace piishield {
namespace extractors {

class ContactExtractor : public CandidateExtractor
{
public:
    static constexpr double EMAIL_CONFIDENCE = 0.95;
    static constexpr double URL_CONFIDENCE = 0.90;
    static constexpr double PHONE_CONFIDENCE = 0.85;

    core::ExtractorKind kind() const override { return core::ExtractorKind::CONTACT_PATTERN; }

    std::vector<core::Candidate> extract(const std::string &text) const override
    {
        std::vector<core::Candidate> out;
        extractEmails(text, out);
        extractUrls(text, out);
        extractPhones(text, out);
        return out;
    }

    /**
     * @brief Region name for a national number ("04012345678" -> "Hamburg"),
     *        empty if the area code is not in the table.
     */
    static std::string regionFor(const std::string &national)
    {
        static const std::vector<std::pair<std::string, std::string>> areaCodes = {
            {"030", "Berlin"},
            {"040", "Hamburg"},
            {"089", "M\xC3\xBCnchen"},
            {"069", "Frankfurt am Main"},
            {"0221", "K\xC3\xB6ln"},
            {"0211", "D\xC3\xBCsseldorf"},
            {"0711", "Stuttgart"},
            {"0341", "Leipzig"},
            {"0351", "Dresden"},
            {"0511", "Hannover"},
            {"0911", "N\xC3\xBCrnberg"},
            {"0421", "Bremen"},
            {"0201", "Essen"},
            {"0231", "Dortmund"}
        };
        for (const auto &entry : areaCodes) {
            if (national.compare(0, entry.first.size(), entry.first) == 0) {
                return entry.second;
            }
        }
        return std::string();
    }

    /// "mobile" for 015x, 016x and 017x, "landline" otherwise.
    static std::string numberTypeFor(const std::string &national)
    {
        if (national.size() >= 3 && national[0] == '0' && national[1] == '1'
            && (national[2] == '5' || national[2] == '6' || national[2] == '7')) {
            return "mobile";
        }
        return "landline";
    }

private:
    void extractEmails(const std::string &text, std::vector<core::Candidate> &out) const
    {
        static const std::regex emailRegex(
            R"([A-Za-z0-9._%+\-]+@[A-Za-z0-9\-]+(?:\.[A-Za-z0-9\-]+)*\.[A-Za-z]{2,})");

        forEachMatch(text, emailRegex, [&](const std::smatch &, std::size_t start, std::size_t end) {
            if (!isolated(text, start, end)) {
                return;
            }
            out.push_back(core::makeCandidate(text, start, end, core::PiiType::CONTACT_EMAIL,
                                              EMAIL_CONFIDENCE, kind()));
        });
    }

    void extractUrls(const std::string &text, std::vector<core::Candidate> &out) const
    {
        static const std::regex urlRegex(R"((?:https?://|www\.)[^\s<>"']+)", std::regex::icase);
        static const std::string trailing = ".,;:!?)]}";

        forEachMatch(text, urlRegex, [&](const std::smatch &, std::size_t start, std::size_t end) {
            if (start > 0 && (util::text::isWordByte(text[start - 1]) || text[start - 1] == '@'
                              || text[start - 1] == '.')) {
                return;
            }
            while (end > start && trailing.find(text[end - 1]) != std::string::npos) {
                --end;
            }
            // The host part needs at least one dot.
            std::string matched = util::text::toLower(text.substr(start, end - start));
            std::size_t hostStart = matched.compare(0, 4, "www.") == 0 ? 4 : matched.find("://") + 3;
            if (hostStart >= matched.size() || matched.find('.', hostStart) == std::string::npos) {
                return;
            }
            out.push_back(core::makeCandidate(text, start, end, core::PiiType::CONTACT_URL,
                                              URL_CONFIDENCE, kind()));
        });
    }

    void extractPhones(const std::string &text, std::vector<core::Candidate> &out) const
    {
        static const std::string PHONE_SEPARATORS = " -/";
        static const std::regex phoneRegex(
            R"((?:\+49[ \-]?|0049[ \-]?|0)(?:\(0\) ?)?\d{2,5}(?:[ \-/]?\d{2,}){1,4})");

        scanMatches(text, phoneRegex, [&](const std::smatch &, std::size_t start, std::size_t end) -> std::size_t {
            if (start > 0 && util::text::isWordByte(text[start - 1])) {
                return end;
            }
            // "12.04" or "3,040" are not phone numbers.
            if (start >= 2 && (text[start - 1] == '.' || text[start - 1] == ',' || text[start - 1] == '/')
                && util::text::isDigit(text[start - 2])) {
                return end;
            }

            // The whole match first, then prefixes ending before a group that
            // opens with a trunk 0 (a second number), then any shorter prefix
            // ending before a separator (a trailing postcode or count).
            std::vector<std::size_t> cuts{end};
            std::vector<std::size_t> plainCuts;
            for (std::size_t i = end - 1; i > start; --i) {
                if (PHONE_SEPARATORS.find(text[i]) == std::string::npos || !util::text::isDigit(text[i - 1])) {
                    continue;
                }
                if (i + 1 < end && text[i + 1] == '0') {
                    cuts.push_back(i);
                } else {
                    plainCuts.push_back(i);
                }
            }
            cuts.insert(cuts.end(), plainCuts.begin(), plainCuts.end());
            for (std::size_t cut : cuts) {
                if (cut == end && cut < text.size() && util::text::isWordByte(text[cut])) {
                    continue;
                }
                std::string raw = text.substr(start, cut - start);
                std::string national = nationalNumber(raw);
                if (national.size() < 6 || national.size() > 15) {
                    continue;
                }

                core::Metadata metadata{{"country", "DE"}, {"number_type", numberTypeFor(national)}};
                std::string region = regionFor(national);
                if (!region.empty()) {
                    metadata["region"] = region;
                }
                out.push_back(core::makeCandidate(text, start, cut, core::PiiType::CONTACT_PHONE,
                                                  PHONE_CONFIDENCE, kind(), std::move(metadata)));
                return cut;
            }
            return end;
        });
    }

    // Digits of the number in national form, leading 0 included.
    static std::string nationalNumber(const std::string &raw)
    {
        std::string digits;
        std::size_t i = 0;
        if (raw.compare(0, 3, "+49") == 0) {
            i = 3;
            digits = "0";
        } else if (raw.compare(0, 4, "0049") == 0) {
            i = 4;
            digits = "0";
        }
        std::string rest = util::text::digitsOnly(raw.substr(i));
        // "+49 (0)30 ..." carries the trunk prefix twice.
        if (!digits.empty() && raw.find("(0)") != std::string::npos && !rest.empty() && rest[0] == '0') {
            rest.erase(0, 1);
        }
        return digits + rest;
    }
};

} // namespace extractors
} // namespace piishield

#endif // PIISHIELD_EXTRACTORS_CONTACT_EXTRACTOR_HPP
