#ifndef PIISHIELD_EXTRACTORS_DATE_EXTRACTOR_HPP
#define PIISHIELD_EXTRACTORS_DATE_EXTRACTOR_HPP

#include <algorithm>
#include <cstddef>
#include <regex>
#include <string>
#include <vector>
#include "extractor.hpp"

/**
 * @file date_extractor.hpp
 * @brief Birth dates written as dd.mm.yyyy next to a birth keyword.
 *
 * A bare date is not personal data ("Termin am 12.04.2025"), so a date only
 * becomes DATE:BIRTH when "geboren", "geb.", "Geburtsdatum" or "Geburtstag"
 * appears within KEYWORD_WINDOW bytes before or after it.
 */

namespace piishield {
namespace extractors {

class DateExtractor : public CandidateExtractor
{
public:
    static constexpr double BIRTH_DATE_CONFIDENCE = 0.90;
    static constexpr std::size_t KEYWORD_WINDOW = 40;

    core::ExtractorKind kind() const override { return core::ExtractorKind::DATE; }

    std::vector<core::Candidate> extract(const std::string &text) const override
    {
        static const std::regex dateRegex(R"((\d{1,2})\.(\d{1,2})\.(\d{4}))");

        std::vector<core::Candidate> out;
        forEachMatch(text, dateRegex, [&](const std::smatch &m, std::size_t start, std::size_t end) {
            if (!isolated(text, start, end)) {
                return;
            }
            int day = std::stoi(m.str(1));
            int month = std::stoi(m.str(2));
            int year = std::stoi(m.str(3));
            if (day < 1 || day > 31 || month < 1 || month > 12 || year < 1900 || year > 2100) {
                return;
            }
            if (!hasBirthKeyword(text, start, end)) {
                return;
            }
            out.push_back(core::makeCandidate(text, start, end, core::PiiType::DATE_BIRTH,
                                              BIRTH_DATE_CONFIDENCE, kind(),
                                              {{"year", m.str(3)}}));
        });
        return out;
    }

private:
    static bool hasBirthKeyword(const std::string &text, std::size_t start, std::size_t end)
    {
        static const std::vector<std::string> keywords = {
            "geboren", "geb.", "geburtsdatum", "geburtstag"
        };
        std::size_t from = start > KEYWORD_WINDOW ? start - KEYWORD_WINDOW : 0;
        std::size_t to = std::min(text.size(), end + KEYWORD_WINDOW);
        std::string window = util::text::toLower(text.substr(from, to - from));
        for (const auto &keyword : keywords) {
            if (window.find(keyword) != std::string::npos) {
                return true;
            }
        }
        return false;
    }
};

} // namespace extractors
} // namespace piishield

#endif // PIISHIELD_EXTRACTORS_DATE_EXTRACTOR_HPP
