#ifndef PIISHIELD_EXTRACTORS_IDENTIFIER_EXTRACTOR_HPP
#define PIISHIELD_EXTRACTORS_IDENTIFIER_EXTRACTOR_HPP

#include <cstddef>
#include <regex>
#include <string>
#include <utility>
#include <vector>
#include "extractor.hpp"
#include "../validation/id_validators.hpp"

/**
 * @file identifier_extractor.hpp
 * @brief German government identifiers: Steuer-ID, Rentenversicherungsnummer,
 *        Personalausweis, Reisepass and Führerschein numbers.
 *
 * Every match goes through its validator in id_validators.hpp; a failing
 * match is discarded. Grouping spaces inside a Steuer-ID or
 * Rentenversicherungsnummer are accepted and kept inside the span.
 */

namespace piishield {
namespace extractors {

class IdentifierExtractor : public CandidateExtractor
{
public:
    static constexpr double TAX_ID_CONFIDENCE = 0.95;
    static constexpr double SOCIAL_SECURITY_CONFIDENCE = 0.95;
    static constexpr double DOCUMENT_CONFIDENCE = 0.90;
    static constexpr double DRIVER_LICENSE_CONFIDENCE = 0.90;

    core::ExtractorKind kind() const override { return core::ExtractorKind::IDENTIFIER; }

    std::vector<core::Candidate> extract(const std::string &text) const override
    {
        std::vector<core::Candidate> out;

        static const std::regex taxIdRegex(R"(\d{2} ?\d{3} ?\d{3} ?\d{3})");
        scan(text, taxIdRegex, out, [](const std::string &compact, core::Candidate &c) {
            if (!validation::isValidTaxId(compact)) {
                return false;
            }
            c.type = core::PiiType::ID_TAX_ID;
            c.confidence = TAX_ID_CONFIDENCE;
            return true;
        });

        static const std::regex pensionRegex(R"(\d{2} ?\d{6} ?[A-Z] ?\d{3})");
        scan(text, pensionRegex, out, [](const std::string &compact, core::Candidate &c) {
            if (!validation::isValidPensionInsuranceNumber(compact)) {
                return false;
            }
            c.type = core::PiiType::ID_SOCIAL_SECURITY;
            c.confidence = SOCIAL_SECURITY_CONFIDENCE;
            return true;
        });

        static const std::regex documentRegex(R"([CFGHJKLMNPRTVWXYZ][CFGHJKLMNPRTVWXYZ0-9]{8}[0-9]?)");
        scan(text, documentRegex, out, [](const std::string &compact, core::Candidate &c) {
            switch (validation::classifyDocumentNumber(compact)) {
                case validation::DocumentKind::PASSPORT:
                    c.type = core::PiiType::ID_PASSPORT;
                    c.metadata["document"] = "reisepass";
                    break;
                case validation::DocumentKind::ID_CARD:
                    c.type = core::PiiType::ID_ID_CARD;
                    c.metadata["document"] = "personalausweis";
                    break;
                case validation::DocumentKind::NONE:
                    return false;
            }
            c.confidence = DOCUMENT_CONFIDENCE;
            return true;
        });

        static const std::regex licenseRegex(R"([A-Z0-9]{11})");
        scan(text, licenseRegex, out, [](const std::string &compact, core::Candidate &c) {
            if (!validation::isValidDriverLicense(compact)) {
                return false;
            }
            c.type = core::PiiType::ID_DRIVER_LICENSE;
            c.confidence = DRIVER_LICENSE_CONFIDENCE;
            return true;
        });

        return out;
    }

private:
    /**
     * @brief Run @p re over @p text; @p accept receives the match without
     *        spaces and fills in type and confidence, or returns false to drop it.
     */
    template <typename Accept>
    void scan(const std::string &text, const std::regex &re,
              std::vector<core::Candidate> &out, Accept accept) const
    {
        forEachMatch(text, re, [&](const std::smatch &m, std::size_t start, std::size_t end) {
            if (!isolated(text, start, end)) {
                return;
            }
            core::Candidate c = core::makeCandidate(text, start, end, core::PiiType::ID_TAX_ID,
                                                    0.0, kind());
            if (accept(util::text::removeChars(m.str(), " "), c)) {
                out.push_back(std::move(c));
            }
        });
    }
};

} // namespace extractors
} // namespace piishield

#endif // PIISHIELD_EXTRACTORS_IDENTIFIER_EXTRACTOR_HPP
