#ifndef PIISHIELD_EXTRACTORS_ENTITY_EXTRACTOR_HPP
#define PIISHIELD_EXTRACTORS_ENTITY_EXTRACTOR_HPP

#include <cstddef>
#include <exception>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include "extractor.hpp"
#include "config/pipeline_config.hpp"
#include "../core/errors.hpp"
#include "../providers/entity_recognizer.hpp"
#include "../util/logger.hpp"

/**
 * @file entity_extractor.hpp
 * @brief Adapter between an EntityRecognizer and the candidate pipeline.
 *
 * DESIGN GOALS:
 *   - One recognize() call per string. Provider labels map onto the taxonomy:
 *       PER, PERSON                          -> PERSON
 *       LOC, GPE, LOCATION                   -> LOCATION
 *       MED_CONDITION, DISEASE, CONDITION    -> MEDICAL:CONDITION
 *       MED_MEDICATION, DRUG, MEDICATION     -> MEDICAL:MEDICATION
 *       MED_PROCEDURE, PROCEDURE             -> MEDICAL:PROCEDURE
 *     Other labels are ignored.
 *   - Candidates keep the provider's score as their confidence. Scores below
 *     entityMinScore are dropped.
 *   - LOCATION spans (bare city names) are kept in the text unless
 *     redactLocations is set.
 *   - Leading titles are stripped from PERSON spans ("Frau Müller" -> "Müller")
 *     when stripPersonTitles is set. Blocklisted terms are dropped after that.
 *   - A recognizer that is not thread-safe is called under a single lock.
 *   - Any exception from the recognizer becomes an ExtractionError.
 */

namespace piishield {
namespace extractors {

class EntityExtractor : public CandidateExtractor
{
public:
    /**
     * @throw core::ProviderUnavailable if @p recognizer is null.
     */
    EntityExtractor(const config::PipelineConfig &config,
                    std::shared_ptr<const providers::EntityRecognizer> recognizer)
        : config_(config)
        , recognizer_(std::move(recognizer))
    {
        if (!recognizer_) {
            throw core::ProviderUnavailable("EntityExtractor: no entity recognizer configured");
        }
        serialize_ = !recognizer_->isThreadSafe();
        for (const auto &term : config_.entityBlocklist) {
            entityBlocklist_.insert(util::text::toLower(term));
        }
        for (const auto &term : config_.personBlocklist) {
            personBlocklist_.insert(util::text::toLower(term));
        }
        if (serialize_) {
            util::logger::info("EntityExtractor: recognizer '" + recognizer_->name()
                               + "' is not thread-safe, calls are serialized");
        }
    }

    core::ExtractorKind kind() const override { return core::ExtractorKind::ENTITY_MODEL; }

    /**
     * @brief Taxonomy type for a provider label.
     * @return false for labels with no counterpart.
     */
    static bool mapLabel(const std::string &label, core::PiiType &type)
    {
        std::string upper = util::text::toUpperAscii(label);
        if (upper == "PER" || upper == "PERSON") {
            type = core::PiiType::PERSON;
        } else if (upper == "LOC" || upper == "GPE" || upper == "LOCATION") {
            type = core::PiiType::LOCATION;
        } else if (upper == "MED_CONDITION" || upper == "DISEASE" || upper == "CONDITION") {
            type = core::PiiType::MEDICAL_CONDITION;
        } else if (upper == "MED_MEDICATION" || upper == "DRUG" || upper == "MEDICATION") {
            type = core::PiiType::MEDICAL_MEDICATION;
        } else if (upper == "MED_PROCEDURE" || upper == "PROCEDURE") {
            type = core::PiiType::MEDICAL_PROCEDURE;
        } else {
            return false;
        }
        return true;
    }

    std::vector<core::Candidate> extract(const std::string &text) const override
    {
        std::vector<providers::RecognizedEntity> entities = callRecognizer(text);

        std::vector<core::Candidate> out;
        std::size_t rejected = 0;
        for (const auto &entity : entities) {
            core::PiiType type = core::PiiType::PERSON;
            if (!mapLabel(entity.label, type)) {
                continue;
            }
            if (entity.end <= entity.start || entity.end > text.size()
                || !(entity.score >= 0.0 && entity.score <= 1.0)) {
                ++rejected;
                continue;
            }
            if (entity.score < config_.entityMinScore) {
                continue;
            }
            if (type == core::PiiType::LOCATION && !config_.redactLocations) {
                continue;
            }

            std::size_t start = entity.start;
            std::size_t end = entity.end;
            trimSpan(text, start, end);
            if (type == core::PiiType::PERSON && config_.stripPersonTitles) {
                start = skipTitles(text, start, end);
            }
            if (start >= end) {
                continue;
            }

            std::string lowered = util::text::toLower(text.substr(start, end - start));
            if (entityBlocklist_.count(lowered) > 0) {
                continue;
            }
            if (type == core::PiiType::PERSON && personBlocklist_.count(lowered) > 0) {
                continue;
            }

            out.push_back(core::makeCandidate(text, start, end, type, entity.score, kind(),
                                              {{"label", entity.label}}));
        }

        if (rejected > 0) {
            util::logger::warn("EntityExtractor: ignored " + std::to_string(rejected)
                               + " malformed span(s) from recognizer '" + recognizer_->name() + "'");
        }
        return out;
    }

private:
    std::vector<providers::RecognizedEntity> callRecognizer(const std::string &text) const
    {
        try {
            if (serialize_) {
                std::lock_guard<std::mutex> lock(recognizerMutex_);
                return recognizer_->recognize(text);
            }
            return recognizer_->recognize(text);
        } catch (const core::ExtractionError &) {
            throw;
        } catch (const std::exception &e) {
            throw core::ExtractionError(name(), recognizer_->name() + ": " + e.what());
        }
    }

    // Shrink [start, end) past surrounding whitespace.
    static void trimSpan(const std::string &text, std::size_t &start, std::size_t &end)
    {
        while (start < end && util::text::isSpace(text[start])) {
            ++start;
        }
        while (end > start && util::text::isSpace(text[end - 1])) {
            --end;
        }
    }

    // Advance start past leading honorifics and the whitespace after them. A span
    // holding nothing but titles comes back empty.
    static std::size_t skipTitles(const std::string &text, std::size_t start, std::size_t end)
    {
        static const std::vector<std::string> titles = {
            "Rechtsanw\xC3\xA4ltin", "Rechtsanwalt", "Anw\xC3\xA4ltin", "Anwalt",
            "Notarin", "Notar", "Herrn", "Herr", "Frau", "Prof.", "Dr."
        };
        bool stripped = true;
        while (stripped) {
            stripped = false;
            for (const auto &title : titles) {
                std::size_t after = start + title.size();
                if (after > end || text.compare(start, title.size(), title) != 0
                    || (after < end && !util::text::isSpace(text[after]))) {
                    continue;
                }
                start = after;
                while (start < end && util::text::isSpace(text[start])) {
                    ++start;
                }
                stripped = true;
                break;
            }
        }
        return start;
    }

    const config::PipelineConfig &config_;
    std::shared_ptr<const providers::EntityRecognizer> recognizer_;
    bool serialize_;
    mutable std::mutex recognizerMutex_;
    std::set<std::string> entityBlocklist_;
    std::set<std::string> personBlocklist_;
};

} // namespace extractors
} // namespace piishield

#endif // PIISHIELD_EXTRACTORS_ENTITY_EXTRACTOR_HPP
