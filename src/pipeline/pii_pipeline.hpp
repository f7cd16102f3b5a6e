#ifndef PIISHIELD_PIPELINE_PII_PIPELINE_HPP
#define PIISHIELD_PIPELINE_PII_PIPELINE_HPP

#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "config/pipeline_config.hpp"
#include "../core/candidate.hpp"
#include "../core/conflict_resolver.hpp"
#include "../core/errors.hpp"
#include "../core/redactor.hpp"
#include "../core/result.hpp"
#include "../core/tokenizer.hpp"
#include "../extractors/address_extractor.hpp"
#include "../extractors/age_extractor.hpp"
#include "../extractors/contact_extractor.hpp"
#include "../extractors/date_extractor.hpp"
#include "../extractors/entity_extractor.hpp"
#include "../extractors/extractor.hpp"
#include "../extractors/financial_extractor.hpp"
#include "../extractors/identifier_extractor.hpp"
#include "../providers/entity_recognizer.hpp"
#include "../providers/similarity_scorer.hpp"
#include "../util/logger.hpp"
#include "../util/worker_pool.hpp"

/**
 * @file pii_pipeline.hpp
 * @brief Orchestrates extraction, conflict resolution, tokenization and
 *        redaction for batches of strings.
 *
 * DESIGN GOALS:
 *   - Per string: run every enabled extractor, resolve the union of their
 *     candidates, tokenize the survivors and redact. Nothing crosses string
 *     boundaries except the pure token function and read-only collaborators.
 *   - An extractor that throws costs only its own candidates for that string;
 *     the failure is logged and listed in Result::errors.
 *   - processBatch preserves input order and always returns one Result per
 *     input. A string whose processing fails as a whole comes back unchanged
 *     with a "pipeline" error.
 *   - With workerThreads > 1, strings are spread over a WorkerPool owned by the
 *     pipeline.
 *   - The configuration is copied at construction and never modified.
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace piishield;
 *   config::PipelineConfig cfg;
 *   pipeline::PiiPipeline pipe(cfg,
 *       std::make_shared<providers::GazetteerRecognizer>(),
 *       std::make_shared<providers::TfIdfSimilarityScorer>());
 *   auto results = pipe.processBatch({"Meine IBAN ist DE89370400440532013000"});
 *   // results[0].anonymizedText == "Meine IBAN ist [PII:FINANCIAL:IBAN_ID_xxxxxxxx]"
 *   @endcode
 */

namespace piishield {
namespace pipeline {

class PiiPipeline
{
public:
    /**
     * @param config Copied; the pipeline and its extractors read only this copy.
     * @param recognizer Required when the entity extractor is enabled.
     * @param scorer Required when the age extractor is enabled.
     * @param occupationFactory Occupation map used by the conflict resolver.
     * @throw core::ProviderUnavailable if a required collaborator is missing.
     */
    PiiPipeline(const config::PipelineConfig &config,
                std::shared_ptr<const providers::EntityRecognizer> recognizer,
                std::shared_ptr<const providers::SimilarityScorer> scorer,
                core::OccupationMapFactory occupationFactory = core::makeIntervalOccupationMap)
        : config_(config)
        , resolver_(std::move(occupationFactory))
    {
        const auto &on = config_.extractors;
        if (on.contact) {
            extractors_.push_back(std::make_unique<extractors::ContactExtractor>());
        }
        if (on.financial) {
            extractors_.push_back(std::make_unique<extractors::FinancialExtractor>());
        }
        if (on.identifier) {
            extractors_.push_back(std::make_unique<extractors::IdentifierExtractor>());
        }
        if (on.address) {
            extractors_.push_back(std::make_unique<extractors::AddressExtractor>());
        }
        if (on.date) {
            extractors_.push_back(std::make_unique<extractors::DateExtractor>());
        }
        if (on.age) {
            extractors_.push_back(std::make_unique<extractors::AgeExtractor>(config_, std::move(scorer)));
        }
        if (on.entity) {
            extractors_.push_back(std::make_unique<extractors::EntityExtractor>(config_, std::move(recognizer)));
        }

        if (config_.workerThreads > 1) {
            pool_ = std::make_unique<util::WorkerPool>(config_.workerThreads);
        }

        std::string names;
        for (const auto &name : extractorNames()) {
            names += (names.empty() ? "" : ", ") + name;
        }
        util::logger::info("PiiPipeline: ready with extractors [" + names + "], "
                           + std::to_string(config_.workerThreads) + " worker thread(s)");
    }

    PiiPipeline(const PiiPipeline&) = delete;
    PiiPipeline& operator=(const PiiPipeline&) = delete;

    /**
     * @brief Register an additional candidate source. Call before the first
     *        processText()/processBatch().
     */
    void addExtractor(std::unique_ptr<extractors::CandidateExtractor> extractor)
    {
        if (!extractor) {
            throw std::invalid_argument("PiiPipeline: null extractor");
        }
        util::logger::info("PiiPipeline: added extractor '" + extractor->name() + "'");
        extractors_.push_back(std::move(extractor));
    }

    const config::PipelineConfig &config() const { return config_; }

    std::vector<std::string> extractorNames() const
    {
        std::vector<std::string> names;
        for (const auto &extractor : extractors_) {
            names.push_back(extractor->name());
        }
        return names;
    }

    /**
     * @brief Detect, resolve, tokenize and redact one string.
     *
     * Extractor failures are recorded in Result::errors. Failures of the
     * resolution stage propagate to the caller.
     */
    core::Result processText(const std::string &text) const
    {
        auto begin = std::chrono::steady_clock::now();
        core::Result result;

        std::vector<core::Candidate> candidates;
        for (const auto &extractor : extractors_) {
            try {
                std::vector<core::Candidate> found = extractor->extract(text);
                candidates.insert(candidates.end(),
                                  std::make_move_iterator(found.begin()),
                                  std::make_move_iterator(found.end()));
            } catch (const std::exception &e) {
                util::logger::warn("PiiPipeline: extractor '" + extractor->name() + "' failed: " + e.what());
                result.errors.push_back({extractor->name(), e.what()});
            }
        }

        std::size_t candidateCount = candidates.size();
        for (auto &accepted : resolver_.resolve(std::move(candidates), text.size())) {
            result.detections.push_back(core::tokenize(std::move(accepted)));
        }
        result.anonymizedText = core::redact(text, result.detections);
        result.hasPii = !result.detections.empty();
        result.processingTimeMs = elapsedMs(begin);

        util::logger::debug("PiiPipeline: " + std::to_string(candidateCount) + " candidate(s), "
                            + std::to_string(result.detections.size()) + " detection(s) in "
                            + std::to_string(result.processingTimeMs) + " ms");
        return result;
    }

    /**
     * @brief Process every string of a batch; results keep the input order.
     * @throw core::InputError if @p texts is empty.
     */
    std::vector<core::Result> processBatch(const std::vector<std::string> &texts) const
    {
        if (texts.empty()) {
            throw core::InputError("processBatch: empty batch");
        }

        auto processOne = [this, &texts](std::size_t i) { return processGuarded(texts[i]); };

        std::vector<core::Result> results;
        if (pool_ && texts.size() > 1) {
            results = pool_->mapOrdered(texts.size(), processOne);
        } else {
            results.reserve(texts.size());
            for (std::size_t i = 0; i < texts.size(); ++i) {
                results.push_back(processOne(i));
            }
        }

        auto withPii = std::count_if(results.begin(), results.end(),
                                     [](const core::Result &r) { return r.hasPii; });
        util::logger::info("PiiPipeline: processed batch of " + std::to_string(texts.size())
                           + " string(s), " + std::to_string(withPii) + " with PII");
        return results;
    }

private:
    // Whole-string failures become an unchanged text plus a "pipeline" error.
    core::Result processGuarded(const std::string &text) const
    {
        auto begin = std::chrono::steady_clock::now();
        try {
            return processText(text);
        } catch (const std::exception &e) {
            util::logger::error(std::string("PiiPipeline: string processing failed: ") + e.what());
            core::Result failed;
            failed.anonymizedText = text;
            failed.errors.push_back({"pipeline", e.what()});
            failed.processingTimeMs = elapsedMs(begin);
            return failed;
        }
    }

    // Milliseconds since @p begin, rounded to two decimals.
    static double elapsedMs(std::chrono::steady_clock::time_point begin)
    {
        std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - begin;
        return std::round(elapsed.count() * 100.0) / 100.0;
    }

    const config::PipelineConfig config_;
    core::ConflictResolver resolver_;
    std::vector<std::unique_ptr<extractors::CandidateExtractor>> extractors_;
    std::unique_ptr<util::WorkerPool> pool_;
};

} // namespace pipeline
} // namespace piishield

#endif // PIISHIELD_PIPELINE_PII_PIPELINE_HPP
