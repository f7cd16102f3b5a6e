#ifndef PIISHIELD_EXTRACTORS_AGE_EXTRACTOR_HPP
#define PIISHIELD_EXTRACTORS_AGE_EXTRACTOR_HPP

#include <algorithm>
#include <cstddef>
#include <iomanip>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>
#include "extractor.hpp"
#include "config/pipeline_config.hpp"
#include "../core/errors.hpp"
#include "../providers/similarity_scorer.hpp"

/**
 * @file age_extractor.hpp
 * @brief Numbers that denote a person's age, gated by context similarity.
 *
 * DESIGN GOALS:
 *   - Any stand-alone number from 0 to 120 is a possible age. Numbers that are
 *     part of a date, time, decimal or range ("12.04.1985", "9:30", "3,5")
 *     are not.
 *   - The words around the number (ageContextWords on each side) are scored
 *     against ageReferenceCorpus by the SimilarityScorer. A score at or above
 *     ageThreshold accepts the number.
 *   - Accepted ages are typed by bucket (AGE:CHILD, AGE:TEEN, AGE:ADULT,
 *     AGE:SENIOR) and carry the score as their confidence, so a barely
 *     accepted age loses conflicts against any more certain detection.
 *
 * USAGE EXAMPLE:
 *   @code
 *   AgeExtractor ages(cfg, std::make_shared<providers::TfIdfSimilarityScorer>());
 *   auto found = ages.extract("Ich bin also 40 Jahre alt.");
 *   // AGE:ADULT "40", metadata calculated_age = "40"
 *   @endcode
 */

namespace piishield {
namespace extractors {

class AgeExtractor : public CandidateExtractor
{
public:
    static constexpr int MAX_AGE = 120;

    /**
     * @throw core::ProviderUnavailable if @p scorer is null.
     */
    AgeExtractor(const config::PipelineConfig &config,
                 std::shared_ptr<const providers::SimilarityScorer> scorer)
        : config_(config)
        , scorer_(std::move(scorer))
    {
        if (!scorer_) {
            throw core::ProviderUnavailable("AgeExtractor: no similarity scorer configured");
        }
    }

    core::ExtractorKind kind() const override { return core::ExtractorKind::AGE; }

    std::vector<core::Candidate> extract(const std::string &text) const override
    {
        std::vector<core::Candidate> out;
        std::vector<util::text::WordSpan> words = util::text::wordSpans(text);

        for (std::size_t i = 0; i < words.size(); ++i) {
            const auto &word = words[i];
            if (word.text.size() > 3 || util::text::digitsOnly(word.text).size() != word.text.size()) {
                continue;
            }
            int value = std::stoi(word.text);
            if (value > MAX_AGE || partOfLargerNumber(text, word.start, word.end)) {
                continue;
            }

            double score = scorer_->similarity(contextWindow(words, i), config_.ageReferenceCorpus);
            if (!(score >= 0.0 && score <= 1.0)) {
                throw core::ExtractionError(name(), "similarity score outside [0,1]");
            }
            if (!accepts(score)) {
                continue;
            }

            std::ostringstream similarity;
            similarity << std::fixed << std::setprecision(3) << score;
            out.push_back(core::makeCandidate(text, word.start, word.end, core::ageBucket(value),
                                              score, kind(),
                                              {{"calculated_age", std::to_string(value)},
                                               {"similarity", similarity.str()}}));
        }
        return out;
    }

    /// Threshold policy: inclusive.
    bool accepts(double score) const { return score >= config_.ageThreshold; }

private:
    // Digits glued to other digits through '.', ',', ':', '/' or '-'.
    static bool partOfLargerNumber(const std::string &text, std::size_t start, std::size_t end)
    {
        static const std::string joiners = ".,:/-";
        if (start >= 2 && joiners.find(text[start - 1]) != std::string::npos
            && util::text::isDigit(text[start - 2])) {
            return true;
        }
        if (end + 1 < text.size() && joiners.find(text[end]) != std::string::npos
            && util::text::isDigit(text[end + 1])) {
            return true;
        }
        return false;
    }

    std::string contextWindow(const std::vector<util::text::WordSpan> &words, std::size_t index) const
    {
        std::size_t k = config_.ageContextWords;
        std::size_t first = index > k ? index - k : 0;
        std::size_t last = std::min(words.size() - 1, index + k);
        std::string window;
        for (std::size_t j = first; j <= last; ++j) {
            if (!window.empty()) {
                window += ' ';
            }
            window += words[j].text;
        }
        return window;
    }

    const config::PipelineConfig &config_;
    std::shared_ptr<const providers::SimilarityScorer> scorer_;
};

} // namespace extractors
} // namespace piishield

#endif // PIISHIELD_EXTRACTORS_AGE_EXTRACTOR_HPP
