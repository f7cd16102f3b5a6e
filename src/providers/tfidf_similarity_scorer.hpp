#ifndef PIISHIELD_PROVIDERS_TFIDF_SIMILARITY_SCORER_HPP
#define PIISHIELD_PROVIDERS_TFIDF_SIMILARITY_SCORER_HPP

#include <algorithm>
#include <cmath>
#include <map>
#include <set>
#include <string>
#include <vector>
#include "similarity_scorer.hpp"
#include "../util/text_utils.hpp"

/**
 * @file tfidf_similarity_scorer.hpp
 * @brief Vector-space similarity: TF-IDF fitted on the reference corpus,
 *        cosine against each corpus phrase, maximum wins.
 *
 * DESIGN GOALS:
 *   - The vocabulary is the corpus. Window terms the corpus never uses carry
 *     no weight (they neither help nor hurt), numbers and stopwords are
 *     dropped before weighting.
 *   - idf(t) = ln((1 + N) / (1 + df(t))) + 1 over the N corpus phrases.
 *   - An empty window vector scores 0.
 *   - No state: the model is rebuilt from the corpus argument on each call,
 *     which for a dozen short phrases costs less than the regex passes.
 *
 * USAGE EXAMPLE:
 *   @code
 *   TfIdfSimilarityScorer scorer;
 *   double s = scorer.similarity("also 40 Jahre alt", {"jahre alt", "feiert geburtstag"});
 *   // s == 1.0
 *   @endcode
 */

namespace piishield {
namespace providers {

class TfIdfSimilarityScorer : public SimilarityScorer
{
public:
    std::string name() const override { return "tfidf"; }

    /**
     * @brief Lowercased word tokens without digits-only tokens, one-letter
     *        tokens and German stopwords.
     */
    static std::vector<std::string> tokenize(const std::string &text)
    {
        std::vector<std::string> tokens;
        for (const auto &word : util::text::wordSpans(util::text::toLower(text))) {
            if (word.text.size() < 2) {
                continue;
            }
            if (util::text::digitsOnly(word.text).size() == word.text.size()) {
                continue;
            }
            if (stopwords().count(word.text) > 0) {
                continue;
            }
            tokens.push_back(word.text);
        }
        return tokens;
    }

    double similarity(const std::string &window, const std::vector<std::string> &corpus) const override
    {
        if (corpus.empty()) {
            return 0.0;
        }

        std::vector<std::vector<std::string>> phrases;
        std::map<std::string, int> documentFrequency;
        for (const auto &phrase : corpus) {
            phrases.push_back(tokenize(phrase));
            std::set<std::string> unique(phrases.back().begin(), phrases.back().end());
            for (const auto &term : unique) {
                ++documentFrequency[term];
            }
        }

        const double n = static_cast<double>(corpus.size());
        std::map<std::string, double> idf;
        for (const auto &entry : documentFrequency) {
            idf[entry.first] = std::log((1.0 + n) / (1.0 + entry.second)) + 1.0;
        }

        Vector windowVector = weigh(tokenize(window), idf);
        if (windowVector.empty()) {
            return 0.0;
        }

        double best = 0.0;
        for (const auto &terms : phrases) {
            best = std::max(best, cosine(windowVector, weigh(terms, idf)));
        }
        return std::min(1.0, std::max(0.0, best));
    }

private:
    using Vector = std::map<std::string, double>;

    // Term frequency times idf; out-of-vocabulary terms are skipped.
    static Vector weigh(const std::vector<std::string> &terms, const std::map<std::string, double> &idf)
    {
        Vector v;
        for (const auto &term : terms) {
            auto it = idf.find(term);
            if (it != idf.end()) {
                v[term] += it->second;
            }
        }
        return v;
    }

    static double cosine(const Vector &a, const Vector &b)
    {
        double dot = 0.0;
        double normA = 0.0;
        double normB = 0.0;
        for (const auto &entry : a) {
            normA += entry.second * entry.second;
            auto it = b.find(entry.first);
            if (it != b.end()) {
                dot += entry.second * it->second;
            }
        }
        for (const auto &entry : b) {
            normB += entry.second * entry.second;
        }
        if (normA == 0.0 || normB == 0.0) {
            return 0.0;
        }
        return dot / (std::sqrt(normA) * std::sqrt(normB));
    }

    static const std::set<std::string> &stopwords()
    {
        static const std::set<std::string> words = {
            "ich", "bin", "ist", "er", "sie", "es", "wir", "ihr", "sind", "war",
            "am", "im", "in", "an", "ab", "auf", "aus", "bei", "mit", "von", "vom",
            "zu", "zum", "zur", "f\xC3\xBCr", "und", "oder", "der", "die", "das",
            "den", "dem", "des", "ein", "eine", "einer", "einen", "mein", "meine",
            "meiner", "sein", "seine", "also", "noch", "schon", "nur", "etwa", "ca",
            "\xC3\xBC" "ber", "unter", "nach", "vor", "seit", "um", "du"
        };
        return words;
    }
};

} // namespace providers
} // namespace piishield

#endif // PIISHIELD_PROVIDERS_TFIDF_SIMILARITY_SCORER_HPP
