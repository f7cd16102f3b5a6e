// test/unit/test_age_extractor.cpp
// -----------------------------------------------------------
// Age detection: number candidates, the inclusive similarity threshold,
// age buckets, and the TF-IDF scorer it uses by default.

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "config/pipeline_config.hpp"
#include "core/errors.hpp"
#include "extractors/age_extractor.hpp"
#include "providers/similarity_scorer.hpp"
#include "providers/tfidf_similarity_scorer.hpp"

namespace {

using namespace piishield;

// Returns the same score for every window and remembers the windows it saw.
class FixedScorer : public providers::SimilarityScorer {
public:
    explicit FixedScorer(double score) : score_(score) {}

    std::string name() const override { return "fixed"; }

    double similarity(const std::string& window, const std::vector<std::string>&) const override {
        windows.push_back(window);
        return score_;
    }

    mutable std::vector<std::string> windows;

private:
    double score_;
};

TEST(AgeExtractorTest, ThresholdIsInclusive) {
    config::PipelineConfig cfg;
    cfg.ageThreshold = 0.6;
    std::string text = "Ich bin 40 Jahre alt";

    extractors::AgeExtractor below(cfg, std::make_shared<FixedScorer>(0.599));
    extractors::AgeExtractor exact(cfg, std::make_shared<FixedScorer>(0.6));
    extractors::AgeExtractor above(cfg, std::make_shared<FixedScorer>(0.601));

    EXPECT_TRUE(below.extract(text).empty());
    ASSERT_EQ(exact.extract(text).size(), (size_t)1);
    ASSERT_EQ(above.extract(text).size(), (size_t)1);
    EXPECT_TRUE(exact.accepts(0.6));
    EXPECT_FALSE(exact.accepts(0.5999));
}

TEST(AgeExtractorTest, CandidateCarriesBucketScoreAndMetadata) {
    config::PipelineConfig cfg;
    extractors::AgeExtractor ages(cfg, std::make_shared<FixedScorer>(0.75));
    auto found = ages.extract("Ich bin 40 Jahre alt");
    ASSERT_EQ(found.size(), (size_t)1);
    EXPECT_EQ(found[0].type, core::PiiType::AGE_ADULT);
    EXPECT_EQ(found[0].text, "40");
    EXPECT_EQ(found[0].start, (size_t)8);
    EXPECT_DOUBLE_EQ(found[0].confidence, 0.75);
    EXPECT_EQ(found[0].metadata.at("calculated_age"), "40");
    EXPECT_EQ(found[0].metadata.at("similarity"), "0.750");
    EXPECT_EQ(found[0].source, core::ExtractorKind::AGE);
}

TEST(AgeExtractorTest, ContextWindowSpansConfiguredWords) {
    config::PipelineConfig cfg;
    cfg.ageContextWords = 2;
    auto scorer = std::make_shared<FixedScorer>(0.0);
    extractors::AgeExtractor ages(cfg, scorer);
    ages.extract("eins zwei drei 40 vier f\xC3\xBCnf sechs");
    ASSERT_EQ(scorer->windows.size(), (size_t)1);
    EXPECT_EQ(scorer->windows[0], "zwei drei 40 vier f\xC3\xBCnf");
}

TEST(AgeExtractorTest, NumbersInsideDatesTimesAndDecimalsAreSkipped) {
    config::PipelineConfig cfg;
    auto scorer = std::make_shared<FixedScorer>(1.0);
    extractors::AgeExtractor ages(cfg, scorer);
    EXPECT_TRUE(ages.extract("Termin am 12.04.1985 um 9:30, Dosis 2,5 mg").empty());
    EXPECT_TRUE(scorer->windows.empty());
    EXPECT_TRUE(ages.extract("Es sind 121 Jahre oder 1000 Tage").empty());
}

TEST(AgeExtractorTest, ScoresOutsideUnitIntervalAreErrors) {
    config::PipelineConfig cfg;
    extractors::AgeExtractor ages(cfg, std::make_shared<FixedScorer>(1.5));
    EXPECT_THROW(ages.extract("Ich bin 40 Jahre alt"), core::ExtractionError);
}

TEST(AgeExtractorTest, MissingScorerIsProviderUnavailable) {
    config::PipelineConfig cfg;
    EXPECT_THROW(extractors::AgeExtractor(cfg, nullptr), core::ProviderUnavailable);
}

TEST(AgeExtractorTest, BucketsWithTfIdfScorer) {
    config::PipelineConfig cfg;
    extractors::AgeExtractor ages(cfg, std::make_shared<providers::TfIdfSimilarityScorer>());

    auto child = ages.extract("Mein Sohn ist 7 Jahre alt.");
    ASSERT_EQ(child.size(), (size_t)1);
    EXPECT_EQ(child[0].type, core::PiiType::AGE_CHILD);

    auto senior = ages.extract("Meine Oma wird 82 Jahre alt.");
    ASSERT_EQ(senior.size(), (size_t)1);
    EXPECT_EQ(senior[0].type, core::PiiType::AGE_SENIOR);

    EXPECT_TRUE(ages.extract("Wir treffen uns ab 9 Uhr unter den Linden").empty());
}

TEST(TfIdfSimilarityScorerTest, ExactPhraseScoresOne) {
    config::PipelineConfig cfg;
    providers::TfIdfSimilarityScorer scorer;
    EXPECT_NEAR(scorer.similarity("also 40 Jahre alt", cfg.ageReferenceCorpus), 1.0, 1e-9);
    EXPECT_EQ(scorer.similarity("ab 9 Uhr unter", cfg.ageReferenceCorpus), 0.0);
}

TEST(TfIdfSimilarityScorerTest, PartialOverlapScoresBetween) {
    providers::TfIdfSimilarityScorer scorer;
    std::vector<std::string> corpus = {"jahre alt", "feiert geburtstag"};
    double s = scorer.similarity("seit Jahren alt", corpus);
    EXPECT_GT(s, 0.0);
    EXPECT_LT(s, 1.0);
    EXPECT_EQ(scorer.similarity("Jahre alt", {}), 0.0);
}

TEST(TfIdfSimilarityScorerTest, TokenizeDropsNumbersAndStopwords) {
    auto tokens = providers::TfIdfSimilarityScorer::tokenize("Ich bin 40 Jahre ALT");
    ASSERT_EQ(tokens.size(), (size_t)2);
    EXPECT_EQ(tokens[0], "jahre");
    EXPECT_EQ(tokens[1], "alt");
}

} // anonymous namespace
