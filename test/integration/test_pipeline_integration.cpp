// test/integration/test_pipeline_integration.cpp
// -----------------------------------------------------------
// End-to-end batches through PiiPipeline with the gazetteer recognizer and
// the TF-IDF scorer: detections, tokens, redaction and per-string failures.

#include <gtest/gtest.h>

#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/pipeline_config.hpp"
#include "core/candidate.hpp"
#include "core/errors.hpp"
#include "core/result.hpp"
#include "extractors/extractor.hpp"
#include "pipeline/pii_pipeline.hpp"
#include "providers/gazetteer_recognizer.hpp"
#include "providers/tfidf_similarity_scorer.hpp"

namespace {

using namespace piishield;
using core::PiiType;

std::unique_ptr<pipeline::PiiPipeline> makePipeline(const config::PipelineConfig& cfg = config::PipelineConfig())
{
    return std::make_unique<pipeline::PiiPipeline>(
        cfg,
        std::make_shared<providers::GazetteerRecognizer>(),
        std::make_shared<providers::TfIdfSimilarityScorer>());
}

std::multiset<PiiType> typesOf(const core::Result& r)
{
    std::multiset<PiiType> types;
    for (const auto& d : r.detections) {
        types.insert(d.type);
    }
    return types;
}

// Throws for any string containing "BOOM".
class ExplodingExtractor : public extractors::CandidateExtractor {
public:
    core::ExtractorKind kind() const override { return core::ExtractorKind::ENTITY_MODEL; }
    std::string name() const override { return "exploding"; }
    std::vector<core::Candidate> extract(const std::string& text) const override {
        if (text.find("BOOM") != std::string::npos) {
            throw std::runtime_error("detonated");
        }
        return {};
    }
};

// Emits a candidate reaching past the end of the string.
class OverreachingExtractor : public extractors::CandidateExtractor {
public:
    core::ExtractorKind kind() const override { return core::ExtractorKind::ENTITY_MODEL; }
    std::vector<core::Candidate> extract(const std::string& text) const override {
        core::Candidate c;
        c.type = PiiType::PERSON;
        c.start = 0;
        c.end = text.size() + 10;
        c.text = text;
        c.confidence = 0.9;
        c.source = kind();
        return {c};
    }
};

TEST(PipelineIntegrationTest, PersonAndAddress) {
    auto pipe = makePipeline();
    std::string text = "Hallo, ich bin Max Mustermann aus Musterstra\xC3\x9F" "e 12.";
    auto results = pipe->processBatch({text});
    ASSERT_EQ(results.size(), (size_t)1);
    const auto& r = results[0];

    EXPECT_TRUE(r.hasPii);
    EXPECT_TRUE(r.errors.empty());
    ASSERT_EQ(r.detections.size(), (size_t)2);
    EXPECT_EQ(r.detections[0].type, PiiType::PERSON);
    EXPECT_EQ(r.detections[0].text, "Max Mustermann");
    EXPECT_EQ(r.detections[1].type, PiiType::LOCATION_ADDRESS);
    EXPECT_EQ(r.detections[1].text, "Musterstra\xC3\x9F" "e 12");
    EXPECT_EQ(r.anonymizedText,
              "Hallo, ich bin [PII:PERSON_ID_3faf46bc] aus [PII:LOCATION:ADDRESS_ID_17c6330d].");
    EXPECT_GE(r.processingTimeMs, 0.0);
}

TEST(PipelineIntegrationTest, ValidIbanIsReplaced) {
    auto pipe = makePipeline();
    auto r = pipe->processText("Meine IBAN ist DE89370400440532013000");
    ASSERT_EQ(r.detections.size(), (size_t)1);
    EXPECT_EQ(r.detections[0].type, PiiType::FINANCIAL_IBAN);
    EXPECT_EQ(r.anonymizedText, "Meine IBAN ist [PII:FINANCIAL:IBAN_ID_4a337cdf]");
}

TEST(PipelineIntegrationTest, GroupedIbanBeatsOverlappingPhone) {
    auto pipe = makePipeline();
    auto r = pipe->processText("\xC3\x9C" "berweisung an DE89 3704 0044 0532 0130 00");
    ASSERT_EQ(r.detections.size(), (size_t)1);
    EXPECT_EQ(r.detections[0].type, PiiType::FINANCIAL_IBAN);
    EXPECT_EQ(r.anonymizedText, "\xC3\x9C" "berweisung an [PII:FINANCIAL:IBAN_ID_4a337cdf]");
}

TEST(PipelineIntegrationTest, BackToBackFinancialValuesAreAllReplaced) {
    auto pipe = makePipeline();
    auto ibans = pipe->processText("IBAN DE89370400440532013000 DE89370400440532013000");
    EXPECT_EQ(ibans.anonymizedText,
              "IBAN [PII:FINANCIAL:IBAN_ID_4a337cdf] [PII:FINANCIAL:IBAN_ID_4a337cdf]");

    auto card = pipe->processText("Karte 4111 1111 1111 1111 12 25 gueltig");
    ASSERT_EQ(card.detections.size(), (size_t)1);
    EXPECT_EQ(card.detections[0].type, PiiType::FINANCIAL_CREDIT_CARD);
    EXPECT_EQ(card.anonymizedText.find("4111"), std::string::npos);
    EXPECT_NE(card.anonymizedText.find(" 12 25 gueltig"), std::string::npos);
}

TEST(PipelineIntegrationTest, MalformedIbanIsLeftAlone) {
    auto pipe = makePipeline();
    std::string text = "Meine IBAN ist DE89370400440532013001";
    auto r = pipe->processText(text);
    EXPECT_FALSE(r.hasPii);
    EXPECT_TRUE(r.detections.empty());
    EXPECT_EQ(r.anonymizedText, text);
}

TEST(PipelineIntegrationTest, AgeWithContext) {
    auto pipe = makePipeline();
    auto r = pipe->processText("Ich bin also 40 Jahre alt.");
    ASSERT_EQ(r.detections.size(), (size_t)1);
    EXPECT_EQ(r.detections[0].type, PiiType::AGE_ADULT);
    EXPECT_EQ(r.anonymizedText, "Ich bin also [PII:AGE:ADULT_ID_d645920e] Jahre alt.");
}

TEST(PipelineIntegrationTest, SameValueSameTokenAcrossBatch) {
    auto pipe = makePipeline();
    auto results = pipe->processBatch({"Max Mustermann ruft an.",
                                       "Gestern rief Max Mustermann wieder an."});
    ASSERT_EQ(results.size(), (size_t)2);
    ASSERT_EQ(results[0].detections.size(), (size_t)1);
    ASSERT_EQ(results[1].detections.size(), (size_t)1);
    EXPECT_EQ(results[0].detections[0].token, results[1].detections[0].token);
    EXPECT_EQ(results[1].anonymizedText, "Gestern rief [PII:PERSON_ID_3faf46bc] wieder an.");
}

TEST(PipelineIntegrationTest, MixedRecordKeepsResultInvariants) {
    auto pipe = makePipeline();
    std::string text =
        "Frau Anna Schmidt, geboren am 03.07.1980, E-Mail anna.schmidt@example.de, "
        "Tel. 0221 9876543, wohnt in der Lindenweg 3b in K\xC3\xB6ln.";
    auto r = pipe->processText(text);

    std::multiset<PiiType> expected = {PiiType::PERSON, PiiType::DATE_BIRTH, PiiType::CONTACT_EMAIL,
                                       PiiType::CONTACT_PHONE, PiiType::LOCATION_ADDRESS};
    EXPECT_EQ(typesOf(r), expected);
    EXPECT_TRUE(r.hasPii);

    // Sorted, disjoint, and every span replaced by its token in order.
    std::string rebuilt;
    std::size_t cursor = 0;
    for (std::size_t i = 0; i < r.detections.size(); ++i) {
        const auto& d = r.detections[i];
        if (i > 0) {
            EXPECT_LE(r.detections[i - 1].end, d.start);
        }
        EXPECT_EQ(text.substr(d.start, d.end - d.start), d.text);
        rebuilt += text.substr(cursor, d.start - cursor) + d.token;
        cursor = d.end;
    }
    rebuilt += text.substr(cursor);
    EXPECT_EQ(r.anonymizedText, rebuilt);

    EXPECT_EQ(r.detections[0].text, "Anna Schmidt");
    EXPECT_NE(r.anonymizedText.find("K\xC3\xB6ln"), std::string::npos);
    EXPECT_EQ(r.anonymizedText.find("anna.schmidt"), std::string::npos);
}

TEST(PipelineIntegrationTest, CitiesOnlyRedactedWhenConfigured) {
    std::string text = "Ich wohne in Berlin.";
    auto plain = makePipeline()->processText(text);
    EXPECT_FALSE(plain.hasPii);
    EXPECT_EQ(plain.anonymizedText, text);

    config::PipelineConfig cfg;
    cfg.redactLocations = true;
    auto redacted = makePipeline(cfg)->processText(text);
    ASSERT_EQ(redacted.detections.size(), (size_t)1);
    EXPECT_EQ(redacted.detections[0].type, PiiType::LOCATION);
    EXPECT_EQ(redacted.anonymizedText.find("Berlin"), std::string::npos);
    EXPECT_EQ(redacted.anonymizedText.find("Ich wohne in [PII:LOCATION_ID_"), (size_t)0);
}

TEST(PipelineIntegrationTest, DisabledExtractorsProduceNothing) {
    config::PipelineConfig cfg;
    cfg.extractors.financial = false;
    auto pipe = makePipeline(cfg);
    std::string text = "Meine IBAN ist DE89370400440532013000";
    auto r = pipe->processText(text);
    EXPECT_FALSE(r.hasPii);
    EXPECT_EQ(r.anonymizedText, text);

    for (const auto& name : pipe->extractorNames()) {
        EXPECT_NE(name, "financial");
    }
}

TEST(PipelineIntegrationTest, ExtractorFailureIsConfinedToItsString) {
    auto pipe = makePipeline();
    pipe->addExtractor(std::make_unique<ExplodingExtractor>());

    auto results = pipe->processBatch({"BOOM sagt Max Mustermann", "Max Mustermann"});
    ASSERT_EQ(results.size(), (size_t)2);

    ASSERT_EQ(results[0].errors.size(), (size_t)1);
    EXPECT_EQ(results[0].errors[0].source, "exploding");
    EXPECT_EQ(results[0].errors[0].message, "detonated");
    ASSERT_EQ(results[0].detections.size(), (size_t)1);
    EXPECT_EQ(results[0].detections[0].type, PiiType::PERSON);

    EXPECT_TRUE(results[1].errors.empty());
    EXPECT_TRUE(results[1].hasPii);
}

TEST(PipelineIntegrationTest, WholeStringFailureReturnsInputUnchanged) {
    auto pipe = makePipeline();
    pipe->addExtractor(std::make_unique<OverreachingExtractor>());

    std::string text = "Max Mustermann";
    auto results = pipe->processBatch({text});
    ASSERT_EQ(results.size(), (size_t)1);
    EXPECT_FALSE(results[0].hasPii);
    EXPECT_TRUE(results[0].detections.empty());
    EXPECT_EQ(results[0].anonymizedText, text);
    ASSERT_EQ(results[0].errors.size(), (size_t)1);
    EXPECT_EQ(results[0].errors[0].source, "pipeline");

    EXPECT_THROW(pipe->processText(text), std::out_of_range);
}

TEST(PipelineIntegrationTest, EmptyBatchIsInputError) {
    auto pipe = makePipeline();
    EXPECT_THROW(pipe->processBatch({}), core::InputError);
    EXPECT_THROW(pipe->addExtractor(nullptr), std::invalid_argument);
}

TEST(PipelineIntegrationTest, EmptyStringHasNoPii) {
    auto r = makePipeline()->processText("");
    EXPECT_FALSE(r.hasPii);
    EXPECT_EQ(r.anonymizedText, "");
}

TEST(PipelineIntegrationTest, WorkerThreadsPreserveOrder) {
    std::vector<std::string> texts;
    for (int i = 0; i < 24; ++i) {
        texts.push_back("Eintrag " + std::to_string(i) + " von Max Mustermann");
    }

    config::PipelineConfig parallel;
    parallel.workerThreads = 4;
    auto threaded = makePipeline(parallel)->processBatch(texts);
    auto sequential = makePipeline()->processBatch(texts);

    ASSERT_EQ(threaded.size(), texts.size());
    for (std::size_t i = 0; i < texts.size(); ++i) {
        EXPECT_EQ(threaded[i].anonymizedText, sequential[i].anonymizedText);
        EXPECT_EQ(threaded[i].anonymizedText,
                  "Eintrag " + std::to_string(i) + " von [PII:PERSON_ID_3faf46bc]");
    }
}

} // anonymous namespace
