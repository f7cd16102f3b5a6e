// test/unit/test_util.cpp
// -----------------------------------------------------------
// Configuration parsing, logger, worker pool, text helpers and JSON output.

#include <gtest/gtest.h>

#include <atomic>
#include <cstdio>
#include <fstream>
#include <future>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/pipeline_config.hpp"
#include "core/candidate.hpp"
#include "core/result.hpp"
#include "core/tokenizer.hpp"
#include "service/result_json.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"
#include "util/text_utils.hpp"
#include "util/worker_pool.hpp"

namespace {

using namespace piishield;
namespace logger = piishield::util::logger;

// ------------------------------------------------------------------ config

TEST(ConfigParserTest, DefaultsMatchDocumentation) {
    config::PipelineConfig cfg;
    EXPECT_DOUBLE_EQ(cfg.ageThreshold, 0.60);
    EXPECT_EQ(cfg.ageContextWords, 3u);
    EXPECT_FALSE(cfg.ageReferenceCorpus.empty());
    EXPECT_DOUBLE_EQ(cfg.entityMinScore, 0.50);
    EXPECT_FALSE(cfg.redactLocations);
    EXPECT_TRUE(cfg.stripPersonTitles);
    EXPECT_EQ(cfg.workerThreads, 1u);
    EXPECT_TRUE(cfg.extractors.entity);
}

TEST(ConfigParserTest, AppliesKeyValueLines) {
    config::PipelineConfig cfg;
    util::ConfigParser parser(cfg);
    std::istringstream in(
        "# piishield settings\n"
        "\n"
        "ageThreshold = 0.75\n"
        "ageContextWords=5\n"
        "ageReferenceCorpus = jahre alt, feiert geburtstag\n"
        "entityMinScore=0.4\n"
        "redactLocations = yes\n"
        "stripPersonTitles = off\n"
        "personBlocklist = Alexa\n"
        "workerThreads = 4\n"
        "logLevel = warn\n"
        "gazetteerDirectory = /opt/lexicon\n"
        "extractors.age = false\n"
        "someFutureKey = ignored\n");
    parser.loadFromStream(in);

    EXPECT_DOUBLE_EQ(cfg.ageThreshold, 0.75);
    EXPECT_EQ(cfg.ageContextWords, 5u);
    ASSERT_EQ(cfg.ageReferenceCorpus.size(), (size_t)2);
    EXPECT_EQ(cfg.ageReferenceCorpus[1], "feiert geburtstag");
    EXPECT_DOUBLE_EQ(cfg.entityMinScore, 0.4);
    EXPECT_TRUE(cfg.redactLocations);
    EXPECT_FALSE(cfg.stripPersonTitles);
    ASSERT_EQ(cfg.personBlocklist.size(), (size_t)1);
    EXPECT_EQ(cfg.workerThreads, 4u);
    EXPECT_EQ(cfg.logLevel, "warn");
    EXPECT_EQ(cfg.gazetteerDirectory, "/opt/lexicon");
    EXPECT_FALSE(cfg.extractors.age);
    EXPECT_TRUE(cfg.extractors.contact);
}

TEST(ConfigParserTest, RejectsMalformedInput) {
    auto load = [](const std::string& text) {
        config::PipelineConfig cfg;
        util::ConfigParser parser(cfg);
        std::istringstream in(text);
        parser.loadFromStream(in);
    };
    EXPECT_THROW(load("ageThreshold 0.5\n"), std::runtime_error);
    EXPECT_THROW(load("= 0.5\n"), std::runtime_error);
    EXPECT_THROW(load("ageThreshold = 1.5\n"), std::runtime_error);
    EXPECT_THROW(load("ageThreshold = abc\n"), std::runtime_error);
    EXPECT_THROW(load("ageContextWords = -2\n"), std::runtime_error);
    EXPECT_THROW(load("ageContextWords = 51\n"), std::runtime_error);
    EXPECT_THROW(load("workerThreads = 0\n"), std::runtime_error);
    EXPECT_THROW(load("redactLocations = maybe\n"), std::runtime_error);
    EXPECT_THROW(load("logLevel = loud\n"), std::runtime_error);
    EXPECT_THROW(load("extractors.weather = true\n"), std::runtime_error);
}

TEST(ConfigParserTest, MissingFileKeepsDefaults) {
    config::PipelineConfig cfg;
    util::ConfigParser parser(cfg);
    EXPECT_FALSE(parser.loadFromFile("does_not_exist.conf"));
    EXPECT_DOUBLE_EQ(cfg.ageThreshold, 0.60);
}

TEST(ConfigParserTest, LoadsFromFile) {
    const std::string file = "config_parser_test.conf";
    {
        std::ofstream out(file);
        out << "entityMinScore = 0.9\nredactLocations = true\n";
    }
    config::PipelineConfig cfg;
    util::ConfigParser parser(cfg);
    EXPECT_TRUE(parser.loadFromFile(file));
    EXPECT_DOUBLE_EQ(cfg.entityMinScore, 0.9);
    EXPECT_TRUE(cfg.redactLocations);
    std::remove(file.c_str());
}

// ------------------------------------------------------------------ logger

TEST(LoggerTest, ParsesLevelNames) {
    EXPECT_EQ(logger::parseLogLevel("debug"), logger::LogLevel::DEBUG);
    EXPECT_EQ(logger::parseLogLevel("INFO"), logger::LogLevel::INFO);
    EXPECT_EQ(logger::parseLogLevel("Warning"), logger::LogLevel::WARN);
    EXPECT_EQ(logger::parseLogLevel("error"), logger::LogLevel::ERROR);
    EXPECT_EQ(logger::parseLogLevel("critical"), logger::LogLevel::CRITICAL);
    EXPECT_THROW(logger::parseLogLevel("verbose"), std::invalid_argument);
}

TEST(LoggerTest, MirrorsToFileAboveLevel) {
    const std::string file = "logger_test.log";
    std::remove(file.c_str());

    auto& log = logger::Logger::getInstance();
    logger::LogLevel previous = log.getLogLevel();
    log.setLogLevel(logger::LogLevel::WARN);
    ASSERT_TRUE(log.enableFileOutput(file, false));
    log.info("hidden info line");
    log.warn("visible warn line");
    log.disableFileOutput();
    log.setLogLevel(previous);

    std::ifstream in(file);
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_EQ(content.str().find("hidden info line"), std::string::npos);
    EXPECT_NE(content.str().find("visible warn line"), std::string::npos);
    EXPECT_NE(content.str().find("[WARN]"), std::string::npos);
    std::remove(file.c_str());
}

// ------------------------------------------------------------- worker pool

TEST(WorkerPoolTest, MapOrderedKeepsIndexOrder) {
    util::WorkerPool pool(4);
    EXPECT_EQ(pool.size(), (size_t)4);
    auto squares = pool.mapOrdered(100, [](std::size_t i) { return i * i; });
    ASSERT_EQ(squares.size(), (size_t)100);
    for (std::size_t i = 0; i < squares.size(); ++i) {
        EXPECT_EQ(squares[i], i * i);
    }
}

TEST(WorkerPoolTest, EnqueueReturnsFuture) {
    util::WorkerPool pool(2);
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 10; ++i) {
        futures.push_back(pool.enqueue([&counter] { ++counter; }));
    }
    for (auto& f : futures) {
        f.get();
    }
    EXPECT_EQ(counter.load(), 10);
}

TEST(WorkerPoolTest, MapOrderedRethrowsTaskFailure) {
    util::WorkerPool pool(3);
    EXPECT_THROW(pool.mapOrdered(8, [](std::size_t i) -> int {
                     if (i == 5) {
                         throw std::runtime_error("task failed");
                     }
                     return static_cast<int>(i);
                 }),
                 std::runtime_error);
}

// ------------------------------------------------------------------- text

TEST(TextUtilsTest, LowercasesUmlautsAndSplitsWords) {
    namespace text = piishield::util::text;
    EXPECT_EQ(text::toLower("\xC3\x84RZTIN M\xC3\x9CLLER"), "\xC3\xA4rztin m\xC3\xBCller");
    EXPECT_EQ(text::collapseWhitespace("  a \t b\n c "), "a b c");
    EXPECT_EQ(text::digitsOnly("+49 (30) 12-34"), "49301234");

    auto words = text::wordSpans("Hallo, M\xC3\xBCller! 40 Jahre");
    ASSERT_EQ(words.size(), (size_t)4);
    EXPECT_EQ(words[1].text, "M\xC3\xBCller");
    EXPECT_EQ(words[1].start, (size_t)7);
    EXPECT_EQ(words[1].end, (size_t)14);
    EXPECT_EQ(words[2].text, "40");

    auto list = text::splitList(" a , b,,c ", ',');
    ASSERT_EQ(list.size(), (size_t)3);
    EXPECT_EQ(list[2], "c");
}

// ------------------------------------------------------------------- json

TEST(ResultJsonTest, SerializesResultContract) {
    std::string text = "Mail: a\"b@example.de";
    core::Result result;
    result.detections.push_back(core::tokenize(core::makeCandidate(
        text, 6, text.size(), core::PiiType::CONTACT_EMAIL, 0.95, core::ExtractorKind::CONTACT_PATTERN)));
    result.hasPii = true;
    result.anonymizedText = "Mail: " + result.detections[0].token;
    result.processingTimeMs = 1.234;
    result.errors.push_back({"age", "scorer\nfailed"});

    std::string json = service::toJson(result);
    EXPECT_EQ(json.find("{\"has_pii\":true,\"anonymized_text\":\"Mail: [PII:CONTACT:EMAIL_ID_"), (size_t)0);
    EXPECT_NE(json.find("\"text\":\"a\\\"b@example.de\""), std::string::npos);
    EXPECT_NE(json.find("\"start\":6,\"end\":20"), std::string::npos);
    EXPECT_NE(json.find("\"confidence\":0.9500"), std::string::npos);
    EXPECT_NE(json.find("\"source\":\"contact_pattern\""), std::string::npos);
    EXPECT_NE(json.find("\"processing_time_ms\":1.23"), std::string::npos);
    EXPECT_NE(json.find("{\"source\":\"age\",\"message\":\"scorer\\nfailed\"}"), std::string::npos);
    EXPECT_EQ(json.back(), '}');
}

TEST(ResultJsonTest, EscapesControlCharacters) {
    EXPECT_EQ(service::escapeString(std::string("a\x01z", 3)), "a\\u0001z");
    EXPECT_EQ(service::escapeString("M\xC3\xBCller"), "M\xC3\xBCller");
}

} // anonymous namespace
