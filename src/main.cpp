#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "config/pipeline_config.hpp"
#include "core/errors.hpp"
#include "pipeline/pii_pipeline.hpp"
#include "providers/gazetteer_recognizer.hpp"
#include "providers/tfidf_similarity_scorer.hpp"
#include "service/result_json.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

namespace logger = piishield::util::logger;

// Usage: piishield_batch [config_file] [input_file]
// One text per input line (stdin when no input file or "-"), one JSON result per line on stdout.
int main(int argc, char** argv) {
    logger::setLogLevel(logger::LogLevel::INFO);
    logger::info("[main] piishield batch starting...");

    // 1. Parse configuration
    piishield::config::PipelineConfig pipelineConfig;
    piishield::util::ConfigParser configParser(pipelineConfig);

    std::string configPath = "piishield.conf";
    if (argc > 1) {
        configPath = argv[1];
    }
    try {
        configParser.loadFromFile(configPath);
        logger::setLogLevel(logger::parseLogLevel(pipelineConfig.logLevel));
    } catch (const std::exception &ex) {
        logger::critical(std::string("[main] Invalid configuration: ") + ex.what());
        return 1;
    }
    if (!pipelineConfig.logFile.empty() && !logger::enableFileOutput(pipelineConfig.logFile)) {
        logger::warn("[main] Continuing with stderr logging only");
    }

    // 2. Read the batch
    std::vector<std::string> texts;
    {
        std::string inputPath = argc > 2 ? argv[2] : "-";
        std::ifstream inFile;
        if (inputPath != "-") {
            inFile.open(inputPath);
            if (!inFile.is_open()) {
                logger::critical("[main] Cannot open input file: " + inputPath);
                return 1;
            }
        }
        std::istream &input = inputPath == "-" ? std::cin : inFile;
        std::string line;
        while (std::getline(input, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            texts.push_back(line);
        }
    }

    // 3. Build the pipeline and process
    try {
        auto lexicon = pipelineConfig.gazetteerDirectory.empty()
            ? piishield::providers::GazetteerLexicon::defaults()
            : piishield::providers::GazetteerLexicon::loadFromDirectory(pipelineConfig.gazetteerDirectory);

        piishield::pipeline::PiiPipeline pipeline(
            pipelineConfig,
            std::make_shared<piishield::providers::GazetteerRecognizer>(std::move(lexicon)),
            std::make_shared<piishield::providers::TfIdfSimilarityScorer>());

        for (const auto &result : pipeline.processBatch(texts)) {
            std::cout << piishield::service::toJson(result) << "\n";
        }
        std::cout.flush();
    } catch (const piishield::core::InputError &ex) {
        logger::error(std::string("[main] ") + ex.what());
        return 2;
    } catch (const piishield::core::ProviderUnavailable &ex) {
        logger::critical(std::string("[main] Provider unavailable: ") + ex.what());
        return 1;
    }

    logger::info("[main] Done. Processed " + std::to_string(texts.size()) + " text(s).");
    return 0;
}
