#ifndef PIISHIELD_UTIL_CONFIG_PARSER_HPP
#define PIISHIELD_UTIL_CONFIG_PARSER_HPP

#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>
#include "config/pipeline_config.hpp"
#include "logger.hpp"
#include "text_utils.hpp"

/**
 * @file config_parser.hpp
 * @brief Parser for piishield's "key=value" configuration files.
 *
 * DESIGN GOALS:
 *   - Read a plain "key=value" file into a config::PipelineConfig.
 *   - Lines starting with '#' and blank lines are ignored.
 *   - Lists are comma-separated ("entityBlocklist = Patient, Termin").
 *   - Booleans accept true/false, yes/no, on/off and 1/0.
 *   - A missing file keeps the defaults; a malformed line or value throws.
 *
 * USAGE:
 *   @code
 *   piishield::config::PipelineConfig cfg;
 *   piishield::util::ConfigParser parser(cfg);
 *   parser.loadFromFile("piishield.conf");
 *   @endcode
 */

namespace piishield {
namespace util {

/**
 * @class ConfigParser
 * @brief Populates a PipelineConfig from a file or from in-memory text.
 */
class ConfigParser
{
public:
    explicit ConfigParser(config::PipelineConfig &pipelineConfig)
        : config_(pipelineConfig)
    {
    }

    /**
     * @brief Read the given file and apply every recognized key.
     * @return false if the file does not exist (defaults kept), true otherwise.
     * @throw std::runtime_error on malformed lines or values.
     */
    inline bool loadFromFile(const std::string &filepath)
    {
        std::ifstream inFile(filepath);
        if (!inFile.is_open()) {
            logger::warn("ConfigParser: File not found: " + filepath + ", using defaults");
            return false;
        }

        logger::info("ConfigParser: Loading config from " + filepath);
        loadFromStream(inFile);
        logger::info("ConfigParser: Config loaded.");
        return true;
    }

    /**
     * @brief Apply "key=value" lines from @p input.
     * @throw std::runtime_error on malformed lines or values.
     */
    inline void loadFromStream(std::istream &input)
    {
        std::string line;
        std::size_t lineNumber = 0;
        while (std::getline(input, line)) {
            ++lineNumber;
            line = text::trim(line);
            if (line.empty() || line[0] == '#') {
                continue;
            }

            auto pos = line.find('=');
            if (pos == std::string::npos) {
                throw std::runtime_error("ConfigParser: line " + std::to_string(lineNumber)
                    + " has no '=': " + line);
            }
            std::string key = text::trim(line.substr(0, pos));
            std::string val = text::trim(line.substr(pos + 1));
            if (key.empty()) {
                throw std::runtime_error("ConfigParser: line " + std::to_string(lineNumber)
                    + " has an empty key");
            }
            applyKeyValue(key, val);
        }
    }

private:
    config::PipelineConfig &config_;

    inline void applyKeyValue(const std::string &key, const std::string &val)
    {
        if (key == "ageThreshold") {
            config_.ageThreshold = parseUnitInterval(key, val);
        }
        else if (key == "ageContextWords") {
            config_.ageContextWords = static_cast<uint32_t>(parseUInt(key, val, 50));
        }
        else if (key == "ageReferenceCorpus") {
            config_.ageReferenceCorpus = text::splitList(val, ',');
        }
        else if (key == "entityMinScore") {
            config_.entityMinScore = parseUnitInterval(key, val);
        }
        else if (key == "redactLocations") {
            config_.redactLocations = parseBool(key, val);
        }
        else if (key == "stripPersonTitles") {
            config_.stripPersonTitles = parseBool(key, val);
        }
        else if (key == "entityBlocklist") {
            config_.entityBlocklist = text::splitList(val, ',');
        }
        else if (key == "personBlocklist") {
            config_.personBlocklist = text::splitList(val, ',');
        }
        else if (key == "workerThreads") {
            config_.workerThreads = static_cast<uint32_t>(parseUInt(key, val, 256));
            if (config_.workerThreads == 0) {
                throw std::runtime_error("ConfigParser: workerThreads must be at least 1");
            }
        }
        else if (key == "logLevel") {
            try {
                logger::parseLogLevel(val);
            }
            catch (const std::invalid_argument &ex) {
                throw std::runtime_error(std::string("ConfigParser: ") + ex.what());
            }
            config_.logLevel = val;
        }
        else if (key == "logFile") {
            config_.logFile = val;
        }
        else if (key == "gazetteerDirectory") {
            config_.gazetteerDirectory = val;
        }
        else if (key.compare(0, 11, "extractors.") == 0) {
            applyExtractorSwitch(key, key.substr(11), val);
        }
        else {
            logger::warn("ConfigParser: Unrecognized key '" + key + "'");
            return;
        }
        logger::debug("ConfigParser: " + key + " set");
    }

    inline void applyExtractorSwitch(const std::string &key, const std::string &name,
                                     const std::string &val)
    {
        bool enabled = parseBool(key, val);
        config::ExtractorSwitches &sw = config_.extractors;
        if (name == "contact") sw.contact = enabled;
        else if (name == "financial") sw.financial = enabled;
        else if (name == "identifier") sw.identifier = enabled;
        else if (name == "address") sw.address = enabled;
        else if (name == "age") sw.age = enabled;
        else if (name == "date") sw.date = enabled;
        else if (name == "entity") sw.entity = enabled;
        else {
            throw std::runtime_error("ConfigParser: unknown extractor '" + name + "'");
        }
    }

    inline static bool parseBool(const std::string &key, const std::string &val)
    {
        std::string v = text::toLower(val);
        if (v == "true" || v == "yes" || v == "on" || v == "1") {
            return true;
        }
        if (v == "false" || v == "no" || v == "off" || v == "0") {
            return false;
        }
        throw std::runtime_error("ConfigParser: '" + key + "' expects a boolean, got '" + val + "'");
    }

    inline static uint64_t parseUInt(const std::string &key, const std::string &val, uint64_t maxValue)
    {
        uint64_t n = 0;
        try {
            std::size_t idx = 0;
            if (!val.empty() && val[0] == '-') {
                throw std::invalid_argument("negative");
            }
            n = std::stoull(val, &idx, 10);
            if (idx != val.size()) {
                throw std::invalid_argument("non-numeric suffix");
            }
        }
        catch (const std::exception &ex) {
            throw std::runtime_error("ConfigParser: '" + key + "' expects an unsigned integer, got '"
                + val + "': " + ex.what());
        }
        if (n > maxValue) {
            throw std::runtime_error("ConfigParser: '" + key + "' exceeds " + std::to_string(maxValue));
        }
        return n;
    }

    inline static double parseUnitInterval(const std::string &key, const std::string &val)
    {
        double d = 0.0;
        try {
            std::size_t idx = 0;
            d = std::stod(val, &idx);
            if (idx != val.size()) {
                throw std::invalid_argument("non-numeric suffix");
            }
        }
        catch (const std::exception &ex) {
            throw std::runtime_error("ConfigParser: '" + key + "' expects a number, got '"
                + val + "': " + ex.what());
        }
        if (!(d >= 0.0 && d <= 1.0)) {
            throw std::runtime_error("ConfigParser: '" + key + "' must lie in [0,1]");
        }
        return d;
    }
};

} // namespace util
} // namespace piishield

#endif // PIISHIELD_UTIL_CONFIG_PARSER_HPP
