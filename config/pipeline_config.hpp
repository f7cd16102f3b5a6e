#ifndef PIISHIELD_CONFIG_PIPELINE_CONFIG_HPP
#define PIISHIELD_CONFIG_PIPELINE_CONFIG_HPP

#include <cstdint>
#include <string>
#include <vector>

/**
 * @file pipeline_config.hpp
 * @brief Configuration record for one piishield pipeline.
 *
 * USAGE:
 *   - Populate manually or through util::ConfigParser before constructing the
 *     pipeline. The pipeline keeps its own copy and never modifies it; the
 *     extractors only hold const references to that copy.
 */

namespace piishield {
namespace config {

/**
 * @struct ExtractorSwitches
 * @brief Enables or disables whole candidate sources.
 */
struct ExtractorSwitches
{
    bool contact = true;     ///< e-mail, URL, phone
    bool financial = true;   ///< IBAN, credit card
    bool identifier = true;  ///< tax ID, social security, passport, ID card, driver license
    bool address = true;     ///< street + house number
    bool age = true;         ///< numeric age with context similarity gate
    bool date = true;        ///< date of birth
    bool entity = true;      ///< entity-recognition provider
};

/**
 * @struct PipelineConfig
 * @brief Thresholds, blocklists and switches read by the extractors.
 *
 * Defaults:
 *   ageThreshold = 0.60 (inclusive), ageContextWords = 3,
 *   entityMinScore = 0.50, redactLocations = false,
 *   stripPersonTitles = true, workerThreads = 1, logLevel = "info"
 */
struct PipelineConfig
{
    PipelineConfig()
        : ageThreshold(0.60),
          ageContextWords(3),
          ageReferenceCorpus{
              "jahre alt",
              "jahre jung",
              "im alter von jahren",
              "alter jahre",
              "jährig",
              "jährige",
              "jähriger",
              "jährigen",
              "lebensjahr vollendet",
              "wird jahre alt",
              "feiert geburtstag",
              "kind ist jahre",
              "rentner mit jahren"},
          entityMinScore(0.50),
          redactLocations(false),
          stripPersonTitles(true),
          entityBlocklist{
              "Patient", "Patientin", "Termin", "Vertrag", "Meeting",
              "Hallo", "Danke", "Bitte", "Uhr"},
          personBlocklist{
              "Gott", "Jesus", "Alexa", "Siri"},
          workerThreads(1),
          logLevel("info")
    {
    }

    /// Minimum context similarity for an age candidate. score >= threshold accepts.
    double ageThreshold;

    /// Words taken on each side of a numeric token to build its context window.
    uint32_t ageContextWords;

    /// Reference phrases indicating that a nearby number is an age.
    std::vector<std::string> ageReferenceCorpus;

    /// Recognizer spans scoring below this are discarded.
    double entityMinScore;

    /// When false, LOCATION spans from the recognizer (city names) are kept in the output.
    bool redactLocations;

    /// Remove leading honorifics ("Frau", "Dr.") from PERSON spans.
    bool stripPersonTitles;

    /// Case-insensitive exact terms never accepted from the recognizer.
    std::vector<std::string> entityBlocklist;

    /// Case-insensitive exact terms never accepted as PERSON.
    std::vector<std::string> personBlocklist;

    /// Worker threads used by processBatch. 1 processes strings sequentially.
    uint32_t workerThreads;

    /// Minimal log level name (debug, info, warn, error, critical).
    std::string logLevel;

    /// Optional log file mirror. Empty keeps logging on stderr only.
    std::string logFile;

    /// Directory holding gazetteer lexicon files. Empty uses the built-in lexicons.
    std::string gazetteerDirectory;

    ExtractorSwitches extractors;
};

} // namespace config
} // namespace piishield

#endif // PIISHIELD_CONFIG_PIPELINE_CONFIG_HPP
