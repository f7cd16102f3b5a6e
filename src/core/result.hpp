#ifndef PIISHIELD_CORE_RESULT_HPP
#define PIISHIELD_CORE_RESULT_HPP

#include <string>
#include <vector>
#include "candidate.hpp"

namespace piishield {
namespace core {

/**
 * @struct ProcessingError
 * @brief A failure confined to one source while processing one string.
 */
struct ProcessingError
{
    std::string source;   ///< Extractor name, or "pipeline" for a whole-string failure
    std::string message;
};

/**
 * @struct Result
 * @brief Outcome for one input string of a batch.
 *
 * detections are sorted by start and pairwise non-overlapping. has_pii is true
 * iff detections is non-empty. anonymized_text equals the input with exactly
 * the detected spans replaced by their tokens.
 */
struct Result
{
    bool hasPii = false;
    std::string anonymizedText;
    std::vector<Detection> detections;
    double processingTimeMs = 0.0;
    std::vector<ProcessingError> errors;
};

} // namespace core
} // namespace piishield

#endif // PIISHIELD_CORE_RESULT_HPP
