#ifndef PIISHIELD_PROVIDERS_ENTITY_RECOGNIZER_HPP
#define PIISHIELD_PROVIDERS_ENTITY_RECOGNIZER_HPP

#include <cstddef>
#include <string>
#include <vector>

/**
 * @file entity_recognizer.hpp
 * @brief Capability interface for a named-entity recognition provider.
 *
 * The pipeline treats the recognizer as a black box: text in, typed spans
 * with the provider's own score out. Labels are provider vocabulary
 * ("PER", "LOC", "MED_CONDITION", ...); mapping them onto the PII taxonomy
 * is the job of the EntityExtractor, not of the provider.
 *
 * A provider is initialised once and only read afterwards. If its recognize()
 * must not run concurrently, isThreadSafe() returns false and the pipeline
 * serialises every call through a single lock.
 */

namespace piishield {
namespace providers {

/**
 * @struct RecognizedEntity
 * @brief One provider span: byte offsets [start, end), label and score.
 */
struct RecognizedEntity
{
    std::size_t start;
    std::size_t end;
    std::string label;
    double score;
};

class EntityRecognizer
{
public:
    virtual ~EntityRecognizer() = default;

    /// Provider name for logs.
    virtual std::string name() const = 0;

    /**
     * @brief Recognize entities in one string.
     * @throw std::exception subclasses on failure; the caller records the
     *        failure for this string only.
     */
    virtual std::vector<RecognizedEntity> recognize(const std::string &text) const = 0;

    virtual bool isThreadSafe() const { return false; }
};

} // namespace providers
} // namespace piishield

#endif // PIISHIELD_PROVIDERS_ENTITY_RECOGNIZER_HPP
