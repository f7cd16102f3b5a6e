#ifndef PIISHIELD_CORE_CANDIDATE_HPP
#define PIISHIELD_CORE_CANDIDATE_HPP

#include <cstddef>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include "pii_type.hpp"

/**
 * @file candidate.hpp
 * @brief Candidate spans proposed by extractors, and the detections that survive resolution.
 *
 * DESIGN GOALS:
 *   - A Candidate is a half-open byte range [start, end) into the original
 *     string with a type, a confidence in [0,1], its producer and free-form
 *     string metadata (e.g. "country" for an IBAN, "calculated_age" for an age).
 *   - Candidates are only built through makeCandidate(), which rejects
 *     zero-length, inverted and out-of-bounds spans. Nothing downstream
 *     re-checks them and nothing downstream modifies them.
 *   - A Detection is a Candidate that survived conflict resolution, plus its token.
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace piishield::core;
 *   Candidate c = makeCandidate(text, 15, 37, PiiType::FINANCIAL_IBAN, 0.99,
 *                               ExtractorKind::FINANCIAL, {{"country", "DE"}});
 *   @endcode
 */

namespace piishield {
namespace core {

using Metadata = std::map<std::string, std::string>;

/**
 * @struct Candidate
 * @brief A proposed PII span.
 */
struct Candidate
{
    PiiType type;
    std::size_t start;        ///< First byte of the span
    std::size_t end;          ///< One past the last byte of the span
    std::string text;         ///< Copy of original[start, end)
    double confidence;        ///< In [0,1]
    ExtractorKind source;
    Metadata metadata;

    std::size_t length() const { return end - start; }

    bool overlaps(const Candidate &other) const
    {
        return start < other.end && other.start < end;
    }

    bool sameSpanAndType(const Candidate &other) const
    {
        return type == other.type && start == other.start && end == other.end;
    }
};

/**
 * @struct Detection
 * @brief An accepted Candidate with its redaction token.
 */
struct Detection : public Candidate
{
    std::string token;
};

/**
 * @brief Build a Candidate over original[start, end).
 * @throw std::invalid_argument if end <= start, end > original.size(), or
 *        confidence is outside [0,1].
 */
inline Candidate makeCandidate(const std::string &original,
                               std::size_t start,
                               std::size_t end,
                               PiiType type,
                               double confidence,
                               ExtractorKind source,
                               Metadata metadata = {})
{
    if (end <= start) {
        throw std::invalid_argument("makeCandidate: empty or inverted span ["
            + std::to_string(start) + "," + std::to_string(end) + ") for " + typeName(type));
    }
    if (end > original.size()) {
        throw std::invalid_argument("makeCandidate: span end " + std::to_string(end)
            + " exceeds text length " + std::to_string(original.size()));
    }
    if (!(confidence >= 0.0 && confidence <= 1.0)) {
        throw std::invalid_argument("makeCandidate: confidence outside [0,1] for " + typeName(type));
    }

    Candidate c;
    c.type = type;
    c.start = start;
    c.end = end;
    c.text = original.substr(start, end - start);
    c.confidence = confidence;
    c.source = source;
    c.metadata = std::move(metadata);
    return c;
}

} // namespace core
} // namespace piishield

#endif // PIISHIELD_CORE_CANDIDATE_HPP
