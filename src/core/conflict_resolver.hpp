#ifndef PIISHIELD_CORE_CONFLICT_RESOLVER_HPP
#define PIISHIELD_CORE_CONFLICT_RESOLVER_HPP

#include <algorithm>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "candidate.hpp"
#include "occupation_map.hpp"
#include "pii_type.hpp"

/**
 * @file conflict_resolver.hpp
 * @brief Reduces overlapping candidates from all extractors to one
 *        non-overlapping set.
 *
 * DESIGN GOALS:
 *   - Greedy acceptance in a fixed order:
 *       (type priority desc, confidence desc, span length desc, start asc).
 *     Candidates sharing type and span are collapsed into the one that sorts
 *     first (highest confidence, then lowest source, then metadata).
 *   - A candidate is accepted only if its whole range is free in the
 *     occupation map. Partially covered candidates are dropped, never trimmed.
 *   - The accepted set depends only on the candidate multiset, not on the
 *     order the extractors produced it in.
 *   - The occupation map is created per call through a factory so that the
 *     interval list can be swapped for a bitmap on long documents.
 *
 * USAGE EXAMPLE:
 *   @code
 *   piishield::core::ConflictResolver resolver;
 *   std::vector<Candidate> accepted = resolver.resolve(std::move(candidates), text.size());
 *   @endcode
 */

namespace piishield {
namespace core {

class ConflictResolver
{
public:
    explicit ConflictResolver(OccupationMapFactory factory = makeIntervalOccupationMap)
        : factory_(std::move(factory))
    {
        if (!factory_) {
            throw std::invalid_argument("ConflictResolver: occupation map factory is empty");
        }
    }

    /**
     * @brief Strict ordering used by the greedy walk. Returns true if @p a is
     *        considered before @p b.
     */
    static bool precedes(const Candidate &a, const Candidate &b)
    {
        int pa = typePriority(a.type);
        int pb = typePriority(b.type);
        if (pa != pb) {
            return pa > pb;
        }
        if (a.confidence != b.confidence) {
            return a.confidence > b.confidence;
        }
        if (a.length() != b.length()) {
            return a.length() > b.length();
        }
        if (a.start != b.start) {
            return a.start < b.start;
        }
        // Only reachable for same priority and same span, i.e. the same type.
        return static_cast<int>(a.source) < static_cast<int>(b.source);
    }

    /**
     * @brief Resolve candidates for one string.
     * @param candidates All candidates produced for the string.
     * @param textLength Byte length of the string.
     * @return Accepted candidates sorted by start.
     * @throw std::out_of_range if a candidate lies outside [0, textLength].
     */
    std::vector<Candidate> resolve(std::vector<Candidate> candidates, std::size_t textLength) const
    {
        for (const auto &c : candidates) {
            if (c.end <= c.start || c.end > textLength) {
                throw std::out_of_range("ConflictResolver: candidate " + typeName(c.type) + " ["
                    + std::to_string(c.start) + "," + std::to_string(c.end)
                    + ") outside text of length " + std::to_string(textLength));
            }
        }

        std::vector<Candidate> unique = collapseDuplicates(std::move(candidates));

        std::unique_ptr<OccupationMap> occupied = factory_(textLength);
        std::vector<Candidate> accepted;
        for (auto &c : unique) {
            if (occupied->isFree(c.start, c.end)) {
                occupied->claim(c.start, c.end);
                accepted.push_back(std::move(c));
            }
        }

        std::sort(accepted.begin(), accepted.end(),
                  [](const Candidate &a, const Candidate &b) { return a.start < b.start; });
        return accepted;
    }

private:
    // Total order: precedes(), then metadata for candidates it cannot tell apart.
    static bool ranksBefore(const Candidate &a, const Candidate &b)
    {
        if (precedes(a, b)) {
            return true;
        }
        if (precedes(b, a)) {
            return false;
        }
        return a.metadata < b.metadata;
    }

    // Sorts by ranksBefore and keeps the first of each type and span.
    static std::vector<Candidate> collapseDuplicates(std::vector<Candidate> candidates)
    {
        std::sort(candidates.begin(), candidates.end(), &ConflictResolver::ranksBefore);
        std::vector<Candidate> out;
        out.reserve(candidates.size());
        for (auto &c : candidates) {
            auto existing = std::find_if(out.begin(), out.end(),
                [&c](const Candidate &o) { return o.sameSpanAndType(c); });
            if (existing == out.end()) {
                out.push_back(std::move(c));
            }
        }
        return out;
    }

    OccupationMapFactory factory_;
};

} // namespace core
} // namespace piishield

#endif // PIISHIELD_CORE_CONFLICT_RESOLVER_HPP
