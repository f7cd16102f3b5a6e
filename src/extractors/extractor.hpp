#ifndef PIISHIELD_EXTRACTORS_EXTRACTOR_HPP
#define PIISHIELD_EXTRACTORS_EXTRACTOR_HPP

#include <cstddef>
#include <regex>
#include <string>
#include <vector>
#include "../core/candidate.hpp"
#include "../core/pii_type.hpp"
#include "../util/text_utils.hpp"

/**
 * @file extractor.hpp
 * @brief Base class of every candidate producer.
 *
 * DESIGN GOALS:
 *   - An extractor looks at one string and returns candidates for it. It keeps
 *     no per-string state, so a single instance serves all worker threads.
 *   - Validation happens inside the extractor: a match that fails its
 *     checksum never leaves extract().
 *   - Failures other than validation are thrown; the pipeline turns them into
 *     a per-string ProcessingError tagged with name().
 *
 * USAGE EXAMPLE:
 *   @code
 *   piishield::extractors::ContactExtractor contact;
 *   for (const auto &c : contact.extract(text)) {
 *       // c.type, c.start, c.end ...
 *   }
 *   @endcode
 */

namespace piishield {
namespace extractors {

class CandidateExtractor
{
public:
    virtual ~CandidateExtractor() = default;

    virtual core::ExtractorKind kind() const = 0;

    /// Label used in logs and in Result::errors.
    virtual std::string name() const { return core::extractorKindName(kind()); }

    virtual std::vector<core::Candidate> extract(const std::string &text) const = 0;

protected:
    /**
     * @brief Call @p onMatch(match, start, end) for every match of @p re.
     */
    template <typename Fn>
    static void forEachMatch(const std::string &text, const std::regex &re, Fn onMatch)
    {
        auto it = std::sregex_iterator(text.begin(), text.end(), re);
        auto stop = std::sregex_iterator();
        for (; it != stop; ++it) {
            std::size_t start = static_cast<std::size_t>(it->position(0));
            std::size_t end = start + static_cast<std::size_t>(it->length(0));
            onMatch(*it, start, end);
        }
    }

    /**
     * @brief Search loop for patterns whose matches may run on into the next
     *        value. @p onMatch(match, start, end) returns the offset where the
     *        next search begins; anything at or before @p start advances one byte.
     */
    template <typename Fn>
    static void scanMatches(const std::string &text, const std::regex &re, Fn onMatch)
    {
        std::size_t pos = 0;
        std::smatch m;
        while (pos < text.size()) {
            auto flags = pos > 0 ? std::regex_constants::match_prev_avail
                                 : std::regex_constants::match_default;
            if (!std::regex_search(text.begin() + pos, text.end(), m, re, flags)) {
                break;
            }
            std::size_t start = pos + static_cast<std::size_t>(m.position(0));
            std::size_t end = start + static_cast<std::size_t>(m.length(0));
            std::size_t next = onMatch(m, start, end);
            pos = next > start ? next : start + 1;
        }
    }

    /**
     * @brief True if [start, end) is not glued to a neighbouring word byte.
     *
     * std::regex word boundaries are ASCII-only, which misreads umlauts as
     * separators, so boundaries are checked here on bytes instead.
     */
    static bool isolated(const std::string &text, std::size_t start, std::size_t end)
    {
        if (start > 0 && util::text::isWordByte(text[start - 1])) {
            return false;
        }
        if (end < text.size() && util::text::isWordByte(text[end])) {
            return false;
        }
        return true;
    }
};

} // namespace extractors
} // namespace piishield

#endif // PIISHIELD_EXTRACTORS_EXTRACTOR_HPP
