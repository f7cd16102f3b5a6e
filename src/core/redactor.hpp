#ifndef PIISHIELD_CORE_REDACTOR_HPP
#define PIISHIELD_CORE_REDACTOR_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>
#include "candidate.hpp"

/**
 * @file redactor.hpp
 * @brief Builds the anonymized text from the original and its detections.
 *
 * Single left-to-right pass: text between detections is copied byte for byte,
 * each detection span is replaced by its token. Detections must be sorted by
 * start and must not overlap; the resolver guarantees both, and a violation
 * here is a programming error reported as std::logic_error.
 */

namespace piishield {
namespace core {

inline std::string redact(const std::string &original, const std::vector<Detection> &detections)
{
    std::string out;
    out.reserve(original.size());

    std::size_t cursor = 0;
    for (const auto &d : detections) {
        if (d.start < cursor) {
            throw std::logic_error("redact: detections unsorted or overlapping at offset "
                + std::to_string(d.start));
        }
        if (d.end <= d.start || d.end > original.size()) {
            throw std::logic_error("redact: detection span outside text at offset "
                + std::to_string(d.start));
        }
        out.append(original, cursor, d.start - cursor);
        out += d.token;
        cursor = d.end;
    }
    out.append(original, cursor, std::string::npos);
    return out;
}

} // namespace core
} // namespace piishield

#endif // PIISHIELD_CORE_REDACTOR_HPP
