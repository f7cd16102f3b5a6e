#ifndef PIISHIELD_SERVICE_RESULT_JSON_HPP
#define PIISHIELD_SERVICE_RESULT_JSON_HPP

#include <cstddef>
#include <iomanip>
#include <sstream>
#include <string>
#include "../core/result.hpp"

/**
 * @file result_json.hpp
 * @brief Renders a Result as a single-line JSON object.
 *
 * DESIGN GOALS:
 *   - Field names follow the public result contract: has_pii, anonymized_text,
 *     detections, processing_time_ms, plus errors.
 *   - Each detection carries type, token, text, start, end, confidence,
 *     source and metadata.
 *   - Strings are UTF-8 and are written through unchanged apart from JSON
 *     escapes for quotes, backslashes and control characters.
 *
 * USAGE EXAMPLE:
 *   @code
 *   std::cout << piishield::service::toJson(result) << "\n";
 *   // {"has_pii":true,"anonymized_text":"Meine IBAN ist [PII:FINANCIAL:IBAN_ID_...]",...}
 *   @endcode
 */

namespace piishield {
namespace service {

/**
 * @brief Escape characters in a string for JSON, e.g. " -> \".
 */
inline std::string escapeString(const std::string &in)
{
    std::ostringstream oss;
    for (char c : in) {
        switch (c) {
        case '"':  oss << "\\\""; break;
        case '\\': oss << "\\\\"; break;
        case '\b': oss << "\\b";  break;
        case '\f': oss << "\\f";  break;
        case '\n': oss << "\\n";  break;
        case '\r': oss << "\\r";  break;
        case '\t': oss << "\\t";  break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                    << static_cast<int>(static_cast<unsigned char>(c)) << std::dec;
            } else {
                oss << c;
            }
            break;
        }
    }
    return oss.str();
}

/**
 * @brief One detection as a JSON object.
 */
inline std::string toJson(const core::Detection &d)
{
    std::ostringstream oss;
    oss << "{";
    oss << R"("type":")" << escapeString(core::typeName(d.type)) << "\",";
    oss << R"("token":")" << escapeString(d.token) << "\",";
    oss << R"("text":")" << escapeString(d.text) << "\",";
    oss << R"("start":)" << d.start << ",";
    oss << R"("end":)" << d.end << ",";
    oss << R"("confidence":)" << std::fixed << std::setprecision(4) << d.confidence << ",";
    oss << R"("source":")" << core::extractorKindName(d.source) << "\",";
    oss << R"("metadata":{)";
    bool first = true;
    for (const auto &kv : d.metadata) {
        if (!first) {
            oss << ",";
        }
        oss << "\"" << escapeString(kv.first) << "\":\"" << escapeString(kv.second) << "\"";
        first = false;
    }
    oss << "}}";
    return oss.str();
}

/**
 * @brief A whole Result as a JSON object.
 */
inline std::string toJson(const core::Result &result)
{
    std::ostringstream oss;
    oss << "{";
    oss << R"("has_pii":)" << (result.hasPii ? "true" : "false") << ",";
    oss << R"("anonymized_text":")" << escapeString(result.anonymizedText) << "\",";
    oss << R"("detections":[)";
    for (std::size_t i = 0; i < result.detections.size(); ++i) {
        if (i > 0) {
            oss << ",";
        }
        oss << toJson(result.detections[i]);
    }
    oss << "],";
    oss << R"("processing_time_ms":)" << std::fixed << std::setprecision(2) << result.processingTimeMs << ",";
    oss << R"("errors":[)";
    for (std::size_t i = 0; i < result.errors.size(); ++i) {
        if (i > 0) {
            oss << ",";
        }
        oss << R"({"source":")" << escapeString(result.errors[i].source)
            << R"(","message":")" << escapeString(result.errors[i].message) << "\"}";
    }
    oss << "]}";
    return oss.str();
}

} // namespace service
} // namespace piishield

#endif // PIISHIELD_SERVICE_RESULT_JSON_HPP
