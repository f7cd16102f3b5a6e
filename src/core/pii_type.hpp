#ifndef PIISHIELD_CORE_PII_TYPE_HPP
#define PIISHIELD_CORE_PII_TYPE_HPP

#include <string>

/**
 * @file pii_type.hpp
 * @brief The closed PII taxonomy, its wire names and its resolution priority.
 *
 * Wire names are hierarchical ("CATEGORY:SUBTYPE") and appear verbatim inside
 * redaction tokens, so they must never change once published.
 *
 * Priorities form a strict total order: no two types share a value. Validated
 * financial and government identifiers rank highest, then contact data, then
 * rule-based address/date spans, then recognizer output, then the heuristic
 * age buckets.
 */

namespace piishield {
namespace core {

enum class PiiType {
    FINANCIAL_IBAN,
    FINANCIAL_CREDIT_CARD,
    ID_TAX_ID,
    ID_SOCIAL_SECURITY,
    ID_PASSPORT,
    ID_ID_CARD,
    ID_DRIVER_LICENSE,
    CONTACT_EMAIL,
    CONTACT_URL,
    CONTACT_PHONE,
    DATE_BIRTH,
    LOCATION_ADDRESS,
    PERSON,
    LOCATION,
    MEDICAL_CONDITION,
    MEDICAL_MEDICATION,
    MEDICAL_PROCEDURE,
    AGE_SENIOR,
    AGE_ADULT,
    AGE_TEEN,
    AGE_CHILD
};

/**
 * @brief Wire name used in detections and tokens, e.g. "FINANCIAL:IBAN".
 */
inline std::string typeName(PiiType type)
{
    switch (type) {
        case PiiType::FINANCIAL_IBAN: return "FINANCIAL:IBAN";
        case PiiType::FINANCIAL_CREDIT_CARD: return "FINANCIAL:CREDIT_CARD";
        case PiiType::ID_TAX_ID: return "ID:TAX_ID";
        case PiiType::ID_SOCIAL_SECURITY: return "ID:SOCIAL_SECURITY";
        case PiiType::ID_PASSPORT: return "ID:PASSPORT";
        case PiiType::ID_ID_CARD: return "ID:ID_CARD";
        case PiiType::ID_DRIVER_LICENSE: return "ID:DRIVER_LICENSE";
        case PiiType::CONTACT_EMAIL: return "CONTACT:EMAIL";
        case PiiType::CONTACT_URL: return "CONTACT:URL";
        case PiiType::CONTACT_PHONE: return "CONTACT:PHONE";
        case PiiType::DATE_BIRTH: return "DATE:BIRTH";
        case PiiType::LOCATION_ADDRESS: return "LOCATION:ADDRESS";
        case PiiType::PERSON: return "PERSON";
        case PiiType::LOCATION: return "LOCATION";
        case PiiType::MEDICAL_CONDITION: return "MEDICAL:CONDITION";
        case PiiType::MEDICAL_MEDICATION: return "MEDICAL:MEDICATION";
        case PiiType::MEDICAL_PROCEDURE: return "MEDICAL:PROCEDURE";
        case PiiType::AGE_SENIOR: return "AGE:SENIOR";
        case PiiType::AGE_ADULT: return "AGE:ADULT";
        case PiiType::AGE_TEEN: return "AGE:TEEN";
        case PiiType::AGE_CHILD: return "AGE:CHILD";
    }
    return "UNKNOWN";
}

/**
 * @brief Resolution priority; higher wins a span conflict.
 */
inline int typePriority(PiiType type)
{
    switch (type) {
        case PiiType::FINANCIAL_IBAN: return 200;
        case PiiType::FINANCIAL_CREDIT_CARD: return 190;
        case PiiType::ID_TAX_ID: return 180;
        case PiiType::ID_SOCIAL_SECURITY: return 175;
        case PiiType::ID_PASSPORT: return 170;
        case PiiType::ID_ID_CARD: return 165;
        case PiiType::ID_DRIVER_LICENSE: return 160;
        case PiiType::CONTACT_EMAIL: return 150;
        case PiiType::CONTACT_URL: return 145;
        case PiiType::CONTACT_PHONE: return 140;
        case PiiType::DATE_BIRTH: return 130;
        case PiiType::LOCATION_ADDRESS: return 120;
        case PiiType::PERSON: return 110;
        case PiiType::LOCATION: return 100;
        case PiiType::MEDICAL_CONDITION: return 90;
        case PiiType::MEDICAL_MEDICATION: return 85;
        case PiiType::MEDICAL_PROCEDURE: return 80;
        case PiiType::AGE_SENIOR: return 40;
        case PiiType::AGE_ADULT: return 35;
        case PiiType::AGE_TEEN: return 30;
        case PiiType::AGE_CHILD: return 25;
    }
    return 0;
}

/**
 * @brief Age bucket for a calculated age in years.
 *        <13 child, 13-17 teen, 18-64 adult, 65+ senior.
 */
inline PiiType ageBucket(int years)
{
    if (years < 13) return PiiType::AGE_CHILD;
    if (years < 18) return PiiType::AGE_TEEN;
    if (years < 65) return PiiType::AGE_ADULT;
    return PiiType::AGE_SENIOR;
}

/**
 * @brief Which producer a candidate came from.
 */
enum class ExtractorKind {
    CONTACT_PATTERN,
    FINANCIAL,
    IDENTIFIER,
    ADDRESS,
    AGE,
    DATE,
    ENTITY_MODEL
};

inline std::string extractorKindName(ExtractorKind kind)
{
    switch (kind) {
        case ExtractorKind::CONTACT_PATTERN: return "contact_pattern";
        case ExtractorKind::FINANCIAL: return "financial";
        case ExtractorKind::IDENTIFIER: return "identifier";
        case ExtractorKind::ADDRESS: return "address";
        case ExtractorKind::AGE: return "age";
        case ExtractorKind::DATE: return "date";
        case ExtractorKind::ENTITY_MODEL: return "entity_model";
    }
    return "unknown";
}

} // namespace core
} // namespace piishield

#endif // PIISHIELD_CORE_PII_TYPE_HPP
