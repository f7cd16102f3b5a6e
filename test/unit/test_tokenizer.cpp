// test/unit/test_tokenizer.cpp
// -----------------------------------------------------------
// Token format, value normalization, MD5 digests and span redaction.

#include <gtest/gtest.h>

#include <regex>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/candidate.hpp"
#include "core/redactor.hpp"
#include "core/tokenizer.hpp"
#include "util/hashing.hpp"

namespace {

using namespace piishield::core;
namespace hashing = piishield::util::hashing;

Detection detection(const std::string& text, std::size_t start, std::size_t end, PiiType type) {
    return tokenize(makeCandidate(text, start, end, type, 0.9, ExtractorKind::CONTACT_PATTERN));
}

TEST(HashingTest, Md5KnownDigests) {
    EXPECT_EQ(hashing::md5Hex(""), "d41d8cd98f00b204e9800998ecf8427e");
    EXPECT_EQ(hashing::md5Hex("DE89370400440532013000").substr(0, 8), "4a337cdf");
    EXPECT_EQ(hashing::digestPrefix("abcdef", 4), "abcd");
    EXPECT_THROW(hashing::digestPrefix("abc", 8), std::invalid_argument);
}

TEST(TokenizerTest, TokenFormat) {
    std::string token = makeToken(PiiType::FINANCIAL_IBAN, "DE89370400440532013000");
    EXPECT_EQ(token, "[PII:FINANCIAL:IBAN_ID_4a337cdf]");

    static const std::regex shape(R"(\[PII:[A-Z:_]+_ID_[0-9a-f]{8}\])");
    EXPECT_TRUE(std::regex_match(makeToken(PiiType::PERSON, "Max Mustermann"), shape));
    EXPECT_TRUE(std::regex_match(makeToken(PiiType::AGE_ADULT, "40"), shape));
    EXPECT_EQ(makeToken(PiiType::PERSON, "Max Mustermann"), "[PII:PERSON_ID_3faf46bc]");
    EXPECT_EQ(makeToken(PiiType::AGE_ADULT, "40"), "[PII:AGE:ADULT_ID_d645920e]");
}

TEST(TokenizerTest, EquivalentSpellingsShareAToken) {
    EXPECT_EQ(makeToken(PiiType::FINANCIAL_IBAN, "DE89 3704 0044 0532 0130 00"),
              makeToken(PiiType::FINANCIAL_IBAN, "de89370400440532013000"));
    EXPECT_EQ(makeToken(PiiType::CONTACT_PHONE, "+49 30 123456"),
              makeToken(PiiType::CONTACT_PHONE, "030/123456"));
    EXPECT_EQ(makeToken(PiiType::CONTACT_PHONE, "0049-30-123456"), "[PII:CONTACT:PHONE_ID_39b4703c]");
    EXPECT_EQ(makeToken(PiiType::DATE_BIRTH, "1.4.1985"), "[PII:DATE:BIRTH_ID_57374ab2]");
    EXPECT_EQ(makeToken(PiiType::DATE_BIRTH, "01.04.1985"), "[PII:DATE:BIRTH_ID_57374ab2]");
    EXPECT_EQ(makeToken(PiiType::PERSON, "MAX  Mustermann"), makeToken(PiiType::PERSON, "max mustermann"));
    EXPECT_EQ(makeToken(PiiType::LOCATION_ADDRESS, "Musterstrasse 12"),
              "[PII:LOCATION:ADDRESS_ID_17c6330d]");
    EXPECT_EQ(makeToken(PiiType::LOCATION_ADDRESS, "Musterstr. 12"),
              makeToken(PiiType::LOCATION_ADDRESS, "Musterstra\xC3\x9F" "e 12"));
}

TEST(TokenizerTest, TypeIsPartOfTheToken) {
    EXPECT_NE(makeToken(PiiType::PERSON, "Berlin"), makeToken(PiiType::LOCATION, "Berlin"));
    EXPECT_NE(makeToken(PiiType::PERSON, "Anna"), makeToken(PiiType::PERSON, "Anne"));
}

TEST(TokenizerTest, NormalizeValueByType) {
    EXPECT_EQ(normalizeValue(PiiType::FINANCIAL_CREDIT_CARD, "4111 1111-1111 1111"), "4111111111111111");
    EXPECT_EQ(normalizeValue(PiiType::ID_SOCIAL_SECURITY, "15 070649 c 103"), "15070649C103");
    EXPECT_EQ(normalizeValue(PiiType::CONTACT_EMAIL, "Max.Muster@Example.DE"), "max.muster@example.de");
    EXPECT_EQ(normalizeValue(PiiType::CONTACT_PHONE, "+49 (0)30 123456"), "030123456");
}

TEST(TokenizerTest, TokenizeKeepsCandidateFields) {
    std::string text = "Ruf an: 030 123456";
    Detection d = detection(text, 8, 18, PiiType::CONTACT_PHONE);
    EXPECT_EQ(d.text, "030 123456");
    EXPECT_EQ(d.start, (size_t)8);
    EXPECT_EQ(d.end, (size_t)18);
    EXPECT_EQ(d.token, "[PII:CONTACT:PHONE_ID_39b4703c]");
}

TEST(RedactorTest, ReplacesSpansAndKeepsTheRest) {
    std::string text = "A 030 123456 B 40 C";
    std::vector<Detection> ds = {
        detection(text, 2, 12, PiiType::CONTACT_PHONE),
        detection(text, 15, 17, PiiType::AGE_ADULT),
    };
    EXPECT_EQ(redact(text, ds),
              "A [PII:CONTACT:PHONE_ID_39b4703c] B [PII:AGE:ADULT_ID_d645920e] C");
    EXPECT_EQ(redact(text, {}), text);
}

TEST(RedactorTest, SpanAtTextEdges) {
    std::string text = "030 123456";
    std::vector<Detection> ds = {detection(text, 0, text.size(), PiiType::CONTACT_PHONE)};
    EXPECT_EQ(redact(text, ds), "[PII:CONTACT:PHONE_ID_39b4703c]");
}

TEST(RedactorTest, RejectsUnsortedOrOverlappingDetections) {
    std::string text = "0123456789abcdef";
    Detection a = detection(text, 0, 6, PiiType::PERSON);
    Detection b = detection(text, 4, 10, PiiType::PERSON);
    Detection c = detection(text, 10, 12, PiiType::PERSON);
    EXPECT_THROW(redact(text, {a, b}), std::logic_error);
    EXPECT_THROW(redact(text, {c, a}), std::logic_error);

    Detection beyond = c;
    beyond.end = 40;
    EXPECT_THROW(redact(text, {beyond}), std::logic_error);
}

TEST(CandidateTest, MakeCandidateValidatesSpanAndConfidence) {
    std::string text = "hello";
    EXPECT_THROW(makeCandidate(text, 3, 3, PiiType::PERSON, 0.5, ExtractorKind::ENTITY_MODEL),
                 std::invalid_argument);
    EXPECT_THROW(makeCandidate(text, 0, 9, PiiType::PERSON, 0.5, ExtractorKind::ENTITY_MODEL),
                 std::invalid_argument);
    EXPECT_THROW(makeCandidate(text, 0, 5, PiiType::PERSON, 1.5, ExtractorKind::ENTITY_MODEL),
                 std::invalid_argument);
    Candidate c = makeCandidate(text, 1, 4, PiiType::PERSON, 0.5, ExtractorKind::ENTITY_MODEL);
    EXPECT_EQ(c.text, "ell");
    EXPECT_EQ(c.length(), (size_t)3);
}

} // anonymous namespace
