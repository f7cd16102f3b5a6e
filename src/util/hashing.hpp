#ifndef PIISHIELD_UTIL_HASHING_HPP
#define PIISHIELD_UTIL_HASHING_HPP

#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <openssl/evp.h>

/**
 * @file hashing.hpp
 * @brief Message digests used to derive redaction tokens.
 *
 * REQUIREMENTS:
 *   - Links against OpenSSL (libcrypto), through the EVP interface.
 *
 * DESIGN:
 *   - md5Hex() returns the lowercase hex form of the 128-bit MD5 digest.
 *     Tokens only need a stable fixed-width digest, not collision resistance
 *     against an adversary, so MD5 keeps the historical 8-hex token prefix.
 *   - digestPrefix() truncates a hex digest to the width a token embeds.
 *
 * USAGE:
 *   @code
 *   using namespace piishield::util::hashing;
 *   std::string hex = md5Hex("de89370400440532013000");   // 32 hex chars
 *   std::string id  = digestPrefix(hex, 8);               // first 8
 *   @endcode
 */

namespace piishield {
namespace util {
namespace hashing {

namespace detail {

struct MdCtxDeleter
{
    void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};

using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

inline std::string toHex(const unsigned char *bytes, unsigned int length)
{
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<unsigned>(bytes[i]);
    }
    return oss.str();
}

} // namespace detail

/**
 * @brief Hex digest of @p input using the named EVP algorithm.
 * @throw std::runtime_error if OpenSSL does not provide the algorithm or fails.
 */
inline std::string digestHex(const EVP_MD *algorithm, const std::string &input)
{
    if (algorithm == nullptr) {
        throw std::runtime_error("hashing::digestHex: digest algorithm unavailable.");
    }

    detail::MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error("hashing::digestHex: Failed to create EVP_MD_CTX.");
    }
    if (EVP_DigestInit_ex(ctx.get(), algorithm, nullptr) != 1) {
        throw std::runtime_error("hashing::digestHex: EVP_DigestInit_ex failed.");
    }
    if (EVP_DigestUpdate(ctx.get(), input.data(), input.size()) != 1) {
        throw std::runtime_error("hashing::digestHex: EVP_DigestUpdate failed.");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &length) != 1) {
        throw std::runtime_error("hashing::digestHex: EVP_DigestFinal_ex failed.");
    }
    return detail::toHex(digest, length);
}

/**
 * @brief 32-character lowercase hex MD5 digest of @p input.
 */
inline std::string md5Hex(const std::string &input)
{
    return digestHex(EVP_md5(), input);
}

/**
 * @brief First @p hexChars characters of a hex digest.
 * @throw std::invalid_argument if the digest is shorter than requested.
 */
inline std::string digestPrefix(const std::string &hexDigest, std::size_t hexChars)
{
    if (hexDigest.size() < hexChars) {
        throw std::invalid_argument("hashing::digestPrefix: digest shorter than requested prefix.");
    }
    return hexDigest.substr(0, hexChars);
}

} // namespace hashing
} // namespace util
} // namespace piishield

#endif // PIISHIELD_UTIL_HASHING_HPP
