#pragma once

#include <array>
#include <string>
#include <string_view>

#include <openssl/evp.h>
#include <openssl/sha.h>

using digest_t = std::array<unsigned char, SHA512_DIGEST_LENGTH>;
// 4 output characters per 3 input bytes, padded, plus EVP_EncodeBlock's NUL
using base64digest_t = std::array<char, (SHA512_DIGEST_LENGTH + 2) / 3 * 4 + 1>;

constexpr std::size_t WORKING_STRING_LENGTH = 32;

class Digest {
  public:
    Digest(std::string_view input)
        : m_digest(get_digest(input)), m_base64digest(get_base64digest(m_digest))
    {}

    std::string_view base64digest() const
    {
        return {m_base64digest.data(), m_base64digest.size() - 1};
    }

    /**
     * Returns the truncated base64 text from which passwords are derived.
     * 88 base64 characters are always available, so this cannot fail.
     */
    std::string working_string() const
    {
        return std::string(base64digest().substr(0, WORKING_STRING_LENGTH));
    }

  private:
    static digest_t get_digest(std::string_view input)
    {
        digest_t digest;
        SHA512(reinterpret_cast<const unsigned char *>(input.data()),
               input.size(), digest.data());
        return digest;
    }

    static base64digest_t get_base64digest(const digest_t &digest)
    {
        base64digest_t base64;
        EVP_EncodeBlock(reinterpret_cast<unsigned char *>(base64.data()),
                        digest.data(), static_cast<int>(digest.size()));
        return base64;
    }

    digest_t m_digest;
    base64digest_t m_base64digest;
};
