#include "securevault/crypto/providers/OpenSslProviderFactory.hpp"
#include "securevault/security/SecureBuffer.hpp"
#include "securevault/security/SecureRandom.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <memory>
#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <optional>
#include <span>
#include <stdexcept>
#include <vector>

namespace securevault::crypto::providers
{
namespace
{

constexpr char g_kDigestName[]{ "SHA256" };

void requireExactSize(std::size_t actual, std::size_t expected, const char* what)
{
    if (actual != expected)
    {
        throw std::invalid_argument(what);
    }
}

void requireIntSized(std::size_t size, const char* what)
{
    if (size > static_cast<std::size_t>(std::numeric_limits<int>::max()))
    {
        throw std::invalid_argument(what);
    }
}

using EvpKdfPtr = std::unique_ptr<EVP_KDF, decltype(&EVP_KDF_free)>;
using EvpKdfCtxPtr = std::unique_ptr<EVP_KDF_CTX, decltype(&EVP_KDF_CTX_free)>;
using EvpMdPtr = std::unique_ptr<EVP_MD, decltype(&EVP_MD_free)>;
using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using EvpCipherPtr = std::unique_ptr<EVP_CIPHER, decltype(&EVP_CIPHER_free)>;
using EvpCipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

class OpenSslCryptoProvider final : public securevault::crypto::ICryptoProvider
{
public:
    OpenSslCryptoProvider()
        : m_pbkdf2{ EVP_KDF_fetch(nullptr, "PBKDF2", nullptr), &EVP_KDF_free },
          m_sha256{ EVP_MD_fetch(nullptr, g_kDigestName, nullptr), &EVP_MD_free },
          m_aesGcm{ EVP_CIPHER_fetch(nullptr, "AES-256-GCM", nullptr), &EVP_CIPHER_free }
    {
        if (!m_pbkdf2 || !m_sha256 || !m_aesGcm)
        {
            throw std::runtime_error("OpenSslCryptoProvider: required algorithms not available");
        }
    }

    [[nodiscard]] securevault::security::SecureBuffer deriveKey(std::span<const std::byte> passphrase,
                                                                std::span<const std::uint8_t> salt,
                                                                const Pbkdf2Params& params) const override
    {
        requireExactSize(salt.size(), g_kdfSaltBytes, "deriveKey: invalid salt size");
        if (params.iterations < g_minPbkdf2Iterations)
        {
            throw std::invalid_argument("deriveKey: iteration count below policy minimum");
        }

        EvpKdfCtxPtr ctx{ EVP_KDF_CTX_new(m_pbkdf2.get()), &EVP_KDF_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("deriveKey: EVP_KDF_CTX_new failed");
        }

        // OSSL_PARAM wants non-const buffers; work on copies. One spare byte keeps
        // the pointer valid for an empty passphrase.
        securevault::security::SecureBuffer passCopy(passphrase.size() + 1U);
        if (!passphrase.empty())
        {
            std::memcpy(passCopy.data(), passphrase.data(), passphrase.size());
        }
        std::array<std::uint8_t, g_kdfSaltBytes> saltCopy{};
        std::memcpy(saltCopy.data(), salt.data(), saltCopy.size());

        auto iterations{ static_cast<std::uint64_t>(params.iterations) };
        char digestName[sizeof(g_kDigestName)]{};
        std::memcpy(digestName, g_kDigestName, sizeof(g_kDigestName));

        OSSL_PARAM osslParams[]{
            OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_PASSWORD, passCopy.data(), passphrase.size()),
            OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_SALT, saltCopy.data(), saltCopy.size()),
            OSSL_PARAM_construct_uint64(OSSL_KDF_PARAM_ITER, &iterations),
            OSSL_PARAM_construct_utf8_string(OSSL_KDF_PARAM_DIGEST, digestName, 0),
            OSSL_PARAM_construct_end(),
        };

        securevault::security::SecureBuffer out(g_derivedKeyBytes);
        const int rc{ EVP_KDF_derive(ctx.get(), out.data(), out.size(), osslParams) };
        securevault::security::secureRelease(passCopy);
        if (rc <= 0)
        {
            securevault::security::secureRelease(out);
            throw std::runtime_error("deriveKey: EVP_KDF_derive failed");
        }
        return out;
    }

    [[nodiscard]] Sha256Digest sha256(std::span<const std::byte> data) const override
    {
        EvpMdCtxPtr ctx{ EVP_MD_CTX_new(), &EVP_MD_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("sha256: EVP_MD_CTX_new failed");
        }

        Sha256Digest out{};
        unsigned int written{ 0U };
        if (EVP_DigestInit_ex2(ctx.get(), m_sha256.get(), nullptr) != 1 ||
            EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
            EVP_DigestFinal_ex(ctx.get(), out.data(), &written) != 1 || written != out.size())
        {
            throw std::runtime_error("sha256: digest failed");
        }
        return out;
    }

    [[nodiscard]] bool randomBytes(std::span<std::uint8_t> out) noexcept override
    {
        return securevault::security::secureRandomFill(out);
    }

    [[nodiscard]] std::vector<std::uint8_t> aeadEncrypt(std::span<const std::uint8_t> key,
                                                        std::span<const std::uint8_t> nonce,
                                                        std::span<const std::byte> plainText) override
    {
        requireExactSize(key.size(), g_aeadKeyBytes, "aeadEncrypt: key");
        requireExactSize(nonce.size(), g_aeadNonceBytes, "aeadEncrypt: nonce");
        requireIntSized(plainText.size(), "aeadEncrypt: plainText too large");

        EvpCipherCtxPtr ctx{ EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("aeadEncrypt: EVP_CIPHER_CTX_new failed");
        }
        if (EVP_EncryptInit_ex(ctx.get(), m_aesGcm.get(), nullptr, nullptr, nullptr) != 1)
        {
            throw std::runtime_error("aeadEncrypt: EVP_EncryptInit_ex failed");
        }
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(nonce.size()), nullptr) != 1)
        {
            throw std::runtime_error("aeadEncrypt: set ivlen failed");
        }
        if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1)
        {
            throw std::runtime_error("aeadEncrypt: set key/nonce failed");
        }

        std::vector<std::uint8_t> sealed(plainText.size() + g_aeadTagBytes);
        int outLen{ 0 };
        const auto* ptPtr{ reinterpret_cast<const unsigned char*>(plainText.data()) };
        if (!plainText.empty() &&
            EVP_EncryptUpdate(ctx.get(), sealed.data(), &outLen, ptPtr, static_cast<int>(plainText.size())) != 1)
        {
            throw std::runtime_error("aeadEncrypt: encrypt update failed");
        }
        int finalLen{ 0 };
        if (EVP_EncryptFinal_ex(ctx.get(), sealed.data() + outLen, &finalLen) != 1)
        {
            throw std::runtime_error("aeadEncrypt: encrypt final failed");
        }
        const std::size_t cipherBytes{ static_cast<std::size_t>(outLen) + static_cast<std::size_t>(finalLen) };
        if (cipherBytes != plainText.size())
        {
            throw std::runtime_error("aeadEncrypt: invalid output length");
        }

        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_GET_TAG, static_cast<int>(g_aeadTagBytes),
                                sealed.data() + cipherBytes) != 1)
        {
            throw std::runtime_error("aeadEncrypt: get tag failed");
        }
        return sealed;
    }

    [[nodiscard]] std::optional<securevault::security::SecureBuffer>
    aeadDecrypt(std::span<const std::uint8_t> key, std::span<const std::uint8_t> nonce,
                std::span<const std::uint8_t> sealed) override
    {
        requireExactSize(key.size(), g_aeadKeyBytes, "aeadDecrypt: key");
        requireExactSize(nonce.size(), g_aeadNonceBytes, "aeadDecrypt: nonce");
        requireIntSized(sealed.size(), "aeadDecrypt: input too large");
        if (sealed.size() < g_aeadTagBytes)
        {
            return std::nullopt;
        }

        const auto cipherText{ sealed.first(sealed.size() - g_aeadTagBytes) };
        std::array<std::uint8_t, g_aeadTagBytes> tag{};
        std::memcpy(tag.data(), sealed.data() + cipherText.size(), tag.size());

        EvpCipherCtxPtr ctx{ EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("aeadDecrypt: EVP_CIPHER_CTX_new failed");
        }
        if (EVP_DecryptInit_ex(ctx.get(), m_aesGcm.get(), nullptr, nullptr, nullptr) != 1)
        {
            throw std::runtime_error("aeadDecrypt: EVP_DecryptInit_ex failed");
        }
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(nonce.size()), nullptr) != 1)
        {
            throw std::runtime_error("aeadDecrypt: set ivlen failed");
        }
        if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1)
        {
            throw std::runtime_error("aeadDecrypt: set key/nonce failed");
        }

        // One spare byte so the final call has a valid output pointer for empty plaintext.
        securevault::security::SecureBuffer plainText(cipherText.size() + 1U);
        int outLen{ 0 };
        if (!cipherText.empty() && EVP_DecryptUpdate(ctx.get(), plainText.data(), &outLen, cipherText.data(),
                                                     static_cast<int>(cipherText.size())) != 1)
        {
            securevault::security::secureRelease(plainText);
            return std::nullopt;
        }
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_TAG, static_cast<int>(tag.size()), tag.data()) != 1)
        {
            throw std::runtime_error("aeadDecrypt: set tag failed");
        }

        int finalLen{ 0 };
        if (EVP_DecryptFinal_ex(ctx.get(), plainText.data() + outLen, &finalLen) != 1)
        {
            securevault::security::secureRelease(plainText);
            return std::nullopt;
        }
        const std::size_t totalBytes{ static_cast<std::size_t>(outLen) + static_cast<std::size_t>(finalLen) };
        if (totalBytes != cipherText.size())
        {
            securevault::security::secureRelease(plainText);
            return std::nullopt;
        }
        plainText.resize(totalBytes);
        return plainText;
    }

private:
    EvpKdfPtr m_pbkdf2;
    EvpMdPtr m_sha256;
    EvpCipherPtr m_aesGcm;
};

} // namespace

[[nodiscard]] std::unique_ptr<securevault::crypto::ICryptoProvider> makeOpenSslCryptoProvider()
{
    return std::make_unique<OpenSslCryptoProvider>();
}

} // namespace securevault::crypto::providers
