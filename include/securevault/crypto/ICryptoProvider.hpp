#ifndef INCLUDE_SECUREVAULT_CRYPTO_ICRYPTOPROVIDER_HPP
#define INCLUDE_SECUREVAULT_CRYPTO_ICRYPTOPROVIDER_HPP

#include "securevault/crypto/KdfParams.hpp"
#include "securevault/security/SecureBuffer.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace securevault::crypto
{

constexpr std::size_t g_aeadKeyBytes{ 32 };
constexpr std::size_t g_aeadNonceBytes{ 12 };
constexpr std::size_t g_aeadTagBytes{ 16 };

using Sha256Digest = std::array<std::uint8_t, g_sha256Bytes>;

// All methods must be safe to call from several threads at once.
class ICryptoProvider
{
public:
    ICryptoProvider() = default;
    ICryptoProvider(const ICryptoProvider&) = delete;
    ICryptoProvider& operator=(const ICryptoProvider&) = delete;
    ICryptoProvider(ICryptoProvider&&) = delete;
    ICryptoProvider& operator=(ICryptoProvider&&) = delete;
    virtual ~ICryptoProvider() = default;

    // PBKDF2-HMAC-SHA256 producing a g_derivedKeyBytes key.
    // Contract violations (salt size, iteration floor) throw std::invalid_argument.
    [[nodiscard]] virtual securevault::security::SecureBuffer deriveKey(std::span<const std::byte> passphrase,
                                                                        std::span<const std::uint8_t> salt,
                                                                        const Pbkdf2Params& params) const = 0;

    [[nodiscard]] virtual Sha256Digest sha256(std::span<const std::byte> data) const = 0;

    [[nodiscard]] virtual bool randomBytes(std::span<std::uint8_t> out) noexcept = 0;

    // AEAD: AES-256-GCM, 12-byte nonce, tag appended to the ciphertext.
    [[nodiscard]] virtual std::vector<std::uint8_t> aeadEncrypt(std::span<const std::uint8_t> key,
                                                                std::span<const std::uint8_t> nonce,
                                                                std::span<const std::byte> plainText) = 0;

    // Returns std::nullopt on authentication failure.
    [[nodiscard]] virtual std::optional<securevault::security::SecureBuffer>
    aeadDecrypt(std::span<const std::uint8_t> key, std::span<const std::uint8_t> nonce,
                std::span<const std::uint8_t> sealed) = 0;
};

} // namespace securevault::crypto

#endif // INCLUDE_SECUREVAULT_CRYPTO_ICRYPTOPROVIDER_HPP
