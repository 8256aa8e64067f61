#ifndef INCLUDE_SECUREVAULT_CORE_RECORDCODEC_HPP
#define INCLUDE_SECUREVAULT_CORE_RECORDCODEC_HPP

#include "securevault/core/VaultError.hpp"
#include "securevault/crypto/ICryptoProvider.hpp"
#include "securevault/crypto/KdfParams.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace securevault::core
{

constexpr std::size_t g_blobSaltBytes{ securevault::crypto::g_kdfSaltBytes };
constexpr std::size_t g_blobIvBytes{ securevault::crypto::g_aeadNonceBytes };
constexpr std::size_t g_blobMinBytes{ g_blobSaltBytes + g_blobIvBytes };

// salt(16) | iv(12) | ciphertext+tag
struct EncryptedBlob final
{
    std::array<std::uint8_t, g_blobSaltBytes> salt{};
    std::array<std::uint8_t, g_blobIvBytes> iv{};
    std::vector<std::uint8_t> cipherText;
};

[[nodiscard]] std::string encodeBlob(const EncryptedBlob& blob);

// InvalidFormat when the text is not strict base64 or decodes to fewer than g_blobMinBytes.
[[nodiscard]] VaultResult<EncryptedBlob> decodeBlob(std::string_view text);

} // namespace securevault::core

#endif // INCLUDE_SECUREVAULT_CORE_RECORDCODEC_HPP
