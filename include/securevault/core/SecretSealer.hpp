#ifndef INCLUDE_SECUREVAULT_CORE_SECRETSEALER_HPP
#define INCLUDE_SECUREVAULT_CORE_SECRETSEALER_HPP

#include "securevault/core/VaultError.hpp"
#include "securevault/crypto/ICryptoProvider.hpp"
#include "securevault/security/SecureBuffer.hpp"
#include <string>
#include <string_view>

namespace securevault::core
{

// Encrypts one secret under a key derived from `passphrase` with freshly minted salt and IV,
// and returns the base64 blob.
[[nodiscard]] VaultResult<std::string> sealSecret(securevault::crypto::ICryptoProvider& crypto,
                                                  const securevault::security::SecureString& plainText,
                                                  const securevault::security::SecureString& passphrase) noexcept;

// Reverses sealSecret using the salt embedded in the blob.
// InvalidFormat for a malformed blob, IntegrityFailed for a wrong passphrase or tampered bytes.
[[nodiscard]] VaultResult<securevault::security::SecureString>
openSecret(securevault::crypto::ICryptoProvider& crypto, std::string_view blob,
           const securevault::security::SecureString& passphrase) noexcept;

} // namespace securevault::core

#endif // INCLUDE_SECUREVAULT_CORE_SECRETSEALER_HPP
