#ifndef INCLUDE_SECUREVAULT_CORE_COMMITMENT_HPP
#define INCLUDE_SECUREVAULT_CORE_COMMITMENT_HPP

#include "securevault/core/VaultError.hpp"
#include "securevault/crypto/ICryptoProvider.hpp"
#include "securevault/security/SecureBuffer.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace securevault::core
{

enum class CommitmentScheme : std::uint8_t
{
    // base64(SHA-256(passphrase)). Fast, so weak against offline guessing.
    Sha256,
    // pbkdf2-sha256$<iterations>$<b64 salt>$<b64 key>
    Pbkdf2Sha256,
};

[[nodiscard]] std::string_view toString(CommitmentScheme scheme) noexcept;
[[nodiscard]] std::optional<CommitmentScheme> parseCommitmentScheme(std::string_view name) noexcept;

[[nodiscard]] VaultResult<std::string> makeCommitment(securevault::crypto::ICryptoProvider& crypto,
                                                      const securevault::security::SecureString& passphrase,
                                                      CommitmentScheme scheme) noexcept;

// Detects the scheme from the stored value. Any parse or backend failure reads as a mismatch.
[[nodiscard]] bool verifyCommitment(securevault::crypto::ICryptoProvider& crypto, std::string_view stored,
                                    const securevault::security::SecureString& passphrase) noexcept;

// Spends the same key-derivation work as verifying against a commitment of this scheme,
// then discards it. For rejections that have no stored commitment to compare against.
void rejectPassphrase(securevault::crypto::ICryptoProvider& crypto,
                      const securevault::security::SecureString& passphrase, CommitmentScheme scheme) noexcept;

} // namespace securevault::core

#endif // INCLUDE_SECUREVAULT_CORE_COMMITMENT_HPP
