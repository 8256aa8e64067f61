#include "securevault/core/Commitment.hpp"

#include "Base64.hpp"
#include "securevault/core/KdfPolicy.hpp"
#include "securevault/security/ScopeWipe.hpp"
#include "securevault/security/SecureEquals.hpp"
#include <array>
#include <charconv>
#include <plog/Log.h>
#include <stdexcept>
#include <vector>

namespace securevault::core
{
namespace
{

constexpr std::string_view g_kSha256Name{ "sha256" };
constexpr std::string_view g_kPbkdf2Name{ "pbkdf2-sha256" };
constexpr std::string_view g_kPbkdf2Prefix{ "pbkdf2-sha256$" };
constexpr char g_kSeparator{ '$' };

struct Pbkdf2Commitment final
{
    std::uint32_t iterations{};
    std::vector<std::uint8_t> salt{};
    std::vector<std::uint8_t> key{};
};

[[nodiscard]] std::optional<Pbkdf2Commitment> parsePbkdf2(std::string_view stored)
{
    std::string_view rest{ stored.substr(g_kPbkdf2Prefix.size()) };

    const auto firstSep{ rest.find(g_kSeparator) };
    if (firstSep == std::string_view::npos)
    {
        return std::nullopt;
    }
    const std::string_view iterText{ rest.substr(0, firstSep) };
    rest.remove_prefix(firstSep + 1U);

    const auto secondSep{ rest.find(g_kSeparator) };
    if (secondSep == std::string_view::npos)
    {
        return std::nullopt;
    }
    const std::string_view saltText{ rest.substr(0, secondSep) };
    const std::string_view keyText{ rest.substr(secondSep + 1U) };

    Pbkdf2Commitment out{};
    const auto [ptr, ec]{ std::from_chars(iterText.data(), iterText.data() + iterText.size(), out.iterations) };
    if (ec != std::errc{} || ptr != iterText.data() + iterText.size() ||
        out.iterations < securevault::crypto::g_minPbkdf2Iterations)
    {
        return std::nullopt;
    }

    auto salt{ detail::base64Decode(saltText) };
    auto key{ detail::base64Decode(keyText) };
    if (!salt || !key || salt->size() != securevault::crypto::g_kdfSaltBytes ||
        key->size() != securevault::crypto::g_derivedKeyBytes)
    {
        return std::nullopt;
    }
    out.salt = std::move(*salt);
    out.key = std::move(*key);
    return out;
}

// The zero salt is never stored; the derived key is discarded.
void deriveAndDiscard(securevault::crypto::ICryptoProvider& crypto, const securevault::security::SecureString& passphrase,
                      CommitmentScheme scheme)
{
    if (scheme == CommitmentScheme::Sha256)
    {
        auto digest{ crypto.sha256(securevault::security::asBytes(passphrase)) };
        auto wipe{ securevault::security::scopeWipe(std::span<std::uint8_t>{ digest }) };
        return;
    }
    const std::array<std::uint8_t, securevault::crypto::g_kdfSaltBytes> salt{};
    auto key{ crypto.deriveKey(securevault::security::asBytes(passphrase), salt, defaultPbkdf2Params()) };
    auto wipe{ securevault::security::scopeWipe(key) };
}

[[nodiscard]] bool verifySha256(securevault::crypto::ICryptoProvider& crypto, std::string_view stored,
                                const securevault::security::SecureString& passphrase)
{
    const auto expected{ detail::base64Decode(stored) };
    if (!expected || expected->size() != securevault::crypto::g_sha256Bytes)
    {
        PLOGW << "commitment: unreadable sha256 commitment";
        deriveAndDiscard(crypto, passphrase, CommitmentScheme::Sha256);
        return false;
    }
    auto digest{ crypto.sha256(securevault::security::asBytes(passphrase)) };
    auto wipe{ securevault::security::scopeWipe(std::span<std::uint8_t>{ digest }) };
    return securevault::security::secureEquals(std::span<const std::uint8_t>{ digest },
                                               std::span<const std::uint8_t>{ *expected });
}

[[nodiscard]] bool verifyPbkdf2(securevault::crypto::ICryptoProvider& crypto, std::string_view stored,
                                const securevault::security::SecureString& passphrase)
{
    const auto parsed{ parsePbkdf2(stored) };
    if (!parsed)
    {
        PLOGW << "commitment: unreadable pbkdf2 commitment";
        deriveAndDiscard(crypto, passphrase, CommitmentScheme::Pbkdf2Sha256);
        return false;
    }
    auto key{ crypto.deriveKey(securevault::security::asBytes(passphrase), parsed->salt,
                               securevault::crypto::Pbkdf2Params{ .iterations = parsed->iterations }) };
    auto wipe{ securevault::security::scopeWipe(key) };
    return securevault::security::secureEquals(std::span<const std::uint8_t>{ key },
                                               std::span<const std::uint8_t>{ parsed->key });
}

} // namespace

std::string_view toString(CommitmentScheme scheme) noexcept
{
    switch (scheme)
    {
    case CommitmentScheme::Sha256:
        return g_kSha256Name;
    case CommitmentScheme::Pbkdf2Sha256:
        return g_kPbkdf2Name;
    }
    return "unknown";
}

std::optional<CommitmentScheme> parseCommitmentScheme(std::string_view name) noexcept
{
    if (name == g_kSha256Name)
    {
        return CommitmentScheme::Sha256;
    }
    if (name == g_kPbkdf2Name)
    {
        return CommitmentScheme::Pbkdf2Sha256;
    }
    return std::nullopt;
}

VaultResult<std::string> makeCommitment(securevault::crypto::ICryptoProvider& crypto,
                                        const securevault::security::SecureString& passphrase,
                                        CommitmentScheme scheme) noexcept
{
    try
    {
        if (scheme == CommitmentScheme::Sha256)
        {
            auto digest{ crypto.sha256(securevault::security::asBytes(passphrase)) };
            auto wipe{ securevault::security::scopeWipe(std::span<std::uint8_t>{ digest }) };
            return detail::base64Encode(digest);
        }

        std::array<std::uint8_t, securevault::crypto::g_kdfSaltBytes> salt{};
        if (!crypto.randomBytes(salt))
        {
            PLOGE << "commitment: CSPRNG failure";
            return VaultError::RandomFailed;
        }
        const auto params{ defaultPbkdf2Params() };
        auto key{ crypto.deriveKey(securevault::security::asBytes(passphrase), salt, params) };
        auto wipe{ securevault::security::scopeWipe(key) };

        std::string out{ g_kPbkdf2Prefix };
        out.append(std::to_string(params.iterations));
        out.push_back(g_kSeparator);
        out.append(detail::base64Encode(salt));
        out.push_back(g_kSeparator);
        out.append(detail::base64Encode(key));
        return out;
    }
    catch (const std::invalid_argument& e)
    {
        PLOGE << "commitment: " << e.what();
        return VaultError::InvalidArgument;
    }
    catch (const std::exception& e)
    {
        PLOGE << "commitment: " << e.what();
        return VaultError::CryptoError;
    }
}

bool verifyCommitment(securevault::crypto::ICryptoProvider& crypto, std::string_view stored,
                      const securevault::security::SecureString& passphrase) noexcept
{
    try
    {
        if (stored.starts_with(g_kPbkdf2Prefix))
        {
            return verifyPbkdf2(crypto, stored, passphrase);
        }
        return verifySha256(crypto, stored, passphrase);
    }
    catch (const std::exception& e)
    {
        PLOGW << "commitment: verification aborted: " << e.what();
        return false;
    }
}

void rejectPassphrase(securevault::crypto::ICryptoProvider& crypto,
                      const securevault::security::SecureString& passphrase, CommitmentScheme scheme) noexcept
{
    try
    {
        deriveAndDiscard(crypto, passphrase, scheme);
    }
    catch (const std::exception& e)
    {
        PLOGW << "commitment: " << e.what();
    }
}

} // namespace securevault::core
