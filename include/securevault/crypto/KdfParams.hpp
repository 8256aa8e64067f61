#ifndef INCLUDE_SECUREVAULT_CRYPTO_KDFPARAMS_HPP
#define INCLUDE_SECUREVAULT_CRYPTO_KDFPARAMS_HPP

#include <cstddef>
#include <cstdint>

namespace securevault::crypto
{

constexpr std::size_t g_kdfSaltBytes{ 16 };
constexpr std::size_t g_derivedKeyBytes{ 32 };
constexpr std::size_t g_sha256Bytes{ 32 };

// Lower bound enforced by every provider.
constexpr std::uint32_t g_minPbkdf2Iterations{ 100'000U };

// PBKDF2-HMAC-SHA256. The blob format does not record the iteration count,
// so record encryption always uses the default.
struct Pbkdf2Params final
{
    std::uint32_t iterations{ g_minPbkdf2Iterations };
};

} // namespace securevault::crypto

#endif // INCLUDE_SECUREVAULT_CRYPTO_KDFPARAMS_HPP
