#ifndef INCLUDE_SECUREVAULT_CORE_KDFPOLICY_HPP
#define INCLUDE_SECUREVAULT_CORE_KDFPOLICY_HPP

#include "securevault/crypto/KdfParams.hpp"

namespace securevault::core
{

// Work factor for record encryption and the hardened commitment.
[[nodiscard]] constexpr securevault::crypto::Pbkdf2Params defaultPbkdf2Params() noexcept
{
    constexpr std::uint32_t kDefaultIterations{ securevault::crypto::g_minPbkdf2Iterations };
    return securevault::crypto::Pbkdf2Params{ .iterations = kDefaultIterations };
}

} // namespace securevault::core

#endif // INCLUDE_SECUREVAULT_CORE_KDFPOLICY_HPP
