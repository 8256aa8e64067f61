#ifndef INCLUDE_SECUREVAULT_CORE_VAULTOPTIONS_HPP
#define INCLUDE_SECUREVAULT_CORE_VAULTOPTIONS_HPP

#include "securevault/core/Commitment.hpp"
#include "securevault/core/Timestamp.hpp"
#include <chrono>
#include <cstddef>
#include <functional>

namespace securevault::core
{

constexpr std::size_t g_defaultDecryptWorkers{ 1U };
constexpr std::size_t g_maxDecryptWorkers{ 64U };

using WallClock = std::function<Timestamp()>;

[[nodiscard]] inline Timestamp systemNow()
{
    return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
}

struct VaultOptions final
{
    // Used only when a new vault is initialized; existing commitments keep their scheme.
    CommitmentScheme commitmentScheme{ CommitmentScheme::Sha256 };
    // Threads used by listDecrypted. Clamped to [1, g_maxDecryptWorkers].
    std::size_t decryptWorkers{ g_defaultDecryptWorkers };
    WallClock clock{ systemNow };
};

} // namespace securevault::core

#endif // INCLUDE_SECUREVAULT_CORE_VAULTOPTIONS_HPP
