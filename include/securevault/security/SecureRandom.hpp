#ifndef INCLUDE_SECUREVAULT_SECURITY_SECURERANDOM_HPP
#define INCLUDE_SECUREVAULT_SECURITY_SECURERANDOM_HPP

#include <cstdint>
#include <span>

namespace securevault::security
{

// Fills `out` from the operating system CSPRNG. Returns false if the OS source fails.
[[nodiscard]] bool secureRandomFill(std::span<std::uint8_t> out) noexcept;

} // namespace securevault::security

#endif // INCLUDE_SECUREVAULT_SECURITY_SECURERANDOM_HPP
