#ifndef INCLUDE_SECUREVAULT_SECURITY_SECUREEQUALS_HPP
#define INCLUDE_SECUREVAULT_SECURITY_SECUREEQUALS_HPP

#include <cstddef>
#include <cstdint>
#include <span>

namespace securevault::security
{

// Constant-time for equal lengths. Length itself is not secret.
[[nodiscard]] inline bool secureEquals(std::span<const std::byte> a, std::span<const std::byte> b) noexcept
{
    if (a.size() != b.size())
    {
        return false;
    }

    volatile unsigned char diff{};
    for (std::size_t i{}; i < a.size(); ++i)
    {
        diff |= std::to_integer<unsigned char>(a[i] ^ b[i]);
    }
    return diff == 0;
}

[[nodiscard]] inline bool secureEquals(std::span<const std::uint8_t> a, std::span<const std::uint8_t> b) noexcept
{
    return secureEquals(std::as_bytes(a), std::as_bytes(b));
}

} // namespace securevault::security

#endif // INCLUDE_SECUREVAULT_SECURITY_SECUREEQUALS_HPP
