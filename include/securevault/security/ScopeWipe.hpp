#ifndef INCLUDE_SECUREVAULT_SECURITY_SCOPEWIPE_HPP
#define INCLUDE_SECUREVAULT_SECURITY_SCOPEWIPE_HPP

#include "securevault/security/MemoryWiper.hpp"
#include "securevault/security/SecureBuffer.hpp"
#include <cstdint>
#include <span>

namespace securevault::security
{

// Wipes a borrowed byte range when the guard leaves scope unless released.
class [[nodiscard]] ScopeWipe final
{
public:
    explicit ScopeWipe(std::span<std::byte> bytes) noexcept : m_bytes{ bytes }
    {
    }

    ScopeWipe(const ScopeWipe&) = delete;
    ScopeWipe& operator=(const ScopeWipe&) = delete;
    ScopeWipe(ScopeWipe&& other) noexcept : m_bytes{ other.m_bytes }
    {
        other.release();
    }
    ScopeWipe& operator=(ScopeWipe&&) = delete;

    ~ScopeWipe() noexcept
    {
        secureWipe(m_bytes);
    }

    void release() noexcept
    {
        m_bytes = {};
    }

private:
    std::span<std::byte> m_bytes;
};

[[nodiscard]] inline ScopeWipe scopeWipe(std::span<std::uint8_t> bytes) noexcept
{
    return ScopeWipe{ std::as_writable_bytes(bytes) };
}

[[nodiscard]] inline ScopeWipe scopeWipe(SecureBuffer& b) noexcept
{
    return ScopeWipe{ asWritableBytes(b) };
}

[[nodiscard]] inline ScopeWipe scopeWipe(SecureString& s) noexcept
{
    return ScopeWipe{ asWritableBytes(s) };
}

} // namespace securevault::security

#endif // INCLUDE_SECUREVAULT_SECURITY_SCOPEWIPE_HPP
