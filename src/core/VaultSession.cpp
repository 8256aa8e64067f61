#include "securevault/core/VaultSession.hpp"

#include <array>
#include <plog/Log.h>

namespace securevault::core
{
namespace
{

constexpr std::string_view g_kHexDigits{ "0123456789abcdef" };

} // namespace

VaultSession::VaultSession(securevault::security::SecureString passphrase, Duration timeout, NowProvider nowProvider)
    : m_now(std::move(nowProvider)), m_timeout(timeout), m_lastActivity{}, m_passphrase(std::move(passphrase))
{
    m_lastActivity = m_now();
}

VaultResult<VaultSession> VaultSession::open(const VaultStore& store,
                                             const securevault::security::SecureString& passphrase, Duration timeout,
                                             NowProvider nowProvider)
{
    if (passphrase.empty())
    {
        return VaultError::InvalidArgument;
    }
    if (!store.verify(passphrase))
    {
        PLOGW << "session: passphrase rejected";
        return VaultError::AuthFailed;
    }
    PLOGI << "session: unlocked";
    return VaultSession{ passphrase, timeout, std::move(nowProvider) };
}

void VaultSession::touch() noexcept
{
    m_lastActivity = m_now();
}

bool VaultSession::isExpired() const noexcept
{
    if (m_timeout.count() <= 0)
    {
        return false;
    }

    return (m_now() - m_lastActivity) > m_timeout;
}

void VaultSession::lock() noexcept
{
    securevault::security::secureRelease(m_passphrase);
    if (!m_locked)
    {
        PLOGI << "session: locked";
    }
    m_locked = true;
}

bool VaultSession::isLocked() const noexcept
{
    return m_locked || m_passphrase.empty();
}

VaultResult<std::reference_wrapper<const securevault::security::SecureString>> VaultSession::passphrase() const noexcept
{
    if (isLocked() || isExpired())
    {
        return VaultError::InvalidState;
    }
    return std::cref(m_passphrase);
}

VaultSession::Duration VaultSession::timeout() const noexcept
{
    return m_timeout;
}

SessionCache::SessionCache(securevault::crypto::ICryptoProvider& crypto, Duration ttl, NowProvider nowProvider)
    : m_crypto(&crypto), m_ttl(ttl), m_now(std::move(nowProvider))
{
}

bool SessionCache::expired(const Entry& entry, TimePoint now) const noexcept
{
    if (m_ttl.count() <= 0)
    {
        return false;
    }
    return (now - entry.storedAt) > m_ttl;
}

VaultResult<std::string> SessionCache::remember(const VaultSession& session)
{
    const auto pass{ session.passphrase() };
    if (isError(pass))
    {
        return std::get<VaultError>(pass);
    }

    std::array<std::uint8_t, g_tokenBytes> raw{};
    if (!m_crypto->randomBytes(raw))
    {
        PLOGE << "session cache: CSPRNG failure";
        return VaultError::RandomFailed;
    }
    std::string token{};
    token.reserve(raw.size() * 2U);
    for (const std::uint8_t b : raw)
    {
        token.push_back(g_kHexDigits[b >> 4U]);
        token.push_back(g_kHexDigits[b & 0x0FU]);
    }

    Entry entry{};
    entry.passphrase = std::get<std::reference_wrapper<const securevault::security::SecureString>>(pass).get();
    entry.sessionTimeout = session.timeout();
    entry.storedAt = m_now();

    const std::lock_guard lock{ m_mutex };
    m_entries.insert_or_assign(token, std::move(entry));
    PLOGI << "session cache: entry stored (" << m_entries.size() << " cached)";
    return token;
}

VaultResult<VaultSession> SessionCache::restore(std::string_view token, const VaultStore& store)
{
    securevault::security::SecureString passphrase{};
    Duration sessionTimeout{};
    {
        const std::lock_guard lock{ m_mutex };
        const auto it{ m_entries.find(token) };
        if (it == m_entries.end())
        {
            PLOGW << "session cache: unknown token";
            return VaultError::InvalidState;
        }
        if (expired(it->second, m_now()))
        {
            PLOGW << "session cache: token expired";
            m_entries.erase(it);
            return VaultError::InvalidState;
        }
        passphrase = it->second.passphrase;
        sessionTimeout = it->second.sessionTimeout;
    }

    auto session{ VaultSession::open(store, passphrase, sessionTimeout, m_now) };
    VaultError failure{ VaultError::AuthFailed };
    if (!isError(session))
    {
        const auto firstRecord{ store.checkFirstRecord(passphrase) };
        if (!isError(firstRecord))
        {
            PLOGI << "session cache: session restored";
            return session;
        }
        failure = std::get<VaultError>(firstRecord);
        std::get<VaultSession>(session).lock();
    }
    else
    {
        failure = std::get<VaultError>(session);
    }

    PLOGW << "session cache: restore failed (" << toString(failure) << "), entry discarded";
    forget(token);
    return failure;
}

void SessionCache::forget(std::string_view token) noexcept
{
    const std::lock_guard lock{ m_mutex };
    const auto it{ m_entries.find(token) };
    if (it != m_entries.end())
    {
        m_entries.erase(it);
    }
}

std::size_t SessionCache::purgeExpired() noexcept
{
    const std::lock_guard lock{ m_mutex };
    const TimePoint now{ m_now() };
    return std::erase_if(m_entries, [&](const auto& kv) { return expired(kv.second, now); });
}

std::size_t SessionCache::size() const noexcept
{
    const std::lock_guard lock{ m_mutex };
    return m_entries.size();
}

} // namespace securevault::core
