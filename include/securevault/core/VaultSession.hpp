#ifndef INCLUDE_SECUREVAULT_CORE_VAULTSESSION_HPP
#define INCLUDE_SECUREVAULT_CORE_VAULTSESSION_HPP

#include "securevault/core/VaultError.hpp"
#include "securevault/core/VaultStore.hpp"
#include "securevault/crypto/ICryptoProvider.hpp"
#include "securevault/security/SecureBuffer.hpp"
#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <string_view>

namespace securevault::core
{

// Holds a verified passphrase in wiped-on-release memory for as long as the user is active.
class VaultSession final
{
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration = std::chrono::seconds;
    using NowProvider = std::function<TimePoint()>;

    // AuthFailed when the passphrase does not verify, InvalidArgument when it is empty.
    [[nodiscard]] static VaultResult<VaultSession> open(const VaultStore& store,
                                                        const securevault::security::SecureString& passphrase,
                                                        Duration timeout, NowProvider nowProvider = Clock::now);

    VaultSession(const VaultSession&) = delete;
    VaultSession& operator=(const VaultSession&) = delete;
    VaultSession(VaultSession&&) noexcept = default;
    VaultSession& operator=(VaultSession&&) noexcept = default;
    ~VaultSession() = default;

    void touch() noexcept;

    // A zero timeout never expires.
    [[nodiscard]] bool isExpired() const noexcept;

    // Wipes the passphrase. Irreversible for this object.
    void lock() noexcept;
    [[nodiscard]] bool isLocked() const noexcept;

    // InvalidState once locked or expired.
    [[nodiscard]] VaultResult<std::reference_wrapper<const securevault::security::SecureString>>
    passphrase() const noexcept;

    [[nodiscard]] Duration timeout() const noexcept;

private:
    VaultSession(securevault::security::SecureString passphrase, Duration timeout, NowProvider nowProvider);

    NowProvider m_now;
    Duration m_timeout{};
    TimePoint m_lastActivity{};
    securevault::security::SecureString m_passphrase;
    bool m_locked{ false };
};

// Process-local cache that lets a locked shell resume without retyping the passphrase.
// Nothing here ever reaches durable storage.
class SessionCache final
{
public:
    using Clock = VaultSession::Clock;
    using TimePoint = VaultSession::TimePoint;
    using Duration = VaultSession::Duration;
    using NowProvider = VaultSession::NowProvider;

    static constexpr std::size_t g_tokenBytes{ 32U };

    SessionCache(securevault::crypto::ICryptoProvider& crypto, Duration ttl, NowProvider nowProvider = Clock::now);

    // Returns a random hex token unrelated to the passphrase.
    // InvalidState if the session is locked or expired, RandomFailed if no token could be minted.
    [[nodiscard]] VaultResult<std::string> remember(const VaultSession& session);

    // InvalidState for unknown or expired tokens; AuthFailed/IntegrityFailed/InvalidFormat when the
    // cached passphrase no longer opens the vault. Every failure discards the entry.
    [[nodiscard]] VaultResult<VaultSession> restore(std::string_view token, const VaultStore& store);

    void forget(std::string_view token) noexcept;

    // Returns how many entries were dropped.
    std::size_t purgeExpired() noexcept;

    [[nodiscard]] std::size_t size() const noexcept;

private:
    struct Entry final
    {
        securevault::security::SecureString passphrase;
        Duration sessionTimeout{};
        TimePoint storedAt{};
    };

    [[nodiscard]] bool expired(const Entry& entry, TimePoint now) const noexcept;

    securevault::crypto::ICryptoProvider* m_crypto{ nullptr };
    Duration m_ttl{};
    NowProvider m_now;
    mutable std::mutex m_mutex;
    std::map<std::string, Entry, std::less<>> m_entries;
};

} // namespace securevault::core

#endif // INCLUDE_SECUREVAULT_CORE_VAULTSESSION_HPP
