#ifndef SECUREVAULT_UI_CLI_INTERACTIVESHELL_HPP
#define SECUREVAULT_UI_CLI_INTERACTIVESHELL_HPP

#include "securevault/core/VaultSession.hpp"
#include "securevault/core/VaultStore.hpp"
#include "securevault/security/SecureBuffer.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <optional>
#include <string>

namespace securevault::ui::cli
{

// In tests: returns a pre-determined string.
using PasswordReader = std::function<securevault::security::SecureString(const std::string&)>;

class InteractiveShell final
{
public:
    InteractiveShell(securevault::core::VaultStore& store, securevault::core::SessionCache& cache, std::istream& in,
                     std::ostream& out, PasswordReader pwdReader, std::chrono::seconds sessionTimeout,
                     securevault::core::VaultSession::NowProvider nowProvider = securevault::core::VaultSession::Clock::now);

    int run();

private:
    securevault::core::VaultStore& m_store;
    securevault::core::SessionCache& m_cache;
    std::istream& m_in;
    std::ostream& m_out;
    PasswordReader m_pwdReader;
    std::chrono::seconds m_sessionTimeout;
    securevault::core::VaultSession::NowProvider m_now;

    std::optional<securevault::core::VaultSession> m_session;
    bool m_running{ true };

    void processLine(const std::string& line);
    void expireIdleSession();
    [[nodiscard]] bool requireUnlocked();
    // Only valid right after requireUnlocked() succeeded.
    [[nodiscard]] const securevault::security::SecureString& passphrase() const;
    void reportError(const char* what, securevault::core::VaultError error);

    void doInit();
    void doUnlock();
    void doLock();
    void doSuspend();
    void doResume(const std::string& token);
    void doStatus();
    void doList(bool reveal);
    void doAdd(const securevault::core::RecordFields& fields);
    void doEdit(const std::string& id, securevault::core::RecordUpdate update, bool newPassword);
    void doRm(const std::string& id);
    void doExport(const std::filesystem::path& file);
    void doImport(const std::filesystem::path& file);
    void doWipe();
};

} // namespace securevault::ui::cli

#endif // SECUREVAULT_UI_CLI_INTERACTIVESHELL_HPP
