#include "AppConfig.hpp"

#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>
#include <stdexcept>

namespace securevault::ui::cli
{
namespace
{

constexpr std::size_t g_kMaxLogFileBytes{ 1024U * 1024U };
constexpr int g_kMaxLogFiles{ 3 };

} // namespace

void registerOptions(CLI::App& app, AppConfig& config)
{
    app.set_config("--config", "", "Read options from an INI file");

    app.add_option("--vault", config.vaultPath, "Path to the vault database file")
        ->envname("SECV_VAULT")
        ->capture_default_str();

    app.add_option("--log-level", config.logLevel, "Log severity")
        ->envname("SECV_LOG_LEVEL")
        ->check(CLI::IsMember({ "none", "fatal", "error", "warning", "info", "debug", "verbose" }))
        ->capture_default_str();

    app.add_option("--log-file", config.logFile, "Also write logs to this rolling file")->envname("SECV_LOG_FILE");

    app.add_option("--session-timeout", config.sessionTimeoutSeconds, "Idle seconds before the vault locks (0 = never)")
        ->envname("SECV_SESSION_TIMEOUT")
        ->check(CLI::NonNegativeNumber)
        ->capture_default_str();

    app.add_option("--decrypt-workers", config.decryptWorkers, "Threads used to decrypt listings")
        ->envname("SECV_DECRYPT_WORKERS")
        ->check(CLI::Range(std::size_t{ 1 }, securevault::core::g_maxDecryptWorkers))
        ->capture_default_str();

    app.add_option("--commitment", config.commitment,
                   "Passphrase check for new vaults. sha256 is a single fast hash and is cheap to brute-force "
                   "offline; pbkdf2-sha256 applies the record key derivation")
        ->envname("SECV_COMMITMENT")
        ->check(CLI::IsMember({ "sha256", "pbkdf2-sha256" }))
        ->capture_default_str();
}

securevault::core::VaultOptions toVaultOptions(const AppConfig& config)
{
    securevault::core::VaultOptions options{};
    const auto scheme{ securevault::core::parseCommitmentScheme(config.commitment) };
    if (!scheme)
    {
        throw std::invalid_argument("unknown commitment scheme: " + config.commitment);
    }
    options.commitmentScheme = *scheme;
    options.decryptWorkers = config.decryptWorkers;
    return options;
}

plog::Severity toSeverity(const std::string& level) noexcept
{
    if (level.empty() || level == "none")
    {
        return plog::none;
    }
    return plog::severityFromString(level.c_str());
}

std::chrono::seconds sessionTimeout(const AppConfig& config) noexcept
{
    return std::chrono::seconds{ config.sessionTimeoutSeconds < 0 ? 0 : config.sessionTimeoutSeconds };
}

void initLogging(const AppConfig& config)
{
    static plog::ConsoleAppender<plog::TxtFormatter> consoleAppender{ plog::streamStdErr };
    plog::init(toSeverity(config.logLevel), &consoleAppender);

    if (!config.logFile.empty())
    {
        static plog::RollingFileAppender<plog::TxtFormatter> fileAppender{ config.logFile.c_str(), g_kMaxLogFileBytes,
                                                                           g_kMaxLogFiles };
        plog::get()->addAppender(&fileAppender);
    }
}

} // namespace securevault::ui::cli
