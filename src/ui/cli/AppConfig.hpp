#ifndef SECUREVAULT_UI_CLI_APPCONFIG_HPP
#define SECUREVAULT_UI_CLI_APPCONFIG_HPP

#include "securevault/core/VaultOptions.hpp"
#include <CLI/CLI.hpp>
#include <chrono>
#include <cstddef>
#include <plog/Severity.h>
#include <string>

namespace securevault::ui::cli
{

struct AppConfig final
{
    std::string vaultPath{ "securevault.db" };
    std::string logLevel{ "warning" };
    std::string logFile{};
    long long sessionTimeoutSeconds{ 300 };
    std::size_t decryptWorkers{ securevault::core::g_defaultDecryptWorkers };
    std::string commitment{ "sha256" };
};

// Every option can also come from a SECV_* environment variable or the INI file named by --config.
void registerOptions(CLI::App& app, AppConfig& config);

[[nodiscard]] securevault::core::VaultOptions toVaultOptions(const AppConfig& config);

[[nodiscard]] plog::Severity toSeverity(const std::string& level) noexcept;

[[nodiscard]] std::chrono::seconds sessionTimeout(const AppConfig& config) noexcept;

// Console appender on stderr, plus a rolling file appender when a log file is configured.
void initLogging(const AppConfig& config);

} // namespace securevault::ui::cli

#endif // SECUREVAULT_UI_CLI_APPCONFIG_HPP
