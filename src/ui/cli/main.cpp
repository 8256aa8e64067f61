#include "AppConfig.hpp"
#include "ConsoleUtils.hpp"
#include "InteractiveShell.hpp"

#include "securevault/core/VaultSession.hpp"
#include "securevault/core/VaultStore.hpp"
#include "securevault/crypto/providers/OpenSslProviderFactory.hpp"
#include "securevault/storage/sqlite/SqliteKeyValueStoreFactory.hpp"
#include <CLI/CLI.hpp>
#include <iostream>
#include <plog/Log.h>

int main(int argc, char** argv)
{
    securevault::ui::cli::AppConfig config{};
    CLI::App app{ "SecureVault: encrypted credential vault" };
    securevault::ui::cli::registerOptions(app, config);

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError& e)
    {
        return app.exit(e);
    }

    try
    {
        securevault::ui::cli::initLogging(config);
        securevault::ui::cli::hardenProcess();

        auto crypto{ securevault::crypto::providers::makeOpenSslCryptoProvider() };
        auto storage{ securevault::storage::sqlite::makeSqliteKeyValueStore(config.vaultPath) };
        securevault::core::VaultStore store{ *crypto, *storage, securevault::ui::cli::toVaultOptions(config) };

        const auto timeout{ securevault::ui::cli::sessionTimeout(config) };
        securevault::core::SessionCache cache{ *crypto, timeout };

        securevault::ui::cli::InteractiveShell shell{
            store, cache, std::cin, std::cout,
            [](const std::string& prompt) { return securevault::ui::cli::readPassword(prompt, std::cout); }, timeout
        };
        PLOGI << "shell started on " << config.vaultPath;
        return shell.run();
    }
    catch (const std::exception& e)
    {
        PLOGF << e.what();
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    }
}
