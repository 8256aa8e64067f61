#include "InteractiveShell.hpp"
#include "Tokenizer.hpp"
#include "securevault/security/ScopeWipe.hpp"

#include <CLI/CLI.hpp>
#include <fstream>
#include <iterator>
#include <plog/Log.h>
#include <system_error>
#include <vector>

namespace securevault::ui::cli
{

namespace
{

constexpr const char* g_kLockedMessage{ "Error: Vault is locked. Use 'unlock' or 'resume <token>'.\n" };

} // namespace

InteractiveShell::InteractiveShell(securevault::core::VaultStore& store, securevault::core::SessionCache& cache,
                                   std::istream& in, std::ostream& out, PasswordReader pwdReader,
                                   std::chrono::seconds sessionTimeout,
                                   securevault::core::VaultSession::NowProvider nowProvider)
    : m_store(store), m_cache(cache), m_in(in), m_out(out), m_pwdReader(std::move(pwdReader)),
      m_sessionTimeout(sessionTimeout), m_now(std::move(nowProvider))
{
}

int InteractiveShell::run()
{
    m_out << "SecureVault shell\n";
    m_out << "Type 'help' for available commands.\n";

    std::string line;
    while (m_running && m_in.good())
    {
        m_out << (m_session.has_value() ? "secv(unlocked)> " : "secv> ");

        if (!std::getline(m_in, line))
        {
            break; // EOF
        }

        if (line.empty())
        {
            continue;
        }

        expireIdleSession();
        processLine(line);
    }

    if (m_session.has_value())
    {
        m_session->lock();
        m_session.reset();
    }
    return 0;
}

void InteractiveShell::expireIdleSession()
{
    if (m_session.has_value() && m_session->isExpired())
    {
        m_session->lock();
        m_session.reset();
        m_out << "Session expired; vault locked.\n";
    }
}

bool InteractiveShell::requireUnlocked()
{
    if (!m_session.has_value() || securevault::core::isError(m_session->passphrase()))
    {
        m_out << g_kLockedMessage;
        return false;
    }
    m_session->touch();
    return true;
}

const securevault::security::SecureString& InteractiveShell::passphrase() const
{
    return std::get<std::reference_wrapper<const securevault::security::SecureString>>(m_session->passphrase()).get();
}

void InteractiveShell::reportError(const char* what, securevault::core::VaultError error)
{
    using securevault::core::VaultError;
    switch (error)
    {
    case VaultError::AuthFailed:
        m_out << "Error: " << what << ": wrong passphrase.\n";
        return;
    case VaultError::NotFound:
        m_out << "Error: " << what << ": no such record.\n";
        return;
    case VaultError::InvalidState:
        m_out << "Error: " << what << ": vault is not initialized.\n";
        return;
    case VaultError::InvalidFormat:
        m_out << "Error: " << what << ": malformed data.\n";
        return;
    default:
        m_out << "Error: " << what << " (" << securevault::core::toString(error) << ").\n";
        return;
    }
}

void InteractiveShell::processLine(const std::string& line)
{
    auto tokens = Tokenizer::tokenize(line);
    if (!tokens)
    {
        m_out << "Syntax Error: unterminated quote\n";
        return;
    }
    std::vector<std::string> userArgs = std::move(*tokens);

    if (userArgs.empty())
    {
        return;
    }

    // 'help' prints the root help rather than the help of the 'help' subcommand.
    if (userArgs[0] == "help")
    {
        userArgs[0] = "--help";
    }

    std::vector<std::string> args;
    args.reserve(userArgs.size() + 1);
    args.emplace_back("secv");
    args.insert(args.end(), userArgs.begin(), userArgs.end());

    CLI::App app{ "SecureVault shell" };
    app.require_subcommand(1);

    app.add_subcommand("help", "Print this help message")->callback([]() { throw CLI::CallForHelp(); });
    app.add_subcommand("exit", "Exit the shell")->alias("quit")->callback([this]() { m_running = false; });

    app.add_subcommand("init", "Create a new vault")->callback([this]() { doInit(); });
    app.add_subcommand("unlock", "Unlock the vault")->callback([this]() { doUnlock(); });
    app.add_subcommand("lock", "Lock the vault")->callback([this]() { doLock(); });
    app.add_subcommand("suspend", "Lock the vault and print a token for 'resume'")->callback([this]() {
        doSuspend();
    });

    std::string tokenArg;
    auto* subResume = app.add_subcommand("resume", "Unlock with a token from 'suspend'");
    subResume->add_option("token", tokenArg, "Resume token")->required();
    subResume->callback([&]() { doResume(tokenArg); });

    app.add_subcommand("status", "Show vault state")->callback([this]() { doStatus(); });

    bool reveal{ false };
    auto* subLs = app.add_subcommand("ls", "List records");
    subLs->add_flag("--show", reveal, "Print passwords");
    subLs->callback([&]() { doList(reveal); });

    securevault::core::RecordFields fields{};
    std::string urlArg;
    std::string notesArg;
    auto* subAdd = app.add_subcommand("add", "Add a record (prompts for the password)");
    subAdd->add_option("website", fields.website, "Website")->required();
    subAdd->add_option("username", fields.username, "Username")->required();
    subAdd->add_option("--category", fields.category, "Category");
    auto* addUrl = subAdd->add_option("--url", urlArg, "URL");
    auto* addNotes = subAdd->add_option("--notes", notesArg, "Notes");
    subAdd->callback([&]() {
        if (addUrl->count() > 0U && !urlArg.empty())
        {
            fields.url = urlArg;
        }
        if (addNotes->count() > 0U && !notesArg.empty())
        {
            fields.notes = notesArg;
        }
        doAdd(fields);
    });

    std::string idArg;
    std::string websiteArg;
    std::string usernameArg;
    std::string categoryArg;
    bool newPassword{ false };
    auto* subEdit = app.add_subcommand("edit", "Update fields of a record");
    subEdit->add_option("id", idArg, "Record id")->required();
    auto* editWebsite = subEdit->add_option("--website", websiteArg, "Website");
    auto* editUsername = subEdit->add_option("--username", usernameArg, "Username");
    auto* editCategory = subEdit->add_option("--category", categoryArg, "Category");
    auto* editUrl = subEdit->add_option("--url", urlArg, "URL (empty clears)");
    auto* editNotes = subEdit->add_option("--notes", notesArg, "Notes (empty clears)");
    subEdit->add_flag("--password", newPassword, "Prompt for a new password");
    subEdit->callback([&]() {
        securevault::core::RecordUpdate update{};
        if (editWebsite->count() > 0U)
        {
            update.website = websiteArg;
        }
        if (editUsername->count() > 0U)
        {
            update.username = usernameArg;
        }
        if (editCategory->count() > 0U)
        {
            update.category = categoryArg;
        }
        if (editUrl->count() > 0U)
        {
            update.url = urlArg;
        }
        if (editNotes->count() > 0U)
        {
            update.notes = notesArg;
        }
        doEdit(idArg, std::move(update), newPassword);
    });

    auto* subRm = app.add_subcommand("rm", "Delete a record");
    subRm->add_option("id", idArg, "Record id")->required();
    subRm->callback([&]() { doRm(idArg); });

    std::string fileArg;
    auto* subExport = app.add_subcommand("export", "Write the encrypted collection to a file");
    subExport->add_option("file", fileArg, "Destination file")->required();
    subExport->callback([&]() { doExport(fileArg); });

    auto* subImport = app.add_subcommand("import", "Replace all records with the contents of a file");
    subImport->add_option("file", fileArg, "Source file")->required();
    subImport->callback([&]() { doImport(fileArg); });

    app.add_subcommand("wipe", "Destroy the vault")->callback([this]() { doWipe(); });

    try
    {
        std::vector<char*> argv;
        argv.reserve(args.size());
        for (const auto& arg : args)
        {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }

        app.parse(static_cast<int>(argv.size()), argv.data());
    }
    catch ([[maybe_unused]] const CLI::CallForHelp&)
    {
        m_out << app.help();
    }
    catch (const CLI::ParseError& e)
    {
        m_out << "Syntax Error: " << e.what() << "\n";
    }
}

// --- Handlers ---

void InteractiveShell::doInit()
{
    const auto state = m_store.state();
    if (securevault::core::isError(state) ||
        std::get<securevault::core::VaultState>(state) != securevault::core::VaultState::Uninitialized)
    {
        m_out << "Error: Vault already exists.\n";
        return;
    }

    auto p1 = m_pwdReader("New passphrase: ");
    auto wipeP1 = securevault::security::scopeWipe(p1);

    auto p2 = m_pwdReader("Confirm passphrase: ");
    auto wipeP2 = securevault::security::scopeWipe(p2);

    if (securevault::security::asStringView(p1) != securevault::security::asStringView(p2))
    {
        m_out << "Error: Passphrases do not match.\n";
        return;
    }

    const auto result = m_store.initialize(p1);
    if (securevault::core::isError(result))
    {
        reportError("Create failed", std::get<securevault::core::VaultError>(result));
        return;
    }
    m_out << "Vault created.\n";

    auto session = securevault::core::VaultSession::open(m_store, p1, m_sessionTimeout, m_now);
    if (!securevault::core::isError(session))
    {
        m_session.emplace(std::move(std::get<securevault::core::VaultSession>(session)));
        m_out << "Vault unlocked.\n";
    }
}

void InteractiveShell::doUnlock()
{
    if (m_session.has_value())
    {
        m_out << "Vault is already unlocked.\n";
        return;
    }

    auto pass = m_pwdReader("Passphrase: ");
    auto wipePass = securevault::security::scopeWipe(pass);

    auto result = securevault::core::VaultSession::open(m_store, pass, m_sessionTimeout, m_now);
    if (securevault::core::isError(result))
    {
        m_out << "Error: Authentication failed or no vault.\n";
        return;
    }
    m_session.emplace(std::move(std::get<securevault::core::VaultSession>(result)));
    m_out << "Vault unlocked.\n";
}

void InteractiveShell::doLock()
{
    if (!m_session.has_value())
    {
        m_out << "Vault is already locked.\n";
        return;
    }
    m_session->lock();
    m_session.reset();
    m_out << "Vault locked.\n";
}

void InteractiveShell::doSuspend()
{
    if (!requireUnlocked())
    {
        return;
    }

    const auto token = m_cache.remember(*m_session);
    if (securevault::core::isError(token))
    {
        reportError("Suspend failed", std::get<securevault::core::VaultError>(token));
        return;
    }
    m_session->lock();
    m_session.reset();
    m_out << "Vault locked. Resume token: " << std::get<std::string>(token) << "\n";
}

void InteractiveShell::doResume(const std::string& token)
{
    if (m_session.has_value())
    {
        m_out << "Vault is already unlocked.\n";
        return;
    }

    auto result = m_cache.restore(token, m_store);
    if (securevault::core::isError(result))
    {
        m_out << "Error: Could not resume session ("
              << securevault::core::toString(std::get<securevault::core::VaultError>(result)) << ").\n";
        return;
    }
    m_session.emplace(std::move(std::get<securevault::core::VaultSession>(result)));
    m_out << "Vault unlocked.\n";
}

void InteractiveShell::doStatus()
{
    const auto state = m_store.state();
    if (securevault::core::isError(state))
    {
        reportError("Status unavailable", std::get<securevault::core::VaultError>(state));
        return;
    }

    if (std::get<securevault::core::VaultState>(state) == securevault::core::VaultState::Uninitialized)
    {
        m_out << "State: uninitialized\n";
        return;
    }

    m_out << "State: " << (m_session.has_value() ? "unlocked" : "locked") << "\n";
    const auto count = m_store.recordCount();
    if (!securevault::core::isError(count))
    {
        m_out << "Records: " << std::get<std::size_t>(count) << "\n";
    }
    m_out << "Cached sessions: " << m_cache.size() << "\n";
}

void InteractiveShell::doList(bool reveal)
{
    if (!requireUnlocked())
    {
        return;
    }

    auto result = m_store.listDecrypted(passphrase());
    if (securevault::core::isError(result))
    {
        reportError("Failed to list records", std::get<securevault::core::VaultError>(result));
        return;
    }

    auto& listing = std::get<securevault::core::DecryptedListing>(result);
    if (listing.records.empty() && listing.skipped.empty())
    {
        m_out << "(empty)\n";
    }
    for (auto& r : listing.records)
    {
        auto wipePassword = securevault::security::scopeWipe(r.password);
        m_out << r.id << "  " << r.fields.website << "  " << r.fields.username;
        if (!r.fields.category.empty())
        {
            m_out << "  [" << r.fields.category << "]";
        }
        if (r.fields.url)
        {
            m_out << "  " << *r.fields.url;
        }
        if (reveal)
        {
            m_out << "  password: " << securevault::security::asStringView(r.password);
        }
        m_out << "\n";
        if (r.fields.notes)
        {
            m_out << "    notes: " << *r.fields.notes << "\n";
        }
    }
    if (!listing.skipped.empty())
    {
        m_out << "Warning: " << listing.skipped.size() << " of " << listing.storedCount
              << " record(s) could not be decrypted.\n";
    }
}

void InteractiveShell::doAdd(const securevault::core::RecordFields& fields)
{
    if (!requireUnlocked())
    {
        return;
    }

    const auto& pass = passphrase();
    auto secret = m_pwdReader("Password: ");
    auto wipeSecret = securevault::security::scopeWipe(secret);

    const auto result = m_store.addRecord(fields, secret, pass);
    if (securevault::core::isError(result))
    {
        reportError("Failed to add record", std::get<securevault::core::VaultError>(result));
        return;
    }
    m_out << "Record added: " << std::get<std::string>(result) << "\n";
}

void InteractiveShell::doEdit(const std::string& id, securevault::core::RecordUpdate update, bool newPassword)
{
    if (!requireUnlocked())
    {
        return;
    }

    const auto& pass = passphrase();
    if (newPassword)
    {
        update.password = m_pwdReader("New password: ");
    }

    const auto result = m_store.updateRecord(id, update, pass);
    if (update.password)
    {
        securevault::security::secureRelease(*update.password);
    }
    if (securevault::core::isError(result))
    {
        reportError("Failed to update record", std::get<securevault::core::VaultError>(result));
        return;
    }
    m_out << "Record updated.\n";
}

void InteractiveShell::doRm(const std::string& id)
{
    if (!requireUnlocked())
    {
        return;
    }

    const auto result = m_store.deleteRecord(id);
    if (securevault::core::isError(result))
    {
        reportError("Failed to delete record", std::get<securevault::core::VaultError>(result));
        return;
    }
    m_out << "Record deleted (if it existed).\n";
}

void InteractiveShell::doExport(const std::filesystem::path& file)
{
    if (!requireUnlocked())
    {
        return;
    }

    const auto result = m_store.exportAll();
    if (securevault::core::isError(result))
    {
        reportError("Export failed", std::get<securevault::core::VaultError>(result));
        return;
    }
    const auto& snapshot = std::get<std::string>(result);

    // Truncate first and narrow the mode while the file is still empty.
    std::ofstream out{ file, std::ios::binary | std::ios::trunc };
    if (!out)
    {
        m_out << "Error: Could not write " << file.string() << "\n";
        return;
    }
#if !defined(_WIN32)
    std::error_code ec{};
    std::filesystem::permissions(file, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace, ec);
    if (ec)
    {
        PLOGE << "export: could not restrict permissions: " << ec.message();
        m_out << "Error: Could not restrict permissions on " << file.string() << "\n";
        return;
    }
#endif

    out.write(snapshot.data(), static_cast<std::streamsize>(snapshot.size()));
    out.close();
    if (!out)
    {
        m_out << "Error: Could not write " << file.string() << "\n";
        return;
    }

    m_out << "Exported to " << file.string() << "\n";
}

void InteractiveShell::doImport(const std::filesystem::path& file)
{
    if (!requireUnlocked())
    {
        return;
    }

    std::ifstream in{ file, std::ios::binary };
    if (!in)
    {
        m_out << "Error: Could not read " << file.string() << "\n";
        return;
    }
    const std::string snapshot{ std::istreambuf_iterator<char>{ in }, std::istreambuf_iterator<char>{} };

    const auto result = m_store.importAll(snapshot);
    if (securevault::core::isError(result))
    {
        reportError("Import failed", std::get<securevault::core::VaultError>(result));
        return;
    }
    m_out << "Imported " << std::get<std::size_t>(result) << " record(s).\n";
}

void InteractiveShell::doWipe()
{
    m_out << "Type 'wipe' to permanently destroy the vault: " << std::flush;
    std::string answer;
    if (!std::getline(m_in, answer) || answer != "wipe")
    {
        m_out << "Aborted.\n";
        return;
    }

    const auto result = m_store.wipe();
    if (securevault::core::isError(result))
    {
        reportError("Wipe failed", std::get<securevault::core::VaultError>(result));
        return;
    }
    if (m_session.has_value())
    {
        m_session->lock();
        m_session.reset();
    }
    m_out << "Vault wiped.\n";
}

} // namespace securevault::ui::cli
