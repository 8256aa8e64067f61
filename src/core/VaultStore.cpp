#include "securevault/core/VaultStore.hpp"

#include "securevault/core/Commitment.hpp"
#include "securevault/core/RecordCollection.hpp"
#include "securevault/core/SecretSealer.hpp"
#include "securevault/storage/StorageErrors.hpp"
#include <algorithm>
#include <array>
#include <future>
#include <plog/Log.h>
#include <stdexcept>
#include <system_error>
#include <unordered_set>

namespace securevault::core
{
namespace
{

constexpr std::size_t g_kUuidBytes{ 16U };
constexpr std::uint8_t g_kUuidVersionMask{ 0x0FU };
constexpr std::uint8_t g_kUuidVersion4{ 0x40U };
constexpr std::uint8_t g_kUuidVariantMask{ 0x3FU };
constexpr std::uint8_t g_kUuidVariantRfc4122{ 0x80U };
constexpr std::string_view g_kHexDigits{ "0123456789abcdef" };
constexpr int g_kMaxIdAttempts{ 8 };

// Maps lower-layer exceptions onto VaultError at the engine boundary.
template <class F> [[nodiscard]] auto guarded(const char* op, F&& body) noexcept -> decltype(body())
{
    try
    {
        return body();
    }
    catch (const securevault::storage::StorageFailure& e)
    {
        PLOGE << op << ": storage failure: " << e.what();
        return VaultError::StorageError;
    }
    catch (const std::invalid_argument& e)
    {
        PLOGE << op << ": " << e.what();
        return VaultError::InvalidArgument;
    }
    catch (const std::exception& e)
    {
        PLOGE << op << ": unexpected failure: " << e.what();
        return VaultError::StorageError;
    }
}

// RFC 4122 version 4, lowercase.
[[nodiscard]] std::optional<std::string> mintUuid(securevault::crypto::ICryptoProvider& crypto)
{
    std::array<std::uint8_t, g_kUuidBytes> raw{};
    if (!crypto.randomBytes(raw))
    {
        return std::nullopt;
    }
    raw[6] = static_cast<std::uint8_t>((raw[6] & g_kUuidVersionMask) | g_kUuidVersion4);
    raw[8] = static_cast<std::uint8_t>((raw[8] & g_kUuidVariantMask) | g_kUuidVariantRfc4122);

    std::string out{};
    out.reserve(36U);
    for (std::size_t i{ 0U }; i < raw.size(); ++i)
    {
        if (i == 4U || i == 6U || i == 8U || i == 10U)
        {
            out.push_back('-');
        }
        out.push_back(g_kHexDigits[raw[i] >> 4U]);
        out.push_back(g_kHexDigits[raw[i] & 0x0FU]);
    }
    return out;
}

[[nodiscard]] std::size_t clampWorkers(std::size_t requested, std::size_t jobs) noexcept
{
    const std::size_t capped{ std::clamp<std::size_t>(requested, 1U, g_maxDecryptWorkers) };
    return std::max<std::size_t>(1U, std::min(capped, jobs));
}

[[nodiscard]] std::vector<EncryptedRecord>::iterator findRecord(std::vector<EncryptedRecord>& records,
                                                                std::string_view id)
{
    return std::find_if(records.begin(), records.end(), [id](const EncryptedRecord& r) { return r.id == id; });
}

} // namespace

std::string_view toString(VaultState state) noexcept
{
    switch (state)
    {
    case VaultState::Uninitialized:
        return "uninitialized";
    case VaultState::Locked:
        return "locked";
    }
    return "unknown";
}

VaultStore::VaultStore(securevault::crypto::ICryptoProvider& crypto, securevault::storage::IKeyValueStore& storage,
                       VaultOptions options)
    : m_crypto(&crypto), m_storage(&storage), m_options(std::move(options))
{
    if (!m_options.clock)
    {
        m_options.clock = systemNow;
    }
}

const VaultOptions& VaultStore::options() const noexcept
{
    return m_options;
}

Timestamp VaultStore::now() const
{
    return m_options.clock();
}

VaultResult<std::vector<EncryptedRecord>> VaultStore::loadRecords() const
{
    if (!m_storage->get(g_commitmentKey))
    {
        return VaultError::InvalidState;
    }

    const auto raw{ m_storage->get(g_collectionKey) };
    if (!raw)
    {
        return std::vector<EncryptedRecord>{};
    }

    auto parsed{ parseCollection(*raw, ParseMode::Stored) };
    if (isError(parsed))
    {
        PLOGE << "vault: stored collection is corrupted";
    }
    return parsed;
}

void VaultStore::persistRecords(const std::vector<EncryptedRecord>& records)
{
    m_storage->set(g_collectionKey, serializeCollection(records));
}

VaultResult<std::monostate> VaultStore::initialize(const securevault::security::SecureString& passphrase) noexcept
{
    if (passphrase.empty())
    {
        return VaultError::InvalidArgument;
    }

    return guarded("initialize", [&]() -> VaultResult<std::monostate> {
        const std::lock_guard lock{ m_mutex };

        if (m_storage->get(g_commitmentKey) || m_storage->get(g_collectionKey))
        {
            PLOGW << "initialize: vault already exists";
            return VaultError::InvalidState;
        }

        auto commitment{ makeCommitment(*m_crypto, passphrase, m_options.commitmentScheme) };
        if (isError(commitment))
        {
            return std::get<VaultError>(commitment);
        }

        std::vector<securevault::storage::Mutation> batch{};
        batch.push_back({ std::string{ g_commitmentKey }, std::move(std::get<std::string>(commitment)) });
        batch.push_back({ std::string{ g_collectionKey }, serializeCollection({}) });
        m_storage->apply(batch);

        PLOGI << "vault initialized (commitment=" << toString(m_options.commitmentScheme) << ")";
        return std::monostate{};
    });
}

bool VaultStore::verify(const securevault::security::SecureString& passphrase) const noexcept
{
    try
    {
        const auto stored{ m_storage->get(g_commitmentKey) };
        if (!stored)
        {
            rejectPassphrase(*m_crypto, passphrase, m_options.commitmentScheme);
            return false;
        }
        return verifyCommitment(*m_crypto, *stored, passphrase);
    }
    catch (const std::exception& e)
    {
        PLOGW << "verify: " << e.what();
        rejectPassphrase(*m_crypto, passphrase, m_options.commitmentScheme);
        return false;
    }
}

VaultResult<std::string> VaultStore::addRecord(const RecordFields& fields,
                                               const securevault::security::SecureString& secret,
                                               const securevault::security::SecureString& passphrase) noexcept
{
    return guarded("addRecord", [&]() -> VaultResult<std::string> {
        if (!m_storage->get(g_commitmentKey))
        {
            return VaultError::InvalidState;
        }
        if (!verify(passphrase))
        {
            PLOGW << "addRecord: passphrase rejected";
            return VaultError::AuthFailed;
        }

        auto sealed{ sealSecret(*m_crypto, secret, passphrase) };
        if (isError(sealed))
        {
            return std::get<VaultError>(sealed);
        }

        const std::lock_guard lock{ m_mutex };

        auto loaded{ loadRecords() };
        if (isError(loaded))
        {
            return std::get<VaultError>(loaded);
        }
        auto& records{ std::get<std::vector<EncryptedRecord>>(loaded) };

        std::optional<std::string> id{};
        for (int attempt{ 0 }; attempt < g_kMaxIdAttempts && !id; ++attempt)
        {
            id = mintUuid(*m_crypto);
            if (!id)
            {
                PLOGE << "addRecord: CSPRNG failure";
                return VaultError::RandomFailed;
            }
            if (findRecord(records, *id) != records.end())
            {
                id.reset();
            }
        }
        if (!id)
        {
            return VaultError::RandomFailed;
        }

        EncryptedRecord rec{};
        rec.id = *id;
        rec.fields = fields;
        rec.encryptedPassword = std::move(std::get<std::string>(sealed));
        rec.createdAt = now();
        rec.lastModified = rec.createdAt;
        records.push_back(std::move(rec));

        persistRecords(records);
        PLOGI << "record added: id=" << *id;
        return *id;
    });
}

VaultResult<DecryptedListing> VaultStore::listDecrypted(const securevault::security::SecureString& passphrase) const noexcept
{
    return guarded("listDecrypted", [&]() -> VaultResult<DecryptedListing> {
        std::vector<EncryptedRecord> records{};
        {
            const std::lock_guard lock{ m_mutex };
            auto loaded{ loadRecords() };
            if (isError(loaded))
            {
                return std::get<VaultError>(loaded);
            }
            records = std::move(std::get<std::vector<EncryptedRecord>>(loaded));
        }

        const std::size_t n{ records.size() };
        std::vector<VaultResult<securevault::security::SecureString>> results(n, VaultError::IntegrityFailed);

        const std::size_t workers{ clampWorkers(m_options.decryptWorkers, n) };
        auto decryptStride = [&](std::size_t first) {
            for (std::size_t i{ first }; i < n; i += workers)
            {
                results[i] = openSecret(*m_crypto, records[i].encryptedPassword, passphrase);
            }
        };

        std::vector<std::future<void>> futures{};
        std::size_t launched{ 1U };
        try
        {
            for (; launched < workers; ++launched)
            {
                futures.push_back(std::async(std::launch::async, decryptStride, launched));
            }
        }
        catch (const std::system_error& e)
        {
            PLOGW << "listDecrypted: running remaining work inline: " << e.what();
        }
        for (std::size_t stride{ launched }; stride < workers; ++stride)
        {
            decryptStride(stride);
        }
        decryptStride(0U);
        for (auto& f : futures)
        {
            f.get();
        }

        DecryptedListing listing{};
        listing.storedCount = n;
        for (std::size_t i{ 0U }; i < n; ++i)
        {
            auto& rec{ records[i] };
            if (isError(results[i]))
            {
                const VaultError reason{ std::get<VaultError>(results[i]) };
                PLOGW << "record skipped: id=" << rec.id << " reason=" << toString(reason);
                listing.skipped.push_back({ rec.id, reason });
                continue;
            }
            Record out{};
            out.id = std::move(rec.id);
            out.fields = std::move(rec.fields);
            out.password = std::move(std::get<securevault::security::SecureString>(results[i]));
            out.createdAt = rec.createdAt;
            out.lastModified = rec.lastModified;
            listing.records.push_back(std::move(out));
        }
        return listing;
    });
}

VaultResult<std::monostate> VaultStore::updateRecord(std::string_view id, const RecordUpdate& update,
                                                     const securevault::security::SecureString& passphrase) noexcept
{
    return guarded("updateRecord", [&]() -> VaultResult<std::monostate> {
        const std::lock_guard lock{ m_mutex };

        auto loaded{ loadRecords() };
        if (isError(loaded))
        {
            return std::get<VaultError>(loaded);
        }
        auto& records{ std::get<std::vector<EncryptedRecord>>(loaded) };

        const auto it{ findRecord(records, id) };
        if (it == records.end())
        {
            return VaultError::NotFound;
        }
        EncryptedRecord& rec{ *it };

        if (update.password && !update.password->empty())
        {
            if (!verify(passphrase))
            {
                PLOGW << "updateRecord: passphrase rejected";
                return VaultError::AuthFailed;
            }
            auto sealed{ sealSecret(*m_crypto, *update.password, passphrase) };
            if (isError(sealed))
            {
                return std::get<VaultError>(sealed);
            }
            rec.encryptedPassword = std::move(std::get<std::string>(sealed));
        }

        if (update.website && !update.website->empty())
        {
            rec.fields.website = *update.website;
        }
        if (update.username && !update.username->empty())
        {
            rec.fields.username = *update.username;
        }
        if (update.category && !update.category->empty())
        {
            rec.fields.category = *update.category;
        }
        if (update.url)
        {
            rec.fields.url = update.url->empty() ? std::nullopt : update.url;
        }
        if (update.notes)
        {
            rec.fields.notes = update.notes->empty() ? std::nullopt : update.notes;
        }

        // Strictly later than the previous stamp even if the clock stalls or steps back.
        rec.lastModified = std::max(now(), rec.lastModified + std::chrono::milliseconds{ 1 });

        persistRecords(records);
        PLOGI << "record updated: id=" << rec.id;
        return std::monostate{};
    });
}

VaultResult<std::monostate> VaultStore::deleteRecord(std::string_view id) noexcept
{
    return guarded("deleteRecord", [&]() -> VaultResult<std::monostate> {
        const std::lock_guard lock{ m_mutex };

        auto loaded{ loadRecords() };
        if (isError(loaded))
        {
            return std::get<VaultError>(loaded);
        }
        auto& records{ std::get<std::vector<EncryptedRecord>>(loaded) };

        const auto it{ findRecord(records, id) };
        if (it == records.end())
        {
            return std::monostate{};
        }
        records.erase(it);
        persistRecords(records);
        PLOGI << "record deleted: id=" << id;
        return std::monostate{};
    });
}

VaultResult<std::string> VaultStore::exportAll() const noexcept
{
    return guarded("exportAll", [&]() -> VaultResult<std::string> {
        const std::lock_guard lock{ m_mutex };

        const auto loaded{ loadRecords() };
        if (isError(loaded))
        {
            return std::get<VaultError>(loaded);
        }
        return serializeCollection(std::get<std::vector<EncryptedRecord>>(loaded));
    });
}

VaultResult<std::size_t> VaultStore::importAll(std::string_view snapshot) noexcept
{
    return guarded("importAll", [&]() -> VaultResult<std::size_t> {
        auto parsed{ parseCollection(snapshot, ParseMode::Import) };
        if (isError(parsed))
        {
            return std::get<VaultError>(parsed);
        }
        const auto& records{ std::get<std::vector<EncryptedRecord>>(parsed) };

        const std::lock_guard lock{ m_mutex };
        if (!m_storage->get(g_commitmentKey))
        {
            return VaultError::InvalidState;
        }
        persistRecords(records);
        PLOGI << "collection replaced by import: " << records.size() << " records";
        return records.size();
    });
}

VaultResult<std::monostate> VaultStore::wipe() noexcept
{
    return guarded("wipe", [&]() -> VaultResult<std::monostate> {
        const std::lock_guard lock{ m_mutex };

        std::vector<securevault::storage::Mutation> batch{};
        batch.push_back({ std::string{ g_commitmentKey }, std::nullopt });
        batch.push_back({ std::string{ g_collectionKey }, std::nullopt });
        m_storage->apply(batch);

        PLOGW << "vault wiped";
        return std::monostate{};
    });
}

VaultResult<VaultState> VaultStore::state() const noexcept
{
    return guarded("state", [&]() -> VaultResult<VaultState> {
        if (m_storage->get(g_commitmentKey) || m_storage->get(g_collectionKey))
        {
            return VaultState::Locked;
        }
        return VaultState::Uninitialized;
    });
}

VaultResult<std::size_t> VaultStore::recordCount() const noexcept
{
    return guarded("recordCount", [&]() -> VaultResult<std::size_t> {
        const std::lock_guard lock{ m_mutex };

        const auto loaded{ loadRecords() };
        if (isError(loaded))
        {
            return std::get<VaultError>(loaded);
        }
        return std::get<std::vector<EncryptedRecord>>(loaded).size();
    });
}

VaultResult<std::monostate> VaultStore::checkFirstRecord(const securevault::security::SecureString& passphrase) const noexcept
{
    return guarded("checkFirstRecord", [&]() -> VaultResult<std::monostate> {
        std::string firstBlob{};
        {
            const std::lock_guard lock{ m_mutex };
            const auto loaded{ loadRecords() };
            if (isError(loaded))
            {
                return std::get<VaultError>(loaded);
            }
            const auto& records{ std::get<std::vector<EncryptedRecord>>(loaded) };
            if (records.empty())
            {
                return std::monostate{};
            }
            firstBlob = records.front().encryptedPassword;
        }

        auto opened{ openSecret(*m_crypto, firstBlob, passphrase) };
        if (isError(opened))
        {
            PLOGW << "checkFirstRecord: " << toString(std::get<VaultError>(opened));
            return std::get<VaultError>(opened);
        }
        securevault::security::secureRelease(std::get<securevault::security::SecureString>(opened));
        return std::monostate{};
    });
}

} // namespace securevault::core
