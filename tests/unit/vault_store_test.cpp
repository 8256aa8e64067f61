#include "securevault/core/RecordCollection.hpp"
#include "securevault/core/VaultStore.hpp"
#include "test_utils/CryptoDoubles.hpp"
#include "test_utils/InMemoryKeyValueStore.hpp"

#include <chrono>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace
{

using namespace std::chrono_literals;
using securevault::core::DecryptedListing;
using securevault::core::EncryptedRecord;
using securevault::core::RecordFields;
using securevault::core::RecordUpdate;
using securevault::core::Timestamp;
using securevault::core::VaultError;
using securevault::core::VaultOptions;
using securevault::core::VaultState;
using securevault::core::VaultStore;
using securevault::security::asStringView;
using securevault::security::SecureString;
using securevault::security::secureStringFrom;

constexpr const char* g_kMaster{ "Tr0ub4dor&3" };

template <class T> [[nodiscard]] T expectOk(securevault::core::VaultResult<T> res)
{
    EXPECT_FALSE(securevault::core::isError(res))
        << "unexpected error: " << securevault::core::toString(std::get<VaultError>(res));
    return std::get<T>(std::move(res));
}

template <class T> void expectError(const securevault::core::VaultResult<T>& res, VaultError expected)
{
    ASSERT_TRUE(securevault::core::isError(res));
    EXPECT_EQ(std::get<VaultError>(res), expected);
}

[[nodiscard]] RecordFields site(std::string website, std::string username)
{
    RecordFields f{};
    f.website = std::move(website);
    f.username = std::move(username);
    return f;
}

class VaultStoreTest : public ::testing::Test
{
protected:
    VaultStoreTest()
    {
        m_clockNow = *securevault::core::parseIso8601("2024-06-01T12:00:00.000Z");
    }

    [[nodiscard]] VaultStore& vault(VaultOptions options = {})
    {
        if (!m_vault)
        {
            options.clock = [this] { return m_clockNow; };
            m_vault = std::make_unique<VaultStore>(m_crypto, m_storage, std::move(options));
        }
        return *m_vault;
    }

    [[nodiscard]] std::string add(std::string website, std::string secret)
    {
        return expectOk(vault().addRecord(site(std::move(website), "alice"), secureStringFrom(secret),
                                          secureStringFrom(g_kMaster)));
    }

    [[nodiscard]] DecryptedListing list(std::string_view pass = g_kMaster)
    {
        return expectOk(vault().listDecrypted(secureStringFrom(pass)));
    }

    [[nodiscard]] std::vector<EncryptedRecord> storedRecords() const
    {
        const auto raw{ m_storage.peek(securevault::core::g_collectionKey) };
        if (!raw)
        {
            return {};
        }
        auto parsed{ securevault::core::parseCollection(*raw, securevault::core::ParseMode::Stored) };
        if (securevault::core::isError(parsed))
        {
            return {};
        }
        return std::get<std::vector<EncryptedRecord>>(std::move(parsed));
    }

    void initialize()
    {
        (void)expectOk(vault().initialize(secureStringFrom(g_kMaster)));
    }

    securevault::test_utils::FaultyCryptoProvider m_crypto;   // NOLINT
    securevault::test_utils::InMemoryKeyValueStore m_storage; // NOLINT
    Timestamp m_clockNow{};                                   // NOLINT
    std::unique_ptr<VaultStore> m_vault;                      // NOLINT
};

} // namespace

TEST_F(VaultStoreTest, AddThenListRoundTrip)
{
    initialize();
    const std::string id{ expectOk(vault().addRecord(site("example.com", "alice"), secureStringFrom("s3cr3t!"),
                                                     secureStringFrom(g_kMaster))) };
    EXPECT_FALSE(id.empty());

    const auto listing{ list() };
    ASSERT_EQ(listing.records.size(), 1U);
    EXPECT_EQ(listing.records[0].id, id);
    EXPECT_EQ(listing.records[0].fields.website, "example.com");
    EXPECT_EQ(listing.records[0].fields.username, "alice");
    EXPECT_EQ(asStringView(listing.records[0].password), "s3cr3t!");
    EXPECT_TRUE(listing.skipped.empty());

    const auto wrong{ list("WrongPass") };
    EXPECT_TRUE(wrong.records.empty());
    EXPECT_EQ(wrong.storedCount, 1U);
    ASSERT_EQ(wrong.skipped.size(), 1U);
    EXPECT_EQ(wrong.skipped[0].reason, VaultError::IntegrityFailed);
}

TEST_F(VaultStoreTest, UpdatePasswordBumpsLastModified)
{
    initialize();
    const std::string id{ add("example.com", "s3cr3t!") };

    RecordUpdate update{};
    update.password = secureStringFrom("newSecret9");
    (void)expectOk(vault().updateRecord(id, update, secureStringFrom(g_kMaster)));

    const auto listing{ list() };
    ASSERT_EQ(listing.records.size(), 1U);
    EXPECT_EQ(asStringView(listing.records[0].password), "newSecret9");
    EXPECT_GT(listing.records[0].lastModified, listing.records[0].createdAt);
}

TEST_F(VaultStoreTest, LastModifiedAdvancesEvenWhenClockStepsBack)
{
    initialize();
    const std::string id{ add("example.com", "s3cr3t!") };
    const Timestamp created{ storedRecords().at(0).createdAt };

    m_clockNow -= 1h;
    RecordUpdate update{};
    update.notes = "moved";
    (void)expectOk(vault().updateRecord(id, update, secureStringFrom(g_kMaster)));
    EXPECT_EQ(storedRecords().at(0).lastModified, created + 1ms);

    m_clockNow += 2h;
    (void)expectOk(vault().updateRecord(id, update, secureStringFrom(g_kMaster)));
    EXPECT_EQ(storedRecords().at(0).lastModified, m_clockNow);
    EXPECT_EQ(storedRecords().at(0).createdAt, created);
}

TEST_F(VaultStoreTest, InitializeWritesCommitmentAndEmptyCollection)
{
    EXPECT_EQ(expectOk(vault().state()), VaultState::Uninitialized);
    initialize();

    EXPECT_TRUE(m_storage.peek(securevault::core::g_commitmentKey).has_value());
    EXPECT_EQ(m_storage.peek(securevault::core::g_collectionKey), "[]");
    EXPECT_EQ(m_storage.writeCount(), 1U);
    EXPECT_EQ(expectOk(vault().state()), VaultState::Locked);
    EXPECT_EQ(expectOk(vault().recordCount()), 0U);
}

TEST_F(VaultStoreTest, InitializeRefusesExistingVaultAndEmptyPassphrase)
{
    expectError(vault().initialize(secureStringFrom("")), VaultError::InvalidArgument);
    initialize();
    expectError(vault().initialize(secureStringFrom("other")), VaultError::InvalidState);
    EXPECT_TRUE(vault().verify(secureStringFrom(g_kMaster)));
}

TEST_F(VaultStoreTest, InitializeRefusesOrphanCollection)
{
    m_storage.poke(securevault::core::g_collectionKey, "[]");
    EXPECT_EQ(expectOk(vault().state()), VaultState::Locked);
    expectError(vault().initialize(secureStringFrom(g_kMaster)), VaultError::InvalidState);
}

TEST_F(VaultStoreTest, InitializeIsAtomic)
{
    m_storage.failWrites = true;
    expectError(vault().initialize(secureStringFrom(g_kMaster)), VaultError::StorageError);
    m_storage.failWrites = false;

    EXPECT_FALSE(m_storage.peek(securevault::core::g_commitmentKey).has_value());
    EXPECT_FALSE(m_storage.peek(securevault::core::g_collectionKey).has_value());
    EXPECT_EQ(expectOk(vault().state()), VaultState::Uninitialized);
}

TEST_F(VaultStoreTest, VerifyAcceptsOnlyTheMasterPassphrase)
{
    EXPECT_FALSE(vault().verify(secureStringFrom(g_kMaster)));
    initialize();
    EXPECT_TRUE(vault().verify(secureStringFrom(g_kMaster)));
    EXPECT_FALSE(vault().verify(secureStringFrom("WrongPass")));
    EXPECT_FALSE(vault().verify(secureStringFrom("")));

    m_storage.poke(securevault::core::g_commitmentKey, "garbage");
    EXPECT_FALSE(vault().verify(secureStringFrom(g_kMaster)));

    m_storage.failReads = true;
    EXPECT_FALSE(vault().verify(secureStringFrom(g_kMaster)));
}

TEST_F(VaultStoreTest, HardenedCommitmentVerifies)
{
    VaultOptions options{};
    options.commitmentScheme = securevault::core::CommitmentScheme::Pbkdf2Sha256;
    (void)expectOk(vault(options).initialize(secureStringFrom(g_kMaster)));

    EXPECT_THAT(*m_storage.peek(securevault::core::g_commitmentKey), ::testing::StartsWith("pbkdf2-sha256$"));
    EXPECT_TRUE(vault().verify(secureStringFrom(g_kMaster)));
    EXPECT_FALSE(vault().verify(secureStringFrom("WrongPass")));
}

TEST_F(VaultStoreTest, RejectedVerifyCostsOneDerivation)
{
    VaultOptions options{};
    options.commitmentScheme = securevault::core::CommitmentScheme::Pbkdf2Sha256;
    auto& store{ vault(options) };

    EXPECT_FALSE(store.verify(secureStringFrom(g_kMaster)));
    EXPECT_EQ(m_crypto.deriveCalls.load(), 1);

    (void)expectOk(store.initialize(secureStringFrom(g_kMaster)));
    m_crypto.deriveCalls = 0;
    EXPECT_FALSE(store.verify(secureStringFrom("WrongPass")));
    EXPECT_EQ(m_crypto.deriveCalls.load(), 1);

    m_storage.poke(securevault::core::g_commitmentKey, "pbkdf2-sha256$garbage");
    EXPECT_FALSE(store.verify(secureStringFrom(g_kMaster)));
    EXPECT_EQ(m_crypto.deriveCalls.load(), 2);

    m_storage.failReads = true;
    EXPECT_FALSE(store.verify(secureStringFrom(g_kMaster)));
    EXPECT_EQ(m_crypto.deriveCalls.load(), 3);
}

TEST_F(VaultStoreTest, AddRejectsWrongPassphraseAndMissingVault)
{
    expectError(vault().addRecord(site("a", "b"), secureStringFrom("x"), secureStringFrom(g_kMaster)),
                VaultError::InvalidState);

    initialize();
    expectError(vault().addRecord(site("a", "b"), secureStringFrom("x"), secureStringFrom("WrongPass")),
                VaultError::AuthFailed);
    EXPECT_EQ(expectOk(vault().recordCount()), 0U);
}

TEST_F(VaultStoreTest, AddMintsDistinctUuids)
{
    initialize();
    const std::string a{ add("a.example", "1") };
    const std::string b{ add("b.example", "2") };

    EXPECT_NE(a, b);
    EXPECT_THAT(a, ::testing::MatchesRegex("[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}"));
    EXPECT_EQ(m_clockNow, storedRecords().at(0).createdAt);
    EXPECT_EQ(storedRecords().at(0).createdAt, storedRecords().at(0).lastModified);
}

TEST_F(VaultStoreTest, AddSurfacesRandomAndCipherFailures)
{
    initialize();
    m_crypto.failRandom = true;
    expectError(vault().addRecord(site("a", "b"), secureStringFrom("x"), secureStringFrom(g_kMaster)),
                VaultError::RandomFailed);
    m_crypto.failRandom = false;

    m_crypto.failEncrypt = true;
    expectError(vault().addRecord(site("a", "b"), secureStringFrom("x"), secureStringFrom(g_kMaster)),
                VaultError::CryptoError);
    m_crypto.failEncrypt = false;

    EXPECT_EQ(expectOk(vault().recordCount()), 0U);
}

TEST_F(VaultStoreTest, ListSkipsCorruptedRecordAndReportsIt)
{
    initialize();
    const std::string a{ add("a.example", "one") };
    const std::string b{ add("b.example", "two") };
    const std::string c{ add("c.example", "three") };

    auto records{ storedRecords() };
    auto& blob{ records[1].encryptedPassword };
    blob[blob.size() / 2U] = (blob[blob.size() / 2U] == 'A') ? 'B' : 'A';
    m_storage.poke(securevault::core::g_collectionKey, securevault::core::serializeCollection(records));

    const auto listing{ list() };
    EXPECT_EQ(listing.storedCount, 3U);
    ASSERT_EQ(listing.records.size(), 2U);
    EXPECT_EQ(listing.records[0].id, a);
    EXPECT_EQ(listing.records[1].id, c);
    ASSERT_EQ(listing.skipped.size(), 1U);
    EXPECT_EQ(listing.skipped[0].id, b);
    EXPECT_EQ(listing.skipped[0].reason, VaultError::IntegrityFailed);
}

TEST_F(VaultStoreTest, MalformedBlobOnlyAffectsItsOwnRecord)
{
    for (const std::string malformed : { "AAAA", "!!!" })
    {
        (void)expectOk(vault().wipe());
        initialize();
        const std::string a{ add("a.example", "one") };
        const std::string b{ add("b.example", "two") };
        const std::string c{ add("c.example", "three") };

        auto records{ storedRecords() };
        ASSERT_EQ(records.size(), 3U);
        records[1].encryptedPassword = malformed;
        m_storage.poke(securevault::core::g_collectionKey, securevault::core::serializeCollection(records));

        EXPECT_EQ(expectOk(vault().recordCount()), 3U) << malformed;
        (void)expectOk(vault().checkFirstRecord(secureStringFrom(g_kMaster)));
        EXPECT_EQ(expectOk(vault().exportAll()), m_storage.peek(securevault::core::g_collectionKey).value());

        const auto listing{ list() };
        EXPECT_EQ(listing.storedCount, 3U);
        ASSERT_EQ(listing.records.size(), 2U) << malformed;
        EXPECT_EQ(listing.records[0].id, a);
        EXPECT_EQ(listing.records[1].id, c);
        ASSERT_EQ(listing.skipped.size(), 1U);
        EXPECT_EQ(listing.skipped[0].id, b);
        EXPECT_EQ(listing.skipped[0].reason, VaultError::InvalidFormat);

        (void)expectOk(vault().deleteRecord(b));
        EXPECT_EQ(expectOk(vault().recordCount()), 2U);
        (void)add("d.example", "four");
        const auto after{ list() };
        EXPECT_EQ(after.records.size(), 3U);
        EXPECT_TRUE(after.skipped.empty());
    }
}

TEST_F(VaultStoreTest, ParallelDecryptKeepsStoredOrder)
{
    VaultOptions options{};
    options.decryptWorkers = 4U;
    (void)expectOk(vault(options).initialize(secureStringFrom(g_kMaster)));

    std::vector<std::string> ids{};
    for (int i{ 0 }; i < 6; ++i)
    {
        ids.push_back(add("site" + std::to_string(i), "secret" + std::to_string(i)));
    }

    const auto listing{ list() };
    ASSERT_EQ(listing.records.size(), ids.size());
    for (std::size_t i{ 0U }; i < ids.size(); ++i)
    {
        EXPECT_EQ(listing.records[i].id, ids[i]);
        EXPECT_EQ(asStringView(listing.records[i].password), "secret" + std::to_string(i));
    }
}

TEST_F(VaultStoreTest, ListOnCorruptedCollectionIsFormatError)
{
    initialize();
    m_storage.poke(securevault::core::g_collectionKey, "{not json");
    expectError(vault().listDecrypted(secureStringFrom(g_kMaster)), VaultError::InvalidFormat);
    expectError(vault().recordCount(), VaultError::InvalidFormat);
}

TEST_F(VaultStoreTest, UpdateAppliesPartialFieldRules)
{
    initialize();
    RecordFields fields{ site("example.com", "alice") };
    fields.category = "Work";
    fields.url = "https://example.com";
    fields.notes = "n";
    const std::string id{ expectOk(
        vault().addRecord(fields, secureStringFrom("s3cr3t!"), secureStringFrom(g_kMaster))) };
    const std::string blobBefore{ storedRecords().at(0).encryptedPassword };

    RecordUpdate update{};
    update.website = "";
    update.username = "bob";
    update.url = "";
    update.notes = "new notes";
    (void)expectOk(vault().updateRecord(id, update, secureStringFrom("WrongPass")));

    const auto rec{ storedRecords().at(0) };
    EXPECT_EQ(rec.fields.website, "example.com");
    EXPECT_EQ(rec.fields.username, "bob");
    EXPECT_EQ(rec.fields.category, "Work");
    EXPECT_FALSE(rec.fields.url.has_value());
    EXPECT_EQ(rec.fields.notes, "new notes");
    EXPECT_EQ(rec.encryptedPassword, blobBefore);
}

TEST_F(VaultStoreTest, UpdateErrors)
{
    expectError(vault().updateRecord("nope", {}, secureStringFrom(g_kMaster)), VaultError::InvalidState);

    initialize();
    const std::string id{ add("example.com", "s3cr3t!") };
    expectError(vault().updateRecord("nope", {}, secureStringFrom(g_kMaster)), VaultError::NotFound);

    RecordUpdate update{};
    update.password = secureStringFrom("newSecret9");
    expectError(vault().updateRecord(id, update, secureStringFrom("WrongPass")), VaultError::AuthFailed);

    const auto listing{ list() };
    ASSERT_EQ(listing.records.size(), 1U);
    EXPECT_EQ(asStringView(listing.records[0].password), "s3cr3t!");
}

TEST_F(VaultStoreTest, DeleteIsIdempotent)
{
    initialize();
    const std::string a{ add("a.example", "1") };
    const std::string b{ add("b.example", "2") };

    (void)expectOk(vault().deleteRecord(a));
    EXPECT_EQ(expectOk(vault().recordCount()), 1U);
    (void)expectOk(vault().deleteRecord(a));
    EXPECT_EQ(expectOk(vault().recordCount()), 1U);
    EXPECT_EQ(storedRecords().at(0).id, b);
}

TEST_F(VaultStoreTest, ExportMatchesPersistedCollection)
{
    initialize();
    (void)add("a.example", "1");
    const std::string exported{ expectOk(vault().exportAll()) };
    EXPECT_EQ(exported, *m_storage.peek(securevault::core::g_collectionKey));
    EXPECT_THAT(exported, ::testing::Not(::testing::HasSubstr("\"1\"")));
}

TEST_F(VaultStoreTest, ExportNeverDerivesKeys)
{
    initialize();
    (void)add("a.example", "1");
    const int before{ m_crypto.deriveCalls.load() };
    (void)expectOk(vault().exportAll());
    EXPECT_EQ(m_crypto.deriveCalls.load(), before);
}

TEST_F(VaultStoreTest, ImportReplacesCollection)
{
    initialize();
    (void)add("a.example", "1");
    (void)add("b.example", "2");
    const std::string snapshot{ expectOk(vault().exportAll()) };

    (void)add("c.example", "3");
    EXPECT_EQ(expectOk(vault().recordCount()), 3U);

    EXPECT_EQ(expectOk(vault().importAll(snapshot)), 2U);
    const auto listing{ list() };
    ASSERT_EQ(listing.records.size(), 2U);
    EXPECT_EQ(asStringView(listing.records[1].password), "2");
}

TEST_F(VaultStoreTest, ImportIsAllOrNothing)
{
    initialize();
    (void)add("a.example", "1");
    const std::string before{ *m_storage.peek(securevault::core::g_collectionKey) };

    expectError(vault().importAll("[{\"id\":\"x\"}]"), VaultError::InvalidFormat);
    expectError(vault().importAll("not json"), VaultError::InvalidFormat);
    EXPECT_EQ(*m_storage.peek(securevault::core::g_collectionKey), before);

    m_storage.failWrites = true;
    expectError(vault().importAll("[]"), VaultError::StorageError);
    m_storage.failWrites = false;
    EXPECT_EQ(*m_storage.peek(securevault::core::g_collectionKey), before);
}

TEST_F(VaultStoreTest, OperationsRequireAnInitializedVault)
{
    expectError(vault().importAll("[]"), VaultError::InvalidState);
    expectError(vault().exportAll(), VaultError::InvalidState);
    expectError(vault().deleteRecord("x"), VaultError::InvalidState);
    expectError(vault().listDecrypted(secureStringFrom(g_kMaster)), VaultError::InvalidState);
    expectError(vault().recordCount(), VaultError::InvalidState);
    expectError(vault().checkFirstRecord(secureStringFrom(g_kMaster)), VaultError::InvalidState);
}

TEST_F(VaultStoreTest, WipeReturnsToUninitialized)
{
    initialize();
    (void)add("a.example", "1");
    (void)expectOk(vault().wipe());

    EXPECT_EQ(expectOk(vault().state()), VaultState::Uninitialized);
    EXPECT_FALSE(vault().verify(secureStringFrom(g_kMaster)));
    initialize();
    EXPECT_EQ(expectOk(vault().recordCount()), 0U);
}

TEST_F(VaultStoreTest, StorageFailuresMapToStorageError)
{
    initialize();
    const std::string id{ add("a.example", "1") };
    m_storage.failReads = true;
    expectError(vault().state(), VaultError::StorageError);
    expectError(vault().recordCount(), VaultError::StorageError);
    expectError(vault().listDecrypted(secureStringFrom(g_kMaster)), VaultError::StorageError);
    m_storage.failReads = false;

    m_storage.failWrites = true;
    expectError(vault().deleteRecord(id), VaultError::StorageError);
    m_storage.failWrites = false;
    EXPECT_EQ(expectOk(vault().recordCount()), 1U);
}

TEST_F(VaultStoreTest, CheckFirstRecordDecryptsOnlyTheFirst)
{
    initialize();
    (void)expectOk(vault().checkFirstRecord(secureStringFrom("anything")));

    (void)add("a.example", "1");
    (void)expectOk(vault().checkFirstRecord(secureStringFrom(g_kMaster)));
    expectError(vault().checkFirstRecord(secureStringFrom("WrongPass")), VaultError::IntegrityFailed);
}

TEST_F(VaultStoreTest, ConcurrentAddsLoseNothing)
{
    initialize();
    constexpr int kThreads{ 3 };
    std::vector<std::thread> threads{};
    for (int t{ 0 }; t < kThreads; ++t)
    {
        threads.emplace_back([this, t] {
            (void)vault().addRecord(site("site" + std::to_string(t), "u"), secureStringFrom("p"),
                                    secureStringFrom(g_kMaster));
        });
    }
    for (auto& th : threads)
    {
        th.join();
    }
    EXPECT_EQ(expectOk(vault().recordCount()), static_cast<std::size_t>(kThreads));
}
