#ifndef INCLUDE_SECUREVAULT_CORE_VAULTSTORE_HPP
#define INCLUDE_SECUREVAULT_CORE_VAULTSTORE_HPP

#include "securevault/core/Record.hpp"
#include "securevault/core/VaultError.hpp"
#include "securevault/core/VaultOptions.hpp"
#include "securevault/crypto/ICryptoProvider.hpp"
#include "securevault/security/SecureBuffer.hpp"
#include "securevault/storage/IKeyValueStore.hpp"
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace securevault::core
{

constexpr std::string_view g_commitmentKey{ "securevault_master_hash" };
constexpr std::string_view g_collectionKey{ "securevault_data" };

// The store never holds a passphrase; "unlocked" only exists in VaultSession.
enum class VaultState : std::uint8_t
{
    Uninitialized,
    Locked,
};

[[nodiscard]] std::string_view toString(VaultState state) noexcept;

class VaultStore final
{
public:
    VaultStore(securevault::crypto::ICryptoProvider& crypto, securevault::storage::IKeyValueStore& storage,
               VaultOptions options = {});

    VaultStore(const VaultStore&) = delete;
    VaultStore& operator=(const VaultStore&) = delete;
    VaultStore(VaultStore&&) = delete;
    VaultStore& operator=(VaultStore&&) = delete;
    ~VaultStore() = default;

    // Writes the commitment and an empty collection in one batch.
    // InvalidState if either key already exists, InvalidArgument for an empty passphrase.
    [[nodiscard]] VaultResult<std::monostate> initialize(const securevault::security::SecureString& passphrase) noexcept;

    // False on mismatch, missing vault, storage failure or a corrupted commitment alike.
    [[nodiscard]] bool verify(const securevault::security::SecureString& passphrase) const noexcept;

    // Returns the new record id.
    [[nodiscard]] VaultResult<std::string> addRecord(const RecordFields& fields,
                                                     const securevault::security::SecureString& secret,
                                                     const securevault::security::SecureString& passphrase) noexcept;

    // Records that fail to decrypt are reported in `skipped`, never fatal. Output keeps stored order.
    [[nodiscard]] VaultResult<DecryptedListing>
    listDecrypted(const securevault::security::SecureString& passphrase) const noexcept;

    // The passphrase is only checked when the update carries a new secret.
    [[nodiscard]] VaultResult<std::monostate> updateRecord(std::string_view id, const RecordUpdate& update,
                                                           const securevault::security::SecureString& passphrase) noexcept;

    // Deleting an unknown id succeeds.
    [[nodiscard]] VaultResult<std::monostate> deleteRecord(std::string_view id) noexcept;

    // Pretty-printed collection JSON. Nothing is decrypted.
    [[nodiscard]] VaultResult<std::string> exportAll() const noexcept;

    // Replaces the whole collection or nothing. Returns the imported record count.
    [[nodiscard]] VaultResult<std::size_t> importAll(std::string_view snapshot) noexcept;

    [[nodiscard]] VaultResult<std::monostate> wipe() noexcept;

    [[nodiscard]] VaultResult<VaultState> state() const noexcept;
    [[nodiscard]] VaultResult<std::size_t> recordCount() const noexcept;

    // Decrypts the first stored record, if any. Used to validate a restored session.
    [[nodiscard]] VaultResult<std::monostate> checkFirstRecord(const securevault::security::SecureString& passphrase) const noexcept;

    [[nodiscard]] const VaultOptions& options() const noexcept;

private:
    [[nodiscard]] VaultResult<std::vector<EncryptedRecord>> loadRecords() const;
    void persistRecords(const std::vector<EncryptedRecord>& records);
    [[nodiscard]] Timestamp now() const;

    securevault::crypto::ICryptoProvider* m_crypto{ nullptr };
    securevault::storage::IKeyValueStore* m_storage{ nullptr };
    VaultOptions m_options;
    mutable std::mutex m_mutex;
};

} // namespace securevault::core

#endif // INCLUDE_SECUREVAULT_CORE_VAULTSTORE_HPP
