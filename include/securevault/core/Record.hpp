#ifndef INCLUDE_SECUREVAULT_CORE_RECORD_HPP
#define INCLUDE_SECUREVAULT_CORE_RECORD_HPP

#include "securevault/core/Timestamp.hpp"
#include "securevault/core/VaultError.hpp"
#include "securevault/security/SecureBuffer.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace securevault::core
{

// Plaintext metadata stored beside the encrypted secret.
struct RecordFields final
{
    std::string website{};
    std::string username{};
    std::string category{};
    std::optional<std::string> url{};
    std::optional<std::string> notes{};

    bool operator==(const RecordFields&) const = default;
};

// A record as persisted: the secret only exists as a sealed blob.
struct EncryptedRecord final
{
    std::string id{};
    RecordFields fields{};
    std::string encryptedPassword{};
    Timestamp createdAt{};
    Timestamp lastModified{};

    bool operator==(const EncryptedRecord&) const = default;
};

struct Record final
{
    std::string id{};
    RecordFields fields{};
    securevault::security::SecureString password{};
    Timestamp createdAt{};
    Timestamp lastModified{};
};

// Partial update. Empty website/username/category are ignored; a present url/notes replaces
// the stored value (empty clears it); a present non-empty password is re-encrypted.
struct RecordUpdate final
{
    std::optional<std::string> website{};
    std::optional<std::string> username{};
    std::optional<std::string> category{};
    std::optional<std::string> url{};
    std::optional<std::string> notes{};
    std::optional<securevault::security::SecureString> password{};
};

struct SkippedRecord final
{
    std::string id{};
    VaultError reason{};
};

// records.size() + skipped.size() == storedCount.
struct DecryptedListing final
{
    std::vector<Record> records{};
    std::vector<SkippedRecord> skipped{};
    std::size_t storedCount{ 0U };
};

} // namespace securevault::core

#endif // INCLUDE_SECUREVAULT_CORE_RECORD_HPP
