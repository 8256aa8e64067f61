#ifndef INCLUDE_SECUREVAULT_CORE_RECORDCOLLECTION_HPP
#define INCLUDE_SECUREVAULT_CORE_RECORDCOLLECTION_HPP

#include "securevault/core/Record.hpp"
#include "securevault/core/VaultError.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace securevault::core
{

// JSON array, two-space indent, keys in persisted order. Optional fields are omitted when absent.
// Throws std::invalid_argument when a field is not valid UTF-8.
[[nodiscard]] std::string serializeCollection(const std::vector<EncryptedRecord>& records);

enum class ParseMode : std::uint8_t
{
    // Untrusted snapshots: every blob must also decode.
    Import,
    // The persisted collection: record shape only, a bad blob surfaces when that record is opened.
    Stored,
};

// A JSON array of record objects with unique non-empty ids and ISO-8601 timestamps.
// Anything else is InvalidFormat. Unknown keys are ignored.
[[nodiscard]] VaultResult<std::vector<EncryptedRecord>> parseCollection(std::string_view text,
                                                                        ParseMode mode = ParseMode::Import);

} // namespace securevault::core

#endif // INCLUDE_SECUREVAULT_CORE_RECORDCOLLECTION_HPP
