#ifndef INCLUDE_SECUREVAULT_STORAGE_SQLITE_SQLITEKEYVALUESTOREFACTORY_HPP
#define INCLUDE_SECUREVAULT_STORAGE_SQLITE_SQLITEKEYVALUESTOREFACTORY_HPP

#include "securevault/storage/IKeyValueStore.hpp"
#include <filesystem>
#include <memory>

namespace securevault::storage::sqlite
{

// Opens (creating if needed) a single-file store. Throws StorageFailure.
[[nodiscard]] std::unique_ptr<securevault::storage::IKeyValueStore>
makeSqliteKeyValueStore(const std::filesystem::path& dbPath);

} // namespace securevault::storage::sqlite

#endif // INCLUDE_SECUREVAULT_STORAGE_SQLITE_SQLITEKEYVALUESTOREFACTORY_HPP
