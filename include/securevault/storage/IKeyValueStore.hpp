#ifndef INCLUDE_SECUREVAULT_STORAGE_IKEYVALUESTORE_HPP
#define INCLUDE_SECUREVAULT_STORAGE_IKEYVALUESTORE_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace securevault::storage
{

// value == std::nullopt removes the key.
struct Mutation final
{
    std::string key{};
    std::optional<std::string> value{};
};

// Durable string-to-bytes map. Failures throw StorageFailure.
class IKeyValueStore
{
public:
    IKeyValueStore() = default;
    IKeyValueStore(const IKeyValueStore&) = delete;
    IKeyValueStore& operator=(const IKeyValueStore&) = delete;
    IKeyValueStore(IKeyValueStore&&) = delete;
    IKeyValueStore& operator=(IKeyValueStore&&) = delete;
    virtual ~IKeyValueStore() = default;

    [[nodiscard]] virtual std::optional<std::string> get(std::string_view key) const = 0;

    virtual void set(std::string_view key, std::string_view value) = 0;

    // Removing an absent key is not an error.
    virtual void remove(std::string_view key) = 0;

    // All mutations become visible together or not at all.
    virtual void apply(const std::vector<Mutation>& batch) = 0;
};

} // namespace securevault::storage

#endif // INCLUDE_SECUREVAULT_STORAGE_IKEYVALUESTORE_HPP
