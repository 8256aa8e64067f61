#include "securevault/core/RecordCollection.hpp"

#include "securevault/core/RecordCodec.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <plog/Log.h>
#include <stdexcept>
#include <unordered_set>

namespace securevault::core
{
namespace
{

using Json = nlohmann::ordered_json;

constexpr int g_kIndent{ 2 };

constexpr const char* g_kId{ "id" };
constexpr const char* g_kWebsite{ "website" };
constexpr const char* g_kUsername{ "username" };
constexpr const char* g_kEncryptedPassword{ "encryptedPassword" };
constexpr const char* g_kUrl{ "url" };
constexpr const char* g_kCategory{ "category" };
constexpr const char* g_kNotes{ "notes" };
constexpr const char* g_kCreatedAt{ "createdAt" };
constexpr const char* g_kLastModified{ "lastModified" };

[[nodiscard]] Json toJson(const EncryptedRecord& r)
{
    Json obj = Json::object();
    obj[g_kId] = r.id;
    obj[g_kWebsite] = r.fields.website;
    obj[g_kUsername] = r.fields.username;
    obj[g_kEncryptedPassword] = r.encryptedPassword;
    if (r.fields.url)
    {
        obj[g_kUrl] = *r.fields.url;
    }
    obj[g_kCategory] = r.fields.category;
    if (r.fields.notes)
    {
        obj[g_kNotes] = *r.fields.notes;
    }
    obj[g_kCreatedAt] = formatIso8601(r.createdAt);
    obj[g_kLastModified] = formatIso8601(r.lastModified);
    return obj;
}

[[nodiscard]] std::optional<std::string> requiredString(const Json& obj, const char* key)
{
    const auto it{ obj.find(key) };
    if (it == obj.end() || !it->is_string())
    {
        return std::nullopt;
    }
    return it->get<std::string>();
}

// nullopt: malformed. Engaged nullopt inside: key absent.
[[nodiscard]] std::optional<std::optional<std::string>> optionalString(const Json& obj, const char* key)
{
    const auto it{ obj.find(key) };
    if (it == obj.end())
    {
        return std::optional<std::string>{};
    }
    if (!it->is_string())
    {
        return std::nullopt;
    }
    return std::optional<std::string>{ it->get<std::string>() };
}

[[nodiscard]] std::optional<EncryptedRecord> fromJson(const Json& obj, ParseMode mode)
{
    if (!obj.is_object())
    {
        return std::nullopt;
    }

    auto id{ requiredString(obj, g_kId) };
    auto website{ requiredString(obj, g_kWebsite) };
    auto username{ requiredString(obj, g_kUsername) };
    auto blob{ requiredString(obj, g_kEncryptedPassword) };
    auto category{ requiredString(obj, g_kCategory) };
    auto createdAt{ requiredString(obj, g_kCreatedAt) };
    auto lastModified{ requiredString(obj, g_kLastModified) };
    auto url{ optionalString(obj, g_kUrl) };
    auto notes{ optionalString(obj, g_kNotes) };
    if (!id || id->empty() || !website || !username || !blob || !category || !createdAt || !lastModified || !url ||
        !notes)
    {
        return std::nullopt;
    }

    if (mode == ParseMode::Import && isError(decodeBlob(*blob)))
    {
        return std::nullopt;
    }

    const auto created{ parseIso8601(*createdAt) };
    const auto modified{ parseIso8601(*lastModified) };
    if (!created || !modified)
    {
        return std::nullopt;
    }

    EncryptedRecord out{};
    out.id = std::move(*id);
    out.fields.website = std::move(*website);
    out.fields.username = std::move(*username);
    out.fields.category = std::move(*category);
    out.fields.url = std::move(*url);
    out.fields.notes = std::move(*notes);
    out.encryptedPassword = std::move(*blob);
    out.createdAt = *created;
    out.lastModified = *modified;
    return out;
}

} // namespace

std::string serializeCollection(const std::vector<EncryptedRecord>& records)
{
    Json arr = Json::array();
    for (const auto& r : records)
    {
        arr.push_back(toJson(r));
    }

    try
    {
        return arr.dump(g_kIndent);
    }
    catch (const nlohmann::json::type_error& e)
    {
        throw std::invalid_argument(std::string{ "collection: " } + e.what());
    }
}

VaultResult<std::vector<EncryptedRecord>> parseCollection(std::string_view text, ParseMode mode)
{
    const Json doc = Json::parse(text.begin(), text.end(), nullptr, false);
    if (doc.is_discarded())
    {
        PLOGW << "collection: not valid JSON";
        return VaultError::InvalidFormat;
    }
    if (!doc.is_array())
    {
        PLOGW << "collection: top-level value is not an array";
        return VaultError::InvalidFormat;
    }

    std::vector<EncryptedRecord> out{};
    out.reserve(doc.size());
    std::unordered_set<std::string> seen{};

    for (std::size_t i{ 0U }; i < doc.size(); ++i)
    {
        auto rec{ fromJson(doc[i], mode) };
        if (!rec)
        {
            PLOGW << "collection: malformed record at index " << i;
            return VaultError::InvalidFormat;
        }
        if (!seen.insert(rec->id).second)
        {
            PLOGW << "collection: duplicate id at index " << i;
            return VaultError::InvalidFormat;
        }
        out.push_back(std::move(*rec));
    }
    return out;
}

} // namespace securevault::core
