#include "securevault/core/RecordCodec.hpp"

#include "Base64.hpp"
#include <algorithm>

namespace securevault::core
{

std::string encodeBlob(const EncryptedBlob& blob)
{
    std::vector<std::uint8_t> packed{};
    packed.reserve(g_blobMinBytes + blob.cipherText.size());
    packed.insert(packed.end(), blob.salt.begin(), blob.salt.end());
    packed.insert(packed.end(), blob.iv.begin(), blob.iv.end());
    packed.insert(packed.end(), blob.cipherText.begin(), blob.cipherText.end());
    return detail::base64Encode(packed);
}

VaultResult<EncryptedBlob> decodeBlob(std::string_view text)
{
    const auto packed{ detail::base64Decode(text) };
    if (!packed || packed->size() < g_blobMinBytes)
    {
        return VaultError::InvalidFormat;
    }

    EncryptedBlob blob{};
    auto it{ packed->begin() };
    std::copy_n(it, g_blobSaltBytes, blob.salt.begin());
    it += static_cast<std::ptrdiff_t>(g_blobSaltBytes);
    std::copy_n(it, g_blobIvBytes, blob.iv.begin());
    it += static_cast<std::ptrdiff_t>(g_blobIvBytes);
    blob.cipherText.assign(it, packed->end());
    return blob;
}

} // namespace securevault::core
