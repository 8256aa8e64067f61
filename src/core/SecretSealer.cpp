#include "securevault/core/SecretSealer.hpp"

#include "securevault/core/KdfPolicy.hpp"
#include "securevault/core/RecordCodec.hpp"
#include <plog/Log.h>
#include <stdexcept>

namespace securevault::core
{

VaultResult<std::string> sealSecret(securevault::crypto::ICryptoProvider& crypto,
                                    const securevault::security::SecureString& plainText,
                                    const securevault::security::SecureString& passphrase) noexcept
{
    EncryptedBlob blob{};
    if (!crypto.randomBytes(std::span<std::uint8_t>{ blob.salt }) ||
        !crypto.randomBytes(std::span<std::uint8_t>{ blob.iv }))
    {
        PLOGE << "sealSecret: CSPRNG failure";
        return VaultError::RandomFailed;
    }

    securevault::security::SecureBuffer key{};
    try
    {
        key = crypto.deriveKey(securevault::security::asBytes(passphrase), blob.salt, defaultPbkdf2Params());
        blob.cipherText = crypto.aeadEncrypt(key, blob.iv, securevault::security::asBytes(plainText));
        securevault::security::secureRelease(key);
        return encodeBlob(blob);
    }
    catch (const std::invalid_argument& e)
    {
        securevault::security::secureRelease(key);
        PLOGE << "sealSecret: " << e.what();
        return VaultError::InvalidArgument;
    }
    catch (const std::exception& e)
    {
        securevault::security::secureRelease(key);
        PLOGE << "sealSecret: " << e.what();
        return VaultError::CryptoError;
    }
}

VaultResult<securevault::security::SecureString> openSecret(securevault::crypto::ICryptoProvider& crypto,
                                                            std::string_view blobText,
                                                            const securevault::security::SecureString& passphrase) noexcept
{
    securevault::security::SecureBuffer key{};
    try
    {
        auto blobOrErr{ decodeBlob(blobText) };
        if (isError(blobOrErr))
        {
            return std::get<VaultError>(blobOrErr);
        }
        const auto& blob{ std::get<EncryptedBlob>(blobOrErr) };

        key = crypto.deriveKey(securevault::security::asBytes(passphrase), blob.salt, defaultPbkdf2Params());
        auto plainOpt{ crypto.aeadDecrypt(key, blob.iv, blob.cipherText) };
        securevault::security::secureRelease(key);
        if (!plainOpt)
        {
            return VaultError::IntegrityFailed;
        }
        auto out{ securevault::security::secureStringFrom(*plainOpt) };
        securevault::security::secureRelease(*plainOpt);
        return out;
    }
    catch (const std::invalid_argument& e)
    {
        securevault::security::secureRelease(key);
        PLOGE << "openSecret: " << e.what();
        return VaultError::InvalidArgument;
    }
    catch (const std::exception& e)
    {
        securevault::security::secureRelease(key);
        PLOGE << "openSecret: " << e.what();
        return VaultError::CryptoError;
    }
}

} // namespace securevault::core
