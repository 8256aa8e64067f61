#include "securevault/core/VaultError.hpp"

namespace securevault::core
{

std::string_view toString(VaultError error) noexcept
{
    switch (error)
    {
    case VaultError::InvalidFormat:
        return "invalid-format";
    case VaultError::IntegrityFailed:
        return "integrity";
    case VaultError::NotFound:
        return "not-found";
    case VaultError::InvalidState:
        return "invalid-state";
    case VaultError::AuthFailed:
        return "auth-failed";
    case VaultError::InvalidArgument:
        return "invalid-argument";
    case VaultError::RandomFailed:
        return "random-failed";
    case VaultError::CryptoError:
        return "crypto";
    case VaultError::StorageError:
        return "storage";
    }
    return "unknown";
}

} // namespace securevault::core
