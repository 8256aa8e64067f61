#ifndef INCLUDE_SECUREVAULT_CORE_VAULTERROR_HPP
#define INCLUDE_SECUREVAULT_CORE_VAULTERROR_HPP

#include <cstdint>
#include <string_view>
#include <variant>

namespace securevault::core
{

enum class VaultError : std::uint8_t
{
    InvalidFormat,
    IntegrityFailed,
    NotFound,
    InvalidState,
    AuthFailed,
    InvalidArgument,
    RandomFailed,
    CryptoError,
    StorageError,
};

template <class T> using VaultResult = std::variant<T, VaultError>;

[[nodiscard]] std::string_view toString(VaultError error) noexcept;

template <class T> [[nodiscard]] bool isError(const VaultResult<T>& result) noexcept
{
    return std::holds_alternative<VaultError>(result);
}

} // namespace securevault::core

#endif // INCLUDE_SECUREVAULT_CORE_VAULTERROR_HPP
