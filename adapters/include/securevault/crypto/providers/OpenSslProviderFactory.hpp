#ifndef INCLUDE_SECUREVAULT_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
#define INCLUDE_SECUREVAULT_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP

#include "securevault/crypto/ICryptoProvider.hpp"
#include <memory>

namespace securevault::crypto::providers
{

[[nodiscard]] std::unique_ptr<securevault::crypto::ICryptoProvider> makeOpenSslCryptoProvider();

} // namespace securevault::crypto::providers

#endif // INCLUDE_SECUREVAULT_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
