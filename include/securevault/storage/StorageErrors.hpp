#ifndef INCLUDE_SECUREVAULT_STORAGE_STORAGEERRORS_HPP
#define INCLUDE_SECUREVAULT_STORAGE_STORAGEERRORS_HPP

#include <stdexcept>

namespace securevault::storage
{

class StorageFailure final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

} // namespace securevault::storage

#endif // INCLUDE_SECUREVAULT_STORAGE_STORAGEERRORS_HPP
