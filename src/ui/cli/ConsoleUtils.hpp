#ifndef SECUREVAULT_UI_CLI_CONSOLEUTILS_HPP
#define SECUREVAULT_UI_CLI_CONSOLEUTILS_HPP

#include "securevault/security/SecureBuffer.hpp"
#include <iosfwd>
#include <string>

namespace securevault::ui::cli
{

// Pins process memory and disables core dumps so secrets do not reach swap or disk.
void hardenProcess() noexcept;

// Prompts on `out` and reads one line from stdin with terminal echo disabled.
[[nodiscard]] securevault::security::SecureString readPassword(const std::string& prompt, std::ostream& out);

} // namespace securevault::ui::cli

#endif // SECUREVAULT_UI_CLI_CONSOLEUTILS_HPP
