#ifndef INCLUDE_SECUREVAULT_CORE_TIMESTAMP_HPP
#define INCLUDE_SECUREVAULT_CORE_TIMESTAMP_HPP

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace securevault::core
{

using Timestamp = std::chrono::sys_time<std::chrono::milliseconds>;

// YYYY-MM-DDTHH:MM:SS.sssZ (UTC).
[[nodiscard]] std::string formatIso8601(Timestamp t);

// Accepts the format above, with or without the millisecond part.
[[nodiscard]] std::optional<Timestamp> parseIso8601(std::string_view text) noexcept;

} // namespace securevault::core

#endif // INCLUDE_SECUREVAULT_CORE_TIMESTAMP_HPP
