#ifndef SECUREVAULT_SRC_CORE_BASE64_HPP
#define SECUREVAULT_SRC_CORE_BASE64_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace securevault::core::detail
{

// Standard alphabet with '=' padding.
[[nodiscard]] std::string base64Encode(std::span<const std::uint8_t> bytes);

// Strict: rejects whitespace, bad alphabet, misplaced padding and lengths not divisible by 4.
[[nodiscard]] std::optional<std::vector<std::uint8_t>> base64Decode(std::string_view text);

} // namespace securevault::core::detail

#endif // SECUREVAULT_SRC_CORE_BASE64_HPP
