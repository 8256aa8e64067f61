#include "Base64.hpp"

#include <limits>
#include <stdexcept>
#include <openssl/evp.h>

namespace securevault::core::detail
{
namespace
{

constexpr std::size_t g_kQuantumChars{ 4U };
constexpr std::size_t g_kQuantumBytes{ 3U };

[[nodiscard]] bool isAlphabet(char c) noexcept
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '+' || c == '/';
}

[[nodiscard]] std::optional<std::size_t> paddingOf(std::string_view text) noexcept
{
    std::size_t padding{ 0U };
    while (padding < text.size() && text[text.size() - 1U - padding] == '=')
    {
        ++padding;
    }
    if (padding > 2U)
    {
        return std::nullopt;
    }
    for (std::size_t i{}; i < text.size() - padding; ++i)
    {
        if (!isAlphabet(text[i]))
        {
            return std::nullopt;
        }
    }
    return padding;
}

} // namespace

std::string base64Encode(std::span<const std::uint8_t> bytes)
{
    if (bytes.empty())
    {
        return {};
    }
    if (bytes.size() > static_cast<std::size_t>(std::numeric_limits<int>::max() / 2))
    {
        throw std::length_error("base64Encode: input too large");
    }

    const std::size_t quanta{ (bytes.size() + g_kQuantumBytes - 1U) / g_kQuantumBytes };
    std::string out(quanta * g_kQuantumChars + 1U, '\0');
    const int written{ EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), bytes.data(),
                                       static_cast<int>(bytes.size())) };
    out.resize(static_cast<std::size_t>(written));
    return out;
}

std::optional<std::vector<std::uint8_t>> base64Decode(std::string_view text)
{
    if (text.empty())
    {
        return std::vector<std::uint8_t>{};
    }
    if ((text.size() % g_kQuantumChars) != 0U ||
        text.size() > static_cast<std::size_t>(std::numeric_limits<int>::max()))
    {
        return std::nullopt;
    }
    const auto padding{ paddingOf(text) };
    if (!padding)
    {
        return std::nullopt;
    }

    std::vector<std::uint8_t> out((text.size() / g_kQuantumChars) * g_kQuantumBytes);
    const int written{ EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(text.data()),
                                       static_cast<int>(text.size())) };
    if (written < 0 || static_cast<std::size_t>(written) != out.size())
    {
        return std::nullopt;
    }
    // EVP_DecodeBlock emits zero bytes for the padding characters.
    out.resize(out.size() - *padding);
    return out;
}

} // namespace securevault::core::detail
