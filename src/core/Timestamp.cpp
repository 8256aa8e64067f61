#include "securevault/core/Timestamp.hpp"

#include <cstdio>

namespace securevault::core
{
namespace
{

constexpr std::size_t g_kSecondsForm{ 20U };      // 2024-01-02T03:04:05Z
constexpr std::size_t g_kMillisecondsForm{ 24U }; // 2024-01-02T03:04:05.678Z

[[nodiscard]] std::optional<int> readDigits(std::string_view text, std::size_t offset, std::size_t count) noexcept
{
    int value{ 0 };
    for (std::size_t i{ offset }; i < offset + count; ++i)
    {
        const char c{ text[i] };
        if (c < '0' || c > '9')
        {
            return std::nullopt;
        }
        value = value * 10 + (c - '0');
    }
    return value;
}

[[nodiscard]] bool expect(std::string_view text, std::size_t offset, char c) noexcept
{
    return text[offset] == c;
}

} // namespace

std::string formatIso8601(Timestamp t)
{
    using namespace std::chrono;

    const auto day{ floor<days>(t) };
    const year_month_day ymd{ day };
    const hh_mm_ss<milliseconds> tod{ t - day };

    char buf[g_kMillisecondsForm + 1U]{};
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d.%03dZ", static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()),
                  static_cast<int>(tod.hours().count()), static_cast<int>(tod.minutes().count()),
                  static_cast<int>(tod.seconds().count()), static_cast<int>(tod.subseconds().count()));
    return std::string{ buf };
}

std::optional<Timestamp> parseIso8601(std::string_view text) noexcept
{
    using namespace std::chrono;

    if (text.size() != g_kSecondsForm && text.size() != g_kMillisecondsForm)
    {
        return std::nullopt;
    }
    if (!expect(text, 4U, '-') || !expect(text, 7U, '-') || !expect(text, 10U, 'T') || !expect(text, 13U, ':') ||
        !expect(text, 16U, ':') || text.back() != 'Z')
    {
        return std::nullopt;
    }

    const auto y{ readDigits(text, 0U, 4U) };
    const auto mo{ readDigits(text, 5U, 2U) };
    const auto d{ readDigits(text, 8U, 2U) };
    const auto h{ readDigits(text, 11U, 2U) };
    const auto mi{ readDigits(text, 14U, 2U) };
    const auto s{ readDigits(text, 17U, 2U) };
    if (!y || !mo || !d || !h || !mi || !s || *h > 23 || *mi > 59 || *s > 59)
    {
        return std::nullopt;
    }

    int ms{ 0 };
    if (text.size() == g_kMillisecondsForm)
    {
        const auto frac{ readDigits(text, 20U, 3U) };
        if (!expect(text, 19U, '.') || !frac)
        {
            return std::nullopt;
        }
        ms = *frac;
    }

    const year_month_day ymd{ year{ *y }, month{ static_cast<unsigned>(*mo) }, day{ static_cast<unsigned>(*d) } };
    if (!ymd.ok())
    {
        return std::nullopt;
    }

    return Timestamp{ sys_days{ ymd } + hours{ *h } + minutes{ *mi } + seconds{ *s } + milliseconds{ ms } };
}

} // namespace securevault::core
