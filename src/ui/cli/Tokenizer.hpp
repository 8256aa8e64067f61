#ifndef SECUREVAULT_UI_CLI_TOKENIZER_HPP
#define SECUREVAULT_UI_CLI_TOKENIZER_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace securevault::ui::cli
{

// Shell-style word splitting: whitespace separates, '...' is literal, "..." honours \" and \\,
// a bare backslash escapes the next character. Unterminated quotes yield std::nullopt.
class Tokenizer
{
public:
    [[nodiscard]] static std::optional<std::vector<std::string>> tokenize(std::string_view line);

private:
    enum class Mode
    {
        None,
        Single,
        Double
    };

    struct TokenState
    {
        std::vector<std::string> parts;
        std::string currentToken;
        bool tokenStarted{ false };
        Mode mode{ Mode::None };
    };

    class Cursor
    {
    public:
        explicit Cursor(std::string_view l) : m_line(l)
        {
        }

        [[nodiscard]] bool atEnd() const
        {
            return m_index >= m_line.size();
        }

        [[nodiscard]] char current() const
        {
            return m_line[m_index];
        }

        [[nodiscard]] bool hasNext() const
        {
            return m_index + 1 < m_line.size();
        }

        [[nodiscard]] char next() const
        {
            return m_line[m_index + 1];
        }

        void advance(std::size_t n = 1)
        {
            m_index += n;
        }

    private:
        std::string_view m_line;
        std::size_t m_index{ 0 };
    };

    static void pushToken(TokenState& state);
    static void appendChar(TokenState& state, char c);
    static void handleSingle(TokenState& state, Cursor& cursor);
    static void handleDouble(TokenState& state, Cursor& cursor);
    static void handleNone(TokenState& state, Cursor& cursor);
};

} // namespace securevault::ui::cli

#endif // SECUREVAULT_UI_CLI_TOKENIZER_HPP
