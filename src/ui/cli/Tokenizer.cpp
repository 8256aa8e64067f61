#include "Tokenizer.hpp"

#include <cctype>

namespace securevault::ui::cli
{

std::optional<std::vector<std::string>> Tokenizer::tokenize(std::string_view line)
{
    TokenState state{};
    Cursor cursor{ line };

    while (!cursor.atEnd())
    {
        switch (state.mode)
        {
        case Mode::Single:
            handleSingle(state, cursor);
            break;
        case Mode::Double:
            handleDouble(state, cursor);
            break;
        case Mode::None:
            handleNone(state, cursor);
            break;
        }
    }

    if (state.mode != Mode::None)
    {
        return std::nullopt;
    }

    pushToken(state);
    return std::move(state.parts);
}

void Tokenizer::pushToken(TokenState& state)
{
    if (state.tokenStarted)
    {
        state.parts.push_back(std::move(state.currentToken));
    }
    state.currentToken.clear();
    state.tokenStarted = false;
}

void Tokenizer::appendChar(TokenState& state, char c)
{
    state.currentToken.push_back(c);
    state.tokenStarted = true;
}

void Tokenizer::handleSingle(TokenState& state, Cursor& cursor)
{
    const char c{ cursor.current() };
    cursor.advance();
    if (c == '\'')
    {
        state.mode = Mode::None;
        return;
    }
    appendChar(state, c);
}

void Tokenizer::handleDouble(TokenState& state, Cursor& cursor)
{
    const char c{ cursor.current() };
    if (c == '"')
    {
        state.mode = Mode::None;
        cursor.advance();
        return;
    }

    if (c == '\\' && cursor.hasNext() && (cursor.next() == '"' || cursor.next() == '\\'))
    {
        appendChar(state, cursor.next());
        cursor.advance(2);
        return;
    }

    appendChar(state, c);
    cursor.advance();
}

void Tokenizer::handleNone(TokenState& state, Cursor& cursor)
{
    const char c{ cursor.current() };

    if (std::isspace(static_cast<unsigned char>(c)) != 0)
    {
        pushToken(state);
        cursor.advance();
        return;
    }

    if (c == '\'' || c == '"')
    {
        // An empty quoted pair still produces a token.
        state.mode = (c == '\'') ? Mode::Single : Mode::Double;
        state.tokenStarted = true;
        cursor.advance();
        return;
    }

    if (c == '\\' && cursor.hasNext())
    {
        appendChar(state, cursor.next());
        cursor.advance(2);
        return;
    }

    appendChar(state, c);
    cursor.advance();
}

} // namespace securevault::ui::cli
