#include "Tokenizer.h"

namespace Phonoclip
{

bool Tokenizer::isWordCharacter (juce::juce_wchar c) noexcept
{
    if (c < 0x80)
        return juce::CharacterFunctions::isLetterOrDigit (c) || c == '_' || c == '\'';

    // Latin-1 symbols and spaces, the multiplication and division signs,
    // general punctuation and CJK punctuation separate words.
    if (c <= 0xbf || c == 0xd7 || c == 0xf7)
        return false;

    if ((c >= 0x2000 && c <= 0x206f) || (c >= 0x3000 && c <= 0x303f) || c == 0xfeff)
        return false;

    // Any other code point is taken as part of a word, whatever the C locale says.
    return true;
}

juce::Array<Token> Tokenizer::tokenize (const juce::String& text)
{
    juce::Array<Token> tokens;
    juce::String currentWord;

    auto flushWord = [&]
    {
        if (currentWord.isNotEmpty())
        {
            tokens.add ({ currentWord, Token::Kind::Word });
            currentWord.clear();
        }
    };

    for (auto p = text.getCharPointer(); ! p.isEmpty(); ++p)
    {
        const auto c = *p;

        if (isWordCharacter (c))
        {
            currentWord += juce::String::charToString (c);
            continue;
        }

        flushWord();

        if (c == '.' || c == '!' || c == '?')
            tokens.add ({ juce::String::charToString (c), Token::Kind::Terminal });
        else if (c == ',' || c == ';')
            tokens.add ({ juce::String::charToString (c), Token::Kind::Comma });
    }

    flushWord();
    return tokens;
}

} // namespace Phonoclip
