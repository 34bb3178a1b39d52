#pragma once

#include <juce_core/juce_core.h>

namespace Phonoclip
{

struct Token
{
    enum class Kind
    {
        Word,
        Terminal, // . ! ?
        Comma     // , ;
    };

    juce::String text;
    Kind kind { Kind::Word };

    bool isWord() const { return kind == Kind::Word; }
    bool isPunctuation() const { return kind != Kind::Word; }
};

/**
 * Splits input text into word and punctuation tokens.
 *
 * A word is a maximal run of letters, digits, underscores and apostrophes,
 * where any non-ASCII letter counts; its case is kept as typed. Each of ". ! ?" is a Terminal token and each of
 * ", ;" a Comma token. Every other character only separates tokens.
 */
class Tokenizer
{
public:
    static juce::Array<Token> tokenize (const juce::String& text);

    static bool isWordCharacter (juce::juce_wchar c) noexcept;
};

} // namespace Phonoclip
