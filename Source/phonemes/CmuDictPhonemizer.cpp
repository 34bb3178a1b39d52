#include "CmuDictPhonemizer.h"

namespace Phonoclip
{

// "READ(2)" -> "READ"
static juce::String stripVariantSuffix (const juce::String& word)
{
    if (word.endsWithChar (')'))
    {
        const int open = word.lastIndexOfChar ('(');
        if (open > 0)
            return word.substring (0, open);
    }

    return word;
}

bool CmuDictPhonemizer::loadFromFile (const juce::File& file, juce::String& error)
{
    if (! file.existsAsFile())
    {
        error = "pronunciation dictionary not found: " + file.getFullPathName();
        return false;
    }

    entries.clear();
    const int accepted = loadFromText (file.loadFileAsString());

    if (accepted == 0)
    {
        error = "no entries found in " + file.getFullPathName();
        return false;
    }

    juce::Logger::writeToLog ("[CmuDict] Loaded " + juce::String (size()) + " words from " + file.getFullPathName());
    return true;
}

int CmuDictPhonemizer::loadFromText (const juce::String& text)
{
    juce::StringArray lines;
    lines.addLines (text);

    int accepted = 0;

    for (auto line : lines)
    {
        if (line.startsWith (";;;"))
            continue;

        const int hash = line.indexOfChar ('#');
        if (hash >= 0)
            line = line.substring (0, hash);

        auto parts = juce::StringArray::fromTokens (line.trim(), " \t", "");
        parts.removeEmptyStrings();

        if (parts.size() < 2)
            continue;

        const auto key = stripVariantSuffix (parts[0]).toUpperCase();
        parts.remove (0);

        for (auto& p : parts)
            p = p.toUpperCase();

        if (entries.find (key) == entries.end())
            entries.emplace (key, parts);

        ++accepted;
    }

    return accepted;
}

juce::StringArray CmuDictPhonemizer::lookup (const juce::String& word) const
{
    const auto it = entries.find (word.toUpperCase());
    return it != entries.end() ? it->second : juce::StringArray();
}

juce::StringArray CmuDictPhonemizer::phonemize (const juce::String& word)
{
    auto found = lookup (word);
    if (! found.isEmpty())
        return found;

    // Without the apostrophe ("ROCKIN'" -> "ROCKIN") before spelling it out.
    const auto bare = word.removeCharacters ("'");
    if (bare != word)
    {
        found = lookup (bare);
        if (! found.isEmpty())
            return found;
    }

    juce::StringArray spelled;

    for (auto p = bare.getCharPointer(); ! p.isEmpty(); ++p)
    {
        const auto letter = lookup (juce::String::charToString (*p));
        if (letter.isEmpty())
        {
            DBG ("[CmuDict] Cannot spell '" + word + "'");
            return {};
        }

        spelled.addArray (letter);
    }

    if (! spelled.isEmpty())
        juce::Logger::writeToLog ("[CmuDict] '" + word + "' not in dictionary, spelling it out");

    return spelled;
}

} // namespace Phonoclip
