#include "ClipLibrary.h"
#include <limits>

namespace Phonoclip
{

ClipLibrary::ClipLibrary (VariantSelector& s)
    : selector (s)
{
}

std::optional<juce::File> ClipLibrary::resolvePhoneme (const juce::File& voiceRoot, const juce::String& label) const
{
    return pick (voiceRoot, label);
}

std::optional<juce::File> ClipLibrary::resolveWord (const juce::File& voiceRoot, const juce::String& word) const
{
    return pick (voiceRoot.getChildFile (wordsFolderName), word.toUpperCase());
}

std::optional<juce::File> ClipLibrary::pick (const juce::File& directory, const juce::String& baseName) const
{
    if (baseName.isEmpty())
        return std::nullopt;

    const auto candidates = findVariants (directory, baseName);
    if (candidates.isEmpty())
        return std::nullopt;

    const int index = selector.pickIndex (candidates.size());
    jassert (juce::isPositiveAndBelow (index, candidates.size()));

    return candidates[juce::jlimit (0, candidates.size() - 1, index)];
}

juce::int64 ClipLibrary::variantNumber (const juce::String& fileName, const juce::String& baseName)
{
    if (! fileName.endsWithIgnoreCase (".wav"))
        return -2;

    const auto stem = fileName.dropLastCharacters (4);

    if (stem.equalsIgnoreCase (baseName))
        return -1;

    if (! stem.startsWithIgnoreCase (baseName + "_"))
        return -2;

    const auto suffix = stem.substring (baseName.length() + 1);
    if (suffix.isEmpty() || ! suffix.containsOnly ("0123456789"))
        return -2;

    // Saturate so huge suffixes still sort after every smaller one.
    constexpr auto limit = std::numeric_limits<juce::int64>::max();
    juce::int64 value = 0;

    for (auto p = suffix.getCharPointer(); ! p.isEmpty(); ++p)
    {
        const auto digit = (juce::int64) (*p - '0');
        if (value > (limit - digit) / 10)
            return limit;

        value = value * 10 + digit;
    }

    return value;
}

juce::Array<juce::File> ClipLibrary::findVariants (const juce::File& directory, const juce::String& baseName)
{
    juce::Array<juce::File> matches;

    if (! directory.isDirectory())
        return matches;

    for (const auto& entry : juce::RangedDirectoryIterator (directory, false, "*", juce::File::findFiles))
    {
        const auto file = entry.getFile();
        if (variantNumber (file.getFileName(), baseName) != -2)
            matches.add (file);
    }

    std::sort (matches.begin(), matches.end(), [&baseName] (const juce::File& a, const juce::File& b)
    {
        const auto na = variantNumber (a.getFileName(), baseName);
        const auto nb = variantNumber (b.getFileName(), baseName);
        if (na != nb)
            return na < nb;
        return a.getFileName() < b.getFileName();
    });

    return matches;
}

} // namespace Phonoclip
