#pragma once

#include "VariantSelector.h"
#include <optional>

namespace Phonoclip
{

/**
 * Finds recordings in a voice bank.
 *
 * Layout:
 *   <voice>/<PHONEME>.wav, <voice>/<PHONEME>_<n>.wav
 *   <voice>/words/<WORD>.wav, <voice>/words/<WORD>_<n>.wav
 *
 * Every file sharing a base name is a variant of the same sound; the
 * selector picks one of them per lookup. A missing directory or file is a
 * normal outcome and yields std::nullopt.
 */
class ClipLibrary
{
public:
    explicit ClipLibrary (VariantSelector& selector);

    std::optional<juce::File> resolvePhoneme (const juce::File& voiceRoot, const juce::String& label) const;
    std::optional<juce::File> resolveWord (const juce::File& voiceRoot, const juce::String& word) const;

    /**
     * All files in directory named <baseName>.wav or <baseName>_<digits>.wav,
     * ignoring case. Unsuffixed first, then by ascending suffix.
     */
    static juce::Array<juce::File> findVariants (const juce::File& directory, const juce::String& baseName);

    /** Parses the variant suffix; -1 for the unsuffixed file, -2 when the name does not match. */
    static juce::int64 variantNumber (const juce::String& fileName, const juce::String& baseName);

    static constexpr const char* wordsFolderName = "words";

private:
    std::optional<juce::File> pick (const juce::File& directory, const juce::String& baseName) const;

    VariantSelector& selector;
};

} // namespace Phonoclip
