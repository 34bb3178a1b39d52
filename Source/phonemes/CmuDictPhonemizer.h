#pragma once

#include "Phonemizer.h"
#include <map>

namespace Phonoclip
{

/**
 * Phonemizer backed by a CMU Pronouncing Dictionary file.
 *
 * Accepts both the classic layout ("ABOUT  AH0 B AW1 T", ";;;" comments)
 * and the cmudict.dict layout ("about ah0 b aw1 t # comment"). Variant
 * entries such as "READ(2)" are folded into the base word and the first
 * pronunciation listed wins.
 *
 * Words missing from the dictionary are spelled out using the entries for
 * their individual letters.
 */
class CmuDictPhonemizer : public Phonemizer
{
public:
    CmuDictPhonemizer() = default;

    /** Replaces the current contents. Returns false and fills error when the file can't be read. */
    bool loadFromFile (const juce::File& file, juce::String& error);

    /** Adds entries from dictionary text; returns the number of lines accepted. */
    int loadFromText (const juce::String& text);

    juce::StringArray phonemize (const juce::String& word) override;

    /** Dictionary pronunciation only, no spelling fallback. */
    juce::StringArray lookup (const juce::String& word) const;

    int size() const noexcept { return (int) entries.size(); }

private:
    std::map<juce::String, juce::StringArray> entries;
};

} // namespace Phonoclip
