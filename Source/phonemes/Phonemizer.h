#pragma once

#include <juce_core/juce_core.h>

namespace Phonoclip
{

/**
 * Grapheme-to-phoneme engine.
 *
 * Returns ARPAbet-like labels for one word, optionally with a trailing stress
 * digit ("AE1"). The output may contain tokens that are not phonemes at all
 * (stray punctuation); callers filter them.
 */
class Phonemizer
{
public:
    virtual ~Phonemizer() = default;

    virtual juce::StringArray phonemize (const juce::String& word) = 0;
};

} // namespace Phonoclip
