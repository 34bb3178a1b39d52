#pragma once

#include "Phonemizer.h"
#include "../audio/AudioSegment.h"
#include "../audio/ClipReader.h"
#include "../render/Diagnostics.h"
#include "../render/SynthConfig.h"
#include "../voicebank/ClipLibrary.h"
#include <optional>
#include <vector>

namespace Phonoclip
{

/**
 * Turns one word into the ordered list of clips that speak it.
 *
 * A recorded whole-word clip wins when word-first lookup is on. Otherwise the
 * word is phonemized and each phoneme is looked up in the voice bank, with the
 * fallback table standing in for missing recordings. Everything returned is
 * already converted to PcmFormat::target().
 *
 * Problems (missing clips, unreadable files, fallback cycles) never abort a
 * word; they are recorded in the DiagnosticLog and the unit is dropped.
 */
class PhonemeResolver
{
public:
    PhonemeResolver (const ClipLibrary& library,
                     Phonemizer& phonemizer,
                     const ClipReader& reader,
                     const SynthConfig& config,
                     DiagnosticLog& diagnostics);

    std::vector<AudioSegment> resolveWordToSegments (const juce::File& voiceRoot, const juce::String& word);

    /** Phonemizer output after cleaning and the final-vowel rule. */
    juce::StringArray getPhonemeLabels (const juce::String& word);

    /** Audio for one label, or std::nullopt with a diagnostic recorded. */
    std::optional<PcmBuffer> resolveOnePhoneme (const juce::File& voiceRoot, const juce::String& label);

    /**
     * Drops tokens that are not [A-Z]+[0-9]* and strips stress digits,
     * keeping the reduced-vowel marker AH0 as is.
     */
    static juce::StringArray cleanLabels (const juce::StringArray& raw);

    static bool isVowel (const juce::String& label) noexcept;

    static constexpr const char* reducedVowelLabel = "AH0";

private:
    std::optional<PcmBuffer> resolveOnePhoneme (const juce::File& voiceRoot, const juce::String& label,
                                                juce::StringArray& activeLabels);
    std::optional<PcmBuffer> resolveReducedVowel (const juce::File& voiceRoot, juce::StringArray& activeLabels);
    std::optional<PcmBuffer> resolveThroughFallback (const juce::File& voiceRoot, const juce::String& label,
                                                     const juce::StringArray& substitutes,
                                                     juce::StringArray& activeLabels);
    std::optional<PcmBuffer> loadClip (const juce::File& file, const juce::String& subject);

    const ClipLibrary& library;
    Phonemizer& phonemizer;
    const ClipReader& reader;
    const SynthConfig& config;
    DiagnosticLog& diagnostics;

    JUCE_DECLARE_NON_COPYABLE (PhonemeResolver)
};

} // namespace Phonoclip
