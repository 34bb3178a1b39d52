#pragma once

#include "../phonemes/FallbackTable.h"

namespace Phonoclip
{

/**
 * Silence inserted between units, in seconds.
 */
struct PauseDurations
{
    double terminal { 0.5 };   // after . ! ?
    double comma { 0.25 };     // after , ;
    double interWord { 0.01 }; // after every word
};

/**
 * Everything that shapes a render.
 *
 * Use one of the named presets rather than building from scratch; the file
 * and live presets differ only in the sentence-end pause.
 */
struct SynthConfig
{
    bool wordFirstLookup { true };
    bool randomVariants { true };

    bool useFallbackTable { true };
    FallbackTable fallbackTable { FallbackTable::createDefault() };

    bool reducedVowelTrim { true };
    juce::String reducedVowelNeighbour { "EH" };

    bool finalVowelSubstitution { true };
    juce::String clearVowel { "AA" };

    bool crossfadeEnabled { true };
    double fadeDurationSeconds { 0.05 };

    PauseDurations pauses;

    int playbackChunkFrames { 1024 };

    /** Upper bound for the fade and every pause accepted from JSON. */
    static constexpr double maxDurationSeconds = 60.0;

    /** Render to a WAV file: 500 ms sentence pause. */
    static SynthConfig forFileRender();

    /** Speak through the output device: 300 ms sentence pause. */
    static SynthConfig forLivePlayback();

    /** Straight concatenation of exact files: no variants, substitutes, vowel rules or crossfades. */
    static SynthConfig plainConcatenation();

    /** "file", "live" or "plain". Returns false for anything else. */
    static bool fromPresetName (const juce::String& name, SynthConfig& result);

    static juce::StringArray getPresetNames() { return { "file", "live", "plain" }; }

    /**
     * Overrides fields from a JSON object. Recognised keys match the member
     * names, with "pauses" an object of terminal/comma/interWord and
     * "fallbackTable" an object of label arrays that replaces the table.
     * Unknown keys are ignored. On error nothing is changed.
     */
    bool applyJson (const juce::String& jsonText, juce::String& error);

    /** Reads a JSON file and applies it. */
    bool applyJsonFile (const juce::File& file, juce::String& error);

    juce::String describe() const;
};

} // namespace Phonoclip
