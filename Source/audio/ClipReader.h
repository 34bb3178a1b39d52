#pragma once

#include "PcmBuffer.h"
#include <juce_audio_formats/juce_audio_formats.h>
#include <optional>

namespace Phonoclip
{

/**
 * Loads voice-bank recordings into raw PcmBuffers in their source format.
 *
 * Integer WAV data keeps its bit depth. Floating-point WAV data is converted
 * to 16-bit on load since PcmBuffer only carries integer samples.
 * One reader per render; it is not shared between threads.
 */
class ClipReader
{
public:
    ClipReader();

    /**
     * Reads a whole clip.
     * @param file   Clip to read.
     * @param error  Receives the reason when the file cannot be decoded.
     * @return       The clip, or std::nullopt if the file is missing, unreadable or malformed.
     */
    std::optional<PcmBuffer> read (const juce::File& file, juce::String& error) const;

    /** Clips longer than this are treated as malformed. */
    static constexpr double maxClipSeconds = 600.0;

private:
    mutable juce::AudioFormatManager formatManager;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (ClipReader)
};

} // namespace Phonoclip
