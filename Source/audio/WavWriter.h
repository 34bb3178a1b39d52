#pragma once

#include "PcmBuffer.h"

namespace Phonoclip
{

/**
 * Writes a PcmBuffer as a PCM WAV file.
 *
 * The file is written next to the destination first and swapped in when
 * complete, so a failed write never leaves a truncated file behind.
 */
class WavWriter
{
public:
    /**
     * @param pcm   Audio to write; its format becomes the WAV header.
     * @param dest  Destination file, replaced if it exists.
     * @param error Receives the cause on failure.
     * @return      true on success.
     */
    static bool write (const PcmBuffer& pcm, const juce::File& dest, juce::String& error);

    static constexpr int framesPerBlock = 4096;
};

} // namespace Phonoclip
