#pragma once

#include "PcmBuffer.h"

namespace Phonoclip
{

/**
 * Converts PCM between channel counts, sample widths and sample rates.
 *
 * Conversion order is fixed: channels, then width, then rate, so the
 * resampler always runs on samples that already have the target width and
 * channel count. Converting to the buffer's own format returns it unchanged.
 */
class AudioNormalizer
{
public:
    static PcmBuffer normalize (const PcmBuffer& source, const PcmFormat& target);

    /** Equal-weight average of all channels of each frame. */
    static juce::MemoryBlock mixToMono (const juce::MemoryBlock& data, int numChannels, int bytesPerSample);

    /** Copies a mono stream into every channel of a multichannel one. */
    static juce::MemoryBlock duplicateMono (const juce::MemoryBlock& data, int numChannels, int bytesPerSample);

    /** Rescales every sample from one width to another, keeping relative amplitude. */
    static juce::MemoryBlock convertWidth (const juce::MemoryBlock& data, int fromBytes, int toBytes);

    /**
     * Linear-interpolation resampler.
     * Produces floor(inFrames * toRate / fromRate) frames.
     */
    static juce::MemoryBlock resample (const juce::MemoryBlock& data, int numChannels, int bytesPerSample,
                                       int fromRate, int toRate);
};

} // namespace Phonoclip
