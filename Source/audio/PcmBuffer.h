#pragma once

#include <juce_core/juce_core.h>

namespace Phonoclip
{

/**
 * Layout of an interleaved integer PCM stream.
 */
struct PcmFormat
{
    int numChannels { 1 };
    int bytesPerSample { 2 };
    int sampleRate { 44100 };

    int getFrameSize() const noexcept { return numChannels * bytesPerSample; }

    bool isValid() const noexcept
    {
        return numChannels > 0 && bytesPerSample >= 1 && bytesPerSample <= 4 && sampleRate > 0;
    }

    bool operator== (const PcmFormat& other) const noexcept
    {
        return numChannels == other.numChannels
            && bytesPerSample == other.bytesPerSample
            && sampleRate == other.sampleRate;
    }

    bool operator!= (const PcmFormat& other) const noexcept { return ! operator== (other); }

    juce::String toString() const;

    /** The one format every segment is converted to before mixing: mono, 16-bit, 44100 Hz. */
    static PcmFormat target() noexcept { return { 1, 2, 44100 }; }
};

/**
 * A block of interleaved, little-endian, signed integer PCM plus its format.
 *
 * 8-bit data is stored signed, the same way juce::AudioFormatReader hands it out.
 */
struct PcmBuffer
{
    PcmFormat format;
    juce::MemoryBlock data;

    PcmBuffer() = default;
    PcmBuffer (const PcmFormat& f, juce::MemoryBlock bytes) : format (f), data (std::move (bytes)) {}

    size_t getNumBytes() const noexcept { return data.getSize(); }
    juce::int64 getNumFrames() const noexcept;
    bool isEmpty() const noexcept { return data.getSize() == 0; }

    double getDurationSeconds() const noexcept;

    /** Appends another buffer of the same format. */
    void append (const PcmBuffer& other);

    /** Drops bytes from the front. */
    void removeFromStart (size_t numBytes);

    /** Drops bytes from the end. */
    void removeFromEnd (size_t numBytes);

    /** Zero-filled buffer of floor(sampleRate * seconds) frames. */
    static PcmBuffer silence (const PcmFormat& format, double seconds);
};

/** Reads one signed little-endian sample of 1..4 bytes. */
int readSample (const void* source, int bytesPerSample) noexcept;

/** Writes one signed little-endian sample of 1..4 bytes. */
void writeSample (void* dest, int bytesPerSample, int value) noexcept;

/** Largest value a signed sample of the given width can hold. */
juce::int64 maxSampleValue (int bytesPerSample) noexcept;

/** Smallest value a signed sample of the given width can hold. */
juce::int64 minSampleValue (int bytesPerSample) noexcept;

/** Clamps to the signed range of the given width. */
int saturate (juce::int64 value, int bytesPerSample) noexcept;

} // namespace Phonoclip
