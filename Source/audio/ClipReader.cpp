#include "ClipReader.h"

namespace Phonoclip
{

ClipReader::ClipReader()
{
    formatManager.registerFormat (new juce::WavAudioFormat(), true);
}

std::optional<PcmBuffer> ClipReader::read (const juce::File& file, juce::String& error) const
{
    if (! file.existsAsFile())
    {
        error = "file not found";
        return std::nullopt;
    }

    std::unique_ptr<juce::AudioFormatReader> reader (formatManager.createReaderFor (file));
    if (reader == nullptr)
    {
        error = "not a readable WAV file";
        return std::nullopt;
    }

    const int numChannels = (int) reader->numChannels;
    const int sampleRate = juce::roundToInt (reader->sampleRate);
    const int bits = reader->bitsPerSample;
    const auto length = reader->lengthInSamples;

    if (numChannels <= 0 || sampleRate <= 0 || length < 0)
    {
        error = "invalid header (channels=" + juce::String (numChannels) + ", rate=" + juce::String (sampleRate) + ")";
        return std::nullopt;
    }

    if ((double) length > maxClipSeconds * (double) sampleRate)
    {
        error = "clip is longer than " + juce::String (maxClipSeconds) + " seconds";
        return std::nullopt;
    }

    const bool isFloat = reader->usesFloatingPointData;
    if (! isFloat && (bits < 8 || bits > 32 || bits % 8 != 0))
    {
        error = "unsupported bit depth " + juce::String (bits);
        return std::nullopt;
    }

    PcmFormat format;
    format.numChannels = numChannels;
    format.bytesPerSample = isFloat ? 2 : bits / 8;
    format.sampleRate = sampleRate;

    const int numFrames = (int) length;
    juce::HeapBlock<int> storage ((size_t) numChannels * (size_t) juce::jmax (1, numFrames), true);
    juce::HeapBlock<int*> channels ((size_t) numChannels);

    for (int ch = 0; ch < numChannels; ++ch)
        channels[ch] = storage.get() + (size_t) ch * (size_t) juce::jmax (1, numFrames);

    if (numFrames > 0 && ! reader->read (channels.get(), numChannels, 0, numFrames, false))
    {
        error = "failed to read sample data";
        return std::nullopt;
    }

    const int width = format.bytesPerSample;
    juce::MemoryBlock data ((size_t) numFrames * (size_t) format.getFrameSize(), true);
    auto* dst = static_cast<juce::uint8*> (data.getData());

    for (int frame = 0; frame < numFrames; ++frame)
    {
        for (int ch = 0; ch < numChannels; ++ch)
        {
            int value;

            if (isFloat)
            {
                // Float readers fill the int buffers with raw float bits.
                const float f = reinterpret_cast<const float*> (channels[ch])[frame];
                value = saturate ((juce::int64) juce::roundToInt (juce::jlimit (-1.0f, 1.0f, f) * 32767.0f), 2);
            }
            else
            {
                // Integer readers hand out left-justified 32-bit samples.
                value = channels[ch][frame] >> (32 - bits);
            }

            writeSample (dst + (size_t) frame * (size_t) format.getFrameSize() + (size_t) (ch * width), width, value);
        }
    }

    return PcmBuffer (format, std::move (data));
}

} // namespace Phonoclip
