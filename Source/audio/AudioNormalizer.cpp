#include "AudioNormalizer.h"

namespace Phonoclip
{

PcmBuffer AudioNormalizer::normalize (const PcmBuffer& source, const PcmFormat& target)
{
    jassert (source.format.isValid() && target.isValid());

    if (source.format == target)
        return source;

    auto data = source.data;
    int channels = source.format.numChannels;
    int width = source.format.bytesPerSample;

    if (channels != target.numChannels)
    {
        if (channels > 1)
        {
            data = mixToMono (data, channels, width);
            channels = 1;
        }

        if (target.numChannels > 1)
        {
            data = duplicateMono (data, target.numChannels, width);
            channels = target.numChannels;
        }
    }

    if (width != target.bytesPerSample)
    {
        data = convertWidth (data, width, target.bytesPerSample);
        width = target.bytesPerSample;
    }

    if (source.format.sampleRate != target.sampleRate)
        data = resample (data, channels, width, source.format.sampleRate, target.sampleRate);

    return { target, std::move (data) };
}

juce::MemoryBlock AudioNormalizer::mixToMono (const juce::MemoryBlock& data, int numChannels, int bytesPerSample)
{
    const auto frameSize = (size_t) (numChannels * bytesPerSample);
    const auto numFrames = data.getSize() / frameSize;
    juce::MemoryBlock out (numFrames * (size_t) bytesPerSample, true);

    auto* src = static_cast<const juce::uint8*> (data.getData());
    auto* dst = static_cast<juce::uint8*> (out.getData());

    for (size_t frame = 0; frame < numFrames; ++frame)
    {
        juce::int64 sum = 0;
        for (int ch = 0; ch < numChannels; ++ch)
            sum += readSample (src + frame * frameSize + (size_t) (ch * bytesPerSample), bytesPerSample);

        writeSample (dst + frame * (size_t) bytesPerSample, bytesPerSample, saturate (sum / numChannels, bytesPerSample));
    }

    return out;
}

juce::MemoryBlock AudioNormalizer::duplicateMono (const juce::MemoryBlock& data, int numChannels, int bytesPerSample)
{
    const auto numFrames = data.getSize() / (size_t) bytesPerSample;
    const auto frameSize = (size_t) (numChannels * bytesPerSample);
    juce::MemoryBlock out (numFrames * frameSize, true);

    auto* src = static_cast<const juce::uint8*> (data.getData());
    auto* dst = static_cast<juce::uint8*> (out.getData());

    for (size_t frame = 0; frame < numFrames; ++frame)
        for (int ch = 0; ch < numChannels; ++ch)
            std::memcpy (dst + frame * frameSize + (size_t) (ch * bytesPerSample),
                         src + frame * (size_t) bytesPerSample,
                         (size_t) bytesPerSample);

    return out;
}

juce::MemoryBlock AudioNormalizer::convertWidth (const juce::MemoryBlock& data, int fromBytes, int toBytes)
{
    if (fromBytes == toBytes)
        return data;

    const auto numSamples = data.getSize() / (size_t) fromBytes;
    juce::MemoryBlock out (numSamples * (size_t) toBytes, true);

    auto* src = static_cast<const juce::uint8*> (data.getData());
    auto* dst = static_cast<juce::uint8*> (out.getData());

    // Go through a left-justified 32-bit value: widening pads with zero bits,
    // narrowing drops the low bits.
    const int upShift = 32 - 8 * fromBytes;
    const int downShift = 32 - 8 * toBytes;

    for (size_t i = 0; i < numSamples; ++i)
    {
        const auto wide = (juce::int64) readSample (src + i * (size_t) fromBytes, fromBytes) * (((juce::int64) 1) << upShift);
        writeSample (dst + i * (size_t) toBytes, toBytes, (int) (wide >> downShift));
    }

    return out;
}

juce::MemoryBlock AudioNormalizer::resample (const juce::MemoryBlock& data, int numChannels, int bytesPerSample,
                                             int fromRate, int toRate)
{
    if (fromRate == toRate || fromRate <= 0 || toRate <= 0)
        return data;

    const auto frameSize = (size_t) (numChannels * bytesPerSample);
    const auto inFrames = (juce::int64) (data.getSize() / frameSize);

    if (inFrames == 0)
        return {};

    const auto outFrames = (inFrames * (juce::int64) toRate) / (juce::int64) fromRate;
    juce::MemoryBlock out ((size_t) outFrames * frameSize, true);

    auto* src = static_cast<const juce::uint8*> (data.getData());
    auto* dst = static_cast<juce::uint8*> (out.getData());
    const double step = (double) fromRate / (double) toRate;

    for (juce::int64 j = 0; j < outFrames; ++j)
    {
        const double position = (double) j * step;
        const auto i0 = juce::jmin ((juce::int64) position, inFrames - 1);
        const auto i1 = juce::jmin (i0 + 1, inFrames - 1);
        const double frac = position - (double) i0;

        for (int ch = 0; ch < numChannels; ++ch)
        {
            const auto offset = (size_t) (ch * bytesPerSample);
            const auto a = readSample (src + (size_t) i0 * frameSize + offset, bytesPerSample);
            const auto b = readSample (src + (size_t) i1 * frameSize + offset, bytesPerSample);
            const auto value = (juce::int64) std::llround ((double) a + ((double) b - (double) a) * frac);

            writeSample (dst + (size_t) j * frameSize + offset, bytesPerSample, saturate (value, bytesPerSample));
        }
    }

    return out;
}

} // namespace Phonoclip
