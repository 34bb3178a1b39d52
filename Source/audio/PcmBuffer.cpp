#include "PcmBuffer.h"

namespace Phonoclip
{

juce::String PcmFormat::toString() const
{
    return juce::String (numChannels) + "ch/" + juce::String (bytesPerSample * 8) + "bit/" + juce::String (sampleRate) + "Hz";
}

juce::int64 PcmBuffer::getNumFrames() const noexcept
{
    const int frameSize = format.getFrameSize();
    return frameSize > 0 ? (juce::int64) (data.getSize() / (size_t) frameSize) : 0;
}

double PcmBuffer::getDurationSeconds() const noexcept
{
    return format.sampleRate > 0 ? (double) getNumFrames() / (double) format.sampleRate : 0.0;
}

void PcmBuffer::append (const PcmBuffer& other)
{
    if (other.isEmpty())
        return;

    jassert (isEmpty() || format == other.format);

    if (isEmpty())
        format = other.format;

    data.append (other.data.getData(), other.data.getSize());
}

void PcmBuffer::removeFromStart (size_t numBytes)
{
    data.removeSection (0, juce::jmin (numBytes, data.getSize()));
}

void PcmBuffer::removeFromEnd (size_t numBytes)
{
    data.setSize (data.getSize() - juce::jmin (numBytes, data.getSize()));
}

PcmBuffer PcmBuffer::silence (const PcmFormat& format, double seconds)
{
    const auto numFrames = (size_t) juce::jmax (0.0, std::floor ((double) format.sampleRate * seconds));
    return { format, juce::MemoryBlock (numFrames * (size_t) format.getFrameSize(), true) };
}

int readSample (const void* source, int bytesPerSample) noexcept
{
    auto* p = static_cast<const juce::uint8*> (source);

    switch (bytesPerSample)
    {
        case 1:  return (int) (juce::int8) p[0];
        case 2:  return (int) (juce::int16) juce::ByteOrder::littleEndianShort (p);
        case 3:  return juce::ByteOrder::littleEndian24Bit (p);
        case 4:  return (int) juce::ByteOrder::littleEndianInt (p);
        default: break;
    }

    jassertfalse;
    return 0;
}

void writeSample (void* dest, int bytesPerSample, int value) noexcept
{
    auto* p = static_cast<juce::uint8*> (dest);
    const auto bits = (juce::uint32) value;

    for (int i = 0; i < bytesPerSample; ++i)
        p[i] = (juce::uint8) ((bits >> (8 * i)) & 0xff);
}

juce::int64 maxSampleValue (int bytesPerSample) noexcept
{
    return (((juce::int64) 1) << (8 * bytesPerSample - 1)) - 1;
}

juce::int64 minSampleValue (int bytesPerSample) noexcept
{
    return -(((juce::int64) 1) << (8 * bytesPerSample - 1));
}

int saturate (juce::int64 value, int bytesPerSample) noexcept
{
    return (int) juce::jlimit (minSampleValue (bytesPerSample), maxSampleValue (bytesPerSample), value);
}

} // namespace Phonoclip
