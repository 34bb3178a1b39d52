#include "CrossfadeMixer.h"

namespace Phonoclip
{

CrossfadeMixer::CrossfadeMixer (double fadeDurationSeconds, bool shouldBlend)
    : fadeSeconds (juce::jmax (0.0, fadeDurationSeconds)),
      enabled (shouldBlend)
{
}

bool CrossfadeMixer::isEligibleBoundary (const AudioSegment& current, const AudioSegment& next) noexcept
{
    return current.role == AudioSegment::Role::Phoneme
        && current.classification == AudioSegment::Classification::Consonant
        && ! next.isPause()
        && next.classification == AudioSegment::Classification::Vowel;
}

size_t CrossfadeMixer::getFadeWindowBytes (const PcmBuffer& current, const PcmBuffer& next) const noexcept
{
    const auto frameSize = (size_t) current.format.getFrameSize();
    if (frameSize == 0)
        return 0;

    const auto fadeFrames = (size_t) juce::jmax (0.0, std::floor ((double) current.format.sampleRate * fadeSeconds));
    const auto window = juce::jmin (fadeFrames * frameSize, current.getNumBytes(), next.getNumBytes());

    return window - (window % frameSize);
}

void CrossfadeMixer::blendInPlace (PcmBuffer& current, PcmBuffer& next, size_t windowBytes)
{
    jassert (current.format == next.format);

    const int width = current.format.bytesPerSample;
    const int channels = current.format.numChannels;
    const auto frameSize = (size_t) current.format.getFrameSize();
    const auto numFrames = windowBytes / frameSize;

    if (numFrames == 0)
        return;

    auto* tail = static_cast<juce::uint8*> (current.data.getData()) + (current.getNumBytes() - windowBytes);
    auto* head = static_cast<const juce::uint8*> (next.data.getData());

    for (size_t k = 0; k < numFrames; ++k)
    {
        const double fadeIn = (double) k / (double) numFrames;
        const double fadeOut = 1.0 - fadeIn;

        for (int ch = 0; ch < channels; ++ch)
        {
            const auto offset = k * frameSize + (size_t) (ch * width);
            const auto outgoing = (juce::int64) ((double) readSample (tail + offset, width) * fadeOut);
            const auto incoming = (juce::int64) ((double) readSample (head + offset, width) * fadeIn);

            writeSample (tail + offset, width, saturate (outgoing + incoming, width));
        }
    }

    next.removeFromStart (windowBytes);
}

PcmBuffer CrossfadeMixer::applyCrossfades (std::vector<AudioSegment> segments,
                                           std::vector<SegmentSpan>* layout) const
{
    PcmBuffer out;
    out.format = segments.empty() ? PcmFormat::target() : segments.front().pcm.format;

    if (layout != nullptr)
        layout->clear();

    for (size_t i = 0; i < segments.size(); ++i)
    {
        auto& current = segments[i];
        jassert (current.pcm.isEmpty() || current.pcm.format == out.format);

        bool faded = false;

        if (enabled && i + 1 < segments.size() && isEligibleBoundary (current, segments[i + 1]))
        {
            auto& next = segments[i + 1];
            const auto window = getFadeWindowBytes (current.pcm, next.pcm);

            if (window > 0)
            {
                blendInPlace (current.pcm, next.pcm, window);
                faded = true;
            }
        }

        if (layout != nullptr)
        {
            SegmentSpan span;
            span.label = current.label;
            span.role = current.role;
            span.classification = current.classification;
            span.startFrame = out.getNumFrames();
            span.numFrames = current.pcm.getNumFrames();
            span.fadesIntoNext = faded;
            layout->push_back (span);
        }

        out.data.append (current.pcm.data.getData(), current.pcm.getNumBytes());
    }

    return out;
}

} // namespace Phonoclip
