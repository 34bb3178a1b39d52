#pragma once

#include "AudioSegment.h"
#include <vector>

namespace Phonoclip
{

/**
 * Concatenates render segments, blending consonant-to-vowel seams.
 *
 * Runs one left-to-right pass looking at most one segment ahead. When a
 * boundary is eligible the consonant's tail is faded out over the vowel's
 * head, and the vowel loses the head that went into the blend, so a segment
 * gives up at most its head to its predecessor and its tail to its successor.
 */
class CrossfadeMixer
{
public:
    explicit CrossfadeMixer (double fadeDurationSeconds, bool enabled = true);

    /**
     * Mixes the segments into one buffer.
     * @param segments  Segments in render order, all in the same format.
     * @param layout    Optional; receives the span each segment occupies in the result.
     */
    PcmBuffer applyCrossfades (std::vector<AudioSegment> segments,
                               std::vector<SegmentSpan>* layout = nullptr) const;

    /** Consonant phoneme followed by a vowel that is not a pause. */
    static bool isEligibleBoundary (const AudioSegment& current, const AudioSegment& next) noexcept;

    /** Fade window in bytes for this pair, whole frames only; 0 means no blend. */
    size_t getFadeWindowBytes (const PcmBuffer& current, const PcmBuffer& next) const noexcept;

    /**
     * Blends the last windowBytes of current with the first windowBytes of next.
     * current's tail is replaced by the blend and next loses its head.
     */
    static void blendInPlace (PcmBuffer& current, PcmBuffer& next, size_t windowBytes);

    double getFadeDurationSeconds() const noexcept { return fadeSeconds; }
    bool isEnabled() const noexcept { return enabled; }

private:
    double fadeSeconds;
    bool enabled;
};

} // namespace Phonoclip
