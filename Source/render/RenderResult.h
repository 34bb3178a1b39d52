#pragma once

#include "Diagnostics.h"
#include "../audio/AudioSegment.h"
#include <vector>

namespace Phonoclip
{

/**
 * Outcome of one render, file write or playback.
 */
struct RenderResult
{
    enum class Status
    {
        Rendered,          // audio produced (and written or played, where asked)
        NothingToRender,   // no word or phoneme could be resolved
        OutputWriteFailed,
        DeviceUnavailable,
        Cancelled
    };

    Status status { Status::NothingToRender };
    PcmBuffer audio;
    std::vector<SegmentSpan> layout;
    std::vector<Diagnostic> diagnostics;
    juce::String errorMessage;

    bool wasRendered() const noexcept { return status == Status::Rendered; }

    static juce::String statusName (Status status)
    {
        switch (status)
        {
            case Status::Rendered:          return "rendered";
            case Status::NothingToRender:   return "nothing to render";
            case Status::OutputWriteFailed: return "output write failed";
            case Status::DeviceUnavailable: return "device unavailable";
            case Status::Cancelled:         return "cancelled";
        }

        return "unknown";
    }
};

} // namespace Phonoclip
