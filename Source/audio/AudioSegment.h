#pragma once

#include "PcmBuffer.h"

namespace Phonoclip
{

/**
 * One unit of the render list: a word clip, a phoneme clip or a pause.
 */
struct AudioSegment
{
    enum class Classification
    {
        Vowel,
        Consonant,
        Pause,
        Opaque  // whole-word clip, never crossfaded
    };

    enum class Role
    {
        Word,
        Phoneme,
        Silence
    };

    PcmBuffer pcm;
    Classification classification { Classification::Opaque };
    Role role { Role::Word };
    juce::String label;

    static AudioSegment makeWord (PcmBuffer pcm, const juce::String& word)
    {
        return { std::move (pcm), Classification::Opaque, Role::Word, word };
    }

    static AudioSegment makePhoneme (PcmBuffer pcm, const juce::String& label, bool isVowel)
    {
        return { std::move (pcm), isVowel ? Classification::Vowel : Classification::Consonant, Role::Phoneme, label };
    }

    static AudioSegment makePause (const PcmFormat& format, double seconds)
    {
        return { PcmBuffer::silence (format, seconds), Classification::Pause, Role::Silence, "<pause>" };
    }

    bool isPause() const noexcept { return classification == Classification::Pause; }
    bool isSpeech() const noexcept { return role != Role::Silence; }
};

/**
 * Where a segment ended up in a mixed buffer.
 */
struct SegmentSpan
{
    juce::String label;
    AudioSegment::Role role { AudioSegment::Role::Word };
    AudioSegment::Classification classification { AudioSegment::Classification::Opaque };
    juce::int64 startFrame { 0 };
    juce::int64 numFrames { 0 };
    bool fadesIntoNext { false };
};

} // namespace Phonoclip
