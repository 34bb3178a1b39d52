#pragma once

#include "../audio/PcmBuffer.h"

namespace Phonoclip
{

/**
 * Somewhere rendered PCM can be streamed to, usually an audio device.
 *
 * Call order is open, any number of writes, stop, close. stop() and close()
 * must be safe to call when open() failed or was never called.
 */
class PlaybackSink
{
public:
    virtual ~PlaybackSink() = default;

    /** Acquires the output. Returns false and fills error when it cannot. */
    virtual bool open (const PcmFormat& format, juce::String& error) = 0;

    /** Queues interleaved PCM in the opened format. May block while the output catches up. */
    virtual bool write (const void* data, size_t numBytes) = 0;

    /** Lets queued audio finish, then halts output. */
    virtual void stop() = 0;

    /** Releases the output. */
    virtual void close() = 0;
};

/**
 * Holds a PlaybackSink open for the lifetime of the object.
 *
 * The destructor always stops and closes the sink, including when open()
 * failed and when the scope is left by an exception.
 */
class ScopedPlaybackStream
{
public:
    ScopedPlaybackStream (PlaybackSink& s, const PcmFormat& format)
        : sink (s)
    {
        opened = sink.open (format, error);
    }

    ~ScopedPlaybackStream()
    {
        sink.stop();
        sink.close();
    }

    bool isOpen() const noexcept { return opened; }
    const juce::String& getError() const noexcept { return error; }

    bool write (const void* data, size_t numBytes)
    {
        return opened && sink.write (data, numBytes);
    }

private:
    PlaybackSink& sink;
    bool opened { false };
    juce::String error;

    JUCE_DECLARE_NON_COPYABLE (ScopedPlaybackStream)
};

} // namespace Phonoclip
