#pragma once

#include "PlaybackSink.h"
#include "../render/Renderer.h"
#include <juce_core/juce_core.h>
#include <atomic>
#include <deque>
#include <functional>
#include <memory>

namespace Phonoclip
{

/**
 * SpeechThread - Background worker that renders and plays speak requests.
 *
 * speak() only queues the text and returns. The worker takes one request at
 * a time, opens a fresh sink from the factory, plays the render through it
 * and reports the result. cancelCurrent() stops the request in progress at
 * the next token or chunk; queued requests are unaffected.
 */
class SpeechThread : public juce::Thread
{
public:
    using SinkFactory = std::function<std::unique_ptr<PlaybackSink>()>;
    using FinishedCallback = std::function<void (const juce::String& text, const RenderResult& result)>;

    SpeechThread (Renderer& renderer, const juce::File& voiceRoot, const SynthConfig& config, SinkFactory sinkFactory);
    ~SpeechThread() override;

    void run() override;

    /** Queues text to be spoken. Empty text is ignored. */
    void speak (const juce::String& text);

    /** Stops the request that is currently playing. */
    void cancelCurrent();

    /** Drops queued requests and stops the current one. */
    void cancelAll();

    /** True while a request is being rendered or played. */
    bool isSpeaking() const { return speaking.load(); }

    int getNumPending() const;

    /**
     * Called on the worker thread after every request, whatever its outcome.
     * Set it before the first speak().
     */
    void setOnFinished (FinishedCallback callback) { onFinished = std::move (callback); }

private:
    RenderResult process (const juce::String& text);

    Renderer& renderer;
    const juce::File voiceRoot;
    const SynthConfig config;
    SinkFactory sinkFactory;
    FinishedCallback onFinished;

    std::deque<juce::String> requests;
    juce::CriticalSection queueLock;

    std::atomic<bool> shouldCancel { false };
    std::atomic<bool> speaking { false };
};

} // namespace Phonoclip
