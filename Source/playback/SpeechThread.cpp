#include "SpeechThread.h"

namespace Phonoclip
{

SpeechThread::SpeechThread (Renderer& r, const juce::File& voice, const SynthConfig& cfg, SinkFactory factory)
    : juce::Thread ("Speech Thread"),
      renderer (r),
      voiceRoot (voice),
      config (cfg),
      sinkFactory (std::move (factory))
{
}

SpeechThread::~SpeechThread()
{
    cancelAll();
    stopThread (5000);
}

void SpeechThread::run()
{
    juce::Logger::writeToLog ("[SpeechThread] Thread started");

    while (! threadShouldExit())
    {
        juce::String text;
        {
            const juce::ScopedLock lock (queueLock);
            if (! requests.empty())
            {
                text = requests.front();
                requests.pop_front();
                shouldCancel.store (false);
                speaking.store (true);
            }
        }

        if (text.isEmpty())
        {
            wait (-1);
            continue;
        }

        juce::Logger::writeToLog ("[SpeechThread] Speaking: " + text);

        RenderResult result;

        try
        {
            result = process (text);
        }
        catch (const std::exception& e)
        {
            result = {};
            result.status = RenderResult::Status::DeviceUnavailable;
            result.errorMessage = "exception: " + juce::String (e.what());
            juce::Logger::writeToLog ("[SpeechThread] Request failed with " + result.errorMessage);
        }

        juce::Logger::writeToLog ("[SpeechThread] Finished (" + RenderResult::statusName (result.status) + "): " + text);

        if (onFinished)
            onFinished (text, result);

        speaking.store (false);
    }

    juce::Logger::writeToLog ("[SpeechThread] Thread exiting");
}

RenderResult SpeechThread::process (const juce::String& text)
{
    auto sink = sinkFactory != nullptr ? sinkFactory() : nullptr;
    if (sink == nullptr)
    {
        RenderResult result;
        result.status = RenderResult::Status::DeviceUnavailable;
        result.errorMessage = "no playback sink";
        return result;
    }

    return renderer.play (text, voiceRoot, config, *sink, &shouldCancel);
}

void SpeechThread::speak (const juce::String& text)
{
    if (text.trim().isEmpty())
        return;

    {
        const juce::ScopedLock lock (queueLock);
        requests.push_back (text);
    }

    notify();
}

void SpeechThread::cancelCurrent()
{
    const juce::ScopedLock lock (queueLock);
    shouldCancel.store (true);
}

void SpeechThread::cancelAll()
{
    {
        const juce::ScopedLock lock (queueLock);
        requests.clear();
        shouldCancel.store (true);
    }
}

int SpeechThread::getNumPending() const
{
    const juce::ScopedLock lock (queueLock);
    return (int) requests.size();
}

} // namespace Phonoclip
