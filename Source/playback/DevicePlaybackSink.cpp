#include "DevicePlaybackSink.h"
#include <algorithm>
#include <cmath>

namespace Phonoclip
{

DevicePlaybackSink::DevicePlaybackSink()
    : fifoBuffer ((size_t) fifoSize, 0.0f)
{
}

DevicePlaybackSink::~DevicePlaybackSink()
{
    stop();
    close();
}

bool DevicePlaybackSink::open (const PcmFormat& format, juce::String& error)
{
    if (! format.isValid())
    {
        error = "invalid stream format " + format.toString();
        return false;
    }

    sourceFormat = format;

    auto initError = deviceManager.initialiseWithDefaultDevices (0, 2);
    if (initError.isNotEmpty())
    {
        error = initError;
        return false;
    }

    juce::AudioDeviceManager::AudioDeviceSetup setup;
    deviceManager.getAudioDeviceSetup (setup);
    setup.sampleRate = (double) format.sampleRate;

    auto setupError = deviceManager.setAudioDeviceSetup (setup, true);
    if (setupError.isNotEmpty())
        juce::Logger::writeToLog ("[Playback] Device refused " + juce::String (format.sampleRate) + " Hz: " + setupError);

    auto* device = deviceManager.getCurrentAudioDevice();
    if (device == nullptr)
    {
        error = "no audio output device available";
        return false;
    }

    const double deviceRate = device->getCurrentSampleRate();
    if (deviceRate <= 0.0)
    {
        error = "output device reports no sample rate";
        return false;
    }

    speedRatio = (double) format.sampleRate / deviceRate;
    interpolator.reset();
    pendingInput.clear();
    fifo.reset();
    deviceFailed.store (false);
    running.store (true);

    deviceManager.addAudioCallback (this);
    callbackAttached = true;

    juce::Logger::writeToLog ("[Playback] Opened '" + device->getName() + "' at " + juce::String (deviceRate)
                              + " Hz" + (speedRatio != 1.0 ? " (resampling)" : ""));
    return true;
}

bool DevicePlaybackSink::write (const void* data, size_t numBytes)
{
    if (! running.load() || deviceFailed.load())
        return false;

    const int width = sourceFormat.bytesPerSample;
    const int channels = sourceFormat.numChannels;
    const auto frameSize = (size_t) sourceFormat.getFrameSize();
    const auto numFrames = numBytes / frameSize;
    const auto scale = 1.0f / (float) (maxSampleValue (width) + 1);
    const auto* bytes = static_cast<const juce::uint8*> (data);

    for (size_t frame = 0; frame < numFrames; ++frame)
    {
        float sum = 0.0f;
        for (int ch = 0; ch < channels; ++ch)
            sum += (float) readSample (bytes + frame * frameSize + (size_t) (ch * width), width);

        pendingInput.push_back (sum * scale / (float) channels);
    }

    if (speedRatio == 1.0)
    {
        const bool ok = pushToFifo (pendingInput.data(), (int) pendingInput.size());
        pendingInput.clear();
        return ok;
    }

    // Keep a few input samples back so the interpolator never reads past the end.
    const int available = (int) pendingInput.size() - 4;
    const int numOut = available > 0 ? (int) std::floor ((double) available / speedRatio) : 0;

    if (numOut <= 0)
        return true;

    resampled.resize ((size_t) numOut);
    const int used = interpolator.process (speedRatio, pendingInput.data(), resampled.data(), numOut);
    pendingInput.erase (pendingInput.begin(), pendingInput.begin() + juce::jmin (used, (int) pendingInput.size()));

    return pushToFifo (resampled.data(), numOut);
}

bool DevicePlaybackSink::pushToFifo (const float* samples, int numSamples)
{
    int written = 0;

    while (written < numSamples)
    {
        if (! running.load() || deviceFailed.load())
            return false;

        const int toWrite = juce::jmin (numSamples - written, fifo.getFreeSpace());
        if (toWrite == 0)
        {
            spaceAvailable.wait (100);
            continue;
        }

        int start1, size1, start2, size2;
        fifo.prepareToWrite (toWrite, start1, size1, start2, size2);

        if (size1 > 0)
            std::copy (samples + written, samples + written + size1, fifoBuffer.begin() + start1);
        if (size2 > 0)
            std::copy (samples + written + size1, samples + written + size1 + size2, fifoBuffer.begin() + start2);

        fifo.finishedWrite (size1 + size2);
        written += size1 + size2;
    }

    return true;
}

void DevicePlaybackSink::stop()
{
    if (! running.load())
        return;

    // Let what is already queued play out, bounded by its own length plus a second.
    auto* device = deviceManager.getCurrentAudioDevice();
    const double rate = device != nullptr ? device->getCurrentSampleRate() : 44100.0;
    const auto deadline = juce::Time::getMillisecondCounter()
                        + (juce::uint32) (1000.0 * (double) fifo.getNumReady() / juce::jmax (1.0, rate)) + 1000;

    while (fifo.getNumReady() > 0 && ! deviceFailed.load()
           && juce::Time::getMillisecondCounter() < deadline)
        spaceAvailable.wait (20);

    running.store (false);

    if (callbackAttached)
    {
        deviceManager.removeAudioCallback (this);
        callbackAttached = false;
    }

    fifo.reset();
    pendingInput.clear();
}

void DevicePlaybackSink::close()
{
    running.store (false);

    if (callbackAttached)
    {
        deviceManager.removeAudioCallback (this);
        callbackAttached = false;
    }

    if (deviceManager.getCurrentAudioDevice() != nullptr)
    {
        deviceManager.closeAudioDevice();
        juce::Logger::writeToLog ("[Playback] Device closed");
    }
}

void DevicePlaybackSink::audioDeviceIOCallbackWithContext (const float* const* inputChannelData, int numInputChannels,
                                                           float* const* outputChannelData, int numOutputChannels,
                                                           int numSamples, const juce::AudioIODeviceCallbackContext& context)
{
    juce::ignoreUnused (inputChannelData, numInputChannels, context);

    const int toRead = juce::jmin (numSamples, fifo.getNumReady());
    int start1, size1, start2, size2;
    fifo.prepareToRead (toRead, start1, size1, start2, size2);

    for (int ch = 0; ch < numOutputChannels; ++ch)
    {
        auto* out = outputChannelData[ch];
        if (out == nullptr)
            continue;

        if (size1 > 0)
            std::copy (fifoBuffer.begin() + start1, fifoBuffer.begin() + start1 + size1, out);
        if (size2 > 0)
            std::copy (fifoBuffer.begin() + start2, fifoBuffer.begin() + start2 + size2, out + size1);

        juce::FloatVectorOperations::clear (out + toRead, numSamples - toRead);
    }

    fifo.finishedRead (size1 + size2);
    spaceAvailable.signal();
}

void DevicePlaybackSink::audioDeviceAboutToStart (juce::AudioIODevice* device)
{
    juce::Logger::writeToLog ("[Playback] Device about to start: " + (device != nullptr ? device->getName() : juce::String ("unknown")));
}

void DevicePlaybackSink::audioDeviceStopped()
{
    juce::Logger::writeToLog ("[Playback] Device stopped");
}

void DevicePlaybackSink::audioDeviceError (const juce::String& errorMessage)
{
    deviceFailed.store (true);
    spaceAvailable.signal();
    juce::Logger::writeToLog ("[Playback] Device error: " + errorMessage);
}

} // namespace Phonoclip
