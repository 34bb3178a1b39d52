#pragma once

#include "PlaybackSink.h"
#include <juce_audio_devices/juce_audio_devices.h>
#include <atomic>
#include <vector>

namespace Phonoclip
{

/**
 * Plays PCM through the system's default output device.
 *
 * write() converts to float and pushes into a lock-free FIFO that the device
 * callback drains; it blocks while the FIFO is full. If the device will not run
 * at the source rate the stream is resampled with a Lagrange interpolator.
 * The mono stream is copied to every output channel.
 */
class DevicePlaybackSink : public PlaybackSink,
                           private juce::AudioIODeviceCallback
{
public:
    DevicePlaybackSink();
    ~DevicePlaybackSink() override;

    bool open (const PcmFormat& format, juce::String& error) override;
    bool write (const void* data, size_t numBytes) override;
    void stop() override;
    void close() override;

    static constexpr int fifoSize = 16384;

private:
    void audioDeviceIOCallbackWithContext (const float* const* inputChannelData, int numInputChannels,
                                           float* const* outputChannelData, int numOutputChannels,
                                           int numSamples, const juce::AudioIODeviceCallbackContext& context) override;
    void audioDeviceAboutToStart (juce::AudioIODevice* device) override;
    void audioDeviceStopped() override;
    void audioDeviceError (const juce::String& errorMessage) override;

    bool pushToFifo (const float* samples, int numSamples);

    juce::AudioDeviceManager deviceManager;

    juce::AbstractFifo fifo { fifoSize };
    std::vector<float> fifoBuffer;
    juce::WaitableEvent spaceAvailable;

    PcmFormat sourceFormat;
    double speedRatio { 1.0 };
    juce::LagrangeInterpolator interpolator;
    std::vector<float> pendingInput;
    std::vector<float> resampled;

    std::atomic<bool> running { false };
    std::atomic<bool> deviceFailed { false };
    bool callbackAttached { false };

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (DevicePlaybackSink)
};

} // namespace Phonoclip
