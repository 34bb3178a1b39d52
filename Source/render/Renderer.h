#pragma once

#include "RenderResult.h"
#include "SynthConfig.h"
#include "../phonemes/Phonemizer.h"
#include "../playback/PlaybackSink.h"
#include "../voicebank/VariantSelector.h"
#include <atomic>

namespace Phonoclip
{

/**
 * Text in, audio out.
 *
 * Each call tokenizes the text, resolves every word to clips, inserts pauses,
 * and runs one crossfade pass over the result. All per-render state lives on
 * the stack of the call, so one Renderer may serve several threads as long as
 * its Phonemizer and VariantSelector can.
 */
class Renderer
{
public:
    Renderer (Phonemizer& phonemizer, VariantSelector& selector);

    /**
     * Renders to memory.
     * @param cancel  Optional; checked before every token. When set the call returns Cancelled.
     */
    RenderResult render (const juce::String& text, const juce::File& voiceRoot,
                         const SynthConfig& config, const std::atomic<bool>* cancel = nullptr);

    /** Renders and writes a WAV file. Nothing is written unless the status is Rendered. */
    RenderResult renderToFile (const juce::String& text, const juce::File& voiceRoot,
                               const SynthConfig& config, const juce::File& outputFile);

    /**
     * Renders and streams the audio to a sink in chunks of config.playbackChunkFrames.
     * The sink is always stopped and closed before this returns.
     */
    RenderResult play (const juce::String& text, const juce::File& voiceRoot, const SynthConfig& config,
                       PlaybackSink& sink, const std::atomic<bool>* cancel = nullptr);

    /**
     * The config with the voice's own fallback.json merged over its table.
     * A malformed file is logged and ignored.
     */
    static SynthConfig withVoiceOverrides (const SynthConfig& config, const juce::File& voiceRoot);

    static constexpr const char* voiceFallbackFileName = "fallback.json";

private:
    Phonemizer& phonemizer;
    VariantSelector& selector;

    JUCE_DECLARE_NON_COPYABLE (Renderer)
};

} // namespace Phonoclip
