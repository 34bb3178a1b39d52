#include "Renderer.h"
#include "../audio/ClipReader.h"
#include "../audio/CrossfadeMixer.h"
#include "../audio/WavWriter.h"
#include "../phonemes/PhonemeResolver.h"
#include "../text/Tokenizer.h"
#include "../voicebank/ClipLibrary.h"

namespace Phonoclip
{

namespace
{
    bool isCancelled (const std::atomic<bool>* cancel)
    {
        return cancel != nullptr && cancel->load();
    }
}

Renderer::Renderer (Phonemizer& g2p, VariantSelector& variantSelector)
    : phonemizer (g2p), selector (variantSelector)
{
}

SynthConfig Renderer::withVoiceOverrides (const SynthConfig& config, const juce::File& voiceRoot)
{
    auto file = voiceRoot.getChildFile (voiceFallbackFileName);
    if (! config.useFallbackTable || ! file.existsAsFile())
        return config;

    FallbackTable voiceTable;
    juce::String error;

    if (! FallbackTable::loadFromFile (file, voiceTable, error))
    {
        juce::Logger::writeToLog ("[Renderer] Ignoring " + file.getFullPathName() + ": " + error);
        return config;
    }

    SynthConfig merged = config;
    merged.fallbackTable.mergeFrom (voiceTable);
    juce::Logger::writeToLog ("[Renderer] Loaded " + juce::String (voiceTable.size())
                              + " fallback entries from " + file.getFullPathName());
    return merged;
}

RenderResult Renderer::render (const juce::String& text, const juce::File& voiceRoot,
                               const SynthConfig& baseConfig, const std::atomic<bool>* cancel)
{
    RenderResult result;

    const auto config = withVoiceOverrides (baseConfig, voiceRoot);
    const auto format = PcmFormat::target();

    FirstVariantSelector firstVariant;
    ClipLibrary library (config.randomVariants ? selector : static_cast<VariantSelector&> (firstVariant));
    ClipReader reader;
    DiagnosticLog diagnostics;
    PhonemeResolver resolver (library, phonemizer, reader, config, diagnostics);

    const auto tokens = Tokenizer::tokenize (text);
    juce::Logger::writeToLog ("[Renderer] Rendering " + juce::String (tokens.size()) + " tokens with "
                              + voiceRoot.getFileName() + " (" + config.describe() + ")");

    std::vector<AudioSegment> segments;
    bool hasSpeech = false;

    for (const auto& token : tokens)
    {
        if (isCancelled (cancel))
        {
            juce::Logger::writeToLog ("[Renderer] Cancelled");
            result.status = RenderResult::Status::Cancelled;
            result.diagnostics = diagnostics.getEntries();
            return result;
        }

        switch (token.kind)
        {
            case Token::Kind::Word:
            {
                auto wordSegments = resolver.resolveWordToSegments (voiceRoot, token.text);
                for (auto& s : wordSegments)
                {
                    hasSpeech = hasSpeech || ! s.pcm.isEmpty();
                    segments.push_back (std::move (s));
                }

                segments.push_back (AudioSegment::makePause (format, config.pauses.interWord));
                break;
            }

            case Token::Kind::Terminal:
                segments.push_back (AudioSegment::makePause (format, config.pauses.terminal));
                break;

            case Token::Kind::Comma:
                segments.push_back (AudioSegment::makePause (format, config.pauses.comma));
                break;
        }
    }

    result.diagnostics = diagnostics.getEntries();

    if (! hasSpeech)
    {
        juce::Logger::writeToLog ("[Renderer] Nothing to render for \"" + text + "\"");
        result.status = RenderResult::Status::NothingToRender;
        return result;
    }

    CrossfadeMixer mixer (config.fadeDurationSeconds, config.crossfadeEnabled);
    result.audio = mixer.applyCrossfades (std::move (segments), &result.layout);
    result.status = RenderResult::Status::Rendered;

    juce::Logger::writeToLog ("[Renderer] Rendered " + juce::String (result.audio.getDurationSeconds(), 3) + "s from "
                              + juce::String ((int) result.layout.size()) + " segments, "
                              + juce::String ((int) result.diagnostics.size()) + " diagnostics");
    return result;
}

RenderResult Renderer::renderToFile (const juce::String& text, const juce::File& voiceRoot,
                                     const SynthConfig& config, const juce::File& outputFile)
{
    auto result = render (text, voiceRoot, config);
    if (! result.wasRendered())
        return result;

    juce::String error;
    if (! WavWriter::write (result.audio, outputFile, error))
    {
        juce::Logger::writeToLog ("[Renderer] Could not write " + outputFile.getFullPathName() + ": " + error);
        result.status = RenderResult::Status::OutputWriteFailed;
        result.errorMessage = error;
        return result;
    }

    juce::Logger::writeToLog ("[Renderer] Wrote " + outputFile.getFullPathName());
    return result;
}

RenderResult Renderer::play (const juce::String& text, const juce::File& voiceRoot, const SynthConfig& config,
                             PlaybackSink& sink, const std::atomic<bool>* cancel)
{
    auto result = render (text, voiceRoot, config, cancel);
    if (! result.wasRendered())
        return result;

    ScopedPlaybackStream stream (sink, result.audio.format);

    if (! stream.isOpen())
    {
        juce::Logger::writeToLog ("[Renderer] Output device unavailable: " + stream.getError());
        result.status = RenderResult::Status::DeviceUnavailable;
        result.errorMessage = stream.getError();
        return result;
    }

    const auto frameSize = (size_t) result.audio.format.getFrameSize();
    const auto chunkBytes = (size_t) juce::jmax (1, config.playbackChunkFrames) * frameSize;
    const auto* bytes = static_cast<const char*> (result.audio.data.getData());
    const auto total = result.audio.getNumBytes();

    for (size_t pos = 0; pos < total; pos += chunkBytes)
    {
        if (isCancelled (cancel))
        {
            juce::Logger::writeToLog ("[Renderer] Playback cancelled");
            result.status = RenderResult::Status::Cancelled;
            return result;
        }

        if (! stream.write (bytes + pos, juce::jmin (chunkBytes, total - pos)))
        {
            result.status = RenderResult::Status::DeviceUnavailable;
            result.errorMessage = "output stopped accepting audio";
            juce::Logger::writeToLog ("[Renderer] " + result.errorMessage);
            return result;
        }
    }

    return result;
}

} // namespace Phonoclip
