#include "PhonemeResolver.h"
#include "../audio/AudioNormalizer.h"

namespace Phonoclip
{

PhonemeResolver::PhonemeResolver (const ClipLibrary& lib, Phonemizer& g2p, const ClipReader& clipReader,
                                  const SynthConfig& cfg, DiagnosticLog& log)
    : library (lib), phonemizer (g2p), reader (clipReader), config (cfg), diagnostics (log)
{
}

std::vector<AudioSegment> PhonemeResolver::resolveWordToSegments (const juce::File& voiceRoot, const juce::String& word)
{
    std::vector<AudioSegment> segments;

    if (config.wordFirstLookup)
    {
        if (auto wordFile = library.resolveWord (voiceRoot, word))
        {
            // A recorded word that cannot be read is skipped, not phonemized.
            if (auto pcm = loadClip (*wordFile, word.toUpperCase()))
                segments.push_back (AudioSegment::makeWord (std::move (*pcm), word.toUpperCase()));

            return segments;
        }
    }

    const auto labels = getPhonemeLabels (word);
    DBG ("[PhonemeResolver] " << word << " -> " << labels.joinIntoString (" "));

    if (labels.isEmpty())
    {
        diagnostics.add (Diagnostic::Kind::MissingAsset, word, "no word clip and no phonemes");
        return segments;
    }

    for (const auto& label : labels)
    {
        if (auto pcm = resolveOnePhoneme (voiceRoot, label))
            segments.push_back (AudioSegment::makePhoneme (std::move (*pcm), label, isVowel (label)));
    }

    return segments;
}

juce::StringArray PhonemeResolver::getPhonemeLabels (const juce::String& word)
{
    auto labels = cleanLabels (phonemizer.phonemize (word));

    if (config.finalVowelSubstitution && ! labels.isEmpty())
    {
        const auto& last = labels[labels.size() - 1];
        if (last == "AH" || last == "AE" || last == reducedVowelLabel)
            labels.set (labels.size() - 1, config.clearVowel);
    }

    return labels;
}

std::optional<PcmBuffer> PhonemeResolver::resolveOnePhoneme (const juce::File& voiceRoot, const juce::String& label)
{
    juce::StringArray activeLabels;
    return resolveOnePhoneme (voiceRoot, label, activeLabels);
}

std::optional<PcmBuffer> PhonemeResolver::resolveOnePhoneme (const juce::File& voiceRoot, const juce::String& label,
                                                             juce::StringArray& activeLabels)
{
    if (activeLabels.contains (label))
    {
        diagnostics.add (Diagnostic::Kind::FallbackCycle, label,
                         "substitution loops back through " + activeLabels.joinIntoString (" -> ") + " -> " + label);
        return std::nullopt;
    }

    activeLabels.add (label);
    std::optional<PcmBuffer> result;

    if (config.reducedVowelTrim && label == reducedVowelLabel)
    {
        result = resolveReducedVowel (voiceRoot, activeLabels);
    }
    else if (auto file = library.resolvePhoneme (voiceRoot, label))
    {
        result = loadClip (*file, label);
    }
    else if (const auto* substitutes = config.useFallbackTable ? config.fallbackTable.getSubstitutes (label) : nullptr)
    {
        result = resolveThroughFallback (voiceRoot, label, *substitutes, activeLabels);
    }
    else
    {
        diagnostics.add (Diagnostic::Kind::MissingAsset, label, "no clip in " + voiceRoot.getFullPathName());
    }

    activeLabels.removeString (label);
    return result;
}

std::optional<PcmBuffer> PhonemeResolver::resolveReducedVowel (const juce::File& voiceRoot, juce::StringArray& activeLabels)
{
    auto pcm = resolveOnePhoneme (voiceRoot, config.reducedVowelNeighbour, activeLabels);
    if (! pcm)
        return std::nullopt;

    // Shave a frame off each end so the reduced vowel is a touch shorter.
    if (pcm->getNumFrames() > 2)
    {
        const auto frameBytes = (size_t) pcm->format.getFrameSize();
        pcm->removeFromStart (frameBytes);
        pcm->removeFromEnd (frameBytes);
    }

    return pcm;
}

std::optional<PcmBuffer> PhonemeResolver::resolveThroughFallback (const juce::File& voiceRoot, const juce::String& label,
                                                                  const juce::StringArray& substitutes,
                                                                  juce::StringArray& activeLabels)
{
    std::optional<PcmBuffer> joined;

    for (const auto& substitute : substitutes)
    {
        auto part = resolveOnePhoneme (voiceRoot, substitute, activeLabels);
        if (! part)
            continue;

        if (! joined)
            joined = std::move (part);
        else
            joined->append (*part);
    }

    if (joined)
        DBG ("[PhonemeResolver] " << label << " substituted by " << substitutes.joinIntoString (" "));
    else
        diagnostics.add (Diagnostic::Kind::MissingAsset, label,
                         "no substitute could be resolved (" + substitutes.joinIntoString (" ") + ")");

    return joined;
}

std::optional<PcmBuffer> PhonemeResolver::loadClip (const juce::File& file, const juce::String& subject)
{
    juce::String error;
    auto pcm = reader.read (file, error);

    if (! pcm)
    {
        diagnostics.add (Diagnostic::Kind::CorruptClip, subject, file.getFileName() + ": " + error);
        return std::nullopt;
    }

    auto normalized = AudioNormalizer::normalize (*pcm, PcmFormat::target());

    if (normalized.isEmpty())
    {
        diagnostics.add (Diagnostic::Kind::CorruptClip, subject, file.getFileName() + ": contains no audio at the output rate");
        return std::nullopt;
    }

    return normalized;
}

juce::StringArray PhonemeResolver::cleanLabels (const juce::StringArray& raw)
{
    juce::StringArray labels;

    for (const auto& token : raw)
    {
        const auto text = token.trim();
        const auto letters = text.initialSectionContainingOnly ("ABCDEFGHIJKLMNOPQRSTUVWXYZ");

        if (letters.isEmpty())
            continue;

        if (! text.substring (letters.length()).containsOnly ("0123456789"))
            continue;

        labels.add (text == reducedVowelLabel ? text : letters);
    }

    return labels;
}

bool PhonemeResolver::isVowel (const juce::String& label) noexcept
{
    static const char* const vowels[] = { "AA", "AE", "AH", "AO", "AW", "AY", "EH", "ER",
                                          "EY", "IH", "IY", "OW", "OY", "UH", "UW" };

    for (auto* v : vowels)
        if (label == v)
            return true;

    return false;
}

} // namespace Phonoclip
