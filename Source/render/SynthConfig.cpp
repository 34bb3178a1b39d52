#include "SynthConfig.h"
#include <nlohmann/json.hpp>

namespace Phonoclip
{

SynthConfig SynthConfig::forFileRender()
{
    SynthConfig config;
    config.pauses = { 0.5, 0.25, 0.01 };
    return config;
}

SynthConfig SynthConfig::forLivePlayback()
{
    SynthConfig config;
    config.pauses = { 0.3, 0.25, 0.01 };
    return config;
}

SynthConfig SynthConfig::plainConcatenation()
{
    SynthConfig config = forFileRender();
    config.randomVariants = false;
    config.useFallbackTable = false;
    config.reducedVowelTrim = false;
    config.finalVowelSubstitution = false;
    config.crossfadeEnabled = false;
    return config;
}

bool SynthConfig::fromPresetName (const juce::String& name, SynthConfig& result)
{
    const auto key = name.trim().toLowerCase();

    if (key == "file")       { result = forFileRender();      return true; }
    if (key == "live")       { result = forLivePlayback();    return true; }
    if (key == "plain")      { result = plainConcatenation(); return true; }

    return false;
}

namespace
{
    template <typename T>
    bool readField (const nlohmann::json& obj, const char* key, T& dest, juce::String& error)
    {
        const auto it = obj.find (key);
        if (it == obj.end())
            return true;

        try
        {
            dest = it->template get<T>();
            return true;
        }
        catch (const nlohmann::json::exception&)
        {
            error = "'" + juce::String (key) + "' has the wrong type";
            return false;
        }
    }

    bool readString (const nlohmann::json& obj, const char* key, juce::String& dest, juce::String& error)
    {
        std::string value = dest.toStdString();
        if (! readField (obj, key, value, error))
            return false;

        dest = juce::String (value).trim().toUpperCase();
        return true;
    }
}

bool SynthConfig::applyJson (const juce::String& jsonText, juce::String& error)
{
    nlohmann::json json;

    try
    {
        json = nlohmann::json::parse (jsonText.toStdString());
    }
    catch (const nlohmann::json::parse_error& e)
    {
        error = "invalid JSON: " + juce::String (e.what());
        return false;
    }

    if (! json.is_object())
    {
        error = "configuration must be a JSON object";
        return false;
    }

    SynthConfig updated = *this;

    bool ok = readField (json, "wordFirstLookup", updated.wordFirstLookup, error)
           && readField (json, "randomVariants", updated.randomVariants, error)
           && readField (json, "useFallbackTable", updated.useFallbackTable, error)
           && readField (json, "reducedVowelTrim", updated.reducedVowelTrim, error)
           && readString (json, "reducedVowelNeighbour", updated.reducedVowelNeighbour, error)
           && readField (json, "finalVowelSubstitution", updated.finalVowelSubstitution, error)
           && readString (json, "clearVowel", updated.clearVowel, error)
           && readField (json, "crossfadeEnabled", updated.crossfadeEnabled, error)
           && readField (json, "fadeDurationSeconds", updated.fadeDurationSeconds, error)
           && readField (json, "playbackChunkFrames", updated.playbackChunkFrames, error);

    if (ok)
    {
        const auto pauses = json.find ("pauses");
        if (pauses != json.end())
        {
            if (! pauses->is_object())
            {
                error = "'pauses' must be an object";
                return false;
            }

            ok = readField (*pauses, "terminal", updated.pauses.terminal, error)
              && readField (*pauses, "comma", updated.pauses.comma, error)
              && readField (*pauses, "interWord", updated.pauses.interWord, error);
        }
    }

    if (! ok)
        return false;

    const auto table = json.find ("fallbackTable");
    if (table != json.end())
    {
        juce::String tableError;
        if (! FallbackTable::parseJson (juce::String (table->dump()), updated.fallbackTable, tableError))
        {
            error = "fallbackTable: " + tableError;
            return false;
        }
    }

    auto inRange = [] (double seconds) { return seconds >= 0.0 && seconds <= maxDurationSeconds; };

    if (! (inRange (updated.fadeDurationSeconds) && inRange (updated.pauses.terminal)
           && inRange (updated.pauses.comma) && inRange (updated.pauses.interWord)))
    {
        error = "durations must be between 0 and " + juce::String (maxDurationSeconds) + " seconds";
        return false;
    }

    if (updated.playbackChunkFrames <= 0)
    {
        error = "playbackChunkFrames must be positive";
        return false;
    }

    *this = std::move (updated);
    return true;
}

bool SynthConfig::applyJsonFile (const juce::File& file, juce::String& error)
{
    if (! file.existsAsFile())
    {
        error = "configuration file not found: " + file.getFullPathName();
        return false;
    }

    return applyJson (file.loadFileAsString(), error);
}

juce::String SynthConfig::describe() const
{
    juce::String s;
    s << "wordFirst=" << (wordFirstLookup ? "on" : "off")
      << " variants=" << (randomVariants ? "random" : "first")
      << " fallback=" << (useFallbackTable ? juce::String (fallbackTable.size()) + " entries" : juce::String ("off"))
      << " crossfade=" << (crossfadeEnabled ? juce::String (fadeDurationSeconds * 1000.0) + "ms" : juce::String ("off"))
      << " pauses=" << pauses.terminal << "/" << pauses.comma << "/" << pauses.interWord << "s";
    return s;
}

} // namespace Phonoclip
