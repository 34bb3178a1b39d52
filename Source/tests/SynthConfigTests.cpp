#include "../render/SynthConfig.h"

using namespace Phonoclip;

class SynthConfigTests : public juce::UnitTest
{
public:
    SynthConfigTests() : UnitTest ("SynthConfig", "Phonoclip") {}

    void runTest() override
    {
        beginTest ("File and live presets differ only in the sentence pause");
        {
            const auto file = SynthConfig::forFileRender();
            const auto live = SynthConfig::forLivePlayback();

            expectEquals (file.pauses.terminal, 0.5);
            expectEquals (live.pauses.terminal, 0.3);
            expectEquals (file.pauses.comma, live.pauses.comma);
            expectEquals (file.pauses.interWord, 0.01);
            expect (file.crossfadeEnabled && live.crossfadeEnabled);
            expect (file.randomVariants && live.randomVariants);
            expectEquals (file.fadeDurationSeconds, 0.05);
            expectEquals (file.playbackChunkFrames, 1024);
            expectEquals (file.reducedVowelNeighbour, juce::String ("EH"));
            expectEquals (file.clearVowel, juce::String ("AA"));
            expect (file.fallbackTable == FallbackTable::createDefault());
        }

        beginTest ("Plain preset turns every enhancement off");
        {
            const auto plain = SynthConfig::plainConcatenation();
            expect (! plain.randomVariants);
            expect (! plain.useFallbackTable);
            expect (! plain.reducedVowelTrim);
            expect (! plain.finalVowelSubstitution);
            expect (! plain.crossfadeEnabled);
            expect (plain.wordFirstLookup);
            expectEquals (plain.pauses.terminal, 0.5);
        }

        beginTest ("Presets by name");
        {
            SynthConfig config;
            expect (SynthConfig::fromPresetName ("live", config));
            expectEquals (config.pauses.terminal, 0.3);
            expect (SynthConfig::fromPresetName (" Plain ", config));
            expect (! config.crossfadeEnabled);
            expect (! SynthConfig::fromPresetName ("loud", config));
        }

        beginTest ("JSON overrides a subset of fields");
        {
            auto config = SynthConfig::forFileRender();
            juce::String error;
            expect (config.applyJson (R"({
                "crossfadeEnabled": false,
                "fadeDurationSeconds": 0.02,
                "pauses": { "comma": 0.4 },
                "clearVowel": "ah",
                "somethingElse": 12
            })", error), error);

            expect (! config.crossfadeEnabled);
            expectEquals (config.fadeDurationSeconds, 0.02);
            expectEquals (config.pauses.comma, 0.4);
            expectEquals (config.pauses.terminal, 0.5);
            expectEquals (config.clearVowel, juce::String ("AH"));
            expect (config.randomVariants);
        }

        beginTest ("JSON fallback table replaces the configured one");
        {
            auto config = SynthConfig::forFileRender();
            juce::String error;
            expect (config.applyJson (R"({"fallbackTable": {"NG": ["N", "G"]}})", error), error);
            expectEquals (config.fallbackTable.size(), 1);
            expectEquals (config.fallbackTable.getSubstitutes ("NG")->joinIntoString (" "), juce::String ("N G"));
        }

        beginTest ("Bad JSON leaves the configuration untouched");
        {
            auto config = SynthConfig::forLivePlayback();
            juce::String error;

            expect (! config.applyJson ("{ not json", error));
            expect (error.isNotEmpty());

            expect (! config.applyJson (R"({"crossfadeEnabled": false, "pauses": {"terminal": "long"}})", error));
            expect (config.crossfadeEnabled);
            expectEquals (config.pauses.terminal, 0.3);

            expect (! config.applyJson (R"({"fadeDurationSeconds": -1})", error));
            expect (! config.applyJson (R"({"fadeDurationSeconds": 61})", error));
            expect (! config.applyJson (R"({"pauses": {"terminal": 1e300}})", error));
            expect (! config.applyJson (R"({"pauses": {"comma": 1e6}})", error));
            expectEquals (config.pauses.terminal, 0.3);

            auto longest = SynthConfig::forFileRender();
            expect (longest.applyJson (R"({"pauses": {"interWord": 60}})", error));
            expectEquals (longest.pauses.interWord, 60.0);

            expect (! config.applyJson (R"({"playbackChunkFrames": 0})", error));
            expect (! config.applyJson ("[1, 2]", error));
            expectEquals (config.fadeDurationSeconds, 0.05);
        }

        beginTest ("Missing configuration file");
        {
            SynthConfig config;
            juce::String error;
            expect (! config.applyJsonFile (juce::File::getSpecialLocation (juce::File::tempDirectory)
                                                .getNonexistentChildFile ("noconfig", ".json"), error));
            expect (error.isNotEmpty());
        }
    }
};

static SynthConfigTests synthConfigTests;
