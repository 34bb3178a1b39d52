#pragma once

#include "../render/RenderResult.h"

namespace Phonoclip
{

/** Process exit codes of the phonoclip tool. */
enum ExitCode
{
    exitOk = 0,
    exitUsageError = 1,
    exitNothingToRender = 2,
    exitWriteFailed = 3,
    exitDeviceUnavailable = 4
};

/**
 * Parsed phonoclip command line.
 *
 *   phonoclip render <voiceDir> <text> <output.wav> [options]
 *   phonoclip speak  <voiceDir> <text> [options]
 */
struct CommandLineOptions
{
    enum class Command
    {
        None,
        Render,
        Speak,
        Help,
        Version
    };

    Command command { Command::None };

    juce::String voiceDir;
    juce::String text;
    juce::String outputPath;

    juce::String dictPath;
    juce::String g2pCommand;
    juce::String presetName;   // empty: "file" for render, "live" for speak
    juce::String configPath;
    juce::String logDir;

    bool hasSeed { false };
    juce::int64 seed { 0 };

    juce::String getEffectivePresetName() const;

    /** Returns false and fills error on unknown options, missing values or missing positionals. */
    static bool parse (const juce::StringArray& args, CommandLineOptions& result, juce::String& error);

    static juce::String getUsage();
};

int exitCodeFor (RenderResult::Status status) noexcept;

} // namespace Phonoclip
