#include "CommandLine.h"
#include "../render/SynthConfig.h"

namespace Phonoclip
{

juce::String CommandLineOptions::getEffectivePresetName() const
{
    if (presetName.isNotEmpty())
        return presetName;

    return command == Command::Speak ? "live" : "file";
}

bool CommandLineOptions::parse (const juce::StringArray& args, CommandLineOptions& result, juce::String& error)
{
    result = {};

    if (args.isEmpty())
    {
        error = "no command given";
        return false;
    }

    const auto verb = args[0].toLowerCase();

    if (verb == "help" || verb == "--help" || verb == "-h")
    {
        result.command = Command::Help;
        return true;
    }

    if (verb == "version" || verb == "--version")
    {
        result.command = Command::Version;
        return true;
    }

    if (verb == "render")      result.command = Command::Render;
    else if (verb == "speak")  result.command = Command::Speak;
    else
    {
        error = "unknown command '" + args[0] + "'";
        return false;
    }

    juce::StringArray positionals;

    for (int i = 1; i < args.size(); ++i)
    {
        const auto& arg = args[i];

        if (! arg.startsWith ("--"))
        {
            positionals.add (arg);
            continue;
        }

        if (i + 1 >= args.size())
        {
            error = "option " + arg + " needs a value";
            return false;
        }

        const auto value = args[++i];

        if (arg == "--dict")          result.dictPath = value;
        else if (arg == "--g2p")      result.g2pCommand = value;
        else if (arg == "--preset")   result.presetName = value.toLowerCase();
        else if (arg == "--config")   result.configPath = value;
        else if (arg == "--log-dir")  result.logDir = value;
        else if (arg == "--seed")
        {
            if (! value.trim().containsOnly ("-0123456789") || value.trim().isEmpty())
            {
                error = "--seed expects an integer, got '" + value + "'";
                return false;
            }

            result.hasSeed = true;
            result.seed = value.getLargeIntValue();
        }
        else
        {
            error = "unknown option " + arg;
            return false;
        }
    }

    const int expected = result.command == Command::Render ? 3 : 2;
    if (positionals.size() != expected)
    {
        error = "expected " + juce::String (expected) + " arguments after '" + verb + "', got " + juce::String (positionals.size());
        return false;
    }

    result.voiceDir = positionals[0];
    result.text = positionals[1];

    if (result.command == Command::Render)
        result.outputPath = positionals[2];

    if (result.dictPath.isEmpty() == result.g2pCommand.isEmpty())
    {
        error = "give exactly one of --dict or --g2p";
        return false;
    }

    if (result.presetName.isNotEmpty() && ! SynthConfig::getPresetNames().contains (result.presetName))
    {
        error = "unknown preset '" + result.presetName + "' (expected "
              + SynthConfig::getPresetNames().joinIntoString ("|") + ")";
        return false;
    }

    return true;
}

juce::String CommandLineOptions::getUsage()
{
    return "Usage:\n"
           "  phonoclip render <voiceDir> <text> <output.wav> [options]\n"
           "  phonoclip speak  <voiceDir> <text> [options]\n"
           "\n"
           "Options:\n"
           "  --dict <file>       CMU-format pronouncing dictionary\n"
           "  --g2p \"<command>\"   external phonemizer; {word} is replaced by the word\n"
           "  --preset <name>     file | live | plain\n"
           "  --config <file>     JSON overrides for the preset\n"
           "  --seed <n>          fixed seed for variant choice\n"
           "  --log-dir <dir>     where to write the log file\n";
}

int exitCodeFor (RenderResult::Status status) noexcept
{
    switch (status)
    {
        case RenderResult::Status::Rendered:          return exitOk;
        case RenderResult::Status::NothingToRender:   return exitNothingToRender;
        case RenderResult::Status::OutputWriteFailed: return exitWriteFailed;
        case RenderResult::Status::DeviceUnavailable: return exitDeviceUnavailable;
        case RenderResult::Status::Cancelled:         return exitDeviceUnavailable;
    }

    return exitUsageError;
}

} // namespace Phonoclip
