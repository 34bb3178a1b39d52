#include "CommandPhonemizer.h"

namespace Phonoclip
{

CommandPhonemizer::CommandPhonemizer (const juce::String& commandLine, int timeout)
    : timeoutMs (timeout)
{
    commandTemplate.addTokens (commandLine, " ", "\"");
    commandTemplate.removeEmptyStrings();

    for (auto& arg : commandTemplate)
        arg = arg.unquoted();
}

juce::StringArray CommandPhonemizer::buildArguments (const juce::String& word) const
{
    juce::StringArray args;
    bool substituted = false;

    for (const auto& arg : commandTemplate)
    {
        if (arg.contains (wordPlaceholder))
        {
            args.add (arg.replace (wordPlaceholder, word));
            substituted = true;
        }
        else
        {
            args.add (arg);
        }
    }

    if (! substituted)
        args.add (word);

    return args;
}

juce::StringArray CommandPhonemizer::parseOutput (const juce::String& output)
{
    auto labels = juce::StringArray::fromTokens (output, " \t\r\n", "");
    labels.removeEmptyStrings();
    return labels;
}

juce::StringArray CommandPhonemizer::phonemize (const juce::String& word)
{
    if (commandTemplate.isEmpty())
        return {};

    const auto args = buildArguments (word);
    juce::ChildProcess process;

    if (! process.start (args, juce::ChildProcess::wantStdOut))
    {
        juce::Logger::writeToLog ("[G2P] Could not start: " + args.joinIntoString (" "));
        return {};
    }

    if (! process.waitForProcessToFinish (timeoutMs))
    {
        juce::Logger::writeToLog ("[G2P] Timed out after " + juce::String (timeoutMs) + " ms for '" + word + "'");
        process.kill();
        return {};
    }

    const auto output = process.readAllProcessOutput();
    const auto exitCode = process.getExitCode();

    if (exitCode != 0)
    {
        juce::Logger::writeToLog ("[G2P] Exit code " + juce::String ((int) exitCode) + " for '" + word + "'");
        return {};
    }

    return parseOutput (output);
}

} // namespace Phonoclip
