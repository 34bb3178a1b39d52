#pragma once

#include "Phonemizer.h"

namespace Phonoclip
{

/**
 * Phonemizer that delegates to an external G2P program.
 *
 * The command line is split into arguments (double quotes group); an
 * argument containing "{word}" has it replaced by the word, otherwise the
 * word is appended as the last argument. The program's standard output is
 * split on whitespace into labels. No shell is involved.
 */
class CommandPhonemizer : public Phonemizer
{
public:
    explicit CommandPhonemizer (const juce::String& commandLine, int timeoutMs = 10000);

    juce::StringArray phonemize (const juce::String& word) override;

    /** The argument list that would be run for a word. */
    juce::StringArray buildArguments (const juce::String& word) const;

    /** Splits program output into labels. */
    static juce::StringArray parseOutput (const juce::String& output);

    static constexpr const char* wordPlaceholder = "{word}";

private:
    juce::StringArray commandTemplate;
    int timeoutMs;
};

} // namespace Phonoclip
