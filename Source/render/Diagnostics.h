#pragma once

#include <juce_core/juce_core.h>
#include <vector>

namespace Phonoclip
{

/**
 * A recoverable problem met while resolving a render. The unit it names was
 * left out and rendering carried on.
 */
struct Diagnostic
{
    enum class Kind
    {
        MissingAsset,  // no recording and no usable substitute
        CorruptClip,   // a recording exists but could not be decoded
        FallbackCycle  // the fallback table led back to a label being expanded
    };

    Kind kind { Kind::MissingAsset };
    juce::String subject;
    juce::String message;

    juce::String toString() const;

    static juce::String kindName (Kind kind);
};

/**
 * Per-render list of diagnostics. Every entry is also written to the log.
 */
class DiagnosticLog
{
public:
    void add (Diagnostic::Kind kind, const juce::String& subject, const juce::String& message);

    const std::vector<Diagnostic>& getEntries() const noexcept { return entries; }
    int count (Diagnostic::Kind kind) const noexcept;
    bool isEmpty() const noexcept { return entries.empty(); }

private:
    std::vector<Diagnostic> entries;
};

} // namespace Phonoclip
