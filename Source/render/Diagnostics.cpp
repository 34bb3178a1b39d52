#include "Diagnostics.h"
#include <algorithm>

namespace Phonoclip
{

juce::String Diagnostic::kindName (Kind kind)
{
    switch (kind)
    {
        case Kind::MissingAsset:  return "missing";
        case Kind::CorruptClip:   return "corrupt";
        case Kind::FallbackCycle: return "cycle";
    }

    return "unknown";
}

juce::String Diagnostic::toString() const
{
    return kindName (kind) + " '" + subject + "': " + message;
}

void DiagnosticLog::add (Diagnostic::Kind kind, const juce::String& subject, const juce::String& message)
{
    entries.push_back ({ kind, subject, message });
    juce::Logger::writeToLog ("[Renderer] " + entries.back().toString());
}

int DiagnosticLog::count (Diagnostic::Kind kind) const noexcept
{
    return (int) std::count_if (entries.begin(), entries.end(),
                                [kind] (const Diagnostic& d) { return d.kind == kind; });
}

} // namespace Phonoclip
