#pragma once

#include <juce_core/juce_core.h>

namespace Phonoclip
{

/**
 * Centralized version information for Phonoclip
 *
 * Single source of truth for the name and version printed by the CLI
 * and written into the log header.
 */
class VersionInfo
{
public:
    static constexpr const char* APPLICATION_NAME = "Phonoclip";

    static constexpr const char* VERSION = "0.3";
    static constexpr const char* VERSION_FULL = "0.3.0";
    static constexpr int         VERSION_MAJOR = 0;
    static constexpr int         VERSION_MINOR = 3;
    static constexpr int         VERSION_PATCH = 0;

    static juce::String getVersionString() { return juce::String(VERSION); }
    static juce::String getFullVersionString() { return juce::String(VERSION_FULL); }
    static juce::String getApplicationName() { return juce::String(APPLICATION_NAME); }

    static juce::String getBuildInfoString()
    {
        return juce::String(APPLICATION_NAME) + " " + VERSION_FULL;
    }
};

} // namespace Phonoclip
