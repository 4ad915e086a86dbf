#pragma once

#include <juce_core/juce_core.h>

namespace Narration
{

/** Application identity and version, shared by the CLI banner and the log header. */
class VersionInfo
{
public:
    static constexpr const char* APPLICATION_NAME = "narration";

    static constexpr const char* VERSION = "1.2.0";
    static constexpr int         VERSION_MAJOR = 1;
    static constexpr int         VERSION_MINOR = 2;
    static constexpr int         VERSION_PATCH = 0;

    static juce::String getVersionString() { return juce::String(VERSION); }

    static juce::String getBuildInfoString()
    {
        return juce::String(APPLICATION_NAME) + " " + VERSION + " (JUCE " + juce::SystemStats::getJUCEVersion() + ")";
    }
};

} // namespace Narration
