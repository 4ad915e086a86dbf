#pragma once

#include <juce_core/juce_core.h>
#include "../dialogue/DialogueParser.h"
#include "../synthesis/SpeechProvider.h"
#include "../synthesis/SynthesisOrchestrator.h"
#include "../synthesis/VoiceProfile.h"

namespace Narration
{

struct OutputSettings
{
    juce::File   outputDirectory = juce::File::getCurrentWorkingDirectory().getChildFile("tts_output");
    juce::String prefix = "dialogue";
    bool         mergeAudio = true;
    double       silenceBetween = 0.5;
    double       segmentSilence = 0.2;
    bool         useTimestampSubdir = false;
    bool         exportTrack = true;
};

/**
 * Typed view of the JSON configuration file. Loading validates everything that
 * would otherwise fail mid-run and throws ConfigurationError.
 */
struct NarrationConfig
{
    ProviderSettings         provider;
    VoiceProfile             primaryVoice;
    VoiceProfile             secondaryVoice;
    RateLimitSettings        rateLimit;
    MoodSwitches             moodSwitches;
    DialogueParser::Settings parser;
    int                      maxTextLength = 500;
    OutputSettings           output;
    bool                     streaming = false;

    static constexpr const char* apiKeyEnvironmentVariable = "NARRATION_API_KEY";

    /**
     * relativeTo anchors relative output paths. fallbackApiKey is used when the
     * file leaves api_key empty.
     */
    static NarrationConfig fromJson(const juce::var& json,
                                    const juce::File& relativeTo,
                                    const juce::String& fallbackApiKey = {});

    /** Reads and parses the file; the API key falls back to NARRATION_API_KEY. */
    static NarrationConfig loadFromFile(const juce::File& file);

    /** Run settings for a run started at the given time (used for the timestamp subdirectory). */
    RunSettings makeRunSettings(juce::Time startTime = juce::Time::getCurrentTime()) const;
};

} // namespace Narration
