#pragma once

#include <juce_core/juce_core.h>
#include "../audio/AudioAssembler.h"
#include "../dialogue/DialogueTypes.h"
#include "MoodProfileResolver.h"
#include "SpeechProvider.h"
#include "VoiceProfile.h"
#include <functional>
#include <vector>

namespace Narration
{

struct RateLimitSettings
{
    double delaySeconds = 0.3;      // after every successful request
    int    maxRetries = 0;          // per chunk, 0 disables retrying
    double retryDelaySeconds = 5.0; // multiplied by the attempt number
};

/** Everything one run needs. Nothing here is shared between runs. */
struct RunSettings
{
    juce::File        outputDirectory;
    juce::String      prefix = "dialogue";
    RateLimitSettings rateLimit;
    MoodSwitches      moodSwitches;
    int               maxTextLength = 500;
    bool              streaming = false;
    bool              mergeAudio = true;
    double            silenceBetween = 0.5;
    double            segmentSilence = 0.2;
    bool              exportTrack = true;
    int               firstIndex = 1; // inclusive range of segment indices to process
    int               lastIndex = 0;  // 0 means no upper bound

    bool isInRange(int index) const { return index >= firstIndex && (lastIndex <= 0 || index <= lastIndex); }
};

struct SegmentOutcome
{
    enum class Status
    {
        Succeeded,
        Skipped, // artifact already on disk
        Failed
    };

    int          index = 0;
    Speaker      speaker = Speaker::Primary;
    Status       status = Status::Failed;
    int          attempts = 0;
    juce::String reason;
    juce::File   artifact;
};

/** One entry of the ordered list handed to downstream consumers (e.g. video rendering). */
struct TrackEntry
{
    int          index = 0;
    Speaker      speaker = Speaker::Primary;
    juce::String text;
    Mood         mood = Mood::Gentle;
    juce::File   audioFile;
    double       durationSeconds = 0.0;

    juce::var toJson() const;
};

struct RunReport
{
    int                         succeeded = 0;
    int                         skipped = 0;
    int                         failed = 0;
    std::vector<SegmentOutcome> outcomes;
    std::vector<TrackEntry>     track;
    juce::File                  mergedFile;
    juce::File                  trackFile;

    bool hasFailures() const { return failed > 0; }
    juce::String getSummary() const;
};

/**
 * Drives a batch strictly in document order, one request at a time.
 *
 * A segment's canonical wave file existing with non-zero size is the only
 * completion marker, so re-running against the same output directory resumes
 * an interrupted batch. Two runs sharing an output directory at the same time
 * are not supported: nothing locks the directory.
 */
class SynthesisOrchestrator
{
public:
    using Sleeper = std::function<void(double seconds)>;

    SynthesisOrchestrator(SpeechProvider& provider,
                          VoiceProfile primaryVoice,
                          VoiceProfile secondaryVoice,
                          RunSettings settings,
                          Sleeper sleeper = {});
    ~SynthesisOrchestrator();

    /** Runs the whole batch. Per-segment failures are reported, never thrown. */
    RunReport run(const std::vector<DialogueSegment>& segments);

    juce::File getSegmentFile(const DialogueSegment& segment) const;
    juce::File getChunkFile(const DialogueSegment& segment, int part) const;
    juce::File getCompleteFile() const;
    juce::File getConversationFile() const;

    /** Joint output of a run restricted to part of the script: <prefix>_dialogue_combined_<first>-<last>.wav */
    juce::File getConversationFile(int firstIndex, int lastIndex) const;
    juce::File getTrackFile() const;

    /** <prefix>_<index:3 digits>_<speaker>[_part<N>].wav */
    static juce::String artifactName(const juce::String& prefix, int index, Speaker speaker, int part = 0);

    /** True when the file exists with non-zero size. */
    static bool isComplete(const juce::File& artifact);

    /** Writes through a temporary sibling so a crash never leaves a partial artifact. */
    static bool writeArtifact(const juce::File& target, const juce::MemoryBlock& data, juce::String* error = nullptr);

    const RunSettings& getSettings() const { return settings; }

private:
    SpeechProvider& provider;
    VoiceProfile    primaryVoice;
    VoiceProfile    secondaryVoice;
    RunSettings     settings;
    Sleeper         sleeper;
    AudioAssembler  assembler;

    const VoiceProfile& voiceFor(Speaker speaker) const;

    SegmentOutcome processSegment(const DialogueSegment& segment);

    /** Calls the provider with linear backoff. Returns the last result; attempts is incremented per call. */
    ProviderResult requestWithRetry(const std::function<ProviderResult()>& request,
                                    const juce::String& label,
                                    int& attempts);

    void runConversation(const std::vector<DialogueSegment>& segments, bool partialRange, RunReport& report);
    void mergeRun(RunReport& report);
    void buildTrack(const std::vector<DialogueSegment>& segments, RunReport& report);
    bool exportTrack(const RunReport& report, juce::String* error);

    JUCE_DECLARE_NON_COPYABLE(SynthesisOrchestrator)
};

} // namespace Narration
