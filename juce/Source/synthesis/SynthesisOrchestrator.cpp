#include "SynthesisOrchestrator.h"
#include "../dialogue/TextSegmenter.h"
#include <algorithm>

namespace Narration
{

namespace
{

juce::String describeSegment(const DialogueSegment& segment)
{
    return "[" + juce::String(segment.index).paddedLeft('0', 3) + " " + speakerToString(segment.speaker) + "]";
}

} // namespace

//==============================================================================
juce::var TrackEntry::toJson() const
{
    auto* obj = new juce::DynamicObject();
    obj->setProperty("index", index);
    obj->setProperty("speaker", speakerToString(speaker));
    obj->setProperty("text", text);
    obj->setProperty("mood", moodToString(mood));
    obj->setProperty("audioPath", audioFile.getFullPathName());
    obj->setProperty("duration", durationSeconds);
    return juce::var(obj);
}

juce::String RunReport::getSummary() const
{
    return juce::String(succeeded) + " synthesized, " + juce::String(skipped) + " already present, "
           + juce::String(failed) + " failed";
}

//==============================================================================
SynthesisOrchestrator::SynthesisOrchestrator(SpeechProvider& p,
                                             VoiceProfile primary,
                                             VoiceProfile secondary,
                                             RunSettings s,
                                             Sleeper sl)
    : provider(p), primaryVoice(std::move(primary)), secondaryVoice(std::move(secondary)), settings(std::move(s)),
      sleeper(std::move(sl))
{
    if (! sleeper)
        sleeper = [](double seconds) { juce::Thread::sleep(juce::roundToInt(seconds * 1000.0)); };
}

SynthesisOrchestrator::~SynthesisOrchestrator() = default;

juce::String SynthesisOrchestrator::artifactName(const juce::String& prefix, int index, Speaker speaker, int part)
{
    auto name = prefix + "_" + juce::String(index).paddedLeft('0', 3) + "_" + speakerToString(speaker);

    if (part > 0)
        name << "_part" << part;

    return name + ".wav";
}

juce::File SynthesisOrchestrator::getSegmentFile(const DialogueSegment& segment) const
{
    return settings.outputDirectory.getChildFile(artifactName(settings.prefix, segment.index, segment.speaker));
}

juce::File SynthesisOrchestrator::getChunkFile(const DialogueSegment& segment, int part) const
{
    return settings.outputDirectory.getChildFile(artifactName(settings.prefix, segment.index, segment.speaker, part));
}

juce::File SynthesisOrchestrator::getCompleteFile() const
{
    return settings.outputDirectory.getChildFile(settings.prefix + "_complete.wav");
}

juce::File SynthesisOrchestrator::getConversationFile() const
{
    return settings.outputDirectory.getChildFile(settings.prefix + "_dialogue_combined.wav");
}

juce::File SynthesisOrchestrator::getConversationFile(int firstIndex, int lastIndex) const
{
    return settings.outputDirectory.getChildFile(settings.prefix + "_dialogue_combined_"
                                                 + juce::String(firstIndex).paddedLeft('0', 3) + "-"
                                                 + juce::String(lastIndex).paddedLeft('0', 3) + ".wav");
}

juce::File SynthesisOrchestrator::getTrackFile() const
{
    return settings.outputDirectory.getChildFile(settings.prefix + "_track.json");
}

bool SynthesisOrchestrator::isComplete(const juce::File& artifact)
{
    return artifact.existsAsFile() && artifact.getSize() > 0;
}

bool SynthesisOrchestrator::writeArtifact(const juce::File& target, const juce::MemoryBlock& data, juce::String* error)
{
    juce::TemporaryFile temp(target);

    if (! temp.getFile().replaceWithData(data.getData(), data.getSize()))
    {
        if (error != nullptr)
            *error = "Failed to write " + temp.getFile().getFullPathName();
        return false;
    }

    if (! temp.overwriteTargetFileWithTemporary())
    {
        if (error != nullptr)
            *error = "Failed to move artifact into place: " + target.getFullPathName();
        return false;
    }

    return true;
}

const VoiceProfile& SynthesisOrchestrator::voiceFor(Speaker speaker) const
{
    return speaker == Speaker::Primary ? primaryVoice : secondaryVoice;
}

//==============================================================================
RunReport SynthesisOrchestrator::run(const std::vector<DialogueSegment>& segments)
{
    RunReport report;

    std::vector<DialogueSegment> selected;
    for (const auto& segment : segments)
        if (settings.isInRange(segment.index))
            selected.push_back(segment);

    // The final artifacts always cover the whole script; a range run must not produce them.
    const bool partialRange = selected.size() < segments.size();

    juce::Logger::writeToLog("[Orchestrator] " + juce::String((int) selected.size()) + " of "
                             + juce::String((int) segments.size()) + " segments selected, provider "
                             + backendKindToString(provider.getKind()) + ", output "
                             + settings.outputDirectory.getFullPathName());

    auto dirResult = settings.outputDirectory.createDirectory();
    if (dirResult.failed())
    {
        juce::Logger::writeToLog("[Orchestrator] cannot create output directory: " + dirResult.getErrorMessage());

        for (const auto& segment : selected)
        {
            SegmentOutcome outcome;
            outcome.index = segment.index;
            outcome.speaker = segment.speaker;
            outcome.reason = "Output directory unavailable: " + dirResult.getErrorMessage();
            report.outcomes.push_back(outcome);
            ++report.failed;
        }

        return report;
    }

    if (provider.supportsConversation())
    {
        runConversation(selected, partialRange, report);
        juce::Logger::writeToLog("[Orchestrator] done: " + report.getSummary());
        return report;
    }

    for (const auto& segment : selected)
    {
        auto outcome = processSegment(segment);

        switch (outcome.status)
        {
            case SegmentOutcome::Status::Succeeded: ++report.succeeded; break;
            case SegmentOutcome::Status::Skipped:   ++report.skipped; break;
            case SegmentOutcome::Status::Failed:    ++report.failed; break;
        }

        report.outcomes.push_back(outcome);
    }

    buildTrack(selected, report);

    if (partialRange)
        juce::Logger::writeToLog("[Orchestrator] range run, skipping the final merge");
    else
        mergeRun(report);

    if (settings.exportTrack && ! report.track.empty())
    {
        juce::String error;
        if (! exportTrack(report, &error))
            juce::Logger::writeToLog("[Orchestrator] track export failed: " + error);
        else
            report.trackFile = getTrackFile();
    }

    juce::Logger::writeToLog("[Orchestrator] done: " + report.getSummary());
    return report;
}

SegmentOutcome SynthesisOrchestrator::processSegment(const DialogueSegment& segment)
{
    SegmentOutcome outcome;
    outcome.index = segment.index;
    outcome.speaker = segment.speaker;

    auto tag = describeSegment(segment);
    auto target = getSegmentFile(segment);

    if (isComplete(target))
    {
        juce::Logger::writeToLog("[Orchestrator] " + tag + " already present: " + target.getFileName());
        outcome.status = SegmentOutcome::Status::Skipped;
        outcome.artifact = target;
        return outcome;
    }

    juce::Logger::writeToLog("[Orchestrator] " + tag + " (" + moodToString(segment.mood) + ") "
                             + segment.text.substring(0, 40));

    auto moodParameters = MoodProfileResolver::resolve(segment.mood, provider.getMoodCapabilities(), settings.moodSwitches);
    auto profile = MoodProfileResolver::apply(voiceFor(segment.speaker), moodParameters);

    auto chunks = TextSegmenter::segment(segment.text, settings.maxTextLength);
    if (chunks.isEmpty())
    {
        outcome.reason = "No text to synthesize";
        return outcome;
    }

    const bool multiPart = chunks.size() > 1;
    if (multiPart)
        juce::Logger::writeToLog("[Orchestrator] " + tag + " split into " + juce::String(chunks.size()) + " chunks");

    juce::Array<juce::File> parts;

    for (int i = 0; i < chunks.size(); ++i)
    {
        auto chunkFile = multiPart ? getChunkFile(segment, i + 1) : target;
        auto label = tag + (multiPart ? " part " + juce::String(i + 1) : juce::String());

        if (multiPart && isComplete(chunkFile))
        {
            DBG("[Orchestrator] reusing " + chunkFile.getFileName());
            parts.add(chunkFile);
            continue;
        }

        const auto& chunk = chunks[i];
        auto result = requestWithRetry(
            [&]
            {
                return settings.streaming ? provider.synthesizeStreaming(chunk, profile)
                                          : provider.synthesize(chunk, profile);
            },
            label,
            outcome.attempts);

        if (! result.ok)
        {
            outcome.reason = result.reason;
            juce::Logger::writeToLog("[Orchestrator] " + label + " FAILED after " + juce::String(outcome.attempts)
                                     + " attempt(s): " + result.reason);
            return outcome;
        }

        juce::String writeError;
        if (! writeArtifact(chunkFile, result.audio, &writeError))
        {
            outcome.reason = writeError;
            juce::Logger::writeToLog("[Orchestrator] " + label + " FAILED: " + writeError);
            return outcome;
        }

        parts.add(chunkFile);
        sleeper(settings.rateLimit.delaySeconds);
    }

    if (multiPart)
    {
        juce::String mergeError;
        if (! assembler.merge(parts, target, settings.segmentSilence, &mergeError))
        {
            outcome.reason = "Chunk merge failed: " + mergeError;
            juce::Logger::writeToLog("[Orchestrator] " + tag + " FAILED: " + outcome.reason);
            return outcome;
        }

        for (const auto& part : parts)
            part.deleteFile();
    }

    juce::Logger::writeToLog("[Orchestrator] " + tag + " written: " + target.getFileName());
    outcome.status = SegmentOutcome::Status::Succeeded;
    outcome.artifact = target;
    return outcome;
}

ProviderResult SynthesisOrchestrator::requestWithRetry(const std::function<ProviderResult()>& request,
                                                       const juce::String& label,
                                                       int& attempts)
{
    const auto maxRetries = juce::jmax(0, settings.rateLimit.maxRetries);
    ProviderResult result;

    for (int retry = 0; retry <= maxRetries; ++retry)
    {
        if (retry > 0)
        {
            auto wait = settings.rateLimit.retryDelaySeconds * retry;
            juce::Logger::writeToLog("[Orchestrator] " + label + " retrying in " + juce::String(wait, 1) + " s");
            sleeper(wait);
        }

        ++attempts;
        result = request();

        if (result.ok)
            return result;

        juce::Logger::writeToLog("[Orchestrator] " + label + " attempt " + juce::String(attempts) + " failed: "
                                 + result.reason + (result.rateLimited ? " (rate limited)" : ""));
    }

    return result;
}

void SynthesisOrchestrator::runConversation(const std::vector<DialogueSegment>& segments,
                                            bool partialRange,
                                            RunReport& report)
{
    if (segments.empty())
        return;

    auto target = partialRange ? getConversationFile(segments.front().index, segments.back().index)
                               : getConversationFile();
    auto status = SegmentOutcome::Status::Skipped;
    juce::String reason;
    int attempts = 0;

    if (isComplete(target))
    {
        juce::Logger::writeToLog("[Orchestrator] conversation already present: " + target.getFileName());
    }
    else
    {
        std::vector<ConversationLine> lines;
        for (const auto& segment : segments)
            lines.push_back({ segment.speaker, segment.text });

        auto result = requestWithRetry([&] { return provider.synthesizeConversation(lines, primaryVoice, secondaryVoice); },
                                       "[conversation]",
                                       attempts);

        status = SegmentOutcome::Status::Succeeded;

        if (! result.ok)
        {
            status = SegmentOutcome::Status::Failed;
            reason = result.reason;
        }
        else if (! writeArtifact(target, result.audio, &reason))
        {
            status = SegmentOutcome::Status::Failed;
        }

        if (status == SegmentOutcome::Status::Failed)
            juce::Logger::writeToLog("[Orchestrator] conversation FAILED after " + juce::String(attempts)
                                     + " attempt(s): " + reason);
    }

    for (const auto& segment : segments)
    {
        SegmentOutcome outcome;
        outcome.index = segment.index;
        outcome.speaker = segment.speaker;
        outcome.status = status;
        outcome.attempts = attempts;
        outcome.reason = reason;

        switch (status)
        {
            case SegmentOutcome::Status::Succeeded: ++report.succeeded; outcome.artifact = target; break;
            case SegmentOutcome::Status::Skipped:   ++report.skipped;   outcome.artifact = target; break;
            case SegmentOutcome::Status::Failed:    ++report.failed; break;
        }

        report.outcomes.push_back(outcome);
    }

    if (status != SegmentOutcome::Status::Failed)
        report.mergedFile = target;
}

void SynthesisOrchestrator::mergeRun(RunReport& report)
{
    juce::Array<juce::File> artifacts;

    for (const auto& outcome : report.outcomes)
        if (outcome.status != SegmentOutcome::Status::Failed)
            artifacts.add(outcome.artifact);

    if (! settings.mergeAudio || artifacts.size() <= 1)
        return;

    auto complete = getCompleteFile();

    if (isComplete(complete))
    {
        juce::Logger::writeToLog("[Orchestrator] merged file already present: " + complete.getFileName());
        report.mergedFile = complete;
        return;
    }

    juce::String error;
    if (assembler.merge(artifacts, complete, settings.silenceBetween, &error))
        report.mergedFile = complete;
    else
        juce::Logger::writeToLog("[Orchestrator] final merge failed: " + error);
}

void SynthesisOrchestrator::buildTrack(const std::vector<DialogueSegment>& segments, RunReport& report)
{
    for (const auto& outcome : report.outcomes)
    {
        if (outcome.status == SegmentOutcome::Status::Failed)
            continue;

        auto segment = std::find_if(segments.begin(), segments.end(),
                                    [&](const DialogueSegment& s) { return s.index == outcome.index; });
        if (segment == segments.end())
            continue;

        TrackEntry entry;
        entry.index = segment->index;
        entry.speaker = segment->speaker;
        entry.text = segment->text;
        entry.mood = segment->mood;
        entry.audioFile = outcome.artifact;

        if (auto duration = assembler.probeDurationSeconds(outcome.artifact))
            entry.durationSeconds = *duration;
        else
            juce::Logger::writeToLog("[Orchestrator] cannot probe duration of " + outcome.artifact.getFileName());

        report.track.push_back(entry);
    }
}

bool SynthesisOrchestrator::exportTrack(const RunReport& report, juce::String* error)
{
    juce::Array<juce::var> entries;
    for (const auto& entry : report.track)
        entries.add(entry.toJson());

    auto json = juce::JSON::toString(juce::var(entries));
    return writeArtifact(getTrackFile(), juce::MemoryBlock(json.toRawUTF8(), json.getNumBytesAsUTF8()), error);
}

} // namespace Narration
