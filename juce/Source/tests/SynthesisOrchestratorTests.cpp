#include <juce_core/juce_core.h>
#include "../dialogue/TextSegmenter.h"
#include "../synthesis/SiliconFlowSpeechProvider.h"
#include "../synthesis/SynthesisOrchestrator.h"
#include "TestHelpers.h"

using namespace Narration;
using namespace NarrationTests;

namespace
{

DialogueSegment makeSegment(int index, Speaker speaker, const juce::String& text, Mood mood = Mood::Gentle)
{
    DialogueSegment segment;
    segment.index = index;
    segment.speaker = speaker;
    segment.text = text;
    segment.mood = mood;
    return segment;
}

/** One provider, one stub transport and one scratch output directory per test. */
struct OrchestratorFixture
{
    explicit OrchestratorFixture(const juce::String& model = "IndexTeam/IndexTTS-2")
    {
        ProviderSettings providerSettings;
        providerSettings.kind = BackendKind::SiliconFlow;
        providerSettings.apiKey = "sk-test";
        providerSettings.model = model;
        provider = std::make_unique<SiliconFlowSpeechProvider>(providerSettings, transport);

        settings.outputDirectory = temp.get().getChildFile("out");
        primary.voice = "alex";
        secondary.voice = "anna";
    }

    RunReport run(const std::vector<DialogueSegment>& segments)
    {
        SynthesisOrchestrator orchestrator(*provider, primary, secondary, settings,
                                           [this](double seconds) { sleeps.push_back(seconds); });
        return orchestrator.run(segments);
    }

    juce::File file(const juce::String& name) const { return settings.outputDirectory.getChildFile(name); }

    void answerWithWav(int numSamples)
    {
        auto wav = makeWav(16000.0, 1, 16, numSamples);
        transport.handler = [wav](const StubTransport::Request&) { return makeResponse(200, wav); };
    }

    void queueWav(int numSamples) { transport.queued.push_back(makeResponse(200, makeWav(16000.0, 1, 16, numSamples))); }
    void queueError(int status) { transport.queued.push_back(makeResponse(status, R"({"message":"busy"})")); }

    ScopedTempDirectory                         temp;
    StubTransport                               transport;
    std::unique_ptr<SiliconFlowSpeechProvider>  provider;
    VoiceProfile                                primary, secondary;
    RunSettings                                 settings;
    std::vector<double>                         sleeps;
};

} // namespace

class SynthesisOrchestratorTests : public juce::UnitTest
{
public:
    SynthesisOrchestratorTests() : UnitTest("Synthesis Orchestrator", "Synthesis") {}

    void runTest() override
    {
        runTestArtifactNames();
        runTestSingleSegment();
        runTestMergeAndTrack();
        runTestResume();
        runTestRetryBackoff();
        runTestFailureContinues();
        runTestChunking();
        runTestChunkResume();
        runTestRangeFilter();
        runTestStreaming();
        runTestConversation();
        runTestUnwritableOutput();
    }

private:
    void runTestArtifactNames()
    {
        beginTest("Artifact naming");

        expectEquals(SynthesisOrchestrator::artifactName("dialogue", 7, Speaker::Primary),
                     juce::String("dialogue_007_primary.wav"));
        expectEquals(SynthesisOrchestrator::artifactName("ep1", 12, Speaker::Secondary, 2),
                     juce::String("ep1_012_secondary_part2.wav"));
        expectEquals(SynthesisOrchestrator::artifactName("x", 1234, Speaker::Primary), juce::String("x_1234_primary.wav"));

        RunSettings range;
        range.firstIndex = 3;
        expect(! range.isInRange(2));
        expect(range.isInRange(500));
        range.lastIndex = 4;
        expect(range.isInRange(4));
        expect(! range.isInRange(5));
    }

    void runTestSingleSegment()
    {
        beginTest("A single segment is written under its canonical name without a merge");

        OrchestratorFixture f;
        f.answerWithWav(16000);

        auto report = f.run({ makeSegment(1, Speaker::Primary, "Hello there.", Mood::Happy) });

        expectEquals(report.succeeded, 1);
        expect(! report.hasFailures());
        expect(f.file("dialogue_001_primary.wav").existsAsFile());

        AudioAssembler assembler;
        auto duration = assembler.probeDurationSeconds(f.file("dialogue_001_primary.wav"));
        expect(duration.has_value());
        expectWithinAbsoluteError(duration.value_or(0.0), 1.0, 1.0e-6);
        expect(report.mergedFile == juce::File());
        expect(! f.file("dialogue_complete.wav").exists());

        expectEquals((int) f.sleeps.size(), 1);
        expectEquals(f.sleeps[0], 0.3);

        expectEquals(f.transport.countRequests("POST"), 1);
        auto body = f.transport.requests[0].json();
        expectEquals(body.getProperty("input", {}).toString(), juce::String("Hello there."));
        expectEquals(body.getProperty("voice", {}).toString(), juce::String("IndexTeam/IndexTTS-2:alex"));
    }

    void runTestMergeAndTrack()
    {
        beginTest("Successful segments are merged in order and exported as a track");

        OrchestratorFixture f;
        f.answerWithWav(16000);

        auto report = f.run({ makeSegment(1, Speaker::Primary, "First line."),
                              makeSegment(2, Speaker::Secondary, "Second line.", Mood::Happy) });

        expectEquals(report.succeeded, 2);
        expect(report.mergedFile == f.file("dialogue_complete.wav"));
        expectEquals((int) readSamples(report.mergedFile)[0].size(), 2 * 16000 + 8000);

        expect(report.trackFile == f.file("dialogue_track.json"));
        auto track = juce::JSON::parse(report.trackFile);
        expect(track.isArray());
        expectEquals(track.size(), 2);
        expectEquals((int) track[0].getProperty("index", 0), 1);
        expectEquals(track[1].getProperty("speaker", {}).toString(), juce::String("secondary"));
        expectEquals(track[1].getProperty("mood", {}).toString(), juce::String("happy"));
        expectEquals(track[1].getProperty("text", {}).toString(), juce::String("Second line."));
        expectEquals(track[1].getProperty("audioPath", {}).toString(),
                     f.file("dialogue_002_secondary.wav").getFullPathName());
        expectWithinAbsoluteError((double) track[0].getProperty("duration", 0.0), 1.0, 1.0e-6);
    }

    void runTestResume()
    {
        beginTest("Existing artifacts are skipped and still merged");

        OrchestratorFixture f;
        f.settings.outputDirectory.createDirectory();
        expect(writeWav(f.file("dialogue_001_primary.wav"), 16000.0, 1, 16, 4000, 9));
        f.answerWithWav(16000);

        auto report = f.run({ makeSegment(1, Speaker::Primary, "Already done."),
                              makeSegment(2, Speaker::Secondary, "Still to do.") });

        expectEquals(report.skipped, 1);
        expectEquals(report.succeeded, 1);
        expectEquals(f.transport.countRequests("POST"), 1);
        expectEquals(f.transport.requests[0].json().getProperty("input", {}).toString(), juce::String("Still to do."));
        expect(report.outcomes[0].status == SegmentOutcome::Status::Skipped);
        expectEquals(report.outcomes[0].attempts, 0);

        auto merged = readSamples(report.mergedFile);
        expectEquals((int) merged[0].size(), 4000 + 8000 + 16000);
        expectEquals(merged[0][0], patternSample(0, 0, 9));

        // An empty file is not a completion marker.
        OrchestratorFixture g;
        g.settings.outputDirectory.createDirectory();
        g.file("dialogue_001_primary.wav").create();
        g.answerWithWav(1600);
        expectEquals(g.run({ makeSegment(1, Speaker::Primary, "Redo.") }).succeeded, 1);
        expectEquals(g.transport.countRequests("POST"), 1);
    }

    void runTestRetryBackoff()
    {
        beginTest("Retries back off linearly then respect the request delay");

        OrchestratorFixture f;
        f.settings.rateLimit.maxRetries = 2;
        f.queueError(500);
        f.queueError(429);
        f.queueWav(1600);

        auto report = f.run({ makeSegment(1, Speaker::Primary, "Try hard.") });

        expectEquals(report.succeeded, 1);
        expectEquals(report.outcomes[0].attempts, 3);
        expectEquals((int) f.sleeps.size(), 3);
        expectEquals(f.sleeps[0], 5.0);
        expectEquals(f.sleeps[1], 10.0);
        expectEquals(f.sleeps[2], 0.3);
    }

    void runTestFailureContinues()
    {
        beginTest("A failed segment is reported and the batch continues");

        OrchestratorFixture f;
        f.queueError(500);
        f.queueWav(1600);
        f.queueWav(1600);

        auto report = f.run({ makeSegment(1, Speaker::Primary, "Broken."),
                              makeSegment(2, Speaker::Secondary, "Fine."),
                              makeSegment(3, Speaker::Primary, "Also fine.") });

        expect(report.hasFailures());
        expectEquals(report.failed, 1);
        expectEquals(report.succeeded, 2);
        expect(report.outcomes[0].status == SegmentOutcome::Status::Failed);
        expect(report.outcomes[0].reason.contains("500"));
        expectEquals(report.outcomes[0].attempts, 1);
        expect(! f.file("dialogue_001_primary.wav").exists());
        expect(f.file("dialogue_002_secondary.wav").existsAsFile());

        // Only the successful segments reach the merge and the track.
        expectEquals((int) readSamples(report.mergedFile)[0].size(), 2 * 1600 + 8000);
        expectEquals((int) report.track.size(), 2);
        expectEquals(report.track[0].index, 2);
        expect(report.getSummary().contains("1 failed"));
    }

    void runTestChunking()
    {
        beginTest("Long text is synthesized in chunks, merged and cleaned up");

        const juce::String text("Aaaa bbbb. Cccc dddd. Eeee.");
        expectEquals(TextSegmenter::segment(text, 10).size(), 3);

        OrchestratorFixture f;
        f.settings.maxTextLength = 10;
        f.answerWithWav(1600);

        auto report = f.run({ makeSegment(1, Speaker::Primary, text) });

        expectEquals(report.succeeded, 1);
        expectEquals(f.transport.countRequests("POST"), 3);
        expectEquals(f.transport.requests[1].json().getProperty("input", {}).toString(), juce::String("Cccc dddd."));

        auto segmentFile = f.file("dialogue_001_primary.wav");
        expectEquals((int) readSamples(segmentFile)[0].size(), 3 * 1600 + 2 * 3200);

        for (int part = 1; part <= 3; ++part)
            expect(! f.file("dialogue_001_primary_part" + juce::String(part) + ".wav").exists());

        expectEquals((int) f.sleeps.size(), 3);
    }

    void runTestChunkResume()
    {
        beginTest("A failed chunk keeps finished parts for the next run");

        const juce::String text("Aaaa bbbb. Cccc dddd. Eeee.");

        OrchestratorFixture f;
        f.settings.maxTextLength = 10;
        f.settings.outputDirectory.createDirectory();
        expect(writeWav(f.file("dialogue_001_primary_part1.wav"), 16000.0, 1, 16, 1600));
        f.queueWav(1600);
        f.queueError(503);

        auto first = f.run({ makeSegment(1, Speaker::Primary, text) });
        expectEquals(first.failed, 1);
        expectEquals(f.transport.countRequests("POST"), 2);
        expectEquals(f.transport.requests[0].json().getProperty("input", {}).toString(), juce::String("Cccc dddd."));
        expect(f.file("dialogue_001_primary_part1.wav").existsAsFile());
        expect(f.file("dialogue_001_primary_part2.wav").existsAsFile());
        expect(! f.file("dialogue_001_primary.wav").exists());

        f.queueWav(1600);
        auto second = f.run({ makeSegment(1, Speaker::Primary, text) });
        expectEquals(second.succeeded, 1);
        expectEquals(f.transport.countRequests("POST"), 3);
        expectEquals(f.transport.requests[2].json().getProperty("input", {}).toString(), juce::String("Eeee."));
        expect(f.file("dialogue_001_primary.wav").existsAsFile());
        expect(! f.file("dialogue_001_primary_part1.wav").exists());
    }

    void runTestRangeFilter()
    {
        beginTest("Only segments inside the index range are processed");

        OrchestratorFixture f;
        f.settings.firstIndex = 2;
        f.settings.lastIndex = 3;
        f.answerWithWav(1600);

        auto report = f.run({ makeSegment(1, Speaker::Primary, "One."),
                              makeSegment(2, Speaker::Secondary, "Two."),
                              makeSegment(3, Speaker::Primary, "Three."),
                              makeSegment(4, Speaker::Secondary, "Four.") });

        expectEquals((int) report.outcomes.size(), 2);
        expectEquals(report.outcomes[0].index, 2);
        expectEquals(report.outcomes[1].index, 3);
        expect(! f.file("dialogue_001_primary.wav").exists());
        expect(f.file("dialogue_003_primary.wav").existsAsFile());
        expect(! f.file("dialogue_004_secondary.wav").exists());
        expect(report.mergedFile == juce::File());
        expect(! f.file("dialogue_complete.wav").exists());

        // A later full run fills the gaps and merges the whole script in order.
        f.settings.firstIndex = 1;
        f.settings.lastIndex = 0;
        auto full = f.run({ makeSegment(1, Speaker::Primary, "One."),
                            makeSegment(2, Speaker::Secondary, "Two."),
                            makeSegment(3, Speaker::Primary, "Three."),
                            makeSegment(4, Speaker::Secondary, "Four.") });

        expectEquals(full.skipped, 2);
        expectEquals(full.succeeded, 2);
        expectEquals(f.transport.countRequests("POST"), 4);
        expect(full.mergedFile == f.file("dialogue_complete.wav"));
        expectEquals((int) readSamples(full.mergedFile)[0].size(), 4 * 1600 + 3 * 8000);

        beginTest("A range past the last index does nothing");

        OrchestratorFixture past;
        past.settings.firstIndex = 9;
        past.settings.rateLimit.maxRetries = 3;
        past.answerWithWav(1600);

        auto empty = past.run({ makeSegment(1, Speaker::Primary, "One.") });
        expect(empty.outcomes.empty());
        expect(past.transport.requests.empty());
        expect(past.sleeps.empty());
    }

    void runTestStreaming()
    {
        beginTest("Streaming mode writes the concatenated stream");

        OrchestratorFixture f;
        f.settings.streaming = true;

        auto wav = makeWav(16000.0, 1, 16, 800);
        auto half = wav.getSize() / 2;
        f.transport.streamLines.add("data: {\"audio\":\"" + juce::Base64::toBase64(wav.getData(), half) + "\"}");
        f.transport.streamLines.add(": keep-alive");
        f.transport.streamLines.add("data: {\"audio\":\""
                                    + juce::Base64::toBase64(static_cast<const char*>(wav.getData()) + half,
                                                             wav.getSize() - half)
                                    + "\"}");

        auto report = f.run({ makeSegment(1, Speaker::Primary, "Streamed.") });

        expectEquals(report.succeeded, 1);
        expectEquals(f.transport.countRequests("STREAM"), 1);
        expectEquals(f.transport.countRequests("POST"), 0);
        expectEquals((int) readSamples(f.file("dialogue_001_primary.wav"))[0].size(), 800);
    }

    void runTestConversation()
    {
        beginTest("Conversation models synthesize the whole batch in one request");

        OrchestratorFixture f("fnlp/MOSS-TTSD-v0.5");
        f.answerWithWav(3200);

        std::vector<DialogueSegment> segments { makeSegment(1, Speaker::Primary, "Hi."),
                                                makeSegment(2, Speaker::Secondary, "Hello."),
                                                makeSegment(3, Speaker::Primary, "Bye.") };

        auto report = f.run(segments);

        expectEquals(report.succeeded, 3);
        expectEquals(f.transport.countRequests("POST"), 1);
        expectEquals(f.transport.requests[0].json().getProperty("input", {}).toString(),
                     juce::String("[S1]Hi.[S2]Hello.[S1]Bye."));
        expect(report.mergedFile == f.file("dialogue_dialogue_combined.wav"));
        expect(report.mergedFile.existsAsFile());
        expect(! f.file("dialogue_001_primary.wav").exists());

        auto again = f.run(segments);
        expectEquals(again.skipped, 3);
        expectEquals(f.transport.countRequests("POST"), 1);

        OrchestratorFixture ranged("fnlp/MOSS-TTSD-v0.5");
        ranged.settings.firstIndex = 2;
        ranged.answerWithWav(3200);
        auto partial = ranged.run(segments);
        expectEquals(partial.succeeded, 2);
        expectEquals(ranged.transport.requests[0].json().getProperty("input", {}).toString(),
                     juce::String("[S2]Hello.[S1]Bye."));
        expect(partial.mergedFile == ranged.file("dialogue_dialogue_combined_002-003.wav"));
        expect(! ranged.file("dialogue_dialogue_combined.wav").exists());

        ranged.settings.firstIndex = 1;
        auto whole = ranged.run(segments);
        expectEquals(whole.succeeded, 3);
        expectEquals(ranged.transport.countRequests("POST"), 2);
        expect(whole.mergedFile == ranged.file("dialogue_dialogue_combined.wav"));

        OrchestratorFixture idle("fnlp/MOSS-TTSD-v0.5");
        idle.settings.firstIndex = 9;
        idle.settings.rateLimit.maxRetries = 2;
        auto nothing = idle.run(segments);
        expect(nothing.outcomes.empty());
        expect(idle.transport.requests.empty());
        expect(idle.sleeps.empty());

        OrchestratorFixture failing("fnlp/MOSS-TTSD-v0.5");
        failing.queueError(500);
        auto failed = failing.run(segments);
        expectEquals(failed.failed, 3);
        expect(failed.mergedFile == juce::File());
        expect(! failing.file("dialogue_dialogue_combined.wav").exists());
    }

    void runTestUnwritableOutput()
    {
        beginTest("An unusable output directory fails every selected segment");

        OrchestratorFixture f;
        auto blocker = f.temp.get().getChildFile("blocker");
        blocker.replaceWithText("x");
        f.settings.outputDirectory = blocker.getChildFile("out");
        f.answerWithWav(1600);

        auto report = f.run({ makeSegment(1, Speaker::Primary, "One."), makeSegment(2, Speaker::Secondary, "Two.") });

        expectEquals(report.failed, 2);
        expect(f.transport.requests.empty());
        expect(report.outcomes[1].reason.isNotEmpty());
    }
};

static SynthesisOrchestratorTests synthesisOrchestratorTests;
