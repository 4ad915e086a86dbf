#include <juce_core/juce_core.h>
#include "../dialogue/DialogueParser.h"

using namespace Narration;

namespace
{

juce::String figureLabel() { return juce::String(juce::CharPointer_UTF8("\xe5\x9b\xbe")); }

juce::String extendedBlock(const juce::String& speaker, const juce::String& mood, const juce::String& text)
{
    return "### " + speaker + " speaker ###\n### " + mood + " ###\n### " + text + " ###\n\n";
}

juce::String legacyBlock(const juce::String& speaker, const juce::String& text)
{
    return "### " + speaker + " speaker ###\n### " + text + " ###\n\n";
}

/** Always answers legacy, to check the detection strategy is pluggable. */
class AlwaysLegacy : public FormatDetectionStrategy
{
public:
    MarkupFormat chooseFormat(int, int) const override { return MarkupFormat::Legacy; }
};

} // namespace

/**
    Dialogue markup parsing: block grammar, format detection, mood resolution
    and text cleaning.
*/
class DialogueParserTests : public juce::UnitTest
{
public:
    DialogueParserTests() : UnitTest("Dialogue Parser", "Dialogue") {}

    void runTest() override
    {
        runTestExtendedFormat();
        runTestUnknownMood();
        runTestMoodSwitchOff();
        runTestLegacyFormat();
        runTestFormatDetection();
        runTestTextCleaning();
        runTestEmptyBlocksDropped();
        runTestMalformedBlocksSkipped();
        runTestSpeakerAliases();
    }

private:
    void runTestExtendedFormat()
    {
        beginTest("Extended format yields dense indices in document order");

        DialogueParser parser(DialogueParser::Settings{});
        auto markup = "# Episode 4\n\n" + extendedBlock("primary", "happy", "Welcome back everyone.")
                      + extendedBlock("secondary", "confused", "Wait, what happened last time?")
                      + extendedBlock("primary", "sad", "We lost the data.");

        auto segments = parser.parse(markup);

        expectEquals((int) segments.size(), 3);
        expectEquals(segments[0].index, 1);
        expectEquals(segments[1].index, 2);
        expectEquals(segments[2].index, 3);

        expect(segments[0].speaker == Speaker::Primary);
        expect(segments[1].speaker == Speaker::Secondary);

        expect(segments[0].mood == Mood::Happy);
        expect(segments[1].mood == Mood::Confused);
        expect(segments[2].mood == Mood::Sad);

        expectEquals(segments[1].text, juce::String("Wait, what happened last time?"));
        expect(parser.detectFormat(markup) == MarkupFormat::Extended);
    }

    void runTestUnknownMood()
    {
        beginTest("Unknown mood falls back to the configured default, case is ignored");

        DialogueParser::Settings settings;
        settings.defaultMood = Mood::Confident;
        DialogueParser parser(settings);

        auto segments = parser.parse(extendedBlock("primary", "ecstatic", "First line here.")
                                     + extendedBlock("secondary", "ANGRY", "Second line here."));

        expectEquals((int) segments.size(), 2);
        expect(segments[0].mood == Mood::Confident);
        expect(segments[1].mood == Mood::Angry);
    }

    void runTestMoodSwitchOff()
    {
        beginTest("Disabled text mood forces the default on every segment");

        DialogueParser::Settings settings;
        settings.useTextMood = false;
        settings.defaultMood = Mood::Gentle;
        DialogueParser parser(settings);

        auto segments = parser.parse(extendedBlock("primary", "shocked", "No way that worked.")
                                     + extendedBlock("secondary", "happy", "It really did."));

        expectEquals((int) segments.size(), 2);
        for (const auto& segment : segments)
            expect(segment.mood == Mood::Gentle);
    }

    void runTestLegacyFormat()
    {
        beginTest("Legacy format uses the default mood");

        DialogueParser::Settings settings;
        settings.defaultMood = Mood::Resigned;
        DialogueParser parser(settings);

        auto markup = legacyBlock("primary", "Good evening and welcome.") + legacyBlock("secondary", "Thanks for having me.");
        auto segments = parser.parse(markup);

        expect(parser.detectFormat(markup) == MarkupFormat::Legacy);
        expectEquals((int) segments.size(), 2);
        expectEquals(segments[0].text, juce::String("Good evening and welcome."));
        expectEquals(segments[1].text, juce::String("Thanks for having me."));
        expect(segments[0].mood == Mood::Resigned);
        expect(segments[1].mood == Mood::Resigned);
    }

    void runTestFormatDetection()
    {
        beginTest("Match-ratio detection and replaceable strategy");

        MatchRatioFormatDetection ratio;
        expect(ratio.chooseFormat(0, 0) == MarkupFormat::Legacy);
        expect(ratio.chooseFormat(0, 4) == MarkupFormat::Legacy);
        expect(ratio.chooseFormat(2, 4) == MarkupFormat::Extended);
        expect(ratio.chooseFormat(1, 4) == MarkupFormat::Legacy);
        expect(ratio.chooseFormat(3, 3) == MarkupFormat::Extended);

        MatchRatioFormatDetection strict(1.0);
        expect(strict.chooseFormat(2, 4) == MarkupFormat::Legacy);

        auto markup = extendedBlock("primary", "happy", "Hello there friend.");
        DialogueParser legacyOnly(DialogueParser::Settings{}, std::make_unique<AlwaysLegacy>());
        auto segments = legacyOnly.parse(markup);

        // the mood line is read as the text of a legacy block
        expectEquals((int) segments.size(), 1);
        expectEquals(segments[0].text, juce::String("happy"));
    }

    void runTestTextCleaning()
    {
        beginTest("Text cleaning");

        DialogueParser parser(DialogueParser::Settings{});

        expectEquals(parser.cleanText("  line one\nline   two \n\n three  "), juce::String("line one line two three"));

        auto fullWidth = juce::String(juce::CharPointer_UTF8("\xef\xbc\x88\xe6\xb3\xa8\xef\xbc\x89")); // （注）
        expectEquals(parser.cleanText("See Figure 3 (aside) now" + fullWidth + "ok"),
                     "See " + figureLabel() + "3 nowok");

        expectEquals(parser.cleanText("figure12 and FIGURE  7"),
                     figureLabel() + "12 and " + figureLabel() + "7");

        expectEquals(parser.cleanText("Figure A stays"), juce::String("Figure A stays"));

        auto ideographicSpace = juce::String::charToString((juce::juce_wchar) 0x3000);
        expectEquals(parser.cleanText(ideographicSpace + "one" + ideographicSpace + ideographicSpace + " two" + ideographicSpace),
                     juce::String("one two"));
        expectEquals(parser.cleanText("empty () parens"), juce::String("empty () parens"));

        DialogueParser::Settings plain;
        plain.removeParentheses = false;
        plain.localizeFigures = false;
        DialogueParser untouched(plain);
        expectEquals(untouched.cleanText("Figure 2 (kept)"), juce::String("Figure 2 (kept)"));
    }

    void runTestEmptyBlocksDropped()
    {
        beginTest("Blocks with empty cleaned text do not consume an index");

        DialogueParser parser(DialogueParser::Settings{});
        auto segments = parser.parse(extendedBlock("primary", "happy", "First.")
                                     + extendedBlock("secondary", "happy", "(only an aside)")
                                     + extendedBlock("primary", "happy", "Third."));

        expectEquals((int) segments.size(), 2);
        expectEquals(segments[0].text, juce::String("First."));
        expectEquals(segments[1].text, juce::String("Third."));
        expectEquals(segments[1].index, 2);
    }

    void runTestMalformedBlocksSkipped()
    {
        beginTest("Malformed blocks are skipped silently");

        DialogueParser parser(DialogueParser::Settings{});
        auto markup = extendedBlock("primary", "happy", "Valid first line.")
                      + "### narrator speaker ###\n### happy ###\n### Not a known speaker ###\n\n"
                      + "### primary speaker ### ### happy ### ### no line breaks ###\n\n"
                      + extendedBlock("secondary", "gentle", "Valid second line.")
                      + "### primary speaker ###\n### sad ###\n### never closed";

        auto segments = parser.parse(markup);

        expectEquals((int) segments.size(), 2);
        expectEquals(segments[0].text, juce::String("Valid first line."));
        expectEquals(segments[1].text, juce::String("Valid second line."));
        expectEquals(segments[1].index, 2);

        expect(parser.parse("no markup at all").empty());
        expect(parser.parseFile(juce::File::getCurrentWorkingDirectory().getChildFile("does_not_exist.md")).empty());
    }

    void runTestSpeakerAliases()
    {
        beginTest("male/female speaker aliases");

        DialogueParser parser(DialogueParser::Settings{});
        auto segments = parser.parse(extendedBlock("male", "happy", "Alias one.") + extendedBlock("female", "sad", "Alias two."));

        expectEquals((int) segments.size(), 2);
        expect(segments[0].speaker == Speaker::Primary);
        expect(segments[1].speaker == Speaker::Secondary);

        expect(! speakerFromToken("Primary").has_value());
        expect(moodFromString(" Resigned ") == Mood::Resigned);
    }
};

static DialogueParserTests dialogueParserTests;
