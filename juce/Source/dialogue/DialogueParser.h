#pragma once

#include <juce_core/juce_core.h>
#include "DialogueTypes.h"
#include <memory>
#include <vector>

namespace Narration
{

enum class MarkupFormat
{
    Extended, // ### speaker ### / ### mood ### / ### text ###
    Legacy    // ### speaker ### / ### text ###
};

/**
 * Decides which block grammar a document uses, given how many blocks of each
 * kind were found in it.
 */
class FormatDetectionStrategy
{
public:
    virtual ~FormatDetectionStrategy() = default;

    virtual MarkupFormat chooseFormat(int extendedMatches, int legacyMatches) const = 0;
};

/**
 * Picks the extended grammar when at least one extended block exists and the
 * extended count reaches minimumRatio times the legacy count.
 */
class MatchRatioFormatDetection : public FormatDetectionStrategy
{
public:
    explicit MatchRatioFormatDetection(double minimumRatio = 0.5) : minimumRatio(minimumRatio) {}

    MarkupFormat chooseFormat(int extendedMatches, int legacyMatches) const override;

private:
    double minimumRatio;
};

/**
 * Turns triple-hash fenced dialogue markup into an ordered list of segments.
 *
 * Malformed blocks are skipped silently; blocks whose cleaned text is empty are
 * dropped without consuming an index.
 */
class DialogueParser
{
public:
    struct Settings
    {
        bool         useTextMood = true;        // false forces every segment to defaultMood
        Mood         defaultMood = Mood::Gentle;
        bool         removeParentheses = true;  // strip (aside) and （aside）
        bool         localizeFigures = true;    // "Figure 3" -> figureLabel + "3"
        juce::String figureLabel = juce::String(juce::CharPointer_UTF8("\xe5\x9b\xbe"));
    };

    explicit DialogueParser(Settings settings,
                            std::unique_ptr<FormatDetectionStrategy> formatDetection = nullptr);
    ~DialogueParser();

    std::vector<DialogueSegment> parse(const juce::String& markup) const;

    /** Reads the file as UTF-8 and parses it. A missing file yields no segments. */
    std::vector<DialogueSegment> parseFile(const juce::File& file) const;

    MarkupFormat detectFormat(const juce::String& markup) const;

    /** Applies the per-segment cleaning steps (line breaks, whitespace, asides, figures). */
    juce::String cleanText(const juce::String& rawText) const;

    const Settings& getSettings() const { return settings; }

private:
    Settings                                 settings;
    std::unique_ptr<FormatDetectionStrategy> formatDetection;

    Mood resolveMood(const juce::String& declaredMood) const;
    juce::String removeParentheticals(const juce::String& text) const;
    juce::String rewriteFigureReferences(const juce::String& text) const;

    JUCE_DECLARE_NON_COPYABLE(DialogueParser)
};

} // namespace Narration
