#include "DialogueParser.h"

namespace Narration
{

namespace
{

using CodePoints = std::vector<juce::juce_wchar>;

CodePoints toCodePoints(const juce::String& text)
{
    CodePoints chars;
    chars.reserve((size_t) text.length());

    for (auto p = text.getCharPointer(); ! p.isEmpty();)
        chars.push_back(p.getAndAdvance());

    return chars;
}

juce::String fromCodePoints(const CodePoints& chars, size_t start, size_t end)
{
    juce::String result;
    result.preallocateBytes(end - start);

    for (auto i = start; i < end; ++i)
        result += chars[i];

    return result;
}

// iswspace misses the ideographic space in the C locale.
bool isSpace(juce::juce_wchar c) { return c == 0x3000 || juce::CharacterFunctions::isWhitespace(c); }

bool isWordChar(juce::juce_wchar c)
{
    return juce::CharacterFunctions::isLetterOrDigit(c) || c == '_';
}

bool isOpeningParen(juce::juce_wchar c) { return c == '(' || c == 0xff08; }
bool isClosingParen(juce::juce_wchar c) { return c == ')' || c == 0xff09; }

struct BlockMatch
{
    size_t       end = 0; // one past the closing fence of the text block
    juce::String speaker;
    juce::String mood;
    juce::String text;
};

/**
 * Hand-rolled matcher for the two block grammars. Mirrors a left-to-right,
 * non-overlapping "find all" over the document.
 */
class MarkupScanner
{
public:
    explicit MarkupScanner(const juce::String& markup) : chars(toCodePoints(markup)) {}

    std::vector<BlockMatch> findAll(MarkupFormat format) const
    {
        std::vector<BlockMatch> matches;
        size_t pos = 0;

        while (pos < chars.size())
        {
            BlockMatch match;

            if (matchBlockAt(pos, format, match))
            {
                matches.push_back(match);
                pos = match.end;
            }
            else
            {
                ++pos;
            }
        }

        return matches;
    }

private:
    CodePoints chars;

    bool isFenceAt(size_t p) const
    {
        return p + 3 <= chars.size() && chars[p] == '#' && chars[p + 1] == '#' && chars[p + 2] == '#';
    }

    size_t skipSpaces(size_t p) const
    {
        while (p < chars.size() && isSpace(chars[p]))
            ++p;
        return p;
    }

    bool consumeLiteral(size_t& p, const char* literal) const
    {
        auto q = p;
        for (auto* c = literal; *c != 0; ++c, ++q)
            if (q >= chars.size() || chars[q] != (juce::juce_wchar) *c)
                return false;

        p = q;
        return true;
    }

    bool consumeFence(size_t& p) const
    {
        if (! isFenceAt(p))
            return false;
        p += 3;
        return true;
    }

    // A whitespace run that contains at least one line feed.
    bool consumeLineBreak(size_t& p) const
    {
        auto end = skipSpaces(p);
        for (auto i = p; i < end; ++i)
        {
            if (chars[i] == '\n')
            {
                p = end;
                return true;
            }
        }
        return false;
    }

    bool consumeSpeaker(size_t& p, juce::String& speaker) const
    {
        for (auto* token : { "primary", "secondary", "male", "female" })
        {
            auto q = p;
            if (consumeLiteral(q, token))
            {
                speaker = token;
                p = q;
                return true;
            }
        }
        return false;
    }

    bool matchBlockAt(size_t p, MarkupFormat format, BlockMatch& out) const
    {
        if (! consumeFence(p))
            return false;

        p = skipSpaces(p);
        if (! consumeSpeaker(p, out.speaker))
            return false;

        p = skipSpaces(p);
        if (! consumeLiteral(p, "speaker"))
            return false;

        p = skipSpaces(p);
        if (! consumeFence(p) || ! consumeLineBreak(p))
            return false;

        if (format == MarkupFormat::Extended)
        {
            if (! consumeFence(p))
                return false;

            p = skipSpaces(p);
            auto moodStart = p;
            while (p < chars.size() && isWordChar(chars[p]))
                ++p;

            if (p == moodStart)
                return false;

            out.mood = fromCodePoints(chars, moodStart, p);

            p = skipSpaces(p);
            if (! consumeFence(p) || ! consumeLineBreak(p))
                return false;
        }

        if (! consumeFence(p))
            return false;

        auto textStart = skipSpaces(p);
        auto closing = textStart;
        while (closing < chars.size() && ! isFenceAt(closing))
            ++closing;

        if (closing >= chars.size())
            return false;

        auto textEnd = closing;
        while (textEnd > textStart && isSpace(chars[textEnd - 1]))
            --textEnd;

        out.text = fromCodePoints(chars, textStart, textEnd);
        out.end = closing + 3;
        return true;
    }
};

juce::String collapseWhitespace(const juce::String& text)
{
    juce::String result;
    result.preallocateBytes(text.getNumBytesAsUTF8());
    bool pendingSpace = false;

    for (auto p = text.getCharPointer(); ! p.isEmpty();)
    {
        auto c = p.getAndAdvance();

        if (isSpace(c))
        {
            pendingSpace = true;
            continue;
        }

        if (pendingSpace && result.isNotEmpty())
            result += ' ';

        pendingSpace = false;
        result += c;
    }

    return result;
}

} // namespace

//==============================================================================
MarkupFormat MatchRatioFormatDetection::chooseFormat(int extendedMatches, int legacyMatches) const
{
    if (extendedMatches > 0 && (double) extendedMatches >= (double) legacyMatches * minimumRatio)
        return MarkupFormat::Extended;

    return MarkupFormat::Legacy;
}

//==============================================================================
DialogueParser::DialogueParser(Settings s, std::unique_ptr<FormatDetectionStrategy> detection)
    : settings(std::move(s)), formatDetection(std::move(detection))
{
    if (formatDetection == nullptr)
        formatDetection = std::make_unique<MatchRatioFormatDetection>();
}

DialogueParser::~DialogueParser() = default;

MarkupFormat DialogueParser::detectFormat(const juce::String& markup) const
{
    MarkupScanner scanner(markup);
    auto extended = (int) scanner.findAll(MarkupFormat::Extended).size();
    auto legacy = (int) scanner.findAll(MarkupFormat::Legacy).size();

    return formatDetection->chooseFormat(extended, legacy);
}

std::vector<DialogueSegment> DialogueParser::parse(const juce::String& markup) const
{
    MarkupScanner scanner(markup);
    auto extendedMatches = scanner.findAll(MarkupFormat::Extended);
    auto legacyMatches = scanner.findAll(MarkupFormat::Legacy);

    auto format = formatDetection->chooseFormat((int) extendedMatches.size(), (int) legacyMatches.size());
    const auto& matches = format == MarkupFormat::Extended ? extendedMatches : legacyMatches;

    juce::Logger::writeToLog("[Parser] extended blocks: " + juce::String((int) extendedMatches.size())
                             + ", legacy blocks: " + juce::String((int) legacyMatches.size()) + ", using "
                             + (format == MarkupFormat::Extended ? "extended" : "legacy") + " format");

    std::vector<DialogueSegment> segments;
    segments.reserve(matches.size());

    for (const auto& match : matches)
    {
        auto speaker = speakerFromToken(match.speaker);
        if (! speaker.has_value())
            continue;

        auto text = cleanText(match.text);
        if (text.isEmpty())
        {
            DBG("[Parser] dropping block with empty text");
            continue;
        }

        DialogueSegment segment;
        segment.index = (int) segments.size() + 1;
        segment.speaker = *speaker;
        segment.text = text;
        segment.mood = format == MarkupFormat::Extended ? resolveMood(match.mood) : settings.defaultMood;
        segments.push_back(segment);
    }

    return segments;
}

std::vector<DialogueSegment> DialogueParser::parseFile(const juce::File& file) const
{
    if (! file.existsAsFile())
    {
        juce::Logger::writeToLog("[Parser] script not found: " + file.getFullPathName());
        return {};
    }

    return parse(file.loadFileAsString());
}

Mood DialogueParser::resolveMood(const juce::String& declaredMood) const
{
    if (! settings.useTextMood)
        return settings.defaultMood;

    return moodFromString(declaredMood).value_or(settings.defaultMood);
}

juce::String DialogueParser::cleanText(const juce::String& rawText) const
{
    auto text = collapseWhitespace(rawText.replaceCharacter('\n', ' '));

    if (settings.removeParentheses)
        text = removeParentheticals(text);

    if (settings.localizeFigures)
        text = rewriteFigureReferences(text);

    return collapseWhitespace(text).trim();
}

juce::String DialogueParser::removeParentheticals(const juce::String& text) const
{
    auto chars = toCodePoints(text);
    CodePoints kept;
    kept.reserve(chars.size());

    size_t i = 0;
    while (i < chars.size())
    {
        if (isOpeningParen(chars[i]))
        {
            auto close = i + 1;
            while (close < chars.size() && ! isClosingParen(chars[close]))
                ++close;

            // needs at least one character between the brackets
            if (close < chars.size() && close > i + 1)
            {
                i = close + 1;
                continue;
            }
        }

        kept.push_back(chars[i]);
        ++i;
    }

    return fromCodePoints(kept, 0, kept.size());
}

juce::String DialogueParser::rewriteFigureReferences(const juce::String& text) const
{
    auto chars = toCodePoints(text);
    juce::String result;
    result.preallocateBytes(text.getNumBytesAsUTF8());

    static const char* keyword = "figure";
    size_t i = 0;

    while (i < chars.size())
    {
        bool keywordHere = i + 6 <= chars.size();
        for (size_t k = 0; keywordHere && k < 6; ++k)
            keywordHere = juce::CharacterFunctions::toLowerCase(chars[i + k]) == (juce::juce_wchar) keyword[k];

        if (keywordHere)
        {
            auto digitsStart = i + 6;
            while (digitsStart < chars.size() && isSpace(chars[digitsStart]))
                ++digitsStart;

            auto digitsEnd = digitsStart;
            while (digitsEnd < chars.size() && juce::CharacterFunctions::isDigit(chars[digitsEnd]))
                ++digitsEnd;

            if (digitsEnd > digitsStart)
            {
                result += settings.figureLabel + fromCodePoints(chars, digitsStart, digitsEnd);
                i = digitsEnd;
                continue;
            }
        }

        result += chars[i];
        ++i;
    }

    return result;
}

} // namespace Narration
