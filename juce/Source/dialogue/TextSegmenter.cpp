#include "TextSegmenter.h"

namespace Narration
{

bool TextSegmenter::isSentenceTerminator(juce::juce_wchar c)
{
    switch (c)
    {
        case '.':
        case '!':
        case '?':
        case 0x3002: // 。
        case 0xff01: // ！
        case 0xff1f: // ？
            return true;
        default:
            return false;
    }
}

juce::StringArray TextSegmenter::splitSentences(const juce::String& text)
{
    juce::StringArray sentences;
    juce::String current;

    for (auto p = text.getCharPointer(); ! p.isEmpty();)
    {
        auto c = p.getAndAdvance();
        current += c;

        if (isSentenceTerminator(c))
        {
            sentences.add(current);
            current.clear();
        }
    }

    if (current.isNotEmpty())
        sentences.add(current);

    return sentences;
}

juce::StringArray TextSegmenter::segment(const juce::String& text, int maxLength)
{
    if (maxLength <= 0 || text.length() <= maxLength)
        return juce::StringArray(text);

    juce::StringArray chunks;
    juce::String current;

    auto flush = [&chunks](const juce::String& chunk)
    {
        if (chunk.isNotEmpty())
            chunks.add(chunk);
    };

    for (auto sentence : splitSentences(text))
    {
        if (current.length() + sentence.length() <= maxLength)
        {
            current += sentence;
            continue;
        }

        flush(current);
        current = sentence.trimStart();

        // hard cut for a sentence that can never fit
        while (current.length() > maxLength)
        {
            chunks.add(current.substring(0, maxLength));
            current = current.substring(maxLength);
        }
    }

    flush(current.trimEnd());

    DBG("[Segmenter] " + juce::String(text.length()) + " chars -> " + juce::String(chunks.size()) + " chunks");
    return chunks;
}

} // namespace Narration
