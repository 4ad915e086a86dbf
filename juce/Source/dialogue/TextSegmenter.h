#pragma once

#include <juce_core/juce_core.h>

namespace Narration
{

/**
 * Splits oversized segment text into request-sized chunks.
 *
 * Text is cut into sentences after each terminator (。！？.!?), then packed
 * greedily left to right. A single sentence longer than the limit is cut into
 * limit-sized pieces. Lengths are counted in code points.
 */
class TextSegmenter
{
public:
    /** Returns {text} unchanged when it fits or when maxLength is not positive. */
    static juce::StringArray segment(const juce::String& text, int maxLength);

    /** Sentences in order, each carrying its terminator; a trailing fragment is kept. */
    static juce::StringArray splitSentences(const juce::String& text);

    static bool isSentenceTerminator(juce::juce_wchar c);
};

} // namespace Narration
