#pragma once

#include <juce_core/juce_core.h>

namespace Narration
{

/**
 * Decoders for the audio encodings found in backend responses. All of them
 * throw SynthesisError on malformed input.
 */
namespace AudioPayload
{
    /** Hex string, optionally prefixed with "0x". Must have even length. */
    juce::MemoryBlock decodeHex(const juce::String& hex);

    juce::MemoryBlock decodeBase64(const juce::String& base64);

    /** Mime type for a reference clip, chosen by file extension. */
    juce::String mimeTypeForFile(const juce::File& file);

    /** Passes URLs and data URIs through, embeds local files as data URIs. */
    juce::String toReferenceUri(const juce::String& audio);
} // namespace AudioPayload

} // namespace Narration
