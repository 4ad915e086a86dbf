#include "AudioPayload.h"
#include "../config/NarrationErrors.h"

namespace Narration
{
namespace AudioPayload
{

juce::MemoryBlock decodeHex(const juce::String& hex)
{
    auto digits = hex.trim();
    if (digits.startsWithIgnoreCase("0x"))
        digits = digits.substring(2);

    if (digits.isEmpty())
        throw SynthesisError("Empty hex audio payload");

    if (digits.length() % 2 != 0)
        throw SynthesisError("Hex audio payload has odd length");

    if (! digits.containsOnly("0123456789abcdefABCDEF"))
        throw SynthesisError("Hex audio payload contains non-hex characters");

    juce::MemoryBlock block;
    block.loadFromHexString(digits);
    return block;
}

juce::MemoryBlock decodeBase64(const juce::String& base64)
{
    juce::MemoryOutputStream decoded;

    if (base64.trim().isEmpty() || ! juce::Base64::convertFromBase64(decoded, base64.trim()))
        throw SynthesisError("Malformed base64 audio payload");

    return decoded.getMemoryBlock();
}

juce::String mimeTypeForFile(const juce::File& file)
{
    auto ext = file.getFileExtension().toLowerCase();

    if (ext == ".wav") return "audio/wav";
    if (ext == ".m4a") return "audio/mp4";
    if (ext == ".ogg") return "audio/ogg";
    if (ext == ".aac") return "audio/aac";

    return "audio/mpeg";
}

juce::String toReferenceUri(const juce::String& audio)
{
    if (audio.startsWithIgnoreCase("http://") || audio.startsWithIgnoreCase("https://")
        || audio.startsWithIgnoreCase("data:"))
        return audio;

    auto file = juce::File::getCurrentWorkingDirectory().getChildFile(audio);

    juce::MemoryBlock data;
    if (! file.existsAsFile() || ! file.loadFileAsData(data))
        throw SynthesisError("Reference audio not found: " + file.getFullPathName().toStdString());

    return "data:" + mimeTypeForFile(file) + ";base64," + juce::Base64::toBase64(data.getData(), data.getSize());
}

} // namespace AudioPayload
} // namespace Narration
