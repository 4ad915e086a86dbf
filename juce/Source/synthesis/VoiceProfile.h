#pragma once

#include <juce_core/juce_core.h>
#include <optional>

namespace Narration
{

/** A reference clip used for voice cloning: audio (URL, data URI or local path) plus its transcript. */
struct ReferenceAudio
{
    juce::String audio;
    juce::String text;

    static ReferenceAudio fromJson(const juce::var& json);
    juce::var toJson() const;
};

/**
 * Per-speaker synthesis settings, loaded from configuration and read-only during
 * a run. Unset optionals mean "let the backend decide".
 */
struct VoiceProfile
{
    juce::String          voice;
    std::optional<double> speed;
    std::optional<int>    pitch;
    std::optional<double> volume;
    std::optional<double> gain;
    std::optional<int>    sampleRate;

    juce::String          emotion;       // backend emotion label (minimax vocabulary)
    juce::String          emotionVector; // IndexTTS emotion label
    std::optional<double> emotionAlpha;

    juce::String        instructions;
    std::optional<bool> optimizeInstructions;
    juce::String        languageType;
    juce::String        responseFormat;

    juce::Array<ReferenceAudio> references;

    /** Keys this struct does not model, forwarded verbatim to the backend. */
    juce::NamedValueSet extras;

    static VoiceProfile fromJson(const juce::var& json);

    bool hasExtra(const juce::Identifier& name) const { return extras.contains(name); }
};

} // namespace Narration
