#pragma once

#include "SpeechProvider.h"

namespace Narration
{

/**
 * Request + fetch backend. The generation endpoint answers with either a URL to
 * download or inline base64 audio. Style is steered only through free-text
 * instructions, which are sent for "instruct" models only.
 */
class QwenSpeechProvider : public SpeechProvider
{
public:
    QwenSpeechProvider(const ProviderSettings& settings, HttpTransport& transport);

    MoodCapabilities getMoodCapabilities() const override;

    juce::var buildRequest(const juce::String& text, const VoiceProfile& profile) const;

    bool acceptsInstructions() const { return settings.model.contains("instruct"); }

protected:
    juce::MemoryBlock performSynthesis(const juce::String& text, const VoiceProfile& profile) override;

    juce::String getStreamingUrl() const override { return getEndpointUrl(); }
    juce::var buildStreamingRequest(const juce::String& text, const VoiceProfile& profile) const override;
    bool decodeStreamingEvent(const juce::var& event, juce::MemoryBlock& audio) const override;

private:
    juce::String getEndpointUrl() const;
};

} // namespace Narration
