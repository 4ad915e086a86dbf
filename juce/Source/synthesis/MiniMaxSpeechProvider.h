#pragma once

#include "SpeechProvider.h"

namespace Narration
{

/**
 * Hex-JSON envelope backend. Audio arrives hex encoded in data.audio; errors come
 * back in base_resp with a non-zero status_code.
 */
class MiniMaxSpeechProvider : public SpeechProvider
{
public:
    MiniMaxSpeechProvider(const ProviderSettings& settings, HttpTransport& transport);

    MoodCapabilities getMoodCapabilities() const override;

    juce::var buildRequest(const juce::String& text, const VoiceProfile& profile, bool stream) const;

    static const char* defaultVoiceId() { return "Chinese (Mandarin)_Reliable_Executive"; }

protected:
    juce::MemoryBlock performSynthesis(const juce::String& text, const VoiceProfile& profile) override;

    juce::String getStreamingUrl() const override { return getEndpointUrl(); }
    juce::var buildStreamingRequest(const juce::String& text, const VoiceProfile& profile) const override;
    bool decodeStreamingEvent(const juce::var& event, juce::MemoryBlock& audio) const override;

    bool isRateLimitMessage(const juce::String& message) const override;

private:
    juce::String getEndpointUrl() const;
};

} // namespace Narration
