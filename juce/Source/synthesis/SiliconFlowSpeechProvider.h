#pragma once

#include "SpeechProvider.h"

namespace Narration
{

/**
 * OpenAI-style speech endpoint returning the audio body directly.
 *
 * IndexTTS models additionally take emotion vector parameters; MOSS-TTSD models
 * synthesize a whole two-speaker conversation in one request.
 */
class SiliconFlowSpeechProvider : public SpeechProvider
{
public:
    SiliconFlowSpeechProvider(const ProviderSettings& settings, HttpTransport& transport);

    MoodCapabilities getMoodCapabilities() const override;

    bool supportsConversation() const override { return isConversationModel(); }

    bool isIndexTtsModel() const { return settings.model.contains("IndexTTS"); }
    bool isConversationModel() const { return settings.model.contains("MOSS-TTSD"); }

    juce::var buildRequest(const juce::String& text, const VoiceProfile& profile) const;
    juce::var buildConversationRequest(const std::vector<ConversationLine>& lines,
                                       const VoiceProfile& primary,
                                       const VoiceProfile& secondary) const;

    /** Picks the built-in reference clip for a voice name, falling back to the pool's first voice. */
    static ReferenceAudio fallbackReference(Speaker speaker, const juce::String& voice);

protected:
    juce::MemoryBlock performSynthesis(const juce::String& text, const VoiceProfile& profile) override;

    juce::MemoryBlock performConversation(const std::vector<ConversationLine>& lines,
                                          const VoiceProfile& primary,
                                          const VoiceProfile& secondary) override;

    juce::String getStreamingUrl() const override { return getEndpointUrl(); }
    juce::var buildStreamingRequest(const juce::String& text, const VoiceProfile& profile) const override;
    bool decodeStreamingEvent(const juce::var& event, juce::MemoryBlock& audio) const override;

private:
    juce::String getEndpointUrl() const;
    juce::String qualifyVoice(const juce::String& voice) const;
    static juce::var referencesToJson(const juce::Array<ReferenceAudio>& references);
};

} // namespace Narration
