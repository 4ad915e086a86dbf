#include "MiniMaxSpeechProvider.h"
#include "../config/NarrationErrors.h"
#include "AudioPayload.h"

namespace Narration
{

MiniMaxSpeechProvider::MiniMaxSpeechProvider(const ProviderSettings& s, HttpTransport& t)
    : SpeechProvider(s, t)
{
    if (settings.groupId.isEmpty())
        juce::Logger::writeToLog("[MiniMax] WARNING: no group_id configured, the API may reject requests");
}

MoodCapabilities MiniMaxSpeechProvider::getMoodCapabilities() const
{
    MoodCapabilities caps;
    caps.nativeRate = true;
    caps.nativePitch = true;
    caps.nativeVolume = true;
    caps.vocabulary = EmotionVocabulary::MiniMax;
    return caps;
}

juce::String MiniMaxSpeechProvider::getEndpointUrl() const
{
    auto url = settings.baseUrl + "/v1/t2a_v2";

    if (settings.groupId.isNotEmpty())
        url << "?GroupId=" << juce::URL::addEscapeChars(settings.groupId, true);

    return url;
}

juce::var MiniMaxSpeechProvider::buildRequest(const juce::String& text, const VoiceProfile& profile, bool stream) const
{
    auto* voiceSetting = new juce::DynamicObject();
    voiceSetting->setProperty("voice_id", profile.voice.isNotEmpty() ? profile.voice : juce::String(defaultVoiceId()));
    voiceSetting->setProperty("speed", profile.speed.value_or(1.0));
    voiceSetting->setProperty("vol", profile.volume.value_or(1.0));
    voiceSetting->setProperty("pitch", profile.pitch.value_or(0));

    if (profile.emotion.isNotEmpty())
        voiceSetting->setProperty("emotion", profile.emotion);

    auto* audioSetting = new juce::DynamicObject();
    audioSetting->setProperty("sample_rate", profile.sampleRate.value_or(32000));
    audioSetting->setProperty("bitrate", profile.extras.getWithDefault("bitrate", 128000));
    audioSetting->setProperty("format", profile.responseFormat.isNotEmpty() ? profile.responseFormat : juce::String("wav"));
    audioSetting->setProperty("channel", profile.extras.getWithDefault("channel", 1));

    auto* request = new juce::DynamicObject();
    request->setProperty("model", settings.model);
    request->setProperty("text", text);
    request->setProperty("stream", stream);
    request->setProperty("voice_setting", juce::var(voiceSetting));
    request->setProperty("audio_setting", juce::var(audioSetting));

    for (auto& extra : profile.extras)
        if (extra.name != juce::Identifier("bitrate") && extra.name != juce::Identifier("channel"))
            request->setProperty(extra.name, extra.value);

    return juce::var(request);
}

juce::MemoryBlock MiniMaxSpeechProvider::performSynthesis(const juce::String& text, const VoiceProfile& profile)
{
    auto response = postJson(getEndpointUrl(), buildRequest(text, profile, false));
    auto json = juce::JSON::parse(response.getBodyAsString());

    auto hex = json.getProperty("data", {}).getProperty("audio", {}).toString();
    if (hex.isNotEmpty())
        return AudioPayload::decodeHex(hex);

    auto baseResp = json.getProperty("base_resp", {});
    if ((int) baseResp.getProperty("status_code", 0) != 0)
    {
        auto message = baseResp.getProperty("status_msg", "Unknown error").toString();

        if (isRateLimitMessage(message))
            juce::Logger::writeToLog("[MiniMax] rate limited, consider raising rate_limit.delay");

        throw SynthesisError(("API error: " + message).toStdString());
    }

    throw SynthesisError(("Unexpected response: " + response.getBodyAsString().substring(0, 200)).toStdString());
}

juce::var MiniMaxSpeechProvider::buildStreamingRequest(const juce::String& text, const VoiceProfile& profile) const
{
    return buildRequest(text, profile, true);
}

bool MiniMaxSpeechProvider::decodeStreamingEvent(const juce::var& event, juce::MemoryBlock& audio) const
{
    auto hex = event.getProperty("data", {}).getProperty("audio", {}).toString();
    if (hex.isEmpty())
        return false;

    audio = AudioPayload::decodeHex(hex);
    return true;
}

bool MiniMaxSpeechProvider::isRateLimitMessage(const juce::String& message) const
{
    auto lower = message.toLowerCase();
    return lower.contains("rate limit") || lower.contains("rpm");
}

} // namespace Narration
