#include "QwenSpeechProvider.h"
#include "../config/NarrationErrors.h"
#include "AudioPayload.h"

namespace Narration
{

QwenSpeechProvider::QwenSpeechProvider(const ProviderSettings& s, HttpTransport& t)
    : SpeechProvider(s, t)
{
}

MoodCapabilities QwenSpeechProvider::getMoodCapabilities() const
{
    MoodCapabilities caps;
    caps.instructionText = true;
    return caps;
}

juce::String QwenSpeechProvider::getEndpointUrl() const
{
    return settings.baseUrl + "/services/aigc/multimodal-generation/generation";
}

juce::var QwenSpeechProvider::buildRequest(const juce::String& text, const VoiceProfile& profile) const
{
    auto* input = new juce::DynamicObject();
    input->setProperty("text", text);
    input->setProperty("voice", profile.voice);
    input->setProperty("language_type", profile.languageType.isNotEmpty() ? profile.languageType : juce::String("Chinese"));

    if (profile.instructions.isNotEmpty() && acceptsInstructions())
    {
        input->setProperty("instructions", profile.instructions);
        input->setProperty("optimize_instructions", profile.optimizeInstructions.value_or(true));
    }

    for (auto& extra : profile.extras)
        input->setProperty(extra.name, extra.value);

    auto* request = new juce::DynamicObject();
    request->setProperty("model", settings.model);
    request->setProperty("input", juce::var(input));
    return juce::var(request);
}

juce::MemoryBlock QwenSpeechProvider::performSynthesis(const juce::String& text, const VoiceProfile& profile)
{
    auto response = postJson(getEndpointUrl(), buildRequest(text, profile));
    auto json = juce::JSON::parse(response.getBodyAsString());

    auto* root = json.getDynamicObject();
    if (root == nullptr)
        throw SynthesisError("Response is not a JSON object");

    auto audio = root->getProperty("output").getProperty("audio", {});
    auto* audioObj = audio.getDynamicObject();

    if (audioObj == nullptr)
        throw SynthesisError(("Unexpected response: " + response.getBodyAsString().substring(0, 200)).toStdString());

    auto url = audioObj->getProperty("url").toString();
    if (url.isNotEmpty())
    {
        DBG("[Qwen] fetching audio from " + url);
        auto download = transport.get(url, settings.timeoutMs);

        if (! download.isSuccess())
            throw SynthesisError("Audio download failed with HTTP " + std::to_string(download.statusCode));

        return download.body;
    }

    auto data = audioObj->getProperty("data").toString();
    if (data.isNotEmpty())
        return AudioPayload::decodeBase64(data);

    throw SynthesisError("Response carried neither an audio URL nor inline audio data");
}

juce::var QwenSpeechProvider::buildStreamingRequest(const juce::String& text, const VoiceProfile& profile) const
{
    auto request = buildRequest(text, profile);
    request.getDynamicObject()->setProperty("stream", true);
    return request;
}

bool QwenSpeechProvider::decodeStreamingEvent(const juce::var& event, juce::MemoryBlock& audio) const
{
    auto payload = event.getProperty("output", {}).getProperty("audio", {});

    if (payload.isString())
    {
        audio = AudioPayload::decodeBase64(payload.toString());
        return true;
    }

    auto data = payload.getProperty("data", {}).toString();
    if (data.isEmpty())
        return false;

    audio = AudioPayload::decodeBase64(data);
    return true;
}

} // namespace Narration
