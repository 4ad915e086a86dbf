#include "SiliconFlowSpeechProvider.h"
#include "../config/NarrationErrors.h"
#include "AudioPayload.h"

namespace Narration
{

namespace
{

const char* const primaryVoicePool[] = { "alex", "benjamin", "charles", "david" };
const char* const secondaryVoicePool[] = { "anna", "bella", "claire", "diana" };

const char* const voiceTemplateUrl = "https://sf-maas-uat-prod.oss-cn-shanghai.aliyuncs.com/voice_template/fish_audio-";

// Transcript of the built-in voice template clips.
const char* const voiceTemplateText = "在一无所知中，梦里的一天结束了，一个新的轮回便会开始";

// Keys only IndexTTS models understand.
const char* const indexTtsOnlyKeys[] = { "emo_audio_prompt", "use_emo_text" };

bool isIndexTtsOnlyKey(const juce::Identifier& name)
{
    for (auto* key : indexTtsOnlyKeys)
        if (name == juce::Identifier(key))
            return true;

    return false;
}

} // namespace

SiliconFlowSpeechProvider::SiliconFlowSpeechProvider(const ProviderSettings& s, HttpTransport& t)
    : SpeechProvider(s, t)
{
    if (isConversationModel())
        juce::Logger::writeToLog("[SiliconFlow] " + settings.model + " selected, conversation mode available");
}

MoodCapabilities SiliconFlowSpeechProvider::getMoodCapabilities() const
{
    MoodCapabilities caps;
    caps.nativeRate = true;

    if (isIndexTtsModel())
        caps.vocabulary = EmotionVocabulary::IndexTts;

    return caps;
}

juce::String SiliconFlowSpeechProvider::getEndpointUrl() const { return settings.baseUrl + "/audio/speech"; }

juce::String SiliconFlowSpeechProvider::qualifyVoice(const juce::String& voice) const
{
    if (voice.isEmpty() || voice.startsWith(settings.model))
        return voice;

    return settings.model + ":" + voice;
}

juce::var SiliconFlowSpeechProvider::referencesToJson(const juce::Array<ReferenceAudio>& references)
{
    juce::Array<juce::var> list;

    for (const auto& ref : references)
    {
        ReferenceAudio resolved;
        resolved.audio = AudioPayload::toReferenceUri(ref.audio);
        resolved.text = ref.text;
        list.add(resolved.toJson());
    }

    return juce::var(list);
}

juce::var SiliconFlowSpeechProvider::buildRequest(const juce::String& text, const VoiceProfile& profile) const
{
    auto* request = new juce::DynamicObject();
    request->setProperty("model", settings.model);
    request->setProperty("input", text);
    request->setProperty("voice", qualifyVoice(profile.voice));
    request->setProperty("response_format",
                         profile.responseFormat.isNotEmpty() ? profile.responseFormat : juce::String("wav"));

    if (profile.speed.has_value())
        request->setProperty("speed", *profile.speed);
    if (profile.gain.has_value())
        request->setProperty("gain", *profile.gain);
    if (profile.sampleRate.has_value())
        request->setProperty("sample_rate", *profile.sampleRate);

    if (! profile.references.isEmpty())
        request->setProperty("references", referencesToJson(profile.references));

    if (isIndexTtsModel())
    {
        if (profile.emotionVector.isNotEmpty())
            request->setProperty("emo_vector", profile.emotionVector);
        if (profile.emotionAlpha.has_value())
            request->setProperty("emo_alpha", *profile.emotionAlpha);
    }

    for (auto& extra : profile.extras)
        if (isIndexTtsModel() || ! isIndexTtsOnlyKey(extra.name))
            request->setProperty(extra.name, extra.value);

    return juce::var(request);
}

juce::MemoryBlock SiliconFlowSpeechProvider::performSynthesis(const juce::String& text, const VoiceProfile& profile)
{
    auto response = postJson(getEndpointUrl(), buildRequest(text, profile));
    return response.body;
}

ReferenceAudio SiliconFlowSpeechProvider::fallbackReference(Speaker speaker, const juce::String& voice)
{
    auto name = voice.fromLastOccurrenceOf(":", false, false).trim().toLowerCase();

    juce::StringArray pool;
    if (speaker == Speaker::Primary)
        pool = juce::StringArray(primaryVoicePool, juce::numElementsInArray(primaryVoicePool));
    else
        pool = juce::StringArray(secondaryVoicePool, juce::numElementsInArray(secondaryVoicePool));

    if (! pool.contains(name))
        name = pool[0];

    auto capitalised = name.substring(0, 1).toUpperCase() + name.substring(1);

    ReferenceAudio ref;
    ref.audio = juce::String(voiceTemplateUrl) + capitalised + ".mp3";
    ref.text = juce::String::fromUTF8(voiceTemplateText);
    return ref;
}

juce::var SiliconFlowSpeechProvider::buildConversationRequest(const std::vector<ConversationLine>& lines,
                                                              const VoiceProfile& primary,
                                                              const VoiceProfile& secondary) const
{
    juce::String script;
    for (const auto& line : lines)
        script << (line.speaker == Speaker::Primary ? "[S1]" : "[S2]") << line.text;

    juce::Array<ReferenceAudio> references;
    references.add(primary.references.isEmpty() ? fallbackReference(Speaker::Primary, primary.voice)
                                                : primary.references.getReference(0));
    references.add(secondary.references.isEmpty() ? fallbackReference(Speaker::Secondary, secondary.voice)
                                                   : secondary.references.getReference(0));

    auto* request = new juce::DynamicObject();
    request->setProperty("model", settings.model);
    request->setProperty("input", script);
    request->setProperty("response_format",
                         primary.responseFormat.isNotEmpty() ? primary.responseFormat : juce::String("wav"));
    request->setProperty("references", referencesToJson(references));

    if (primary.speed.has_value())
        request->setProperty("speed", *primary.speed);
    if (primary.gain.has_value())
        request->setProperty("gain", *primary.gain);
    if (primary.hasExtra("max_tokens"))
        request->setProperty("max_tokens", primary.extras["max_tokens"]);

    return juce::var(request);
}

juce::MemoryBlock SiliconFlowSpeechProvider::performConversation(const std::vector<ConversationLine>& lines,
                                                                 const VoiceProfile& primary,
                                                                 const VoiceProfile& secondary)
{
    juce::Logger::writeToLog("[SiliconFlow] synthesizing conversation of " + juce::String((int) lines.size())
                             + " lines");

    auto response = postJson(getEndpointUrl(), buildConversationRequest(lines, primary, secondary));
    return response.body;
}

juce::var SiliconFlowSpeechProvider::buildStreamingRequest(const juce::String& text, const VoiceProfile& profile) const
{
    auto request = buildRequest(text, profile);
    request.getDynamicObject()->setProperty("stream", true);
    return request;
}

bool SiliconFlowSpeechProvider::decodeStreamingEvent(const juce::var& event, juce::MemoryBlock& audio) const
{
    auto data = event.getProperty("audio", {}).toString();
    if (data.isEmpty())
        return false;

    audio = AudioPayload::decodeBase64(data);
    return true;
}

} // namespace Narration
