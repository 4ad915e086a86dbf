#include "SpeechProvider.h"
#include "../config/NarrationErrors.h"
#include "MiniMaxSpeechProvider.h"
#include "QwenSpeechProvider.h"
#include "SiliconFlowSpeechProvider.h"

namespace Narration
{

namespace
{

const char* const placeholderApiKey = "YOUR_API_KEY_HERE";

// Streamed lines may be server-sent events ("data: {...}").
juce::String stripEventPrefix(const juce::String& line)
{
    auto trimmed = line.trim();

    if (trimmed.startsWith("data:"))
        return trimmed.substring(5).trim();

    return trimmed;
}

} // namespace

//==============================================================================
juce::String backendKindToString(BackendKind kind)
{
    switch (kind)
    {
        case BackendKind::Qwen:        return "qwen";
        case BackendKind::SiliconFlow: return "siliconflow";
        case BackendKind::MiniMax:     return "minimax";
    }

    jassertfalse;
    return {};
}

std::optional<BackendKind> backendKindFromString(const juce::String& name)
{
    auto lower = name.trim().toLowerCase();

    for (auto kind : { BackendKind::Qwen, BackendKind::SiliconFlow, BackendKind::MiniMax })
        if (backendKindToString(kind) == lower)
            return kind;

    return std::nullopt;
}

//==============================================================================
ProviderResult ProviderResult::success(juce::MemoryBlock audio)
{
    ProviderResult result;
    result.audio = std::move(audio);
    result.ok = true;
    return result;
}

ProviderResult ProviderResult::failure(const juce::String& reason, bool rateLimited)
{
    ProviderResult result;
    result.reason = reason;
    result.rateLimited = rateLimited;
    return result;
}

ProviderSettings ProviderSettings::withDefaults() const
{
    auto copy = *this;

    switch (kind)
    {
        case BackendKind::Qwen:
            if (copy.model.isEmpty())   copy.model = "qwen3-tts-flash";
            if (copy.baseUrl.isEmpty()) copy.baseUrl = "https://dashscope.aliyuncs.com/api/v1";
            break;

        case BackendKind::SiliconFlow:
            if (copy.model.isEmpty())   copy.model = "IndexTeam/IndexTTS-2";
            if (copy.baseUrl.isEmpty()) copy.baseUrl = "https://api.siliconflow.cn/v1";
            break;

        case BackendKind::MiniMax:
            if (copy.model.isEmpty())   copy.model = "speech-2.6-hd";
            if (copy.baseUrl.isEmpty()) copy.baseUrl = "https://api.minimax.chat";
            break;
    }

    copy.baseUrl = copy.baseUrl.trimCharactersAtEnd("/");
    return copy;
}

//==============================================================================
SpeechProvider::SpeechProvider(ProviderSettings s, HttpTransport& t)
    : settings(s.withDefaults()), transport(t)
{
}

SpeechProvider::~SpeechProvider() = default;

juce::String SpeechProvider::getLogTag() const
{
    switch (settings.kind)
    {
        case BackendKind::Qwen:        return "[Qwen]";
        case BackendKind::SiliconFlow: return "[SiliconFlow]";
        case BackendKind::MiniMax:     return "[MiniMax]";
    }

    return "[Provider]";
}

ProviderResult SpeechProvider::synthesize(const juce::String& text, const VoiceProfile& profile)
{
    try
    {
        auto audio = performSynthesis(text, profile);

        if (audio.isEmpty())
            return ProviderResult::failure("Response contained no audio data");

        return ProviderResult::success(std::move(audio));
    }
    catch (const SynthesisError& e)
    {
        juce::String reason(e.what());
        juce::Logger::writeToLog(getLogTag() + " synthesis failed: " + reason);
        return ProviderResult::failure(reason, isRateLimitMessage(reason));
    }
    catch (const std::exception& e)
    {
        juce::String reason(e.what());
        juce::Logger::writeToLog(getLogTag() + " unexpected error: " + reason);
        return ProviderResult::failure(reason);
    }
}

ProviderResult SpeechProvider::synthesizeStreaming(const juce::String& text, const VoiceProfile& profile)
{
    try
    {
        juce::MemoryBlock combined;
        int chunkCount = 0;
        int skipped = 0;

        auto onLine = [&](const juce::String& line)
        {
            auto payload = stripEventPrefix(line);
            if (payload.isEmpty())
                return;

            juce::var event;
            if (juce::JSON::parse(payload, event).failed())
            {
                ++skipped;
                return;
            }

            try
            {
                juce::MemoryBlock chunk;
                if (decodeStreamingEvent(event, chunk) && ! chunk.isEmpty())
                {
                    combined.append(chunk.getData(), chunk.getSize());
                    ++chunkCount;
                }
            }
            catch (const SynthesisError&)
            {
                ++skipped;
            }
        };

        auto status = transport.postStreaming(getStreamingUrl(),
                                              juce::JSON::toString(buildStreamingRequest(text, profile), true),
                                              makeHeaders(),
                                              settings.timeoutMs,
                                              onLine);

        if (status < 200 || status >= 300)
            return ProviderResult::failure("HTTP " + juce::String(status) + " from streaming endpoint");

        DBG(getLogTag() + " stream finished: " + juce::String(chunkCount) + " chunks, " + juce::String(skipped)
            + " lines skipped");

        if (chunkCount == 0)
            return ProviderResult::failure("Stream carried no audio chunks");

        return ProviderResult::success(std::move(combined));
    }
    catch (const std::exception& e)
    {
        juce::String reason(e.what());
        juce::Logger::writeToLog(getLogTag() + " streaming synthesis failed: " + reason);
        return ProviderResult::failure(reason, isRateLimitMessage(reason));
    }
}

ProviderResult SpeechProvider::synthesizeConversation(const std::vector<ConversationLine>& lines,
                                                      const VoiceProfile& primary,
                                                      const VoiceProfile& secondary)
{
    if (! supportsConversation())
        return ProviderResult::failure("Model " + settings.model + " does not support joint conversation synthesis");

    if (lines.empty())
        return ProviderResult::failure("Conversation has no lines");

    try
    {
        auto audio = performConversation(lines, primary, secondary);

        if (audio.isEmpty())
            return ProviderResult::failure("Response contained no audio data");

        return ProviderResult::success(std::move(audio));
    }
    catch (const std::exception& e)
    {
        juce::String reason(e.what());
        juce::Logger::writeToLog(getLogTag() + " conversation synthesis failed: " + reason);
        return ProviderResult::failure(reason, isRateLimitMessage(reason));
    }
}

juce::MemoryBlock SpeechProvider::performConversation(const std::vector<ConversationLine>&,
                                                      const VoiceProfile&,
                                                      const VoiceProfile&)
{
    throw SynthesisError("Joint conversation synthesis is not available for this backend");
}

juce::StringPairArray SpeechProvider::makeHeaders() const
{
    juce::StringPairArray headers;
    headers.set("Authorization", "Bearer " + settings.apiKey);
    headers.set("Content-Type", "application/json");
    return headers;
}

HttpResponse SpeechProvider::postJson(const juce::String& url, const juce::var& body)
{
    auto response = transport.post(url, juce::JSON::toString(body, true), makeHeaders(), settings.timeoutMs);

    if (! response.isSuccess())
    {
        auto message = describeErrorBody(response);
        throw SynthesisError(("HTTP " + juce::String(response.statusCode)
                              + (message.isNotEmpty() ? ": " + message : juce::String()))
                                 .toStdString());
    }

    return response;
}

juce::String SpeechProvider::describeErrorBody(const HttpResponse& response)
{
    auto text = response.getBodyAsString();
    auto json = juce::JSON::parse(text);

    if (auto* obj = json.getDynamicObject())
    {
        if (auto* error = obj->getProperty("error").getDynamicObject())
            if (error->hasProperty("message"))
                return error->getProperty("message").toString();

        if (obj->hasProperty("message"))
            return obj->getProperty("message").toString();

        if (auto* baseResp = obj->getProperty("base_resp").getDynamicObject())
            return baseResp->getProperty("status_msg").toString();
    }

    return text.substring(0, 200);
}

//==============================================================================
std::unique_ptr<SpeechProvider> createSpeechProvider(const ProviderSettings& settings, HttpTransport& transport)
{
    if (settings.apiKey.trim().isEmpty() || settings.apiKey == placeholderApiKey)
        throw ConfigurationError("A valid api_key is required for provider '"
                                 + backendKindToString(settings.kind).toStdString() + "'");

    switch (settings.kind)
    {
        case BackendKind::Qwen:        return std::make_unique<QwenSpeechProvider>(settings, transport);
        case BackendKind::SiliconFlow: return std::make_unique<SiliconFlowSpeechProvider>(settings, transport);
        case BackendKind::MiniMax:     return std::make_unique<MiniMaxSpeechProvider>(settings, transport);
    }

    throw ConfigurationError("Unsupported provider");
}

} // namespace Narration
