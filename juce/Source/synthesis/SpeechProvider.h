#pragma once

#include <juce_core/juce_core.h>
#include "../dialogue/DialogueTypes.h"
#include "HttpTransport.h"
#include "MoodProfileResolver.h"
#include "VoiceProfile.h"
#include <memory>
#include <optional>
#include <vector>

namespace Narration
{

/** The closed set of supported speech backends. */
enum class BackendKind
{
    Qwen,        // request + fetch (URL or inline base64)
    SiliconFlow, // direct binary body, voice cloning, joint conversation on MOSS-TTSD
    MiniMax      // JSON envelope with hex audio
};

juce::String backendKindToString(BackendKind kind);
std::optional<BackendKind> backendKindFromString(const juce::String& name);

/** Outcome of one adapter call. A failure always carries a human-readable reason. */
struct ProviderResult
{
    juce::MemoryBlock audio;
    bool              ok = false;
    juce::String      reason;
    bool              rateLimited = false;

    static ProviderResult success(juce::MemoryBlock audio);
    static ProviderResult failure(const juce::String& reason, bool rateLimited = false);
};

struct ProviderSettings
{
    BackendKind  kind = BackendKind::Qwen;
    juce::String apiKey;
    juce::String model;
    juce::String baseUrl;
    juce::String groupId;
    int          timeoutMs = 120000;

    /** Fills empty model/baseUrl with the backend's defaults. */
    ProviderSettings withDefaults() const;
};

/** One line of a jointly synthesized conversation. */
struct ConversationLine
{
    Speaker      speaker = Speaker::Primary;
    juce::String text;
};

/**
 * Common contract of the speech backends. The public entry points never throw:
 * transport, decode and backend errors all come back as a failed ProviderResult.
 */
class SpeechProvider
{
public:
    SpeechProvider(ProviderSettings settings, HttpTransport& transport);
    virtual ~SpeechProvider();

    BackendKind getKind() const { return settings.kind; }
    const ProviderSettings& getSettings() const { return settings; }

    ProviderResult synthesize(const juce::String& text, const VoiceProfile& profile);

    /** Newline-delimited JSON streaming. Malformed lines are skipped; chunks keep arrival order. */
    ProviderResult synthesizeStreaming(const juce::String& text, const VoiceProfile& profile);

    /** Whole conversation in one request. Only meaningful when supportsConversation() is true. */
    ProviderResult synthesizeConversation(const std::vector<ConversationLine>& lines,
                                          const VoiceProfile& primary,
                                          const VoiceProfile& secondary);

    virtual bool supportsConversation() const { return false; }

    virtual MoodCapabilities getMoodCapabilities() const = 0;

protected:
    ProviderSettings settings;
    HttpTransport&   transport;

    /** Implementations throw SynthesisError on any failure. */
    virtual juce::MemoryBlock performSynthesis(const juce::String& text, const VoiceProfile& profile) = 0;

    virtual juce::String getStreamingUrl() const = 0;
    virtual juce::var buildStreamingRequest(const juce::String& text, const VoiceProfile& profile) const = 0;

    /** Decodes the audio carried by one streamed event; throws or returns false when there is none. */
    virtual bool decodeStreamingEvent(const juce::var& event, juce::MemoryBlock& audio) const = 0;

    virtual juce::MemoryBlock performConversation(const std::vector<ConversationLine>& lines,
                                                  const VoiceProfile& primary,
                                                  const VoiceProfile& secondary);

    /** Overridden by backends that can tell a rate-limit failure from the message text. */
    virtual bool isRateLimitMessage(const juce::String&) const { return false; }

    juce::StringPairArray makeHeaders() const;

    /** Posts a JSON body and throws SynthesisError for transport errors and non-2xx statuses. */
    HttpResponse postJson(const juce::String& url, const juce::var& body);

    /** Best-effort extraction of a backend error message from a JSON error body. */
    static juce::String describeErrorBody(const HttpResponse& response);

    juce::String getLogTag() const;

private:
    JUCE_DECLARE_NON_COPYABLE(SpeechProvider)
};

/**
 * Builds the provider for settings.kind. Throws ConfigurationError for a missing
 * or placeholder API key.
 */
std::unique_ptr<SpeechProvider> createSpeechProvider(const ProviderSettings& settings, HttpTransport& transport);

} // namespace Narration
