#include "NarrationConfig.h"
#include "NarrationErrors.h"

namespace Narration
{

namespace
{

juce::var section(const juce::var& root, const char* name)
{
    auto value = root.getProperty(name, {});
    return value.isObject() ? value : juce::var();
}

template <typename T>
T valueOr(const juce::var& object, const char* key, T fallback)
{
    auto* obj = object.getDynamicObject();
    if (obj == nullptr || ! obj->hasProperty(key))
        return fallback;

    return static_cast<T>(obj->getProperty(key));
}

juce::String stringOr(const juce::var& object, const char* key, const juce::String& fallback)
{
    auto* obj = object.getDynamicObject();
    if (obj == nullptr || ! obj->hasProperty(key))
        return fallback;

    return obj->getProperty(key).toString();
}

juce::var firstPresent(const juce::var& object, const char* key, const char* alias)
{
    auto value = object.getProperty(key, {});
    return value.isObject() ? value : object.getProperty(alias, {});
}

} // namespace

NarrationConfig NarrationConfig::fromJson(const juce::var& json,
                                          const juce::File& relativeTo,
                                          const juce::String& fallbackApiKey)
{
    if (! json.isObject())
        throw ConfigurationError("Configuration root must be a JSON object");

    NarrationConfig config;

    auto providerName = stringOr(json, "provider", {});
    auto kind = backendKindFromString(providerName);
    if (! kind.has_value())
        throw ConfigurationError("Unsupported provider '" + providerName.toStdString()
                                 + "', expected qwen, siliconflow or minimax");

    auto api = section(json, "api");
    config.provider.kind = *kind;
    config.provider.apiKey = stringOr(api, "api_key", {}).trim();
    config.provider.model = stringOr(api, "model", {});
    config.provider.baseUrl = stringOr(api, "base_url", {});
    config.provider.groupId = stringOr(api, "group_id", {});

    if (config.provider.apiKey.isEmpty())
        config.provider.apiKey = fallbackApiKey.trim();

    if (config.provider.apiKey.isEmpty() || config.provider.apiKey == "YOUR_API_KEY_HERE")
        throw ConfigurationError("api.api_key is missing or still the placeholder value");

    config.provider = config.provider.withDefaults();

    auto voices = section(json, "voices");
    config.primaryVoice = VoiceProfile::fromJson(firstPresent(voices, "primary", "male"));
    config.secondaryVoice = VoiceProfile::fromJson(firstPresent(voices, "secondary", "female"));

    auto rateLimit = section(json, "rate_limit");
    config.rateLimit.delaySeconds = valueOr(rateLimit, "delay", 0.3);
    config.rateLimit.maxRetries = valueOr(rateLimit, "max_retries", 0);
    config.rateLimit.retryDelaySeconds = valueOr(rateLimit, "retry_delay", 5.0);

    if (config.rateLimit.delaySeconds < 0.0 || config.rateLimit.maxRetries < 0
        || config.rateLimit.retryDelaySeconds < 0.0)
        throw ConfigurationError("rate_limit values must not be negative");

    auto emotion = section(json, "emotion");
    config.moodSwitches.useTextMood = valueOr(emotion, "use_emotion", true);
    config.moodSwitches.passBaseParams = valueOr(emotion, "pass_voice_params", false);

    auto defaultMoodName = stringOr(emotion, "default_emotion", "gentle");
    auto defaultMood = moodFromString(defaultMoodName);
    if (! defaultMood.has_value())
        throw ConfigurationError("Unknown default_emotion '" + defaultMoodName.toStdString() + "'");

    auto text = section(json, "text_processing");
    config.parser.useTextMood = config.moodSwitches.useTextMood;
    config.parser.defaultMood = *defaultMood;
    config.parser.removeParentheses = valueOr(text, "remove_parentheses", true);
    config.parser.localizeFigures = valueOr(text, "localize_figures", true);
    config.parser.figureLabel = stringOr(text, "figure_label", config.parser.figureLabel);
    config.maxTextLength = valueOr(text, "max_text_length", 500);

    if (config.maxTextLength <= 0)
        throw ConfigurationError("text_processing.max_text_length must be positive");

    auto output = section(json, "output");
    config.output.outputDirectory = relativeTo.getChildFile(stringOr(output, "output_dir", "./tts_output"));
    config.output.prefix = stringOr(output, "prefix", "dialogue");
    config.output.mergeAudio = valueOr(output, "merge_audio", true);
    config.output.silenceBetween = valueOr(output, "silence_between", 0.5);
    config.output.segmentSilence = valueOr(output, "segment_silence", 0.2);
    config.output.useTimestampSubdir = valueOr(output, "use_timestamp_subdir", false);
    config.output.exportTrack = valueOr(output, "export_track", true);

    if (config.output.prefix.isEmpty() || juce::File::createLegalFileName(config.output.prefix) != config.output.prefix)
        throw ConfigurationError("output.prefix must be a plain file name");

    config.streaming = valueOr(json, "streaming", false);

    return config;
}

NarrationConfig NarrationConfig::loadFromFile(const juce::File& file)
{
    if (! file.existsAsFile())
        throw ConfigurationError("Configuration file not found: " + file.getFullPathName().toStdString());

    juce::var json;
    auto result = juce::JSON::parse(file.loadFileAsString(), json);

    if (result.failed())
        throw ConfigurationError("Invalid JSON in " + file.getFileName().toStdString() + ": "
                                 + result.getErrorMessage().toStdString());

    juce::Logger::writeToLog("[Config] loaded " + file.getFullPathName());

    return fromJson(json,
                    juce::File::getCurrentWorkingDirectory(),
                    juce::SystemStats::getEnvironmentVariable(apiKeyEnvironmentVariable, {}));
}

RunSettings NarrationConfig::makeRunSettings(juce::Time startTime) const
{
    RunSettings run;
    run.outputDirectory = output.outputDirectory;

    if (output.useTimestampSubdir)
        run.outputDirectory = run.outputDirectory.getChildFile(startTime.formatted("%Y%m%d_%H%M%S"));

    run.prefix = output.prefix;
    run.rateLimit = rateLimit;
    run.moodSwitches = moodSwitches;
    run.maxTextLength = maxTextLength;
    run.streaming = streaming;
    run.mergeAudio = output.mergeAudio;
    run.silenceBetween = output.silenceBetween;
    run.segmentSilence = output.segmentSilence;
    run.exportTrack = output.exportTrack;
    return run;
}

} // namespace Narration
