#include "VoiceProfile.h"

namespace Narration
{

ReferenceAudio ReferenceAudio::fromJson(const juce::var& json)
{
    ReferenceAudio ref;

    if (auto* obj = json.getDynamicObject())
    {
        ref.audio = obj->getProperty("audio").toString();
        ref.text = obj->getProperty("text").toString();
    }

    return ref;
}

juce::var ReferenceAudio::toJson() const
{
    auto* obj = new juce::DynamicObject();
    obj->setProperty("audio", audio);
    obj->setProperty("text", text);
    return juce::var(obj);
}

VoiceProfile VoiceProfile::fromJson(const juce::var& json)
{
    VoiceProfile profile;

    auto* obj = json.getDynamicObject();
    if (obj == nullptr)
        return profile;

    for (auto& prop : obj->getProperties())
    {
        auto key = prop.name.toString();
        const auto& value = prop.value;

        if (key == "voice" || key == "voice_id")
            profile.voice = value.toString();
        else if (key == "speed")
            profile.speed = (double) value;
        else if (key == "pitch")
            profile.pitch = juce::roundToInt((double) value);
        else if (key == "vol")
            profile.volume = (double) value;
        else if (key == "gain")
            profile.gain = (double) value;
        else if (key == "sample_rate")
            profile.sampleRate = (int) value;
        else if (key == "emotion")
            profile.emotion = value.toString();
        else if (key == "emo_vector")
            profile.emotionVector = value.toString();
        else if (key == "emo_alpha")
            profile.emotionAlpha = (double) value;
        else if (key == "instructions")
            profile.instructions = value.toString();
        else if (key == "optimize_instructions")
            profile.optimizeInstructions = (bool) value;
        else if (key == "language_type")
            profile.languageType = value.toString();
        else if (key == "response_format" || key == "format")
            profile.responseFormat = value.toString();
        else if (key == "references")
        {
            if (auto* refs = value.getArray())
                for (const auto& ref : *refs)
                    profile.references.add(ReferenceAudio::fromJson(ref));
        }
        else
        {
            profile.extras.set(prop.name, value);
        }
    }

    return profile;
}

} // namespace Narration
