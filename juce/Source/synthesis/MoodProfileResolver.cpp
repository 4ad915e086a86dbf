#include "MoodProfileResolver.h"

namespace Narration
{

namespace
{

// clang-format off
const MoodEntry moodTable[] = {
    { Mood::Gentle,    1.0,  0, 1.0, "neutral",   "语速适中，语气温柔平和" },
    { Mood::Happy,     1.1,  2, 1.0, "happy",     "语速稍快，语气轻快愉悦" },
    { Mood::Confident, 1.0,  0, 1.1, "neutral",   "语速适中，语气坚定自信" },
    { Mood::Expectant, 1.1,  4, 1.0, "happy",     "语速稍快，语气充满期待和好奇" },
    { Mood::Confused,  0.9,  2, 1.0, "surprised", "语速稍慢，语气带有疑问和困惑" },
    { Mood::Shocked,   1.2,  8, 1.1, "surprised", "语速较快，语气惊讶震惊" },
    { Mood::Angry,     1.2, -4, 1.2, "angry",     "语速较快，语气愤怒不满" },
    { Mood::Sad,       0.8, -6, 0.9, "sad",       "语速较慢，语气悲伤低沉" },
    { Mood::Resigned,  1.0, -2, 1.0, "sad",       "语速适中，语气无奈平淡" },
};

struct VocabularyEntry
{
    Mood        mood;
    const char* label;
};

const VocabularyEntry indexTtsVocabulary[] = {
    { Mood::Gentle,    "Neutral" },
    { Mood::Happy,     "Happy" },
    { Mood::Confident, "Neutral" },
    { Mood::Expectant, "Happy" },
    { Mood::Confused,  "Surprised" },
    { Mood::Shocked,   "Surprised" },
    { Mood::Angry,     "Angry" },
    { Mood::Sad,       "Sad" },
    { Mood::Resigned,  "Sad" },
};
// clang-format on

juce::String instructionSeparator()
{
    return juce::String(juce::CharPointer_UTF8("\xef\xbc\x8c")); // full-width comma
}

} // namespace

bool MoodParameters::isEmpty() const
{
    return ! rate.has_value() && ! pitch.has_value() && ! volume.has_value() && emotionLabel.isEmpty()
           && ! emotionAlpha.has_value() && instruction.isEmpty() && ! dropInstructions;
}

const MoodEntry& MoodProfileResolver::lookup(Mood mood)
{
    for (const auto& entry : moodTable)
        if (entry.mood == mood)
            return entry;

    jassertfalse;
    return moodTable[0];
}

juce::String MoodProfileResolver::translate(Mood mood, EmotionVocabulary vocabulary)
{
    switch (vocabulary)
    {
        case EmotionVocabulary::None:
            return {};

        case EmotionVocabulary::MiniMax:
            return lookup(mood).emotionLabel;

        case EmotionVocabulary::IndexTts:
            for (const auto& entry : indexTtsVocabulary)
                if (entry.mood == mood)
                    return entry.label;
            return "Neutral";
    }

    jassertfalse;
    return {};
}

MoodParameters MoodProfileResolver::resolve(Mood mood,
                                            const MoodCapabilities& capabilities,
                                            const MoodSwitches& switches)
{
    MoodParameters params;
    const auto& entry = lookup(mood);

    if (switches.useTextMood || switches.passBaseParams)
    {
        if (capabilities.nativeRate)
            params.rate = entry.rate;
        if (capabilities.nativePitch)
            params.pitch = entry.pitch;
        if (capabilities.nativeVolume)
            params.volume = entry.volume;
    }

    if (switches.useTextMood)
    {
        if (capabilities.instructionText)
            params.instruction = juce::String::fromUTF8(entry.instruction);

        params.emotionLabel = translate(mood, capabilities.vocabulary);
        params.vocabulary = capabilities.vocabulary;

        if (capabilities.vocabulary == EmotionVocabulary::IndexTts)
            params.emotionAlpha = capabilities.emotionAlpha;
    }
    else if (! switches.passBaseParams && capabilities.instructionText)
    {
        // leave style entirely to the backend
        params.dropInstructions = true;
    }

    return params;
}

VoiceProfile MoodProfileResolver::apply(const VoiceProfile& profile, const MoodParameters& parameters)
{
    auto merged = profile;

    if (! merged.speed.has_value())
        merged.speed = parameters.rate;
    if (! merged.pitch.has_value())
        merged.pitch = parameters.pitch;
    if (! merged.volume.has_value())
        merged.volume = parameters.volume;
    if (! merged.emotionAlpha.has_value())
        merged.emotionAlpha = parameters.emotionAlpha;

    switch (parameters.vocabulary)
    {
        case EmotionVocabulary::None:
            break;
        case EmotionVocabulary::MiniMax:
            if (merged.emotion.isEmpty())
                merged.emotion = parameters.emotionLabel;
            break;
        case EmotionVocabulary::IndexTts:
            if (merged.emotionVector.isEmpty())
                merged.emotionVector = parameters.emotionLabel;
            break;
    }

    if (parameters.dropInstructions)
    {
        merged.instructions.clear();
        merged.optimizeInstructions.reset();
    }
    else if (parameters.instruction.isNotEmpty())
    {
        merged.instructions = merged.instructions.isEmpty()
                                  ? parameters.instruction
                                  : merged.instructions + instructionSeparator() + parameters.instruction;

        if (! merged.optimizeInstructions.has_value())
            merged.optimizeInstructions = true;
    }

    return merged;
}

} // namespace Narration
