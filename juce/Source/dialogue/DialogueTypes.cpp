#include "DialogueTypes.h"

namespace Narration
{

juce::String speakerToString(Speaker speaker)
{
    switch (speaker)
    {
        case Speaker::Primary:   return "primary";
        case Speaker::Secondary: return "secondary";
    }

    jassertfalse;
    return {};
}

std::optional<Speaker> speakerFromToken(const juce::String& token)
{
    if (token == "primary" || token == "male")
        return Speaker::Primary;

    if (token == "secondary" || token == "female")
        return Speaker::Secondary;

    return std::nullopt;
}

juce::String moodToString(Mood mood)
{
    switch (mood)
    {
        case Mood::Gentle:    return "gentle";
        case Mood::Happy:     return "happy";
        case Mood::Confident: return "confident";
        case Mood::Expectant: return "expectant";
        case Mood::Confused:  return "confused";
        case Mood::Shocked:   return "shocked";
        case Mood::Angry:     return "angry";
        case Mood::Sad:       return "sad";
        case Mood::Resigned:  return "resigned";
    }

    jassertfalse;
    return {};
}

std::optional<Mood> moodFromString(const juce::String& name)
{
    auto lower = name.trim().toLowerCase();

    for (auto mood : allMoods)
        if (moodToString(mood) == lower)
            return mood;

    return std::nullopt;
}

} // namespace Narration
