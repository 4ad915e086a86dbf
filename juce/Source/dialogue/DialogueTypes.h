#pragma once

#include <juce_core/juce_core.h>
#include <array>
#include <optional>

namespace Narration
{

enum class Speaker
{
    Primary,
    Secondary
};

/** The nine fixed mood tags a script line can carry. */
enum class Mood
{
    Gentle,
    Happy,
    Confident,
    Expectant,
    Confused,
    Shocked,
    Angry,
    Sad,
    Resigned
};

constexpr std::array<Mood, 9> allMoods{ Mood::Gentle,   Mood::Happy,    Mood::Confident,
                                        Mood::Expectant, Mood::Confused, Mood::Shocked,
                                        Mood::Angry,    Mood::Sad,      Mood::Resigned };

/** Canonical lowercase name used in file names ("primary" / "secondary"). */
juce::String speakerToString(Speaker speaker);

/** Accepts "primary"/"secondary" and the legacy "male"/"female" aliases (lowercase only). */
std::optional<Speaker> speakerFromToken(const juce::String& token);

juce::String moodToString(Mood mood);

/** Case-insensitive lookup of a mood tag. */
std::optional<Mood> moodFromString(const juce::String& name);

/**
 * One parsed dialogue line. Indices are 1-based and dense in document order.
 */
struct DialogueSegment
{
    int          index = 0;
    Speaker      speaker = Speaker::Primary;
    juce::String text;
    Mood         mood = Mood::Gentle;
};

} // namespace Narration
