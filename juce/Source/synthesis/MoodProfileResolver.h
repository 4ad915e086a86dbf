#pragma once

#include <juce_core/juce_core.h>
#include "../dialogue/DialogueTypes.h"
#include "VoiceProfile.h"
#include <optional>

namespace Narration
{

/** Which discrete emotion vocabulary a backend understands, if any. */
enum class EmotionVocabulary
{
    None,
    MiniMax,  // happy, sad, angry, surprised, neutral...
    IndexTts  // Neutral, Happy, Sad, Angry, Fearful, Disgusted, Surprised
};

/** What a backend can do with mood information. Supplied by each provider. */
struct MoodCapabilities
{
    bool              nativeRate = false;
    bool              nativePitch = false;
    bool              nativeVolume = false;
    bool              instructionText = false;
    EmotionVocabulary vocabulary = EmotionVocabulary::None;
    double            emotionAlpha = 0.7; // only used with EmotionVocabulary::IndexTts
};

struct MoodSwitches
{
    bool useTextMood = true;
    bool passBaseParams = false;
};

/** Mood-derived overrides for one segment, before merging into the voice profile. */
struct MoodParameters
{
    std::optional<double> rate;
    std::optional<int>    pitch;
    std::optional<double> volume;
    juce::String          emotionLabel;
    EmotionVocabulary     vocabulary = EmotionVocabulary::None;
    std::optional<double> emotionAlpha;
    juce::String          instruction;
    bool                  dropInstructions = false;

    bool isEmpty() const;
};

/** One row of the fixed mood table. */
struct MoodEntry
{
    Mood         mood;
    double       rate;
    int          pitch;
    double       volume;
    const char*  emotionLabel; // minimax vocabulary
    const char*  instruction;  // UTF-8 style direction
};

class MoodProfileResolver
{
public:
    static const MoodEntry& lookup(Mood mood);

    /** Translates a mood into a backend vocabulary. Unmapped moods give that vocabulary's neutral label. */
    static juce::String translate(Mood mood, EmotionVocabulary vocabulary);

    static MoodParameters resolve(Mood mood, const MoodCapabilities& capabilities, const MoodSwitches& switches);

    /**
     * Merges mood parameters into a copy of the profile. Fields already set on the
     * profile win; mood instructions are appended to configured ones.
     */
    static VoiceProfile apply(const VoiceProfile& profile, const MoodParameters& parameters);
};

} // namespace Narration
