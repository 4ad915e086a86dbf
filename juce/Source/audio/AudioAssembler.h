#pragma once

#include <juce_audio_formats/juce_audio_formats.h>
#include <optional>

namespace Narration
{

/**
 * Concatenates wave files sample-for-sample with zeroed silence between them.
 *
 * All inputs must share the first file's channel count, sample width and sample
 * rate; a mismatch fails the merge before anything is written. Output is written
 * to a temporary sibling and moved into place, so a failed merge never leaves a
 * partial file at the target path.
 */
class AudioAssembler
{
public:
    struct WaveFormat
    {
        double       sampleRate = 0.0;
        unsigned int numChannels = 0;
        unsigned int bitsPerSample = 0;
        bool         isFloat = false;

        bool operator==(const WaveFormat& other) const
        {
            return sampleRate == other.sampleRate && numChannels == other.numChannels
                   && bitsPerSample == other.bitsPerSample && isFloat == other.isFloat;
        }
        bool operator!=(const WaveFormat& other) const { return ! operator==(other); }

        juce::String toString() const;
    };

    AudioAssembler();
    ~AudioAssembler();

    bool merge(const juce::Array<juce::File>& inputs,
               const juce::File& output,
               double silenceSeconds,
               juce::String* error = nullptr);

    /** Number of zero frames inserted between two files. */
    static juce::int64 silenceFrames(double sampleRate, double silenceSeconds);

    std::optional<WaveFormat> readFormat(const juce::File& file);

    /** Length of a readable audio file in seconds, or nullopt. */
    std::optional<double> probeDurationSeconds(const juce::File& file);

private:
    juce::AudioFormatManager formatManager;

    std::unique_ptr<juce::AudioFormatReader> openReader(const juce::File& file);
    static bool writeSilence(juce::AudioFormatWriter& writer, unsigned int numChannels, juce::int64 frames);

    JUCE_DECLARE_NON_COPYABLE(AudioAssembler)
};

} // namespace Narration
