#include "AudioAssembler.h"
#include <cmath>

namespace Narration
{

namespace
{

bool fail(juce::String* error, const juce::String& message)
{
    juce::Logger::writeToLog("[Assembler] " + message);

    if (error != nullptr)
        *error = message;

    return false;
}

AudioAssembler::WaveFormat formatOf(const juce::AudioFormatReader& reader)
{
    AudioAssembler::WaveFormat format;
    format.sampleRate = reader.sampleRate;
    format.numChannels = reader.numChannels;
    format.bitsPerSample = reader.bitsPerSample;
    format.isFloat = reader.usesFloatingPointData;
    return format;
}

} // namespace

juce::String AudioAssembler::WaveFormat::toString() const
{
    return juce::String(sampleRate) + " Hz, " + juce::String(numChannels) + " ch, " + juce::String(bitsPerSample)
           + (isFloat ? " bit float" : " bit");
}

AudioAssembler::AudioAssembler() { formatManager.registerBasicFormats(); }

AudioAssembler::~AudioAssembler() = default;

juce::int64 AudioAssembler::silenceFrames(double sampleRate, double silenceSeconds)
{
    if (silenceSeconds <= 0.0)
        return 0;

    return (juce::int64) std::llround(sampleRate * silenceSeconds);
}

std::unique_ptr<juce::AudioFormatReader> AudioAssembler::openReader(const juce::File& file)
{
    if (! file.existsAsFile())
        return nullptr;

    return std::unique_ptr<juce::AudioFormatReader>(formatManager.createReaderFor(file));
}

std::optional<AudioAssembler::WaveFormat> AudioAssembler::readFormat(const juce::File& file)
{
    if (auto reader = openReader(file))
        return formatOf(*reader);

    return std::nullopt;
}

std::optional<double> AudioAssembler::probeDurationSeconds(const juce::File& file)
{
    auto reader = openReader(file);

    if (reader == nullptr || reader->sampleRate <= 0.0)
        return std::nullopt;

    return (double) reader->lengthInSamples / reader->sampleRate;
}

bool AudioAssembler::writeSilence(juce::AudioFormatWriter& writer, unsigned int numChannels, juce::int64 frames)
{
    constexpr int blockSize = 8192;
    juce::AudioBuffer<float> zeros((int) numChannels, blockSize);
    zeros.clear();

    while (frames > 0)
    {
        auto todo = (int) juce::jmin((juce::int64) blockSize, frames);

        if (! writer.writeFromAudioSampleBuffer(zeros, 0, todo))
            return false;

        frames -= todo;
    }

    return true;
}

bool AudioAssembler::merge(const juce::Array<juce::File>& inputs,
                           const juce::File& output,
                           double silenceSeconds,
                           juce::String* error)
{
    if (inputs.isEmpty())
        return fail(error, "Nothing to merge into " + output.getFileName());

    // Validate every input against the first before touching the output.
    std::vector<std::unique_ptr<juce::AudioFormatReader>> readers;
    WaveFormat format;

    for (const auto& input : inputs)
    {
        auto reader = openReader(input);
        if (reader == nullptr)
            return fail(error, "Cannot read audio file: " + input.getFullPathName());

        auto current = formatOf(*reader);

        if (readers.empty())
        {
            format = current;

            if (format.bitsPerSample == 32 && ! format.isFloat)
                return fail(error, "32-bit integer wave files are not supported: " + input.getFileName());
        }
        else if (current != format)
        {
            return fail(error, "Format mismatch in " + input.getFileName() + " (" + current.toString()
                                   + ", expected " + format.toString() + ")");
        }

        readers.push_back(std::move(reader));
    }

    if (! output.getParentDirectory().createDirectory())
        return fail(error, "Failed to create directory: " + output.getParentDirectory().getFullPathName());

    juce::TemporaryFile temp(output);

    {
        std::unique_ptr<juce::FileOutputStream> out(temp.getFile().createOutputStream());
        if (out == nullptr || ! out->openedOk())
            return fail(error, "Failed to open output stream: " + temp.getFile().getFullPathName());

        juce::WavAudioFormat wav;
        std::unique_ptr<juce::AudioFormatWriter> writer(
            wav.createWriterFor(out.get(), format.sampleRate, format.numChannels, (int) format.bitsPerSample, {}, 0));

        if (writer == nullptr)
            return fail(error, "Failed to create wave writer for " + format.toString());

        out.release(); // owned by the writer now

        auto gap = silenceFrames(format.sampleRate, silenceSeconds);

        for (size_t i = 0; i < readers.size(); ++i)
        {
            auto& reader = *readers[i];

            if (! writer->writeFromAudioReader(reader, 0, reader.lengthInSamples))
                return fail(error, "Failed writing samples from " + inputs[(int) i].getFileName());

            if (i + 1 < readers.size() && ! writeSilence(*writer, format.numChannels, gap))
                return fail(error, "Failed writing silence");
        }
    }

    if (! temp.overwriteTargetFileWithTemporary())
        return fail(error, "Failed to move merged audio into place: " + output.getFullPathName());

    juce::Logger::writeToLog("[Assembler] merged " + juce::String(inputs.size()) + " files into "
                             + output.getFileName());
    return true;
}

} // namespace Narration
