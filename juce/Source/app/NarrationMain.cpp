#include <juce_core/juce_core.h>
#include "../config/NarrationConfig.h"
#include "../config/NarrationErrors.h"
#include "../dialogue/DialogueParser.h"
#include "../synthesis/HttpTransport.h"
#include "../synthesis/SpeechProvider.h"
#include "../synthesis/SynthesisOrchestrator.h"
#include "../utils/NarrationLogger.h"
#include "../utils/VersionInfo.h"
#include <iostream>

namespace
{

constexpr int exitOk = 0;
constexpr int exitSegmentFailures = 1;
constexpr int exitConfigurationError = 2;

struct CommandLineOptions
{
    juce::File scriptFile;
    juce::File configFile = juce::File::getCurrentWorkingDirectory().getChildFile("configs/config.json");
    int        firstIndex = 1;
    int        lastIndex = 0;
    bool       showHelp = false;
};

void printUsage()
{
    std::cout << "Usage: " << Narration::VersionInfo::APPLICATION_NAME
              << " <script.md> [-c|--config <config.json>] [--start N] [--end M]\n"
                 "  -c, --config   configuration file (default: configs/config.json)\n"
                 "  --start N      first segment index to synthesize (default: 1)\n"
                 "  --end M        last segment index to synthesize (default: last)\n"
                 "  -h, --help     show this help\n";
}

bool parseIndex(const juce::String& token, int& out)
{
    if (token.isEmpty() || ! token.containsOnly("0123456789"))
        return false;

    out = token.getIntValue();
    return out > 0;
}

bool parseCommandLine(const juce::StringArray& args, CommandLineOptions& options, juce::String& error)
{
    for (int i = 0; i < args.size(); ++i)
    {
        const auto& arg = args[i];

        if (arg == "-h" || arg == "--help")
        {
            options.showHelp = true;
        }
        else if ((arg == "-c" || arg == "--config") && i + 1 < args.size())
        {
            options.configFile = juce::File::getCurrentWorkingDirectory().getChildFile(args[++i]);
        }
        else if (arg == "--start" && i + 1 < args.size())
        {
            if (! parseIndex(args[++i], options.firstIndex))
            {
                error = "--start expects a positive integer";
                return false;
            }
        }
        else if (arg == "--end" && i + 1 < args.size())
        {
            if (! parseIndex(args[++i], options.lastIndex))
            {
                error = "--end expects a positive integer";
                return false;
            }
        }
        else if (arg.startsWith("-"))
        {
            error = "Unknown or incomplete option: " + arg;
            return false;
        }
        else if (options.scriptFile == juce::File())
        {
            options.scriptFile = juce::File::getCurrentWorkingDirectory().getChildFile(arg);
        }
        else
        {
            error = "Unexpected argument: " + arg;
            return false;
        }
    }

    if (options.showHelp)
        return true;

    if (options.scriptFile == juce::File())
    {
        error = "No script file given";
        return false;
    }

    if (options.lastIndex > 0 && options.lastIndex < options.firstIndex)
    {
        error = "--end must not be smaller than --start";
        return false;
    }

    return true;
}

} // namespace

int main(int argc, char* argv[])
{
    juce::StringArray args(argv + 1, argc - 1);
    args.removeEmptyStrings();

    CommandLineOptions options;
    juce::String       error;

    if (! parseCommandLine(args, options, error))
    {
        std::cerr << error << "\n";
        printUsage();
        return exitConfigurationError;
    }

    if (options.showHelp)
    {
        printUsage();
        return exitOk;
    }

    try
    {
        auto config = Narration::NarrationConfig::loadFromFile(options.configFile);

        auto runSettings = config.makeRunSettings();
        runSettings.firstIndex = options.firstIndex;
        runSettings.lastIndex = options.lastIndex;

        Narration::NarrationLogger logger(runSettings.outputDirectory.getChildFile("logs"),
                                          "[Narration] " + Narration::VersionInfo::getBuildInfoString());
        Narration::ScopedCurrentLogger scopedLogger(logger);

        if (logger.getLogFile() != juce::File())
            juce::Logger::writeToLog("[Narration] Log file: " + logger.getLogFile().getFullPathName());

        if (! options.scriptFile.existsAsFile())
        {
            juce::Logger::writeToLog("[Narration] script not found: " + options.scriptFile.getFullPathName());
            return exitSegmentFailures;
        }

        Narration::DialogueParser parser(config.parser);
        auto segments = parser.parseFile(options.scriptFile);

        juce::Logger::writeToLog("[Narration] parsed " + juce::String((int) segments.size()) + " segments from "
                                 + options.scriptFile.getFileName());

        if (segments.empty())
        {
            juce::Logger::writeToLog("[Narration] no dialogue blocks found, check the script format");
            return exitSegmentFailures;
        }

        Narration::JuceHttpTransport transport;
        auto provider = Narration::createSpeechProvider(config.provider, transport);

        Narration::SynthesisOrchestrator orchestrator(*provider,
                                                      config.primaryVoice,
                                                      config.secondaryVoice,
                                                      runSettings);
        auto report = orchestrator.run(segments);

        juce::Logger::writeToLog("[Narration] " + report.getSummary());

        for (const auto& outcome : report.outcomes)
            if (outcome.status == Narration::SegmentOutcome::Status::Failed)
                juce::Logger::writeToLog("[Narration]   failed #" + juce::String(outcome.index) + " "
                                         + Narration::speakerToString(outcome.speaker) + " after "
                                         + juce::String(outcome.attempts) + " attempt(s): " + outcome.reason);

        if (report.mergedFile != juce::File())
            juce::Logger::writeToLog("[Narration] merged audio: " + report.mergedFile.getFullPathName());

        if (report.trackFile != juce::File())
            juce::Logger::writeToLog("[Narration] track list: " + report.trackFile.getFullPathName());

        return report.hasFailures() ? exitSegmentFailures : exitOk;
    }
    catch (const Narration::ConfigurationError& e)
    {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return exitConfigurationError;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return exitSegmentFailures;
    }
}
