#pragma once

#include <juce_core/juce_core.h>
#include <memory>

namespace Narration
{

/**
 * Logger that prints every line to stdout and appends it to a date-stamped log
 * file. If the log directory cannot be created, only the console is used.
 */
class NarrationLogger : public juce::Logger
{
public:
    NarrationLogger(const juce::File& logDirectory, const juce::String& welcomeMessage);
    ~NarrationLogger() override;

    /** Empty when no log file could be opened. */
    juce::File getLogFile() const;

    void logMessage(const juce::String& message) override;

private:
    std::unique_ptr<juce::FileLogger> fileLogger;
    juce::CriticalSection             lock;

    JUCE_DECLARE_NON_COPYABLE(NarrationLogger)
};

/** Makes a logger current for the lifetime of this object. */
class ScopedCurrentLogger
{
public:
    explicit ScopedCurrentLogger(juce::Logger& logger) { juce::Logger::setCurrentLogger(&logger); }
    ~ScopedCurrentLogger() { juce::Logger::setCurrentLogger(nullptr); }

private:
    JUCE_DECLARE_NON_COPYABLE(ScopedCurrentLogger)
};

} // namespace Narration
