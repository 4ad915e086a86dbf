#include "NarrationLogger.h"
#include <iostream>

namespace Narration
{

NarrationLogger::NarrationLogger(const juce::File& logDirectory, const juce::String& welcomeMessage)
{
    if (logDirectory.createDirectory())
        fileLogger.reset(juce::FileLogger::createDateStampedLogger(logDirectory.getFullPathName(),
                                                                   "narration",
                                                                   ".log",
                                                                   welcomeMessage));

    std::cout << welcomeMessage << std::endl;
}

NarrationLogger::~NarrationLogger() = default;

juce::File NarrationLogger::getLogFile() const
{
    return fileLogger != nullptr ? fileLogger->getLogFile() : juce::File();
}

void NarrationLogger::logMessage(const juce::String& message)
{
    const juce::ScopedLock sl(lock);

    std::cout << message << std::endl;

    if (fileLogger != nullptr)
        fileLogger->logMessage(message);
}

} // namespace Narration
