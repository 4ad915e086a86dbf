#pragma once

#include <stdexcept>
#include <string>

namespace Narration
{

/**
 * Fatal configuration problem (missing credential, unknown provider, ...).
 * Raised before any synthesis request is made.
 */
class ConfigurationError : public std::runtime_error
{
public:
    explicit ConfigurationError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * Transport, decode or backend-reported failure inside a provider.
 * Never escapes a provider: SpeechProvider converts it into a failed ProviderResult.
 */
class SynthesisError : public std::runtime_error
{
public:
    explicit SynthesisError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace Narration
