#pragma once

#include <juce_core/juce_core.h>
#include <functional>

namespace Narration
{

struct HttpResponse
{
    int               statusCode = 0;
    juce::MemoryBlock body;

    bool         isSuccess() const { return statusCode >= 200 && statusCode < 300; }
    juce::String getBodyAsString() const { return body.toString(); }
};

/**
 * Minimal blocking HTTP surface used by the speech providers.
 *
 * Implementations throw SynthesisError when no response could be obtained at all;
 * a non-2xx status is returned normally so callers can read the error body.
 */
class HttpTransport
{
public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse post(const juce::String& url,
                              const juce::String& jsonBody,
                              const juce::StringPairArray& headers,
                              int timeoutMs) = 0;

    virtual HttpResponse get(const juce::String& url, int timeoutMs) = 0;

    /** Posts and hands every line of the response body to onLine as it arrives. */
    virtual int postStreaming(const juce::String& url,
                              const juce::String& jsonBody,
                              const juce::StringPairArray& headers,
                              int timeoutMs,
                              const std::function<void(const juce::String& line)>& onLine) = 0;
};

/** HttpTransport on top of juce::URL / juce::WebInputStream. */
class JuceHttpTransport : public HttpTransport
{
public:
    JuceHttpTransport() = default;

    HttpResponse post(const juce::String& url,
                      const juce::String& jsonBody,
                      const juce::StringPairArray& headers,
                      int timeoutMs) override;

    HttpResponse get(const juce::String& url, int timeoutMs) override;

    int postStreaming(const juce::String& url,
                      const juce::String& jsonBody,
                      const juce::StringPairArray& headers,
                      int timeoutMs,
                      const std::function<void(const juce::String& line)>& onLine) override;

private:
    std::unique_ptr<juce::InputStream> open(const juce::String& url,
                                            const juce::String* jsonBody,
                                            const juce::StringPairArray& headers,
                                            int timeoutMs,
                                            int& statusCode);

    JUCE_DECLARE_NON_COPYABLE(JuceHttpTransport)
};

} // namespace Narration
