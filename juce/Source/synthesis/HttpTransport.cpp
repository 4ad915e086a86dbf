#include "HttpTransport.h"
#include "../config/NarrationErrors.h"

namespace Narration
{

namespace
{

juce::String formatHeaders(const juce::StringPairArray& headers)
{
    juce::String result;

    for (auto& key : headers.getAllKeys())
        result << key << ": " << headers[key] << "\r\n";

    return result;
}

} // namespace

std::unique_ptr<juce::InputStream> JuceHttpTransport::open(const juce::String& urlString,
                                                           const juce::String* jsonBody,
                                                           const juce::StringPairArray& headers,
                                                           int timeoutMs,
                                                           int& statusCode)
{
    juce::URL url(urlString);
    auto handling = juce::URL::ParameterHandling::inAddress;

    if (jsonBody != nullptr)
    {
        url = url.withPOSTData(*jsonBody);
        handling = juce::URL::ParameterHandling::inPostData;
    }

    statusCode = 0;

    auto stream = url.createInputStream(juce::URL::InputStreamOptions(handling)
                                            .withConnectionTimeoutMs(timeoutMs)
                                            .withNumRedirectsToFollow(5)
                                            .withExtraHeaders(formatHeaders(headers))
                                            .withStatusCode(&statusCode));

    if (stream == nullptr && statusCode == 0)
        throw SynthesisError("Failed to connect to " + url.getDomain().toStdString());

    return stream;
}

HttpResponse JuceHttpTransport::post(const juce::String& url,
                                     const juce::String& jsonBody,
                                     const juce::StringPairArray& headers,
                                     int timeoutMs)
{
    HttpResponse response;
    auto stream = open(url, &jsonBody, headers, timeoutMs, response.statusCode);

    if (stream != nullptr)
        stream->readIntoMemoryBlock(response.body);

    DBG("[Http] POST " + url + " -> " + juce::String(response.statusCode) + ", "
        + juce::String((int) response.body.getSize()) + " bytes");
    return response;
}

HttpResponse JuceHttpTransport::get(const juce::String& url, int timeoutMs)
{
    HttpResponse response;
    auto stream = open(url, nullptr, {}, timeoutMs, response.statusCode);

    if (stream != nullptr)
    {
        stream->readIntoMemoryBlock(response.body);

        if (auto* web = dynamic_cast<juce::WebInputStream*>(stream.get()))
            response.statusCode = web->getStatusCode();
    }

    return response;
}

int JuceHttpTransport::postStreaming(const juce::String& url,
                                     const juce::String& jsonBody,
                                     const juce::StringPairArray& headers,
                                     int timeoutMs,
                                     const std::function<void(const juce::String& line)>& onLine)
{
    int statusCode = 0;
    auto stream = open(url, &jsonBody, headers, timeoutMs, statusCode);

    if (stream == nullptr || statusCode < 200 || statusCode >= 300)
        return statusCode;

    while (! stream->isExhausted())
    {
        auto line = stream->readNextLine();

        if (line.isNotEmpty())
            onLine(line);
    }

    return statusCode;
}

} // namespace Narration
