#pragma once

#include <string>
#include <vector>

namespace utils
{

struct Header
{
    std::string name;
    std::string value;
};

struct SessionConfig
{
    int connect_timeout_ms = 3000;
    int timeout_ms = 3000;
};

struct HttpResponse
{
    int status_code = 0;
    std::string text;
    std::string error;      // non-empty on network/transport errors
    bool timed_out = false; // transport error was a connect or read timeout

    bool ok() const { return error.empty() && status_code >= 200 && status_code < 300; }
};

// Simple GET helper
HttpResponse get(const std::string& url, const std::vector<Header>& headers, const SessionConfig& cfg);

} // namespace utils
