#include "HttpCommon.hpp"

#include <cpr/cpr.h>

namespace
{

inline void apply_common(cpr::Session& s, const utils::SessionConfig& cfg)
{
    s.SetConnectTimeout(cpr::ConnectTimeout{ cfg.connect_timeout_ms });
    s.SetTimeout(cpr::Timeout{ cfg.timeout_ms });
}

inline cpr::Header make_header(const std::vector<utils::Header>& headers)
{
    cpr::Header h;
    for (const auto& kv : headers)
        h.emplace(kv.name, kv.value);
    if (h.find("Accept") == h.end())
        h.emplace("Accept", "application/json");
    return h;
}

} // namespace

namespace utils
{

HttpResponse get(const std::string& url, const std::vector<Header>& headers, const SessionConfig& cfg)
{
    cpr::Session s;
    s.SetUrl(cpr::Url{ url });
    s.SetHeader(make_header(headers));
    apply_common(s, cfg);
    auto r = s.Get();
    HttpResponse hr;
    if (r.error)
    {
        hr.error = r.error.message;
        hr.timed_out = r.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT;
        return hr;
    }
    hr.status_code = static_cast<int>(r.status_code);
    hr.text = std::move(r.text);
    return hr;
}

} // namespace utils
