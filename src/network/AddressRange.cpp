#include "AddressRange.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace network
{

namespace
{

constexpr const char* kFormatHint = "use CIDR (192.168.1.0/24) or range (192.168.1.1-100)";

std::string trim(const std::string& s)
{
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return s.substr(b, e - b);
}

bool parseSmallInt(const std::string& s, int max_value, int& out)
{
    if (s.empty() || s.size() > 3)
        return false;
    int v = 0;
    for (char c : s)
    {
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return false;
        v = v * 10 + (c - '0');
    }
    if (v > max_value)
        return false;
    out = v;
    return true;
}

bool fail(ParseError& outError, ParseErrorKind kind, const std::string& input, std::string message)
{
    outError.kind = kind;
    outError.input = input;
    outError.message = std::move(message);
    return false;
}

} // namespace

AddressRange::AddressRange(Ipv4Address first, Ipv4Address last)
    : first_(first)
    , last_(last)
{
}

bool AddressRange::parse(const std::string& spec, AddressRange& out, ParseError& outError)
{
    const std::string text = trim(spec);
    if (text.empty())
        return fail(outError, ParseErrorKind::Malformed, spec, "empty network range");

    const auto slash = text.find('/');
    if (slash != std::string::npos)
    {
        auto base = Ipv4Address::parse(text.substr(0, slash));
        int prefix = 0;
        if (!base || !parseSmallInt(text.substr(slash + 1), 32, prefix))
            return fail(outError, ParseErrorKind::Malformed, spec, std::string("invalid subnet: ") + kFormatHint);

        const std::uint32_t mask = prefix == 0 ? 0u : (0xFFFFFFFFu << (32 - prefix));
        const std::uint32_t network_addr = base->value() & mask;
        out = AddressRange(Ipv4Address(network_addr), Ipv4Address(network_addr | ~mask));
        return true;
    }

    const auto dash = text.find('-');
    if (dash != std::string::npos)
    {
        auto start = Ipv4Address::parse(trim(text.substr(0, dash)));
        const std::string rhs = trim(text.substr(dash + 1));
        if (!start)
            return fail(outError, ParseErrorKind::Malformed, spec, std::string("invalid range: ") + kFormatHint);

        std::optional<Ipv4Address> end;
        if (rhs.find('.') != std::string::npos)
        {
            end = Ipv4Address::parse(rhs);
        }
        else
        {
            int last_octet = 0;
            if (parseSmallInt(rhs, 255, last_octet))
                end = Ipv4Address((start->value() & 0xFFFFFF00u) | static_cast<std::uint32_t>(last_octet));
        }

        if (!end)
            return fail(outError, ParseErrorKind::Malformed, spec, std::string("invalid range: ") + kFormatHint);

        if (*end < *start)
            return fail(outError, ParseErrorKind::InvertedRange, spec,
                        "range end " + end->toString() + " is before start " + start->toString());

        out = AddressRange(*start, *end);
        return true;
    }

    return fail(outError, ParseErrorKind::Malformed, spec, std::string("invalid network range format: ") + kFormatHint);
}

bool AddressRange::parseList(const std::string& specs, std::vector<AddressRange>& out, ParseError& outError)
{
    std::vector<AddressRange> parsed;
    std::size_t pos = 0;
    while (true)
    {
        const auto comma = specs.find(',', pos);
        const std::string item = specs.substr(pos, comma == std::string::npos ? std::string::npos : comma - pos);

        AddressRange range;
        if (!parse(item, range, outError))
            return false;
        parsed.push_back(range);

        if (comma == std::string::npos)
            break;
        pos = comma + 1;
    }

    out = std::move(parsed);
    return true;
}

std::vector<AddressRange> AddressRange::coalesce(std::vector<AddressRange> ranges)
{
    std::sort(ranges.begin(), ranges.end(),
              [](const AddressRange& a, const AddressRange& b) { return a.first_ < b.first_; });

    std::vector<AddressRange> merged;
    for (const auto& r : ranges)
    {
        if (!merged.empty())
        {
            auto& back = merged.back();
            // adjacent blocks fuse too; 64-bit so 255.255.255.255 + 1 does not wrap
            if (static_cast<std::uint64_t>(r.first_.value()) <= static_cast<std::uint64_t>(back.last_.value()) + 1)
            {
                if (r.last_ > back.last_)
                    back.last_ = r.last_;
                continue;
            }
        }
        merged.push_back(r);
    }
    return merged;
}

std::uint64_t AddressRange::count() const
{
    return static_cast<std::uint64_t>(last_.value()) - first_.value() + 1;
}

std::string AddressRange::toString() const
{
    const std::uint64_t n = count();
    if ((n & (n - 1)) == 0)
    {
        int host_bits = 0;
        while ((std::uint64_t{ 1 } << host_bits) < n)
            ++host_bits;
        const std::uint64_t block = std::uint64_t{ 1 } << host_bits;
        if (first_.value() % block == 0)
            return first_.toString() + "/" + std::to_string(32 - host_bits);
    }
    return first_.toString() + "-" + last_.toString();
}

} // namespace network
