#include "Ipv4Address.hpp"

#include <cctype>

namespace network
{

Ipv4Address::Ipv4Address(std::uint8_t a, std::uint8_t b, std::uint8_t c, std::uint8_t d)
    : value_((static_cast<std::uint32_t>(a) << 24) | (static_cast<std::uint32_t>(b) << 16) |
             (static_cast<std::uint32_t>(c) << 8) | static_cast<std::uint32_t>(d))
{
}

std::uint8_t Ipv4Address::octet(int index) const
{
    if (index < 0 || index > 3)
        return 0;
    return static_cast<std::uint8_t>((value_ >> (8 * (3 - index))) & 0xFF);
}

std::string Ipv4Address::toString() const
{
    std::string out;
    out.reserve(15);
    for (int i = 0; i < 4; ++i)
    {
        if (i)
            out.push_back('.');
        out += std::to_string(octet(i));
    }
    return out;
}

std::optional<Ipv4Address> Ipv4Address::parse(const std::string& text)
{
    std::uint32_t value = 0;
    int octets = 0;
    std::size_t pos = 0;

    while (octets < 4)
    {
        if (pos >= text.size() || !std::isdigit(static_cast<unsigned char>(text[pos])))
            return std::nullopt;

        std::uint32_t part = 0;
        std::size_t digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])))
        {
            part = part * 10 + static_cast<std::uint32_t>(text[pos] - '0');
            ++pos;
            if (++digits > 3 || part > 255)
                return std::nullopt;
        }

        value = (value << 8) | part;
        ++octets;

        if (octets < 4)
        {
            if (pos >= text.size() || text[pos] != '.')
                return std::nullopt;
            ++pos;
        }
    }

    if (pos != text.size())
        return std::nullopt;

    return Ipv4Address(value);
}

} // namespace network
