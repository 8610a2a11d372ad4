#pragma once

#include <compare>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace network
{

// IPv4 address stored in host byte order so that integer order matches
// address order.
class Ipv4Address
{
public:
    Ipv4Address() = default;
    explicit Ipv4Address(std::uint32_t value)
        : value_(value)
    {
    }
    Ipv4Address(std::uint8_t a, std::uint8_t b, std::uint8_t c, std::uint8_t d);

    std::uint32_t value() const { return value_; }
    std::uint8_t octet(int index) const;

    std::string toString() const;

    auto operator<=>(const Ipv4Address& other) const = default;

    // Parse dotted-quad notation ("192.168.1.10"); no leading/trailing junk
    static std::optional<Ipv4Address> parse(const std::string& text);

private:
    std::uint32_t value_ = 0;
};

} // namespace network

template <>
struct std::hash<network::Ipv4Address>
{
    std::size_t operator()(const network::Ipv4Address& addr) const noexcept
    {
        return std::hash<std::uint32_t>{}(addr.value());
    }
};
