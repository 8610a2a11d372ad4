#pragma once

#include "Ipv4Address.hpp"

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <string>
#include <vector>

namespace network
{

enum class ParseErrorKind
{
    Malformed,
    InvertedRange
};

struct ParseError
{
    ParseErrorKind kind = ParseErrorKind::Malformed;
    std::string input;
    std::string message;
};

/// Contiguous, inclusive block of IPv4 addresses parsed from CIDR
/// ("10.0.0.0/24"), explicit range ("10.0.0.5-10.0.1.20") or last-octet
/// shorthand ("10.0.0.5-20") notation.
///
/// Iteration is lazy, strictly increasing and restartable: every call to
/// begin() starts again from first().
class AddressRange
{
public:
    class Iterator
    {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = Ipv4Address;
        using difference_type = std::ptrdiff_t;
        using pointer = const Ipv4Address*;
        using reference = Ipv4Address;

        Iterator() = default;

        Ipv4Address operator*() const { return Ipv4Address(static_cast<std::uint32_t>(pos_)); }

        Iterator& operator++()
        {
            ++pos_;
            return *this;
        }

        Iterator operator++(int)
        {
            Iterator tmp = *this;
            ++pos_;
            return tmp;
        }

        bool operator==(const Iterator& other) const { return pos_ == other.pos_; }

    private:
        friend class AddressRange;
        explicit Iterator(std::uint64_t pos)
            : pos_(pos)
        {
        }

        // 64-bit so that one-past-255.255.255.255 is representable
        std::uint64_t pos_ = 0;
    };

    AddressRange() = default;
    AddressRange(Ipv4Address first, Ipv4Address last);

    /// Parse a single range spec. On failure outError is filled and false returned.
    static bool parse(const std::string& spec, AddressRange& out, ParseError& outError);

    /// Parse a comma separated list of range specs. Empty items are rejected.
    static bool parseList(const std::string& specs, std::vector<AddressRange>& out, ParseError& outError);

    /// Sort and fuse overlapping or adjacent ranges into disjoint blocks so
    /// that walking the result visits every covered address exactly once.
    static std::vector<AddressRange> coalesce(std::vector<AddressRange> ranges);

    Ipv4Address first() const { return first_; }
    Ipv4Address last() const { return last_; }

    /// Exact number of addresses in the range, computed without iterating.
    std::uint64_t count() const;

    bool contains(Ipv4Address addr) const { return addr >= first_ && addr <= last_; }

    Iterator begin() const { return Iterator(first_.value()); }
    Iterator end() const { return Iterator(static_cast<std::uint64_t>(last_.value()) + 1); }

    /// Canonical text form: "a.b.c.d/n" when the block is CIDR aligned,
    /// otherwise "a.b.c.d-e.f.g.h".
    std::string toString() const;

    bool operator==(const AddressRange& other) const = default;

private:
    Ipv4Address first_;
    Ipv4Address last_;
};

} // namespace network
