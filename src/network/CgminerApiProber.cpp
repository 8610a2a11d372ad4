#include "CgminerApiProber.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <utility>
#include <vector>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

using json = nlohmann::json;

namespace network
{

namespace
{

constexpr const char* kRequest = R"({"command":"version+summary+stats"})";
constexpr std::size_t kMaxReplyBytes = 256 * 1024;
constexpr std::uint32_t kMaxFans = 16;
constexpr std::uint32_t kMaxChipsPerBoard = 1024;

struct SocketGuard
{
    explicit SocketGuard(int s)
        : fd(s)
    {
    }
    ~SocketGuard()
    {
        if (fd >= 0)
            ::close(fd);
    }
    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;

    int fd;
};

using Clock = std::chrono::steady_clock;

int remainingMs(Clock::time_point deadline)
{
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

// Wait for `events` on fd until deadline. Returns 1 ready, 0 timeout, -1 error.
int waitFor(int fd, short events, Clock::time_point deadline)
{
    while (true)
    {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = events;
        int rc = ::poll(&pfd, 1, remainingMs(deadline));
        if (rc < 0 && errno == EINTR)
            continue;
        if (rc < 0)
            return -1;
        return rc == 0 ? 0 : 1;
    }
}

std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::optional<double> numberField(const json& obj, const char* key)
{
    if (!obj.is_object() || !obj.contains(key))
        return std::nullopt;
    const auto& v = obj[key];
    if (v.is_number())
        return v.get<double>();
    if (v.is_string())
    {
        const std::string s = v.get<std::string>();
        char* end = nullptr;
        double d = std::strtod(s.c_str(), &end);
        if (end != s.c_str())
            return d;
    }
    return std::nullopt;
}

// Counts reported by the device: NaN and negatives read as 0, huge values are capped
std::uint32_t countField(const json& obj, const char* key, std::uint32_t ceiling)
{
    const double v = numberField(obj, key).value_or(0.0);
    if (!(v > 0.0))
        return 0;
    return v >= ceiling ? ceiling : static_cast<std::uint32_t>(v);
}

// Nominal chips per hashboard for Antminer models; STATS only reports working chips
std::optional<std::uint32_t> antminerChipsPerBoard(const std::string& model)
{
    static const std::pair<const char*, std::uint32_t> kTable[] = {
        { "s19j pro", 126 }, { "s19 pro", 114 }, { "s19 xp", 110 }, { "s19", 76 }, { "s21", 108 }, { "s9", 63 },
    };
    const std::string m = lower(model);
    for (const auto& [name, chips] : kTable)
    {
        if (m.find(name) != std::string::npos)
            return chips;
    }
    return std::nullopt;
}

std::string stringField(const json& obj, const char* key)
{
    if (obj.is_object() && obj.contains(key) && obj[key].is_string())
        return obj[key].get<std::string>();
    return {};
}

// Multi-command replies nest each section as {"version":[{"VERSION":[{...}]}]}
const json* section(const json& root, const char* command, const char* key)
{
    if (root.contains(command) && root[command].is_array() && !root[command].empty())
    {
        const auto& inner = root[command][0];
        if (inner.contains(key) && inner[key].is_array() && !inner[key].empty())
            return &inner[key];
    }
    if (root.contains(key) && root[key].is_array() && !root[key].empty())
        return &root[key];
    return nullptr;
}

void identify(const json& version, DeviceSnapshot& snap)
{
    std::string type = stringField(version, "Type");
    if (type.empty())
        type = stringField(version, "PROD");
    if (type.empty())
        type = stringField(version, "Model");
    snap.model = type;

    const std::string t = lower(type);
    if (t.find("antminer") != std::string::npos)
        snap.make = MinerMake::AntMiner;
    else if (t.find("whatsminer") != std::string::npos || t.rfind("m3", 0) == 0 || t.rfind("m5", 0) == 0 ||
             t.rfind("m6", 0) == 0)
        snap.make = MinerMake::WhatsMiner;
    else if (t.find("avalon") != std::string::npos)
        snap.make = MinerMake::AvalonMiner;

    if (version.contains("BOSminer") || version.contains("BOSer") || t.find("bos") != std::string::npos)
    {
        snap.firmware = MinerFirmware::BraiinsOS;
        snap.firmware_version = stringField(version, version.contains("BOSer") ? "BOSer" : "BOSminer");
    }
    else if (version.contains("LUXminer"))
    {
        snap.firmware = MinerFirmware::LuxOS;
        snap.firmware_version = stringField(version, "LUXminer");
    }
    else if (t.find("vnish") != std::string::npos)
    {
        snap.firmware = MinerFirmware::VNish;
        snap.firmware_version = stringField(version, "BMMiner");
    }
    else
    {
        snap.firmware = MinerFirmware::Stock;
        for (const char* key : { "BMMiner", "CGMiner", "Firmware", "FW Version" })
        {
            snap.firmware_version = stringField(version, key);
            if (!snap.firmware_version.empty())
                break;
        }
    }

    snap.mac = stringField(version, "MAC");
}

void readSummary(const json& summary, DeviceSnapshot& snap)
{
    if (auto ghs = numberField(summary, "GHS 5s"))
        snap.hashrate_ths = *ghs / 1000.0;
    else if (auto mhs = numberField(summary, "MHS 5s"))
        snap.hashrate_ths = *mhs / 1'000'000.0;
    else if (auto ghs_av = numberField(summary, "GHS av"))
        snap.hashrate_ths = *ghs_av / 1000.0;

    if (auto temp = numberField(summary, "Temperature"))
        snap.temperature_c = *temp;

    // WhatsMiner reports input power in the summary
    if (auto power = numberField(summary, "Power"); power && *power > 0.0)
        snap.power_w = *power;

    if (auto fan_in = numberField(summary, "Fan Speed In"))
        snap.fan_rpms.push_back(*fan_in);
    if (auto fan_out = numberField(summary, "Fan Speed Out"))
        snap.fan_rpms.push_back(*fan_out);
}

void readStats(const json& stats, DeviceSnapshot& snap)
{
    // Antminer puts the hardware block in the second STATS entry
    for (const auto& entry : stats)
    {
        if (!entry.is_object())
            continue;

        if (auto ideal = numberField(entry, "total_rateideal"))
            snap.expected_hashrate_ths = *ideal / 1000.0;

        if (snap.fan_rpms.empty())
        {
            const std::uint32_t fan_num = countField(entry, "fan_num", kMaxFans);
            for (std::uint32_t i = 1; i <= fan_num; ++i)
            {
                const std::string key = "fan" + std::to_string(i);
                if (auto rpm = numberField(entry, key.c_str()))
                    snap.fan_rpms.push_back(*rpm);
            }
        }

        if (!snap.temperature_c)
        {
            double sum = 0.0;
            int n = 0;
            for (int i = 1; i <= 4; ++i)
            {
                const std::string key = "temp2_" + std::to_string(i);
                auto t = numberField(entry, key.c_str());
                if (t && *t > 0.0)
                {
                    sum += *t;
                    ++n;
                }
            }
            if (n > 0)
                snap.temperature_c = sum / n;
        }

        if (!snap.power_w)
        {
            if (auto power = numberField(entry, "Power"); power && *power > 0.0)
                snap.power_w = *power;
        }

        std::vector<std::uint32_t> boards;
        for (int i = 1; i <= 16; ++i)
        {
            const std::string key = "chain_acn" + std::to_string(i);
            if (numberField(entry, key.c_str()))
                boards.push_back(countField(entry, key.c_str(), kMaxChipsPerBoard));
        }
        if (boards.empty())
            continue;

        std::uint32_t chips = 0;
        for (std::uint32_t n : boards)
            chips += n;
        snap.total_chips = chips;

        if (auto per_board = antminerChipsPerBoard(snap.model))
        {
            std::uint32_t board_count = countField(entry, "miner_count", 16);
            if (board_count == 0)
                board_count = static_cast<std::uint32_t>(boards.size());
            snap.expected_chips = *per_board * board_count;
        }
        snap.board_chips = std::move(boards);
    }
}

} // namespace

CgminerApiProber::CgminerApiProber(int port)
    : port_(port)
{
}

ProbeResult CgminerApiProber::parseResponse(const std::string& payload)
{
    // Replies are NUL-terminated and some firmwares leave stray bytes around it
    std::string text = payload;
    auto nul = text.find('\0');
    if (nul != std::string::npos)
        text.resize(nul);

    json root;
    try
    {
        root = json::parse(text);
    }
    catch (const json::exception& e)
    {
        return ProbeResult::failure(ProbeStatus::Protocol, std::string("cgminer reply is not JSON: ") + e.what());
    }

    if (!root.is_object())
        return ProbeResult::failure(ProbeStatus::Protocol, "cgminer reply is not a JSON object");

    const json* version = section(root, "version", "VERSION");
    const json* summary = section(root, "summary", "SUMMARY");
    if (!version && !summary)
        return ProbeResult::failure(ProbeStatus::NoDevice, "reply carries no VERSION or SUMMARY section");

    DeviceSnapshot snap;
    if (version)
        identify((*version)[0], snap);
    if (summary)
        readSummary((*summary)[0], snap);
    if (const json* stats = section(root, "stats", "STATS"))
        readStats(*stats, snap);

    snap.is_mining = snap.hashrate_ths.value_or(0.0) > 0.0;
    return ProbeResult::success(std::move(snap));
}

ProbeResult CgminerApiProber::probe(Ipv4Address address, const DeviceFilter& filter, std::chrono::milliseconds timeout)
{
    const auto deadline = Clock::now() + timeout;
    const std::string ip = address.toString();

    SocketGuard sock(::socket(AF_INET, SOCK_STREAM, 0));
    if (sock.fd < 0)
        return ProbeResult::failure(ProbeStatus::Transport, std::string("socket: ") + std::strerror(errno));

    int flags = ::fcntl(sock.fd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(sock.fd, F_SETFL, flags | O_NONBLOCK) < 0)
        return ProbeResult::failure(ProbeStatus::Transport, std::string("fcntl: ") + std::strerror(errno));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<std::uint16_t>(port_));
    addr.sin_addr.s_addr = htonl(address.value());

    if (::connect(sock.fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0)
    {
        if (errno == ECONNREFUSED)
            return ProbeResult::failure(ProbeStatus::NoDevice, "connection refused");
        if (errno != EINPROGRESS)
            return ProbeResult::failure(ProbeStatus::Transport, std::string("connect: ") + std::strerror(errno));

        int ready = waitFor(sock.fd, POLLOUT, deadline);
        if (ready == 0)
            return ProbeResult::failure(ProbeStatus::Timeout, "connect timed out");
        if (ready < 0)
            return ProbeResult::failure(ProbeStatus::Transport, std::string("poll: ") + std::strerror(errno));

        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (::getsockopt(sock.fd, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0)
            return ProbeResult::failure(ProbeStatus::Transport, std::string("getsockopt: ") + std::strerror(errno));
        if (so_error == ECONNREFUSED)
            return ProbeResult::failure(ProbeStatus::NoDevice, "connection refused");
        if (so_error == ETIMEDOUT)
            return ProbeResult::failure(ProbeStatus::Timeout, "connect timed out");
        if (so_error != 0)
            return ProbeResult::failure(ProbeStatus::Transport, std::string("connect: ") + std::strerror(so_error));
    }

    const char* data = kRequest;
    std::size_t left = std::strlen(kRequest);
    while (left > 0)
    {
        ssize_t n = ::send(sock.fd, data, left, MSG_NOSIGNAL);
        if (n > 0)
        {
            data += n;
            left -= static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
        {
            int ready = waitFor(sock.fd, POLLOUT, deadline);
            if (ready == 0)
                return ProbeResult::failure(ProbeStatus::Timeout, "send timed out");
            if (ready > 0)
                continue;
        }
        return ProbeResult::failure(ProbeStatus::Transport, std::string("send: ") + std::strerror(errno));
    }

    std::string reply;
    char buf[4096];
    while (reply.size() < kMaxReplyBytes)
    {
        int ready = waitFor(sock.fd, POLLIN, deadline);
        if (ready == 0)
            return ProbeResult::failure(ProbeStatus::Timeout, "no reply from " + ip);
        if (ready < 0)
            return ProbeResult::failure(ProbeStatus::Transport, std::string("poll: ") + std::strerror(errno));

        ssize_t n = ::recv(sock.fd, buf, sizeof(buf), 0);
        if (n == 0)
            break;
        if (n < 0)
        {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
                continue;
            return ProbeResult::failure(ProbeStatus::Transport, std::string("recv: ") + std::strerror(errno));
        }
        reply.append(buf, static_cast<std::size_t>(n));
        if (reply.find('\0') != std::string::npos)
            break;
    }

    if (reply.empty())
        return ProbeResult::failure(ProbeStatus::NoDevice, "empty reply");

    ProbeResult result = parseResponse(reply);
    if (!result.found())
    {
        PLOG_DEBUG << "cgminer probe " << ip << ": " << result.error;
        return result;
    }

    if (!filter.matches(result.device))
        return ProbeResult::failure(ProbeStatus::Filtered, std::string(makeName(result.device.make)) + " / " +
                                                               firmwareName(result.device.firmware) +
                                                               " excluded by filter");
    return result;
}

} // namespace network
