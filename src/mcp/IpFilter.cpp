#include "mcp/IpFilter.hpp"
#include <arpa/inet.h>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <sstream>
#include <stdexcept>

namespace secure_fs {

namespace {

constexpr std::uint8_t kMappedPrefix[12] = {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0xff, 0xff};

// Accepts dotted IPv4 and textual IPv6; "::ffff:a.b.c.d" is folded to IPv4.
bool parse_address(const std::string& text, IpFilter::Address& out) {
    std::string host = text;
    if (host.size() > 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    std::size_t zone = host.find('%');
    if (zone != std::string::npos) host.resize(zone);

    in_addr v4{};
    if (inet_pton(AF_INET, host.c_str(), &v4) == 1) {
        out.family = AF_INET;
        out.bytes.fill(0);
        std::memcpy(out.bytes.data(), &v4, 4);
        return true;
    }

    in6_addr v6{};
    if (inet_pton(AF_INET6, host.c_str(), &v6) == 1) {
        if (std::memcmp(&v6, kMappedPrefix, sizeof(kMappedPrefix)) == 0) {
            out.family = AF_INET;
            out.bytes.fill(0);
            std::memcpy(out.bytes.data(), reinterpret_cast<const std::uint8_t*>(&v6) + 12, 4);
        } else {
            out.family = AF_INET6;
            std::memcpy(out.bytes.data(), &v6, 16);
        }
        return true;
    }
    return false;
}

int address_bits(int family) {
    return family == AF_INET ? 32 : 128;
}

bool prefix_matches(const IpFilter::Address& a, const IpFilter::Address& b, int prefix) {
    int full = prefix / 8;
    if (std::memcmp(a.bytes.data(), b.bytes.data(), static_cast<std::size_t>(full)) != 0) return false;
    int rest = prefix % 8;
    if (rest == 0) return true;
    auto mask = static_cast<std::uint8_t>(0xff << (8 - rest));
    return (a.bytes[full] & mask) == (b.bytes[full] & mask);
}

void mask_host_bits(IpFilter::Address& a, int prefix) {
    int bits = address_bits(a.family);
    for (int bit = prefix; bit < bits; ++bit) {
        a.bytes[bit / 8] &= static_cast<std::uint8_t>(~(0x80 >> (bit % 8)));
    }
}

bool same(const IpFilter::Address& a, const IpFilter::Address& b) {
    return a.family == b.family && a.bytes == b.bytes;
}

}

IpFilter::IpFilter(const std::vector<std::string>& allowed_ips, const std::vector<std::string>& allowed_subnets) {
    for (const auto& ip : allowed_ips) {
        Address addr;
        if (!parse_address(ip, addr)) {
            throw std::invalid_argument("invalid IP address " + ip);
        }
        addresses_.push_back(addr);
        address_texts_.push_back(ip);
    }

    for (const auto& cidr : allowed_subnets) {
        std::size_t slash = cidr.find('/');
        if (slash == std::string::npos) {
            throw std::invalid_argument("invalid subnet " + cidr + ": missing prefix length");
        }
        Subnet subnet;
        subnet.text = cidr;
        if (!parse_address(cidr.substr(0, slash), subnet.network)) {
            throw std::invalid_argument("invalid subnet " + cidr + ": bad address");
        }

        std::string len = cidr.substr(slash + 1);
        if (len.empty() || len.size() > 3 || !std::all_of(len.begin(), len.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
            throw std::invalid_argument("invalid subnet " + cidr + ": bad prefix length");
        }
        subnet.prefix = std::stoi(len);
        // A mapped "::ffff:10.0.0.0/104" folds to IPv4 with the prefix shifted accordingly.
        if (subnet.network.family == AF_INET && cidr.find(':') != std::string::npos) {
            subnet.prefix -= 96;
        }
        if (subnet.prefix < 0 || subnet.prefix > address_bits(subnet.network.family)) {
            throw std::invalid_argument("invalid subnet " + cidr + ": prefix length out of range");
        }
        mask_host_bits(subnet.network, subnet.prefix);
        subnets_.push_back(subnet);
    }
}

bool IpFilter::allows(const std::string& address) const {
    if (empty()) return true;

    Address client;
    if (!parse_address(address, client)) return false;

    for (const auto& allowed : addresses_) {
        if (same(allowed, client)) return true;
    }
    for (const auto& subnet : subnets_) {
        if (subnet.network.family == client.family && prefix_matches(subnet.network, client, subnet.prefix)) {
            return true;
        }
    }
    return false;
}

std::string IpFilter::describe() const {
    std::stringstream ss;
    ss << "IPs=[";
    for (std::size_t i = 0; i < address_texts_.size(); ++i) {
        if (i > 0) ss << ", ";
        ss << address_texts_[i];
    }
    ss << "], Subnets=[";
    for (std::size_t i = 0; i < subnets_.size(); ++i) {
        if (i > 0) ss << ", ";
        ss << subnets_[i].text;
    }
    ss << "]";
    return ss.str();
}

}
