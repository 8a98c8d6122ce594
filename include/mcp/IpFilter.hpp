#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace secure_fs {

// Client allow-list: exact addresses plus IPv4/IPv6 CIDR subnets.
// An empty filter admits everyone.
class IpFilter {
public:
    IpFilter() = default;

    // Throws std::invalid_argument on a malformed address or subnet.
    IpFilter(const std::vector<std::string>& allowed_ips, const std::vector<std::string>& allowed_subnets);

    bool allows(const std::string& address) const;
    bool empty() const { return addresses_.empty() && subnets_.empty(); }

    // "IPs=[...], Subnets=[...]" for the startup log.
    std::string describe() const;

    struct Address {
        int family = 0; // AF_INET or AF_INET6
        std::array<std::uint8_t, 16> bytes{};
    };

private:
    struct Subnet {
        Address network;
        int prefix = 0;
        std::string text;
    };

    std::vector<Address> addresses_;
    std::vector<std::string> address_texts_;
    std::vector<Subnet> subnets_;
};

}
