#include <sstv/authenticator.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netpacket/packet.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <cstdio>
#include <cstring>

static std::string format_mac(const unsigned char* addr) {
    char buf[18];
    snprintf(buf, sizeof(buf), "%02x:%02x:%02x:%02x:%02x:%02x",
             addr[0], addr[1], addr[2], addr[3], addr[4], addr[5]);
    return buf;
}

static bool is_zero_mac(const unsigned char* addr) {
    for (int i = 0; i < 6; i++) {
        if (addr[i] != 0) return false;
    }
    return true;
}

std::string detect_local_mac(const std::string& local_ip) {
    struct ifaddrs* list = nullptr;
    if (getifaddrs(&list) != 0) {
        return SSTV_FALLBACK_MAC;
    }

    // Interface that carries the connection
    std::string iface;
    for (struct ifaddrs* p = list; p != nullptr; p = p->ifa_next) {
        if (!p->ifa_addr || p->ifa_addr->sa_family != AF_INET) continue;

        char ip[INET_ADDRSTRLEN];
        auto* sin = reinterpret_cast<struct sockaddr_in*>(p->ifa_addr);
        if (inet_ntop(AF_INET, &sin->sin_addr, ip, sizeof(ip)) && local_ip == ip) {
            iface = p->ifa_name;
            break;
        }
    }

    std::string iface_mac;
    std::string first_mac;
    for (struct ifaddrs* p = list; p != nullptr; p = p->ifa_next) {
        if (!p->ifa_addr || p->ifa_addr->sa_family != AF_PACKET) continue;

        auto* ll = reinterpret_cast<struct sockaddr_ll*>(p->ifa_addr);
        if (ll->sll_halen != 6 || is_zero_mac(ll->sll_addr)) continue;

        std::string mac = format_mac(ll->sll_addr);
        if (!iface.empty() && iface == p->ifa_name) {
            iface_mac = mac;
        }
        if (first_mac.empty() && !(p->ifa_flags & IFF_LOOPBACK)) {
            first_mac = mac;
        }
    }

    freeifaddrs(list);

    if (!iface_mac.empty()) return iface_mac;
    if (!first_mac.empty()) return first_mac;
    return SSTV_FALLBACK_MAC;
}
