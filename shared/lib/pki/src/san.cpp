#include "certmgr/pki/san.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sstream>

namespace certmgr::pki {

bool isIpAddress(const std::string& value) {
    unsigned char buf[sizeof(struct in6_addr)];
    return inet_pton(AF_INET, value.c_str(), buf) == 1 ||
           inet_pton(AF_INET6, value.c_str(), buf) == 1;
}

std::string sanToString(const std::vector<std::string>& san) {
    std::string result;
    for (const auto& value : san) {
        if (!result.empty()) result += ", ";
        result += (isIpAddress(value) ? "IP: " : "DNS: ") + value;
    }
    return result;
}

std::vector<std::string> splitSan(const std::string& stored) {
    std::vector<std::string> values;
    std::istringstream stream(stored);
    std::string value;
    while (stream >> value) {
        values.push_back(value);
    }
    return values;
}

std::string joinSan(const std::vector<std::string>& san) {
    std::string result;
    for (const auto& value : san) {
        if (value.empty()) continue;
        if (!result.empty()) result += ' ';
        result += value;
    }
    return result;
}

} // namespace certmgr::pki
