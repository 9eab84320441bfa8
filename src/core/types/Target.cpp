#include "core/types/Target.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <utility>

namespace reconpulse::core {

Target::Target(std::string host) : host_(std::move(host)), ipLiteral_(isIpAddress(host_)) {}

std::string Target::urlHost() const {
    if (ipLiteral_ && host_.find(':') != std::string::npos) {
        return "[" + host_ + "]";
    }
    return host_;
}

bool Target::isIpAddress(const std::string& host) {
    if (host.empty()) {
        return false;
    }

    in_addr v4{};
    if (inet_pton(AF_INET, host.c_str(), &v4) == 1) {
        return true;
    }

    in6_addr v6{};
    return inet_pton(AF_INET6, host.c_str(), &v6) == 1;
}

} // namespace reconpulse::core
