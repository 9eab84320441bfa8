#pragma once

#include <string>

namespace reconpulse::core {

/**
 * @brief A host under scan, classified once as IP literal or name.
 *
 * The classification is computed at construction and never changes, so every
 * probe of a run sees the same answer.
 */
class Target {
public:
    explicit Target(std::string host);

    [[nodiscard]] const std::string& host() const { return host_; }
    [[nodiscard]] bool isIpLiteral() const { return ipLiteral_; }

    /**
     * @brief Host as it appears in a URL authority; IPv6 literals are bracketed.
     */
    [[nodiscard]] std::string urlHost() const;

    /**
     * @brief Checks whether a string is a literal IPv4 or IPv6 address.
     * @param host Host string to classify.
     * @return True for "127.0.0.1", "2001:db8::1" and similar.
     */
    static bool isIpAddress(const std::string& host);

private:
    std::string host_;
    bool ipLiteral_{false};
};

} // namespace reconpulse::core
