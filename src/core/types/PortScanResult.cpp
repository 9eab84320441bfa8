#include "core/types/PortScanResult.hpp"

#include <algorithm>
#include <iterator>
#include <sstream>

namespace reconpulse::core {

std::vector<ServiceEntry> PortScanResult::parseServiceLines(const std::string& output) {
    std::vector<ServiceEntry> services;
    std::istringstream lines(output);
    std::string line;

    while (std::getline(lines, line)) {
        if (line.find("/tcp") == std::string::npos) {
            continue;
        }

        std::istringstream words(line);
        std::vector<std::string> parts{std::istream_iterator<std::string>(words),
                                       std::istream_iterator<std::string>()};
        if (parts.size() < 3 || std::find(parts.begin(), parts.end(), "open") == parts.end()) {
            continue;
        }

        ServiceEntry entry;
        entry.port = parts[0];
        entry.state = parts[1];
        entry.service = parts[2];
        for (size_t i = 3; i < parts.size(); ++i) {
            if (i > 3) {
                entry.version += ' ';
            }
            entry.version += parts[i];
        }
        services.push_back(std::move(entry));
    }

    return services;
}

const std::unordered_map<uint16_t, std::string>& ServiceDetector::getKnownServices() {
    static const std::unordered_map<uint16_t, std::string> services = {
        {21, "ftp"},        {22, "ssh"},        {23, "telnet"},      {25, "smtp"},
        {53, "domain"},     {80, "http"},       {110, "pop3"},       {111, "rpcbind"},
        {135, "msrpc"},     {139, "netbios-ssn"}, {143, "imap"},     {443, "https"},
        {445, "microsoft-ds"}, {993, "imaps"},  {995, "pop3s"},      {1433, "ms-sql-s"},
        {1521, "oracle"},   {3306, "mysql"},    {3389, "ms-wbt-server"}, {5432, "postgresql"},
        {5900, "vnc"},      {6379, "redis"},    {8080, "http-proxy"}, {8443, "https-alt"},
        {9200, "elasticsearch"}, {11211, "memcache"}, {27017, "mongodb"}};
    return services;
}

std::string ServiceDetector::detectService(uint16_t port) {
    const auto& services = getKnownServices();
    auto it = services.find(port);
    return it != services.end() ? it->second : "unknown";
}

std::vector<uint16_t> ServiceDetector::commonPorts() {
    std::vector<uint16_t> ports;
    ports.reserve(getKnownServices().size());
    for (const auto& [port, name] : getKnownServices()) {
        ports.push_back(port);
    }
    std::sort(ports.begin(), ports.end());
    return ports;
}

} // namespace reconpulse::core
