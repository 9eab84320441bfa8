#include "core/types/ScanSettings.hpp"

#include <algorithm>
#include <stdexcept>

namespace reconpulse::core {

std::chrono::seconds ScanSettings::portScanTimeout() const {
    return std::max(timeout * 4, std::chrono::seconds{20});
}

void ScanSettings::validate() const {
    if (timeout.count() <= 0) {
        throw std::invalid_argument("timeout must be a positive number of seconds");
    }
    if (httpTimeout.count() <= 0) {
        throw std::invalid_argument("HTTP timeout must be a positive number of seconds");
    }
    if (tlsTimeout.count() <= 0) {
        throw std::invalid_argument("TLS timeout must be a positive number of seconds");
    }
}

} // namespace reconpulse::core
