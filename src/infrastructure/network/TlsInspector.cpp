#include "infrastructure/network/TlsInspector.hpp"

#include "core/util/Timestamp.hpp"

#include <QDateTime>
#include <QLocale>
#include <QSslCertificate>
#include <QSslCipher>
#include <QSslSocket>
#include <QStringList>
#include <spdlog/spdlog.h>

#include <map>
#include <optional>
#include <string>

namespace reconpulse::infra {

namespace {

const std::map<std::string, std::string>& attributeNames() {
    static const std::map<std::string, std::string> names = {
        {"C", "countryName"},         {"ST", "stateOrProvinceName"},
        {"L", "localityName"},        {"O", "organizationName"},
        {"OU", "organizationalUnitName"}, {"CN", "commonName"},
        {"emailAddress", "emailAddress"}, {"serialNumber", "serialNumber"}};
    return names;
}

core::DistinguishedName toDistinguishedName(const QSslCertificate& cert, bool subject) {
    core::DistinguishedName name;
    const auto attributes = subject ? cert.subjectInfoAttributes() : cert.issuerInfoAttributes();
    for (const auto& attribute : attributes) {
        const auto values = subject ? cert.subjectInfo(attribute) : cert.issuerInfo(attribute);
        auto key = attribute.toStdString();
        if (auto it = attributeNames().find(key); it != attributeNames().end()) {
            key = it->second;
        }
        for (const auto& value : values) {
            name.push_back({key, value.toStdString()});
        }
    }
    return name;
}

// Renders a certificate time the way peer certificates print it, e.g. "Jan 01 00:00:00 2025 GMT".
std::optional<std::string> certTimeText(const QDateTime& time) {
    if (!time.isValid()) {
        return std::nullopt;
    }
    return QLocale::c().toString(time.toUTC(), "MMM dd HH:mm:ss yyyy 'GMT'").toStdString();
}

std::string handshakeError(const QSslSocket& socket) {
    QStringList messages;
    for (const auto& error : socket.sslHandshakeErrors()) {
        messages << error.errorString();
    }
    if (messages.isEmpty()) {
        return socket.errorString().toStdString();
    }
    return messages.join("; ").toStdString();
}

} // namespace

core::TlsResult TlsInspector::inspect(const std::string& host, uint16_t port,
                                      std::chrono::seconds timeout) {
    auto timeoutMs =
        static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count());

    QSslSocket socket;
    socket.connectToHostEncrypted(QString::fromStdString(host), port);
    if (!socket.waitForEncrypted(timeoutMs)) {
        auto error = socket.error() == QAbstractSocket::SocketTimeoutError
                         ? "TLS handshake timed out after " + std::to_string(timeout.count()) +
                               " seconds"
                         : handshakeError(socket);
        spdlog::debug("TLS inspection of {}:{} failed: {}", host, port, error);
        socket.abort();
        return core::TlsResult::failed(error);
    }

    const auto cert = socket.peerCertificate();
    const auto cipher = socket.sessionCipher();

    core::TlsResult result;
    result.ok = true;
    result.subject = toDistinguishedName(cert, true);
    result.issuer = toDistinguishedName(cert, false);

    const auto alternatives = cert.subjectAlternativeNames();
    for (auto it = alternatives.cbegin(); it != alternatives.cend(); ++it) {
        result.san.push_back(it.value().toStdString());
    }

    result.notBefore = core::certTimeToIso(certTimeText(cert.effectiveDate()));
    result.notAfter = core::certTimeToIso(certTimeText(cert.expiryDate()));
    result.protocol = cipher.protocolString().toStdString();
    result.cipher = core::CipherInfo{cipher.name().toStdString(),
                                     cipher.protocolString().toStdString(), cipher.usedBits()};

    socket.disconnectFromHost();

    spdlog::debug("TLS inspection of {}:{} ok, notAfter={}", host, port,
                  result.notAfter.value_or("n/a"));
    return result;
}

} // namespace reconpulse::infra
