#include "infrastructure/network/DnsResolver.hpp"

#include "core/types/Target.hpp"

#include <QDnsLookup>
#include <QEventLoop>
#include <QHostAddress>
#include <QHostInfo>
#include <QTimer>
#include <spdlog/spdlog.h>

#include <map>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace reconpulse::infra {

namespace {

const std::map<std::string, QDnsLookup::Type>& lookupTypes() {
    static const std::map<std::string, QDnsLookup::Type> types = {
        {"A", QDnsLookup::A},   {"AAAA", QDnsLookup::AAAA}, {"CNAME", QDnsLookup::CNAME},
        {"NS", QDnsLookup::NS}, {"MX", QDnsLookup::MX},     {"TXT", QDnsLookup::TXT}};
    return types;
}

std::string absoluteName(const QString& name) {
    auto text = name.toStdString();
    if (!text.empty() && text.back() != '.') {
        text += '.';
    }
    return text;
}

std::optional<std::string> firstAddress(const QHostInfo& info) {
    const auto addresses = info.addresses();
    for (const auto& address : addresses) {
        if (address.protocol() == QAbstractSocket::IPv4Protocol) {
            return address.toString().toStdString();
        }
    }
    if (!addresses.isEmpty()) {
        return addresses.first().toString().toStdString();
    }
    return std::nullopt;
}

} // namespace

core::DnsResult DnsResolver::resolve(const std::string& target, std::chrono::seconds lifetime) {
    core::DnsResult result;
    result.target = target;

    if (core::Target::isIpAddress(target)) {
        result.resolvedIp = target;
        return result;
    }

    for (const auto& type : core::kDnsRecordTypes) {
        result.records[type] = {};
    }

    auto info = QHostInfo::fromName(QString::fromStdString(target));
    if (info.error() != QHostInfo::NoError) {
        result.errors.push_back("Resolution failed: " + info.errorString().toStdString());
    } else {
        result.resolvedIp = firstAddress(info);
        if (!result.resolvedIp) {
            result.errors.push_back("Resolution failed: no addresses returned");
        }
    }

    QEventLoop loop;
    QTimer deadline;
    deadline.setSingleShot(true);
    QObject::connect(&deadline, &QTimer::timeout, &loop, &QEventLoop::quit);

    std::vector<std::pair<std::string, std::unique_ptr<QDnsLookup>>> lookups;
    int pending = 0;

    for (const auto& type : core::kDnsRecordTypes) {
        auto lookup = std::make_unique<QDnsLookup>(lookupTypes().at(type),
                                                   QString::fromStdString(target));
        QObject::connect(lookup.get(), &QDnsLookup::finished, &loop, [&pending, &loop]() {
            if (--pending == 0) {
                loop.quit();
            }
        });
        ++pending;
        lookup->lookup();
        lookups.emplace_back(type, std::move(lookup));
    }

    if (pending > 0) {
        deadline.start(std::chrono::duration_cast<std::chrono::milliseconds>(lifetime));
        loop.exec();
    }

    for (auto& [type, lookup] : lookups) {
        if (!lookup->isFinished()) {
            lookup->abort();
            result.errors.push_back(type + " lookup failed: timed out after " +
                                    std::to_string(lifetime.count()) + " seconds");
            continue;
        }

        switch (lookup->error()) {
        case QDnsLookup::NoError:
            result.records[type] = recordsToText(*lookup);
            break;
        case QDnsLookup::NotFoundError:
            break;
        default:
            result.errors.push_back(type + " lookup failed: " +
                                    lookup->errorString().toStdString());
            break;
        }
    }

    spdlog::debug("DNS for {}: resolved={} errors={}", target, result.resolvedIp.value_or("n/a"),
                  result.errors.size());
    return result;
}

std::vector<std::string> DnsResolver::recordsToText(const QDnsLookup& lookup) {
    std::vector<std::string> records;

    switch (lookup.type()) {
    case QDnsLookup::A:
    case QDnsLookup::AAAA:
        for (const auto& record : lookup.hostAddressRecords()) {
            records.push_back(record.value().toString().toStdString());
        }
        break;
    case QDnsLookup::CNAME:
        for (const auto& record : lookup.canonicalNameRecords()) {
            records.push_back(absoluteName(record.value()));
        }
        break;
    case QDnsLookup::NS:
        for (const auto& record : lookup.nameServerRecords()) {
            records.push_back(absoluteName(record.value()));
        }
        break;
    case QDnsLookup::MX:
        for (const auto& record : lookup.mailExchangeRecords()) {
            records.push_back(std::to_string(record.preference()) + " " +
                              absoluteName(record.exchange()));
        }
        break;
    case QDnsLookup::TXT:
        for (const auto& record : lookup.textRecords()) {
            std::string text;
            for (const auto& chunk : record.values()) {
                if (!text.empty()) {
                    text += ' ';
                }
                text += '"' + chunk.toStdString() + '"';
            }
            records.push_back(text);
        }
        break;
    default:
        break;
    }

    return records;
}

} // namespace reconpulse::infra
