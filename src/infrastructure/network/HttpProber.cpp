#include "infrastructure/network/HttpProber.hpp"

#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QUrl>
#include <spdlog/spdlog.h>

#include <memory>
#include <utility>
#include <vector>

namespace reconpulse::infra {

namespace {

std::vector<std::pair<std::string, std::string>> rawHeaders(const QNetworkReply& reply) {
    std::vector<std::pair<std::string, std::string>> headers;
    for (const auto& [name, value] : reply.rawHeaderPairs()) {
        headers.emplace_back(name.toStdString(), value.toStdString());
    }
    return headers;
}

} // namespace

HttpProber::HttpProber(std::string userAgent) : userAgent_(std::move(userAgent)) {}

core::HttpProbeOutcome HttpProber::probe(const std::string& url, std::chrono::seconds timeout) {
    auto timeoutMs = std::chrono::duration_cast<std::chrono::milliseconds>(timeout);

    QNetworkAccessManager manager;
    QNetworkRequest request(QUrl(QString::fromStdString(url)));
    request.setRawHeader("User-Agent", QByteArray::fromStdString(userAgent_));
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                         QNetworkRequest::NoLessSafeRedirectPolicy);
    request.setTransferTimeout(static_cast<int>(timeoutMs.count()));

    spdlog::debug("HTTP GET {}", url);

    std::unique_ptr<QNetworkReply> reply(manager.get(request));
    if (!reply) {
        return core::HttpProbeOutcome::failed(url, "Failed to create network request");
    }

    if (!reply->isFinished()) {
        QEventLoop loop;
        QObject::connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
        loop.exec();
    }

    auto statusAttr = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    if (!statusAttr.isValid()) {
        std::string error = reply->error() == QNetworkReply::OperationCanceledError
                                ? "timed out after " + std::to_string(timeout.count()) + " seconds"
                                : reply->errorString().toStdString();
        spdlog::debug("HTTP probe of {} failed: {}", url, error);
        return core::HttpProbeOutcome::failed(url, error);
    }

    auto headers = core::normalizeHeaders(rawHeaders(*reply));

    core::HttpProbeOutcome outcome;
    outcome.url = url;
    outcome.statusCode = statusAttr.toInt();
    if (auto it = headers.find("server"); it != headers.end()) {
        outcome.server = it->second;
    }
    outcome.securityHeaders = core::extractSecurityHeaders(headers);

    if (reply->error() == QNetworkReply::NoError) {
        outcome.ok = true;
    } else {
        auto reason = reply->attribute(QNetworkRequest::HttpReasonPhraseAttribute).toString();
        outcome.ok = false;
        outcome.error = "HTTP Error " + std::to_string(*outcome.statusCode) + ": " +
                        reason.toStdString();
    }

    spdlog::debug("HTTP probe of {} returned {}", url, *outcome.statusCode);
    return outcome;
}

} // namespace reconpulse::infra
