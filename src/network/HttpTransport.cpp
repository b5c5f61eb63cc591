/**
 * Valstore - HTTP Transport Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "HttpTransport.hpp"

#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>

#include <spdlog/spdlog.h>

namespace valstore {

namespace {

QByteArray findHeader(const HeaderList& headers, const QByteArray& name) {
    for (const auto& header : headers) {
        if (header.first.compare(name, Qt::CaseInsensitive) == 0) {
            return header.second;
        }
    }
    return QByteArray();
}

} // anonymous namespace

QByteArray HttpRequest::header(const QByteArray& name) const {
    return findHeader(headers, name);
}

void HttpRequest::setHeader(const QByteArray& name, const QByteArray& value) {
    for (auto& header : headers) {
        if (header.first.compare(name, Qt::CaseInsensitive) == 0) {
            header.second = value;
            return;
        }
    }
    headers.append(qMakePair(name, value));
}

QByteArray HttpResponse::header(const QByteArray& name) const {
    return findHeader(headers, name);
}

QtHttpTransport::QtHttpTransport()
    : m_networkManager(std::make_unique<QNetworkAccessManager>())
{
}

QtHttpTransport::~QtHttpTransport() = default;

TransportFactory QtHttpTransport::factory() {
    return []() -> std::unique_ptr<HttpTransport> {
        return std::make_unique<QtHttpTransport>();
    };
}

HttpResponse QtHttpTransport::send(const HttpRequest& request) {
    QNetworkRequest networkRequest(request.url);
    for (const auto& header : request.headers) {
        networkRequest.setRawHeader(header.first, header.second);
    }

    // Cookies are owned by the SessionContext jar
    networkRequest.setAttribute(QNetworkRequest::CookieLoadControlAttribute,
                                QNetworkRequest::Manual);
    networkRequest.setAttribute(QNetworkRequest::CookieSaveControlAttribute,
                                QNetworkRequest::Manual);
    networkRequest.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                                request.followRedirects
                                    ? QNetworkRequest::NoLessSafeRedirectPolicy
                                    : QNetworkRequest::ManualRedirectPolicy);

    spdlog::debug("HTTP {} {}", request.method.toStdString(),
                  request.url.toString(QUrl::RemoveQuery | QUrl::RemoveFragment).toStdString());

    QEventLoop loop;
    QNetworkReply* reply = m_networkManager->sendCustomRequest(
        networkRequest, request.method, request.body);

    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);

    // Timeout handling
    QTimer timer;
    timer.setSingleShot(true);
    QObject::connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
    timer.start(request.timeoutMs);

    loop.exec();

    if (!timer.isActive()) {
        spdlog::error("HTTP request timed out after {} ms", request.timeoutMs);
        reply->abort();
        reply->deleteLater();
        throw HttpError("Request timed out");
    }

    timer.stop();

    QVariant statusAttribute = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    if (!statusAttribute.isValid()) {
        QString errorMsg = reply->errorString();
        spdlog::error("HTTP request failed: {}", errorMsg.toStdString());
        reply->deleteLater();
        throw HttpError(errorMsg.toStdString());
    }

    HttpResponse response;
    response.status = statusAttribute.toInt();
    response.headers = reply->rawHeaderPairs();
    response.body = reply->readAll();

    QVariant setCookies = reply->header(QNetworkRequest::SetCookieHeader);
    if (setCookies.isValid()) {
        response.cookies = setCookies.value<QList<QNetworkCookie>>();
    }

    reply->deleteLater();

    spdlog::debug("HTTP {} -> {} ({} bytes)", request.method.toStdString(),
                  response.status, response.body.size());

    return response;
}

} // namespace valstore
