/**
 * Valstore - Session Context Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "SessionContext.hpp"
#include "RiotEndpoints.hpp"

#include "core/StoreError.hpp"

#include <chrono>
#include <thread>

#include <QNetworkCookieJar>
#include <QSet>

#include <spdlog/spdlog.h>

namespace valstore {

namespace {
    constexpr const char* ACCEPT = "application/json, text/plain, */*";
    constexpr const char* ACCEPT_LANGUAGE = "ja,en-US;q=0.9,en;q=0.8";
}

SessionContext::SessionContext(std::unique_ptr<HttpTransport> transport,
                               const QString& userAgent,
                               const HttpOptions& options)
    : m_transport(std::move(transport))
    , m_cookieJar(std::make_unique<QNetworkCookieJar>())
    , m_userAgent(userAgent)
    , m_options(options)
{
}

SessionContext::~SessionContext() = default;

void SessionContext::applyCredentials(const CredentialBundle& bundle, CookieScope scope) {
    m_cookieJar = std::make_unique<QNetworkCookieJar>();

    const char* domains[] = {RiotCookieDomains::WILDCARD, RiotCookieDomains::AUTH_HOST};
    for (const auto& [name, value] : bundle.cookies(scope == CookieScope::SsidOnly)) {
        for (const char* domain : domains) {
            QNetworkCookie cookie(QByteArray::fromStdString(name),
                                  QByteArray::fromStdString(value));
            cookie.setDomain(domain);
            cookie.setPath("/");
            cookie.setSecure(true);
            cookie.setHttpOnly(true);
            m_cookieJar->insertCookie(cookie);
        }
    }
}

QByteArray SessionContext::cookieHeader(const QUrl& url) const {
    QList<QByteArray> pairs;
    QSet<QByteArray> seen;
    for (const auto& cookie : m_cookieJar->cookiesForUrl(url)) {
        if (seen.contains(cookie.name())) {
            continue;
        }
        seen.insert(cookie.name());
        pairs.append(cookie.toRawForm(QNetworkCookie::NameAndValueOnly));
    }
    return pairs.join("; ");
}

HttpResponse SessionContext::get(const QUrl& url, const HeaderList& headers,
                                 bool followRedirects) {
    HttpRequest request;
    request.method = "GET";
    request.url = url;
    request.headers = headers;
    request.followRedirects = followRedirects;
    return send(std::move(request));
}

HttpResponse SessionContext::postJson(const QUrl& url, const nlohmann::json& body,
                                      const HeaderList& headers) {
    HttpRequest request;
    request.method = "POST";
    request.url = url;
    request.headers = headers;
    request.body = QByteArray::fromStdString(body.dump());
    request.setHeader("Content-Type", "application/json");
    return send(std::move(request));
}

HttpResponse SessionContext::putJson(const QUrl& url, const nlohmann::json& body,
                                     const HeaderList& headers) {
    HttpRequest request;
    request.method = "PUT";
    request.url = url;
    request.headers = headers;
    request.body = QByteArray::fromStdString(body.dump());
    request.setHeader("Content-Type", "application/json");
    return send(std::move(request));
}

HttpResponse SessionContext::send(HttpRequest request) {
    if (request.header("User-Agent").isEmpty()) {
        request.setHeader("User-Agent", m_userAgent.toUtf8());
    }
    if (request.header("Accept").isEmpty()) {
        request.setHeader("Accept", ACCEPT);
    }
    request.setHeader("Accept-Language", ACCEPT_LANGUAGE);
    request.setHeader("Origin", RiotUrls::WEB_ORIGIN);
    request.setHeader("Referer", RiotUrls::WEB_REFERER);

    QByteArray cookies = cookieHeader(request.url);
    if (!cookies.isEmpty()) {
        request.setHeader("Cookie", cookies);
    }
    request.timeoutMs = m_options.timeoutMs;

    int backoffMs = m_options.retryBackoffMs;
    for (int retry = 0;; ++retry) {
        HttpResponse response = m_transport->send(request);

        if (!response.cookies.isEmpty()) {
            m_cookieJar->setCookiesFromUrl(response.cookies, request.url);
        }

        if (!response.isTransient() || retry >= m_options.maxTransientRetries) {
            return response;
        }

        spdlog::warn("HTTP {} {} returned {}, retrying in {} ms ({}/{})",
                     request.method.toStdString(), request.url.host().toStdString(),
                     response.status, backoffMs, retry + 1, m_options.maxTransientRetries);
        if (backoffMs > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(backoffMs));
        }
        backoffMs *= 2;
    }
}

HeaderList SessionContext::bearer(const QString& accessToken) {
    return {qMakePair(QByteArray("Authorization"), "Bearer " + accessToken.toUtf8())};
}

nlohmann::json parseJsonBody(const HttpResponse& response, const char* context) {
    try {
        return nlohmann::json::parse(response.body.constData(),
                                     response.body.constData() + response.body.size());
    } catch (const nlohmann::json::exception& e) {
        throw StoreException(StoreError::UpstreamError,
                             std::string(context) + ": response is not JSON (" + e.what() + ")",
                             response.status);
    }
}

} // namespace valstore
