/**
 * Valstore - Session Context
 *
 * One HTTP client with its own cookie jar, owned by exactly one
 * reauthentication attempt.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <memory>

#include <QString>

#include <nlohmann/json.hpp>

#include "HttpTransport.hpp"
#include "core/credentials/CredentialBundle.hpp"

class QNetworkCookieJar;

namespace valstore {

/**
 * Which cookies an attempt sends
 */
enum class CookieScope {
    SsidOnly,
    Full
};

/**
 * Per-call network limits
 */
struct HttpOptions {
    int timeoutMs = 15000;
    int maxTransientRetries = 3;   // Retries on 409/429/5xx only
    int retryBackoffMs = 500;      // Doubled after every retry
};

/**
 * HTTP session bound to one attempt
 *
 * Stamps the web-client headers on every request, sends the cookies of
 * its own jar and keeps cookies set by the provider. Sessions are never
 * shared, so SsidOnly and Full attempts see different jars.
 */
class SessionContext {
public:
    SessionContext(std::unique_ptr<HttpTransport> transport,
                   const QString& userAgent,
                   const HttpOptions& options = HttpOptions());
    ~SessionContext();

    SessionContext(const SessionContext&) = delete;
    SessionContext& operator=(const SessionContext&) = delete;

    /**
     * Replace the jar content with the bundle's cookies
     *
     * Every cookie is set for both the wildcard domain and the auth host
     * so the legacy and current endpoints both see it.
     */
    void applyCredentials(const CredentialBundle& bundle, CookieScope scope);

    HttpResponse get(const QUrl& url, const HeaderList& headers = {},
                     bool followRedirects = true);
    HttpResponse postJson(const QUrl& url, const nlohmann::json& body,
                          const HeaderList& headers = {});
    HttpResponse putJson(const QUrl& url, const nlohmann::json& body,
                         const HeaderList& headers = {});

    /**
     * Send a request with session headers, cookies and transient retries
     *
     * @throws HttpError on transport failure
     */
    HttpResponse send(HttpRequest request);

    /**
     * Authorization header for a bearer token
     */
    static HeaderList bearer(const QString& accessToken);

private:
    QByteArray cookieHeader(const QUrl& url) const;

    std::unique_ptr<HttpTransport> m_transport;
    std::unique_ptr<QNetworkCookieJar> m_cookieJar;
    QString m_userAgent;
    HttpOptions m_options;
};

/**
 * Parse a JSON response body
 *
 * @param context Short name of the call for error messages
 * @throws StoreException (UpstreamError) if the body is not JSON
 */
nlohmann::json parseJsonBody(const HttpResponse& response, const char* context);

} // namespace valstore
