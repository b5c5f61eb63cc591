/**
 * Valstore - HTTP Transport
 *
 * Minimal synchronous HTTP abstraction used by every provider call.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

#include <QByteArray>
#include <QList>
#include <QNetworkCookie>
#include <QPair>
#include <QUrl>

class QNetworkAccessManager;

namespace valstore {

using HeaderList = QList<QPair<QByteArray, QByteArray>>;

/**
 * Transport failure without an HTTP status (DNS, TLS, timeout)
 */
class HttpError : public std::runtime_error {
public:
    explicit HttpError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * Outgoing request
 */
struct HttpRequest {
    QByteArray method = "GET";
    QUrl url;
    HeaderList headers;
    QByteArray body;
    bool followRedirects = true;
    int timeoutMs = 15000;

    /**
     * Case-insensitive header lookup, empty if absent
     */
    QByteArray header(const QByteArray& name) const;
    void setHeader(const QByteArray& name, const QByteArray& value);
};

/**
 * Received response
 */
struct HttpResponse {
    int status = 0;
    HeaderList headers;
    QByteArray body;
    QList<QNetworkCookie> cookies;   // Parsed Set-Cookie headers

    QByteArray header(const QByteArray& name) const;

    bool isSuccess() const { return status >= 200 && status < 300; }
    bool isRedirect() const {
        return status == 301 || status == 302 || status == 303 ||
               status == 307 || status == 308;
    }
    bool isTransient() const {
        return status == 409 || status == 429 || status >= 500;
    }
};

/**
 * Abstract HTTP transport
 *
 * One transport belongs to one SessionContext. Implementations must not
 * keep cookies of their own.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /**
     * Send a request and wait for the response
     *
     * @throws HttpError when no HTTP status was received
     */
    virtual HttpResponse send(const HttpRequest& request) = 0;
};

using TransportFactory = std::function<std::unique_ptr<HttpTransport>()>;

/**
 * Transport backed by QNetworkAccessManager
 *
 * Blocks the calling thread on a local event loop, like every other
 * network call in this code base.
 */
class QtHttpTransport : public HttpTransport {
public:
    QtHttpTransport();
    ~QtHttpTransport() override;

    HttpResponse send(const HttpRequest& request) override;

    /**
     * Factory producing a fresh transport per session
     */
    static TransportFactory factory();

private:
    std::unique_ptr<QNetworkAccessManager> m_networkManager;
};

} // namespace valstore
