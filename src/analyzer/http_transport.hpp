#pragma once

#include <chrono>
#include <optional>
#include <utility>
#include <vector>

#include <QByteArray>
#include <QNetworkAccessManager>
#include <QString>
#include <QUrl>

namespace mirulog {

enum class TransportError {
    None,
    ConnectionRefused,
    Timeout,
    Network
};

struct HttpRequest {
    QByteArray method = "GET";
    QUrl url;
    std::vector<std::pair<QByteArray, QByteArray>> headers;
    QByteArray body;
    std::chrono::milliseconds timeout{120000};
};

struct HttpResponse {
    // 0 when no HTTP response was received; see error.
    int status = 0;
    QByteArray body;
    std::vector<std::pair<QByteArray, QByteArray>> headers;
    TransportError error = TransportError::None;
    QString errorString;

    // Case-insensitive lookup.
    std::optional<QByteArray> header(const QByteArray &name) const;
};

// Blocking HTTP seam used by the backends. Never throws for HTTP or network
// failures; they are reported in the response.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual HttpResponse send(const HttpRequest &request) = 0;
};

// QNetworkAccessManager driven by a local event loop. Requires a
// QCoreApplication instance.
class QtHttpTransport : public HttpTransport {
public:
    HttpResponse send(const HttpRequest &request) override;

    // Replies are parented here until their deferred deletion runs.
    QNetworkAccessManager &networkManager() { return m_manager; }

private:
    QNetworkAccessManager m_manager;
};

} // namespace mirulog
