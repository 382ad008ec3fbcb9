#include "analyzer/http_transport.hpp"

#include <memory>

#include <QEventLoop>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>

#include "common/logging.hpp"

namespace mirulog {

namespace {

struct ReplyDeleter {
    void operator()(QNetworkReply *reply) const
    {
        if (reply) {
            reply->deleteLater();
        }
    }
};

using ReplyPtr = std::unique_ptr<QNetworkReply, ReplyDeleter>;

} // namespace

std::optional<QByteArray> HttpResponse::header(const QByteArray &name) const
{
    const QByteArray wanted = name.toLower();
    for (const auto &entry : headers) {
        if (entry.first.toLower() == wanted) {
            return entry.second;
        }
    }
    return std::nullopt;
}

HttpResponse QtHttpTransport::send(const HttpRequest &request)
{
    QNetworkRequest networkRequest(request.url);
    for (const auto &header : request.headers) {
        networkRequest.setRawHeader(header.first, header.second);
    }

    ReplyPtr reply(request.method == "POST"
                       ? m_manager.post(networkRequest, request.body)
                       : m_manager.get(networkRequest));

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    bool timedOut = false;
    QObject::connect(&timer, &QTimer::timeout, &loop, [&]() {
        timedOut = true;
        reply->abort();
    });
    QObject::connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
    timer.start(static_cast<int>(request.timeout.count()));
    if (!reply->isFinished()) {
        loop.exec();
    }
    timer.stop();

    HttpResponse response;
    const QVariant statusAttr = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    if (statusAttr.isValid()) {
        response.status = statusAttr.toInt();
    }
    response.body = reply->readAll();
    for (const auto &pair : reply->rawHeaderPairs()) {
        response.headers.emplace_back(pair.first, pair.second);
    }

    if (timedOut) {
        response.error = TransportError::Timeout;
        response.errorString = QStringLiteral("request timed out");
    } else if (response.status == 0 && reply->error() != QNetworkReply::NoError) {
        response.error = reply->error() == QNetworkReply::ConnectionRefusedError
            ? TransportError::ConnectionRefused
            : TransportError::Network;
        response.errorString = reply->errorString();
    }

    if (response.error != TransportError::None) {
        MLOG_DEBUG(QStringLiteral("QtHttpTransport"),
                   QStringLiteral("send"),
                   QStringLiteral("http_transport_error"),
                   QStringLiteral("no HTTP response received"),
                   QStringLiteral("QNetworkAccessManager"),
                   mirulog::logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"url", request.url.toString(QUrl::RemoveQuery).toStdString()},
                                  {"error", response.errorString.toStdString()}});
    }

    return response;
}

} // namespace mirulog
