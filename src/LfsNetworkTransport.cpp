#include "LfsNetworkTransport.h"
#include "LfsError.h"

#include <QDebug>
#include <QNetworkAccessManager>
#include <QNetworkRequest>
#include <memory>

#include "asyncfuture.h"

namespace {
constexpr int ErrorBodyPreviewBytes = 512;

QString responseBodyPreview(const QByteArray& body)
{
    if (body.isEmpty()) {
        return QString();
    }

    const bool truncated = body.size() > ErrorBodyPreviewBytes;
    const QByteArray previewBytes = truncated ? body.left(ErrorBodyPreviewBytes) : body;
    const QString previewText = QString::fromUtf8(previewBytes).simplified();
    if (previewText.isEmpty()) {
        return QString();
    }

    if (truncated) {
        return QStringLiteral("%1 [truncated]").arg(previewText);
    }
    return previewText;
}

QString enrichReplyErrorMessage(const QString& baseMessage, QNetworkReply* reply, const QByteArray& body)
{
    QString message = baseMessage;
    message += QStringLiteral(" [networkError=%1").arg(static_cast<int>(reply->error()));

    const QString detail = reply->errorString();
    if (!detail.isEmpty()) {
        message += QStringLiteral(", detail=\"%1\"").arg(detail);
    }

    const QString bodyPreview = responseBodyPreview(body);
    if (!bodyPreview.isEmpty()) {
        message += QStringLiteral(", response=\"%1\"").arg(bodyPreview);
    }

    message += QLatin1Char(']');
    return message;
}

}

namespace QLfs {

LfsNetworkTransport::LfsNetworkTransport(int timeoutMs)
    : mTimeoutMs(timeoutMs > 0 ? timeoutMs : DefaultTimeoutMs)
{
}

Monad::Result<LfsHttpResponse> LfsNetworkTransport::send(const LfsHttpRequest& request) const
{
    if (!request.url.isValid()) {
        return Monad::Result<LfsHttpResponse>(QStringLiteral("Invalid request URL: %1").arg(request.url.toString()),
                                              static_cast<int>(LfsErrorCode::Transport));
    }

    QNetworkAccessManager manager;
    QNetworkRequest networkRequest(request.url);
    for (const auto& header : request.headers) {
        networkRequest.setRawHeader(header.first, header.second);
    }
    networkRequest.setTransferTimeout(mTimeoutMs);

    std::unique_ptr<QNetworkReply> reply(manager.sendCustomRequest(networkRequest, request.method, request.body));
    if (!reply) {
        return Monad::Result<LfsHttpResponse>(QStringLiteral("Missing LFS reply"),
                                              static_cast<int>(LfsErrorCode::Transport));
    }

    auto finished = AsyncFuture::observe(reply.get(), &QNetworkReply::finished).future();

    //A stalled reply is aborted by the transfer timeout and still emits finished
    while (!reply->isFinished() && !AsyncFuture::waitForFinished(finished, mTimeoutMs)) {
        qDebug() << "[LFS transport] still waiting on" << request.method << request.url.toString(QUrl::RemoveUserInfo);
    }

    const QByteArray body = reply->readAll();
    const QVariant statusAttribute = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    if (!statusAttribute.isValid()) {
        const QString base = isOfflineError(reply->error())
                                 ? QStringLiteral("LFS %1 request failed (offline)")
                                 : QStringLiteral("LFS %1 request failed");
        return Monad::Result<LfsHttpResponse>(enrichReplyErrorMessage(base.arg(QString::fromLatin1(request.method)),
                                                                      reply.get(),
                                                                      body),
                                              static_cast<int>(LfsErrorCode::Transport));
    }

    LfsHttpResponse response;
    response.status = statusAttribute.toInt();
    response.body = body;
    const auto pairs = reply->rawHeaderPairs();
    for (const auto& pair : pairs) {
        response.headers.append(qMakePair(pair.first, pair.second));
    }
    return Monad::Result<LfsHttpResponse>(response);
}

bool LfsNetworkTransport::isOfflineError(QNetworkReply::NetworkError error)
{
    switch (error) {
    case QNetworkReply::HostNotFoundError:
    case QNetworkReply::TimeoutError:
    case QNetworkReply::ConnectionRefusedError:
    case QNetworkReply::NetworkSessionFailedError:
    case QNetworkReply::TemporaryNetworkFailureError:
        return true;
    default:
        return false;
    }
}

} // namespace QLfs
