#ifndef LFSTRANSPORT_H
#define LFSTRANSPORT_H

#include <QByteArray>
#include <QList>
#include <QPair>
#include <QUrl>

#include "Monad/Result.h"

namespace QLfs {

struct LfsHttpRequest {
    QByteArray method;
    QUrl url;
    QList<QPair<QByteArray, QByteArray>> headers;
    QByteArray body;

    QByteArray header(const QByteArray& name) const
    {
        for (const auto& header : headers) {
            if (header.first.compare(name, Qt::CaseInsensitive) == 0) {
                return header.second;
            }
        }
        return QByteArray();
    }
};

struct LfsHttpResponse {
    int status = 0;
    QByteArray body;
    QList<QPair<QByteArray, QByteArray>> headers;
};

/**
 * HTTP seam of LfsClient.
 *
 * Any response that carries a status, including 4xx and 5xx, is a successful
 * send. Only failing to obtain a status at all is an error, reported with
 * LfsErrorCode::Transport. Implementations must be callable from several
 * threads at once.
 */
class LfsTransport
{
public:
    virtual ~LfsTransport() = default;
    virtual Monad::Result<LfsHttpResponse> send(const LfsHttpRequest& request) const = 0;
};

} // namespace QLfs

#endif // LFSTRANSPORT_H
