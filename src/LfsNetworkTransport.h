#ifndef LFSNETWORKTRANSPORT_H
#define LFSNETWORKTRANSPORT_H

#include <QNetworkReply>

#include "LfsTransport.h"

namespace QLfs {

/**
 * Blocking LfsTransport over QNetworkAccessManager.
 *
 * Each send() builds its own manager on the calling thread and spins that
 * thread's events until the reply finishes, so one instance can be shared by
 * several threads. The transfer timeout aborts a reply that stalls for longer
 * than timeoutMs.
 */
class LfsNetworkTransport : public LfsTransport
{
public:
    static constexpr int DefaultTimeoutMs = 30000;

    explicit LfsNetworkTransport(int timeoutMs = DefaultTimeoutMs);

    int timeoutMs() const { return mTimeoutMs; }

    Monad::Result<LfsHttpResponse> send(const LfsHttpRequest& request) const override;

    static bool isOfflineError(QNetworkReply::NetworkError error);

private:
    int mTimeoutMs;
};

} // namespace QLfs

#endif // LFSNETWORKTRANSPORT_H
