#ifndef LFSCLIENT_H
#define LFSCLIENT_H

#include <QByteArray>
#include <QString>
#include <QVector>

#include <functional>
#include <memory>

#include "LfsBatch.h"
#include "LfsClientConfig.h"
#include "LfsOid.h"
#include "LfsPointer.h"
#include "LfsTransport.h"
#include "Monad/Result.h"

namespace QLfs {

/**
 * Synchronous client for the LFS batch API and the "basic" transfer adapter.
 *
 * Every object moves through Negotiate, then either AlreadySatisfied or
 * Transfer (and Verify when the server asks for it), and ends in Done or
 * Error. Downloaded bytes are always re-hashed before they are returned.
 *
 * The batch calls negotiate once for all objects. If the server reports an
 * error for any object, the whole call fails before a single transfer starts.
 * Nothing is retried.
 *
 * A client is safe to use from several threads once the state observer is
 * set, provided its transport is.
 */
class LfsClient
{
public:
    enum class State {
        Negotiate,
        AlreadySatisfied,
        Transfer,
        Verify,
        Done,
        Error
    };

    using StateObserver = std::function<void(const LfsOid& oid, State state)>;

    struct UploadItem {
        LfsPointer pointer;
        QByteArray content;
    };

    LfsClient() = default;
    LfsClient(LfsClientConfig config, std::shared_ptr<LfsTransport> transport);

    //Derives the endpoint from a git remote URL and talks to it over Qt Network
    static Monad::Result<LfsClient> forRemoteUrl(const QString& remoteUrl);
    static Monad::Result<LfsClient> forRemoteUrl(const QString& remoteUrl,
                                                 std::shared_ptr<LfsTransport> transport);

    const LfsClientConfig& config() const { return mConfig; }

    void setStateObserver(StateObserver observer);
    static QString stateName(State state);

    Monad::Result<LfsBatchResponse> batch(const LfsBatchRequest& request) const;

    Monad::ResultBase upload(const LfsPointer& pointer, const QByteArray& content) const;
    Monad::Result<QByteArray> download(const LfsPointer& pointer) const;

    Monad::ResultBase uploadBatch(const QVector<UploadItem>& items) const;
    Monad::Result<QVector<QByteArray>> downloadBatch(const QVector<LfsPointer>& pointers) const;

    Monad::Result<QVector<LfsOid>> checkExists(const QVector<LfsPointer>& pointers) const;

private:
    LfsClientConfig mConfig;
    std::shared_ptr<LfsTransport> mTransport;
    StateObserver mStateObserver;

    Monad::Result<LfsHttpResponse> send(const LfsHttpRequest& request) const;
    Monad::ResultBase transferUpload(const LfsPointer& pointer,
                                     const QByteArray& content,
                                     const LfsBatchObject& object) const;
    Monad::Result<QByteArray> transferDownload(const LfsPointer& pointer,
                                               const LfsBatchObject& object) const;
    void report(const LfsOid& oid, State state) const;
    void addCommonHeaders(LfsHttpRequest* request) const;
};

} // namespace QLfs

#endif // LFSCLIENT_H
