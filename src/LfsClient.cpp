#include "LfsClient.h"
#include "LfsError.h"
#include "LfsNetworkTransport.h"

#include <QDebug>
#include <QHash>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSet>

namespace {
constexpr const char* LfsJsonMime = "application/vnd.git-lfs+json";
constexpr const char* OctetStreamMime = "application/octet-stream";
constexpr int ErrorBodyPreviewBytes = 512;

//One pointer per oid. Two pointers naming one oid with different sizes cannot both be right.
Monad::Result<QVector<QLfs::LfsPointer>> uniquePointers(const QVector<QLfs::LfsPointer>& pointers)
{
    QVector<QLfs::LfsPointer> unique;
    QHash<QLfs::LfsOid, qint64> seen;
    for (const auto& pointer : pointers) {
        const auto it = seen.constFind(pointer.oid());
        if (it != seen.constEnd()) {
            if (it.value() != pointer.size()) {
                return Monad::Result<QVector<QLfs::LfsPointer>>(
                    QStringLiteral("LFS pointers for %1 disagree on size: %2 and %3")
                        .arg(pointer.oidHex())
                        .arg(it.value())
                        .arg(pointer.size()),
                    static_cast<int>(QLfs::LfsErrorCode::InvalidPointer));
            }
            continue;
        }
        seen.insert(pointer.oid(), pointer.size());
        unique.append(pointer);
    }
    return Monad::Result<QVector<QLfs::LfsPointer>>(unique);
}

QString responseMessage(const QByteArray& body)
{
    const QJsonDocument document = QJsonDocument::fromJson(body);
    if (document.isObject()) {
        const QString message = document.object().value(QStringLiteral("message")).toString();
        if (!message.isEmpty()) {
            return message;
        }
    }

    const bool truncated = body.size() > ErrorBodyPreviewBytes;
    const QString preview = QString::fromUtf8(truncated ? body.left(ErrorBodyPreviewBytes) : body).simplified();
    if (truncated) {
        return QStringLiteral("%1 [truncated]").arg(preview);
    }
    return preview;
}

//Maps an HTTP failure status onto an LfsErrorCode, success statuses give no error
Monad::ResultBase statusResult(const QLfs::LfsHttpResponse& response, const QString& what)
{
    const int status = response.status;
    if (status < 400) {
        return Monad::ResultBase();
    }

    QLfs::LfsErrorCode code = QLfs::LfsErrorCode::ServerError;
    if (status == 401 || status == 403) {
        code = QLfs::LfsErrorCode::AuthRequired;
    } else if (status == 404) {
        code = QLfs::LfsErrorCode::NotFound;
    }

    QString message = QStringLiteral("%1 failed (%2)").arg(what).arg(status);
    const QString detail = responseMessage(response.body);
    if (!detail.isEmpty()) {
        message += QStringLiteral(": %1").arg(detail);
    }
    return Monad::ResultBase(message, static_cast<int>(code));
}

Monad::ResultBase objectErrorResult(const QLfs::LfsBatchObject& object)
{
    const QLfs::LfsErrorCode code = object.error.code == 404
                                        ? QLfs::LfsErrorCode::NotFound
                                        : QLfs::LfsErrorCode::ServerError;
    return Monad::ResultBase(QStringLiteral("LFS object %1: %2")
                                 .arg(object.oid, QLfs::lfsServerErrorMessage(object.error.code, object.error.message)),
                             static_cast<int>(code));
}

Monad::ResultBase notFound(const QString& oid)
{
    return Monad::ResultBase(QStringLiteral("LFS object %1 not found on server").arg(oid),
                             static_cast<int>(QLfs::LfsErrorCode::NotFound));
}

Monad::ResultBase usableAction(const QLfs::LfsAction* action, const QString& name)
{
    if (!action->href.isValid() || action->href.isEmpty()) {
        return Monad::ResultBase(QStringLiteral("Missing LFS %1 href").arg(name),
                                 static_cast<int>(QLfs::LfsErrorCode::Protocol));
    }
    if (action->isExpired()) {
        return Monad::ResultBase(QStringLiteral("LFS %1 action expired").arg(name),
                                 static_cast<int>(QLfs::LfsErrorCode::Protocol));
    }
    return Monad::ResultBase();
}

void applyHeaders(QLfs::LfsHttpRequest* request, const QMap<QByteArray, QByteArray>& headers)
{
    for (auto it = headers.begin(); it != headers.end(); ++it) {
        request->headers.append(qMakePair(it.key(), it.value()));
    }
}

}

namespace QLfs {

LfsClient::LfsClient(LfsClientConfig config, std::shared_ptr<LfsTransport> transport)
    : mConfig(std::move(config)),
    mTransport(std::move(transport))
{
}

Monad::Result<LfsClient> LfsClient::forRemoteUrl(const QString& remoteUrl)
{
    return forRemoteUrl(remoteUrl, std::make_shared<LfsNetworkTransport>());
}

Monad::Result<LfsClient> LfsClient::forRemoteUrl(const QString& remoteUrl, std::shared_ptr<LfsTransport> transport)
{
    auto builderResult = LfsClientConfig::Builder::fromRemoteUrl(remoteUrl);
    if (builderResult.hasError()) {
        return Monad::Result<LfsClient>(builderResult.errorMessage(), builderResult.errorCode());
    }
    return Monad::Result<LfsClient>(LfsClient(builderResult.value().build(), std::move(transport)));
}

void LfsClient::setStateObserver(StateObserver observer)
{
    mStateObserver = std::move(observer);
}

QString LfsClient::stateName(State state)
{
    switch (state) {
    case State::Negotiate:
        return QStringLiteral("NEGOTIATE");
    case State::AlreadySatisfied:
        return QStringLiteral("ALREADY_SATISFIED");
    case State::Transfer:
        return QStringLiteral("TRANSFER");
    case State::Verify:
        return QStringLiteral("VERIFY");
    case State::Done:
        return QStringLiteral("DONE");
    case State::Error:
        return QStringLiteral("ERROR");
    }
    return QString();
}

void LfsClient::report(const LfsOid& oid, State state) const
{
    qDebug() << "[LFS client]" << oid.toHex() << stateName(state);
    if (mStateObserver) {
        mStateObserver(oid, state);
    }
}

Monad::Result<LfsHttpResponse> LfsClient::send(const LfsHttpRequest& request) const
{
    if (!mTransport) {
        return Monad::Result<LfsHttpResponse>(QStringLiteral("LFS client has no transport"),
                                              static_cast<int>(LfsErrorCode::Transport));
    }
    return mTransport->send(request);
}

void LfsClient::addCommonHeaders(LfsHttpRequest* request) const
{
    const QString userAgent = mConfig.userAgent();
    if (!userAgent.isEmpty()) {
        request->headers.append(qMakePair(QByteArray("User-Agent"), userAgent.toUtf8()));
    }
    const auto extraHeaders = mConfig.extraHeaders();
    for (const auto& header : extraHeaders) {
        request->headers.append(header);
    }
}

Monad::Result<LfsBatchResponse> LfsClient::batch(const LfsBatchRequest& request) const
{
    LfsBatchRequest outgoing = request;
    if (outgoing.refName.isEmpty()) {
        outgoing.refName = mConfig.refName();
    }

    LfsHttpRequest httpRequest;
    httpRequest.method = QByteArrayLiteral("POST");
    httpRequest.url = mConfig.batchUrl();
    httpRequest.headers.append(qMakePair(QByteArray("Accept"), QByteArray(LfsJsonMime)));
    httpRequest.headers.append(qMakePair(QByteArray("Content-Type"), QByteArray(LfsJsonMime)));

    const QByteArray authorization = mConfig.authorizationHeader();
    if (!authorization.isEmpty()) {
        httpRequest.headers.append(qMakePair(QByteArray("Authorization"), authorization));
    }
    addCommonHeaders(&httpRequest);
    httpRequest.body = outgoing.toJson();

    qDebug() << "[LFS client] batch" << lfsOperationName(outgoing.operation)
             << outgoing.objects.size() << "objects" << httpRequest.url.toString(QUrl::RemoveUserInfo);

    auto sendResult = send(httpRequest);
    if (sendResult.hasError()) {
        return Monad::Result<LfsBatchResponse>(sendResult.errorMessage(), sendResult.errorCode());
    }

    const LfsHttpResponse response = sendResult.value();
    auto status = statusResult(response, QStringLiteral("LFS batch request"));
    if (status.hasError()) {
        return Monad::Result<LfsBatchResponse>(status.errorMessage(), status.errorCode());
    }

    auto parsed = LfsBatchResponse::fromJson(response.body);
    if (parsed.hasError()) {
        return parsed;
    }

    //Only the basic adapter is implemented
    if (parsed.value().transfer != QStringLiteral("basic")) {
        return Monad::Result<LfsBatchResponse>(QStringLiteral("Unsupported LFS transfer adapter: %1")
                                                   .arg(parsed.value().transfer),
                                               static_cast<int>(LfsErrorCode::Protocol));
    }
    return parsed;
}

Monad::ResultBase LfsClient::transferUpload(const LfsPointer& pointer,
                                            const QByteArray& content,
                                            const LfsBatchObject& object) const
{
    const LfsAction* uploadAction = object.uploadAction();
    auto usable = usableAction(uploadAction, QStringLiteral("upload"));
    if (usable.hasError()) {
        return usable;
    }

    report(pointer.oid(), State::Transfer);

    LfsHttpRequest put;
    put.method = QByteArrayLiteral("PUT");
    put.url = uploadAction->href;
    applyHeaders(&put, uploadAction->headers);
    put.headers.append(qMakePair(QByteArray("Content-Type"), QByteArray(OctetStreamMime)));
    put.headers.append(qMakePair(QByteArray("Content-Length"), QByteArray::number(content.size())));
    addCommonHeaders(&put);
    put.body = content;

    auto putResult = send(put);
    if (putResult.hasError()) {
        return Monad::ResultBase(putResult.errorMessage(), putResult.errorCode());
    }
    auto putStatus = statusResult(putResult.value(), QStringLiteral("LFS upload"));
    if (putStatus.hasError()) {
        return putStatus;
    }

    const LfsAction* verifyAction = object.verifyAction();
    if (verifyAction) {
        auto verifyUsable = usableAction(verifyAction, QStringLiteral("verify"));
        if (verifyUsable.hasError()) {
            return verifyUsable;
        }

        report(pointer.oid(), State::Verify);

        QJsonObject body;
        body.insert(QStringLiteral("oid"), pointer.oidHex());
        body.insert(QStringLiteral("size"), pointer.size());

        LfsHttpRequest verify;
        verify.method = QByteArrayLiteral("POST");
        verify.url = verifyAction->href;
        applyHeaders(&verify, verifyAction->headers);
        verify.headers.append(qMakePair(QByteArray("Accept"), QByteArray(LfsJsonMime)));
        verify.headers.append(qMakePair(QByteArray("Content-Type"), QByteArray(LfsJsonMime)));
        addCommonHeaders(&verify);
        verify.body = QJsonDocument(body).toJson(QJsonDocument::Compact);

        auto verifyResult = send(verify);
        if (verifyResult.hasError()) {
            return Monad::ResultBase(verifyResult.errorMessage(), verifyResult.errorCode());
        }
        auto verifyStatus = statusResult(verifyResult.value(), QStringLiteral("LFS verify"));
        if (verifyStatus.hasError()) {
            return verifyStatus;
        }
    }

    return Monad::ResultBase();
}

Monad::Result<QByteArray> LfsClient::transferDownload(const LfsPointer& pointer, const LfsBatchObject& object) const
{
    const LfsAction* downloadAction = object.downloadAction();
    auto usable = usableAction(downloadAction, QStringLiteral("download"));
    if (usable.hasError()) {
        return Monad::Result<QByteArray>(usable.errorMessage(), usable.errorCode());
    }

    report(pointer.oid(), State::Transfer);

    LfsHttpRequest get;
    get.method = QByteArrayLiteral("GET");
    get.url = downloadAction->href;
    applyHeaders(&get, downloadAction->headers);
    addCommonHeaders(&get);

    auto getResult = send(get);
    if (getResult.hasError()) {
        return Monad::Result<QByteArray>(getResult.errorMessage(), getResult.errorCode());
    }

    const LfsHttpResponse response = getResult.value();
    auto status = statusResult(response, QStringLiteral("LFS download"));
    if (status.hasError()) {
        return Monad::Result<QByteArray>(status.errorMessage(), status.errorCode());
    }

    if (response.body.size() != pointer.size()) {
        return Monad::Result<QByteArray>(QStringLiteral("LFS download size mismatch for %1: expected %2, got %3")
                                             .arg(pointer.oidHex())
                                             .arg(pointer.size())
                                             .arg(response.body.size()),
                                         static_cast<int>(LfsErrorCode::InvalidPointer));
    }

    const LfsOid actual = LfsOid::hash(response.body);
    if (actual != pointer.oid()) {
        return Monad::Result<QByteArray>(QStringLiteral("LFS download hash mismatch: expected %1, got %2")
                                             .arg(pointer.oidHex(), actual.toHex()),
                                         static_cast<int>(LfsErrorCode::InvalidPointer));
    }

    return Monad::Result<QByteArray>(response.body);
}

Monad::ResultBase LfsClient::upload(const LfsPointer& pointer, const QByteArray& content) const
{
    return uploadBatch({UploadItem{pointer, content}});
}

Monad::Result<QByteArray> LfsClient::download(const LfsPointer& pointer) const
{
    auto result = downloadBatch({pointer});
    if (result.hasError()) {
        return Monad::Result<QByteArray>(result.errorMessage(), result.errorCode());
    }
    return Monad::Result<QByteArray>(result.value().first());
}

Monad::ResultBase LfsClient::uploadBatch(const QVector<UploadItem>& items) const
{
    if (items.isEmpty()) {
        return Monad::ResultBase();
    }

    QVector<UploadItem> unique;
    QSet<LfsOid> seen;
    for (const auto& item : items) {
        if (!item.pointer.isValid() || !item.pointer.matches(item.content)) {
            return Monad::ResultBase(QStringLiteral("Content does not match LFS pointer %1").arg(item.pointer.oidHex()),
                                     static_cast<int>(LfsErrorCode::InvalidPointer));
        }
        if (seen.contains(item.pointer.oid())) {
            continue;
        }
        seen.insert(item.pointer.oid());
        unique.append(item);
    }

    QVector<LfsPointer> pointers;
    pointers.reserve(unique.size());
    for (const auto& item : unique) {
        pointers.append(item.pointer);
        report(item.pointer.oid(), State::Negotiate);
    }

    auto batchResult = batch(LfsBatchRequest::upload(LfsBatchRequest::objectsFor(pointers)));
    if (batchResult.hasError()) {
        for (const auto& pointer : pointers) {
            report(pointer.oid(), State::Error);
        }
        return Monad::ResultBase(batchResult.errorMessage(), batchResult.errorCode());
    }

    const LfsBatchResponse response = batchResult.value();
    if (response.objects.isEmpty()) {
        for (const auto& pointer : pointers) {
            report(pointer.oid(), State::Error);
        }
        return Monad::ResultBase(QStringLiteral("LFS upload batch response has no objects"),
                                 static_cast<int>(LfsErrorCode::Protocol));
    }

    for (const auto& pointer : pointers) {
        const LfsBatchObject* object = response.find(pointer.oidHex());
        if (object && object->hasError()) {
            report(pointer.oid(), State::Error);
            const auto error = objectErrorResult(*object);
            return Monad::ResultBase(error.errorMessage(), static_cast<int>(LfsErrorCode::ServerError));
        }
    }

    for (const auto& item : unique) {
        const LfsOid& oid = item.pointer.oid();
        const LfsBatchObject* object = response.find(item.pointer.oidHex());
        if (!object || !object->uploadAction()) {
            report(oid, State::AlreadySatisfied);
            report(oid, State::Done);
            continue;
        }

        auto transferResult = transferUpload(item.pointer, item.content, *object);
        if (transferResult.hasError()) {
            report(oid, State::Error);
            return transferResult;
        }
        report(oid, State::Done);
    }

    return Monad::ResultBase();
}

Monad::Result<QVector<QByteArray>> LfsClient::downloadBatch(const QVector<LfsPointer>& pointers) const
{
    if (pointers.isEmpty()) {
        return Monad::Result<QVector<QByteArray>>(QVector<QByteArray>());
    }

    for (const auto& pointer : pointers) {
        if (!pointer.isValid()) {
            return Monad::Result<QVector<QByteArray>>(QStringLiteral("Invalid LFS pointer"),
                                                      static_cast<int>(LfsErrorCode::InvalidPointer));
        }
    }

    auto uniqueResult = uniquePointers(pointers);
    if (uniqueResult.hasError()) {
        return Monad::Result<QVector<QByteArray>>(uniqueResult.errorMessage(), uniqueResult.errorCode());
    }
    const QVector<LfsPointer> unique = uniqueResult.value();
    for (const auto& pointer : unique) {
        report(pointer.oid(), State::Negotiate);
    }

    auto failAll = [this, &unique](const Monad::ResultBase& error) {
        for (const auto& pointer : unique) {
            report(pointer.oid(), State::Error);
        }
        return Monad::Result<QVector<QByteArray>>(error.errorMessage(), error.errorCode());
    };

    auto batchResult = batch(LfsBatchRequest::download(LfsBatchRequest::objectsFor(unique)));
    if (batchResult.hasError()) {
        return failAll(Monad::ResultBase(batchResult.errorMessage(), batchResult.errorCode()));
    }

    const LfsBatchResponse response = batchResult.value();

    for (const auto& pointer : unique) {
        const LfsBatchObject* object = response.find(pointer.oidHex());
        if (!object) {
            return failAll(notFound(pointer.oidHex()));
        }
        if (object->hasError()) {
            return failAll(objectErrorResult(*object));
        }
        if (!object->downloadAction()) {
            return failAll(notFound(pointer.oidHex()));
        }
    }

    QHash<LfsOid, QByteArray> contents;
    for (const auto& pointer : unique) {
        const LfsBatchObject* object = response.find(pointer.oidHex());
        auto transferResult = transferDownload(pointer, *object);
        if (transferResult.hasError()) {
            report(pointer.oid(), State::Error);
            return Monad::Result<QVector<QByteArray>>(transferResult.errorMessage(), transferResult.errorCode());
        }
        contents.insert(pointer.oid(), transferResult.value());
        report(pointer.oid(), State::Done);
    }

    QVector<QByteArray> ordered;
    ordered.reserve(pointers.size());
    for (const auto& pointer : pointers) {
        ordered.append(contents.value(pointer.oid()));
    }
    return Monad::Result<QVector<QByteArray>>(ordered);
}

Monad::Result<QVector<LfsOid>> LfsClient::checkExists(const QVector<LfsPointer>& pointers) const
{
    if (pointers.isEmpty()) {
        return Monad::Result<QVector<LfsOid>>(QVector<LfsOid>());
    }

    auto uniqueResult = uniquePointers(pointers);
    if (uniqueResult.hasError()) {
        return Monad::Result<QVector<LfsOid>>(uniqueResult.errorMessage(), uniqueResult.errorCode());
    }
    const QVector<LfsPointer> unique = uniqueResult.value();
    auto batchResult = batch(LfsBatchRequest::download(LfsBatchRequest::objectsFor(unique)));
    if (batchResult.hasError()) {
        return Monad::Result<QVector<LfsOid>>(batchResult.errorMessage(), batchResult.errorCode());
    }

    const LfsBatchResponse response = batchResult.value();
    QVector<LfsOid> present;
    QSet<LfsOid> added;
    for (const auto& pointer : pointers) {
        const LfsBatchObject* object = response.find(pointer.oidHex());
        if (!object || object->hasError() || !object->downloadAction()) {
            continue;
        }
        if (added.contains(pointer.oid())) {
            continue;
        }
        added.insert(pointer.oid());
        present.append(pointer.oid());
    }
    return Monad::Result<QVector<LfsOid>>(present);
}

} // namespace QLfs
