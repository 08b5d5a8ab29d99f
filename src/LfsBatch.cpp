#include "LfsBatch.h"
#include "LfsError.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

namespace {

const QString DownloadActionName = QStringLiteral("download");
const QString UploadActionName = QStringLiteral("upload");
const QString VerifyActionName = QStringLiteral("verify");

QLfs::LfsBatchRequest makeRequest(QLfs::LfsOperation operation,
                                  const QVector<QLfs::LfsObjectSpec>& objects,
                                  const QString& refName)
{
    QLfs::LfsBatchRequest request;
    request.operation = operation;
    request.objects = objects;
    request.refName = refName;
    request.transfers = QStringList {QStringLiteral("basic")};
    return request;
}

QLfs::LfsAction parseAction(const QJsonObject& actionObject, const QDateTime& receivedAt)
{
    QLfs::LfsAction action;
    action.href = QUrl(actionObject.value(QStringLiteral("href")).toString());
    action.receivedAt = receivedAt;

    const QJsonObject headers = actionObject.value(QStringLiteral("header")).toObject();
    for (auto it = headers.begin(); it != headers.end(); ++it) {
        action.headers.insert(it.key().toUtf8(), it.value().toString().toUtf8());
    }

    const QJsonValue expiresIn = actionObject.value(QStringLiteral("expires_in"));
    if (expiresIn.isDouble()) {
        action.expiresIn = expiresIn.toInteger();
    }

    const QString expiresAt = actionObject.value(QStringLiteral("expires_at")).toString();
    if (!expiresAt.isEmpty()) {
        action.expiresAt = QDateTime::fromString(expiresAt, Qt::ISODate);
    }
    return action;
}

} // namespace

namespace QLfs {

QString lfsOperationName(LfsOperation operation)
{
    switch (operation) {
    case LfsOperation::Upload:
        return UploadActionName;
    case LfsOperation::Download:
        break;
    }
    return DownloadActionName;
}

LfsBatchRequest LfsBatchRequest::download(const QVector<LfsObjectSpec>& objects, const QString& refName)
{
    return makeRequest(LfsOperation::Download, objects, refName);
}

LfsBatchRequest LfsBatchRequest::upload(const QVector<LfsObjectSpec>& objects, const QString& refName)
{
    return makeRequest(LfsOperation::Upload, objects, refName);
}

QVector<LfsObjectSpec> LfsBatchRequest::objectsFor(const QVector<LfsPointer>& pointers)
{
    QVector<LfsObjectSpec> specs;
    specs.reserve(pointers.size());
    for (const auto& pointer : pointers) {
        specs.append(LfsObjectSpec{pointer.oidHex(), pointer.size()});
    }
    return specs;
}

QByteArray LfsBatchRequest::toJson() const
{
    QJsonObject root;
    root.insert(QStringLiteral("operation"), lfsOperationName(operation));

    if (!transfers.isEmpty()) {
        root.insert(QStringLiteral("transfers"), QJsonArray::fromStringList(transfers));
    }

    if (!refName.isEmpty()) {
        QJsonObject ref;
        ref.insert(QStringLiteral("name"), refName);
        root.insert(QStringLiteral("ref"), ref);
    }

    QJsonArray objectArray;
    for (const auto& object : objects) {
        QJsonObject entry;
        entry.insert(QStringLiteral("oid"), object.oid);
        entry.insert(QStringLiteral("size"), object.size);
        objectArray.append(entry);
    }
    root.insert(QStringLiteral("objects"), objectArray);

    return QJsonDocument(root).toJson(QJsonDocument::Compact);
}

bool LfsAction::isExpired(const QDateTime& now) const
{
    if (expiresAt.isValid() && now >= expiresAt) {
        return true;
    }
    if (expiresIn >= 0 && receivedAt.isValid() && now >= receivedAt.addSecs(expiresIn)) {
        return true;
    }
    return false;
}

const LfsAction* LfsBatchObject::action(const QString& name) const
{
    auto it = actions.constFind(name);
    if (it == actions.constEnd()) {
        return nullptr;
    }
    return &it.value();
}

const LfsAction* LfsBatchObject::downloadAction() const
{
    return action(DownloadActionName);
}

const LfsAction* LfsBatchObject::uploadAction() const
{
    return action(UploadActionName);
}

const LfsAction* LfsBatchObject::verifyAction() const
{
    return action(VerifyActionName);
}

Monad::Result<LfsBatchResponse> LfsBatchResponse::fromJson(const QByteArray& json, const QDateTime& receivedAt)
{
    QJsonParseError parseError{};
    const QJsonDocument document = QJsonDocument::fromJson(json, &parseError);
    if (document.isNull() || !document.isObject()) {
        return Monad::Result<LfsBatchResponse>(QStringLiteral("Invalid LFS batch response: %1").arg(parseError.errorString()),
                                               static_cast<int>(LfsErrorCode::Protocol));
    }

    LfsBatchResponse response;
    const QJsonObject root = document.object();
    const QString transfer = root.value(QStringLiteral("transfer")).toString();
    if (!transfer.isEmpty()) {
        response.transfer = transfer;
    }

    const QJsonArray objectsArray = root.value(QStringLiteral("objects")).toArray();
    response.objects.reserve(objectsArray.size());

    for (const auto& entry : objectsArray) {
        if (!entry.isObject()) {
            continue;
        }
        const QJsonObject object = entry.toObject();
        LfsBatchObject batchObject;
        batchObject.oid = object.value(QStringLiteral("oid")).toString();
        batchObject.size = object.value(QStringLiteral("size")).toInteger();
        batchObject.authenticated = object.value(QStringLiteral("authenticated")).toBool();

        const QJsonValue errorValue = object.value(QStringLiteral("error"));
        if (errorValue.isObject()) {
            const QJsonObject errorObject = errorValue.toObject();
            batchObject.hasErrorObject = true;
            batchObject.error.code = errorObject.value(QStringLiteral("code")).toInt();
            batchObject.error.message = errorObject.value(QStringLiteral("message")).toString();
        }

        const QJsonObject actions = object.value(QStringLiteral("actions")).toObject();
        for (auto it = actions.begin(); it != actions.end(); ++it) {
            if (!it.value().isObject()) {
                continue;
            }
            batchObject.actions.insert(it.key(), parseAction(it.value().toObject(), receivedAt));
        }

        response.objects.push_back(batchObject);
    }

    return Monad::Result<LfsBatchResponse>(response);
}

const LfsBatchObject* LfsBatchResponse::find(const QString& oid) const
{
    for (const auto& object : objects) {
        if (object.oid.compare(oid, Qt::CaseInsensitive) == 0) {
            return &object;
        }
    }
    return nullptr;
}

} // namespace QLfs
