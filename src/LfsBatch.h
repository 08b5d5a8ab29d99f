#ifndef LFSBATCH_H
#define LFSBATCH_H

#include <QByteArray>
#include <QDateTime>
#include <QHash>
#include <QMap>
#include <QString>
#include <QStringList>
#include <QUrl>
#include <QVector>

#include "LfsPointer.h"
#include "Monad/Result.h"

namespace QLfs {

enum class LfsOperation {
    Download,
    Upload
};

QString lfsOperationName(LfsOperation operation);

struct LfsObjectSpec {
    QString oid;
    qint64 size = 0;
};

class LfsBatchRequest
{
public:
    static LfsBatchRequest download(const QVector<LfsObjectSpec>& objects, const QString& refName = QString());
    static LfsBatchRequest upload(const QVector<LfsObjectSpec>& objects, const QString& refName = QString());
    static QVector<LfsObjectSpec> objectsFor(const QVector<LfsPointer>& pointers);

    LfsOperation operation = LfsOperation::Download;
    QVector<LfsObjectSpec> objects;
    QString refName;
    QStringList transfers;

    QByteArray toJson() const;
};

struct LfsAction {
    QUrl href;
    QMap<QByteArray, QByteArray> headers;
    qint64 expiresIn = -1;
    QDateTime expiresAt;
    QDateTime receivedAt;

    //Invalid expiresAt and negative expiresIn mean the server set no expiry
    bool isExpired(const QDateTime& now = QDateTime::currentDateTimeUtc()) const;
};

struct LfsObjectError {
    int code = 0;
    QString message;
};

class LfsBatchObject
{
public:
    QString oid;
    qint64 size = 0;
    bool authenticated = false;
    QHash<QString, LfsAction> actions;
    bool hasErrorObject = false;
    LfsObjectError error;

    const LfsAction* action(const QString& name) const;
    const LfsAction* downloadAction() const;
    const LfsAction* uploadAction() const;
    const LfsAction* verifyAction() const;

    bool hasError() const { return hasErrorObject; }
};

class LfsBatchResponse
{
public:
    QString transfer = QStringLiteral("basic");
    QVector<LfsBatchObject> objects;

    static Monad::Result<LfsBatchResponse> fromJson(const QByteArray& json,
                                                    const QDateTime& receivedAt = QDateTime::currentDateTimeUtc());

    const LfsBatchObject* find(const QString& oid) const;
};

} // namespace QLfs

#endif // LFSBATCH_H
