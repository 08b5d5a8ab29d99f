#ifndef MOCK_LFS_TRANSPORT_H
#define MOCK_LFS_TRANSPORT_H

#include <QByteArray>
#include <QHash>
#include <QJsonObject>
#include <QPair>
#include <QString>
#include <QUrl>
#include <QVector>

#include "LfsTransport.h"

//In-memory LFS server that answers batch, PUT, GET and verify requests and
//records every request it sees
class MockLfsTransport : public QLfs::LfsTransport
{
public:
    static QUrl endpoint();
    static QString storageHost();

    Monad::Result<QLfs::LfsHttpResponse> send(const QLfs::LfsHttpRequest& request) const override;

    void addObject(const QByteArray& content);
    void setObject(const QString& oid, const QByteArray& bytes);
    bool hasObject(const QString& oid) const;
    QByteArray object(const QString& oid) const;

    void setObjectError(const QString& oid, int code, const QString& message);
    void setReverseObjectOrder(bool reverse) { mReverseObjectOrder = reverse; }
    void setVerifyEnabled(bool enabled) { mVerifyEnabled = enabled; }
    void setEmptyBatchResponse(bool empty) { mEmptyBatchResponse = empty; }
    void setBatchStatus(int status, const QByteArray& body);
    void setTransportFailure(bool fail) { mTransportFailure = fail; }
    void setTransfer(const QString& transfer) { mTransfer = transfer; }
    void setExpiredActions(bool expired) { mExpiredActions = expired; }
    void setEmptyActionHref(bool empty) { mEmptyActionHref = empty; }
    void setVerifyStatus(int status) { mVerifyStatus = status; }

    const QVector<QLfs::LfsHttpRequest>& requests() const { return mRequests; }
    int count(const QByteArray& method, const QString& pathFragment) const;
    int batchCount() const;
    int putCount() const;
    int getCount() const;
    int verifyCount() const;
    QLfs::LfsHttpRequest lastBatchRequest() const;

private:
    QLfs::LfsHttpResponse handleBatch(const QLfs::LfsHttpRequest& request) const;
    QLfs::LfsHttpResponse handlePut(const QLfs::LfsHttpRequest& request, const QString& oid) const;
    QLfs::LfsHttpResponse handleGet(const QString& oid) const;
    QLfs::LfsHttpResponse handleVerify(const QLfs::LfsHttpRequest& request) const;
    QJsonObject action(const QString& href, const QString& token) const;

    mutable QVector<QLfs::LfsHttpRequest> mRequests;
    mutable QHash<QString, QByteArray> mObjects;
    QHash<QString, QPair<int, QString>> mObjectErrors;
    bool mReverseObjectOrder = false;
    bool mVerifyEnabled = false;
    bool mEmptyBatchResponse = false;
    bool mTransportFailure = false;
    bool mExpiredActions = false;
    bool mEmptyActionHref = false;
    int mBatchStatus = 200;
    int mVerifyStatus = 0;
    QString mTransfer = QStringLiteral("basic");
    QByteArray mBatchStatusBody;
};

#endif // MOCK_LFS_TRANSPORT_H
