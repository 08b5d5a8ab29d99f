#ifndef LFS_SERVER_H
#define LFS_SERVER_H

#include <QByteArray>
#include <QHash>
#include <QObject>
#include <QString>
#include <QTcpServer>

class QTcpSocket;

//Loopback HTTP/1.1 server speaking just enough of the LFS batch and basic
//transfer protocol to drive LfsNetworkTransport end to end. One object can be
//offered for download and one accepted for upload.
class LfsServer : public QObject
{
    Q_OBJECT
public:
    explicit LfsServer(QObject* parent = nullptr);

    bool start();

    QString baseUrl() const;
    QString endpoint() const;

    void setDownloadObject(const QString& oid, const QByteArray& bytes);
    void setExpectedUploadObject(const QString& oid, qint64 size);

    //Reads requests but never answers them
    void setStallResponses(bool stall) { mStallResponses = stall; }

    int downloadBatchRequestCount() const { return mDownloadBatchRequestCount; }
    int downloadObjectRequestCount() const { return mDownloadObjectRequestCount; }
    int uploadBatchRequestCount() const { return mUploadBatchRequestCount; }
    int uploadRequestCount() const { return mUploadRequestCount; }
    QByteArray uploadedBytes() const { return mUploadedBytes; }

    //Header of the most recent complete request, name is case-insensitive
    QByteArray lastHeader(const QByteArray& name) const;

private:
    struct Request {
        QByteArray method;
        QByteArray path;
        QHash<QByteArray, QByteArray> headers;
        QByteArray body;
    };

    struct Reply {
        int status = 404;
        QByteArray contentType = QByteArrayLiteral("application/json");
        QByteArray body = QByteArrayLiteral("{\"message\":\"not found\"}");
    };

    void acceptConnections();
    void readFrom(QTcpSocket* socket);

    Reply route(const Request& request);
    Reply batchReply(const Request& request);
    QByteArray batchObjectJson(const QString& oid, qint64 size, const QString& action, const QString& href) const;

    static bool parseRequest(const QByteArray& raw, Request* request);
    static void write(QTcpSocket* socket, const Reply& reply);

    QTcpServer mServer;
    QHash<QTcpSocket*, QByteArray> mBuffers;
    QHash<QByteArray, QByteArray> mLastHeaders;

    QString mDownloadOid;
    QByteArray mDownloadBytes;
    QString mUploadOid;
    qint64 mUploadSize = 0;
    QByteArray mUploadedBytes;
    bool mStallResponses = false;

    int mDownloadBatchRequestCount = 0;
    int mDownloadObjectRequestCount = 0;
    int mUploadBatchRequestCount = 0;
    int mUploadRequestCount = 0;
};

#endif // LFS_SERVER_H
