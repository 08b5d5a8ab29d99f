#include "LfsOid.h"
#include "LfsError.h"

#include <QHashFunctions>
#include <QIODevice>

namespace {

constexpr qint64 HashChunkBytes = 1024 * 128;
constexpr int ReadyReadTimeoutMs = 30000;

bool isHexDigit(QChar ch)
{
    const ushort c = ch.unicode();
    return (c >= '0' && c <= '9')
           || (c >= 'a' && c <= 'f')
           || (c >= 'A' && c <= 'F');
}

} // namespace

namespace QLfs {

LfsOid LfsOid::hash(const QByteArray& data)
{
    return LfsOid(QCryptographicHash::hash(data, QCryptographicHash::Sha256));
}

Monad::Result<LfsHashResult> LfsOid::hashDevice(QIODevice* device)
{
    if (!device || !device->isReadable()) {
        return Monad::Result<LfsHashResult>(QStringLiteral("Device is not open for reading"),
                                            static_cast<int>(LfsErrorCode::Io));
    }

    QCryptographicHash hash(QCryptographicHash::Sha256);
    qint64 size = 0;
    QByteArray chunk(HashChunkBytes, Qt::Uninitialized);
    while (true) {
        const qint64 read = device->read(chunk.data(), chunk.size());
        if (read < 0) {
            return Monad::Result<LfsHashResult>(device->errorString(),
                                                static_cast<int>(LfsErrorCode::Io));
        }
        if (read == 0) {
            //Sequential devices return 0 while more data is still on its way
            if (device->isSequential() && device->waitForReadyRead(ReadyReadTimeoutMs)) {
                continue;
            }
            break;
        }
        hash.addData(QByteArrayView(chunk.constData(), read));
        size += read;
    }

    LfsHashResult result;
    result.oid = LfsOid(hash.result());
    result.size = size;
    return Monad::Result<LfsHashResult>(result);
}

Monad::Result<LfsOid> LfsOid::fromHex(const QString& hex)
{
    if (hex.size() != HexLength) {
        return Monad::Result<LfsOid>(QStringLiteral("Expected %1 hex characters for oid, got %2")
                                         .arg(HexLength)
                                         .arg(hex.size()),
                                     static_cast<int>(LfsErrorCode::InvalidHash));
    }

    for (const QChar ch : hex) {
        if (!isHexDigit(ch)) {
            return Monad::Result<LfsOid>(QStringLiteral("Invalid hex character in oid"),
                                         static_cast<int>(LfsErrorCode::InvalidHash));
        }
    }

    return Monad::Result<LfsOid>(LfsOid(QByteArray::fromHex(hex.toLatin1())));
}

LfsOid LfsOid::fromDigest(const QByteArray& digest)
{
    if (digest.size() != ByteLength) {
        return LfsOid();
    }
    return LfsOid(digest);
}

QString LfsOid::toHex() const
{
    return QString::fromLatin1(mBytes.toHex());
}

size_t qHash(const LfsOid& oid, size_t seed)
{
    return qHash(oid.bytes(), seed);
}

LfsHashingWriter::LfsHashingWriter(QIODevice* inner)
    : mInner(inner),
    mHash(QCryptographicHash::Sha256)
{
}

Monad::ResultBase LfsHashingWriter::write(const char* data, qint64 len)
{
    if (mFinished) {
        return Monad::ResultBase(QStringLiteral("Hashing writer already finished"),
                                 static_cast<int>(LfsErrorCode::Io));
    }
    if (!mInner) {
        return Monad::ResultBase(QStringLiteral("Hashing writer has no output device"),
                                 static_cast<int>(LfsErrorCode::Io));
    }
    if (len <= 0) {
        return Monad::ResultBase();
    }

    const qint64 written = mInner->write(data, len);
    if (written != len) {
        return Monad::ResultBase(QStringLiteral("Short write: %1").arg(mInner->errorString()),
                                 static_cast<int>(LfsErrorCode::Io));
    }

    mHash.addData(QByteArrayView(data, len));
    mSize += written;
    return Monad::ResultBase();
}

Monad::ResultBase LfsHashingWriter::write(const QByteArray& data)
{
    return write(data.constData(), data.size());
}

LfsHashingWriter::Finished LfsHashingWriter::finish()
{
    Finished finished;
    finished.oid = LfsOid::fromDigest(mHash.result());
    finished.size = mSize;
    finished.inner = mInner;

    mFinished = true;
    mInner = nullptr;
    return finished;
}

} // namespace QLfs
