#ifndef LFSOID_H
#define LFSOID_H

#include <QByteArray>
#include <QCryptographicHash>
#include <QString>

#include "Monad/Result.h"

class QIODevice;

namespace QLfs {

struct LfsHashResult;

/**
 * SHA-256 content id of an LFS object. Always 32 bytes unless null.
 */
class LfsOid
{
public:
    static constexpr int ByteLength = 32;
    static constexpr int HexLength = 64;

    LfsOid() = default;

    static LfsOid hash(const QByteArray& data);
    static Monad::Result<LfsHashResult> hashDevice(QIODevice* device);
    static Monad::Result<LfsOid> fromHex(const QString& hex);
    static LfsOid fromDigest(const QByteArray& digest);

    bool isNull() const { return mBytes.isEmpty(); }
    const QByteArray& bytes() const { return mBytes; }
    QString toHex() const;

    bool operator==(const LfsOid& other) const { return mBytes == other.mBytes; }
    bool operator!=(const LfsOid& other) const { return mBytes != other.mBytes; }
    bool operator<(const LfsOid& other) const { return mBytes < other.mBytes; }

private:
    explicit LfsOid(QByteArray bytes) : mBytes(std::move(bytes)) {}

    QByteArray mBytes;
};

size_t qHash(const LfsOid& oid, size_t seed = 0);

struct LfsHashResult {
    LfsOid oid;
    qint64 size = 0;
};

/**
 * Forwards writes to an inner device unchanged while hashing them.
 *
 * The writer does not own the inner device. finish() consumes the writer, any
 * write after it fails.
 */
class LfsHashingWriter
{
public:
    struct Finished {
        LfsOid oid;
        qint64 size = 0;
        QIODevice* inner = nullptr;
    };

    explicit LfsHashingWriter(QIODevice* inner);

    LfsHashingWriter(const LfsHashingWriter&) = delete;
    LfsHashingWriter& operator=(const LfsHashingWriter&) = delete;

    Monad::ResultBase write(const char* data, qint64 len);
    Monad::ResultBase write(const QByteArray& data);

    qint64 size() const { return mSize; }
    bool isFinished() const { return mFinished; }

    Finished finish();

private:
    QIODevice* mInner = nullptr;
    QCryptographicHash mHash;
    qint64 mSize = 0;
    bool mFinished = false;
};

} // namespace QLfs

#endif // LFSOID_H
