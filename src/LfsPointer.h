#ifndef LFSPOINTER_H
#define LFSPOINTER_H

#include <QByteArray>
#include <QString>

#include "LfsOid.h"
#include "Monad/Result.h"

class QIODevice;

namespace QLfs {

/**
 * The (oid, size) pair that stands in for large file content in git.
 *
 * Pointers built from content always carry a matching size. Pointers parsed
 * from text are untrusted until the content is checked with matches().
 */
class LfsPointer
{
public:
    static constexpr int MaxPointerSize = 1024;
    static const char* const VersionUrl;
    static const char* const LegacyVersionUrl;

    LfsPointer() = default;
    LfsPointer(LfsOid oid, qint64 size);

    static LfsPointer fromContent(const QByteArray& content);
    static Monad::Result<LfsPointer> fromDevice(QIODevice* device);

    static Monad::Result<LfsPointer> parse(const QByteArray& data);
    static bool isPointer(const QByteArray& data);

    bool isValid() const;
    const LfsOid& oid() const { return mOid; }
    QString oidHex() const { return mOid.toHex(); }
    qint64 size() const { return mSize; }

    QByteArray toPointerText() const;

    bool matches(const QByteArray& content) const;

    bool operator==(const LfsPointer& other) const { return mOid == other.mOid && mSize == other.mSize; }
    bool operator!=(const LfsPointer& other) const { return !(*this == other); }

private:
    LfsOid mOid;
    qint64 mSize = 0;
};

} // namespace QLfs

#endif // LFSPOINTER_H
