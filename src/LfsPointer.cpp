#include "LfsPointer.h"
#include "LfsError.h"

#include <QList>
#include <QStringDecoder>

namespace {

const QByteArray VersionPrefix("version ");
const QByteArray OidPrefix("oid sha256:");
const QByteArray SizePrefix("size ");

bool isLowerHexOid(const QByteArray& oid)
{
    if (oid.size() != QLfs::LfsOid::HexLength) {
        return false;
    }
    for (char ch : oid) {
        const bool isDigit = ch >= '0' && ch <= '9';
        const bool isLowerHex = ch >= 'a' && ch <= 'f';
        if (!isDigit && !isLowerHex) {
            return false;
        }
    }
    return true;
}

bool isDecimal(const QByteArray& value)
{
    if (value.isEmpty()) {
        return false;
    }
    for (char ch : value) {
        if (ch < '0' || ch > '9') {
            return false;
        }
    }
    return true;
}

Monad::Result<QLfs::LfsPointer> invalidPointer(const QString& message)
{
    return Monad::Result<QLfs::LfsPointer>(message, static_cast<int>(QLfs::LfsErrorCode::InvalidPointer));
}

} // namespace

namespace QLfs {

const char* const LfsPointer::VersionUrl = "https://git-lfs.github.com/spec/v1";
const char* const LfsPointer::LegacyVersionUrl = "https://hawser.github.com/spec/v1";

LfsPointer::LfsPointer(LfsOid oid, qint64 size)
    : mOid(std::move(oid)),
    mSize(size)
{
}

LfsPointer LfsPointer::fromContent(const QByteArray& content)
{
    return LfsPointer(LfsOid::hash(content), content.size());
}

Monad::Result<LfsPointer> LfsPointer::fromDevice(QIODevice* device)
{
    auto hashResult = LfsOid::hashDevice(device);
    if (hashResult.hasError()) {
        return Monad::Result<LfsPointer>(hashResult.errorMessage(), hashResult.errorCode());
    }
    const LfsHashResult hashed = hashResult.value();
    return Monad::Result<LfsPointer>(LfsPointer(hashed.oid, hashed.size));
}

Monad::Result<LfsPointer> LfsPointer::parse(const QByteArray& data)
{
    if (data.size() > MaxPointerSize) {
        return invalidPointer(QStringLiteral("Content too large to be an LFS pointer"));
    }

    QStringDecoder decoder(QStringDecoder::Utf8);
    const QString text = decoder.decode(data);
    if (decoder.hasError()) {
        return invalidPointer(QStringLiteral("LFS pointer is not valid UTF-8"));
    }
    Q_UNUSED(text);

    QByteArray versionValue;
    QByteArray oidLine;
    QByteArray sizeLine;
    bool hasVersion = false;

    const QList<QByteArray> lines = data.split('\n');
    for (const QByteArray& line : lines) {
        const QByteArray trimmed = line.trimmed();
        if (trimmed.isEmpty()) {
            continue;
        }
        if (trimmed.startsWith(VersionPrefix)) {
            versionValue = trimmed.mid(VersionPrefix.size()).trimmed();
            hasVersion = true;
        } else if (trimmed.startsWith("oid ")) {
            oidLine = trimmed;
        } else if (trimmed.startsWith(SizePrefix)) {
            sizeLine = trimmed;
        }
    }

    if (!hasVersion) {
        return invalidPointer(QStringLiteral("Missing LFS pointer version"));
    }
    if (versionValue != VersionUrl && versionValue != LegacyVersionUrl) {
        return invalidPointer(QStringLiteral("Unsupported LFS pointer version: %1")
                                  .arg(QString::fromUtf8(versionValue)));
    }

    if (oidLine.isEmpty()) {
        return invalidPointer(QStringLiteral("Missing LFS pointer oid"));
    }
    if (!oidLine.startsWith(OidPrefix)) {
        return invalidPointer(QStringLiteral("Unsupported LFS pointer oid type"));
    }
    const QByteArray oidBytes = oidLine.mid(OidPrefix.size()).trimmed();
    if (!isLowerHexOid(oidBytes)) {
        return invalidPointer(QStringLiteral("Malformed LFS pointer oid"));
    }

    if (sizeLine.isEmpty()) {
        return invalidPointer(QStringLiteral("Missing LFS pointer size"));
    }
    const QByteArray sizeBytes = sizeLine.mid(SizePrefix.size()).trimmed();
    bool ok = false;
    const qint64 size = sizeBytes.toLongLong(&ok);
    if (!isDecimal(sizeBytes) || !ok || size < 0) {
        return invalidPointer(QStringLiteral("Invalid LFS pointer size"));
    }

    auto oidResult = LfsOid::fromHex(QString::fromLatin1(oidBytes));
    if (oidResult.hasError()) {
        return invalidPointer(oidResult.errorMessage());
    }

    return Monad::Result<LfsPointer>(LfsPointer(oidResult.value(), size));
}

bool LfsPointer::isPointer(const QByteArray& data)
{
    if (data.size() > MaxPointerSize) {
        return false;
    }
    return data.startsWith(VersionPrefix + VersionUrl)
           || data.startsWith(VersionPrefix + LegacyVersionUrl);
}

bool LfsPointer::isValid() const
{
    return !mOid.isNull() && mSize >= 0;
}

QByteArray LfsPointer::toPointerText() const
{
    if (!isValid()) {
        return QByteArray();
    }
    QByteArray text;
    text.reserve(128);
    text.append(VersionPrefix);
    text.append(VersionUrl);
    text.append('\n');
    text.append(OidPrefix);
    text.append(mOid.toHex().toLatin1());
    text.append('\n');
    text.append(SizePrefix);
    text.append(QByteArray::number(mSize));
    text.append('\n');
    return text;
}

bool LfsPointer::matches(const QByteArray& content) const
{
    if (content.size() != mSize) {
        return false;
    }
    return LfsOid::hash(content) == mOid;
}

} // namespace QLfs
