#include "LfsStore.h"
#include "LfsError.h"

#include <QDebug>
#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

namespace {

bool isLowerHexOid(const QString& name)
{
    if (name.size() != QLfs::LfsOid::HexLength) {
        return false;
    }
    for (const QChar ch : name) {
        const ushort c = ch.unicode();
        const bool isDigit = c >= '0' && c <= '9';
        const bool isLowerHex = c >= 'a' && c <= 'f';
        if (!isDigit && !isLowerHex) {
            return false;
        }
    }
    return true;
}

bool ensureDirForObjectPath(const QString& objectPath)
{
    const QFileInfo info(objectPath);
    const QDir dir(info.absolutePath());
    if (dir.exists()) {
        return true;
    }
    return QDir().mkpath(dir.absolutePath());
}

//commit() after cancelWriting() reports failure and removes the temporary file
void abandon(QSaveFile& file)
{
    file.cancelWriting();
    const bool committed = file.commit();
    Q_UNUSED(committed);
}

Monad::ResultBase ioError(const QString& message)
{
    return Monad::ResultBase(message, static_cast<int>(QLfs::LfsErrorCode::Io));
}

struct StoredObject {
    QLfs::LfsOid oid;
    QString path;
    qint64 size = 0;
};

//Temporary QSaveFile names and anything else that is not a sharded oid are skipped
QVector<StoredObject> walkObjects(const QString& objectsDirPath)
{
    QVector<StoredObject> found;
    if (!QFileInfo::exists(objectsDirPath)) {
        return found;
    }

    QDirIterator it(objectsDirPath, QDir::Files | QDir::NoDotAndDotDot, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        const QString filePath = it.next();
        const QFileInfo info = it.fileInfo();
        const QString name = info.fileName();
        if (!isLowerHexOid(name)) {
            continue;
        }

        const QString expectedPath = QDir(objectsDirPath).filePath(name.mid(0, 2) + QLatin1Char('/')
                                                                   + name.mid(2, 2) + QLatin1Char('/')
                                                                   + name);
        if (QDir::cleanPath(filePath) != QDir::cleanPath(expectedPath)) {
            continue;
        }

        auto oidResult = QLfs::LfsOid::fromHex(name);
        if (oidResult.hasError()) {
            continue;
        }

        StoredObject object;
        object.oid = oidResult.value();
        object.path = filePath;
        object.size = info.size();
        found.append(object);
    }
    return found;
}

} // namespace

namespace QLfs {

struct LfsStore::StreamWriter::State {
    explicit State(const QString& path)
        : file(path),
        writer(&file)
    {
    }

    //Declared first so the hashing writer never outlives its device
    QSaveFile file;
    LfsHashingWriter writer;
    LfsOid expected;
    bool done = false;
};

LfsStore::LfsStore(QString objectsDirPath)
    : mObjectsDirPath(objectsDirPath.isEmpty() ? QString() : QDir(objectsDirPath).absolutePath())
{
}

LfsStore LfsStore::forGitDir(const QString& gitDirPath)
{
    return LfsStore(QDir(gitDirPath).filePath(QStringLiteral("lfs/objects")));
}

QString LfsStore::objectPath(const LfsOid& oid) const
{
    if (oid.isNull()) {
        return QString();
    }
    const QString hex = oid.toHex();
    const QString first = hex.mid(0, 2);
    const QString second = hex.mid(2, 2);
    return QDir(mObjectsDirPath).filePath(first + QLatin1Char('/') + second + QLatin1Char('/') + hex);
}

bool LfsStore::contains(const LfsOid& oid) const
{
    const QString path = objectPath(oid);
    return !path.isEmpty() && QFileInfo(path).isFile();
}

bool LfsStore::containsValid(const LfsPointer& pointer) const
{
    const QString path = objectPath(pointer.oid());
    if (path.isEmpty()) {
        return false;
    }
    const QFileInfo info(path);
    return info.isFile() && info.size() == pointer.size();
}

bool LfsStore::readObject(const LfsOid& oid, QByteArray* out) const
{
    if (!out) {
        return false;
    }

    const QString path = objectPath(oid);
    if (path.isEmpty()) {
        return false;
    }

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return false;
    }

    *out = file.readAll();
    if (file.error() != QFile::NoError) {
        out->clear();
        return false;
    }
    return true;
}

bool LfsStore::readVerified(const LfsPointer& pointer, QByteArray* out) const
{
    if (!out || !pointer.isValid()) {
        return false;
    }

    if (!containsValid(pointer)) {
        return false;
    }

    QByteArray data;
    if (!readObject(pointer.oid(), &data)) {
        return false;
    }

    if (!pointer.matches(data)) {
        qDebug() << "[LFS store] cached object failed verification, treating as miss:" << pointer.oidHex();
        return false;
    }

    *out = data;
    return true;
}

Monad::ResultBase LfsStore::storeBytes(const LfsOid& oid, const QByteArray& data) const
{
    const QString path = objectPath(oid);
    if (path.isEmpty() || mObjectsDirPath.isEmpty()) {
        return ioError(QStringLiteral("Invalid LFS object path"));
    }

    if (!ensureDirForObjectPath(path)) {
        return ioError(QStringLiteral("Failed to create LFS object directory"));
    }

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        return ioError(file.errorString());
    }
    if (file.write(data) != data.size()) {
        const QString error = file.errorString();
        abandon(file);
        return ioError(QStringLiteral("Failed to write LFS object data: %1").arg(error));
    }
    if (!file.commit()) {
        return ioError(QStringLiteral("Failed to commit LFS object data: %1").arg(file.errorString()));
    }
    return Monad::ResultBase();
}

Monad::ResultBase LfsStore::storeVerified(const LfsPointer& pointer, const QByteArray& data) const
{
    if (!pointer.isValid() || !pointer.matches(data)) {
        return Monad::ResultBase(QStringLiteral("Content does not match LFS pointer %1").arg(pointer.oidHex()),
                                 static_cast<int>(LfsErrorCode::InvalidPointer));
    }
    return storeBytes(pointer.oid(), data);
}

LfsStore::StreamWriter::StreamWriter(std::shared_ptr<State> state)
    : mState(std::move(state))
{
}

bool LfsStore::StreamWriter::isValid() const
{
    return mState && !mState->done && mState->file.isOpen();
}

qint64 LfsStore::StreamWriter::size() const
{
    return mState ? mState->writer.size() : 0;
}

Monad::ResultBase LfsStore::StreamWriter::write(const char* data, qint64 len)
{
    if (!isValid()) {
        return ioError(QStringLiteral("LFS stream writer is not open"));
    }
    return mState->writer.write(data, len);
}

Monad::ResultBase LfsStore::StreamWriter::write(const QByteArray& data)
{
    return write(data.constData(), data.size());
}

Monad::Result<LfsPointer> LfsStore::StreamWriter::finalize()
{
    if (!isValid()) {
        return Monad::Result<LfsPointer>(QStringLiteral("LFS stream writer is not open"),
                                         static_cast<int>(LfsErrorCode::Io));
    }

    const auto finished = mState->writer.finish();
    mState->done = true;

    if (finished.oid != mState->expected) {
        abandon(mState->file);
        const QString message = QStringLiteral("Streamed content hashes to %1, expected %2")
                                    .arg(finished.oid.toHex(), mState->expected.toHex());
        mState.reset();
        return Monad::Result<LfsPointer>(message, static_cast<int>(LfsErrorCode::InvalidPointer));
    }

    if (!mState->file.commit()) {
        const QString message = QStringLiteral("Failed to commit LFS object data: %1")
                                    .arg(mState->file.errorString());
        mState.reset();
        return Monad::Result<LfsPointer>(message, static_cast<int>(LfsErrorCode::Io));
    }

    mState.reset();
    return Monad::Result<LfsPointer>(LfsPointer(finished.oid, finished.size));
}

void LfsStore::StreamWriter::discard()
{
    if (mState && !mState->done) {
        mState->done = true;
        abandon(mState->file);
    }
    mState.reset();
}

Monad::Result<LfsStore::StreamWriter> LfsStore::beginStore(const LfsOid& oid) const
{
    const QString path = objectPath(oid);
    if (path.isEmpty() || mObjectsDirPath.isEmpty()) {
        return Monad::Result<StreamWriter>(QStringLiteral("Invalid LFS object path"),
                                           static_cast<int>(LfsErrorCode::Io));
    }

    if (!ensureDirForObjectPath(path)) {
        return Monad::Result<StreamWriter>(QStringLiteral("Failed to create LFS object directory"),
                                           static_cast<int>(LfsErrorCode::Io));
    }

    auto state = std::make_shared<StreamWriter::State>(path);
    if (!state->file.open(QIODevice::WriteOnly)) {
        return Monad::Result<StreamWriter>(state->file.errorString(),
                                           static_cast<int>(LfsErrorCode::Io));
    }
    state->expected = oid;

    return Monad::Result<StreamWriter>(StreamWriter(std::move(state)));
}

Monad::Result<bool> LfsStore::removeObject(const LfsOid& oid) const
{
    const QString path = objectPath(oid);
    if (path.isEmpty()) {
        return Monad::Result<bool>(false);
    }

    QFile file(path);
    if (!file.exists()) {
        return Monad::Result<bool>(false);
    }
    if (!file.remove()) {
        return Monad::Result<bool>(QStringLiteral("Failed to remove LFS object %1: %2")
                                       .arg(oid.toHex(), file.errorString()),
                                   static_cast<int>(LfsErrorCode::Io));
    }
    return Monad::Result<bool>(true);
}

qint64 LfsStore::totalSize() const
{
    qint64 total = 0;
    for (const auto& object : walkObjects(mObjectsDirPath)) {
        total += object.size;
    }
    return total;
}

int LfsStore::objectCount() const
{
    return walkObjects(mObjectsDirPath).size();
}

QVector<LfsOid> LfsStore::objects() const
{
    QVector<LfsOid> oids;
    const auto found = walkObjects(mObjectsDirPath);
    oids.reserve(found.size());
    for (const auto& object : found) {
        oids.append(object.oid);
    }
    return oids;
}

qint64 LfsStore::prune(const QSet<LfsOid>& keep) const
{
    qint64 reclaimed = 0;
    for (const auto& object : walkObjects(mObjectsDirPath)) {
        if (keep.contains(object.oid)) {
            continue;
        }
        QFile file(object.path);
        if (!file.remove()) {
            qWarning() << "[LFS store] failed to prune" << object.path << file.errorString();
            continue;
        }
        reclaimed += object.size;
    }
    return reclaimed;
}

} // namespace QLfs
