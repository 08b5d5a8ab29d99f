#ifndef LFSSTORE_H
#define LFSSTORE_H

#include <QByteArray>
#include <QSet>
#include <QString>
#include <QVector>

#include <memory>

#include "LfsOid.h"
#include "LfsPointer.h"
#include "Monad/Result.h"

namespace QLfs {

/**
 * Content-addressed object cache laid out as <objectsDir>/hh/hh/<oid hex>.
 *
 * Every write goes through QSaveFile: bytes land in a temporary file beside the
 * final path and are renamed over it on commit, so readers only ever see
 * complete objects. Independent processes may store and read the same
 * directory concurrently, racing writers of one oid commit identical bytes.
 *
 * prune() racing a store of an oid that is not in its keep set may keep or
 * delete that object. Callers that need the object afterwards must re-check
 * with containsValid().
 */
class LfsStore
{
public:
    explicit LfsStore(QString objectsDirPath);

    static LfsStore forGitDir(const QString& gitDirPath);

    const QString& objectsDirPath() const { return mObjectsDirPath; }

    QString objectPath(const LfsOid& oid) const;

    bool contains(const LfsOid& oid) const;
    bool containsValid(const LfsPointer& pointer) const;

    //Unverified, for bulk accounting only
    bool readObject(const LfsOid& oid, QByteArray* out) const;

    //Size or hash mismatch is reported as a miss
    bool readVerified(const LfsPointer& pointer, QByteArray* out) const;

    Monad::ResultBase storeBytes(const LfsOid& oid, const QByteArray& data) const;
    Monad::ResultBase storeVerified(const LfsPointer& pointer, const QByteArray& data) const;

    class StreamWriter {
    public:
        StreamWriter() = default;

        bool isValid() const;
        qint64 size() const;

        Monad::ResultBase write(const char* data, qint64 len);
        Monad::ResultBase write(const QByteArray& data);

        //Commits only if the streamed bytes hash to the expected oid
        Monad::Result<LfsPointer> finalize();
        void discard();

    private:
        struct State;
        explicit StreamWriter(std::shared_ptr<State> state);

        std::shared_ptr<State> mState;

        friend class LfsStore;
    };

    Monad::Result<StreamWriter> beginStore(const LfsOid& oid) const;

    Monad::Result<bool> removeObject(const LfsOid& oid) const;

    qint64 totalSize() const;
    int objectCount() const;
    QVector<LfsOid> objects() const;

    qint64 prune(const QSet<LfsOid>& keep) const;

private:
    QString mObjectsDirPath;
};

} // namespace QLfs

#endif // LFSSTORE_H
