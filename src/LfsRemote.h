#ifndef LFSREMOTE_H
#define LFSREMOTE_H

#include <QByteArray>
#include <QList>
#include <QPair>
#include <QString>
#include <QUrl>

#include "LfsClientConfig.h"
#include "Monad/Result.h"

struct git_repository;

namespace QLfs {

/**
 * Reads LFS settings from a repository's git config through libgit2.
 *
 * The endpoint comes from lfs.url, then remote.<name>.lfsurl, then the remote's
 * own URL. With no remote name, origin is used if it exists, otherwise the
 * first configured remote.
 */
class LfsRemote
{
public:
    static Monad::Result<QUrl> resolveEndpoint(const QString& gitDirPath, const QString& remoteName = QString());
    static QList<QPair<QByteArray, QByteArray>> extraHeaders(const QString& gitDirPath, const QUrl& url);
    static Monad::Result<LfsClientConfig::Builder> configFor(const QString& gitDirPath, const QString& remoteName = QString());

    static Monad::Result<QUrl> resolveEndpoint(git_repository* repo, const QString& remoteName);
    static QList<QPair<QByteArray, QByteArray>> extraHeaders(git_repository* repo, const QUrl& url);
    static QString defaultRemoteName(git_repository* repo);
};

} // namespace QLfs

#endif // LFSREMOTE_H
