#ifndef GITUTILITIES_H
#define GITUTILITIES_H

//Qt includes
#include <QString>
#include <QUrl>

//Our includes
#include "Monad/Result.h"

namespace QLfs {
class GitUtilities
{
public:
    static QUrl fixGitUrl(const QString& sshUrl);
    static Monad::Result<QUrl> lfsEndpointFromRemoteUrl(const QString& remoteUrl);
    static bool isRemoteNameValid(const QString& remoteName);
    static bool isHttpUrl(const QUrl& url);
};
} // namespace QLfs

#endif // GITUTILITIES_H
