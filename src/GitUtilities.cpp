#include "GitUtilities.h"
#include "LfsError.h"
#include "git2.h"

using namespace QLfs;

namespace {

Monad::Result<QUrl> invalidUrl(const QString& message)
{
    return Monad::Result<QUrl>(message, static_cast<int>(LfsErrorCode::InvalidUrl));
}

//user@host:path with no scheme, the form github and gitlab hand out for ssh
bool isScpStyle(const QString& url)
{
    if (url.contains(QStringLiteral("://"))) {
        return false;
    }
    const int colon = url.indexOf(QLatin1Char(':'));
    if (colon <= 0 || colon == url.size() - 1) {
        return false;
    }
    const int slash = url.indexOf(QLatin1Char('/'));
    return slash < 0 || slash > colon;
}

}

//This will try to fix the URL. Url from github and gitlab
//have ssh urls git@github.com:owner/project.git
//This isn't a valid QUrl and should be converted into ssh://git@github.com/owner/project.git
QUrl GitUtilities::fixGitUrl(const QString &sshUrl)
{
    if(isScpStyle(sshUrl)) {
        const int colon = sshUrl.indexOf(QLatin1Char(':'));
        return QUrl(QStringLiteral("ssh://") + sshUrl.left(colon) + "/" + sshUrl.mid(colon + 1));
    }
    return QUrl(sshUrl);
}

//Maps any supported remote form onto <scheme>://host/path.git/info/lfs/
//ssh and scp remotes are served over https on the same host
Monad::Result<QUrl> GitUtilities::lfsEndpointFromRemoteUrl(const QString &remoteUrl)
{
    const QString trimmed = remoteUrl.trimmed();
    if(trimmed.isEmpty()) {
        return invalidUrl(QStringLiteral("Empty remote URL"));
    }

    const QUrl url = fixGitUrl(trimmed);
    if(!url.isValid() || url.host().isEmpty()) {
        return invalidUrl(QStringLiteral("Invalid remote URL: %1").arg(trimmed));
    }

    QUrl endpoint;
    if(isHttpUrl(url)) {
        endpoint = url;
    } else if(url.scheme().toLower() == QStringLiteral("ssh")) {
        endpoint.setScheme(QStringLiteral("https"));
        endpoint.setHost(url.host());
    } else {
        return invalidUrl(QStringLiteral("Unsupported remote URL scheme: %1").arg(url.scheme()));
    }

    QString path = url.path();
    while(path.endsWith(QLatin1Char('/'))) {
        path.chop(1);
    }
    if(!path.startsWith(QLatin1Char('/'))) {
        path.prepend(QLatin1Char('/'));
    }
    if(!path.endsWith(QStringLiteral(".git"))) {
        path += QStringLiteral(".git");
    }
    path += QStringLiteral("/info/lfs/");

    endpoint.setPath(path);
    endpoint.setQuery(QString());
    endpoint.setFragment(QString());

    if(!endpoint.isValid()) {
        return invalidUrl(QStringLiteral("Could not derive LFS endpoint from %1").arg(trimmed));
    }
    return Monad::Result<QUrl>(endpoint);
}

bool GitUtilities::isRemoteNameValid(const QString &remoteName)
{
    return git_remote_is_valid_name(remoteName.toLocal8Bit());
}

bool GitUtilities::isHttpUrl(const QUrl& url)
{
    const QString scheme = url.scheme().toLower();
    return scheme == QStringLiteral("http") || scheme == QStringLiteral("https");
}
