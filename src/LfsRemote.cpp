#include "LfsRemote.h"
#include "GitUtilities.h"
#include "LfsError.h"

#include <QDebug>
#include <memory>

#include "git2.h"
#include "git2/config.h"
#include "git2/remote.h"

namespace {

using RepositoryHolder = std::unique_ptr<git_repository, decltype(&git_repository_free)>;

QString toHeaderName(const QString& line)
{
    const int index = line.indexOf(':');
    if (index <= 0) {
        return QString();
    }
    return line.left(index).trimmed();
}

QByteArray toHeaderValue(const QString& line)
{
    const int index = line.indexOf(':');
    if (index < 0) {
        return QByteArray();
    }
    return line.mid(index + 1).trimmed().toUtf8();
}

QString configString(git_config* config, const QByteArray& key)
{
    git_buf buf = GIT_BUF_INIT;
    QString value;
    if (git_config_get_string_buf(&buf, config, key.constData()) == GIT_OK && buf.ptr) {
        value = QString::fromUtf8(buf.ptr);
    }
    git_buf_dispose(&buf);
    return value;
}

void appendHeaderLine(const QString& headerLine, QList<QPair<QByteArray, QByteArray>>* headers)
{
    const QString headerName = toHeaderName(headerLine);
    if (headerName.isEmpty()) {
        qWarning() << "[LFS remote] ignoring malformed extra header" << headerLine;
        return;
    }
    headers->append(qMakePair(headerName.toUtf8(), toHeaderValue(headerLine)));
}

Monad::Result<git_repository*> openRepository(const QString& gitDirPath)
{
    git_libgit2_init();
    git_repository* repo = nullptr;
    if (git_repository_open(&repo, gitDirPath.toUtf8().constData()) != GIT_OK) {
        const git_error* error = git_error_last();
        git_libgit2_shutdown();
        return Monad::Result<git_repository*>(QStringLiteral("Failed to open git repository %1: %2")
                                                  .arg(gitDirPath,
                                                       error && error->message ? QString::fromUtf8(error->message) : QString()),
                                              static_cast<int>(QLfs::LfsErrorCode::InvalidUrl));
    }
    return Monad::Result<git_repository*>(repo);
}

//Balances the git_libgit2_init() in openRepository
void closeRepository(git_repository* repo)
{
    git_repository_free(repo);
    git_libgit2_shutdown();
}

}

namespace QLfs {

Monad::Result<QUrl> LfsRemote::resolveEndpoint(const QString& gitDirPath, const QString& remoteName)
{
    auto repoResult = openRepository(gitDirPath);
    if (repoResult.hasError()) {
        return Monad::Result<QUrl>(repoResult.errorMessage(), repoResult.errorCode());
    }
    RepositoryHolder repoHolder(repoResult.value(), &closeRepository);
    return resolveEndpoint(repoHolder.get(), remoteName);
}

QList<QPair<QByteArray, QByteArray>> LfsRemote::extraHeaders(const QString& gitDirPath, const QUrl& url)
{
    auto repoResult = openRepository(gitDirPath);
    if (repoResult.hasError()) {
        qWarning() << "[LFS remote]" << repoResult.errorMessage();
        return {};
    }
    RepositoryHolder repoHolder(repoResult.value(), &closeRepository);
    return extraHeaders(repoHolder.get(), url);
}

Monad::Result<LfsClientConfig::Builder> LfsRemote::configFor(const QString& gitDirPath, const QString& remoteName)
{
    auto repoResult = openRepository(gitDirPath);
    if (repoResult.hasError()) {
        return Monad::Result<LfsClientConfig::Builder>(repoResult.errorMessage(), repoResult.errorCode());
    }
    RepositoryHolder repoHolder(repoResult.value(), &closeRepository);

    auto endpointResult = resolveEndpoint(repoHolder.get(), remoteName);
    if (endpointResult.hasError()) {
        return Monad::Result<LfsClientConfig::Builder>(endpointResult.errorMessage(), endpointResult.errorCode());
    }

    const QUrl endpoint = endpointResult.value();
    LfsClientConfig::Builder builder(endpoint);
    const auto headers = extraHeaders(repoHolder.get(), endpoint);
    for (const auto& header : headers) {
        builder.addExtraHeader(header.first, header.second);
    }
    return Monad::Result<LfsClientConfig::Builder>(builder);
}

Monad::Result<QUrl> LfsRemote::resolveEndpoint(git_repository* repo, const QString& remoteName)
{
    if (!repo) {
        return Monad::Result<QUrl>(QStringLiteral("Missing git repository"),
                                   static_cast<int>(LfsErrorCode::InvalidUrl));
    }

    git_config* config = nullptr;
    if (git_repository_config(&config, repo) != GIT_OK) {
        return Monad::Result<QUrl>(QStringLiteral("Failed to read git config"),
                                   static_cast<int>(LfsErrorCode::InvalidUrl));
    }

    std::unique_ptr<git_config, decltype(&git_config_free)> configHolder(config, &git_config_free);

    const QString lfsUrlValue = configString(config, QByteArrayLiteral("lfs.url"));
    if (!lfsUrlValue.isEmpty()) {
        return Monad::Result<QUrl>(QUrl(lfsUrlValue));
    }

    QString resolvedRemote = remoteName;
    if (resolvedRemote.isEmpty()) {
        resolvedRemote = defaultRemoteName(repo);
    }
    if (resolvedRemote.isEmpty()) {
        return Monad::Result<QUrl>(QStringLiteral("No git remote configured for LFS"),
                                   static_cast<int>(LfsErrorCode::InvalidUrl));
    }
    if (!GitUtilities::isRemoteNameValid(resolvedRemote)) {
        return Monad::Result<QUrl>(QStringLiteral("Invalid git remote name: %1").arg(resolvedRemote),
                                   static_cast<int>(LfsErrorCode::InvalidUrl));
    }

    const QString remoteLfsValue = configString(config, QStringLiteral("remote.%1.lfsurl").arg(resolvedRemote).toUtf8());
    if (!remoteLfsValue.isEmpty()) {
        return Monad::Result<QUrl>(QUrl(remoteLfsValue));
    }

    git_remote* remote = nullptr;
    if (git_remote_lookup(&remote, repo, resolvedRemote.toUtf8().constData()) != GIT_OK) {
        return Monad::Result<QUrl>(QStringLiteral("Failed to resolve git remote %1 for LFS").arg(resolvedRemote),
                                   static_cast<int>(LfsErrorCode::InvalidUrl));
    }

    std::unique_ptr<git_remote, decltype(&git_remote_free)> remoteHolder(remote, &git_remote_free);

    const char* remoteUrl = git_remote_url(remote);
    if (!remoteUrl) {
        return Monad::Result<QUrl>(QStringLiteral("Missing remote URL for LFS"),
                                   static_cast<int>(LfsErrorCode::InvalidUrl));
    }

    return GitUtilities::lfsEndpointFromRemoteUrl(QString::fromUtf8(remoteUrl));
}

QList<QPair<QByteArray, QByteArray>> LfsRemote::extraHeaders(git_repository* repo, const QUrl& url)
{
    QList<QPair<QByteArray, QByteArray>> headers;
    if (!repo) {
        return headers;
    }

    git_config* config = nullptr;
    if (git_repository_config(&config, repo) != GIT_OK) {
        return headers;
    }

    std::unique_ptr<git_config, decltype(&git_config_free)> configHolder(config, &git_config_free);

    const QString globalHeader = configString(config, QByteArrayLiteral("http.extraheader"));
    if (!globalHeader.isEmpty()) {
        appendHeaderLine(globalHeader, &headers);
    }

    const QString host = url.host();
    if (!host.isEmpty()) {
        const QString hostHeader = configString(config, QStringLiteral("http.%1.extraheader").arg(host).toUtf8());
        if (!hostHeader.isEmpty()) {
            appendHeaderLine(hostHeader, &headers);
        }
    }

    return headers;
}

QString LfsRemote::defaultRemoteName(git_repository* repo)
{
    if (!repo) {
        return QString();
    }

    git_strarray remotes{};
    if (git_remote_list(&remotes, repo) != GIT_OK) {
        return QString();
    }

    QString firstRemote;
    for (size_t i = 0; i < remotes.count; ++i) {
        const QString name = QString::fromUtf8(remotes.strings[i]);
        if (name == QStringLiteral("origin")) {
            git_strarray_dispose(&remotes);
            return name;
        }
        if (firstRemote.isEmpty()) {
            firstRemote = name;
        }
    }

    git_strarray_dispose(&remotes);
    return firstRemote;
}

} // namespace QLfs
