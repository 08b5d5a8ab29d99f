#ifndef LFSCLIENTCONFIG_H
#define LFSCLIENTCONFIG_H

#include <QByteArray>
#include <QList>
#include <QPair>
#include <QString>
#include <QUrl>

#include <memory>

#include "LfsAuthProvider.h"
#include "Monad/Result.h"

namespace QLfs {

/**
 * Immutable settings for LfsClient. Copies share one read-only block, so a
 * config can be handed to several threads without locking.
 */
class LfsClientConfig
{
public:
    class Builder
    {
    public:
        Builder() = default;
        explicit Builder(QUrl endpoint);

        //Derives the endpoint from a git remote URL (https, http, scp or ssh://)
        static Monad::Result<Builder> fromRemoteUrl(const QString& remoteUrl);

        Builder& setBearerToken(const QString& token);
        Builder& setBasicAuth(const QString& user, const QString& password);
        Builder& setAuthProvider(std::shared_ptr<LfsAuthProvider> provider);
        Builder& setRefName(const QString& refName);
        Builder& setUserAgent(const QString& userAgent);
        Builder& addExtraHeader(const QByteArray& name, const QByteArray& value);

        LfsClientConfig build() const;

    private:
        QUrl mEndpoint;
        QByteArray mExplicitAuthorization;
        std::shared_ptr<LfsAuthProvider> mAuthProvider;
        QString mRefName;
        QString mUserAgent = LfsClientConfig::defaultUserAgent();
        QList<QPair<QByteArray, QByteArray>> mExtraHeaders;
    };

    LfsClientConfig();

    static QString defaultUserAgent();

    QUrl endpoint() const;
    QUrl batchUrl() const;
    QString refName() const;
    QString userAgent() const;
    QList<QPair<QByteArray, QByteArray>> extraHeaders() const;

    //Explicit credentials, then the provider, then user:password in the endpoint URL
    QByteArray authorizationHeader() const;

private:
    struct Data {
        QUrl endpoint;
        QByteArray explicitAuthorization;
        std::shared_ptr<LfsAuthProvider> authProvider;
        QString refName;
        QString userAgent;
        QList<QPair<QByteArray, QByteArray>> extraHeaders;
    };

    explicit LfsClientConfig(std::shared_ptr<const Data> data);

    std::shared_ptr<const Data> mData;
};

} // namespace QLfs

#endif // LFSCLIENTCONFIG_H
