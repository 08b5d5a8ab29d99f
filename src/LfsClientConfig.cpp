#include "LfsClientConfig.h"
#include "GitUtilities.h"

namespace {

QString trimTrailingSlash(QString value)
{
    while (value.endsWith('/')) {
        value.chop(1);
    }
    return value;
}

bool parseAuthFromUrl(const QUrl& url, QByteArray* headerOut)
{
    if (!headerOut) {
        return false;
    }
    const QString user = url.userName();
    const QString pass = url.password();
    if (user.isEmpty() && pass.isEmpty()) {
        return false;
    }
    const QByteArray credentials = (user + ":" + pass).toUtf8().toBase64();
    *headerOut = QByteArray("Basic ") + credentials;
    return true;
}

}

namespace QLfs {

LfsClientConfig::Builder::Builder(QUrl endpoint)
    : mEndpoint(std::move(endpoint))
{
}

Monad::Result<LfsClientConfig::Builder> LfsClientConfig::Builder::fromRemoteUrl(const QString& remoteUrl)
{
    auto endpointResult = GitUtilities::lfsEndpointFromRemoteUrl(remoteUrl);
    if (endpointResult.hasError()) {
        return Monad::Result<Builder>(endpointResult.errorMessage(), endpointResult.errorCode());
    }
    return Monad::Result<Builder>(Builder(endpointResult.value()));
}

LfsClientConfig::Builder& LfsClientConfig::Builder::setBearerToken(const QString& token)
{
    mExplicitAuthorization = QByteArray("Bearer ") + token.toUtf8();
    return *this;
}

LfsClientConfig::Builder& LfsClientConfig::Builder::setBasicAuth(const QString& user, const QString& password)
{
    mExplicitAuthorization = QByteArray("Basic ") + (user + ":" + password).toUtf8().toBase64();
    return *this;
}

LfsClientConfig::Builder& LfsClientConfig::Builder::setAuthProvider(std::shared_ptr<LfsAuthProvider> provider)
{
    mAuthProvider = std::move(provider);
    return *this;
}

LfsClientConfig::Builder& LfsClientConfig::Builder::setRefName(const QString& refName)
{
    mRefName = refName;
    return *this;
}

LfsClientConfig::Builder& LfsClientConfig::Builder::setUserAgent(const QString& userAgent)
{
    mUserAgent = userAgent;
    return *this;
}

LfsClientConfig::Builder& LfsClientConfig::Builder::addExtraHeader(const QByteArray& name, const QByteArray& value)
{
    mExtraHeaders.append(qMakePair(name, value));
    return *this;
}

LfsClientConfig LfsClientConfig::Builder::build() const
{
    auto data = std::make_shared<Data>();
    data->endpoint = mEndpoint;
    data->explicitAuthorization = mExplicitAuthorization;
    data->authProvider = mAuthProvider;
    data->refName = mRefName;
    data->userAgent = mUserAgent;
    data->extraHeaders = mExtraHeaders;
    return LfsClientConfig(std::move(data));
}

LfsClientConfig::LfsClientConfig()
    : mData(std::make_shared<const Data>())
{
}

LfsClientConfig::LfsClientConfig(std::shared_ptr<const Data> data)
    : mData(std::move(data))
{
}

QString LfsClientConfig::defaultUserAgent()
{
    return QStringLiteral("qlfs/%1").arg(QStringLiteral(QLFS_VERSION));
}

QUrl LfsClientConfig::endpoint() const
{
    return mData->endpoint;
}

QUrl LfsClientConfig::batchUrl() const
{
    QUrl url(mData->endpoint);
    url.setPath(trimTrailingSlash(url.path()) + QStringLiteral("/objects/batch"));
    return url;
}

QString LfsClientConfig::refName() const
{
    return mData->refName;
}

QString LfsClientConfig::userAgent() const
{
    return mData->userAgent;
}

QList<QPair<QByteArray, QByteArray>> LfsClientConfig::extraHeaders() const
{
    return mData->extraHeaders;
}

QByteArray LfsClientConfig::authorizationHeader() const
{
    if (!mData->explicitAuthorization.isEmpty()) {
        return mData->explicitAuthorization;
    }

    if (mData->authProvider) {
        const QByteArray provided = mData->authProvider->authorizationHeader(mData->endpoint);
        if (!provided.isEmpty()) {
            return provided;
        }
    }

    QByteArray authHeader;
    if (parseAuthFromUrl(mData->endpoint, &authHeader)) {
        return authHeader;
    }
    return QByteArray();
}

} // namespace QLfs
