#ifndef LFSAUTHPROVIDER_H
#define LFSAUTHPROVIDER_H

#include <QByteArray>
#include <QUrl>

namespace QLfs {

//Supplies the Authorization header value for an LFS endpoint, empty for none
class LfsAuthProvider
{
public:
    virtual ~LfsAuthProvider() = default;
    virtual QByteArray authorizationHeader(const QUrl& url) const = 0;
};

} // namespace QLfs

#endif // LFSAUTHPROVIDER_H
