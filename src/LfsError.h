#ifndef LFSERROR_H
#define LFSERROR_H

#include <QString>

namespace QLfs {

//Error codes carried by Monad::Result / Monad::ResultBase errorCode()
enum class LfsErrorCode : int {
    NoError = 0,
    InvalidPointer,
    InvalidHash,
    InvalidUrl,
    NotFound,
    ServerError,
    AuthRequired,
    Transport,
    Io,
    Protocol
};

QString lfsServerErrorMessage(int serverCode, const QString& message);

} // namespace QLfs

#endif // LFSERROR_H
