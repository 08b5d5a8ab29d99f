#include "LfsError.h"

namespace QLfs {

QString lfsServerErrorMessage(int serverCode, const QString& message)
{
    const QString text = message.isEmpty() ? QStringLiteral("LFS server error") : message;
    return QStringLiteral("%1 (code %2)").arg(text).arg(serverCode);
}

} // namespace QLfs
