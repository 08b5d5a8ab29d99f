#ifndef LFSFILTER_H
#define LFSFILTER_H

#include <QByteArray>
#include <QString>

#include "LfsClient.h"
#include "LfsPolicy.h"
#include "LfsStore.h"
#include "Monad/Result.h"

namespace QLfs {

/**
 * The clean and smudge halves of the LFS filter, without any hook
 * registration. clean() turns eligible content into pointer text and uploads
 * it. smudge() turns pointer text back into content from the local store or
 * the server.
 */
class LfsFilter
{
public:
    enum class CacheWritePolicy {
        BestEffort, //Failed cache writes are logged and ignored
        Required
    };

    LfsFilter(LfsClient client,
              LfsStore store,
              LfsPolicy policy = LfsPolicy::defaultPolicy(),
              CacheWritePolicy cacheWritePolicy = CacheWritePolicy::BestEffort);

    const LfsClient& client() const { return mClient; }
    const LfsStore& store() const { return mStore; }
    const LfsPolicy& policy() const { return mPolicy; }
    CacheWritePolicy cacheWritePolicy() const { return mCacheWritePolicy; }

    Monad::Result<QByteArray> clean(const QString& path, const QByteArray& content) const;
    Monad::Result<QByteArray> smudge(const QString& path, const QByteArray& data) const;

private:
    LfsClient mClient;
    LfsStore mStore;
    LfsPolicy mPolicy;
    CacheWritePolicy mCacheWritePolicy;

    Monad::ResultBase cache(const LfsPointer& pointer, const QByteArray& content) const;
};

} // namespace QLfs

#endif // LFSFILTER_H
