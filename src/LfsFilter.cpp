#include "LfsFilter.h"

#include <QDebug>

namespace QLfs {

LfsFilter::LfsFilter(LfsClient client, LfsStore store, LfsPolicy policy, CacheWritePolicy cacheWritePolicy)
    : mClient(std::move(client)),
    mStore(std::move(store)),
    mPolicy(std::move(policy)),
    mCacheWritePolicy(cacheWritePolicy)
{
}

Monad::ResultBase LfsFilter::cache(const LfsPointer& pointer, const QByteArray& content) const
{
    auto storeResult = mStore.storeVerified(pointer, content);
    if (!storeResult.hasError()) {
        return storeResult;
    }

    if (mCacheWritePolicy == CacheWritePolicy::Required) {
        return storeResult;
    }

    qWarning() << "[LFS filter] failed to cache" << pointer.oidHex() << storeResult.errorMessage();
    return Monad::ResultBase();
}

Monad::Result<QByteArray> LfsFilter::clean(const QString& path, const QByteArray& content) const
{
    if (!mPolicy.isEligible(path, &content)) {
        return Monad::Result<QByteArray>(content);
    }

    //Already converted, committing it again must not wrap the pointer in another pointer
    if (LfsPointer::isPointer(content)) {
        return Monad::Result<QByteArray>(content);
    }

    const LfsPointer pointer = LfsPointer::fromContent(content);

    auto cacheResult = cache(pointer, content);
    if (cacheResult.hasError()) {
        return Monad::Result<QByteArray>(cacheResult.errorMessage(), cacheResult.errorCode());
    }

    auto uploadResult = mClient.upload(pointer, content);
    if (uploadResult.hasError()) {
        qWarning() << "[LFS filter] upload failed for" << path << uploadResult.errorMessage();
        return Monad::Result<QByteArray>(uploadResult.errorMessage(), uploadResult.errorCode());
    }

    qDebug() << "[LFS filter] cleaned" << path << "to" << pointer.oidHex();
    return Monad::Result<QByteArray>(pointer.toPointerText());
}

Monad::Result<QByteArray> LfsFilter::smudge(const QString& path, const QByteArray& data) const
{
    if (!LfsPointer::isPointer(data)) {
        return Monad::Result<QByteArray>(data);
    }

    auto parseResult = LfsPointer::parse(data);
    if (parseResult.hasError()) {
        return Monad::Result<QByteArray>(parseResult.errorMessage(), parseResult.errorCode());
    }
    const LfsPointer pointer = parseResult.value();

    QByteArray cached;
    if (mStore.readVerified(pointer, &cached)) {
        return Monad::Result<QByteArray>(cached);
    }

    auto downloadResult = mClient.download(pointer);
    if (downloadResult.hasError()) {
        qWarning() << "[LFS filter] download failed for" << path << downloadResult.errorMessage();
        return downloadResult;
    }

    const QByteArray content = downloadResult.value();
    auto cacheResult = cache(pointer, content);
    if (cacheResult.hasError()) {
        return Monad::Result<QByteArray>(cacheResult.errorMessage(), cacheResult.errorCode());
    }

    qDebug() << "[LFS filter] smudged" << path << "from server";
    return Monad::Result<QByteArray>(content);
}

} // namespace QLfs
