#include "LfsPolicy.h"

#include <QBuffer>
#include <QFile>
#include <QFileInfo>

#include <algorithm>

namespace {

constexpr qint64 SvgLfsThresholdBytes = 250 * 1024;
constexpr qint64 ScanChunkBytes = 64 * 1024;

const char* const BinaryExtensions[] = {
    "bmp", "gif", "glb", "gltf", "gz", "jpeg", "jpg", "mov", "mp3",
    "mp4", "pdf", "png", "psd", "tif", "tiff", "wav", "webp", "zip"
};

QString extensionOf(const QString& path)
{
    return QFileInfo(path).suffix().toLower();
}

//Case-insensitive search for an inline raster image, the needle may straddle two chunks
bool containsInlineRaster(QIODevice* device)
{
    static const QByteArray needle("data:image/");
    QByteArray tail;
    while (!device->atEnd()) {
        const QByteArray chunk = device->read(ScanChunkBytes);
        if (chunk.isEmpty()) {
            break;
        }
        const QByteArray window = (tail + chunk).toLower();
        if (window.contains(needle)) {
            return true;
        }
        tail = window.right(needle.size() - 1);
    }
    return false;
}

bool isHeavySvg(const QString& path, const QByteArray* data)
{
    if (data) {
        if (data->size() > SvgLfsThresholdBytes) {
            return true;
        }
        QBuffer buffer;
        buffer.setData(*data);
        return buffer.open(QIODevice::ReadOnly) && containsInlineRaster(&buffer);
    }

    const QFileInfo info(path);
    if (!info.isFile()) {
        return false;
    }
    if (info.size() > SvgLfsThresholdBytes) {
        return true;
    }
    QFile file(path);
    return file.open(QIODevice::ReadOnly) && containsInlineRaster(&file);
}

bool always(const QString&, const QByteArray*)
{
    return true;
}

bool never(const QString&, const QByteArray*)
{
    return false;
}

} // namespace

namespace QLfs {

void LfsPolicy::setRule(const QString& extension, EligibilityFn rule)
{
    const QString key = extension.toLower();
    if (!key.isEmpty()) {
        mRules.insert(key, std::move(rule));
    }
}

void LfsPolicy::setDefaultRule(EligibilityFn rule)
{
    mDefaultRule = std::move(rule);
}

bool LfsPolicy::isEligible(const QString& path, const QByteArray* data) const
{
    const auto ruleIt = mRules.constFind(extensionOf(path));
    if (ruleIt != mRules.constEnd()) {
        return ruleIt.value()(path, data);
    }
    return mDefaultRule ? mDefaultRule(path, data) : false;
}

QStringList LfsPolicy::trackedExtensions() const
{
    QStringList extensions = mRules.keys();
    std::sort(extensions.begin(), extensions.end());
    return extensions;
}

LfsPolicy LfsPolicy::defaultPolicy()
{
    LfsPolicy policy;
    for (const char* extension : BinaryExtensions) {
        policy.setRule(QLatin1String(extension), &always);
    }
    policy.setRule(QStringLiteral("svg"), &isHeavySvg);
    policy.setDefaultRule(&never);
    return policy;
}

LfsPolicy LfsPolicy::trackAll()
{
    LfsPolicy policy;
    policy.setDefaultRule(&always);
    return policy;
}

} // namespace QLfs
