#ifndef LFSPOLICY_H
#define LFSPOLICY_H

#include <QByteArray>
#include <QHash>
#include <QString>
#include <QStringList>

#include <functional>

namespace QLfs {

/**
 * Decides which paths are stored as LFS objects.
 *
 * Rules are keyed by lower case file extension. Paths without a matching rule,
 * including paths without an extension, fall back to the default rule, and
 * are kept in git when there is none. When data is null a rule may inspect the
 * file at path instead.
 */
class LfsPolicy
{
public:
    using EligibilityFn = std::function<bool(const QString& path, const QByteArray* data)>;

    LfsPolicy() = default;

    void setRule(const QString& extension, EligibilityFn rule);
    void setDefaultRule(EligibilityFn rule);

    bool isEligible(const QString& path, const QByteArray* data = nullptr) const;
    QStringList trackedExtensions() const;

    static LfsPolicy defaultPolicy();
    static LfsPolicy trackAll();

private:
    QHash<QString, EligibilityFn> mRules;
    EligibilityFn mDefaultRule;
};

} // namespace QLfs

#endif // LFSPOLICY_H
