#include "core/query/query_fingerprint.h"

#include <QCryptographicHash>

namespace dr {

QString normalizeQueryText(const QString& queryText)
{
    return queryText.simplified().toLower();
}

QString queryFingerprint(const QString& queryText, uint64_t registryGeneration)
{
    const QString seed = normalizeQueryText(queryText) + QStringLiteral("|")
                         + QString::number(registryGeneration);
    const QByteArray hash = QCryptographicHash::hash(
        seed.toUtf8(), QCryptographicHash::Sha256);
    return QString::fromLatin1(hash.toHex());
}

} // namespace dr
