/*
 * conditionfilter.cpp — Case-insensitive condition allow-set
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "conditionfilter.h"

namespace ConditionFilter {

AllowSet fromList(const QStringList &conditions)
{
    AllowSet result;
    for (const QString &code : conditions) {
        const QString normalized = code.trimmed().toUpper();
        if (!normalized.isEmpty())
            result.codes.insert(normalized);
    }
    return result;
}

bool passes(const AllowSet &allowed, const QString &condition)
{
    if (!allowed.isActive())
        return true;
    const QString normalized = condition.trimmed().toUpper();
    if (normalized.isEmpty())
        return false;
    return allowed.codes.contains(normalized);
}

QString formatCode(const QString &condition)
{
    const QStringList parts = condition.trimmed().toLower()
                                  .split(QLatin1Char('_'), Qt::SkipEmptyParts);
    QStringList words;
    words.reserve(parts.size());
    for (const QString &part : parts)
        words.append(part.left(1).toUpper() + part.mid(1));
    return words.join(QLatin1Char(' '));
}

} // namespace ConditionFilter
