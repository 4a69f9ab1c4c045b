/*
 * conditionfilter.h — Case-insensitive condition allow-set
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef INSPECTPRINT_CONDITIONFILTER_H
#define INSPECTPRINT_CONDITIONFILTER_H

#include <QSet>
#include <QString>
#include <QStringList>

namespace ConditionFilter {

struct AllowSet {
    QSet<QString> codes;    // upper-cased, trimmed

    bool isActive() const { return !codes.isEmpty(); }
};

AllowSet fromList(const QStringList &conditions);

// A code passes when the filter is inactive, or when it is non-empty and
// in the set. A missing code never passes an active filter.
bool passes(const AllowSet &allowed, const QString &condition);

// "NOT_APPLICABLE" -> "Not Applicable". Empty input gives an empty string.
QString formatCode(const QString &condition);

} // namespace ConditionFilter

#endif // INSPECTPRINT_CONDITIONFILTER_H
