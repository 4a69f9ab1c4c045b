/*
 * textwrap.cpp — Greedy word wrapping against a width measurer
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "textwrap.h"

#include <QRegularExpression>

namespace Layout {

namespace {

// Split an overlong word into pieces that each fit the width. Always takes
// at least one character per piece so the loop terminates for tiny widths.
QStringList breakWord(const QString &word, qreal width, const AdvanceFunction &advance)
{
    QStringList pieces;
    QString current;
    for (const QChar ch : word) {
        const QString candidate = current + ch;
        if (!current.isEmpty() && advance(candidate) > width) {
            pieces.append(current);
            current = QString(ch);
        } else {
            current = candidate;
        }
    }
    if (!current.isEmpty())
        pieces.append(current);
    return pieces;
}

} // anonymous namespace

QStringList wrapLines(const QString &text, qreal width, const AdvanceFunction &advance)
{
    QStringList lines;
    if (text.isEmpty())
        return lines;

    static const QRegularExpression whitespace(QStringLiteral("[ \\t\\r]+"));
    const QStringList paragraphs = text.split(QLatin1Char('\n'));

    for (const QString &para : paragraphs) {
        const QStringList words = para.split(whitespace, Qt::SkipEmptyParts);
        if (words.isEmpty()) {
            lines.append(QString());
            continue;
        }

        QString current;
        for (const QString &word : words) {
            const QString candidate = current.isEmpty()
                ? word : current + QLatin1Char(' ') + word;
            if (advance(candidate) <= width) {
                current = candidate;
                continue;
            }

            if (!current.isEmpty())
                lines.append(current);
            current.clear();

            if (advance(word) <= width) {
                current = word;
                continue;
            }

            // Forced character breaks; the tail stays open for the next word
            QStringList pieces = breakWord(word, width, advance);
            current = pieces.takeLast();
            lines.append(pieces);
        }
        lines.append(current);
    }
    return lines;
}

} // namespace Layout
