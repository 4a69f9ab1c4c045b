/*
 * textwrap.h — Greedy word wrapping against a width measurer
 *
 * Used by every drawing surface so that measured and drawn text agree:
 * the surface supplies the advance function for its font, the wrapper
 * decides the line breaks.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef INSPECTPRINT_TEXTWRAP_H
#define INSPECTPRINT_TEXTWRAP_H

#include <QString>
#include <QStringList>

#include <functional>

namespace Layout {

using AdvanceFunction = std::function<qreal(const QString &)>;

// Break text into lines no wider than width. '\n' forces a break; a word
// wider than the whole line is broken between characters. Empty text gives
// no lines; an empty paragraph between two newlines gives an empty line.
QStringList wrapLines(const QString &text, qreal width, const AdvanceFunction &advance);

} // namespace Layout

#endif // INSPECTPRINT_TEXTWRAP_H
