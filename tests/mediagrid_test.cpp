#include "mediagrid.h"

#include <cassert>

int main()
{
    const Layout::GridSpec spec; // 4 columns, gutter 8, caption gap 4
    const Layout::TextMeasure tenPerCaption = [](const QString &, qreal) { return 10.0; };

    // Nothing to plan
    Layout::GridPlan plan = Layout::planGrid(0, {}, 424, 100, spec, tenPerCaption);
    assert(plan.rowCount() == 0);
    assert(plan.totalHeight == 0);

    // 4 + 1 tiles without captions
    plan = Layout::planGrid(5, {}, 424, 100, spec, tenPerCaption);
    assert(qFuzzyCompare(plan.tileWidth, 100.0));
    assert(plan.rowCount() == 2);
    assert(plan.rowHeights[0] == 100 && plan.rowHeights[1] == 100);
    assert(qFuzzyCompare(plan.totalHeight, 208.0));

    // A single caption grows only its own row
    const QStringList captions{QString(), QStringLiteral("Cracked frame")};
    plan = Layout::planGrid(5, captions, 424, 100, spec, tenPerCaption);
    assert(qFuzzyCompare(plan.rowHeights[0], 114.0));
    assert(qFuzzyCompare(plan.rowHeights[1], 100.0));
    assert(qFuzzyCompare(plan.totalHeight, 222.0));
    assert(qFuzzyCompare(plan.heightOfRows(1, 1, spec.gutter), 100.0));
    assert(qFuzzyCompare(plan.heightOfRows(0, 2, spec.gutter), 222.0));

    // No measurer: captions are ignored
    plan = Layout::planGrid(2, captions, 424, 100, spec, Layout::TextMeasure());
    assert(plan.rowCount() == 1 && plan.rowHeights[0] == 100);

    // Single column stacks every tile
    Layout::GridSpec narrow;
    narrow.columns = 1;
    plan = Layout::planGrid(3, {}, 200, 50, narrow, tenPerCaption);
    assert(plan.rowCount() == 3);
    assert(qFuzzyCompare(plan.tileWidth, 200.0));
    assert(qFuzzyCompare(plan.totalHeight, 3 * 50.0 + 2 * 8.0));

    // Width too small for the gutters never gives a negative tile
    plan = Layout::planGrid(4, {}, 10, 100, spec, tenPerCaption);
    assert(plan.tileWidth == 0);

    return 0;
}
