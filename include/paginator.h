#pragma once

#include "scriptdocument.h"

#include <QVector>

struct PaginationSettings {
    int linesPerPage = 54;
    int overflowAllowance = 2;
    double lineHeightPx = 22.0;
};

struct PageBreak {
    int startIndex = 0;
    int endIndex = 0; // exclusive
    int lineCount = 0;

    bool operator==(const PageBreak &other) const
    {
        return startIndex == other.startIndex && endIndex == other.endIndex && lineCount == other.lineCount;
    }
    bool operator!=(const PageBreak &other) const { return !(*this == other); }
};

namespace Paginator {

// Printed lines a script line occupies: wrapped height over line height,
// rounded up, and never fewer than its explicit line breaks + 1.
int occupiedLineCount(const QString &text, double wrappedHeightPx, double lineHeightPx);

QVector<int> occupiedLineCounts(const QVector<ScriptLine> &lines, const QVector<double> &heightHints,
                                double lineHeightPx);

int totalOccupiedLines(const QVector<ScriptLine> &lines, const QVector<double> &heightHints,
                       double lineHeightPx);

QVector<PageBreak> computeBreaks(const QVector<ScriptLine> &lines, const QVector<double> &heightHints,
                                 const PaginationSettings &settings = PaginationSettings());

// Greedy walk over precomputed occupied counts, starting with an empty page at
// startIndex. computeBreaks() is paginate(roles, counts, 0, settings).
QVector<PageBreak> paginate(const QVector<ScriptFormat::Role> &roles, const QVector<int> &counts,
                            int startIndex, const PaginationSettings &settings);

} // namespace Paginator

// Deterministic stand-in for rendered block heights: every paragraph of a
// line wraps at the role's characters-per-line.
class HeightEstimator {
public:
    explicit HeightEstimator(double lineHeightPx = PaginationSettings().lineHeightPx);

    int wrappedLineCount(const ScriptLine &line) const;
    double estimateHeight(const ScriptLine &line) const;
    QVector<double> estimateHeights(const QVector<ScriptLine> &lines) const;

private:
    double m_lineHeightPx;
};
