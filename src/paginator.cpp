#include "paginator.h"

#include <QStringList>
#include <QtMath>

using ScriptFormat::Role;

namespace {

int wrapSegment(const QString &segment, int width)
{
    if (segment.isEmpty() || width <= 0) {
        return 1;
    }

    int rows = 1;
    int column = 0;
    const QStringList words = segment.split(QLatin1Char(' '));
    for (const QString &word : words) {
        int length = word.size();
        const int needed = column == 0 ? length : column + 1 + length;
        if (needed <= width) {
            column = needed;
            continue;
        }
        if (column > 0) {
            ++rows;
        }
        while (length > width) {
            ++rows;
            length -= width;
        }
        column = length;
    }
    return rows;
}

} // namespace

namespace Paginator {

int occupiedLineCount(const QString &text, double wrappedHeightPx, double lineHeightPx)
{
    const int explicitLines = static_cast<int>(text.count(QLatin1Char('\n'))) + 1;
    if (lineHeightPx <= 0.0 || wrappedHeightPx <= 0.0) {
        return explicitLines;
    }
    const int wrapped = static_cast<int>(qCeil(wrappedHeightPx / lineHeightPx));
    return qMax(wrapped, explicitLines);
}

QVector<int> occupiedLineCounts(const QVector<ScriptLine> &lines, const QVector<double> &heightHints,
                                double lineHeightPx)
{
    QVector<int> counts;
    counts.reserve(lines.size());
    for (int i = 0; i < lines.size(); ++i) {
        const double hint = i < heightHints.size() ? heightHints.at(i) : 0.0;
        counts.append(occupiedLineCount(lines.at(i).text, hint, lineHeightPx));
    }
    return counts;
}

int totalOccupiedLines(const QVector<ScriptLine> &lines, const QVector<double> &heightHints,
                       double lineHeightPx)
{
    int total = 0;
    for (int count : occupiedLineCounts(lines, heightHints, lineHeightPx)) {
        total += count;
    }
    return total;
}

QVector<PageBreak> computeBreaks(const QVector<ScriptLine> &lines, const QVector<double> &heightHints,
                                 const PaginationSettings &settings)
{
    QVector<Role> roles;
    roles.reserve(lines.size());
    for (const ScriptLine &line : lines) {
        roles.append(line.role);
    }
    return paginate(roles, occupiedLineCounts(lines, heightHints, settings.lineHeightPx), 0, settings);
}

QVector<PageBreak> paginate(const QVector<Role> &roles, const QVector<int> &counts,
                            int startIndex, const PaginationSettings &settings)
{
    QVector<PageBreak> pages;
    const int total = qMin(roles.size(), counts.size());
    if (startIndex < 0 || startIndex >= total) {
        return pages;
    }

    const int capacity = qMax(1, settings.linesPerPage);
    const int limit = capacity + qMax(0, settings.overflowAllowance);

    int pageStart = startIndex;
    int count = 0;
    auto closePage = [&](int endIndex) {
        pages.append(PageBreak{pageStart, endIndex, count});
        pageStart = endIndex;
        count = 0;
    };

    for (int i = startIndex; i < total; ++i) {
        const int lines = counts.at(i);
        const bool speakerBeforeDialog = roles.at(i) == ScriptFormat::Speaker
            && i + 1 < total && roles.at(i + 1) == ScriptFormat::Dialog;

        if (speakerBeforeDialog) {
            const int pairLines = lines + counts.at(i + 1);
            if (count + pairLines <= limit) {
                count += pairLines;
                ++i;
                continue;
            }
            if (i > pageStart) {
                closePage(i);
            }
            if (pairLines <= limit) {
                count += pairLines;
                ++i;
                continue;
            }
            // The pair cannot share any page; the dialog continues below.
            count += lines;
            continue;
        }

        if (count + lines > capacity && i > pageStart) {
            closePage(i);
        }
        count += lines;
    }

    closePage(total);
    return pages;
}

} // namespace Paginator

HeightEstimator::HeightEstimator(double lineHeightPx)
    : m_lineHeightPx(lineHeightPx)
{
}

int HeightEstimator::wrappedLineCount(const ScriptLine &line) const
{
    const int width = ScriptFormat::charactersPerLine(line.role);
    int rows = 0;
    const QStringList segments = line.text.split(QLatin1Char('\n'));
    for (const QString &segment : segments) {
        rows += wrapSegment(segment, width);
    }
    return qMax(1, rows);
}

double HeightEstimator::estimateHeight(const ScriptLine &line) const
{
    return wrappedLineCount(line) * m_lineHeightPx;
}

QVector<double> HeightEstimator::estimateHeights(const QVector<ScriptLine> &lines) const
{
    QVector<double> heights;
    heights.reserve(lines.size());
    for (const ScriptLine &line : lines) {
        heights.append(estimateHeight(line));
    }
    return heights;
}
