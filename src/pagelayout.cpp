#include "pagelayout.h"

#include <QDebug>

using ScriptFormat::Role;

PageLayout::PageLayout(const PaginationSettings &settings)
    : m_settings(settings)
{
}

void PageLayout::setSettings(const PaginationSettings &settings)
{
    m_settings = settings;
    reset();
}

void PageLayout::reset()
{
    m_roles.clear();
    m_counts.clear();
    m_lineIds.clear();
    m_breaks.clear();
    m_pages.clear();
    m_lastResumeIndex = -1;
}

int PageLayout::update(const QVector<ScriptLine> &lines, const QVector<double> &heightHints)
{
    QVector<Role> roles;
    roles.reserve(lines.size());
    for (const ScriptLine &line : lines) {
        roles.append(line.role);
    }
    const QVector<int> counts = Paginator::occupiedLineCounts(lines, heightHints, m_settings.lineHeightPx);

    const int changedLine = firstChangedLine(lines, roles, counts);
    if (changedLine < 0) {
        m_lastResumeIndex = -1;
        return -1;
    }

    // The break at a page start depends on that line and the one after it
    // (speaker look-ahead). Any page starting at or after changedLine - 1 can
    // move, so resume from the page holding changedLine - 2.
    int firstPage = pageIndexForLine(qMax(0, changedLine - 2));
    if (firstPage < 0) {
        firstPage = 0;
    }

    QVector<PageBreak> breaks = m_breaks.mid(0, firstPage);
    const int resumeIndex = firstPage < m_breaks.size() ? m_breaks.at(firstPage).startIndex : 0;
    breaks += Paginator::paginate(roles, counts, resumeIndex, m_settings);
    m_lastResumeIndex = resumeIndex;

    int firstChangedPage = -1;
    for (int i = firstPage; i < qMax(breaks.size(), m_breaks.size()); ++i) {
        if (i >= breaks.size() || i >= m_breaks.size() || breaks.at(i) != m_breaks.at(i)) {
            firstChangedPage = i;
            break;
        }
    }

    const int oldPageCount = m_pages.size();
    m_roles = roles;
    m_counts = counts;
    m_lineIds.clear();
    for (const ScriptLine &line : lines) {
        m_lineIds.append(line.id);
    }
    m_breaks = breaks;
    applyBreaks(breaks, lines, firstPage);
    checkPageLimits(firstPage);

    if (oldPageCount != m_pages.size()) {
        qDebug() << "[PageLayout] Page count" << oldPageCount << "->" << m_pages.size();
    }
    return firstChangedPage;
}

int PageLayout::firstChangedLine(const QVector<ScriptLine> &lines, const QVector<Role> &roles,
                                 const QVector<int> &counts) const
{
    const int common = qMin(lines.size(), m_roles.size());
    for (int i = 0; i < common; ++i) {
        if (roles.at(i) != m_roles.at(i) || counts.at(i) != m_counts.at(i)
            || lines.at(i).id != m_lineIds.at(i)) {
            return i;
        }
    }
    if (lines.size() != m_roles.size() || m_breaks.isEmpty()) {
        return common;
    }
    return -1;
}

int PageLayout::pageIndexForLine(int lineIndex) const
{
    int low = 0;
    int high = m_breaks.size() - 1;
    while (low <= high) {
        const int mid = (low + high) / 2;
        const PageBreak &page = m_breaks.at(mid);
        if (lineIndex < page.startIndex) {
            high = mid - 1;
        } else if (lineIndex >= page.endIndex) {
            low = mid + 1;
        } else {
            return mid;
        }
    }
    return -1;
}

int PageLayout::pageForLine(int lineIndex) const
{
    const int index = pageIndexForLine(lineIndex);
    return index < 0 ? 0 : index + 1;
}

void PageLayout::applyBreaks(const QVector<PageBreak> &breaks, const QVector<ScriptLine> &lines, int fromPage)
{
    // Existing containers are reused, trailing ones dropped, missing ones created.
    m_pages.resize(breaks.size());
    for (int i = fromPage; i < breaks.size(); ++i) {
        const PageBreak &pageBreak = breaks.at(i);
        Page &page = m_pages[i];
        page.number = i + 1;
        page.startIndex = pageBreak.startIndex;
        page.endIndex = pageBreak.endIndex;
        page.lineCount = pageBreak.lineCount;
        page.lineIds.clear();
        for (int line = pageBreak.startIndex; line < pageBreak.endIndex; ++line) {
            page.lineIds.append(lines.at(line).id);
        }
    }
}

void PageLayout::checkPageLimits(int fromPage) const
{
    const int limit = m_settings.linesPerPage + m_settings.overflowAllowance;
    for (int i = fromPage; i < m_pages.size(); ++i) {
        const Page &page = m_pages.at(i);
        if (page.lineCount <= limit) {
            continue;
        }
        if (page.endIndex - page.startIndex == 1) {
            qWarning() << "[PageLayout] Page" << page.number << "holds a single line of"
                       << page.lineCount << "lines";
        } else {
            qWarning() << "[PageLayout] Page" << page.number << "exceeds capacity:"
                       << page.lineCount << ">" << limit;
        }
    }
}
