#pragma once

#include "paginator.h"

#include <QStringList>
#include <QVector>

struct Page {
    int number = 1;
    int startIndex = 0;
    int endIndex = 0;
    int lineCount = 0;
    QStringList lineIds;
};

// Page containers for one document. update() only re-walks the lines from the
// first page that the changed lines can influence.
class PageLayout {
public:
    explicit PageLayout(const PaginationSettings &settings = PaginationSettings());

    const PaginationSettings &settings() const { return m_settings; }
    void setSettings(const PaginationSettings &settings);

    // Returns the index of the first page whose range changed, or -1 when the
    // layout is unchanged.
    int update(const QVector<ScriptLine> &lines, const QVector<double> &heightHints);
    void reset();

    int pageCount() const { return m_pages.size(); }
    const QVector<Page> &pages() const { return m_pages; }
    const QVector<PageBreak> &breaks() const { return m_breaks; }
    int pageForLine(int lineIndex) const;
    int lastResumeIndex() const { return m_lastResumeIndex; }

private:
    int firstChangedLine(const QVector<ScriptLine> &lines, const QVector<ScriptFormat::Role> &roles,
                         const QVector<int> &counts) const;
    int pageIndexForLine(int lineIndex) const;
    void applyBreaks(const QVector<PageBreak> &breaks, const QVector<ScriptLine> &lines, int fromPage);
    void checkPageLimits(int fromPage) const;

    PaginationSettings m_settings;
    QVector<ScriptFormat::Role> m_roles;
    QVector<int> m_counts;
    QStringList m_lineIds;
    QVector<PageBreak> m_breaks;
    QVector<Page> m_pages;
    int m_lastResumeIndex = -1;
};
