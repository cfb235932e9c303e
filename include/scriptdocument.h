#pragma once

#include "scriptformat.h"

#include <QString>
#include <QStringList>
#include <QVector>

struct ScriptLine {
    QString id;
    ScriptFormat::Role role = ScriptFormat::Action;
    QString text;

    bool operator==(const ScriptLine &other) const
    {
        return id == other.id && role == other.role && text == other.text;
    }
    bool operator!=(const ScriptLine &other) const { return !(*this == other); }
};

struct IndexedLine {
    int index = -1;
    QString text;
};

// Ordered line sequence of one script. Never empty: the first line is always
// a Header line that can be cleared but not removed or retyped.
class ScriptDocument {
public:
    ScriptDocument();

    static QString createLineId();

    int lineCount() const { return m_lines.size(); }
    bool isEmpty() const;
    const QVector<ScriptLine> &lines() const { return m_lines; }
    const ScriptLine &lineAt(int index) const { return m_lines.at(index); }
    int indexOf(const QString &lineId) const;
    bool contains(const QString &lineId) const { return indexOf(lineId) >= 0; }

    QString insertLine(int index, ScriptFormat::Role role, const QString &text = QString());
    QString insertLineAfter(const QString &lineId, ScriptFormat::Role role, const QString &text = QString());
    bool removeLine(const QString &lineId);
    bool setLineText(const QString &lineId, const QString &text);
    bool setLineRole(const QString &lineId, ScriptFormat::Role role);
    QString splitLine(const QString &lineId, int offset, ScriptFormat::Role newRole);
    bool mergeWithPrevious(const QString &lineId);

    void clear();
    void setLines(const QVector<ScriptLine> &lines);

    QStringList characterNames() const;
    QVector<IndexedLine> sceneHeadings() const;
    QVector<IndexedLine> chapterBreaks() const;
    QString toPlainText() const;

private:
    void ensureFirstLineInvariant();

    QVector<ScriptLine> m_lines;
};
