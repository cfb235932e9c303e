#include "scriptdocument.h"

#include <QDebug>
#include <QSet>
#include <QUuid>

ScriptDocument::ScriptDocument()
{
    clear();
}

QString ScriptDocument::createLineId()
{
    return QStringLiteral("line_") + QUuid::createUuid().toString(QUuid::WithoutBraces);
}

bool ScriptDocument::isEmpty() const
{
    return m_lines.size() == 1 && m_lines.first().text.isEmpty();
}

int ScriptDocument::indexOf(const QString &lineId) const
{
    for (int i = 0; i < m_lines.size(); ++i) {
        if (m_lines.at(i).id == lineId) {
            return i;
        }
    }
    return -1;
}

QString ScriptDocument::insertLine(int index, ScriptFormat::Role role, const QString &text)
{
    // Nothing goes in front of the protected first line.
    const int position = qBound(1, index, static_cast<int>(m_lines.size()));

    ScriptLine line;
    line.id = createLineId();
    line.role = role;
    line.text = text;
    m_lines.insert(position, line);
    return line.id;
}

QString ScriptDocument::insertLineAfter(const QString &lineId, ScriptFormat::Role role, const QString &text)
{
    const int index = indexOf(lineId);
    if (index < 0) {
        qWarning() << "[ScriptDocument] insertLineAfter: unknown line" << lineId;
        return QString();
    }
    return insertLine(index + 1, role, text);
}

bool ScriptDocument::removeLine(const QString &lineId)
{
    const int index = indexOf(lineId);
    if (index < 0) {
        return false;
    }
    if (index == 0) {
        if (m_lines.first().text.isEmpty()) {
            return false;
        }
        m_lines[0].text.clear();
        return true;
    }
    m_lines.remove(index);
    return true;
}

bool ScriptDocument::setLineText(const QString &lineId, const QString &text)
{
    const int index = indexOf(lineId);
    if (index < 0 || m_lines.at(index).text == text) {
        return false;
    }
    m_lines[index].text = text;
    return true;
}

bool ScriptDocument::setLineRole(const QString &lineId, ScriptFormat::Role role)
{
    const int index = indexOf(lineId);
    if (index < 0 || !ScriptFormat::isValidRole(role) || m_lines.at(index).role == role) {
        return false;
    }
    if (index == 0) {
        return false;
    }
    m_lines[index].role = role;
    return true;
}

QString ScriptDocument::splitLine(const QString &lineId, int offset, ScriptFormat::Role newRole)
{
    const int index = indexOf(lineId);
    if (index < 0) {
        return QString();
    }

    ScriptLine &line = m_lines[index];
    const int cut = qBound(0, offset, static_cast<int>(line.text.size()));
    const QString tail = line.text.mid(cut);
    line.text.truncate(cut);
    return insertLine(index + 1, newRole, tail);
}

bool ScriptDocument::mergeWithPrevious(const QString &lineId)
{
    const int index = indexOf(lineId);
    if (index <= 0) {
        return false;
    }
    m_lines[index - 1].text += m_lines.at(index).text;
    m_lines.remove(index);
    return true;
}

void ScriptDocument::clear()
{
    m_lines.clear();
    ensureFirstLineInvariant();
}

void ScriptDocument::setLines(const QVector<ScriptLine> &lines)
{
    m_lines = lines;
    QSet<QString> seen;
    for (ScriptLine &line : m_lines) {
        if (line.id.isEmpty() || seen.contains(line.id)) {
            line.id = createLineId();
        }
        seen.insert(line.id);
    }
    ensureFirstLineInvariant();
}

void ScriptDocument::ensureFirstLineInvariant()
{
    if (m_lines.isEmpty()) {
        ScriptLine first;
        first.id = createLineId();
        first.role = ScriptFormat::Header;
        m_lines.append(first);
        return;
    }
    if (m_lines.first().role != ScriptFormat::Header) {
        ScriptLine first;
        first.id = createLineId();
        first.role = ScriptFormat::Header;
        m_lines.prepend(first);
    }
}

QStringList ScriptDocument::characterNames() const
{
    QStringList names;
    QSet<QString> seen;
    for (const ScriptLine &line : m_lines) {
        if (line.role != ScriptFormat::Speaker) {
            continue;
        }
        const QString name = line.text.trimmed().toUpper();
        if (!name.isEmpty() && !seen.contains(name)) {
            seen.insert(name);
            names.append(name);
        }
    }
    return names;
}

QVector<IndexedLine> ScriptDocument::sceneHeadings() const
{
    QVector<IndexedLine> headings;
    for (int i = 0; i < m_lines.size(); ++i) {
        const ScriptLine &line = m_lines.at(i);
        if (line.role == ScriptFormat::Header && !line.text.trimmed().isEmpty()) {
            headings.append(IndexedLine{i, line.text.trimmed()});
        }
    }
    return headings;
}

QVector<IndexedLine> ScriptDocument::chapterBreaks() const
{
    QVector<IndexedLine> breaks;
    for (int i = 0; i < m_lines.size(); ++i) {
        const ScriptLine &line = m_lines.at(i);
        if (line.role == ScriptFormat::ChapterBreak) {
            breaks.append(IndexedLine{i, line.text.trimmed()});
        }
    }
    return breaks;
}

QString ScriptDocument::toPlainText() const
{
    QStringList texts;
    texts.reserve(m_lines.size());
    for (const ScriptLine &line : m_lines) {
        texts.append(line.text);
    }
    return texts.join(QLatin1Char('\n'));
}
