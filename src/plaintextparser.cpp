#include "plaintextparser.h"

#include <QDebug>
#include <QRegularExpression>
#include <QStringList>

using ScriptFormat::Role;

namespace {

bool hasNoLowercase(const QString &line)
{
    bool hasLetter = false;
    for (const QChar c : line) {
        if (c.isLower()) {
            return false;
        }
        hasLetter = hasLetter || c.isLetter();
    }
    return hasLetter;
}

bool startsDialogBlock(const QString &next)
{
    return !next.isEmpty() && (next.at(0).isLetter() || next.at(0) == QLatin1Char('('));
}

// A speaker name stands alone in capitals after a blank line, with its dialog
// or a parenthetical directly below.
bool isSpeaker(const QString &line, const QString &previous, const QString &next)
{
    if (!previous.isEmpty() || !hasNoLowercase(line)) {
        return false;
    }
    if (line.size() < PlainTextParser::MIN_SPEAKER_LENGTH || line.size() > PlainTextParser::MAX_SPEAKER_LENGTH) {
        return false;
    }
    if (line.endsWith(QLatin1Char(':'))) {
        return false;
    }
    return startsDialogBlock(next);
}

ScriptLine makeLine(Role role, const QString &text)
{
    ScriptLine line;
    line.id = ScriptDocument::createLineId();
    line.role = role;
    line.text = text;
    return line;
}

class BlockBuilder {
public:
    explicit BlockBuilder(QVector<ScriptLine> &lines) : m_lines(lines) {}

    // Consecutive Action or Dialog lines join into one paragraph.
    void append(Role role, const QString &text)
    {
        if (m_open && m_role == role) {
            m_text += QLatin1Char(' ') + text;
            return;
        }
        flush();
        m_open = true;
        m_role = role;
        m_text = text;
    }

    void add(Role role, const QString &text)
    {
        flush();
        m_lines.append(makeLine(role, text));
    }

    void flush()
    {
        if (m_open) {
            m_lines.append(makeLine(m_role, m_text));
            m_open = false;
        }
    }

private:
    QVector<ScriptLine> &m_lines;
    bool m_open = false;
    Role m_role = ScriptFormat::Action;
    QString m_text;
};

} // namespace

namespace PlainTextParser {

bool isSceneHeading(const QString &line)
{
    static const QRegularExpression pattern(
        QStringLiteral("^(INT\\.?/EXT\\.|EXT\\.?/INT\\.|INT\\.|EXT\\.|I/E\\.|EST\\.)(\\s|$)"));
    return hasNoLowercase(line) && pattern.match(line).hasMatch();
}

bool isChapterHeading(const QString &line)
{
    static const QRegularExpression pattern(QStringLiteral("^(ACT|CHAPTER|PART)\\b"));
    return hasNoLowercase(line) && pattern.match(line).hasMatch();
}

bool isParenthetical(const QString &line)
{
    return line.size() >= 2 && line.startsWith(QLatin1Char('(')) && line.endsWith(QLatin1Char(')'));
}

QVector<ScriptLine> parse(const QString &text)
{
    QStringList rawLines = QString(text).remove(QLatin1Char('\r')).split(QLatin1Char('\n'));
    for (QString &raw : rawLines) {
        raw = raw.simplified();
    }

    QVector<ScriptLine> lines;
    BlockBuilder block(lines);
    bool inDialog = false;

    for (int i = 0; i < rawLines.size(); ++i) {
        const QString &line = rawLines.at(i);
        if (line.isEmpty()) {
            block.flush();
            inDialog = false;
            continue;
        }

        const QString previous = i > 0 ? rawLines.at(i - 1) : QString();
        const QString next = i + 1 < rawLines.size() ? rawLines.at(i + 1) : QString();

        if (isSceneHeading(line)) {
            block.add(ScriptFormat::Header, line);
            inDialog = false;
        } else if (isChapterHeading(line) && previous.isEmpty() && next.isEmpty()) {
            block.add(ScriptFormat::ChapterBreak, line);
            inDialog = false;
        } else if (isParenthetical(line)) {
            block.add(ScriptFormat::Directions, line);
        } else if (isSpeaker(line, previous, next)) {
            block.add(ScriptFormat::Speaker, line);
            inDialog = true;
        } else {
            block.append(inDialog ? ScriptFormat::Dialog : ScriptFormat::Action, line);
        }
    }
    block.flush();

    qDebug() << "[PlainTextParser] Parsed" << lines.size() << "lines from" << rawLines.size() << "text lines";
    return lines;
}

QString toPlainText(const QVector<ScriptLine> &lines)
{
    QStringList out;
    for (int i = 0; i < lines.size(); ++i) {
        const ScriptLine &line = lines.at(i);
        const QString text = line.text.simplified();
        const bool staysInBlock = line.role == ScriptFormat::Dialog || line.role == ScriptFormat::Directions;
        if (i > 0 && !staysInBlock) {
            out.append(QString());
        }
        switch (line.role) {
        case ScriptFormat::Header:
        case ScriptFormat::Speaker:
            out.append(text.toUpper());
            break;
        case ScriptFormat::ChapterBreak:
            out.append(isChapterHeading(text.toUpper()) ? text.toUpper()
                                                        : QStringLiteral("CHAPTER %1").arg(text.toUpper()).trimmed());
            break;
        case ScriptFormat::Directions:
            out.append(isParenthetical(text) ? text : QStringLiteral("(%1)").arg(text));
            break;
        default:
            out.append(text);
            break;
        }
    }
    return out.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

} // namespace PlainTextParser
