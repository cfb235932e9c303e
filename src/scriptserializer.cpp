#include "scriptserializer.h"

#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonValue>

using ScriptFormat::Role;

namespace {

struct OpenTag {
    QString name;
    bool selfClosing = false;
    int end = 0;
};

bool isTagNameChar(QChar c)
{
    return c.isLetterOrNumber() || c == QLatin1Char('-') || c == QLatin1Char('_');
}

// Reads "<name>" or "<name/>" starting at pos.
bool readOpenTag(const QString &text, int pos, OpenTag &tag)
{
    const int length = text.size();
    if (pos >= length || text.at(pos) != QLatin1Char('<')) {
        return false;
    }

    int i = pos + 1;
    if (i >= length || !text.at(i).isLetter()) {
        return false;
    }
    while (i < length && isTagNameChar(text.at(i))) {
        ++i;
    }
    tag.name = text.mid(pos + 1, i - pos - 1);
    tag.selfClosing = false;

    if (i < length && text.at(i) == QLatin1Char('/')) {
        tag.selfClosing = true;
        ++i;
    }
    if (i >= length || text.at(i) != QLatin1Char('>')) {
        return false;
    }
    tag.end = i + 1;
    return true;
}

bool startsKnownLine(const QString &text, int pos)
{
    OpenTag tag;
    if (!readOpenTag(text, pos, tag)) {
        return false;
    }
    bool known = false;
    ScriptFormat::roleForTag(tag.name, &known);
    return known;
}

// A closing tag ends the segment only when it is followed by the end of the
// input or by a newline and the next known opening tag, so text may contain
// newlines and stray markup.
int findSegmentEnd(const QString &text, int from, const QString &closing)
{
    int firstCandidate = -1;
    int candidate = text.indexOf(closing, from);
    while (candidate >= 0) {
        if (firstCandidate < 0) {
            firstCandidate = candidate;
        }
        const int after = candidate + closing.size();
        if (after == text.size()) {
            return candidate;
        }
        if (text.at(after) == QLatin1Char('\n')
            && (after + 1 == text.size() || startsKnownLine(text, after + 1))) {
            return candidate;
        }
        candidate = text.indexOf(closing, candidate + 1);
    }
    return firstCandidate;
}

// Inside a line's text a newline never precedes '<' directly, so "</tag>\n<"
// only appears between segments. A newline followed by '<' or '&' gets an
// '&' inserted after it; all other text is written verbatim.
QString escapeLineText(const QString &text)
{
    QString escaped;
    escaped.reserve(text.size());
    for (int i = 0; i < text.size(); ++i) {
        escaped.append(text.at(i));
        if (text.at(i) == QLatin1Char('\n') && i + 1 < text.size()
            && (text.at(i + 1) == QLatin1Char('<') || text.at(i + 1) == QLatin1Char('&'))) {
            escaped.append(QLatin1Char('&'));
        }
    }
    return escaped;
}

QString unescapeLineText(const QString &text)
{
    QString plain;
    plain.reserve(text.size());
    for (int i = 0; i < text.size(); ++i) {
        plain.append(text.at(i));
        if (text.at(i) == QLatin1Char('\n') && i + 1 < text.size() && text.at(i + 1) == QLatin1Char('&')) {
            ++i;
        }
    }
    return plain;
}

ScriptLine makeLine(Role role, const QString &text)
{
    ScriptLine line;
    line.id = ScriptDocument::createLineId();
    line.role = role;
    line.text = text;
    return line;
}

} // namespace

namespace ScriptSerializer {

QString toTaggedText(const QVector<ScriptLine> &lines)
{
    QStringList segments;
    segments.reserve(lines.size());
    for (const ScriptLine &line : lines) {
        const QString tag = ScriptFormat::tagForRole(line.role);
        segments.append(QStringLiteral("<%1>%2</%1>").arg(tag, escapeLineText(line.text)));
    }
    return segments.join(QLatin1Char('\n'));
}

QVector<ScriptLine> fromTaggedText(const QString &text)
{
    QVector<ScriptLine> lines;
    const int length = text.size();
    int pos = 0;

    while (pos < length) {
        OpenTag tag;
        if (readOpenTag(text, pos, tag)) {
            const Role role = ScriptFormat::roleForTag(tag.name);
            if (tag.selfClosing) {
                lines.append(makeLine(role, QString()));
                pos = tag.end;
            } else {
                const QString closing = QStringLiteral("</%1>").arg(tag.name);
                const int close = findSegmentEnd(text, tag.end, closing);
                if (close >= 0) {
                    lines.append(makeLine(role, unescapeLineText(text.mid(tag.end, close - tag.end))));
                    pos = close + closing.size();
                } else {
                    // Unterminated segment: keep the rest of the physical line.
                    int lineEnd = text.indexOf(QLatin1Char('\n'), tag.end);
                    if (lineEnd < 0) lineEnd = length;
                    lines.append(makeLine(role, unescapeLineText(text.mid(tag.end, lineEnd - tag.end))));
                    pos = lineEnd;
                }
            }
        } else {
            int lineEnd = text.indexOf(QLatin1Char('\n'), pos);
            if (lineEnd < 0) lineEnd = length;
            const QString raw = text.mid(pos, lineEnd - pos);
            if (!raw.trimmed().isEmpty()) {
                lines.append(makeLine(ScriptFormat::DEFAULT_ROLE, raw));
            }
            pos = lineEnd;
        }

        if (pos < length && text.at(pos) == QLatin1Char('\n')) {
            ++pos;
        }
    }

    return lines;
}

bool hasRoleTags(const QString &text)
{
    int pos = 0;
    while (pos < text.size() && text.at(pos).isSpace()) {
        ++pos;
    }
    return startsKnownLine(text, pos);
}

QJsonObject toStorageJson(const QVector<ScriptLine> &lines)
{
    QJsonArray array;
    for (const ScriptLine &line : lines) {
        QJsonObject object;
        object["id"] = line.id;
        object["format"] = ScriptFormat::tagForRole(line.role);
        object["content"] = line.text;
        array.append(object);
    }

    QJsonObject root;
    root["version"] = STORAGE_VERSION;
    root["lines"] = array;
    return root;
}

bool fromStorageJson(const QJsonObject &root, QVector<ScriptLine> &lines)
{
    if (!root.value("lines").isArray()) {
        qWarning() << "[ScriptSerializer] Storage object has no lines array";
        return false;
    }

    const int version = root.value("version").toInt(1);
    const QJsonArray array = root.value("lines").toArray();

    lines.clear();
    lines.reserve(array.size());
    for (const QJsonValue &value : array) {
        const QJsonObject object = value.toObject();
        ScriptLine line;
        if (version >= STORAGE_VERSION) {
            line.id = object.value("id").toString();
            line.role = ScriptFormat::roleForTag(object.value("format").toString());
            line.text = object.value("content").toString();
        } else {
            line.role = ScriptFormat::roleFromState(object.value("type").toInt(ScriptFormat::DEFAULT_ROLE));
            line.text = object.value("text").toString();
        }
        if (line.id.isEmpty()) {
            line.id = ScriptDocument::createLineId();
        }
        lines.append(line);
    }
    return true;
}

QJsonObject chapterToJson(const ChapterInfo &chapter)
{
    QJsonObject object;
    object["title"] = chapter.title;
    object["lineIndex"] = chapter.lineIndex;
    object["pageNumber"] = chapter.pageNumber;
    object["chapterNumber"] = chapter.chapterNumber;
    return object;
}

ChapterInfo chapterFromJson(const QJsonObject &object)
{
    ChapterInfo chapter;
    chapter.title = object.value("title").toString();
    chapter.lineIndex = object.value("lineIndex").toInt(-1);
    chapter.pageNumber = object.value("pageNumber").toInt(1);
    chapter.chapterNumber = object.value("chapterNumber").toInt(1);
    return chapter;
}

QJsonObject stateObject(const QVector<ScriptLine> &lines, Role currentRole,
                        int pageCount, const QVector<ChapterInfo> &chapters)
{
    QJsonArray chapterArray;
    for (const ChapterInfo &chapter : chapters) {
        chapterArray.append(chapterToJson(chapter));
    }

    QJsonObject metadata;
    metadata["formatVersion"] = QString::fromLatin1(STATE_FORMAT_VERSION);

    QJsonObject state;
    state["content"] = toTaggedText(lines);
    state["format"] = ScriptFormat::tagForRole(currentRole);
    state["pageCount"] = pageCount;
    state["chapters"] = chapterArray;
    state["metadata"] = metadata;
    return state;
}

bool restoreState(const QJsonObject &state, QVector<ScriptLine> &lines, Role &currentRole)
{
    if (!state.value("content").isString()) {
        qWarning() << "[ScriptSerializer] State has no content";
        return false;
    }
    lines = fromTaggedText(state.value("content").toString());
    currentRole = ScriptFormat::roleForTag(state.value("format").toString());
    return true;
}

QString toSnapshot(const QJsonObject &state)
{
    return QString::fromUtf8(QJsonDocument(state).toJson(QJsonDocument::Compact));
}

QJsonObject fromSnapshot(const QString &snapshot, bool *ok)
{
    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(snapshot.toUtf8(), &error);
    const bool valid = error.error == QJsonParseError::NoError && doc.isObject();
    if (ok) *ok = valid;
    if (!valid) {
        qWarning() << "[ScriptSerializer] Invalid snapshot:" << error.errorString();
        return QJsonObject();
    }
    return doc.object();
}

} // namespace ScriptSerializer
