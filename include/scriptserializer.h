#pragma once

#include "scriptdocument.h"

#include <QJsonObject>
#include <QString>
#include <QVector>

struct ChapterInfo {
    QString title;
    int lineIndex = -1;
    int pageNumber = 1;
    int chapterNumber = 1;
};

namespace ScriptSerializer {

constexpr int STORAGE_VERSION = 2;
constexpr const char *STATE_FORMAT_VERSION = "2.0";

// <header>INT. HOUSE</header>\n<action>...</action>
QString toTaggedText(const QVector<ScriptLine> &lines);
QVector<ScriptLine> fromTaggedText(const QString &text);
// True when the first non-blank line opens with a known role tag.
bool hasRoleTags(const QString &text);

// {version: 2, lines: [{id, format, content}]}; version 1 ({text, type}) is
// still accepted on read.
QJsonObject toStorageJson(const QVector<ScriptLine> &lines);
bool fromStorageJson(const QJsonObject &root, QVector<ScriptLine> &lines);

QJsonObject chapterToJson(const ChapterInfo &chapter);
ChapterInfo chapterFromJson(const QJsonObject &object);

// Document content plus layout summary, shared by history and autosave.
QJsonObject stateObject(const QVector<ScriptLine> &lines, ScriptFormat::Role currentRole,
                        int pageCount, const QVector<ChapterInfo> &chapters);
bool restoreState(const QJsonObject &state, QVector<ScriptLine> &lines, ScriptFormat::Role &currentRole);

QString toSnapshot(const QJsonObject &state);
QJsonObject fromSnapshot(const QString &snapshot, bool *ok = nullptr);

} // namespace ScriptSerializer
