#pragma once

#include "scriptdocument.h"

#include <QString>
#include <QVector>

// Reads and writes screenplays typed as plain text: uppercase INT./EXT. scene
// headings, a speaker name in capitals above its dialog, parentheticals, and
// blank lines between blocks.
namespace PlainTextParser {

constexpr int MIN_SPEAKER_LENGTH = 2;
constexpr int MAX_SPEAKER_LENGTH = 39;

QVector<ScriptLine> parse(const QString &text);
QString toPlainText(const QVector<ScriptLine> &lines);

bool isSceneHeading(const QString &line);
bool isChapterHeading(const QString &line);
bool isParenthetical(const QString &line);

} // namespace PlainTextParser
