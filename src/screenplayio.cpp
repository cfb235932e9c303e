#include "screenplayio.h"

#include "plaintextparser.h"
#include "scriptdocument.h"
#include "scriptserializer.h"

#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSaveFile>
#include <QXmlStreamReader>
#include <QXmlStreamWriter>

using ScriptFormat::Role;

namespace {

QString fdxParagraphTypeForRole(Role role)
{
    switch (role) {
    case ScriptFormat::Header:
        return "Scene Heading";
    case ScriptFormat::Action:
        return "Action";
    case ScriptFormat::Speaker:
        return "Character";
    case ScriptFormat::Dialog:
        return "Dialogue";
    case ScriptFormat::Directions:
        return "Parenthetical";
    case ScriptFormat::ChapterBreak:
        return "New Act";
    default:
        return "Action";
    }
}

Role roleForFdxParagraphType(const QString &type)
{
    const QString normalized = type.trimmed().toLower();

    if (normalized == "scene heading") return ScriptFormat::Header;
    if (normalized == "action") return ScriptFormat::Action;
    if (normalized == "character") return ScriptFormat::Speaker;
    if (normalized == "dialogue") return ScriptFormat::Dialog;
    if (normalized == "parenthetical") return ScriptFormat::Directions;
    if (normalized == "new act") return ScriptFormat::ChapterBreak;

    // Shot, Transition and anything else have no role of their own.
    return ScriptFormat::Action;
}

bool writeFile(const QString &filePath, const QByteArray &data)
{
    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "[ScreenplayIO] Cannot open" << filePath << file.errorString();
        return false;
    }
    file.write(data);
    return file.commit();
}

bool saveAsSqtFile(const ScriptDocument &document, const QString &filePath)
{
    const QJsonObject root = ScriptSerializer::toStorageJson(document.lines());
    return writeFile(filePath, QJsonDocument(root).toJson());
}

bool saveAsTaggedFile(const ScriptDocument &document, const QString &filePath)
{
    return writeFile(filePath, ScriptSerializer::toTaggedText(document.lines()).toUtf8());
}

bool saveAsPlainFile(const ScriptDocument &document, const QString &filePath)
{
    return writeFile(filePath, PlainTextParser::toPlainText(document.lines()).toUtf8());
}

bool saveAsFdxFile(const ScriptDocument &document, const QString &filePath)
{
    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        qWarning() << "[ScreenplayIO] Cannot open" << filePath << file.errorString();
        return false;
    }

    QXmlStreamWriter xml(&file);
    xml.setAutoFormatting(true);
    xml.writeStartDocument(QStringLiteral("1.0"), true);
    xml.writeDTD(QStringLiteral("<!DOCTYPE FinalDraft SYSTEM \"Final Draft Document Type Definition\">"));

    xml.writeStartElement(QStringLiteral("FinalDraft"));
    xml.writeAttribute(QStringLiteral("DocumentType"), QStringLiteral("Script"));
    xml.writeAttribute(QStringLiteral("Template"), QStringLiteral("No"));
    xml.writeAttribute(QStringLiteral("Version"), QStringLiteral("1"));

    xml.writeStartElement(QStringLiteral("Content"));
    for (const ScriptLine &line : document.lines()) {
        xml.writeStartElement(QStringLiteral("Paragraph"));
        xml.writeAttribute(QStringLiteral("Type"), fdxParagraphTypeForRole(line.role));

        xml.writeStartElement(QStringLiteral("Text"));
        xml.writeCharacters(line.text);
        xml.writeEndElement();

        xml.writeEndElement();
    }
    xml.writeEndElement();
    xml.writeEndElement();
    xml.writeEndDocument();

    if (xml.hasError()) {
        file.cancelWriting();
        return false;
    }
    return file.commit();
}

bool readFile(const QString &filePath, QByteArray &data)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "[ScreenplayIO] Cannot open" << filePath << file.errorString();
        return false;
    }
    data = file.readAll();
    file.close();
    return true;
}

bool loadSqtFile(const QString &filePath, QVector<ScriptLine> &lines)
{
    QByteArray data;
    if (!readFile(filePath, data)) {
        return false;
    }

    const QJsonDocument jsonDoc = QJsonDocument::fromJson(data);
    if (jsonDoc.isNull() || !jsonDoc.isObject()) {
        qWarning() << "[ScreenplayIO] Not a screenplay JSON file:" << filePath;
        return false;
    }
    return ScriptSerializer::fromStorageJson(jsonDoc.object(), lines);
}

bool loadTaggedFile(const QString &filePath, QVector<ScriptLine> &lines)
{
    QByteArray data;
    if (!readFile(filePath, data)) {
        return false;
    }
    const QString text = QString::fromUtf8(data);
    if (ScriptSerializer::hasRoleTags(text)) {
        lines = ScriptSerializer::fromTaggedText(text);
    } else {
        qDebug() << "[ScreenplayIO] No role tags in" << filePath << "- reading as plain screenplay text";
        lines = PlainTextParser::parse(text);
    }
    return true;
}

bool loadPlainFile(const QString &filePath, QVector<ScriptLine> &lines)
{
    QByteArray data;
    if (!readFile(filePath, data)) {
        return false;
    }
    lines = PlainTextParser::parse(QString::fromUtf8(data));
    return true;
}

bool loadFdxFile(const QString &filePath, QVector<ScriptLine> &lines)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qWarning() << "[ScreenplayIO] Cannot open" << filePath << file.errorString();
        return false;
    }

    QXmlStreamReader xml(&file);
    QVector<ScriptLine> paragraphs;

    while (!xml.atEnd()) {
        xml.readNext();
        if (xml.isStartElement() && xml.name() == QLatin1String("Paragraph")) {
            ScriptLine line;
            line.id = ScriptDocument::createLineId();
            line.role = roleForFdxParagraphType(xml.attributes().value(QStringLiteral("Type")).toString());

            while (!(xml.isEndElement() && xml.name() == QLatin1String("Paragraph")) && !xml.atEnd()) {
                xml.readNext();
                if (xml.isStartElement() && xml.name() == QLatin1String("Text")) {
                    line.text += xml.readElementText(QXmlStreamReader::IncludeChildElements);
                }
            }

            paragraphs.append(line);
        }
    }

    file.close();
    if (xml.hasError()) {
        qWarning() << "[ScreenplayIO] FDX parse error in" << filePath << xml.errorString();
        return false;
    }

    lines = paragraphs;
    return true;
}

} // namespace

namespace ScreenplayIO {

bool saveDocument(const ScriptDocument &document, const QString &filePath)
{
    const QString extension = QFileInfo(filePath).suffix().toLower();
    if (extension == QStringLiteral("fdx")) {
        return saveAsFdxFile(document, filePath);
    }
    if (extension == QStringLiteral("txt")) {
        return saveAsTaggedFile(document, filePath);
    }
    if (extension == QStringLiteral("fountain")) {
        return saveAsPlainFile(document, filePath);
    }
    return saveAsSqtFile(document, filePath);
}

bool loadDocument(ScriptDocument &document, const QString &filePath, int &lineCount)
{
    const QString extension = QFileInfo(filePath).suffix().toLower();
    QVector<ScriptLine> lines;
    bool ok = false;
    if (extension == QStringLiteral("fdx")) {
        ok = loadFdxFile(filePath, lines);
    } else if (extension == QStringLiteral("txt")) {
        ok = loadTaggedFile(filePath, lines);
    } else if (extension == QStringLiteral("fountain")) {
        ok = loadPlainFile(filePath, lines);
    } else {
        ok = loadSqtFile(filePath, lines);
    }

    if (!ok) {
        return false;
    }

    document.setLines(lines);
    lineCount = document.lineCount();
    qDebug() << "[ScreenplayIO] Loaded" << lineCount << "lines from" << filePath;
    return true;
}

} // namespace ScreenplayIO
