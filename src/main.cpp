#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDateTime>
#include <QDebug>
#include <QFileInfo>
#include <QTextStream>
#include <cstdio>
#include "autosavemanager.h"
#include "editorsession.h"
#include "scriptstorage.h"

// Custom message handler to add timestamps
void customMessageHandler(QtMsgType type, const QMessageLogContext &context, const QString &msg)
{
    Q_UNUSED(context);
    QString timestamp = QDateTime::currentDateTime().toString("hh:mm:ss.zzz");
    QString formattedMsg = QString("[%1] %2").arg(timestamp, msg);

    QByteArray localMsg = formattedMsg.toLocal8Bit();
    switch (type) {
    case QtDebugMsg:
        fprintf(stderr, "%s\n", localMsg.constData());
        break;
    case QtInfoMsg:
        fprintf(stderr, "%s\n", localMsg.constData());
        break;
    case QtWarningMsg:
        fprintf(stderr, "Warning: %s\n", localMsg.constData());
        break;
    case QtCriticalMsg:
        fprintf(stderr, "Critical: %s\n", localMsg.constData());
        break;
    case QtFatalMsg:
        fprintf(stderr, "Fatal: %s\n", localMsg.constData());
        abort();
    }
}

namespace {

void printSummary(QTextStream &out, const EditorSession &session)
{
    const ScriptDocument &document = session.document();
    out << "Lines: " << document.lineCount() << "\n";
    out << "Pages: " << session.pageCount() << "\n";
    for (const Page &page : session.layout().pages()) {
        out << QString("  page %1: lines %2-%3 (%4 printed lines)\n")
                   .arg(page.number)
                   .arg(page.startIndex + 1)
                   .arg(page.endIndex)
                   .arg(page.lineCount);
    }

    const QVector<IndexedLine> scenes = document.sceneHeadings();
    out << "Scenes: " << scenes.size() << "\n";
    for (const IndexedLine &scene : scenes) {
        out << "  p" << session.layout().pageForLine(scene.index) << "  " << scene.text << "\n";
    }

    out << "Characters: " << document.characterNames().join(", ") << "\n";

    for (const ChapterInfo &chapter : session.chapters()) {
        out << QString("Chapter %1 \"%2\" on page %3\n").arg(chapter.chapterNumber).arg(chapter.title).arg(chapter.pageNumber);
    }
}

} // namespace

int main(int argc, char *argv[])
{
    qInstallMessageHandler(customMessageHandler);
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("scriptpal");
    QCoreApplication::setApplicationVersion("0.1");

    QCommandLineParser parser;
    parser.setApplicationDescription("Paginates and converts screenplay files (.sqt, .fdx, tagged or plain .txt, .fountain).");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("input", "Screenplay file to load.");

    const PaginationSettings defaults;
    QCommandLineOption linesOption("lines-per-page", "Printed lines per page.", "count",
                                   QString::number(defaults.linesPerPage));
    QCommandLineOption overflowOption("overflow", "Extra lines allowed to keep a character with its dialogue.",
                                      "count", QString::number(defaults.overflowAllowance));
    QCommandLineOption convertOption("convert", "Write the script to another file; the extension picks the format.",
                                     "output");
    QCommandLineOption taggedOption("tagged", "Print the tagged serialization instead of the summary.");
    QCommandLineOption storeOption("store", "Save a version record into this directory.", "directory");
    QCommandLineOption titleOption("title", "Title used for the stored record.", "title");
    QCommandLineOption commitOption("commit", "Store a major version with this description.", "description");
    parser.addOption(linesOption);
    parser.addOption(overflowOption);
    parser.addOption(convertOption);
    parser.addOption(taggedOption);
    parser.addOption(storeOption);
    parser.addOption(titleOption);
    parser.addOption(commitOption);
    parser.process(app);

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        parser.showHelp(1);
    }

    EditorSettings settings;
    bool linesOk = false;
    bool overflowOk = false;
    settings.pagination.linesPerPage = parser.value(linesOption).toInt(&linesOk);
    settings.pagination.overflowAllowance = parser.value(overflowOption).toInt(&overflowOk);
    if (!linesOk || !overflowOk || settings.pagination.linesPerPage <= 0 || settings.pagination.overflowAllowance < 0) {
        qCritical() << "[Main] Invalid pagination options";
        return 1;
    }

    const QString inputPath = positional.first();
    EditorSession session(settings);
    if (!session.loadFile(inputPath)) {
        qCritical() << "[Main] Could not load" << inputPath;
        return 1;
    }
    qDebug() << "[Main] Loaded" << inputPath;

    QTextStream out(stdout);
    if (parser.isSet(taggedOption)) {
        out << ScriptSerializer::toTaggedText(session.document().lines()) << "\n";
    } else {
        printSummary(out, session);
    }

    if (parser.isSet(convertOption)) {
        const QString outputPath = parser.value(convertOption);
        if (!session.saveFile(outputPath)) {
            qCritical() << "[Main] Could not write" << outputPath;
            return 1;
        }
        qInfo() << "[Main] Wrote" << outputPath;
    }

    if (parser.isSet(storeOption)) {
        FileScriptStorage storage(parser.value(storeOption));
        AutosaveManager autosave(&storage);
        const QString documentId = QFileInfo(inputPath).completeBaseName();
        SaveRecord existing;
        if (storage.load(documentId, existing)) {
            autosave.initialize(existing);
        }
        QString title = parser.isSet(titleOption) ? parser.value(titleOption) : existing.title;
        if (title.isEmpty()) {
            title = documentId;
        }
        autosave.setDocumentInfo(documentId, title, existing.status);
        session.setAutosaveManager(&autosave);

        QString error;
        const bool stored = parser.isSet(commitOption)
            ? session.commitVersion(parser.value(commitOption), &error)
            : session.saveNow(&error);
        session.setAutosaveManager(nullptr);
        if (!stored) {
            qCritical() << "[Main] Could not store version:" << error;
            return 1;
        }
        out << "Stored version " << autosave.versionString() << "\n";
    }

    return 0;
}
