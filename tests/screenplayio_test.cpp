#include <QTest>
#include <QObject>
#include <QFile>
#include <QJsonObject>
#include <QRegularExpression>
#include <QTemporaryDir>
#include "screenplayio.h"
#include "scriptdocument.h"
#include "scriptstorage.h"

class ScreenplayIOTests : public QObject {
    Q_OBJECT

private:
    ScriptDocument sampleDocument() {
        ScriptDocument doc;
        const QString first = doc.lineAt(0).id;
        doc.setLineText(first, "INT. DINER - NIGHT");
        QString id = doc.insertLineAfter(first, ScriptFormat::Action, "Rain streaks the window.\nA neon sign buzzes.");
        id = doc.insertLineAfter(id, ScriptFormat::Speaker, "MAYA");
        id = doc.insertLineAfter(id, ScriptFormat::Directions, "(quietly)");
        id = doc.insertLineAfter(id, ScriptFormat::Dialog, "Coffee & pie, <please>.");
        doc.insertLineAfter(id, ScriptFormat::ChapterBreak, "Act Two");
        return doc;
    }

    void compareContent(const ScriptDocument &actual, const ScriptDocument &expected) {
        QCOMPARE(actual.lineCount(), expected.lineCount());
        for (int i = 0; i < expected.lineCount(); ++i) {
            QVERIFY2(actual.lineAt(i).role == expected.lineAt(i).role,
                     QString("Role mismatch at line %1").arg(i).toUtf8().constData());
            QCOMPARE(actual.lineAt(i).text, expected.lineAt(i).text);
        }
    }

private slots:
    void sqtRoundTripKeepsIds() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.filePath("pilot.sqt");
        const ScriptDocument doc = sampleDocument();

        QVERIFY(ScreenplayIO::saveDocument(doc, path));
        ScriptDocument loaded;
        int lineCount = 0;
        QVERIFY(ScreenplayIO::loadDocument(loaded, path, lineCount));
        QCOMPARE(lineCount, doc.lineCount());
        QCOMPARE(loaded.lines(), doc.lines());
    }

    void fdxRoundTripKeepsRolesAndText() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.filePath("pilot.fdx");
        const ScriptDocument doc = sampleDocument();

        QVERIFY(ScreenplayIO::saveDocument(doc, path));
        ScriptDocument loaded;
        int lineCount = 0;
        QVERIFY(ScreenplayIO::loadDocument(loaded, path, lineCount));
        compareContent(loaded, doc);
    }

    void fdxUnknownParagraphsBecomeAction() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.filePath("draft.fdx");
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("<?xml version=\"1.0\"?>\n<FinalDraft><Content>"
                   "<Paragraph Type=\"Scene Heading\"><Text>EXT. PIER</Text></Paragraph>"
                   "<Paragraph Type=\"Transition\"><Text>CUT TO:</Text></Paragraph>"
                   "<Paragraph Type=\"Character\"><Text>LEO</Text></Paragraph>"
                   "</Content></FinalDraft>");
        file.close();

        ScriptDocument loaded;
        int lineCount = 0;
        QVERIFY(ScreenplayIO::loadDocument(loaded, path, lineCount));
        QCOMPARE(lineCount, 3);
        QCOMPARE(loaded.lineAt(1).role, ScriptFormat::Action);
        QCOMPARE(loaded.lineAt(1).text, QString("CUT TO:"));
        QCOMPARE(loaded.lineAt(2).role, ScriptFormat::Speaker);
    }

    void taggedTextRoundTrip() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.filePath("pilot.txt");
        const ScriptDocument doc = sampleDocument();

        QVERIFY(ScreenplayIO::saveDocument(doc, path));
        ScriptDocument loaded;
        int lineCount = 0;
        QVERIFY(ScreenplayIO::loadDocument(loaded, path, lineCount));
        compareContent(loaded, doc);
    }

    void untaggedTextIsReadAsScreenplay() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.filePath("typed.txt");
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("EXT. PIER - DAWN\n\nFog rolls in.\n\nLEO\n(shouting)\nAnyone there?\n");
        file.close();

        ScriptDocument loaded;
        int lineCount = 0;
        QVERIFY(ScreenplayIO::loadDocument(loaded, path, lineCount));
        QCOMPARE(lineCount, 5);
        QCOMPARE(loaded.lineAt(0).role, ScriptFormat::Header);
        QCOMPARE(loaded.lineAt(1).text, QString("Fog rolls in."));
        QCOMPARE(loaded.lineAt(2).role, ScriptFormat::Speaker);
        QCOMPARE(loaded.lineAt(3).role, ScriptFormat::Directions);
        QCOMPARE(loaded.lineAt(4).role, ScriptFormat::Dialog);
        QCOMPARE(loaded.characterNames(), QStringList({"LEO"}));
    }

    void fountainRoundTripKeepsBlocks() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.filePath("pilot.fountain");
        ScriptDocument doc;
        const QString first = doc.lineAt(0).id;
        doc.setLineText(first, "INT. DINER - NIGHT");
        QString id = doc.insertLineAfter(first, ScriptFormat::Action, "Rain streaks the window.");
        id = doc.insertLineAfter(id, ScriptFormat::Speaker, "MAYA");
        id = doc.insertLineAfter(id, ScriptFormat::Directions, "(quietly)");
        doc.insertLineAfter(id, ScriptFormat::Dialog, "Coffee & pie, <please>.");

        QVERIFY(ScreenplayIO::saveDocument(doc, path));
        QFile file(path);
        QVERIFY(file.open(QIODevice::ReadOnly));
        QVERIFY(!file.readAll().contains("<speaker>"));
        file.close();

        ScriptDocument loaded;
        int lineCount = 0;
        QVERIFY(ScreenplayIO::loadDocument(loaded, path, lineCount));
        compareContent(loaded, doc);
    }

    void failedLoadLeavesDocumentAlone() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        ScriptDocument doc = sampleDocument();
        const QVector<ScriptLine> before = doc.lines();
        int lineCount = -1;

        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("Cannot open"));
        QVERIFY(!ScreenplayIO::loadDocument(doc, dir.filePath("missing.sqt"), lineCount));

        const QString garbage = dir.filePath("garbage.sqt");
        QFile file(garbage);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("not json");
        file.close();
        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("Not a screenplay"));
        QVERIFY(!ScreenplayIO::loadDocument(doc, garbage, lineCount));

        QCOMPARE(doc.lines(), before);
        QCOMPARE(lineCount, -1);
    }

    void fileStorageKeepsLatestAndMajorVersions() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        FileScriptStorage storage(dir.filePath("saves"));

        SaveRecord record;
        record.documentId = "pilot/ep 1";
        record.title = "Pilot";
        record.status = "draft";
        record.content["pageCount"] = 3;
        record.minorVersion = 4;
        record.versionType = "minor";
        record.savedAt = QDateTime::currentDateTimeUtc();
        QVERIFY(storage.save(record));
        QVERIFY(storage.versions(record.documentId).isEmpty());

        record.majorVersion = 2;
        record.minorVersion = 0;
        record.versionType = "major";
        record.description = "Table read";
        QVERIFY(storage.save(record));

        SaveRecord loaded;
        QVERIFY(storage.load(record.documentId, loaded));
        QCOMPARE(loaded.versionString(), QString("2.0"));
        QCOMPARE(loaded.description, QString("Table read"));
        QCOMPARE(loaded.content.value("pageCount").toInt(), 3);
        QCOMPARE(loaded.toJson().value("metadata").toObject().value("versionNumber").toString(), QString("2.0"));

        const QVector<VersionNumber> versions = storage.versions(record.documentId);
        QCOMPARE(versions.size(), 1);
        QCOMPARE(versions.first().majorVersion, 2);

        SaveRecord major;
        QVERIFY(storage.loadVersion(record.documentId, 2, major));
        QCOMPARE(major.title, QString("Pilot"));
        QVERIFY(!storage.load("unknown", loaded));

        SaveRecord anonymous;
        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("without a document id"));
        QVERIFY(!storage.save(anonymous));
    }
};

QTEST_GUILESS_MAIN(ScreenplayIOTests)
#include "screenplayio_test.moc"
