#include <QTest>
#include <QObject>
#include <QSignalSpy>
#include "autocompleteindex.h"
#include "editorsession.h"

namespace {

class MemoryStorage : public IScriptStorage {
public:
    bool save(const SaveRecord &record) override {
        records.append(record);
        return true;
    }

    bool load(const QString &documentId, SaveRecord &record) const override {
        for (const SaveRecord &stored : records) {
            if (stored.documentId == documentId) {
                record = stored;
            }
        }
        return !records.isEmpty();
    }

    QVector<SaveRecord> records;
};

} // namespace

class EditorSessionTests : public QObject {
    Q_OBJECT

private:
    AutosaveSettings fastAutosave() {
        AutosaveSettings settings;
        settings.debounceMs = 20;
        settings.statusDisplayMs = 20;
        return settings;
    }

    EditorSettings fastEditor() {
        EditorSettings settings;
        settings.historyDebounceMs = 20;
        return settings;
    }

private slots:
    void initTestCase() {
        qRegisterMetaType<AutosaveManager::SaveStatus>("AutosaveManager::SaveStatus");
    }

    void typingFlowsThroughFormats() {
        EditorSession session(fastEditor());
        const QString heading = session.currentLineId();
        QCOMPARE(session.currentRole(), ScriptFormat::Header);

        QVERIFY(session.setLineText(heading, "INT. HOUSE - DAY"));
        const QString action = session.commitLine(heading);
        QCOMPARE(session.currentLineId(), action);
        QCOMPARE(session.currentRole(), ScriptFormat::Action);

        session.setLineText(action, "Tom enters.");
        const QString speaker = session.commitLine(action);
        QCOMPARE(session.currentRole(), ScriptFormat::Action);

        QVERIFY(session.cycleLineRole(speaker, 1));
        QCOMPARE(session.currentRole(), ScriptFormat::Speaker);
        session.setLineText(speaker, "TOM");

        const QString dialog = session.commitLine(speaker);
        QCOMPARE(session.currentRole(), ScriptFormat::Dialog);
        session.setLineText(dialog, "Hello?");

        session.commitLine(dialog);
        QCOMPARE(session.currentRole(), ScriptFormat::Speaker);

        QCOMPARE(session.document().lineCount(), 5);
        QCOMPARE(session.document().characterNames(), QStringList({"TOM"}));
        QCOMPARE(session.currentState().value("format").toString(), QString("speaker"));
    }

    void firstLineIsProtected() {
        EditorSession session(fastEditor());
        const QString heading = session.currentLineId();

        QVERIFY(!session.cycleLineRole(heading, 1));
        QVERIFY(!session.setLineRole(heading, ScriptFormat::Action));
        QVERIFY(!session.mergeLineWithPrevious(heading));
        QVERIFY(!session.deleteLine(heading));

        session.setLineText(heading, "EXT. FIELD");
        QVERIFY(session.deleteLine(heading));
        QCOMPARE(session.document().lineCount(), 1);
        QVERIFY(session.document().lineAt(0).text.isEmpty());
        QCOMPARE(session.document().lineAt(0).role, ScriptFormat::Header);
    }

    void unknownLinesAreRejected() {
        EditorSession session(fastEditor());
        QSignalSpy changes(&session, &EditorSession::contentChanged);

        QVERIFY(session.commitLine("missing").isEmpty());
        QVERIFY(session.insertLine("missing", ScriptFormat::Action).isEmpty());
        QVERIFY(!session.setLineText("missing", "x"));
        QVERIFY(!session.cycleLineRole("missing", -1));
        QVERIFY(!session.setCurrentLine("missing"));
        QCOMPARE(changes.count(), 0);
    }

    void commitSplitsAtCursorAndMergeJoins() {
        EditorSession session(fastEditor());
        const QString heading = session.currentLineId();
        const QString action = session.insertLine(heading, ScriptFormat::Action, "Tom enters. He sits.");

        const QString tail = session.commitLine(action, 11);
        QCOMPARE(session.document().lineAt(1).text, QString("Tom enters."));
        QCOMPARE(session.document().lineAt(2).text, QString(" He sits."));
        QCOMPARE(session.document().lineAt(2).role, ScriptFormat::Action);

        QVERIFY(session.mergeLineWithPrevious(tail));
        QCOMPARE(session.document().lineAt(1).text, QString("Tom enters. He sits."));
        QCOMPARE(session.currentLineId(), action);
    }

    void deleteMovesCursorToPreviousLine() {
        EditorSession session(fastEditor());
        const QString heading = session.currentLineId();
        const QString first = session.insertLine(heading, ScriptFormat::Action, "One.");
        const QString second = session.insertLine(first, ScriptFormat::Action, "Two.");

        QVERIFY(session.deleteLine(second));
        QCOMPARE(session.currentLineId(), first);
        QCOMPARE(session.document().lineCount(), 2);
    }

    void undoAndRedoRestoreContent() {
        EditorSession session(fastEditor());
        const QString heading = session.currentLineId();
        QVERIFY(!session.canUndo());

        session.insertLine(heading, ScriptFormat::Action, "Thunder.");
        QCOMPARE(session.document().lineCount(), 2);
        QVERIFY(session.canUndo());

        QVERIFY(session.undo());
        QCOMPARE(session.document().lineCount(), 1);
        QVERIFY(session.canRedo());

        QVERIFY(session.redo());
        QCOMPARE(session.document().lineCount(), 2);
        QCOMPARE(session.document().lineAt(1).text, QString("Thunder."));
        QCOMPARE(session.document().lineAt(1).role, ScriptFormat::Action);
        QVERIFY(!session.redo());
    }

    void pendingTypingIsUndoneAsOneStep() {
        EditorSession session(fastEditor());
        const QString heading = session.currentLineId();

        session.setLineText(heading, "I");
        session.setLineText(heading, "IN");
        session.setLineText(heading, "INT.");
        QVERIFY(session.canUndo());

        QVERIFY(session.undo());
        QVERIFY(session.document().lineAt(0).text.isEmpty());
        QVERIFY(!session.undo());

        QVERIFY(session.redo());
        QCOMPARE(session.document().lineAt(0).text, QString("INT."));
    }

    void structuralEditKeepsPendingTypingAsOwnStep() {
        EditorSession session(fastEditor());
        const QString heading = session.currentLineId();

        session.setLineText(heading, "INT. HOUSE");
        const QString action = session.commitLine(heading);
        QVERIFY(!action.isEmpty());
        QCOMPARE(session.document().lineCount(), 2);

        QVERIFY(session.undo());
        QCOMPARE(session.document().lineCount(), 1);
        QCOMPARE(session.document().lineAt(0).text, QString("INT. HOUSE"));

        QVERIFY(session.undo());
        QVERIFY(session.document().lineAt(0).text.isEmpty());
    }

    void pendingTypingSurvivesRoleChangeAndDelete() {
        EditorSession session(fastEditor());
        const QString heading = session.currentLineId();
        session.setLineText(heading, "EXT. PIER");
        const QString action = session.commitLine(heading);

        session.setLineText(action, "Waves.");
        QVERIFY(session.setLineRole(action, ScriptFormat::Speaker));
        QVERIFY(session.undo());
        QCOMPARE(session.document().lineAt(1).role, ScriptFormat::Action);
        QCOMPARE(session.document().lineAt(1).text, QString("Waves."));

        const QString line = session.document().lineAt(1).id;
        session.setLineText(line, "Waves crash.");
        QVERIFY(session.deleteLine(line));
        QCOMPARE(session.document().lineCount(), 1);
        QVERIFY(session.undo());
        QCOMPARE(session.document().lineCount(), 2);
        QCOMPARE(session.document().lineAt(1).text, QString("Waves crash."));
    }

    void debouncedTypingReachesHistory() {
        EditorSession session(fastEditor());
        QSignalSpy spy(&session, &EditorSession::historyChanged);

        session.setLineText(session.currentLineId(), "EXT. ROOF");
        QCOMPARE(spy.count(), 0);
        QTRY_COMPARE(spy.count(), 1);
        QCOMPARE(spy.last().at(0).toBool(), true);
    }

    void pagesFollowContent() {
        EditorSession session(fastEditor());
        QSignalSpy spy(&session, &EditorSession::pagesChanged);

        QString last = session.currentLineId();
        for (int i = 0; i < 54; ++i) {
            last = session.insertLine(last, ScriptFormat::Action, QString("Beat %1.").arg(i));
        }
        QCOMPARE(session.pageCount(), 2);
        QCOMPARE(spy.count(), 1);
        QCOMPARE(spy.first().at(0).toInt(), 2);
        QCOMPARE(session.pageForLine(last), 2);
        QCOMPARE(session.pageForLine("missing"), 0);
    }

    void measuredHeightOverridesEstimate() {
        EditorSession session(fastEditor());
        const QString heading = session.currentLineId();
        const QString action = session.insertLine(heading, ScriptFormat::Action, "Montage.");
        QCOMPARE(session.pageCount(), 1);

        session.setLineHeightHint(action, 60 * session.settings().pagination.lineHeightPx);
        QCOMPARE(session.pageCount(), 2);
        QCOMPARE(session.pageForLine(action), 2);

        session.clearLineHeightHints();
        QCOMPARE(session.pageCount(), 1);
    }

    void chaptersAreNumberedInOrder() {
        EditorSession session(fastEditor());
        const QString heading = session.currentLineId();
        const QString first = session.insertChapterBreak(heading);
        session.insertChapterBreak(first, "  Finale ");

        const QVector<ChapterInfo> chapters = session.chapters();
        QCOMPARE(chapters.size(), 2);
        QCOMPARE(chapters.at(0).title, QString("Chapter 1"));
        QCOMPARE(chapters.at(0).lineIndex, 1);
        QCOMPARE(chapters.at(1).title, QString("Finale"));
        QCOMPARE(chapters.at(1).chapterNumber, 2);
        QCOMPARE(chapters.at(1).pageNumber, 1);
    }

    void suggestionsUseDocumentAndLearnOnAccept() {
        EditorSession session(fastEditor());
        const QString heading = session.currentLineId();
        const QString speaker = session.insertLine(heading, ScriptFormat::Speaker, "MARGARET");
        const QString dialog = session.insertLine(speaker, ScriptFormat::Dialog, "Hush.");
        const QString next = session.insertLine(dialog, ScriptFormat::Speaker, "ma");

        QCOMPARE(session.suggestCompletion(next), QString("MARGARET"));
        QVERIFY(session.acceptSuggestion(next, "MARGARET"));
        QCOMPARE(session.document().lineAt(3).text, QString("MARGARET"));
        QCOMPARE(session.autocomplete()->learnedTerms(ScriptFormat::Speaker), QStringList({"MARGARET"}));

        session.setLineText(heading, "ext");
        QCOMPARE(session.suggestCompletion(heading), QString("EXT. "));
        QVERIFY(session.suggestCompletion(dialog).isNull());
    }

    void editsReachAutosave() {
        MemoryStorage storage;
        AutosaveManager autosave(&storage, fastAutosave());
        autosave.setDocumentInfo("doc-1", "Pilot");

        EditorSession session(fastEditor());
        session.setAutosaveManager(&autosave);
        QSignalSpy status(&session, &EditorSession::saveStatusChanged);

        session.setLineText(session.currentLineId(), "INT. STUDIO - DAY");
        session.insertLine(session.currentLineId(), ScriptFormat::Action, "Lights up.");
        QTRY_COMPARE(storage.records.size(), 1);
        QVERIFY(storage.records.last().content.value("content").toString().contains("Lights up."));
        QVERIFY(status.count() > 0);

        QString error;
        QVERIFY(session.commitVersion("First pass", &error));
        QCOMPARE(autosave.versionString(), QString("2.0"));
        QCOMPARE(storage.records.last().versionType, QString("major"));

        session.insertLine(session.currentLineId(), ScriptFormat::Action, "Cut.");
        QVERIFY(session.saveNow(&error));
        QCOMPARE(autosave.versionString(), QString("2.1"));
    }

    void rejectedSavesAreReportedOnce() {
        MemoryStorage storage;
        AutosaveManager autosave(&storage, fastAutosave());

        EditorSession session(fastEditor());
        session.setAutosaveManager(&autosave);
        QSignalSpy rejected(&session, &EditorSession::saveRejected);

        session.setLineText(session.currentLineId(), "INT. VOID");
        session.insertLine(session.currentLineId(), ScriptFormat::Action, "Nothing.");
        QCOMPARE(rejected.count(), 1);
        QCOMPARE(rejected.first().at(0).toString(), QString("Document id is required"));
        QCOMPARE(session.lastSaveError(), QString("Document id is required"));

        QString error;
        QVERIFY(!session.saveNow(&error));
        QCOMPARE(error, QString("Document id is required"));
    }

    void savingNeedsAManager() {
        EditorSession session(fastEditor());
        QString error;
        QVERIFY(!session.saveNow(&error));
        QCOMPARE(error, QString("No autosave manager"));
        QVERIFY(!session.commitVersion("x", &error));
    }

    void readOnlyBlocksEverything() {
        MemoryStorage storage;
        AutosaveManager autosave(&storage, fastAutosave());
        autosave.setDocumentInfo("doc-1", "Pilot");

        EditorSession session(fastEditor());
        session.setAutosaveManager(&autosave);
        const QString heading = session.currentLineId();
        session.insertLine(heading, ScriptFormat::Action, "Before.");

        session.setReadOnly(true);
        QVERIFY(autosave.isReadOnly());
        QVERIFY(!session.setLineText(heading, "changed"));
        QVERIFY(session.commitLine(heading).isEmpty());
        QVERIFY(!session.undo());

        QString error;
        QVERIFY(!session.saveNow(&error));
        QCOMPARE(error, QString("Document is read-only"));
        QCOMPARE(session.document().lineCount(), 2);

        session.setReadOnly(false);
        QVERIFY(session.undo());
        QCOMPARE(session.document().lineCount(), 1);
    }

    void loadingResetsHistory() {
        EditorSession session(fastEditor());
        session.insertLine(session.currentLineId(), ScriptFormat::Action, "Old.");

        session.loadTaggedContent("<header>INT. NEW</header>\n<speaker>ANA</speaker>\n<dialog>Hi.</dialog>");
        QCOMPARE(session.document().lineCount(), 3);
        QVERIFY(!session.canUndo());
        QCOMPARE(session.currentLineId(), session.document().lineAt(0).id);

        const QJsonObject state = session.currentState();
        EditorSession restored(fastEditor());
        QVERIFY(restored.loadState(state));
        QCOMPARE(restored.document().toPlainText(), session.document().toPlainText());
        QVERIFY(!restored.loadState(QJsonObject()));
    }
};

QTEST_GUILESS_MAIN(EditorSessionTests)
#include "editorsession_test.moc"
