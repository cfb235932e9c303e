#pragma once

#include "autosavemanager.h"
#include "pagelayout.h"
#include "paginator.h"
#include "scriptdocument.h"
#include "scriptserializer.h"

#include <QHash>
#include <QJsonObject>
#include <QObject>
#include <QString>

class AutocompleteIndex;
class EditorHistory;
class QTimer;

struct EditorSettings {
    PaginationSettings pagination;
    int historyDebounceMs = 300;
};

// Owns the document and runs every editing event through the same pipeline:
// document mutation, format flow, pagination, history, autosave.
class EditorSession : public QObject {
    Q_OBJECT
public:
    explicit EditorSession(const EditorSettings &settings = EditorSettings(), QObject *parent = nullptr);

    const ScriptDocument &document() const { return m_document; }
    const PageLayout &layout() const { return m_layout; }
    EditorHistory *history() const { return m_history; }
    AutocompleteIndex *autocomplete() const { return m_autocomplete; }
    const EditorSettings &settings() const { return m_settings; }

    // Not owned. Every content change is forwarded to it.
    void setAutosaveManager(AutosaveManager *manager);
    AutosaveManager *autosaveManager() const { return m_autosave; }

    void setReadOnly(bool readOnly);
    bool isReadOnly() const { return m_readOnly; }

    QString currentLineId() const { return m_currentLineId; }
    bool setCurrentLine(const QString &lineId);
    ScriptFormat::Role currentRole() const;

    int pageCount() const { return m_layout.pageCount(); }
    int pageForLine(const QString &lineId) const;
    QVector<ChapterInfo> chapters() const;
    QJsonObject currentState() const;
    QString currentSnapshot() const;

    // Measured height from a rendering surface; replaces the estimate.
    void setLineHeightHint(const QString &lineId, double heightPx);
    void clearLineHeightHints();

    QString commitLine(const QString &lineId, int cursorOffset = -1);
    bool cycleLineRole(const QString &lineId, int direction);
    bool setLineText(const QString &lineId, const QString &text);
    QString insertLine(const QString &afterLineId, ScriptFormat::Role role, const QString &text = QString());
    bool deleteLine(const QString &lineId);
    bool mergeLineWithPrevious(const QString &lineId);
    bool setLineRole(const QString &lineId, ScriptFormat::Role role);
    QString insertChapterBreak(const QString &afterLineId, const QString &title = QString());

    bool undo();
    bool redo();
    bool canUndo() const;
    bool canRedo() const;
    void flushPendingHistory();

    QString suggestCompletion(const QString &lineId) const;
    bool acceptSuggestion(const QString &lineId, const QString &term);

    void loadLines(const QVector<ScriptLine> &lines);
    bool loadState(const QJsonObject &state);
    void loadTaggedContent(const QString &taggedText);
    bool loadFile(const QString &filePath);
    bool saveFile(const QString &filePath) const;

    bool saveNow(QString *errorMessage = nullptr);
    bool commitVersion(const QString &description, QString *errorMessage = nullptr);
    QString lastSaveError() const { return m_lastSaveError; }

signals:
    void contentChanged();
    void pagesChanged(int pageCount);
    void historyChanged(bool canUndo, bool canRedo);
    void saveStatusChanged(AutosaveManager::SaveStatus status);
    void saveRejected(const QString &reason);

private:
    enum HistoryMode {
        PushNow,
        PushDebounced
    };

    bool canEdit() const;
    void afterEdit(HistoryMode mode);
    void repaginate();
    void pushHistory();
    void triggerAutosave();
    void restoreSnapshot(const QString &snapshot);
    void resetHistory();
    QVector<double> heightHints() const;

    EditorSettings m_settings;
    ScriptDocument m_document;
    PageLayout m_layout;
    HeightEstimator m_estimator;
    QHash<QString, double> m_measuredHeights;

    EditorHistory *m_history = nullptr;
    AutocompleteIndex *m_autocomplete = nullptr;
    AutosaveManager *m_autosave = nullptr;
    QTimer *m_historyTimer = nullptr;

    QString m_currentLineId;
    QString m_lastSaveError;
    bool m_readOnly = false;
    bool m_restoring = false;
};
