#include "editorsession.h"

#include "autocompleteindex.h"
#include "editorhistory.h"
#include "formatflow.h"
#include "screenplayio.h"

#include <QDebug>
#include <QTimer>

using ScriptFormat::Role;

EditorSession::EditorSession(const EditorSettings &settings, QObject *parent)
    : QObject(parent)
    , m_settings(settings)
    , m_layout(settings.pagination)
    , m_estimator(settings.pagination.lineHeightPx)
{
    m_history = new EditorHistory(this);
    connect(m_history, &EditorHistory::historyChanged, this, [this](bool canUndo, bool canRedo, const QString &) {
        emit historyChanged(canUndo, canRedo);
    });

    m_autocomplete = new AutocompleteIndex(this);

    m_historyTimer = new QTimer(this);
    m_historyTimer->setSingleShot(true);
    m_historyTimer->setInterval(m_settings.historyDebounceMs);
    connect(m_historyTimer, &QTimer::timeout, this, &EditorSession::pushHistory);

    m_currentLineId = m_document.lineAt(0).id;
    repaginate();
    resetHistory();
}

void EditorSession::setAutosaveManager(AutosaveManager *manager)
{
    if (m_autosave) {
        disconnect(m_autosave, nullptr, this, nullptr);
    }
    m_autosave = manager;
    if (m_autosave) {
        m_autosave->setReadOnly(m_readOnly);
        connect(m_autosave, &AutosaveManager::saveStatusChanged, this, &EditorSession::saveStatusChanged);
    }
}

void EditorSession::setReadOnly(bool readOnly)
{
    m_readOnly = readOnly;
    if (m_readOnly) {
        flushPendingHistory();
    }
    if (m_autosave) {
        m_autosave->setReadOnly(readOnly);
    }
}

bool EditorSession::setCurrentLine(const QString &lineId)
{
    if (!m_document.contains(lineId)) {
        return false;
    }
    m_currentLineId = lineId;
    return true;
}

Role EditorSession::currentRole() const
{
    const int index = m_document.indexOf(m_currentLineId);
    return index >= 0 ? m_document.lineAt(index).role : FormatFlow::initialRole();
}

int EditorSession::pageForLine(const QString &lineId) const
{
    return m_layout.pageForLine(m_document.indexOf(lineId));
}

QVector<ChapterInfo> EditorSession::chapters() const
{
    // Document order is page order, so the list is already sorted by page.
    QVector<ChapterInfo> result;
    int number = 0;
    for (const IndexedLine &chapterBreak : m_document.chapterBreaks()) {
        ChapterInfo chapter;
        chapter.chapterNumber = ++number;
        chapter.lineIndex = chapterBreak.index;
        chapter.pageNumber = qMax(1, m_layout.pageForLine(chapterBreak.index));
        chapter.title = chapterBreak.text.isEmpty() ? QStringLiteral("Chapter %1").arg(number) : chapterBreak.text;
        result.append(chapter);
    }
    return result;
}

QJsonObject EditorSession::currentState() const
{
    return ScriptSerializer::stateObject(m_document.lines(), currentRole(), pageCount(), chapters());
}

QString EditorSession::currentSnapshot() const
{
    return ScriptSerializer::toSnapshot(currentState());
}

void EditorSession::setLineHeightHint(const QString &lineId, double heightPx)
{
    if (!m_document.contains(lineId)) {
        return;
    }
    m_measuredHeights.insert(lineId, heightPx);
    repaginate();
}

void EditorSession::clearLineHeightHints()
{
    m_measuredHeights.clear();
    repaginate();
}

QString EditorSession::commitLine(const QString &lineId, int cursorOffset)
{
    const int index = m_document.indexOf(lineId);
    if (!canEdit() || index < 0) {
        return QString();
    }
    flushPendingHistory();

    const ScriptLine &line = m_document.lineAt(index);
    const int offset = cursorOffset < 0 ? static_cast<int>(line.text.size()) : cursorOffset;
    const Role nextRole = FormatFlow::nextRoleOnCommit(line.role);

    const QString newLineId = m_document.splitLine(lineId, offset, nextRole);
    m_currentLineId = newLineId;
    afterEdit(PushNow);
    return newLineId;
}

bool EditorSession::cycleLineRole(const QString &lineId, int direction)
{
    const int index = m_document.indexOf(lineId);
    if (!canEdit() || index < 0) {
        return false;
    }
    flushPendingHistory();

    const Role nextRole = FormatFlow::nextRoleOnCycle(m_document.lineAt(index).role, direction);
    if (!m_document.setLineRole(lineId, nextRole)) {
        return false;
    }
    m_currentLineId = lineId;
    afterEdit(PushNow);
    return true;
}

bool EditorSession::setLineText(const QString &lineId, const QString &text)
{
    if (!canEdit() || !m_document.setLineText(lineId, text)) {
        return false;
    }
    m_measuredHeights.remove(lineId);
    m_currentLineId = lineId;
    afterEdit(PushDebounced);
    return true;
}

QString EditorSession::insertLine(const QString &afterLineId, Role role, const QString &text)
{
    if (!canEdit() || !ScriptFormat::isValidRole(role)) {
        return QString();
    }
    flushPendingHistory();

    const QString newLineId = m_document.insertLineAfter(afterLineId, role, text);
    if (newLineId.isEmpty()) {
        return QString();
    }
    m_currentLineId = newLineId;
    afterEdit(PushNow);
    return newLineId;
}

bool EditorSession::deleteLine(const QString &lineId)
{
    const int index = m_document.indexOf(lineId);
    if (!canEdit() || index < 0) {
        return false;
    }
    flushPendingHistory();
    if (!m_document.removeLine(lineId)) {
        return false;
    }

    m_measuredHeights.remove(lineId);
    m_currentLineId = m_document.lineAt(qMax(0, index - 1)).id;
    afterEdit(PushNow);
    return true;
}

bool EditorSession::mergeLineWithPrevious(const QString &lineId)
{
    const int index = m_document.indexOf(lineId);
    if (!canEdit() || index <= 0) {
        return false;
    }
    flushPendingHistory();
    if (!m_document.mergeWithPrevious(lineId)) {
        return false;
    }

    const QString previousId = m_document.lineAt(index - 1).id;
    m_measuredHeights.remove(lineId);
    m_measuredHeights.remove(previousId);
    m_currentLineId = previousId;
    afterEdit(PushNow);
    return true;
}

bool EditorSession::setLineRole(const QString &lineId, Role role)
{
    if (!canEdit() || m_document.indexOf(lineId) < 0) {
        return false;
    }
    flushPendingHistory();
    if (!m_document.setLineRole(lineId, role)) {
        return false;
    }
    m_currentLineId = lineId;
    afterEdit(PushNow);
    return true;
}

QString EditorSession::insertChapterBreak(const QString &afterLineId, const QString &title)
{
    return insertLine(afterLineId, ScriptFormat::ChapterBreak, title.trimmed());
}

bool EditorSession::undo()
{
    if (m_readOnly) {
        return false;
    }
    flushPendingHistory();

    QString snapshot;
    if (!m_history->undo(snapshot)) {
        return false;
    }
    restoreSnapshot(snapshot);
    return true;
}

bool EditorSession::redo()
{
    if (m_readOnly) {
        return false;
    }
    flushPendingHistory();

    QString snapshot;
    if (!m_history->redo(snapshot)) {
        return false;
    }
    restoreSnapshot(snapshot);
    return true;
}

bool EditorSession::canUndo() const
{
    return m_history->canUndo() || m_historyTimer->isActive();
}

bool EditorSession::canRedo() const
{
    return m_history->canRedo();
}

void EditorSession::flushPendingHistory()
{
    if (m_historyTimer->isActive()) {
        pushHistory();
    }
}

QString EditorSession::suggestCompletion(const QString &lineId) const
{
    const int index = m_document.indexOf(lineId);
    if (index < 0) {
        return QString();
    }
    const ScriptLine &line = m_document.lineAt(index);
    return m_autocomplete->suggest(line.role, line.text, m_document.lines(), index);
}

bool EditorSession::acceptSuggestion(const QString &lineId, const QString &term)
{
    const int index = m_document.indexOf(lineId);
    if (index < 0 || !canEdit()) {
        return false;
    }
    const ScriptLine &line = m_document.lineAt(index);
    const Role role = line.role;
    if (line.text != term && !setLineText(lineId, term)) {
        return false;
    }
    m_autocomplete->learnTerm(role, term);
    return true;
}

void EditorSession::loadLines(const QVector<ScriptLine> &lines)
{
    m_historyTimer->stop();
    m_measuredHeights.clear();
    m_document.setLines(lines);
    m_currentLineId = m_document.lineAt(0).id;
    m_layout.reset();
    repaginate();
    resetHistory();
    emit contentChanged();
}

bool EditorSession::loadState(const QJsonObject &state)
{
    QVector<ScriptLine> lines;
    Role role = ScriptFormat::DEFAULT_ROLE;
    if (!ScriptSerializer::restoreState(state, lines, role)) {
        return false;
    }
    loadLines(lines);
    return true;
}

void EditorSession::loadTaggedContent(const QString &taggedText)
{
    loadLines(ScriptSerializer::fromTaggedText(taggedText));
}

bool EditorSession::loadFile(const QString &filePath)
{
    ScriptDocument loaded;
    int lineCount = 0;
    if (!ScreenplayIO::loadDocument(loaded, filePath, lineCount)) {
        qWarning() << "[EditorSession] Failed to load" << filePath;
        return false;
    }
    loadLines(loaded.lines());
    return true;
}

bool EditorSession::saveFile(const QString &filePath) const
{
    return ScreenplayIO::saveDocument(m_document, filePath);
}

bool EditorSession::saveNow(QString *errorMessage)
{
    if (!m_autosave) {
        if (errorMessage) *errorMessage = QStringLiteral("No autosave manager");
        return false;
    }
    flushPendingHistory();
    if (!m_autosave->triggerAutosave(currentState(), errorMessage)) {
        return false;
    }
    return m_autosave->saveNow(errorMessage);
}

bool EditorSession::commitVersion(const QString &description, QString *errorMessage)
{
    if (!m_autosave) {
        if (errorMessage) *errorMessage = QStringLiteral("No autosave manager");
        return false;
    }
    flushPendingHistory();
    if (!m_autosave->triggerAutosave(currentState(), errorMessage)) {
        return false;
    }
    return m_autosave->commitMajorVersion(description, errorMessage);
}

bool EditorSession::canEdit() const
{
    return !m_readOnly && !m_restoring;
}

void EditorSession::afterEdit(HistoryMode mode)
{
    repaginate();
    if (mode == PushNow) {
        pushHistory();
    } else {
        m_historyTimer->start();
    }
    triggerAutosave();
    emit contentChanged();
}

void EditorSession::repaginate()
{
    const int previousCount = m_layout.pageCount();
    m_layout.update(m_document.lines(), heightHints());
    if (m_layout.pageCount() != previousCount) {
        emit pagesChanged(m_layout.pageCount());
    }
}

void EditorSession::pushHistory()
{
    m_historyTimer->stop();
    m_history->push(currentSnapshot());
}

void EditorSession::triggerAutosave()
{
    if (!m_autosave) {
        return;
    }
    QString error;
    if (!m_autosave->triggerAutosave(currentState(), &error)) {
        if (error != m_lastSaveError) {
            emit saveRejected(error);
        }
        m_lastSaveError = error;
        return;
    }
    m_lastSaveError.clear();
}

void EditorSession::restoreSnapshot(const QString &snapshot)
{
    bool ok = false;
    const QJsonObject state = ScriptSerializer::fromSnapshot(snapshot, &ok);
    QVector<ScriptLine> lines;
    Role role = ScriptFormat::DEFAULT_ROLE;
    if (!ok || !ScriptSerializer::restoreState(state, lines, role)) {
        qWarning() << "[EditorSession] Cannot restore history entry";
        return;
    }

    m_restoring = true;
    const int currentIndex = qMax(0, m_document.indexOf(m_currentLineId));
    m_document.setLines(lines);
    m_measuredHeights.clear();
    m_currentLineId = m_document.lineAt(qMin(currentIndex, m_document.lineCount() - 1)).id;
    repaginate();
    triggerAutosave();
    m_restoring = false;
    emit contentChanged();
}

void EditorSession::resetHistory()
{
    m_history->clear(currentSnapshot());
}

QVector<double> EditorSession::heightHints() const
{
    QVector<double> hints = m_estimator.estimateHeights(m_document.lines());
    if (m_measuredHeights.isEmpty()) {
        return hints;
    }
    for (int i = 0; i < m_document.lineCount(); ++i) {
        const auto measured = m_measuredHeights.constFind(m_document.lineAt(i).id);
        if (measured != m_measuredHeights.constEnd()) {
            hints[i] = measured.value();
        }
    }
    return hints;
}
