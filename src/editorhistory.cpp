#include "editorhistory.h"

#include <QDebug>
#include <QUndoCommand>

namespace {

class SnapshotCommand : public QUndoCommand {
public:
    SnapshotCommand(QString *current, const QString &before, const QString &after)
        : m_current(current)
        , m_before(before)
        , m_after(after)
    {
        setText(QStringLiteral("Edit"));
    }

    void redo() override { *m_current = m_after; }
    void undo() override { *m_current = m_before; }

private:
    QString *m_current;
    QString m_before;
    QString m_after;
};

} // namespace

EditorHistory::EditorHistory(QObject *parent)
    : QObject(parent)
{
    m_stack.setUndoLimit(MAX_STACK_SIZE);
}

bool EditorHistory::push(const QString &snapshot)
{
    if (m_processing || snapshot == m_current) {
        return false;
    }

    // QUndoStack::push() runs redo(), which makes the snapshot current and
    // discards everything above the stack index.
    m_stack.push(new SnapshotCommand(&m_current, m_current, snapshot));
    notify();
    return true;
}

bool EditorHistory::undo(QString &snapshot)
{
    if (!m_stack.canUndo()) {
        return false;
    }

    m_processing = true;
    m_stack.undo();
    m_processing = false;

    snapshot = m_current;
    notify();
    return true;
}

bool EditorHistory::redo(QString &snapshot)
{
    if (!m_stack.canRedo()) {
        return false;
    }

    m_processing = true;
    m_stack.redo();
    m_processing = false;

    snapshot = m_current;
    notify();
    return true;
}

void EditorHistory::clear(const QString &initialSnapshot)
{
    m_stack.clear();
    m_current = initialSnapshot;
    notify();
}

void EditorHistory::notify()
{
    emit historyChanged(m_stack.canUndo(), m_stack.canRedo(), m_current);
}
