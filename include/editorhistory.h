#pragma once

#include <QObject>
#include <QString>
#include <QUndoStack>

// Snapshot history. Each push becomes one command on a bounded QUndoStack;
// undoing a command restores the snapshot that was current before it.
class EditorHistory : public QObject {
    Q_OBJECT
public:
    static constexpr int MAX_STACK_SIZE = 50;

    explicit EditorHistory(QObject *parent = nullptr);

    bool push(const QString &snapshot);
    bool undo(QString &snapshot);
    bool redo(QString &snapshot);
    bool canUndo() const { return m_stack.canUndo(); }
    bool canRedo() const { return m_stack.canRedo(); }
    int undoCount() const { return m_stack.index(); }
    int redoCount() const { return m_stack.count() - m_stack.index(); }
    QString currentSnapshot() const { return m_current; }
    bool isProcessing() const { return m_processing; }

    // Drops both stacks and starts over from the given snapshot.
    void clear(const QString &initialSnapshot = QString());

signals:
    void historyChanged(bool canUndo, bool canRedo, const QString &currentSnapshot);

private:
    void notify();

    QUndoStack m_stack;
    QString m_current;
    bool m_processing = false;
};
