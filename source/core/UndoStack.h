#pragma once

// ============================================================================
// UndoStack - Bounded, coarse-grained undo/redo history
// ============================================================================
// Two kinds of entries:
// - AddMark: an in-memory mark was placed. Undo removes it, redo puts the
//   same mark back.
// - Everything else went through the document engine and carries the full
//   snapshot that preceded it. Undo restores those bytes. Redo of these
//   entries only moves them back onto the undo stack; the structural edit is
//   not re-executed.
//
// Pushing clears the redo stack. When the stack exceeds its bound the oldest
// entry is dropped and cannot be recovered.
// ============================================================================

#include "DocumentSnapshot.h"
#include "Marks.h"

#include <QObject>
#include <QStack>
#include <QString>

struct UndoAction {
    enum Type {
        AddMark,            ///< In-memory mark placed (mark)
        DeletePages,        ///< prevSnapshot
        ReorderPage,        ///< prevSnapshot
        ApplyText,          ///< prevSnapshot
        Redact,             ///< prevSnapshot
        SearchRedact,       ///< prevSnapshot
        Annotate,           ///< prevSnapshot
        Stamp,              ///< prevSnapshot
        FillForm,           ///< prevSnapshot
        FlattenForm,        ///< prevSnapshot
        AddField,           ///< prevSnapshot
        RotatePages,        ///< prevSnapshot
        CropPages,          ///< prevSnapshot
        InsertBlankPage,    ///< prevSnapshot
        PageNumbers         ///< prevSnapshot
    };

    Type type = AddMark;
    DocumentSnapshot prevSnapshot;
    Mark mark;
    int keepPage = 0;       ///< Page to show after the bytes are restored, 0 = current

    bool isSnapshot() const { return type != AddMark; }

    /// Operation tag ("add-text", "delete", "reorder", ...).
    QString name() const;

    static UndoAction forMark(const Mark& mark);
    static UndoAction forSnapshot(Type type, const DocumentSnapshot& prev, int keepPage = 0);
};

class UndoStack : public QObject {
    Q_OBJECT

public:
    static constexpr int DEFAULT_MAX_DEPTH = 50;

    explicit UndoStack(int maxDepth = DEFAULT_MAX_DEPTH, QObject* parent = nullptr);

    void push(const UndoAction& action);

    /**
     * @brief Pop the newest undo entry and move it onto the redo stack.
     * @param out Receives the entry.
     * @return false if there is nothing to undo.
     */
    bool takeUndo(UndoAction& out);

    /**
     * @brief Pop the newest redo entry and move it back onto the undo stack.
     * @return false if there is nothing to redo.
     */
    bool takeRedo(UndoAction& out);

    /**
     * @brief Replace the newest redo entry.
     *
     * Used after undoing an AddMark so that redo brings back the mark as it
     * was when it was removed, including later text edits.
     */
    bool amendRedoTop(const UndoAction& action);

    bool canUndo() const { return !m_undoStack.isEmpty(); }
    bool canRedo() const { return !m_redoStack.isEmpty(); }
    int undoCount() const { return m_undoStack.size(); }
    int redoCount() const { return m_redoStack.size(); }

    /// Entries from oldest to newest.
    QVector<UndoAction> undoEntries() const { return m_undoStack; }

    int maxDepth() const { return m_maxDepth; }
    void setMaxDepth(int depth);

    void clear();

signals:
    void undoAvailableChanged(bool available);
    void redoAvailableChanged(bool available);

private:
    void trimUndoStack();
    void clearRedoStack();

    QStack<UndoAction> m_undoStack;
    QStack<UndoAction> m_redoStack;
    int m_maxDepth = DEFAULT_MAX_DEPTH;
};
