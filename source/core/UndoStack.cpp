#include "UndoStack.h"

#include <QDebug>

// ============================================================================
// UndoAction
// ============================================================================

QString UndoAction::name() const
{
    switch (type) {
        case AddMark:
            switch (mark.kind) {
                case Mark::TextBox:    return QStringLiteral("add-text");
                case Mark::RedactRect: return QStringLiteral("add-redact-rect");
                case Mark::Highlight:  return QStringLiteral("add-highlight");
                case Mark::Underline:  return QStringLiteral("add-underline");
                case Mark::StickyNote: return QStringLiteral("add-sticky");
                case Mark::DrawPath:   return QStringLiteral("add-path");
                case Mark::FormField:  return QStringLiteral("add-field-mark");
            }
            break;
        case DeletePages:     return QStringLiteral("delete");
        case ReorderPage:     return QStringLiteral("reorder");
        case ApplyText:       return QStringLiteral("add-text-commit");
        case Redact:          return QStringLiteral("redact");
        case SearchRedact:    return QStringLiteral("search-redact");
        case Annotate:        return QStringLiteral("annotate");
        case Stamp:           return QStringLiteral("stamp");
        case FillForm:        return QStringLiteral("fill-form");
        case FlattenForm:     return QStringLiteral("flatten");
        case AddField:        return QStringLiteral("add-field");
        case RotatePages:     return QStringLiteral("rotate");
        case CropPages:       return QStringLiteral("crop");
        case InsertBlankPage: return QStringLiteral("insert-blank");
        case PageNumbers:     return QStringLiteral("page-numbers");
    }
    return QString();
}

UndoAction UndoAction::forMark(const Mark& mark)
{
    UndoAction action;
    action.type = AddMark;
    action.mark = mark;
    return action;
}

UndoAction UndoAction::forSnapshot(Type type, const DocumentSnapshot& prev, int keepPage)
{
    UndoAction action;
    action.type = type;
    action.prevSnapshot = prev;
    action.keepPage = keepPage;
    return action;
}

// ============================================================================
// UndoStack
// ============================================================================

UndoStack::UndoStack(int maxDepth, QObject* parent)
    : QObject(parent)
    , m_maxDepth(qMax(1, maxDepth))
{
}

void UndoStack::push(const UndoAction& action)
{
    const bool hadUndo = canUndo();

    m_undoStack.push(action);
    trimUndoStack();
    clearRedoStack();

    if (!hadUndo) {
        emit undoAvailableChanged(true);
    }
}

bool UndoStack::takeUndo(UndoAction& out)
{
    if (m_undoStack.isEmpty()) {
        return false;
    }

    const bool hadRedo = canRedo();
    out = m_undoStack.pop();
    m_redoStack.push(out);

    if (m_undoStack.isEmpty()) {
        emit undoAvailableChanged(false);
    }
    if (!hadRedo) {
        emit redoAvailableChanged(true);
    }
    return true;
}

bool UndoStack::takeRedo(UndoAction& out)
{
    if (m_redoStack.isEmpty()) {
        return false;
    }

    const bool hadUndo = canUndo();
    out = m_redoStack.pop();
    m_undoStack.push(out);
    trimUndoStack();

    if (m_redoStack.isEmpty()) {
        emit redoAvailableChanged(false);
    }
    if (!hadUndo) {
        emit undoAvailableChanged(true);
    }
    return true;
}

bool UndoStack::amendRedoTop(const UndoAction& action)
{
    if (m_redoStack.isEmpty()) {
        return false;
    }
    m_redoStack.top() = action;
    return true;
}

void UndoStack::setMaxDepth(int depth)
{
    m_maxDepth = qMax(1, depth);
    trimUndoStack();
}

void UndoStack::clear()
{
    const bool hadUndo = canUndo();
    const bool hadRedo = canRedo();
    m_undoStack.clear();
    m_redoStack.clear();
    if (hadUndo) {
        emit undoAvailableChanged(false);
    }
    if (hadRedo) {
        emit redoAvailableChanged(false);
    }
}

void UndoStack::trimUndoStack()
{
    // Oldest entries sit at index 0
    while (m_undoStack.size() > m_maxDepth) {
        qDebug() << "UndoStack: evicting oldest entry" << m_undoStack.first().name();
        m_undoStack.removeFirst();
    }
}

void UndoStack::clearRedoStack()
{
    if (m_redoStack.isEmpty()) {
        return;
    }
    m_redoStack.clear();
    emit redoAvailableChanged(false);
}
