#pragma once

// ============================================================================
// ToolMode - Mutually exclusive interaction modes bound to page overlays
// ============================================================================

#include <QString>

/**
 * @brief Interaction modes of the tool mode controller.
 *
 * At most one mode has its pointer listeners wired at a time.
 */
enum class ToolMode {
    None,       ///< No mode active, overlays ignore pointer input
    TextEdit,   ///< Place, move and edit free text boxes
    Redact,     ///< Drag rectangles that will be painted over on apply
    Highlight,  ///< Click to place a fixed-size highlight
    Underline,  ///< Click to place a fixed-size underline
    Sticky,     ///< Click to place a sticky note, click the icon to edit it
    Draw,       ///< Freehand paths
    AddField    ///< Click to add a text form field
};

/**
 * @brief Stable identifier used in logs and settings ("annotate:draw", ...).
 */
inline QString toolModeName(ToolMode mode)
{
    switch (mode) {
        case ToolMode::None:      return QStringLiteral("none");
        case ToolMode::TextEdit:  return QStringLiteral("text-edit");
        case ToolMode::Redact:    return QStringLiteral("redact");
        case ToolMode::Highlight: return QStringLiteral("annotate:highlight");
        case ToolMode::Underline: return QStringLiteral("annotate:underline");
        case ToolMode::Sticky:    return QStringLiteral("annotate:sticky");
        case ToolMode::Draw:      return QStringLiteral("annotate:draw");
        case ToolMode::AddField:  return QStringLiteral("add-field");
    }
    return QString();
}
