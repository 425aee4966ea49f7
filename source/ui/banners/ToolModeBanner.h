#ifndef TOOLMODEBANNER_H
#define TOOLMODEBANNER_H

#include "../../core/ToolMode.h"

#include <QColor>
#include <QLabel>
#include <QPropertyAnimation>
#include <QPushButton>
#include <QWidget>

class QComboBox;

/**
 * @brief Banner shown above the page column while a tool mode is active.
 *
 * Shows the mode's instruction text and the actions that belong to it:
 *
 * ┌────────────────────────────────────────────────────────────────────────┐
 * │ Redact mode: drag to mark...          [Black v] [Search]  [Exit]       │
 * └────────────────────────────────────────────────────────────────────────┘
 *
 * The colour and search controls appear only in redact mode. Outside it the
 * apply button commits annotations or text; pending redactions are applied
 * from RedactApplyBar.
 */
class ToolModeBanner : public QWidget
{
    Q_OBJECT
    Q_PROPERTY(int slideOffset READ slideOffset WRITE setSlideOffset)

public:
    explicit ToolModeBanner(QWidget* parent = nullptr);

    /**
     * @brief Switch the banner to a mode.
     * @param text Instruction text; empty hides the banner.
     */
    void setMode(ToolMode mode, const QString& text);
    ToolMode mode() const { return m_mode; }

    QColor redactColor() const;

    void showAnimated();
    void hideAnimated();

signals:
    void applyClicked();
    void searchClicked();
    void exitClicked();
    void redactColorChanged(const QColor& color);

protected:
    void paintEvent(QPaintEvent* event) override;

private:
    void setupUi();

    int slideOffset() const { return m_slideOffset; }
    void setSlideOffset(int offset);

    QLabel* m_messageLabel;
    QComboBox* m_colorCombo;
    QPushButton* m_searchButton;
    QPushButton* m_applyButton;
    QPushButton* m_exitButton;

    QPropertyAnimation* m_animation;
    ToolMode m_mode = ToolMode::None;
    int m_slideOffset = 0;  // For slide animation (negative = hidden above)

    static constexpr int BANNER_HEIGHT = 40;
    static constexpr int ANIMATION_DURATION = 200;  // ms
};

#endif // TOOLMODEBANNER_H
