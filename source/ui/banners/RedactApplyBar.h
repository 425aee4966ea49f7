#ifndef REDACTAPPLYBAR_H
#define REDACTAPPLYBAR_H

#include <QLabel>
#include <QPushButton>
#include <QWidget>

/**
 * @brief Bar that offers to commit or discard pending redaction rectangles.
 *
 * ┌──────────────────────────────────────────────┐
 * │ 3 areas marked   [Clear] [Apply Redactions]  │
 * └──────────────────────────────────────────────┘
 *
 * Follows the redaction count of the active document, not the tool mode:
 * it stays up after redact mode is left and goes away when the list empties.
 */
class RedactApplyBar : public QWidget
{
    Q_OBJECT

public:
    explicit RedactApplyBar(QWidget* parent = nullptr);

    /// Show with the count when count > 0, hide otherwise.
    void setRedactionCount(int count);
    int redactionCount() const { return m_count; }

signals:
    void applyClicked();
    void clearClicked();

protected:
    void paintEvent(QPaintEvent* event) override;

private:
    QLabel* m_countLabel;
    QPushButton* m_clearButton;
    QPushButton* m_applyButton;
    int m_count = 0;

    static constexpr int BAR_HEIGHT = 36;
};

#endif // REDACTAPPLYBAR_H
