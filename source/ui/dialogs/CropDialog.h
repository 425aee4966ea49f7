#pragma once

// ============================================================================
// CropDialog - Crop box in points (PDF coordinates, origin bottom-left)
// ============================================================================

#include <QDialog>
#include <QRectF>

class QDoubleSpinBox;

class CropDialog : public QDialog
{
    Q_OBJECT

public:
    /// @param pageSize Unrotated size of the current page, used for the defaults.
    explicit CropDialog(const QSizeF& pageSize, QWidget* parent = nullptr);

    /// Crop box as (left, bottom, width, height).
    QRectF cropBox() const;

private:
    QDoubleSpinBox* m_left = nullptr;
    QDoubleSpinBox* m_bottom = nullptr;
    QDoubleSpinBox* m_right = nullptr;
    QDoubleSpinBox* m_top = nullptr;
};
