#pragma once

// ============================================================================
// PopplerPdfProvider - Poppler-Qt6 implementation of PdfProvider
// ============================================================================
// Rasterizes pages and extracts line-level text boxes from an in-memory PDF on glibc
// desktops. Page sizes are read once on load; pages are loaded per call
// because Poppler::Page objects are not shared between threads.
// ============================================================================

#include "PdfProvider.h"
#include <poppler/qt6/poppler-qt6.h>
#include <memory>

class PopplerPdfProvider : public PdfProvider {
public:
    /**
     * @brief Open a provider on PDF bytes.
     * @param pdfData Snapshot bytes. Poppler reads them in place, so they are kept.
     */
    explicit PopplerPdfProvider(const QByteArray& pdfData);

    bool isValid() const override;
    bool isLocked() const override;
    int pageCount() const override { return m_pageSizes.size(); }

    QSizeF pageSize(int pageIndex) const override;
    QImage renderPageToImage(int pageIndex, qreal dpi) const override;
    QVector<PdfTextBox> textBoxes(int pageIndex) const override;

private:
    std::unique_ptr<Poppler::Page> loadPage(int pageIndex) const;

    QByteArray m_data;
    std::unique_ptr<Poppler::Document> m_document;
    QVector<QSizeF> m_pageSizes;    ///< Points, rotation and crop applied
};
