#pragma once

// ============================================================================
// MuPdfProvider - MuPDF implementation of PdfProvider
// ============================================================================
// Rasterizes pages and extracts line-level text boxes from an in-memory PDF. Used where
// Poppler is not available or not safe to load next to MuPDF (musl builds),
// and by the engine tests to read back what MuPdfEngine wrote.
//
// Page geometry is read once when the document opens; later calls only load
// the page they need.
// ============================================================================

#include "PdfProvider.h"

struct fz_context;
struct fz_document;

class MuPdfProvider : public PdfProvider {
public:
    /**
     * @brief Open a provider on PDF bytes.
     * @param pdfData Snapshot bytes. Kept alive for the lifetime of the provider.
     */
    explicit MuPdfProvider(const QByteArray& pdfData);
    ~MuPdfProvider() override;

    MuPdfProvider(const MuPdfProvider&) = delete;
    MuPdfProvider& operator=(const MuPdfProvider&) = delete;

    bool isValid() const override;
    bool isLocked() const override { return m_locked; }
    int pageCount() const override { return m_pageSizes.size(); }

    QSizeF pageSize(int pageIndex) const override;
    QImage renderPageToImage(int pageIndex, qreal dpi) const override;
    QVector<PdfTextBox> textBoxes(int pageIndex) const override;

private:
    bool open();
    bool hasPage(int pageIndex) const { return pageIndex >= 0 && pageIndex < m_pageSizes.size(); }

    fz_context* m_ctx = nullptr;
    fz_document* m_doc = nullptr;
    QByteArray m_data;              ///< Backing bytes, must outlive m_doc
    QVector<QSizeF> m_pageSizes;    ///< Bounds per page, rotation and crop applied
    bool m_locked = false;
};
