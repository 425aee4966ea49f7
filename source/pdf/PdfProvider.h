#pragma once

// ============================================================================
// PdfProvider - Abstract interface for rasterizing and reading PDF pages
// ============================================================================
// This abstraction layer enables:
// - Swapping PDF backends (Poppler on glibc desktops, MuPDF elsewhere)
// - Easier testing with mock providers
//
// A provider is created from an immutable byte snapshot and is used by one
// thread at a time. Render jobs create their own provider on the worker
// thread that uses it.
//
// Design: Uses simple data structs instead of passing backend-specific types.
// This ensures any implementation can provide the same interface.
// ============================================================================

#include <QByteArray>
#include <QImage>
#include <QRectF>
#include <QSizeF>
#include <QString>
#include <QVector>

#include <functional>
#include <memory>

/**
 * @brief Simple data struct for a text item in a PDF page.
 *
 * Represents one line or run of text with its bounding box.
 * Used for search-based redaction.
 */
struct PdfTextBox {
    QString text;           ///< The text content
    QRectF boundingBox;     ///< Bounding rectangle in points, top-left origin (zoom 1 screen space)
};

/**
 * @brief Abstract interface for PDF page rendering and text extraction.
 */
class PdfProvider {
public:
    virtual ~PdfProvider() = default;

    // ===== Document Info =====

    /**
     * @brief Check if the PDF was loaded successfully.
     * @return True if a valid PDF is loaded.
     */
    virtual bool isValid() const = 0;

    /**
     * @brief Check if the PDF is password-protected and locked.
     */
    virtual bool isLocked() const = 0;

    /**
     * @brief Get the total number of pages.
     * @return Page count, or 0 if invalid.
     */
    virtual int pageCount() const = 0;

    // ===== Page Info =====

    /**
     * @brief Get the displayed size of a page (rotation and crop box applied).
     * @param pageIndex 0-based page index.
     * @return Page size in PDF points (1/72 inch), or invalid size on error.
     */
    virtual QSizeF pageSize(int pageIndex) const = 0;

    // ===== Rendering =====

    /**
     * @brief Render a page to a QImage.
     * @param pageIndex 0-based page index.
     * @param dpi Resolution in dots per inch (72 * zoom).
     * @return Rendered image, or null image on failure.
     */
    virtual QImage renderPageToImage(int pageIndex, qreal dpi) const = 0;

    // ===== Text =====

    /**
     * @brief Get text items on a page, in reading order.
     * @param pageIndex 0-based page index.
     */
    virtual QVector<PdfTextBox> textBoxes(int pageIndex) const = 0;

    // ===== Factory =====

    /**
     * @brief Create the platform's provider for an in-memory PDF.
     * @param pdfData PDF bytes. The provider keeps its own reference.
     * @return Provider instance, or nullptr if the data cannot be loaded.
     */
    static std::unique_ptr<PdfProvider> create(const QByteArray& pdfData);
};

/**
 * @brief Function creating a provider for a byte snapshot.
 *
 * The render pipeline takes one of these so tests can substitute a mock.
 */
using PdfProviderFactory = std::function<std::unique_ptr<PdfProvider>(const QByteArray&)>;
