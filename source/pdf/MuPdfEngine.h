#pragma once

// ============================================================================
// MuPdfEngine - PdfEngine implementation using MuPDF
// ============================================================================
// Each MuPdfEditDocument owns its own fz_context, so handles never share
// MuPDF state and can live on any single thread. Content drawn onto a page is
// buffered per page and written as one extra content stream (wrapped so the
// original content's graphics state cannot leak into it) before the next
// structural edit or save.
// ============================================================================

#include "PdfEngine.h"

#include <QMap>

// Forward declarations for MuPDF types (avoid exposing mupdf headers)
struct fz_context;
struct fz_font;
struct pdf_document;
struct pdf_obj;

class MuPdfEditDocument : public PdfEditDocument {
public:
    MuPdfEditDocument();
    ~MuPdfEditDocument() override;

    // Disable copy (MuPDF context is not copyable)
    MuPdfEditDocument(const MuPdfEditDocument&) = delete;
    MuPdfEditDocument& operator=(const MuPdfEditDocument&) = delete;

    /**
     * @brief Parse PDF bytes. Must be called once, before anything else.
     */
    bool openBytes(const QByteArray& bytes);

    /**
     * @brief Start from a new document with no pages.
     */
    bool createEmpty();

    bool isValid() const { return m_ctx != nullptr && m_doc != nullptr; }

    // ===== PdfEditDocument =====
    int pageCount() const override;
    QSizeF pageSize(int pageIndex) const override;
    int rotation(int pageIndex) const override;

    bool removePage(int pageIndex) override;
    bool insertBlankPage(int atIndex, const QSizeF& size) override;
    bool movePage(int fromIndex, int toIndex) override;
    bool appendPagesFrom(const QByteArray& sourceBytes, const QVector<int>& pageIndices) override;
    bool setRotation(int pageIndex, int degrees) override;
    bool setCropBox(int pageIndex, const QRectF& box) override;

    bool drawRectangle(int pageIndex, const QRectF& rect,
                       const QColor& color, qreal opacity = 1.0) override;
    bool drawLine(int pageIndex, const QPointF& from, const QPointF& to,
                  qreal thickness, const QColor& color) override;
    bool drawText(int pageIndex, const QPointF& origin, const QString& text,
                  const PdfTextStyle& style) override;
    qreal textWidth(const QString& text, const QString& fontName, qreal fontSize) const override;

    QVector<PdfFormField> formFields() const override;
    bool setFieldValue(const QString& name, const QString& value) override;
    bool addTextField(int pageIndex, const QString& name, const QRectF& rect) override;
    bool flattenForms() override;

    bool save(QByteArray& out) override;
    QString lastError() const override { return m_lastError; }

private:
    bool checkPage(int pageIndex, const char* operation);
    void setError(const QString& message);

    /**
     * @brief Media box origin; drawing coordinates are relative to it.
     */
    QPointF mediaOrigin(int pageIndex) const;

    /**
     * @brief Register a base-14 font in the page resources.
     * @return Resource name to use with Tf, empty on failure.
     */
    QByteArray fontResource(int pageIndex, const QString& fontName);

    /**
     * @brief Register an ExtGState with the given fill/stroke alpha.
     * @return Resource name to use with gs, empty on failure.
     */
    QByteArray opacityResource(int pageIndex, qreal opacity);

    /// Page /Resources, copied onto the page if it was inherited.
    pdf_obj* ownResources(int pageIndex);

    fz_font* loadFont(const QString& fontName) const;

    /**
     * @brief Write buffered drawing operators into the page content streams.
     */
    bool flushPendingContent();

    fz_context* m_ctx = nullptr;
    pdf_document* m_doc = nullptr;
    QString m_lastError;

    QMap<int, QByteArray> m_pendingContent;     ///< page index -> operators
    QMap<QString, pdf_obj*> m_fontObjects;      ///< base-14 name -> font dict (owned ref)
    mutable QMap<QString, fz_font*> m_fonts;    ///< base-14 name -> metrics (owned)
};

class MuPdfEngine : public PdfEngine {
public:
    std::unique_ptr<PdfEditDocument> load(const QByteArray& bytes,
                                          QString* errorMessage = nullptr) const override;
    std::unique_ptr<PdfEditDocument> createEmpty(QString* errorMessage = nullptr) const override;
};
