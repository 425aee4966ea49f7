#pragma once

// ============================================================================
// PdfEngine - Abstract interface for byte-producing document operations
// ============================================================================
// The engine loads an immutable byte snapshot into an editable handle
// (PdfEditDocument), applies structural or content edits in document space,
// and saves the result to new bytes. Handles are independent of each other,
// so a handle can be created and used entirely on a worker thread.
//
// Coordinates are PDF points with a bottom-left origin. Page indices are
// 0-based at this level; the editor core works with 1-based page numbers.
// ============================================================================

#include <QByteArray>
#include <QColor>
#include <QPointF>
#include <QRectF>
#include <QSizeF>
#include <QString>
#include <QStringList>
#include <QVector>

#include <memory>

/**
 * @brief Page geometry of a loaded document.
 */
struct DocumentInfo {
    int pageCount = 0;
    QVector<QSizeF> pageSizes;  ///< Unrotated media box size per page, points
    QVector<int> rotations;     ///< /Rotate per page, normalised to 0/90/180/270

    bool isValid() const { return pageCount > 0; }
};

/**
 * @brief An AcroForm field as seen by the form dialogs.
 */
struct PdfFormField {
    enum Type {
        Text,
        CheckBox,
        RadioButton,
        ComboBox,
        ListBox,
        PushButton,
        Signature,
        Unknown
    };

    QString name;           ///< Fully qualified field name
    Type type = Unknown;
    QString value;          ///< Text value, "true"/"false" for checkboxes, selected option
    QStringList options;    ///< Choice options or radio export values
    bool readOnly = false;
};

/**
 * @brief Text drawing parameters.
 */
struct PdfTextStyle {
    QString fontName = QStringLiteral("Helvetica");  ///< One of the base-14 fonts
    qreal fontSize = 12.0;
    QColor color = Qt::black;
    qreal opacity = 1.0;
    qreal rotationDegrees = 0.0;    ///< Counter-clockwise around the text origin
};

/**
 * @brief Editable handle on one loaded document.
 *
 * All mutators return false on failure; lastError() then describes what went
 * wrong. A failed mutation leaves the original snapshot untouched because the
 * handle works on its own copy.
 */
class PdfEditDocument {
public:
    virtual ~PdfEditDocument() = default;

    virtual int pageCount() const = 0;
    virtual QSizeF pageSize(int pageIndex) const = 0;
    virtual int rotation(int pageIndex) const = 0;

    // ===== Structure =====
    virtual bool removePage(int pageIndex) = 0;
    virtual bool insertBlankPage(int atIndex, const QSizeF& size) = 0;
    virtual bool movePage(int fromIndex, int toIndex) = 0;

    /**
     * @brief Append pages of another document to the end of this one.
     * @param sourceBytes Bytes of the source document.
     * @param pageIndices 0-based pages to copy, in order.
     */
    virtual bool appendPagesFrom(const QByteArray& sourceBytes, const QVector<int>& pageIndices) = 0;

    virtual bool setRotation(int pageIndex, int degrees) = 0;

    /**
     * @brief Set the crop box.
     * @param box left/bottom as x/y, width/height as extent, in points.
     */
    virtual bool setCropBox(int pageIndex, const QRectF& box) = 0;

    // ===== Content =====
    virtual bool drawRectangle(int pageIndex, const QRectF& rect,
                               const QColor& color, qreal opacity = 1.0) = 0;
    virtual bool drawLine(int pageIndex, const QPointF& from, const QPointF& to,
                          qreal thickness, const QColor& color) = 0;
    /**
     * @brief Draw text with its first baseline at origin.
     *
     * Newlines start a new line below the previous one. Only Latin-1 text can
     * be drawn with the base-14 fonts; anything else fails with an error.
     */
    virtual bool drawText(int pageIndex, const QPointF& origin, const QString& text,
                          const PdfTextStyle& style) = 0;
    virtual qreal textWidth(const QString& text, const QString& fontName, qreal fontSize) const = 0;

    // ===== Forms =====
    virtual QVector<PdfFormField> formFields() const = 0;
    virtual bool setFieldValue(const QString& name, const QString& value) = 0;
    virtual bool addTextField(int pageIndex, const QString& name, const QRectF& rect) = 0;
    virtual bool flattenForms() = 0;

    // ===== Output =====
    virtual bool save(QByteArray& out) = 0;
    virtual QString lastError() const = 0;

    /**
     * @brief Snapshot the page geometry of the current state.
     */
    DocumentInfo info() const;
};

/**
 * @brief Factory for editable document handles.
 */
class PdfEngine {
public:
    virtual ~PdfEngine() = default;

    /**
     * @brief Parse bytes into an editable handle.
     * @param errorMessage Receives the reason on failure (may be null).
     * @return Handle, or nullptr if the bytes are not a readable document.
     */
    virtual std::unique_ptr<PdfEditDocument> load(const QByteArray& bytes,
                                                  QString* errorMessage = nullptr) const = 0;

    /**
     * @brief Create an empty document (used as the target of merge/extract).
     */
    virtual std::unique_ptr<PdfEditDocument> createEmpty(QString* errorMessage = nullptr) const = 0;

    /**
     * @brief Load bytes only to read their page geometry.
     * @return false with errorMessage set if the bytes cannot be loaded or
     *         contain no pages.
     */
    bool inspect(const QByteArray& bytes, DocumentInfo& info, QString* errorMessage = nullptr) const;

    /**
     * @brief Create the MuPDF-backed engine.
     */
    static std::unique_ptr<PdfEngine> create();
};
