#pragma once

// ============================================================================
// MockPdfEngine / MockPdfProvider - JSON-backed test doubles
// ============================================================================
// The "document" is a compact JSON object:
//   { "pages": [ { "w", "h", "rot", "crop", "label", "ops": [...],
//                  "text": [ {"t","x","y","w","h"} ],
//                  "renderFails", "renderDelayMs" } ],
//     "fields": [ {"name","type","value","options","page","rect"} ] }
// Drawing calls are recorded as "ops" so tests can assert exactly what a
// commit produced in document space. Output is deterministic, which makes
// byte-for-byte undo checks meaningful.
// ============================================================================

#include "PdfEngine.h"
#include "PdfProvider.h"

#include <QJsonArray>
#include <QJsonObject>
#include <QStringList>

class MockPdfEditDocument : public PdfEditDocument {
public:
    explicit MockPdfEditDocument(const QJsonObject& root);

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
    bool appendOp(int pageIndex, const QJsonObject& op);

    QJsonArray m_pages;
    QJsonArray m_fields;
    QString m_lastError;
};

class MockPdfEngine : public PdfEngine {
public:
    std::unique_ptr<PdfEditDocument> load(const QByteArray& bytes,
                                          QString* errorMessage = nullptr) const override;
    std::unique_ptr<PdfEditDocument> createEmpty(QString* errorMessage = nullptr) const override;

    /**
     * @brief Build a document whose pages are labelled "1", "2", ...
     */
    static QByteArray makeDocument(int pageCount, const QSizeF& pageSize = QSizeF(612, 792));

    /**
     * @brief Build a document with one text item per entry.
     * @param pageWords Text items of each page (an item may hold a phrase);
     *        item i sits at (72 + 60*i, 100),
     *        60 wide and 12 high (screen space at zoom 1).
     */
    static QByteArray makeDocumentWithText(const QVector<QStringList>& pageWords);

    /**
     * @brief Add a form field to an existing mock document.
     */
    static QByteArray withField(const QByteArray& bytes, const QString& name,
                                const QString& type, const QString& value = QString(),
                                const QStringList& options = QStringList());

    /**
     * @brief Set a per-page property ("renderFails", "renderDelayMs", ...).
     */
    static QByteArray withPageProperty(const QByteArray& bytes, int pageIndex,
                                       const QString& key, const QJsonValue& value);

    /// Decode the JSON object behind a mock document.
    static QJsonObject parse(const QByteArray& bytes);

    /// Drawing ops recorded on a page.
    static QJsonArray pageOps(const QByteArray& bytes, int pageIndex);
};

class MockPdfProvider : public PdfProvider {
public:
    explicit MockPdfProvider(const QByteArray& pdfData);

    bool isValid() const override { return !m_pages.isEmpty(); }
    bool isLocked() const override { return false; }
    int pageCount() const override { return m_pages.size(); }
    QSizeF pageSize(int pageIndex) const override;
    QImage renderPageToImage(int pageIndex, qreal dpi) const override;
    QVector<PdfTextBox> textBoxes(int pageIndex) const override;

    /**
     * @brief Factory usable as a PdfProviderFactory.
     */
    static std::unique_ptr<PdfProvider> create(const QByteArray& pdfData);

private:
    QJsonArray m_pages;
};
