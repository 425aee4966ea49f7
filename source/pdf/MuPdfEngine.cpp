// ============================================================================
// MuPdfEngine - Implementation
// ============================================================================

#include "MuPdfEngine.h"

#include <mupdf/fitz.h>
#include <mupdf/pdf.h>

#include <QDebug>
#include <QStringList>
#include <QtMath>

#include <algorithm>
#include <cstring>
#include <vector>

namespace {

constexpr qreal LINE_SPACING = 1.2;   ///< Leading as a multiple of the font size

QByteArray num(qreal value)
{
    return QByteArray::number(value, 'f', 4);
}

QByteArray rgbOperands(const QColor& color)
{
    return num(color.redF()) + ' ' + num(color.greenF()) + ' ' + num(color.blueF());
}

/**
 * @brief Escape one line of Latin-1 text for a PDF literal string.
 * @return false if the line has characters the base-14 fonts cannot encode.
 */
bool pdfLiteral(const QString& line, QByteArray& out)
{
    out = "(";
    for (const QChar ch : line) {
        if (ch.unicode() > 0xFF) {
            return false;
        }
        const char c = static_cast<char>(ch.unicode());
        if (c == '(' || c == ')' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    out += ')';
    return true;
}

int normaliseRotation(int degrees)
{
    int r = degrees % 360;
    if (r < 0) {
        r += 360;
    }
    return r;
}

} // namespace

// ============================================================================
// Construction / Destruction
// ============================================================================

MuPdfEditDocument::MuPdfEditDocument()
{
    m_ctx = fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT);
    if (!m_ctx) {
        qWarning() << "MuPdfEditDocument: Failed to create MuPDF context";
        m_lastError = QStringLiteral("Failed to create MuPDF context");
        return;
    }

    fz_try(m_ctx) {
        fz_register_document_handlers(m_ctx);
    }
    fz_catch(m_ctx) {
        qWarning() << "MuPdfEditDocument: Failed to register handlers:" << fz_caught_message(m_ctx);
        fz_drop_context(m_ctx);
        m_ctx = nullptr;
    }
}

MuPdfEditDocument::~MuPdfEditDocument()
{
    if (!m_ctx) {
        return;
    }

    for (pdf_obj* obj : m_fontObjects) {
        pdf_drop_obj(m_ctx, obj);
    }
    for (fz_font* font : m_fonts) {
        fz_drop_font(m_ctx, font);
    }
    if (m_doc) {
        pdf_drop_document(m_ctx, m_doc);
        m_doc = nullptr;
    }
    fz_drop_context(m_ctx);
    m_ctx = nullptr;
}

bool MuPdfEditDocument::openBytes(const QByteArray& bytes)
{
    if (!m_ctx) {
        return false;
    }
    if (bytes.isEmpty()) {
        setError(QStringLiteral("No data to load"));
        return false;
    }

    fz_buffer* buf = nullptr;
    fz_stream* stm = nullptr;
    fz_var(buf);
    fz_var(stm);

    fz_try(m_ctx) {
        buf = fz_new_buffer_from_copied_data(m_ctx,
            reinterpret_cast<const unsigned char*>(bytes.constData()),
            static_cast<size_t>(bytes.size()));
        stm = fz_open_buffer(m_ctx, buf);
        m_doc = pdf_open_document_with_stream(m_ctx, stm);
    }
    fz_always(m_ctx) {
        fz_drop_stream(m_ctx, stm);
        fz_drop_buffer(m_ctx, buf);
    }
    fz_catch(m_ctx) {
        setError(QString::fromUtf8(fz_caught_message(m_ctx)));
        m_doc = nullptr;
        return false;
    }

    if (pdf_needs_password(m_ctx, m_doc)) {
        setError(QStringLiteral("The document is password protected"));
        pdf_drop_document(m_ctx, m_doc);
        m_doc = nullptr;
        return false;
    }
    return true;
}

bool MuPdfEditDocument::createEmpty()
{
    if (!m_ctx) {
        return false;
    }

    fz_try(m_ctx) {
        m_doc = pdf_create_document(m_ctx);
    }
    fz_catch(m_ctx) {
        setError(QString::fromUtf8(fz_caught_message(m_ctx)));
        m_doc = nullptr;
        return false;
    }
    return true;
}

void MuPdfEditDocument::setError(const QString& message)
{
    m_lastError = message;
    qWarning() << "MuPdfEditDocument:" << message;
}

bool MuPdfEditDocument::checkPage(int pageIndex, const char* operation)
{
    if (!isValid()) {
        setError(QStringLiteral("%1: no document loaded").arg(QLatin1String(operation)));
        return false;
    }
    if (pageIndex < 0 || pageIndex >= pageCount()) {
        setError(QStringLiteral("%1: page %2 out of range").arg(QLatin1String(operation)).arg(pageIndex));
        return false;
    }
    return true;
}

// ============================================================================
// Page Info
// ============================================================================

int MuPdfEditDocument::pageCount() const
{
    if (!isValid()) {
        return 0;
    }

    int count = 0;
    fz_try(m_ctx) {
        count = pdf_count_pages(m_ctx, m_doc);
    }
    fz_catch(m_ctx) {
        count = 0;
    }
    return count;
}

QSizeF MuPdfEditDocument::pageSize(int pageIndex) const
{
    QSizeF size(612, 792);
    if (!isValid()) {
        return size;
    }

    fz_try(m_ctx) {
        pdf_obj* pageObj = pdf_lookup_page_obj(m_ctx, m_doc, pageIndex);
        pdf_obj* boxObj = pdf_dict_get_inheritable(m_ctx, pageObj, PDF_NAME(MediaBox));
        if (boxObj) {
            fz_rect box = pdf_to_rect(m_ctx, boxObj);
            if (!fz_is_empty_rect(box)) {
                size = QSizeF(box.x1 - box.x0, box.y1 - box.y0);
            }
        }
    }
    fz_catch(m_ctx) {
        qWarning() << "MuPdfEditDocument: Failed to read media box of page" << pageIndex;
    }
    return size;
}

QPointF MuPdfEditDocument::mediaOrigin(int pageIndex) const
{
    QPointF origin(0, 0);
    fz_try(m_ctx) {
        pdf_obj* pageObj = pdf_lookup_page_obj(m_ctx, m_doc, pageIndex);
        pdf_obj* boxObj = pdf_dict_get_inheritable(m_ctx, pageObj, PDF_NAME(MediaBox));
        if (boxObj) {
            fz_rect box = pdf_to_rect(m_ctx, boxObj);
            origin = QPointF(box.x0, box.y0);
        }
    }
    fz_catch(m_ctx) {
        origin = QPointF(0, 0);
    }
    return origin;
}

int MuPdfEditDocument::rotation(int pageIndex) const
{
    int rotation = 0;
    if (!isValid()) {
        return rotation;
    }

    fz_try(m_ctx) {
        pdf_obj* pageObj = pdf_lookup_page_obj(m_ctx, m_doc, pageIndex);
        pdf_obj* rotateObj = pdf_dict_get_inheritable(m_ctx, pageObj, PDF_NAME(Rotate));
        if (rotateObj) {
            rotation = pdf_to_int(m_ctx, rotateObj);
        }
    }
    fz_catch(m_ctx) {
        rotation = 0;
    }
    return normaliseRotation(rotation);
}

// ============================================================================
// Structure
// ============================================================================

bool MuPdfEditDocument::removePage(int pageIndex)
{
    if (!checkPage(pageIndex, "removePage") || !flushPendingContent()) {
        return false;
    }

    fz_try(m_ctx) {
        pdf_delete_page(m_ctx, m_doc, pageIndex);
    }
    fz_catch(m_ctx) {
        setError(QStringLiteral("Failed to remove page: %1").arg(QString::fromUtf8(fz_caught_message(m_ctx))));
        return false;
    }
    return true;
}

bool MuPdfEditDocument::insertBlankPage(int atIndex, const QSizeF& size)
{
    if (!isValid() || !flushPendingContent()) {
        return false;
    }
    const int count = pageCount();
    if (atIndex < 0 || atIndex > count) {
        setError(QStringLiteral("insertBlankPage: index %1 out of range").arg(atIndex));
        return false;
    }

    pdf_obj* pageObj = nullptr;
    pdf_obj* resources = nullptr;
    fz_buffer* contents = nullptr;
    fz_var(pageObj);
    fz_var(resources);
    fz_var(contents);

    fz_try(m_ctx) {
        fz_rect mediabox = fz_make_rect(0, 0, size.width(), size.height());
        resources = pdf_new_dict(m_ctx, m_doc, 1);
        contents = fz_new_buffer(m_ctx, 16);
        pageObj = pdf_add_page(m_ctx, m_doc, mediabox, 0, resources, contents);
        pdf_insert_page(m_ctx, m_doc, atIndex, pageObj);
    }
    fz_always(m_ctx) {
        pdf_drop_obj(m_ctx, pageObj);
        pdf_drop_obj(m_ctx, resources);
        fz_drop_buffer(m_ctx, contents);
    }
    fz_catch(m_ctx) {
        setError(QStringLiteral("Failed to insert page: %1").arg(QString::fromUtf8(fz_caught_message(m_ctx))));
        return false;
    }
    return true;
}

bool MuPdfEditDocument::movePage(int fromIndex, int toIndex)
{
    if (!checkPage(fromIndex, "movePage") || !checkPage(toIndex, "movePage")) {
        return false;
    }
    if (fromIndex == toIndex) {
        return true;
    }
    if (!flushPendingContent()) {
        return false;
    }

    pdf_obj* pageRef = nullptr;
    fz_var(pageRef);

    fz_try(m_ctx) {
        pdf_obj* pageObj = pdf_lookup_page_obj(m_ctx, m_doc, fromIndex);
        pageRef = pdf_new_indirect(m_ctx, m_doc, pdf_obj_parent_num(m_ctx, pageObj), 0);
        pdf_delete_page(m_ctx, m_doc, fromIndex);
        pdf_insert_page(m_ctx, m_doc, toIndex, pageRef);
    }
    fz_always(m_ctx) {
        pdf_drop_obj(m_ctx, pageRef);
    }
    fz_catch(m_ctx) {
        setError(QStringLiteral("Failed to move page: %1").arg(QString::fromUtf8(fz_caught_message(m_ctx))));
        return false;
    }
    return true;
}

bool MuPdfEditDocument::appendPagesFrom(const QByteArray& sourceBytes, const QVector<int>& pageIndices)
{
    if (!isValid() || !flushPendingContent()) {
        return false;
    }

    fz_buffer* buf = nullptr;
    fz_stream* stm = nullptr;
    pdf_document* source = nullptr;
    pdf_graft_map* graftMap = nullptr;
    fz_var(buf);
    fz_var(stm);
    fz_var(source);
    fz_var(graftMap);

    fz_try(m_ctx) {
        buf = fz_new_buffer_from_copied_data(m_ctx,
            reinterpret_cast<const unsigned char*>(sourceBytes.constData()),
            static_cast<size_t>(sourceBytes.size()));
        stm = fz_open_buffer(m_ctx, buf);
        source = pdf_open_document_with_stream(m_ctx, stm);

        const int sourceCount = pdf_count_pages(m_ctx, source);
        // One graft map per source so shared resources are copied once
        graftMap = pdf_new_graft_map(m_ctx, m_doc);
        for (int index : pageIndices) {
            if (index < 0 || index >= sourceCount) {
                fz_throw(m_ctx, FZ_ERROR_GENERIC, "source page %d out of range", index);
            }
            pdf_graft_mapped_page(m_ctx, graftMap, -1, source, index);
        }
    }
    fz_always(m_ctx) {
        pdf_drop_graft_map(m_ctx, graftMap);
        pdf_drop_document(m_ctx, source);
        fz_drop_stream(m_ctx, stm);
        fz_drop_buffer(m_ctx, buf);
    }
    fz_catch(m_ctx) {
        setError(QStringLiteral("Failed to copy pages: %1").arg(QString::fromUtf8(fz_caught_message(m_ctx))));
        return false;
    }
    return true;
}

bool MuPdfEditDocument::setRotation(int pageIndex, int degrees)
{
    if (!checkPage(pageIndex, "setRotation")) {
        return false;
    }

    fz_try(m_ctx) {
        pdf_obj* pageObj = pdf_lookup_page_obj(m_ctx, m_doc, pageIndex);
        pdf_dict_put_int(m_ctx, pageObj, PDF_NAME(Rotate), normaliseRotation(degrees));
    }
    fz_catch(m_ctx) {
        setError(QStringLiteral("Failed to rotate page: %1").arg(QString::fromUtf8(fz_caught_message(m_ctx))));
        return false;
    }
    return true;
}

bool MuPdfEditDocument::setCropBox(int pageIndex, const QRectF& box)
{
    if (!checkPage(pageIndex, "setCropBox")) {
        return false;
    }
    if (box.width() <= 0 || box.height() <= 0) {
        setError(QStringLiteral("setCropBox: empty crop box"));
        return false;
    }

    fz_try(m_ctx) {
        pdf_obj* pageObj = pdf_lookup_page_obj(m_ctx, m_doc, pageIndex);
        fz_rect crop = fz_make_rect(box.left(), box.top(), box.right(), box.bottom());
        pdf_dict_put_rect(m_ctx, pageObj, PDF_NAME(CropBox), crop);
    }
    fz_catch(m_ctx) {
        setError(QStringLiteral("Failed to crop page: %1").arg(QString::fromUtf8(fz_caught_message(m_ctx))));
        return false;
    }
    return true;
}

// ============================================================================
// Resources
// ============================================================================

pdf_obj* MuPdfEditDocument::ownResources(int pageIndex)
{
    pdf_obj* pageObj = pdf_lookup_page_obj(m_ctx, m_doc, pageIndex);
    pdf_obj* resources = pdf_dict_get(m_ctx, pageObj, PDF_NAME(Resources));
    if (!resources) {
        pdf_obj* inherited = pdf_dict_get_inheritable(m_ctx, pageObj, PDF_NAME(Resources));
        resources = inherited ? pdf_copy_dict(m_ctx, inherited) : pdf_new_dict(m_ctx, m_doc, 4);
        pdf_dict_put_drop(m_ctx, pageObj, PDF_NAME(Resources), resources);
    }
    return resources;
}

fz_font* MuPdfEditDocument::loadFont(const QString& fontName) const
{
    fz_font* font = m_fonts.value(fontName, nullptr);
    if (font) {
        return font;
    }

    const QByteArray name = fontName.toLatin1();
    fz_try(m_ctx) {
        font = fz_new_base14_font(m_ctx, name.constData());
    }
    fz_catch(m_ctx) {
        qWarning() << "MuPdfEditDocument: Unknown base-14 font" << fontName;
        return nullptr;
    }
    m_fonts.insert(fontName, font);
    return font;
}

QByteArray MuPdfEditDocument::fontResource(int pageIndex, const QString& fontName)
{
    fz_font* font = loadFont(fontName);
    if (!font) {
        setError(QStringLiteral("Font %1 is not available").arg(fontName));
        return QByteArray();
    }

    const QByteArray resourceName = "PdfDesk" + fontName.toLatin1().replace('-', '_');
    pdf_obj* fontObj = m_fontObjects.value(fontName, nullptr);

    fz_try(m_ctx) {
        if (!fontObj) {
            fontObj = pdf_add_simple_font(m_ctx, m_doc, font, PDF_SIMPLE_ENCODING_LATIN);
            m_fontObjects.insert(fontName, fontObj);
        }
        pdf_obj* resources = ownResources(pageIndex);
        pdf_obj* fonts = pdf_dict_get(m_ctx, resources, PDF_NAME(Font));
        if (!fonts) {
            fonts = pdf_dict_put_dict(m_ctx, resources, PDF_NAME(Font), 2);
        }
        pdf_dict_puts(m_ctx, fonts, resourceName.constData(), fontObj);
    }
    fz_catch(m_ctx) {
        setError(QStringLiteral("Failed to embed font: %1").arg(QString::fromUtf8(fz_caught_message(m_ctx))));
        return QByteArray();
    }
    return resourceName;
}

QByteArray MuPdfEditDocument::opacityResource(int pageIndex, qreal opacity)
{
    const int percent = qBound(0, qRound(opacity * 100), 100);
    const QByteArray resourceName = "PdfDeskGS" + QByteArray::number(percent);

    fz_try(m_ctx) {
        pdf_obj* resources = ownResources(pageIndex);
        pdf_obj* states = pdf_dict_get(m_ctx, resources, PDF_NAME(ExtGState));
        if (!states) {
            states = pdf_dict_put_dict(m_ctx, resources, PDF_NAME(ExtGState), 2);
        }
        if (!pdf_dict_gets(m_ctx, states, resourceName.constData())) {
            pdf_obj* gs = pdf_dict_puts_dict(m_ctx, states, resourceName.constData(), 3);
            pdf_dict_put(m_ctx, gs, PDF_NAME(Type), PDF_NAME(ExtGState));
            pdf_dict_put_real(m_ctx, gs, PDF_NAME(ca), percent / 100.0);
            pdf_dict_put_real(m_ctx, gs, PDF_NAME(CA), percent / 100.0);
        }
    }
    fz_catch(m_ctx) {
        setError(QStringLiteral("Failed to add opacity state: %1").arg(QString::fromUtf8(fz_caught_message(m_ctx))));
        return QByteArray();
    }
    return resourceName;
}

// ============================================================================
// Content
// ============================================================================

bool MuPdfEditDocument::drawRectangle(int pageIndex, const QRectF& rect,
                                      const QColor& color, qreal opacity)
{
    if (!checkPage(pageIndex, "drawRectangle")) {
        return false;
    }

    QByteArray ops = "q\n";
    if (opacity < 1.0) {
        const QByteArray gs = opacityResource(pageIndex, opacity);
        if (gs.isEmpty()) {
            return false;
        }
        ops += '/' + gs + " gs\n";
    }

    const QPointF origin = mediaOrigin(pageIndex);
    ops += rgbOperands(color) + " rg\n";
    ops += num(origin.x() + rect.x()) + ' ' + num(origin.y() + rect.y()) + ' '
         + num(rect.width()) + ' ' + num(rect.height()) + " re f\n";
    ops += "Q\n";

    m_pendingContent[pageIndex] += ops;
    return true;
}

bool MuPdfEditDocument::drawLine(int pageIndex, const QPointF& from, const QPointF& to,
                                 qreal thickness, const QColor& color)
{
    if (!checkPage(pageIndex, "drawLine")) {
        return false;
    }

    const QPointF origin = mediaOrigin(pageIndex);
    QByteArray ops = "q\n";
    ops += rgbOperands(color) + " RG\n";
    ops += num(thickness) + " w 1 J 1 j\n";
    ops += num(origin.x() + from.x()) + ' ' + num(origin.y() + from.y()) + " m\n";
    ops += num(origin.x() + to.x()) + ' ' + num(origin.y() + to.y()) + " l S\n";
    ops += "Q\n";

    m_pendingContent[pageIndex] += ops;
    return true;
}

bool MuPdfEditDocument::drawText(int pageIndex, const QPointF& origin, const QString& text,
                                 const PdfTextStyle& style)
{
    if (!checkPage(pageIndex, "drawText")) {
        return false;
    }
    if (text.isEmpty()) {
        return true;
    }

    const QStringList lines = QString(text).replace(QLatin1String("\r\n"), QLatin1String("\n"))
                                  .split(QLatin1Char('\n'));
    QVector<QByteArray> literals;
    for (const QString& line : lines) {
        QByteArray literal;
        if (!pdfLiteral(line, literal)) {
            setError(QStringLiteral("drawText: text contains characters outside Latin-1"));
            return false;
        }
        literals.append(literal);
    }

    const QByteArray font = fontResource(pageIndex, style.fontName);
    if (font.isEmpty()) {
        return false;
    }

    QByteArray ops = "q\n";
    if (style.opacity < 1.0) {
        const QByteArray gs = opacityResource(pageIndex, style.opacity);
        if (gs.isEmpty()) {
            return false;
        }
        ops += '/' + gs + " gs\n";
    }

    const QPointF mediaOffset = mediaOrigin(pageIndex);
    const qreal radians = qDegreesToRadians(style.rotationDegrees);
    const qreal c = qCos(radians);
    const qreal s = qSin(radians);

    ops += "BT\n";
    ops += '/' + font + ' ' + num(style.fontSize) + " Tf\n";
    ops += rgbOperands(style.color) + " rg\n";
    ops += num(c) + ' ' + num(s) + ' ' + num(-s) + ' ' + num(c) + ' '
         + num(mediaOffset.x() + origin.x()) + ' ' + num(mediaOffset.y() + origin.y()) + " Tm\n";
    ops += num(style.fontSize * LINE_SPACING) + " TL\n";
    for (int i = 0; i < literals.size(); ++i) {
        if (i > 0) {
            ops += "T*\n";
        }
        ops += literals.at(i) + " Tj\n";
    }
    ops += "ET\nQ\n";

    m_pendingContent[pageIndex] += ops;
    return true;
}

qreal MuPdfEditDocument::textWidth(const QString& text, const QString& fontName, qreal fontSize) const
{
    fz_font* font = loadFont(fontName);
    if (!font) {
        return 0.0;
    }

    qreal width = 0.0;
    fz_try(m_ctx) {
        for (const QChar ch : text) {
            const int gid = fz_encode_character(m_ctx, font, ch.unicode());
            width += fz_advance_glyph(m_ctx, font, gid, 0);
        }
    }
    fz_catch(m_ctx) {
        qWarning() << "MuPdfEditDocument: Failed to measure text:" << fz_caught_message(m_ctx);
        return 0.0;
    }
    return width * fontSize;
}

bool MuPdfEditDocument::flushPendingContent()
{
    if (m_pendingContent.isEmpty()) {
        return true;
    }

    bool ok = true;
    for (auto it = m_pendingContent.constBegin(); it != m_pendingContent.constEnd() && ok; ++it) {
        const int pageIndex = it.key();
        const QByteArray& ops = it.value();

        fz_buffer* prefix = nullptr;
        fz_buffer* suffix = nullptr;
        pdf_obj* prefixRef = nullptr;
        pdf_obj* suffixRef = nullptr;
        pdf_obj* newContents = nullptr;
        fz_var(prefix);
        fz_var(suffix);
        fz_var(prefixRef);
        fz_var(suffixRef);
        fz_var(newContents);

        fz_try(m_ctx) {
            pdf_obj* pageObj = pdf_lookup_page_obj(m_ctx, m_doc, pageIndex);
            pdf_obj* contents = pdf_dict_get(m_ctx, pageObj, PDF_NAME(Contents));

            // [q] + original streams + [Q ops]
            prefix = fz_new_buffer(m_ctx, 4);
            fz_append_string(m_ctx, prefix, "q\n");
            suffix = fz_new_buffer(m_ctx, static_cast<size_t>(ops.size()) + 4);
            fz_append_string(m_ctx, suffix, "Q\n");
            fz_append_data(m_ctx, suffix, ops.constData(), static_cast<size_t>(ops.size()));

            prefixRef = pdf_add_stream(m_ctx, m_doc, prefix, nullptr, 0);
            suffixRef = pdf_add_stream(m_ctx, m_doc, suffix, nullptr, 0);

            newContents = pdf_new_array(m_ctx, m_doc, 4);
            pdf_array_push(m_ctx, newContents, prefixRef);
            if (pdf_is_array(m_ctx, contents)) {
                const int n = pdf_array_len(m_ctx, contents);
                for (int i = 0; i < n; ++i) {
                    pdf_array_push(m_ctx, newContents, pdf_array_get(m_ctx, contents, i));
                }
            } else if (contents) {
                pdf_array_push(m_ctx, newContents, contents);
            }
            pdf_array_push(m_ctx, newContents, suffixRef);
            pdf_dict_put(m_ctx, pageObj, PDF_NAME(Contents), newContents);
        }
        fz_always(m_ctx) {
            pdf_drop_obj(m_ctx, newContents);
            pdf_drop_obj(m_ctx, suffixRef);
            pdf_drop_obj(m_ctx, prefixRef);
            fz_drop_buffer(m_ctx, suffix);
            fz_drop_buffer(m_ctx, prefix);
        }
        fz_catch(m_ctx) {
            setError(QStringLiteral("Failed to write page content: %1")
                     .arg(QString::fromUtf8(fz_caught_message(m_ctx))));
            ok = false;
        }
    }

    m_pendingContent.clear();
    return ok;
}

// ============================================================================
// Forms
// ============================================================================

static PdfFormField::Type convertWidgetType(int type)
{
    switch (type) {
        case PDF_WIDGET_TYPE_TEXT:        return PdfFormField::Text;
        case PDF_WIDGET_TYPE_CHECKBOX:    return PdfFormField::CheckBox;
        case PDF_WIDGET_TYPE_RADIOBUTTON: return PdfFormField::RadioButton;
        case PDF_WIDGET_TYPE_COMBOBOX:    return PdfFormField::ComboBox;
        case PDF_WIDGET_TYPE_LISTBOX:     return PdfFormField::ListBox;
        case PDF_WIDGET_TYPE_BUTTON:      return PdfFormField::PushButton;
        case PDF_WIDGET_TYPE_SIGNATURE:   return PdfFormField::Signature;
        default:                          return PdfFormField::Unknown;
    }
}

QVector<PdfFormField> MuPdfEditDocument::formFields() const
{
    QVector<PdfFormField> result;
    if (!isValid()) {
        return result;
    }

    const int count = pageCount();
    for (int i = 0; i < count; ++i) {
        pdf_page* page = nullptr;
        fz_var(page);

        fz_try(m_ctx) {
            page = pdf_load_page(m_ctx, m_doc, i);
            for (pdf_annot* widget = pdf_first_widget(m_ctx, page); widget;
                 widget = pdf_next_widget(m_ctx, widget)) {
                pdf_obj* fieldObj = pdf_annot_obj(m_ctx, widget);
                char* rawName = pdf_load_field_name(m_ctx, fieldObj);
                const QString name = QString::fromUtf8(rawName);
                fz_free(m_ctx, rawName);

                const PdfFormField::Type type = convertWidgetType(pdf_widget_type(m_ctx, widget));
                const QString value = QString::fromUtf8(pdf_field_value(m_ctx, fieldObj));

                // Radio groups have one widget per option
                auto existing = std::find_if(result.begin(), result.end(),
                    [&name](const PdfFormField& f) { return f.name == name; });
                if (existing != result.end()) {
                    if (type == PdfFormField::RadioButton) {
                        const char* onState = pdf_to_name(m_ctx, pdf_button_field_on_state(m_ctx, fieldObj));
                        existing->options.append(QString::fromUtf8(onState));
                    }
                    continue;
                }

                PdfFormField field;
                field.name = name;
                field.type = type;
                field.readOnly = (pdf_field_flags(m_ctx, fieldObj) & PDF_FIELD_IS_READ_ONLY) != 0;

                if (type == PdfFormField::CheckBox) {
                    field.value = (value.isEmpty() || value == QLatin1String("Off"))
                        ? QStringLiteral("false") : QStringLiteral("true");
                } else if (type == PdfFormField::RadioButton) {
                    field.value = value == QLatin1String("Off") ? QString() : value;
                    const char* onState = pdf_to_name(m_ctx, pdf_button_field_on_state(m_ctx, fieldObj));
                    field.options.append(QString::fromUtf8(onState));
                } else {
                    field.value = value;
                }

                if (type == PdfFormField::ComboBox || type == PdfFormField::ListBox) {
                    const int n = pdf_choice_widget_options(m_ctx, widget, 0, nullptr);
                    std::vector<const char*> options(static_cast<size_t>(qMax(0, n)));
                    if (n > 0) {
                        pdf_choice_widget_options(m_ctx, widget, 0, options.data());
                    }
                    for (const char* opt : options) {
                        field.options.append(QString::fromUtf8(opt));
                    }
                }

                result.append(field);
            }
        }
        fz_always(m_ctx) {
            pdf_drop_page(m_ctx, page);
        }
        fz_catch(m_ctx) {
            qWarning() << "MuPdfEditDocument: Failed to read form fields on page" << i
                       << "-" << fz_caught_message(m_ctx);
        }
    }
    return result;
}

bool MuPdfEditDocument::setFieldValue(const QString& name, const QString& value)
{
    if (!isValid()) {
        return false;
    }

    bool found = false;
    bool ok = true;
    const QByteArray utf8 = value.toUtf8();
    const int count = pageCount();

    for (int i = 0; i < count && ok; ++i) {
        pdf_page* page = nullptr;
        fz_var(page);

        fz_try(m_ctx) {
            page = pdf_load_page(m_ctx, m_doc, i);
            bool touched = false;
            for (pdf_annot* widget = pdf_first_widget(m_ctx, page); widget;
                 widget = pdf_next_widget(m_ctx, widget)) {
                pdf_obj* fieldObj = pdf_annot_obj(m_ctx, widget);
                char* rawName = pdf_load_field_name(m_ctx, fieldObj);
                const bool matches = QString::fromUtf8(rawName) == name;
                fz_free(m_ctx, rawName);
                if (!matches) {
                    continue;
                }

                found = true;
                touched = true;
                switch (pdf_widget_type(m_ctx, widget)) {
                    case PDF_WIDGET_TYPE_TEXT:
                        if (!pdf_set_text_field_value(m_ctx, widget, utf8.constData())) {
                            fz_throw(m_ctx, FZ_ERROR_GENERIC, "value rejected by field");
                        }
                        break;
                    case PDF_WIDGET_TYPE_COMBOBOX:
                    case PDF_WIDGET_TYPE_LISTBOX:
                        pdf_set_choice_field_value(m_ctx, widget, utf8.constData());
                        break;
                    case PDF_WIDGET_TYPE_CHECKBOX: {
                        const char* current = pdf_field_value(m_ctx, fieldObj);
                        const bool isOn = current && *current && strcmp(current, "Off") != 0;
                        const bool wantOn = value == QLatin1String("true");
                        if (isOn != wantOn) {
                            pdf_toggle_widget(m_ctx, widget);
                        }
                        break;
                    }
                    case PDF_WIDGET_TYPE_RADIOBUTTON: {
                        const char* onState = pdf_to_name(m_ctx, pdf_button_field_on_state(m_ctx, fieldObj));
                        const char* current = pdf_field_value(m_ctx, fieldObj);
                        const bool isThis = onState && strcmp(onState, utf8.constData()) == 0;
                        const bool isOn = current && onState && strcmp(current, onState) == 0;
                        if (isThis && !isOn) {
                            pdf_toggle_widget(m_ctx, widget);
                        }
                        break;
                    }
                    default:
                        break;
                }
            }
            if (touched) {
                pdf_update_page(m_ctx, page);
            }
        }
        fz_always(m_ctx) {
            pdf_drop_page(m_ctx, page);
        }
        fz_catch(m_ctx) {
            setError(QStringLiteral("Failed to set field %1: %2")
                     .arg(name, QString::fromUtf8(fz_caught_message(m_ctx))));
            ok = false;
        }
    }

    if (ok && !found) {
        setError(QStringLiteral("No form field named %1").arg(name));
        return false;
    }
    return ok;
}

bool MuPdfEditDocument::addTextField(int pageIndex, const QString& name, const QRectF& rect)
{
    if (!checkPage(pageIndex, "addTextField") || !flushPendingContent()) {
        return false;
    }

    const QPointF origin = mediaOrigin(pageIndex);
    const QByteArray utf8Name = name.toUtf8();
    pdf_page* page = nullptr;
    pdf_annot* annot = nullptr;
    fz_var(page);
    fz_var(annot);

    fz_try(m_ctx) {
        page = pdf_load_page(m_ctx, m_doc, pageIndex);
        annot = pdf_create_annot_raw(m_ctx, page, PDF_ANNOT_WIDGET);
        pdf_obj* fieldObj = pdf_annot_obj(m_ctx, annot);

        pdf_dict_put(m_ctx, fieldObj, PDF_NAME(FT), PDF_NAME(Tx));
        pdf_dict_put_text_string(m_ctx, fieldObj, PDF_NAME(T), utf8Name.constData());
        pdf_dict_put_text_string(m_ctx, fieldObj, PDF_NAME(DA), "/Helv 12 Tf 0 g");
        pdf_dict_put_int(m_ctx, fieldObj, PDF_NAME(F), PDF_ANNOT_IS_PRINT);
        pdf_set_annot_rect(m_ctx, annot, fz_make_rect(origin.x() + rect.left(), origin.y() + rect.top(),
                                                      origin.x() + rect.right(), origin.y() + rect.bottom()));

        // Register the field in the document's AcroForm
        pdf_obj* root = pdf_dict_get(m_ctx, pdf_trailer(m_ctx, m_doc), PDF_NAME(Root));
        pdf_obj* form = pdf_dict_get(m_ctx, root, PDF_NAME(AcroForm));
        if (!form) {
            form = pdf_dict_put_dict(m_ctx, root, PDF_NAME(AcroForm), 2);
        }
        pdf_obj* fields = pdf_dict_get(m_ctx, form, PDF_NAME(Fields));
        if (!fields) {
            fields = pdf_dict_put_array(m_ctx, form, PDF_NAME(Fields), 1);
        }
        pdf_array_push(m_ctx, fields, fieldObj);

        pdf_update_annot(m_ctx, annot);
    }
    fz_always(m_ctx) {
        pdf_drop_annot(m_ctx, annot);
        pdf_drop_page(m_ctx, page);
    }
    fz_catch(m_ctx) {
        setError(QStringLiteral("Failed to add form field: %1").arg(QString::fromUtf8(fz_caught_message(m_ctx))));
        return false;
    }
    return true;
}

bool MuPdfEditDocument::flattenForms()
{
    if (!isValid() || !flushPendingContent()) {
        return false;
    }

    fz_try(m_ctx) {
        // Widgets only; markup annotations stay interactive
        pdf_bake_document(m_ctx, m_doc, 0, 1);
    }
    fz_catch(m_ctx) {
        setError(QStringLiteral("Failed to flatten form: %1").arg(QString::fromUtf8(fz_caught_message(m_ctx))));
        return false;
    }
    return true;
}

// ============================================================================
// Output
// ============================================================================

bool MuPdfEditDocument::save(QByteArray& out)
{
    if (!isValid() || !flushPendingContent()) {
        return false;
    }

    fz_buffer* buf = nullptr;
    fz_output* output = nullptr;
    fz_var(buf);
    fz_var(output);

    fz_try(m_ctx) {
        buf = fz_new_buffer(m_ctx, 8192);
        output = fz_new_output_with_buffer(m_ctx, buf);

        pdf_write_options opts = pdf_default_write_options;
        opts.do_compress = 1;       // Compress streams
        opts.do_garbage = 1;        // Drop objects orphaned by page removal
        pdf_write_document(m_ctx, m_doc, output, &opts);
        fz_close_output(m_ctx, output);

        unsigned char* data = nullptr;
        const size_t len = fz_buffer_storage(m_ctx, buf, &data);
        out = QByteArray(reinterpret_cast<const char*>(data), static_cast<int>(len));
    }
    fz_always(m_ctx) {
        fz_drop_output(m_ctx, output);
        fz_drop_buffer(m_ctx, buf);
    }
    fz_catch(m_ctx) {
        setError(QStringLiteral("Failed to save document: %1").arg(QString::fromUtf8(fz_caught_message(m_ctx))));
        return false;
    }
    return true;
}

// ============================================================================
// MuPdfEngine
// ============================================================================

std::unique_ptr<PdfEditDocument> MuPdfEngine::load(const QByteArray& bytes, QString* errorMessage) const
{
    auto doc = std::make_unique<MuPdfEditDocument>();
    if (!doc->openBytes(bytes)) {
        if (errorMessage) {
            *errorMessage = doc->lastError();
        }
        return nullptr;
    }
    return doc;
}

std::unique_ptr<PdfEditDocument> MuPdfEngine::createEmpty(QString* errorMessage) const
{
    auto doc = std::make_unique<MuPdfEditDocument>();
    if (!doc->createEmpty()) {
        if (errorMessage) {
            *errorMessage = doc->lastError();
        }
        return nullptr;
    }
    return doc;
}
