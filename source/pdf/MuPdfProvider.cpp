#include "MuPdfProvider.h"

#include <mupdf/fitz.h>

#include <QDebug>

#include <cstring>

// ============================================================================
// Construction / Destruction
// ============================================================================

MuPdfProvider::MuPdfProvider(const QByteArray& pdfData)
    : m_data(pdfData)
{
    m_ctx = fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT);
    if (!m_ctx) {
        qWarning() << "MuPdfProvider: Failed to create MuPDF context";
        return;
    }
    if (!open()) {
        m_pageSizes.clear();
    }
}

MuPdfProvider::~MuPdfProvider()
{
    if (m_ctx) {
        fz_drop_document(m_ctx, m_doc);
        fz_drop_context(m_ctx);
    }
}

bool MuPdfProvider::open()
{
    fz_stream* stm = nullptr;
    fz_var(stm);

    fz_try(m_ctx) {
        fz_register_document_handlers(m_ctx);
        stm = fz_open_memory(m_ctx,
            reinterpret_cast<const unsigned char*>(m_data.constData()),
            static_cast<size_t>(m_data.size()));
        m_doc = fz_open_document_with_stream(m_ctx, "application/pdf", stm);
    }
    fz_always(m_ctx) {
        fz_drop_stream(m_ctx, stm);
    }
    fz_catch(m_ctx) {
        qWarning() << "MuPdfProvider: Failed to open document -" << fz_caught_message(m_ctx);
        m_doc = nullptr;
        return false;
    }

    if (fz_needs_password(m_ctx, m_doc)) {
        m_locked = true;
        return false;
    }

    int count = 0;
    fz_try(m_ctx) {
        count = fz_count_pages(m_ctx, m_doc);
    }
    fz_catch(m_ctx) {
        qWarning() << "MuPdfProvider: Failed to count pages -" << fz_caught_message(m_ctx);
        return false;
    }

    m_pageSizes.reserve(count);
    for (int i = 0; i < count; ++i) {
        fz_page* page = nullptr;
        fz_rect bounds = fz_empty_rect;
        fz_var(page);
        fz_try(m_ctx) {
            page = fz_load_page(m_ctx, m_doc, i);
            bounds = fz_bound_page(m_ctx, page);
        }
        fz_always(m_ctx) {
            fz_drop_page(m_ctx, page);
        }
        fz_catch(m_ctx) {
            qWarning() << "MuPdfProvider: Failed to read bounds of page" << i + 1;
            return false;
        }
        m_pageSizes.append(QSizeF(bounds.x1 - bounds.x0, bounds.y1 - bounds.y0));
    }
    return true;
}

// ============================================================================
// Document Info
// ============================================================================

bool MuPdfProvider::isValid() const
{
    return m_doc != nullptr && !m_locked && !m_pageSizes.isEmpty();
}

QSizeF MuPdfProvider::pageSize(int pageIndex) const
{
    return hasPage(pageIndex) ? m_pageSizes.at(pageIndex) : QSizeF();
}

// ============================================================================
// Rendering
// ============================================================================

QImage MuPdfProvider::renderPageToImage(int pageIndex, qreal dpi) const
{
    if (!isValid() || !hasPage(pageIndex) || dpi <= 0) {
        return QImage();
    }

    const float scale = static_cast<float>(dpi / 72.0);
    fz_pixmap* pix = nullptr;
    fz_var(pix);
    QImage result;

    fz_try(m_ctx) {
        // Opaque RGB on white, no alpha channel
        pix = fz_new_pixmap_from_page_number(m_ctx, m_doc, pageIndex,
                                             fz_scale(scale, scale), fz_device_rgb(m_ctx), 0);
        const int width = fz_pixmap_width(m_ctx, pix);
        const int height = fz_pixmap_height(m_ctx, pix);
        const int stride = static_cast<int>(fz_pixmap_stride(m_ctx, pix));
        const unsigned char* samples = fz_pixmap_samples(m_ctx, pix);

        QImage rgb(width, height, QImage::Format_RGB888);
        for (int y = 0; y < height; ++y) {
            std::memcpy(rgb.scanLine(y), samples + y * stride, static_cast<size_t>(width) * 3);
        }
        result = rgb.convertToFormat(QImage::Format_ARGB32_Premultiplied);
    }
    fz_always(m_ctx) {
        fz_drop_pixmap(m_ctx, pix);
    }
    fz_catch(m_ctx) {
        qWarning() << "MuPdfProvider: Render failed for page" << pageIndex + 1
                   << "-" << fz_caught_message(m_ctx);
        return QImage();
    }
    return result;
}

// ============================================================================
// Text
// ============================================================================

QVector<PdfTextBox> MuPdfProvider::textBoxes(int pageIndex) const
{
    QVector<PdfTextBox> boxes;
    if (!isValid() || !hasPage(pageIndex)) {
        return boxes;
    }

    // One item per text line, boxed by the union of its non-blank characters
    PdfTextBox item;
    auto flushLine = [&boxes, &item]() {
        item.text = item.text.trimmed();
        if (!item.text.isEmpty()) {
            boxes.append(item);
        }
        item = PdfTextBox();
    };

    fz_stext_page* textPage = nullptr;
    fz_var(textPage);

    fz_try(m_ctx) {
        fz_stext_options options{};
        textPage = fz_new_stext_page_from_page_number(m_ctx, m_doc, pageIndex, &options);

        for (fz_stext_block* block = textPage->first_block; block; block = block->next) {
            if (block->type != FZ_STEXT_BLOCK_TEXT) {
                continue;
            }
            for (fz_stext_line* line = block->u.t.first_line; line; line = line->next) {
                for (fz_stext_char* ch = line->first_char; ch; ch = ch->next) {
                    const char32_t code = static_cast<char32_t>(ch->c);
                    item.text += QString::fromUcs4(&code, 1);
                    if (QChar::isSpace(code)) {
                        continue;
                    }
                    const fz_rect r = fz_rect_from_quad(ch->quad);
                    const QRectF charRect(r.x0, r.y0, r.x1 - r.x0, r.y1 - r.y0);
                    item.boundingBox = item.boundingBox.isNull()
                        ? charRect : item.boundingBox.united(charRect);
                }
                flushLine();
            }
        }
    }
    fz_always(m_ctx) {
        fz_drop_stext_page(m_ctx, textPage);
    }
    fz_catch(m_ctx) {
        qWarning() << "MuPdfProvider: Text extraction failed for page" << pageIndex + 1;
        return {};
    }
    return boxes;
}
