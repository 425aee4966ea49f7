#include "PopplerPdfProvider.h"

#include <QDebug>

PopplerPdfProvider::PopplerPdfProvider(const QByteArray& pdfData)
    : m_data(pdfData)
{
    m_document = Poppler::Document::loadFromData(m_data);
    if (!m_document) {
        qWarning() << "PopplerPdfProvider: Failed to load" << m_data.size() << "bytes";
        return;
    }
    if (m_document->isLocked()) {
        return;
    }

    m_document->setRenderHint(Poppler::Document::Antialiasing, true);
    m_document->setRenderHint(Poppler::Document::TextAntialiasing, true);
    m_document->setRenderHint(Poppler::Document::TextSlightHinting, true);

    const int count = m_document->numPages();
    m_pageSizes.reserve(count);
    for (int i = 0; i < count; ++i) {
        const std::unique_ptr<Poppler::Page> page = loadPage(i);
        m_pageSizes.append(page ? page->pageSizeF() : QSizeF());
    }
}

bool PopplerPdfProvider::isValid() const
{
    return m_document && !m_document->isLocked() && !m_pageSizes.isEmpty();
}

bool PopplerPdfProvider::isLocked() const
{
    return m_document && m_document->isLocked();
}

QSizeF PopplerPdfProvider::pageSize(int pageIndex) const
{
    if (pageIndex < 0 || pageIndex >= m_pageSizes.size()) {
        return QSizeF();
    }
    return m_pageSizes.at(pageIndex);
}

QImage PopplerPdfProvider::renderPageToImage(int pageIndex, qreal dpi) const
{
    if (dpi <= 0) {
        return QImage();
    }
    const std::unique_ptr<Poppler::Page> page = loadPage(pageIndex);
    if (!page) {
        return QImage();
    }

    QImage image = page->renderToImage(dpi, dpi);
    if (image.isNull()) {
        qWarning() << "PopplerPdfProvider: Render failed for page" << pageIndex + 1;
    }
    return image;
}

QVector<PdfTextBox> PopplerPdfProvider::textBoxes(int pageIndex) const
{
    QVector<PdfTextBox> result;
    const std::unique_ptr<Poppler::Page> page = loadPage(pageIndex);
    if (!page) {
        return result;
    }

    // Poppler hands out words; words chained by nextWord() share a line and
    // are joined into one item so phrases can be matched. Points, top-left origin.
    const std::vector<std::unique_ptr<Poppler::TextBox>> words = page->textList();
    PdfTextBox line;
    const Poppler::TextBox* previous = nullptr;
    auto flushLine = [&result, &line]() {
        line.text = line.text.trimmed();
        if (!line.text.isEmpty()) {
            result.append(line);
        }
        line = PdfTextBox();
    };

    for (const std::unique_ptr<Poppler::TextBox>& word : words) {
        if (!word) {
            continue;
        }
        if (previous && previous->nextWord() != word.get()) {
            flushLine();
        } else if (previous && previous->hasSpaceAfter()) {
            line.text += QLatin1Char(' ');
        }
        line.text += word->text();
        if (!word->text().trimmed().isEmpty()) {
            line.boundingBox = line.boundingBox.isNull()
                ? word->boundingBox() : line.boundingBox.united(word->boundingBox());
        }
        previous = word.get();
    }
    flushLine();
    return result;
}

std::unique_ptr<Poppler::Page> PopplerPdfProvider::loadPage(int pageIndex) const
{
    if (!m_document || m_document->isLocked() || pageIndex < 0 || pageIndex >= m_document->numPages()) {
        return nullptr;
    }
    return m_document->page(pageIndex);
}
