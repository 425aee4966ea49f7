#include "MockPdfEngine.h"

#include <QDebug>
#include <QJsonDocument>
#include <QPainter>
#include <QThread>

namespace {

QJsonObject colorJson(const QColor& color, qreal opacity)
{
    QJsonObject obj;
    obj["color"] = color.name();
    obj["opacity"] = opacity;
    return obj;
}

QJsonObject blankPage(const QSizeF& size, const QString& label)
{
    QJsonObject page;
    page["w"] = size.width();
    page["h"] = size.height();
    page["rot"] = 0;
    page["label"] = label;
    page["ops"] = QJsonArray();
    page["text"] = QJsonArray();
    return page;
}

} // namespace

// ============================================================================
// MockPdfEditDocument
// ============================================================================

MockPdfEditDocument::MockPdfEditDocument(const QJsonObject& root)
    : m_pages(root.value("pages").toArray())
    , m_fields(root.value("fields").toArray())
{
}

bool MockPdfEditDocument::checkPage(int pageIndex, const char* operation)
{
    if (pageIndex < 0 || pageIndex >= m_pages.size()) {
        m_lastError = QStringLiteral("%1: page %2 out of range")
            .arg(QLatin1String(operation)).arg(pageIndex);
        qWarning() << "MockPdfEditDocument:" << m_lastError;
        return false;
    }
    return true;
}

bool MockPdfEditDocument::appendOp(int pageIndex, const QJsonObject& op)
{
    QJsonObject page = m_pages.at(pageIndex).toObject();
    QJsonArray ops = page.value("ops").toArray();
    ops.append(op);
    page["ops"] = ops;
    m_pages[pageIndex] = page;
    return true;
}

int MockPdfEditDocument::pageCount() const
{
    return m_pages.size();
}

QSizeF MockPdfEditDocument::pageSize(int pageIndex) const
{
    const QJsonObject page = m_pages.at(pageIndex).toObject();
    return QSizeF(page.value("w").toDouble(612), page.value("h").toDouble(792));
}

int MockPdfEditDocument::rotation(int pageIndex) const
{
    return m_pages.at(pageIndex).toObject().value("rot").toInt();
}

bool MockPdfEditDocument::removePage(int pageIndex)
{
    if (!checkPage(pageIndex, "removePage")) {
        return false;
    }
    m_pages.removeAt(pageIndex);
    return true;
}

bool MockPdfEditDocument::insertBlankPage(int atIndex, const QSizeF& size)
{
    if (atIndex < 0 || atIndex > m_pages.size()) {
        m_lastError = QStringLiteral("insertBlankPage: index out of range");
        return false;
    }
    m_pages.insert(atIndex, blankPage(size, QStringLiteral("blank")));
    return true;
}

bool MockPdfEditDocument::movePage(int fromIndex, int toIndex)
{
    if (!checkPage(fromIndex, "movePage") || !checkPage(toIndex, "movePage")) {
        return false;
    }
    const QJsonValue page = m_pages.at(fromIndex);
    m_pages.removeAt(fromIndex);
    m_pages.insert(toIndex, page);
    return true;
}

bool MockPdfEditDocument::appendPagesFrom(const QByteArray& sourceBytes, const QVector<int>& pageIndices)
{
    const QJsonArray sourcePages = MockPdfEngine::parse(sourceBytes).value("pages").toArray();
    for (int index : pageIndices) {
        if (index < 0 || index >= sourcePages.size()) {
            m_lastError = QStringLiteral("appendPagesFrom: source page %1 out of range").arg(index);
            return false;
        }
        m_pages.append(sourcePages.at(index));
    }
    return true;
}

bool MockPdfEditDocument::setRotation(int pageIndex, int degrees)
{
    if (!checkPage(pageIndex, "setRotation")) {
        return false;
    }
    QJsonObject page = m_pages.at(pageIndex).toObject();
    int rot = degrees % 360;
    if (rot < 0) {
        rot += 360;
    }
    page["rot"] = rot;
    m_pages[pageIndex] = page;
    return true;
}

bool MockPdfEditDocument::setCropBox(int pageIndex, const QRectF& box)
{
    if (!checkPage(pageIndex, "setCropBox")) {
        return false;
    }
    QJsonObject page = m_pages.at(pageIndex).toObject();
    page["crop"] = QJsonArray{box.left(), box.top(), box.right(), box.bottom()};
    m_pages[pageIndex] = page;
    return true;
}

bool MockPdfEditDocument::drawRectangle(int pageIndex, const QRectF& rect,
                                        const QColor& color, qreal opacity)
{
    if (!checkPage(pageIndex, "drawRectangle")) {
        return false;
    }
    QJsonObject op = colorJson(color, opacity);
    op["op"] = "rect";
    op["x"] = rect.x();
    op["y"] = rect.y();
    op["w"] = rect.width();
    op["h"] = rect.height();
    return appendOp(pageIndex, op);
}

bool MockPdfEditDocument::drawLine(int pageIndex, const QPointF& from, const QPointF& to,
                                   qreal thickness, const QColor& color)
{
    if (!checkPage(pageIndex, "drawLine")) {
        return false;
    }
    QJsonObject op = colorJson(color, 1.0);
    op["op"] = "line";
    op["x1"] = from.x();
    op["y1"] = from.y();
    op["x2"] = to.x();
    op["y2"] = to.y();
    op["thickness"] = thickness;
    return appendOp(pageIndex, op);
}

bool MockPdfEditDocument::drawText(int pageIndex, const QPointF& origin, const QString& text,
                                   const PdfTextStyle& style)
{
    if (!checkPage(pageIndex, "drawText")) {
        return false;
    }
    for (const QChar ch : text) {
        if (ch.unicode() > 0xFF) {
            m_lastError = QStringLiteral("drawText: text contains characters outside Latin-1");
            return false;
        }
    }
    QJsonObject op = colorJson(style.color, style.opacity);
    op["op"] = "text";
    op["x"] = origin.x();
    op["y"] = origin.y();
    op["text"] = text;
    op["font"] = style.fontName;
    op["size"] = style.fontSize;
    op["rotation"] = style.rotationDegrees;
    return appendOp(pageIndex, op);
}

qreal MockPdfEditDocument::textWidth(const QString& text, const QString& fontName, qreal fontSize) const
{
    Q_UNUSED(fontName);
    // Half an em per character
    return text.size() * fontSize * 0.5;
}

QVector<PdfFormField> MockPdfEditDocument::formFields() const
{
    QVector<PdfFormField> result;
    for (const QJsonValue& value : m_fields) {
        const QJsonObject obj = value.toObject();
        PdfFormField field;
        field.name = obj.value("name").toString();
        field.value = obj.value("value").toString();
        const QString type = obj.value("type").toString();
        if (type == "text") field.type = PdfFormField::Text;
        else if (type == "checkbox") field.type = PdfFormField::CheckBox;
        else if (type == "radio") field.type = PdfFormField::RadioButton;
        else if (type == "dropdown") field.type = PdfFormField::ComboBox;
        else field.type = PdfFormField::Unknown;
        for (const QJsonValue& opt : obj.value("options").toArray()) {
            field.options.append(opt.toString());
        }
        result.append(field);
    }
    return result;
}

bool MockPdfEditDocument::setFieldValue(const QString& name, const QString& value)
{
    for (int i = 0; i < m_fields.size(); ++i) {
        QJsonObject obj = m_fields.at(i).toObject();
        if (obj.value("name").toString() != name) {
            continue;
        }
        const QStringList options = obj.value("options").toVariant().toStringList();
        if (!options.isEmpty() && !value.isEmpty() && !options.contains(value)) {
            m_lastError = QStringLiteral("Value %1 is not an option of %2").arg(value, name);
            return false;
        }
        obj["value"] = value;
        m_fields[i] = obj;
        return true;
    }
    m_lastError = QStringLiteral("No form field named %1").arg(name);
    return false;
}

bool MockPdfEditDocument::addTextField(int pageIndex, const QString& name, const QRectF& rect)
{
    if (!checkPage(pageIndex, "addTextField")) {
        return false;
    }
    QJsonObject field;
    field["name"] = name;
    field["type"] = "text";
    field["value"] = QString();
    field["page"] = pageIndex;
    field["rect"] = QJsonArray{rect.x(), rect.y(), rect.width(), rect.height()};
    m_fields.append(field);
    return true;
}

bool MockPdfEditDocument::flattenForms()
{
    for (const QJsonValue& value : m_fields) {
        const QJsonObject obj = value.toObject();
        const int pageIndex = obj.value("page").toInt();
        if (pageIndex < 0 || pageIndex >= m_pages.size()) {
            continue;
        }
        QJsonObject op;
        op["op"] = "flattened-field";
        op["name"] = obj.value("name").toString();
        op["value"] = obj.value("value").toString();
        appendOp(pageIndex, op);
    }
    m_fields = QJsonArray();
    return true;
}

bool MockPdfEditDocument::save(QByteArray& out)
{
    QJsonObject root;
    root["pages"] = m_pages;
    root["fields"] = m_fields;
    out = QJsonDocument(root).toJson(QJsonDocument::Compact);
    return true;
}

// ============================================================================
// MockPdfEngine
// ============================================================================

std::unique_ptr<PdfEditDocument> MockPdfEngine::load(const QByteArray& bytes, QString* errorMessage) const
{
    QJsonParseError parseError;
    const QJsonDocument json = QJsonDocument::fromJson(bytes, &parseError);
    if (parseError.error != QJsonParseError::NoError || !json.isObject()
        || !json.object().value("pages").isArray()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Not a PDF document");
        }
        return nullptr;
    }
    return std::make_unique<MockPdfEditDocument>(json.object());
}

std::unique_ptr<PdfEditDocument> MockPdfEngine::createEmpty(QString* errorMessage) const
{
    Q_UNUSED(errorMessage);
    QJsonObject root;
    root["pages"] = QJsonArray();
    root["fields"] = QJsonArray();
    return std::make_unique<MockPdfEditDocument>(root);
}

QByteArray MockPdfEngine::makeDocument(int pageCount, const QSizeF& pageSize)
{
    QJsonArray pages;
    for (int i = 0; i < pageCount; ++i) {
        pages.append(blankPage(pageSize, QString::number(i + 1)));
    }
    QJsonObject root;
    root["pages"] = pages;
    root["fields"] = QJsonArray();
    return QJsonDocument(root).toJson(QJsonDocument::Compact);
}

QByteArray MockPdfEngine::makeDocumentWithText(const QVector<QStringList>& pageWords)
{
    QJsonObject root = parse(makeDocument(pageWords.size()));
    QJsonArray pages = root.value("pages").toArray();
    for (int p = 0; p < pageWords.size(); ++p) {
        QJsonObject page = pages.at(p).toObject();
        QJsonArray items;
        for (int i = 0; i < pageWords[p].size(); ++i) {
            QJsonObject item;
            item["t"] = pageWords[p][i];
            item["x"] = 72 + 60 * i;
            item["y"] = 100;
            item["w"] = 60;
            item["h"] = 12;
            items.append(item);
        }
        page["text"] = items;
        pages[p] = page;
    }
    root["pages"] = pages;
    return QJsonDocument(root).toJson(QJsonDocument::Compact);
}

QByteArray MockPdfEngine::withField(const QByteArray& bytes, const QString& name,
                                    const QString& type, const QString& value,
                                    const QStringList& options)
{
    QJsonObject root = parse(bytes);
    QJsonArray fields = root.value("fields").toArray();
    QJsonObject field;
    field["name"] = name;
    field["type"] = type;
    field["value"] = value;
    field["page"] = 0;
    field["options"] = QJsonArray::fromStringList(options);
    fields.append(field);
    root["fields"] = fields;
    return QJsonDocument(root).toJson(QJsonDocument::Compact);
}

QByteArray MockPdfEngine::withPageProperty(const QByteArray& bytes, int pageIndex,
                                           const QString& key, const QJsonValue& value)
{
    QJsonObject root = parse(bytes);
    QJsonArray pages = root.value("pages").toArray();
    QJsonObject page = pages.at(pageIndex).toObject();
    page[key] = value;
    pages[pageIndex] = page;
    root["pages"] = pages;
    return QJsonDocument(root).toJson(QJsonDocument::Compact);
}

QJsonObject MockPdfEngine::parse(const QByteArray& bytes)
{
    return QJsonDocument::fromJson(bytes).object();
}

QJsonArray MockPdfEngine::pageOps(const QByteArray& bytes, int pageIndex)
{
    return parse(bytes).value("pages").toArray().at(pageIndex).toObject().value("ops").toArray();
}

// ============================================================================
// MockPdfProvider
// ============================================================================

MockPdfProvider::MockPdfProvider(const QByteArray& pdfData)
    : m_pages(MockPdfEngine::parse(pdfData).value("pages").toArray())
{
}

std::unique_ptr<PdfProvider> MockPdfProvider::create(const QByteArray& pdfData)
{
    auto provider = std::make_unique<MockPdfProvider>(pdfData);
    if (!provider->isValid()) {
        return nullptr;
    }
    return provider;
}

QSizeF MockPdfProvider::pageSize(int pageIndex) const
{
    const QJsonObject page = m_pages.at(pageIndex).toObject();
    QSizeF size(page.value("w").toDouble(612), page.value("h").toDouble(792));
    const int rot = page.value("rot").toInt();
    if (rot == 90 || rot == 270) {
        size.transpose();
    }
    return size;
}

QImage MockPdfProvider::renderPageToImage(int pageIndex, qreal dpi) const
{
    if (pageIndex < 0 || pageIndex >= m_pages.size()) {
        return QImage();
    }

    const QJsonObject page = m_pages.at(pageIndex).toObject();
    const int delay = page.value("renderDelayMs").toInt();
    if (delay > 0) {
        QThread::msleep(static_cast<unsigned long>(delay));
    }
    if (page.value("renderFails").toBool()) {
        return QImage();
    }

    const QSizeF size = pageSize(pageIndex) * (dpi / 72.0);
    QImage image(size.toSize(), QImage::Format_ARGB32);
    image.fill(Qt::white);

    QPainter painter(&image);
    painter.drawText(image.rect(), Qt::AlignCenter, page.value("label").toString());
    painter.end();
    return image;
}

QVector<PdfTextBox> MockPdfProvider::textBoxes(int pageIndex) const
{
    QVector<PdfTextBox> result;
    const QJsonArray items = m_pages.at(pageIndex).toObject().value("text").toArray();
    for (const QJsonValue& value : items) {
        const QJsonObject item = value.toObject();
        PdfTextBox box;
        box.text = item.value("t").toString();
        box.boundingBox = QRectF(item.value("x").toDouble(), item.value("y").toDouble(),
                                 item.value("w").toDouble(), item.value("h").toDouble());
        result.append(box);
    }
    return result;
}
