#include "PdfEngine.h"
#include "MuPdfEngine.h"

DocumentInfo PdfEditDocument::info() const
{
    DocumentInfo info;
    info.pageCount = pageCount();
    info.pageSizes.reserve(info.pageCount);
    info.rotations.reserve(info.pageCount);
    for (int i = 0; i < info.pageCount; ++i) {
        info.pageSizes.append(pageSize(i));
        info.rotations.append(rotation(i));
    }
    return info;
}

bool PdfEngine::inspect(const QByteArray& bytes, DocumentInfo& info, QString* errorMessage) const
{
    std::unique_ptr<PdfEditDocument> doc = load(bytes, errorMessage);
    if (!doc) {
        return false;
    }

    info = doc->info();
    if (!info.isValid()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("The document has no pages.");
        }
        return false;
    }
    return true;
}

std::unique_ptr<PdfEngine> PdfEngine::create()
{
    return std::make_unique<MuPdfEngine>();
}
