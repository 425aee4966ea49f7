// ============================================================================
// PdfProvider::create - compile-time backend selection
// ============================================================================
// Poppler renders on glibc desktops. On musl, Poppler's OpenJPEG calls end up
// in MuPDF's allocators when both libraries are loaded, so MuPDF renders
// there too. PDFDESK_FORCE_MUPDF_PROVIDER (CMake PDFDESK_MUPDF_ONLY) selects
// MuPDF everywhere and drops the Poppler dependency.
// ============================================================================

#include "PdfProvider.h"

#if defined(PDFDESK_FORCE_MUPDF_PROVIDER) || (defined(__linux__) && !defined(__GLIBC__))
#include "MuPdfProvider.h"
using PlatformPdfProvider = MuPdfProvider;
#else
#include "PopplerPdfProvider.h"
using PlatformPdfProvider = PopplerPdfProvider;
#endif

#include <QDebug>

std::unique_ptr<PdfProvider> PdfProvider::create(const QByteArray& pdfData)
{
    auto provider = std::make_unique<PlatformPdfProvider>(pdfData);
    if (provider->isLocked()) {
        qWarning() << "PdfProvider: Document is password protected";
        return nullptr;
    }
    if (!provider->isValid()) {
        return nullptr;
    }
    return provider;
}
