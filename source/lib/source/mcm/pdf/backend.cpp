#include <mcm/pdf/backend.hpp>

#include "png_backend.hpp"
#include "podofo_backend.hpp"

std::unique_ptr<PdfDocument> CreatePdfDocument(PdfBackend backend, const PrintLayout& layout, const Config& config)
{
    switch (backend)
    {
    case PdfBackend::PoDoFo:
        return std::make_unique<PoDoFoDocument>(layout);
    case PdfBackend::Png:
        return std::make_unique<PngDocument>(layout, config);
    default:
        return nullptr;
    }
}
