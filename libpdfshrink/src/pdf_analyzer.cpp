//
// Read-only diagnosis of a document's compression potential.
//

#include "../include/pdf_analyzer.hpp"
#include "../include/image_locator.hpp"
#include "../include/logger.hpp"
#include "../include/pdf_utils.hpp"
#include "../include/pipeline_errors.hpp"
#include <qpdf/Buffer.hh>
#include <qpdf/Pl_Buffer.hh>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <algorithm>
#include <mutex>
#include <string_view>

namespace {

bool shows_text(const std::string_view content) {
    return content.find("Tj") != std::string_view::npos ||
           content.find("TJ") != std::string_view::npos ||
           content.find("Td") != std::string_view::npos;
}

} // namespace

namespace pdfshrink {

size_t AnalysisReport::jpeg_images() const noexcept {
    return static_cast<size_t>(std::ranges::count_if(images, [](const AnalyzedImage& img) {
        return img.encoding == ImageEncoding::EmbeddedJpeg;
    }));
}

uintmax_t AnalysisReport::image_bytes() const noexcept {
    uintmax_t total = 0;
    for (const auto& img : images) total += img.stored_bytes;
    return total;
}

std::vector<std::string> AnalysisReport::recommendations() const {
    std::vector<std::string> out;
    const size_t raw_images = static_cast<size_t>(std::ranges::count_if(images, [](const AnalyzedImage& img) {
        return img.encoding == ImageEncoding::RawFlateRaster;
    }));

    if (images.empty()) {
        out.emplace_back("No images: recompression cannot help, only stream and metadata cleanup apply");
    } else if (jpeg_images() == images.size()) {
        out.emplace_back("All images are already JPEG: expect gains only from a lower quality or a smaller bound");
    } else if (raw_images > 0) {
        out.emplace_back(std::to_string(raw_images) + " losslessly stored image(s): good candidates for recompression");
    }
    if (images.size() > 0 && jpeg_images() * 10 > images.size() * 8) {
        out.emplace_back("Most images are already JPEG compressed");
    }
    if (text_heavy()) {
        out.emplace_back("Primarily text: content streams are already compact");
    }
    if (streams > 0 && filtered_streams < streams) {
        out.emplace_back(std::to_string(streams - filtered_streams) +
                         " unfiltered stream(s): re-serialization will compress them");
    }
    if (info_entries > 0 || has_xmp) {
        out.emplace_back("Metadata present: --no-meta removes it");
    }
    if (file_size < 5ull * 1024 * 1024) {
        out.emplace_back("File is already reasonably small");
    }
    return out;
}

AnalysisReport PdfAnalyzer::analyze(const std::filesystem::path& path) {
    AnalysisReport report;
    report.path = path;

    std::error_code ec;
    report.file_size = std::filesystem::file_size(path, ec);
    if (ec) {
        throw DocumentError("cannot read " + path.string() + ": " + ec.message());
    }

    QpdfLogBridge bridge;
    QPDF pdf;
    open_document(pdf, bridge, path);

    try {
        QPDFObjectHandle info = pdf.getTrailer().getKey("/Info");
        if (info.isDictionary()) {
            report.info_entries = info.getKeys().size();
        }
        report.has_xmp = pdf.getRoot().hasKey("/Metadata");

        for (auto& obj : pdf.getAllObjects()) {
            ++report.objects;
            if (obj.isStream()) {
                ++report.streams;
                QPDFObjectHandle filter = obj.getDict().getKey("/Filter");
                if (!filter.isNull()) ++report.filtered_streams;
            } else if (obj.isDictionary() && obj.getKey("/Type").isNameAndEquals("/Font")) {
                ++report.fonts;
            }
        }

        QPDFPageDocumentHelper pages(pdf);
        for (auto& page : pages.getAllPages()) {
            ++report.pages;
            try {
                Pl_Buffer buf("page contents");
                page.pipeContents(&buf);
                const std::shared_ptr<Buffer> contents = buf.getBufferSharedPointer();
                if (contents && contents->getSize() > 0 &&
                    shows_text({reinterpret_cast<const char*>(contents->getBuffer()), contents->getSize()})) {
                    ++report.text_pages;
                }
            } catch (const std::exception& e) {
                Logger::log(LogLevel::Debug,
                            "page " + std::to_string(report.pages) + " contents unreadable: " + e.what(),
                            "pdf_analyzer");
            }
        }

        std::mutex document_mutex;
        const ImageLocator locator(pdf, document_mutex);
        locator.for_each(
            [&](ImageResource&& resource) {
                AnalyzedImage img;
                img.label = resource.label;
                img.page = resource.page;
                img.width = resource.width;
                img.height = resource.height;
                img.filters = resource.filter_string();
                img.color_space = resource.color_space.name.empty() ? "none" : resource.color_space.name;
                img.encoding = FormatSniffer::classify(resource);
                img.stored_bytes = resource.raw.size();
                report.images.push_back(std::move(img));
            },
            [&](const SkippedEntry&) { ++report.skipped_images; });
    } catch (const std::exception& e) {
        throw DocumentError("cannot analyze " + path.string() + ": " + e.what());
    }

    return report;
}

} // namespace pdfshrink
