//
// qpdf helpers shared by the compressor and the analyzer.
//

#ifndef PDFSHRINK_PDF_UTILS_HPP
#define PDFSHRINK_PDF_UTILS_HPP

#include "log_sink.hpp"
#include <filesystem>
#include <memory>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

class QPDF;
class QPDFObjectHandle;

namespace pdfshrink {

/**
 * @brief Routes qpdf's warning and error output into Logger.
 *
 * Owns the stream buffers handed to a QPDFLogger; must outlive every
 * QPDF object it was attached to.
 */
class QpdfLogBridge {
public:
    QpdfLogBridge();
    ~QpdfLogBridge();

    QpdfLogBridge(const QpdfLogBridge&) = delete;
    QpdfLogBridge& operator=(const QpdfLogBridge&) = delete;

    /// Installs the bridge as @p pdf's logger.
    void attach(QPDF& pdf);

private:
    struct LoggerStreamBuf final : std::stringbuf {
        LogLevel level;
        std::string module;
        LoggerStreamBuf(LogLevel lvl, const char* mod) : level(lvl), module(mod) {}
        int sync() override;
        ~LoggerStreamBuf() override { LoggerStreamBuf::sync(); }
    };

    LoggerStreamBuf info_buf_{LogLevel::Debug, "qpdf"};
    LoggerStreamBuf err_buf_{LogLevel::Warning, "qpdf"}; ///< qpdf sends warnings here too
    std::ostream info_os_{&info_buf_};
    std::ostream err_os_{&err_buf_};
};

/**
 * @brief Opens a document with warnings routed through @p bridge.
 * @throws DocumentError if the file cannot be read or parsed.
 */
void open_document(QPDF& pdf, QpdfLogBridge& bridge, const std::filesystem::path& path);

/**
 * @brief Removes the document information dictionary and XMP metadata.
 * @return true if anything was removed.
 */
bool strip_metadata(QPDF& pdf);

/// @return true if the stream's only filter is /FlateDecode.
[[nodiscard]] bool stream_is_single_flate(QPDFObjectHandle stream);

/// Deflates with Zopfli, zlib container.
[[nodiscard]] std::vector<unsigned char> recompress_with_zopfli(const std::vector<unsigned char>& input,
                                                                int iterations);

/**
 * @brief Recompresses every parameterless single-Flate stream except images with Zopfli.
 *
 * A stream is replaced only when the new data is smaller.
 *
 * @return Number of streams replaced.
 */
size_t zopfli_recompress_streams(QPDF& pdf, int iterations);

} // namespace pdfshrink

#endif // PDFSHRINK_PDF_UTILS_HPP
