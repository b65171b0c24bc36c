//
// Document-level recompression pass.
//

/**
 * @file pdf_compressor.hpp
 * @brief PdfCompressor: runs the image pipeline over one document and writes the result.
 */

#ifndef PDFSHRINK_PDF_COMPRESSOR_HPP
#define PDFSHRINK_PDF_COMPRESSOR_HPP

#include "compression_policy.hpp"
#include "event_bus.hpp"
#include "run_report.hpp"
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <mutex>
#include <thread>

class ThreadPool;

namespace pdfshrink {

/**
 * @brief Document-level switches that are not part of the image policy.
 */
struct CompressOptions {
    bool strip_metadata = false;    ///< Remove /Info and XMP metadata
    bool zopfli_streams = false;    ///< Recompress remaining Flate streams with Zopfli
    int zopfli_iterations = 15;
    bool linearize = false;         ///< Write a linearized (web optimized) file
    bool dry_run = false;           ///< Serialize to memory only
    unsigned threads = std::max(1u, std::thread::hardware_concurrency() / 2);
};

/**
 * @brief Runs Locator, Sniffer, Decoder, Recompressor and Rewriter over a document.
 *
 * Decoding and encoding run on a worker pool, one task per image. The
 * document is only touched by the calling thread, or by a worker holding
 * the document mutex. Rewrites are applied in locator order.
 *
 * Progress is published on the EventBus passed at construction, from the
 * thread that called run().
 */
class PdfCompressor {
public:
    /**
     * @throws std::invalid_argument if the policy is invalid.
     */
    PdfCompressor(CompressionPolicy policy, CompressOptions options, EventBus& bus);

    /**
     * @brief Processes one document.
     *
     * Per-image failures are recorded in the report and never abort the
     * pass. When the serialized result is not smaller than the input, the
     * input bytes are written unchanged.
     *
     * @param input Source PDF.
     * @param output Destination; may equal @p input. Ignored on a dry run.
     * @throws DocumentError if the input cannot be parsed or the output cannot be written.
     */
    RunReport run(const std::filesystem::path& input, const std::filesystem::path& output);

    /**
     * @brief Stops scheduling image work; tasks already running finish.
     *
     * Images not yet processed are reported as cancelled. Safe to call
     * from any thread, e.g. a signal watcher.
     */
    void request_stop() noexcept;

    /// @return "<dir>/<stem>_compressed.pdf"
    [[nodiscard]] static std::filesystem::path default_output_path(const std::filesystem::path& input);

    [[nodiscard]] const CompressionPolicy& policy() const noexcept { return policy_; }

private:
    CompressionPolicy policy_;
    CompressOptions options_;
    EventBus& bus_;

    std::atomic<bool> stop_requested_{false};
    std::mutex pool_mutex_;          ///< Guards active_pool_
    ThreadPool* active_pool_ = nullptr;
};

} // namespace pdfshrink

#endif // PDFSHRINK_PDF_COMPRESSOR_HPP
