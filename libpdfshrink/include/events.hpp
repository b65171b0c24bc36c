//
// Events published by PdfCompressor.
//

#ifndef PDFSHRINK_EVENTS_HPP
#define PDFSHRINK_EVENTS_HPP

#include "run_report.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace pdfshrink {

/**
 * @brief Progress notifications of a document pass.
 *
 * Plain data carriers for EventBus subscribers (CLI progress, reports).
 * They are published from the thread that called PdfCompressor::run.
 */

/**
 * @brief Emitted when the document has been opened and its images located.
 */
struct DocumentScanCompleteEvent {
    std::filesystem::path path;  ///< Input document
    size_t images = 0;           ///< Images found
    size_t skipped = 0;          ///< Malformed entries
};

/**
 * @brief Emitted once per image, in locator order.
 */
struct ImageProcessedEvent {
    std::filesystem::path path;  ///< Input document
    ImageRecord record;
    size_t index = 0;            ///< 1-based position
    size_t total = 0;
};

/**
 * @brief Emitted when the output has been written (or measured, on a dry run).
 */
struct DocumentCompleteEvent {
    std::filesystem::path path;        ///< Input document
    uintmax_t original_size = 0;
    uintmax_t new_size = 0;
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Emitted when the pass is aborted.
 */
struct DocumentErrorEvent {
    std::filesystem::path path;  ///< Input document
    std::string error_message;
};

} // namespace pdfshrink

#endif // PDFSHRINK_EVENTS_HPP
