//
// Content-based file type detection.
//

#ifndef PDFSHRINK_MIME_DETECTOR_HPP
#define PDFSHRINK_MIME_DETECTOR_HPP

#include <filesystem>
#include <string>

namespace pdfshrink {

    /**
     * @brief Detects file types from their content with libmagic.
     */
    class MimeDetector {
    public:
        /**
         * @brief Detect the MIME type of a file.
         *
         * @param path The filesystem path to the file.
         * @return A MIME type such as "application/pdf", or an empty
         * string if libmagic could not be initialized.
         */
        static std::string detect(const std::filesystem::path& path);

        /**
         * @brief Checks whether a file is a PDF document.
         *
         * Falls back to the "%PDF-" header when libmagic gives no answer.
         */
        static bool is_pdf(const std::filesystem::path& path);
    };

} // namespace pdfshrink

#endif // PDFSHRINK_MIME_DETECTOR_HPP
