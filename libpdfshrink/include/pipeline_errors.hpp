//
// Error taxonomy of a document pass.
//

#ifndef PDFSHRINK_PIPELINE_ERRORS_HPP
#define PDFSHRINK_PIPELINE_ERRORS_HPP

#include <stdexcept>
#include <string_view>

namespace pdfshrink {

/**
 * @brief Final outcome of one image in a document pass.
 *
 * Everything except Compressed means the image stream was left
 * byte-for-byte unchanged.
 */
enum class ImageStatus {
    Compressed,   ///< Replacement written into the document
    NotSmaller,   ///< Replacement missed the savings threshold, or the document did not shrink
    LocatorSkip,  ///< Malformed resource entry
    Unsupported,  ///< Filter chain or masking that cannot be recompressed
    DecodeFailed, ///< Every decode strategy failed
    EncodeFailed, ///< Recompression produced no valid stream
    Cancelled     ///< Run interrupted before the image was scheduled
};

[[nodiscard]] constexpr std::string_view to_string(const ImageStatus status) noexcept {
    switch (status) {
        case ImageStatus::Compressed:   return "compressed";
        case ImageStatus::NotSmaller:   return "not smaller";
        case ImageStatus::LocatorSkip:  return "malformed";
        case ImageStatus::Unsupported:  return "unsupported";
        case ImageStatus::DecodeFailed: return "decode failed";
        case ImageStatus::EncodeFailed: return "encode failed";
        case ImageStatus::Cancelled:    return "cancelled";
    }
    return "";
}

/**
 * @brief The source document cannot be opened, parsed or written.
 *
 * The only error that aborts a whole document pass.
 */
class DocumentError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief No decode strategy produced a valid raster for an image.
 */
class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A raster could not be turned into a lossy stream.
 */
class EncodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace pdfshrink

#endif // PDFSHRINK_PIPELINE_ERRORS_HPP
