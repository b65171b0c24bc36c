//
// Discovery of image XObjects in an opened document.
//

/**
 * @file image_locator.hpp
 * @brief Walks pages and nested forms and yields ImageResource values.
 */

#ifndef PDFSHRINK_IMAGE_LOCATOR_HPP
#define PDFSHRINK_IMAGE_LOCATOR_HPP

#include "image_resource.hpp"
#include <functional>
#include <mutex>
#include <string>
#include <vector>

class QPDF;

namespace pdfshrink {

/**
 * @brief An image entry the locator could not turn into a resource.
 */
struct SkippedEntry {
    std::string label;
    int page = 0;
    std::string reason;
};

struct LocatedImages {
    std::vector<ImageResource> images;
    std::vector<SkippedEntry> skipped;
};

/**
 * @brief Read-only traversal of the document's image XObjects.
 *
 * Images are visited in page order, then in resource dictionary order,
 * descending into form XObjects. An image shared by several pages or
 * forms is yielded once, at its first occurrence. Image masks are not
 * yielded.
 *
 * Must run on the thread that owns the document; every qpdf object the
 * workers need later is read here, except for the fully decoded data,
 * which ImageResource::fetch_decoded reads under the document mutex.
 */
class ImageLocator {
public:
    using ImageVisitor = std::function<void(ImageResource&&)>;
    using SkipVisitor = std::function<void(const SkippedEntry&)>;

    ImageLocator(QPDF& pdf, std::mutex& document_mutex) : pdf_(pdf), document_mutex_(document_mutex) {}

    /**
     * @brief Visits every image as soon as it is found.
     * @param on_image Receives each well-formed image.
     * @param on_skip Receives malformed entries; may be empty.
     */
    void for_each(const ImageVisitor& on_image, const SkipVisitor& on_skip = {}) const;

    /// @return Every image and every skipped entry, in traversal order.
    [[nodiscard]] LocatedImages collect() const;

private:
    QPDF& pdf_;
    std::mutex& document_mutex_;
};

/**
 * @brief Parses a /ColorSpace value.
 * @throws std::runtime_error if the declaration is malformed.
 */
[[nodiscard]] ColorSpaceDecl parse_color_space(QPDFObjectHandle color_space);

} // namespace pdfshrink

#endif // PDFSHRINK_IMAGE_LOCATOR_HPP
