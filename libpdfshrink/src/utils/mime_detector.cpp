//
// Content-based file type detection.
//

#include <magic.h>
#include "../../include/mime_detector.hpp"
#include "../../include/logger.hpp"
#include <array>
#include <fstream>
#include <string_view>

std::string pdfshrink::MimeDetector::detect(const std::filesystem::path& path)
{
    const magic_t magic = magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR);
    if (!magic) return {};
    if (magic_load(magic, nullptr) != 0)
    {
        Logger::log(LogLevel::Warning, std::string("cannot load magic database: ") + magic_error(magic), "libmagic");
        magic_close(magic);
        return {};
    }
    const char* mime = magic_file(magic, path.string().c_str());
    std::string result = mime ? mime : "";
    magic_close(magic);
    return result;
}

bool pdfshrink::MimeDetector::is_pdf(const std::filesystem::path& path)
{
    const std::string mime = detect(path);
    if (!mime.empty())
    {
        return mime == "application/pdf";
    }

    // no magic database: check the header
    std::ifstream in(path, std::ios::binary);
    std::array<char, 5> header{};
    if (!in.read(header.data(), header.size()))
    {
        return false;
    }
    return std::string_view(header.data(), header.size()) == "%PDF-";
}
