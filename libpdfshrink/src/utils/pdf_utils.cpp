//
// qpdf helpers: logging bridge, metadata stripping, Zopfli stream recompression.
//

#include "../../include/pdf_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/pipeline_errors.hpp"
#include <qpdf/Buffer.hh>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFExc.hh>
#include <qpdf/QPDFLogger.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <cstdlib>
#include <zopfli/zlib_container.h>
#include <zopfli/zopfli.h>

namespace pdfshrink {

int QpdfLogBridge::LoggerStreamBuf::sync() {
    const std::string s = str();
    size_t start = 0;
    while (start < s.size()) {
        size_t end = s.find('\n', start);
        if (end == std::string::npos) end = s.size();
        std::string line = s.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) {
            Logger::log(level, line, module);
        }
        start = end + 1;
    }
    str("");
    return 0;
}

QpdfLogBridge::QpdfLogBridge() = default;

QpdfLogBridge::~QpdfLogBridge() {
    info_os_.flush();
    err_os_.flush();
}

void QpdfLogBridge::attach(QPDF& pdf) {
    auto qlogger = QPDFLogger::create();
    qlogger->setOutputStreams(&info_os_, &err_os_);
    pdf.setLogger(qlogger);
}

void open_document(QPDF& pdf, QpdfLogBridge& bridge, const std::filesystem::path& path) {
    bridge.attach(pdf);
    try {
        pdf.processFile(path.string().c_str());
    } catch (const QPDFExc& e) {
        throw DocumentError("cannot parse " + path.string() + ": " + e.what());
    } catch (const std::runtime_error& e) {
        throw DocumentError("cannot open " + path.string() + ": " + e.what());
    }
}

bool strip_metadata(QPDF& pdf) {
    bool removed = false;
    QPDFObjectHandle trailer = pdf.getTrailer();
    if (trailer.isDictionary()) {
        if (trailer.hasKey("/Info")) {
            trailer.removeKey("/Info");
            removed = true;
        }
        if (trailer.hasKey("/Metadata")) {
            trailer.removeKey("/Metadata");
            removed = true;
        }
    }
    QPDFObjectHandle root = pdf.getRoot();
    if (root.isDictionary() && root.hasKey("/Metadata")) {
        root.removeKey("/Metadata");
        removed = true;
    }
    return removed;
}

bool stream_is_single_flate(QPDFObjectHandle stream) {
    if (!stream.isStream()) return false;
    QPDFObjectHandle dict = stream.getDict();
    if (!dict.isDictionary()) return false;
    QPDFObjectHandle filter = dict.getKey("/Filter");
    if (filter.isName()) return filter.getName() == "/FlateDecode";
    if (filter.isArray() && filter.getArrayNItems() == 1) {
        QPDFObjectHandle item = filter.getArrayItem(0);
        return item.isName() && item.getName() == "/FlateDecode";
    }
    return false;
}

std::vector<unsigned char> recompress_with_zopfli(const std::vector<unsigned char>& input, const int iterations) {
    ZopfliOptions opts;
    ZopfliInitOptions(&opts);
    opts.numiterations = iterations;
    opts.blocksplitting = 1;
    unsigned char* out_data = nullptr;
    size_t out_size = 0;
    ZopfliZlibCompress(&opts, input.data(), input.size(), &out_data, &out_size);
    std::vector<unsigned char> result(out_data, out_data + out_size);
    std::free(out_data);
    return result;
}

size_t zopfli_recompress_streams(QPDF& pdf, const int iterations) {
    size_t replaced = 0;
    for (auto& obj : pdf.getAllObjects()) {
        if (!obj.isStream()) continue;

        QPDFObjectHandle dict = obj.getDict();
        if (dict.hasKey("/DecodeParms") && !dict.getKey("/DecodeParms").isNull()) continue;
        if (dict.getKey("/Subtype").isNameAndEquals("/Image")) continue;
        if (!stream_is_single_flate(obj)) continue;

        std::vector<unsigned char> decoded;
        size_t stored = 0;
        try {
            const std::shared_ptr<Buffer> raw = obj.getRawStreamData();
            stored = raw->getSize();
            const std::shared_ptr<Buffer> buf = obj.getStreamData(qpdf_dl_generalized);
            decoded.assign(buf->getBuffer(), buf->getBuffer() + buf->getSize());
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Debug,
                        "Skipping stream " + obj.getObjGen().unparse(' ') + " (not decodable): " + e.what(),
                        "pdf_compressor");
            continue;
        }

        std::vector<unsigned char> recompressed = recompress_with_zopfli(decoded, iterations);
        if (recompressed.empty() || recompressed.size() >= stored) continue;

        obj.replaceStreamData(
            std::string(reinterpret_cast<const char*>(recompressed.data()), recompressed.size()),
            QPDFObjectHandle::newName("/FlateDecode"),
            QPDFObjectHandle::newNull()
        );
        ++replaced;
    }
    return replaced;
}

} // namespace pdfshrink
