//
// Document-level recompression pass.
//

#include "../include/pdf_compressor.hpp"
#include "../include/events.hpp"
#include "../include/format_sniffer.hpp"
#include "../include/image_decoder.hpp"
#include "../include/image_locator.hpp"
#include "../include/logger.hpp"
#include "../include/pdf_utils.hpp"
#include "../include/pipeline_errors.hpp"
#include "../include/recompressor.hpp"
#include "../include/resource_rewriter.hpp"
#include "../include/thread_pool.hpp"
#include <qpdf/Buffer.hh>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFWriter.hh>
#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <system_error>

namespace {

using namespace pdfshrink;

// result of one worker task
struct TaskOutcome {
    ImageStatus status = ImageStatus::DecodeFailed;
    std::string reason;
    std::optional<EncodedReplacement> replacement;
    ColorModel source_model = GrayModel{};
    std::string strategy;
    double seconds = 0.0;
};

ImageRecord make_record(const ImageResource& resource, const ImageEncoding encoding) {
    ImageRecord record;
    record.label = resource.label;
    record.page = resource.page;
    record.encoding = std::string(to_string(encoding));
    record.filters = resource.filter_string();
    record.width_before = resource.width;
    record.height_before = resource.height;
    record.width_after = resource.width;
    record.height_after = resource.height;
    record.source_color = resource.color_space.name.empty() ? "none" : resource.color_space.name;
    record.size_before = resource.raw.size();
    record.size_after = resource.raw.size();
    return record;
}

TaskOutcome process_image(const ImageResource& resource,
                          const ImageEncoding encoding,
                          const ColorPreservingDecoder& decoder,
                          const Recompressor& recompressor,
                          const double min_savings_percent,
                          const std::stop_token& st) {
    TaskOutcome outcome;
    if (st.stop_requested()) {
        outcome.status = ImageStatus::Cancelled;
        outcome.reason = "stop requested";
        return outcome;
    }

    const auto start = std::chrono::steady_clock::now();
    const auto elapsed = [&start] {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    };

    DecodeResult decoded;
    try {
        decoded = decoder.decode(resource, encoding);
    } catch (const std::exception& e) {
        outcome.status = ImageStatus::DecodeFailed;
        outcome.reason = e.what();
        outcome.seconds = elapsed();
        return outcome;
    }
    outcome.source_model = decoded.raster.source_model;
    outcome.strategy = std::string(to_string(decoded.strategy));

    EncodedReplacement replacement;
    try {
        replacement = recompressor.recompress(std::move(decoded.raster));
    } catch (const std::exception& e) {
        outcome.status = ImageStatus::EncodeFailed;
        outcome.reason = e.what();
        outcome.seconds = elapsed();
        return outcome;
    }
    outcome.seconds = elapsed();

    if (replacement.data.empty()) {
        outcome.status = ImageStatus::EncodeFailed;
        outcome.reason = "empty stream";
        return outcome;
    }

    const auto original = static_cast<double>(resource.raw.size());
    const auto candidate = static_cast<double>(replacement.data.size());
    const double limit = original * (1.0 - min_savings_percent / 100.0);
    if (replacement.data.size() >= resource.raw.size() || candidate > limit) {
        outcome.status = ImageStatus::NotSmaller;
        outcome.reason = std::to_string(resource.raw.size()) + " -> " +
                         std::to_string(replacement.data.size()) + " bytes";
        return outcome;
    }

    outcome.status = ImageStatus::Compressed;
    outcome.replacement = std::move(replacement);
    return outcome;
}

// publishes the pool to request_stop() for the lifetime of a scope
class ActivePoolScope {
public:
    ActivePoolScope(std::mutex& mutex, ThreadPool*& slot, ThreadPool& pool) : mutex_(mutex), slot_(slot) {
        std::lock_guard lock(mutex_);
        slot_ = &pool;
    }
    ~ActivePoolScope() {
        std::lock_guard lock(mutex_);
        slot_ = nullptr;
    }
    ActivePoolScope(const ActivePoolScope&) = delete;
    ActivePoolScope& operator=(const ActivePoolScope&) = delete;

private:
    std::mutex& mutex_;
    ThreadPool*& slot_;
};

// cleanup for the temporary output if writing fails halfway
void remove_quietly(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        Logger::log(LogLevel::Warning, "Failed to remove " + path.string() + ": " + ec.message(), "pdf_compressor");
    }
}

} // namespace

namespace pdfshrink {

PdfCompressor::PdfCompressor(CompressionPolicy policy, CompressOptions options, EventBus& bus)
    : policy_(std::move(policy)), options_(options), bus_(bus) {
    policy_.validate();
    if (options_.threads == 0) {
        options_.threads = 1;
    }
    if (options_.zopfli_iterations < 1) {
        throw std::invalid_argument("zopfli iterations must be at least 1");
    }
}

std::filesystem::path PdfCompressor::default_output_path(const std::filesystem::path& input) {
    auto out = input.parent_path() / (input.stem().string() + "_compressed");
    out += input.has_extension() ? input.extension() : std::filesystem::path(".pdf");
    return out;
}

void PdfCompressor::request_stop() noexcept {
    stop_requested_.store(true);
    std::lock_guard lock(pool_mutex_);
    if (active_pool_) {
        active_pool_->request_stop();
    }
}

RunReport PdfCompressor::run(const std::filesystem::path& input, const std::filesystem::path& output) {
    const auto start = std::chrono::steady_clock::now();
    Logger::log(LogLevel::Info, "Start PDF recompression: " + input.string(), "pdf_compressor");

    RunReport report;
    report.input = input;
    report.output = options_.dry_run ? std::filesystem::path{} : output;

    try {
        std::error_code ec;
        report.original_size = std::filesystem::file_size(input, ec);
        if (ec) {
            throw DocumentError("cannot read " + input.string() + ": " + ec.message());
        }

        auto tmp_path = output;
        tmp_path += ".tmp";

        QpdfLogBridge bridge;
        {
            QPDF pdf;
            open_document(pdf, bridge, input);

            std::mutex document_mutex;
            const ImageLocator locator(pdf, document_mutex);
            LocatedImages located = locator.collect();
            bus_.publish(DocumentScanCompleteEvent{input, located.images.size(), located.skipped.size()});

            const ColorPreservingDecoder decoder(policy_.strategy_order);
            const Recompressor recompressor(policy_);
            const ResourceRewriter rewriter(document_mutex);

            const size_t total = located.images.size();
            std::vector<ImageEncoding> encodings(total);
            std::vector<std::optional<TaskOutcome>> resolved(total);
            std::vector<std::future<TaskOutcome>> futures(total);

            {
                ThreadPool pool(options_.threads);
                const ActivePoolScope pool_scope(pool_mutex_, active_pool_, pool);

                for (size_t i = 0; i < total; ++i) {
                    const ImageResource& resource = located.images[i];
                    encodings[i] = FormatSniffer::classify(resource);

                    if (resource.color_key_masked) {
                        resolved[i] = TaskOutcome{ImageStatus::Unsupported, "color-key /Mask"};
                        continue;
                    }
                    if (encodings[i] == ImageEncoding::Unsupported) {
                        resolved[i] = TaskOutcome{ImageStatus::Unsupported, "filter " + resource.filter_string()};
                        continue;
                    }
                    if (stop_requested_.load()) {
                        resolved[i] = TaskOutcome{ImageStatus::Cancelled, "stop requested"};
                        continue;
                    }

                    try {
                        futures[i] = pool.enqueue(
                            [&resource, encoding = encodings[i], &decoder, &recompressor,
                             min_savings = policy_.min_savings_percent](const std::stop_token& st) {
                                return process_image(resource, encoding, decoder, recompressor, min_savings, st);
                            });
                    } catch (const std::runtime_error&) {
                        // pool stopped between the flag check and the enqueue
                        resolved[i] = TaskOutcome{ImageStatus::Cancelled, "stop requested"};
                    }
                }

                for (size_t i = 0; i < total; ++i) {
                    const ImageResource& resource = located.images[i];
                    TaskOutcome outcome;
                    if (resolved[i]) {
                        outcome = std::move(*resolved[i]);
                    } else {
                        try {
                            outcome = futures[i].get();
                        } catch (const std::future_error&) {
                            outcome = TaskOutcome{ImageStatus::Cancelled, "stop requested"};
                        }
                    }

                    ImageRecord record = make_record(resource, encodings[i]);
                    record.strategy = outcome.strategy;
                    record.seconds = outcome.seconds;

                    if (outcome.status == ImageStatus::Compressed) {
                        const EncodedReplacement& replacement = *outcome.replacement;
                        try {
                            rewriter.apply(resource, replacement, outcome.source_model);
                            record.width_after = replacement.width;
                            record.height_after = replacement.height;
                            record.size_after = replacement.data.size();
                            record.output_color = std::string(pdf_name(replacement.color_space));
                            record.quality = replacement.quality;
                        } catch (const std::exception& e) {
                            Logger::log(LogLevel::Error, resource.label + ": rewrite failed: " + e.what(),
                                        "pdf_compressor");
                            outcome.status = ImageStatus::EncodeFailed;
                            outcome.reason = std::string("rewrite failed: ") + e.what();
                        }
                    }
                    record.status = outcome.status;
                    record.reason = outcome.reason;

                    if (record.status != ImageStatus::Compressed && Logger::enabled(LogLevel::Debug)) {
                        Logger::log(LogLevel::Debug,
                                    resource.label + " left unchanged (" + std::string(to_string(record.status)) +
                                    "): " + record.reason,
                                    "pdf_compressor");
                    }

                    bus_.publish(ImageProcessedEvent{input, record, i + 1, total});
                    report.images.push_back(std::move(record));
                }
            }

            for (const auto& skipped : located.skipped) {
                ImageRecord record;
                record.label = skipped.label;
                record.page = skipped.page;
                record.status = ImageStatus::LocatorSkip;
                record.reason = skipped.reason;
                report.images.push_back(std::move(record));
            }

            if (options_.strip_metadata) {
                report.metadata_stripped = strip_metadata(pdf);
            }
            if (options_.zopfli_streams) {
                report.streams_recompressed = zopfli_recompress_streams(pdf, options_.zopfli_iterations);
            }

            try {
                QPDFWriter writer(pdf);
                if (options_.dry_run) {
                    writer.setOutputMemory();
                } else {
                    writer.setOutputFilename(tmp_path.string().c_str());
                }
                writer.setObjectStreamMode(qpdf_o_generate);
                writer.setCompressStreams(true);
                writer.setDeterministicID(true);
                writer.setLinearization(options_.linearize);
                writer.write();

                if (options_.dry_run) {
                    const std::unique_ptr<Buffer> buffer(writer.getBuffer());
                    report.new_size = buffer->getSize();
                }
            } catch (const std::exception& e) {
                if (!options_.dry_run) remove_quietly(tmp_path);
                throw DocumentError("cannot write " + output.string() + ": " + e.what());
            }
        }

        if (options_.dry_run) {
            if (report.new_size >= report.original_size) {
                report.keep_original();
            }
        } else {
            report.new_size = std::filesystem::file_size(tmp_path, ec);
            if (ec) {
                remove_quietly(tmp_path);
                throw DocumentError("cannot stat " + tmp_path.string() + ": " + ec.message());
            }

            if (report.new_size >= report.original_size) {
                Logger::log(LogLevel::Info, "Output is not smaller, keeping original bytes: " + input.string(),
                            "pdf_compressor");
                remove_quietly(tmp_path);
                report.keep_original();
                const bool same_file = std::filesystem::exists(output) &&
                                       std::filesystem::equivalent(input, output, ec);
                if (!same_file) {
                    std::filesystem::copy_file(input, output, std::filesystem::copy_options::overwrite_existing, ec);
                    if (ec) {
                        throw DocumentError("cannot write " + output.string() + ": " + ec.message());
                    }
                }
            } else {
                std::filesystem::rename(tmp_path, output, ec);
                if (ec) {
                    remove_quietly(tmp_path);
                    throw DocumentError("cannot write " + output.string() + ": " + ec.message());
                }
            }
        }
    } catch (const DocumentError& e) {
        Logger::log(LogLevel::Error, e.what(), "pdf_compressor");
        bus_.publish(DocumentErrorEvent{input, e.what()});
        throw;
    }

    const auto duration = std::chrono::steady_clock::now() - start;
    report.seconds = std::chrono::duration<double>(duration).count();

    Logger::log(LogLevel::Info,
                input.filename().string() + ": " + report.summary() + ", " +
                std::to_string(report.original_size) + " -> " + std::to_string(report.new_size) + " bytes",
                "pdf_compressor");

    bus_.publish(DocumentCompleteEvent{input, report.original_size, report.new_size,
                                       std::chrono::duration_cast<std::chrono::milliseconds>(duration)});
    return report;
}

} // namespace pdfshrink
