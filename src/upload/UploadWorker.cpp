#include "shardrent/upload/UploadWorker.hpp"

#include "shardrent/Errors.hpp"
#include "shardrent/log/StructuredLogger.hpp"

#include <exception>
#include <string>
#include <utility>

namespace shardrent::upload {

namespace {

struct HostFailure {
    std::string code;
    std::string message;
};

HostFailure describe_failure(const std::exception_ptr& error) {
    try {
        std::rethrow_exception(error);
    } catch (const Error& ex) {
        return {ex.code(), ex.what()};
    } catch (const std::exception& ex) {
        return {"E_HOST", ex.what()};
    } catch (...) {
        return {"E_HOST", "unknown exception"};
    }
}

}  // namespace

UploadWorker::UploadWorker(HostUploader& host,
                           PieceChannel& requests,
                           ReportChannel& results,
                           File& file)
    : host_(host),
      requests_(requests),
      results_(results),
      file_(file) {}

void UploadWorker::run() {
    auto& logger = log::StructuredLogger::instance();
    const auto& address = host_.address();
    WorkerReport report;
    report.address = address;

    logger.debug("upload.worker.start", {{"host", address}, {"file", file_.nickname()}});

    while (auto piece = requests_.receive()) {
        try {
            host_.add_piece(*piece);
        } catch (...) {
            // The host is dropped; its failure travels back in the report.
            auto failure = describe_failure(std::current_exception());
            logger.warning("upload.worker.host_failed",
                           {{"host", address},
                            {"code", failure.code},
                            {"chunk", std::to_string(piece->chunk_index)},
                            {"piece", std::to_string(piece->piece_index)},
                            {"error", failure.message}});
            report.failure = std::move(failure.message);
            break;
        }
        file_.add_bytes_uploaded(piece->data.size());
        ++report.pieces_uploaded;
    }

    // No more pieces for this host from here on.
    requests_.remove_receiver();

    try {
        report.contract = host_.file_contract();
    } catch (...) {
        auto failure = describe_failure(std::current_exception());
        logger.error("upload.worker.contract_unavailable",
                     {{"host", address}, {"code", failure.code}, {"error", failure.message}});
        if (!report.failure) {
            report.failure = std::move(failure.message);
        }
    }

    logger.debug("upload.worker.finish",
                 {{"host", address},
                  {"pieces", std::to_string(report.pieces_uploaded)},
                  {"failed", report.failure ? "true" : "false"}});

    if (!results_.send(std::move(report))) {
        logger.error("upload.worker.report_dropped", {{"host", address}});
    }
}

}  // namespace shardrent::upload
