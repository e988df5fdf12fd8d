#include "shardrent/upload/UploadPipeline.hpp"

#include "shardrent/Errors.hpp"
#include "shardrent/log/StructuredLogger.hpp"
#include "shardrent/upload/ChunkDispatcher.hpp"
#include "shardrent/upload/UploadWorker.hpp"

#include <exception>
#include <string>
#include <system_error>
#include <thread>

namespace shardrent::upload {

std::string_view to_string(UploadState state) noexcept {
    switch (state) {
        case UploadState::Setup:
            return "setup";
        case UploadState::Dispatching:
            return "dispatching";
        case UploadState::Draining:
            return "draining";
        case UploadState::Committed:
            return "committed";
        case UploadState::Aborted:
            return "aborted";
    }
    return "setup";
}

UploadPipeline::UploadPipeline(File& file)
    : file_(file) {}

void UploadPipeline::transition(UploadState next) {
    const auto previous = state_.exchange(next, std::memory_order_acq_rel);
    log::StructuredLogger::instance().debug("upload.state",
                                            {{"file", file_.nickname()},
                                             {"from", std::string(to_string(previous))},
                                             {"to", std::string(to_string(next))}});
}

UploadReport UploadPipeline::run(std::istream& source, const std::vector<std::unique_ptr<HostUploader>>& hosts) {
    auto& logger = log::StructuredLogger::instance();
    if (hosts.empty()) {
        transition(UploadState::Aborted);
        throw InsufficientHostsError("no host sessions available to upload " + file_.nickname());
    }

    PieceChannel requests;
    ReportChannel results;

    std::vector<std::unique_ptr<UploadWorker>> workers;
    workers.reserve(hosts.size());
    for (const auto& host : hosts) {
        requests.add_receiver();
        workers.push_back(std::make_unique<UploadWorker>(*host, requests, results, file_));
    }

    std::vector<std::thread> threads;
    threads.reserve(workers.size());
    std::exception_ptr failure;

    try {
        for (auto& worker : workers) {
            threads.emplace_back([&worker] { worker->run(); });
        }
    } catch (const std::system_error& ex) {
        logger.error("upload.worker.spawn_failed",
                     {{"file", file_.nickname()},
                      {"started", std::to_string(threads.size())},
                      {"error", ex.what()}});
        failure = std::current_exception();
    }

    std::uint64_t chunks = 0;
    if (!failure) {
        transition(UploadState::Dispatching);
        try {
            chunks = ChunkDispatcher(file_, requests).run(source);
        } catch (const std::exception& ex) {
            logger.error("upload.dispatch_failed", {{"file", file_.nickname()}, {"error", ex.what()}});
            failure = std::current_exception();
        }
    }

    // Workers only stop once the request channel is closed.
    transition(UploadState::Draining);
    requests.close();

    std::vector<WorkerReport> reports;
    reports.reserve(threads.size());
    for (std::size_t i = 0; i < threads.size(); ++i) {
        if (auto report = results.receive()) {
            reports.push_back(std::move(*report));
        }
    }
    for (auto& thread : threads) {
        thread.join();
    }

    if (failure) {
        transition(UploadState::Aborted);
        std::rethrow_exception(failure);
    }

    UploadReport summary;
    summary.chunks = chunks;
    for (auto& report : reports) {
        summary.pieces_uploaded += report.pieces_uploaded;
        if (report.failure) {
            summary.failed_hosts.push_back(report.address);
        }
        if (report.contract) {
            file_.set_contract(std::move(*report.contract));
        }
    }
    transition(UploadState::Committed);

    logger.info("upload.committed",
                {{"file", file_.nickname()},
                 {"chunks", std::to_string(summary.chunks)},
                 {"pieces", std::to_string(summary.pieces_uploaded)},
                 {"hosts", std::to_string(reports.size())},
                 {"failed_hosts", std::to_string(summary.failed_hosts.size())}});
    return summary;
}

}  // namespace shardrent::upload
