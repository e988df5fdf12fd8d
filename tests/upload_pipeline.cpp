#include "shardrent/Errors.hpp"
#include "shardrent/erasure/ReedSolomon.hpp"
#include "shardrent/log/StructuredLogger.hpp"
#include "shardrent/upload/File.hpp"
#include "shardrent/upload/UploadPipeline.hpp"

#include "test_support.hpp"

#include <cassert>
#include <map>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace {

using shardrent::ByteBuffer;
using shardrent::test::MemoryHost;
using shardrent::upload::File;
using shardrent::upload::HostUploader;
using shardrent::upload::UploadPipeline;
using shardrent::upload::UploadState;

constexpr std::uint64_t kSmallPiece = 36;

std::vector<std::unique_ptr<HostUploader>> make_hosts(std::size_t count,
                                                      std::vector<MemoryHost*>& raw,
                                                      const std::set<std::size_t>& failing = {},
                                                      shardrent::test::Lockstep* lockstep = nullptr) {
    std::vector<std::unique_ptr<HostUploader>> hosts;
    for (std::size_t i = 0; i < count; ++i) {
        const auto fail_after = failing.count(i) != 0 ? std::optional<std::size_t>{0} : std::nullopt;
        auto host = std::make_unique<MemoryHost>("10.0.0." + std::to_string(i + 1) + ":9982", fail_after, lockstep);
        raw.push_back(host.get());
        hosts.push_back(std::move(host));
    }
    return hosts;
}

std::istringstream source_of(const ByteBuffer& bytes) {
    return std::istringstream(std::string(bytes.begin(), bytes.end()));
}

// (chunk, piece) -> number of contracts holding it
std::map<std::pair<std::uint64_t, std::uint64_t>, int> coverage(const File& file) {
    std::map<std::pair<std::uint64_t, std::uint64_t>, int> held;
    for (const auto& [address, contract] : file.contracts()) {
        assert(address == contract.address);
        for (const auto& record : contract.pieces) {
            ++held[{record.chunk_index, record.piece_index}];
        }
    }
    return held;
}

// Throws something that is not a std::exception on its first piece.
class RefusingHost final : public HostUploader {
public:
    RefusingHost(shardrent::HostAddress address, shardrent::test::Lockstep& lockstep)
        : lockstep_(lockstep) {
        contract_.address = std::move(address);
    }

    const shardrent::HostAddress& address() const noexcept override { return contract_.address; }

    void add_piece(const shardrent::upload::UploadPiece& piece) override {
        lockstep_.arrive_and_wait(piece.chunk_index);
        throw 42;
    }

    shardrent::upload::FileContract file_contract() const override { return contract_; }

private:
    shardrent::test::Lockstep& lockstep_;
    shardrent::upload::FileContract contract_;
};

void healthy_hosts_all_commit() {
    const auto bytes = shardrent::test::patterned_bytes(1000);
    File file{"healthy.bin", shardrent::erasure::make_reed_solomon(2, 3), kSmallPiece, bytes.size(), {}};
    std::vector<MemoryHost*> raw;
    const auto hosts = make_hosts(4, raw);

    UploadPipeline pipeline{file};
    assert(pipeline.state() == UploadState::Setup);
    auto source = source_of(bytes);
    const auto report = pipeline.run(source, hosts);

    assert(pipeline.state() == UploadState::Committed);
    assert(report.chunks == 14);
    assert(report.pieces_uploaded == 14 * 5);
    assert(report.failed_hosts.empty());
    assert(file.contracts().size() == 4);

    std::uint64_t stored = 0;
    for (const auto& [address, contract] : file.contracts()) {
        stored += contract.stored_bytes();
    }
    assert(file.bytes_uploaded() == stored);
    assert(file.bytes_uploaded() == 14 * 5 * kSmallPiece);
    assert(file.chunks_uploaded() == 14);
    assert(file.upload_progress() == 100.0);

    const auto held = coverage(file);
    assert(held.size() == 14 * 5);
    for (const auto& [key, count] : held) {
        assert(count == 1);
    }
    assert(file.redundancy() == 2.5);
}

void failing_host_is_dropped() {
    const auto bytes = shardrent::test::patterned_bytes(1000);
    File file{"degraded.bin", shardrent::erasure::make_reed_solomon(2, 3), kSmallPiece, bytes.size(), {}};
    // The first four pieces go to four different hosts, so the failing one
    // is guaranteed a piece.
    shardrent::test::Lockstep first_chunk{4, 1};
    std::vector<MemoryHost*> raw;
    const auto hosts = make_hosts(4, raw, {0}, &first_chunk);

    UploadPipeline pipeline{file};
    auto source = source_of(bytes);
    const auto report = pipeline.run(source, hosts);

    assert(pipeline.state() == UploadState::Committed);
    assert(file.contracts().size() == 4);
    assert(report.failed_hosts.size() == 1);
    assert(report.failed_hosts.front() == raw[0]->address());

    // The failing host saw exactly one piece and it is not retried elsewhere.
    assert(raw[0]->attempts() == 1);
    assert(file.contracts().at(raw[0]->address()).pieces.empty());
    assert(report.pieces_uploaded == 14 * 5 - 1);
    assert(file.bytes_uploaded() == (14 * 5 - 1) * kSmallPiece);

    const auto held = coverage(file);
    assert(held.size() == 14 * 5 - 1);
    for (const auto& [key, count] : held) {
        assert(count == 1);
    }
}

void foreign_exception_drops_host() {
    const auto bytes = shardrent::test::patterned_bytes(1000);
    File file{"foreign.bin", shardrent::erasure::make_reed_solomon(2, 3), kSmallPiece, bytes.size(), {}};
    // Each of the three hosts takes one of the first three pieces.
    shardrent::test::Lockstep first_chunk{3, 1};
    std::vector<MemoryHost*> raw;
    auto hosts = make_hosts(2, raw, {}, &first_chunk);
    hosts.push_back(std::make_unique<RefusingHost>("10.0.0.9:9982", first_chunk));

    UploadPipeline pipeline{file};
    auto source = source_of(bytes);
    const auto report = pipeline.run(source, hosts);

    assert(pipeline.state() == UploadState::Committed);
    assert(report.failed_hosts.size() == 1);
    assert(report.failed_hosts.front() == "10.0.0.9:9982");
    assert(report.pieces_uploaded == 14 * 5 - 1);
    assert(file.contracts().size() == 3);
}

void empty_file_commits_complete() {
    File file{"empty.bin", shardrent::erasure::make_reed_solomon(2, 3), kSmallPiece, 0, {}};
    std::vector<MemoryHost*> raw;
    const auto hosts = make_hosts(3, raw);

    UploadPipeline pipeline{file};
    std::istringstream source;
    const auto report = pipeline.run(source, hosts);

    assert(pipeline.state() == UploadState::Committed);
    assert(report.chunks == 0);
    assert(report.pieces_uploaded == 0);
    assert(file.num_chunks() == 1);
    assert(file.contracts().size() == 3);
    assert(file.upload_progress() == 100.0);
    assert(file.redundancy() == 2.5);
}

void stream_failure_aborts() {
    File file{"broken.bin", shardrent::erasure::make_reed_solomon(2, 3), kSmallPiece, 1000, {}};
    std::vector<MemoryHost*> raw;
    const auto hosts = make_hosts(3, raw);

    shardrent::test::FailingStreambuf buffer{500};
    std::istream source(&buffer);
    UploadPipeline pipeline{file};
    bool threw = false;
    try {
        (void)pipeline.run(source, hosts);
    } catch (const shardrent::IoError&) {
        threw = true;
    }
    assert(threw);
    assert(pipeline.state() == UploadState::Aborted);
    assert(file.contracts().empty());

    // Workers were drained: everything dispatched before the failure landed.
    std::size_t delivered = 0;
    for (const auto* host : raw) {
        delivered += host->file_contract().pieces.size();
    }
    assert(delivered == 6 * 5);
}

void every_host_failing_aborts() {
    const auto bytes = shardrent::test::patterned_bytes(1000);
    File file{"doomed.bin", shardrent::erasure::make_reed_solomon(2, 3), kSmallPiece, bytes.size(), {}};
    std::vector<MemoryHost*> raw;
    const auto hosts = make_hosts(3, raw, {0, 1, 2});

    UploadPipeline pipeline{file};
    auto source = source_of(bytes);
    bool threw = false;
    try {
        (void)pipeline.run(source, hosts);
    } catch (const shardrent::UploadFailedError& ex) {
        threw = true;
        assert(ex.code() == "E_UPLOAD_FAILED");
    }
    assert(threw);
    assert(pipeline.state() == UploadState::Aborted);
    assert(file.contracts().empty());
}

void no_hosts_is_rejected() {
    File file{"lonely.bin", shardrent::erasure::make_reed_solomon(2, 3), kSmallPiece, 10, {}};
    const std::vector<std::unique_ptr<HostUploader>> hosts;
    std::istringstream source("0123456789");
    UploadPipeline pipeline{file};
    bool threw = false;
    try {
        (void)pipeline.run(source, hosts);
    } catch (const shardrent::InsufficientHostsError&) {
        threw = true;
    }
    assert(threw);
    assert(source.tellg() == 0);
}

void ten_mebibytes_over_twelve_hosts() {
    const std::uint64_t piece_size = (1ull << 22) - 28;
    const auto bytes = shardrent::test::patterned_bytes(10u * 1024u * 1024u);
    File file{"large.bin", shardrent::erasure::make_reed_solomon(2, 10), piece_size, bytes.size(), {}};
    assert(file.num_chunks() == 2);

    shardrent::test::Lockstep lockstep{12};
    std::vector<MemoryHost*> raw;
    const auto hosts = make_hosts(12, raw, {}, &lockstep);

    UploadPipeline pipeline{file};
    auto source = source_of(bytes);
    const auto report = pipeline.run(source, hosts);

    assert(report.chunks == 2);
    assert(report.pieces_uploaded == 24);
    assert(file.contracts().size() == 12);
    for (const auto& [address, contract] : file.contracts()) {
        assert(contract.pieces.size() == 2);
        assert(contract.holds(0, contract.pieces[0].piece_index));
        assert(contract.pieces[0].chunk_index == 0);
        assert(contract.pieces[1].chunk_index == 1);
    }
    const auto held = coverage(file);
    assert(held.size() == 24);
}

}  // namespace

int main() {
    shardrent::log::StructuredLogger::instance().set_enabled(false);

    healthy_hosts_all_commit();
    failing_host_is_dropped();
    foreign_exception_drops_host();
    empty_file_commits_complete();
    stream_failure_aborts();
    every_host_failing_aborts();
    no_hosts_is_rejected();
    ten_mebibytes_over_twelve_hosts();
    return 0;
}
