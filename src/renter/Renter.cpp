#include "shardrent/renter/Renter.hpp"

#include "shardrent/Errors.hpp"
#include "shardrent/crypto/PieceCipher.hpp"
#include "shardrent/erasure/ReedSolomon.hpp"
#include "shardrent/log/StructuredLogger.hpp"
#include "shardrent/renter/BalanceCheck.hpp"
#include "shardrent/upload/UploadPipeline.hpp"

#include <exception>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <system_error>
#include <utility>

namespace shardrent::renter {

void validate_nickname(const std::string& nickname) {
    if (nickname.empty()) {
        throw ValidationError("nickname must not be empty");
    }
    if (nickname == "." || nickname == ".." || nickname.find_first_of("/\\") != std::string::npos ||
        nickname.find('\n') != std::string::npos) {
        throw ValidationError("nickname " + nickname + " is not a plain file name");
    }
}

Renter::Renter(Config config,
               HostDb& host_db,
               Wallet& wallet,
               HostSessionFactory& sessions,
               RenterPersister& persister)
    : config_(std::move(config)),
      host_db_(host_db),
      wallet_(wallet),
      sessions_(sessions),
      persister_(persister) {}

void Renter::load() {
    std::unique_lock lock(mutex_);
    std::map<std::string, std::shared_ptr<upload::File>> restored;
    for (const auto& nickname : persister_.load_index()) {
        std::shared_ptr<upload::File> file = persister_.load_file(nickname);
        restored.emplace(nickname, std::move(file));
    }
    files_ = std::move(restored);
    uploading_.clear();
    log::StructuredLogger::instance().info("renter.loaded", {{"files", std::to_string(files_.size())}});
}

void Renter::upload(const UploadParams& params) {
    std::ifstream source(params.filename, std::ios::binary);
    if (!source) {
        throw IoError("cannot open " + params.filename.string());
    }
    std::error_code ec;
    const auto size = std::filesystem::file_size(params.filename, ec);
    if (ec) {
        throw IoError("cannot stat " + params.filename.string() + ": " + ec.message());
    }
    upload(params, source, size);
}

void Renter::fill_defaults(UploadParams& params, std::uint64_t size) const {
    if (params.duration == 0) {
        params.duration = config_.default_duration;
    }
    if (!params.erasure_code) {
        params.erasure_code = erasure::make_reed_solomon(config_.default_data_pieces, config_.default_parity_pieces);
    }
    if (params.piece_size == 0) {
        params.piece_size = size > config_.default_piece_size ? config_.default_piece_size : config_.small_piece_size;
    }
}

std::vector<std::unique_ptr<upload::HostUploader>> Renter::connect_hosts(const UploadParams& params,
                                                                         const upload::File& file) {
    auto& logger = log::StructuredLogger::instance();
    const auto total_size = params.piece_size * params.erasure_code->num_pieces() * file.num_chunks();

    std::vector<std::unique_ptr<upload::HostUploader>> hosts;
    for (const auto& entry : host_db_.random_hosts(host_sample_size(config_, params.erasure_code->num_pieces()))) {
        try {
            hosts.push_back(sessions_.connect(entry, total_size, params.duration, file.master_key()));
        } catch (const Error& ex) {
            logger.warning("renter.host.unusable",
                           {{"host", entry.address}, {"code", ex.code()}, {"error", ex.what()}});
        }
    }
    return hosts;
}

void Renter::upload(UploadParams params, std::istream& source, std::uint64_t size) {
    auto& logger = log::StructuredLogger::instance();

    validate_nickname(params.nickname);
    if (params.filename.extension() != std::filesystem::path(params.nickname).extension()) {
        throw ValidationError("nickname and file name must have the same extension");
    }
    {
        std::shared_lock lock(mutex_);
        if (files_.count(params.nickname) != 0) {
            throw ValidationError("file with nickname " + params.nickname + " already exists");
        }
    }
    if (size > config_.max_file_size) {
        throw ValidationError("cannot upload a file larger than " + std::to_string(config_.max_file_size) + " bytes");
    }

    fill_defaults(params, size);
    check_wallet_balance(params, size, host_db_, wallet_, config_);

    auto file = std::make_shared<upload::File>(params.nickname, params.erasure_code, params.piece_size, size,
                                               crypto::PieceCipher::generate_key());

    auto hosts = connect_hosts(params, *file);
    if (hosts.size() < params.erasure_code->min_pieces()) {
        logger.warning("renter.upload.rejected",
                       {{"file", params.nickname},
                        {"hosts", std::to_string(hosts.size())},
                        {"required", std::to_string(params.erasure_code->min_pieces())}});
        throw InsufficientHostsError("only " + std::to_string(hosts.size()) + " hosts accepted a contract, " +
                                     std::to_string(params.erasure_code->min_pieces()) + " are required");
    }

    {
        std::unique_lock lock(mutex_);
        if (!files_.emplace(params.nickname, file).second) {
            throw ValidationError("file with nickname " + params.nickname + " already exists");
        }
        uploading_.insert(params.nickname);
        try {
            persister_.save_index(nicknames_locked());
        } catch (const Error&) {
            files_.erase(params.nickname);
            uploading_.erase(params.nickname);
            throw;
        }
    }
    logger.info("renter.upload.accepted",
                {{"file", params.nickname},
                 {"size", std::to_string(size)},
                 {"hosts", std::to_string(hosts.size())},
                 {"data_pieces", std::to_string(params.erasure_code->data_pieces())},
                 {"parity_pieces", std::to_string(params.erasure_code->parity_pieces())},
                 {"piece_size", std::to_string(params.piece_size)}});

    upload::UploadPipeline pipeline(*file);
    try {
        pipeline.run(source, hosts);
    } catch (const std::exception& ex) {
        {
            std::unique_lock lock(mutex_);
            files_.erase(params.nickname);
            uploading_.erase(params.nickname);
            try {
                persister_.save_index(nicknames_locked());
            } catch (const Error& index_error) {
                logger.error("renter.index.save_failed", {{"file", params.nickname}, {"error", index_error.what()}});
            }
        }
        logger.error("renter.upload.rolled_back", {{"file", params.nickname}, {"error", ex.what()}});
        std::throw_with_nested(UploadFailedError("failed to upload " + params.nickname));
    }

    std::unique_lock lock(mutex_);
    uploading_.erase(params.nickname);
    persister_.save_file(*file);
    logger.info("renter.upload.saved",
                {{"file", params.nickname}, {"hosts", std::to_string(file->contracts().size())}});
}

std::vector<std::string> Renter::nicknames_locked() const {
    std::vector<std::string> nicknames;
    nicknames.reserve(files_.size());
    for (const auto& [nickname, file] : files_) {
        nicknames.push_back(nickname);
    }
    return nicknames;
}

FileInfo Renter::describe_locked(const upload::File& file) const {
    FileInfo info;
    info.nickname = file.nickname();
    info.size = file.size();
    info.piece_size = file.piece_size();
    info.data_pieces = file.erasure_code().data_pieces();
    info.parity_pieces = file.erasure_code().parity_pieces();
    info.num_chunks = file.num_chunks();
    info.chunks_uploaded = file.chunks_uploaded();
    info.bytes_uploaded = file.bytes_uploaded();
    info.upload_progress = file.upload_progress();
    info.uploading = uploading_.count(file.nickname()) != 0;
    if (!info.uploading) {
        info.redundancy = file.redundancy();
        info.hosts = file.contracts().size();
    }
    return info;
}

std::vector<FileInfo> Renter::file_list() const {
    std::shared_lock lock(mutex_);
    std::vector<FileInfo> infos;
    infos.reserve(files_.size());
    for (const auto& [nickname, file] : files_) {
        infos.push_back(describe_locked(*file));
    }
    return infos;
}

std::optional<FileInfo> Renter::file_info(const std::string& nickname) const {
    std::shared_lock lock(mutex_);
    const auto it = files_.find(nickname);
    if (it == files_.end()) {
        return std::nullopt;
    }
    return describe_locked(*it->second);
}

void Renter::delete_file(const std::string& nickname) {
    std::unique_lock lock(mutex_);
    const auto it = files_.find(nickname);
    if (it == files_.end()) {
        throw ValidationError("no file with nickname " + nickname);
    }
    if (uploading_.count(nickname) != 0) {
        throw ValidationError("file " + nickname + " is still uploading");
    }
    files_.erase(it);
    persister_.remove_file(nickname);
    persister_.save_index(nicknames_locked());
    log::StructuredLogger::instance().info("renter.file.deleted", {{"file", nickname}});
}

void Renter::rename_file(const std::string& nickname, const std::string& new_nickname) {
    validate_nickname(new_nickname);
    std::unique_lock lock(mutex_);
    const auto it = files_.find(nickname);
    if (it == files_.end()) {
        throw ValidationError("no file with nickname " + nickname);
    }
    if (uploading_.count(nickname) != 0) {
        throw ValidationError("file " + nickname + " is still uploading");
    }
    if (files_.count(new_nickname) != 0) {
        throw ValidationError("file with nickname " + new_nickname + " already exists");
    }

    auto file = it->second;
    files_.erase(it);
    file->set_nickname(new_nickname);
    files_.emplace(new_nickname, file);

    persister_.save_file(*file);
    persister_.remove_file(nickname);
    persister_.save_index(nicknames_locked());
    log::StructuredLogger::instance().info("renter.file.renamed", {{"from", nickname}, {"to", new_nickname}});
}

}  // namespace shardrent::renter
