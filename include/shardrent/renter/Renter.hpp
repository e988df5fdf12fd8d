#pragma once

#include "shardrent/Config.hpp"
#include "shardrent/Export.hpp"
#include "shardrent/renter/HostDb.hpp"
#include "shardrent/renter/HostSessionFactory.hpp"
#include "shardrent/renter/Persister.hpp"
#include "shardrent/renter/UploadParams.hpp"
#include "shardrent/renter/Wallet.hpp"
#include "shardrent/upload/File.hpp"

#include <cstdint>
#include <istream>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

namespace shardrent::renter {

struct FileInfo {
    std::string nickname;
    std::uint64_t size{0};
    std::uint64_t piece_size{0};
    std::size_t data_pieces{0};
    std::size_t parity_pieces{0};
    std::uint64_t num_chunks{0};
    std::uint64_t chunks_uploaded{0};
    std::uint64_t bytes_uploaded{0};
    double upload_progress{0.0};
    // Contract details are withheld while an upload is still running.
    double redundancy{0.0};
    std::size_t hosts{0};
    bool uploading{false};
};

// Tracks the files this client has stored on the network and drives new
// uploads through host selection, the upload pipeline and persistence.
class SHARDRENT_API Renter {
public:
    Renter(Config config,
           HostDb& host_db,
           Wallet& wallet,
           HostSessionFactory& sessions,
           RenterPersister& persister);

    // Restores the file table from the persister. Throws IoError.
    void load();

    // Opens params.filename and uploads its contents.
    void upload(const UploadParams& params);
    void upload(UploadParams params, std::istream& source, std::uint64_t size);

    std::vector<FileInfo> file_list() const;
    std::optional<FileInfo> file_info(const std::string& nickname) const;

    // Both throw ValidationError for unknown nicknames or files still uploading.
    void delete_file(const std::string& nickname);
    void rename_file(const std::string& nickname, const std::string& new_nickname);

    const Config& config() const noexcept { return config_; }

private:
    Config config_;
    HostDb& host_db_;
    Wallet& wallet_;
    HostSessionFactory& sessions_;
    RenterPersister& persister_;

    mutable std::shared_mutex mutex_;
    std::map<std::string, std::shared_ptr<upload::File>> files_;
    std::set<std::string> uploading_;

    std::vector<std::string> nicknames_locked() const;
    FileInfo describe_locked(const upload::File& file) const;
    void fill_defaults(UploadParams& params, std::uint64_t size) const;
    std::vector<std::unique_ptr<upload::HostUploader>> connect_hosts(const UploadParams& params,
                                                                     const upload::File& file);
};

// Rejects empty nicknames and ones that would escape the renter directory.
SHARDRENT_API void validate_nickname(const std::string& nickname);

}  // namespace shardrent::renter
