#pragma once

#include "shardrent/upload/File.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace shardrent::renter {

class RenterPersister {
public:
    virtual ~RenterPersister() = default;

    // Records which nicknames the renter currently tracks.
    virtual void save_index(const std::vector<std::string>& nicknames) = 0;
    virtual void save_file(const upload::File& file) = 0;
    virtual void remove_file(const std::string& nickname) = 0;

    virtual std::vector<std::string> load_index() = 0;
    virtual std::unique_ptr<upload::File> load_file(const std::string& nickname) = 0;
};

// Stores each file record as <directory>/<nickname>.srf next to a plain text
// index with one nickname per line. Writes go through a temporary file and a
// rename. Failures throw IoError.
class DirectoryPersister final : public RenterPersister {
public:
    explicit DirectoryPersister(std::filesystem::path directory);

    void save_index(const std::vector<std::string>& nicknames) override;
    void save_file(const upload::File& file) override;
    void remove_file(const std::string& nickname) override;

    std::vector<std::string> load_index() override;
    std::unique_ptr<upload::File> load_file(const std::string& nickname) override;

    const std::filesystem::path& directory() const noexcept { return directory_; }
    std::filesystem::path file_path(const std::string& nickname) const;
    std::filesystem::path index_path() const;

private:
    std::filesystem::path directory_;

    void ensure_directory() const;
    void write_atomically(const std::filesystem::path& target, const std::string& contents) const;
};

}  // namespace shardrent::renter
