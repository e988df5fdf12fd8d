#include "shardrent/renter/Persister.hpp"

#include "shardrent/Errors.hpp"
#include "shardrent/renter/FileCodec.hpp"

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace shardrent::renter {

namespace {

constexpr char kIndexFileName[] = "renter.index";
constexpr char kRecordExtension[] = ".srf";

}  // namespace

DirectoryPersister::DirectoryPersister(std::filesystem::path directory)
    : directory_(std::move(directory)) {
    if (directory_.empty()) {
        directory_ = std::filesystem::current_path();
    }
}

std::filesystem::path DirectoryPersister::file_path(const std::string& nickname) const {
    return directory_ / (nickname + kRecordExtension);
}

std::filesystem::path DirectoryPersister::index_path() const {
    return directory_ / kIndexFileName;
}

void DirectoryPersister::ensure_directory() const {
    std::error_code ec;
    if (std::filesystem::exists(directory_, ec)) {
        if (!std::filesystem::is_directory(directory_, ec)) {
            throw IoError(directory_.string() + " exists and is not a directory");
        }
        return;
    }
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        throw IoError("cannot create " + directory_.string() + ": " + ec.message());
    }
}

void DirectoryPersister::write_atomically(const std::filesystem::path& target, const std::string& contents) const {
    ensure_directory();
    auto temporary = target;
    temporary += ".tmp";
    {
        std::ofstream stream(temporary, std::ios::binary | std::ios::trunc);
        if (!stream) {
            throw IoError("cannot open " + temporary.string() + " for writing");
        }
        stream.write(contents.data(), static_cast<std::streamsize>(contents.size()));
        stream.flush();
        if (!stream) {
            throw IoError("failed writing " + temporary.string());
        }
    }
    std::error_code ec;
    std::filesystem::rename(temporary, target, ec);
    if (ec) {
        std::filesystem::remove(temporary, ec);
        throw IoError("cannot move " + temporary.string() + " into place");
    }
}

void DirectoryPersister::save_index(const std::vector<std::string>& nicknames) {
    std::string contents;
    for (const auto& nickname : nicknames) {
        contents += nickname;
        contents += '\n';
    }
    write_atomically(index_path(), contents);
}

void DirectoryPersister::save_file(const upload::File& file) {
    const auto encoded = encode_file(file);
    write_atomically(file_path(file.nickname()), std::string(encoded.begin(), encoded.end()));
}

void DirectoryPersister::remove_file(const std::string& nickname) {
    std::error_code ec;
    std::filesystem::remove(file_path(nickname), ec);
    if (ec) {
        throw IoError("cannot remove record for " + nickname + ": " + ec.message());
    }
}

std::vector<std::string> DirectoryPersister::load_index() {
    std::vector<std::string> nicknames;
    std::ifstream stream(index_path());
    if (!stream) {
        return nicknames;
    }
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty()) {
            nicknames.push_back(line);
        }
    }
    if (stream.bad()) {
        throw IoError("failed reading " + index_path().string());
    }
    return nicknames;
}

std::unique_ptr<upload::File> DirectoryPersister::load_file(const std::string& nickname) {
    const auto path = file_path(nickname);
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        throw IoError("cannot open record " + path.string());
    }
    const ByteBuffer bytes((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
    if (stream.bad()) {
        throw IoError("failed reading record " + path.string());
    }
    try {
        return decode_file(bytes);
    } catch (const std::invalid_argument& ex) {
        throw IoError("record " + path.string() + " is corrupt: " + ex.what());
    }
}

}  // namespace shardrent::renter
