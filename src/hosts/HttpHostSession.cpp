#include "shardrent/hosts/HttpHostSession.hpp"

#include "shardrent/Errors.hpp"
#include "shardrent/crypto/MerkleTree.hpp"
#include "shardrent/log/StructuredLogger.hpp"

#include <curl/curl.h>

#include <utility>

namespace shardrent::hosts {

namespace {

std::size_t collect_body(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
    auto* buffer = static_cast<std::string*>(userdata);
    buffer->append(ptr, size * nmemb);
    return size * nmemb;
}

void ensure_curl_initialized() {
    static const bool curl_ready = [] {
        return curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK;
    }();
    if (!curl_ready) {
        throw TransportError("Unable to initialize libcurl");
    }
}

std::string negotiation_body(const ContractId& id, std::uint64_t total_size, BlockHeight duration) {
    return "{\"contract_id\":\"" + contract_id_to_string(id) + "\",\"size\":" + std::to_string(total_size) +
           ",\"duration\":" + std::to_string(duration) + "}";
}

}  // namespace

HttpSessionOptions HttpSessionOptions::from_config(const Config& config) {
    HttpSessionOptions options;
    options.connect_timeout = config.http_connect_timeout;
    options.transfer_timeout = config.http_transfer_timeout;
    return options;
}

void HttpHostSession::CurlDeleter::operator()(void* handle) const noexcept {
    if (handle != nullptr) {
        curl_easy_cleanup(static_cast<CURL*>(handle));
    }
}

HttpHostSession::HttpHostSession(HostAddress address,
                                 std::uint64_t total_size,
                                 BlockHeight duration,
                                 const crypto::Key& master_key,
                                 HttpSessionOptions options)
    : address_(std::move(address)),
      options_(std::move(options)),
      cipher_(master_key) {
    ensure_curl_initialized();
    curl_.reset(curl_easy_init());
    if (!curl_) {
        throw TransportError("Unable to allocate curl handle for " + address_);
    }

    contract_.address = address_;
    contract_.duration = duration;
    crypto::PieceCipher::random_bytes(contract_.id);

    perform("POST", "/contracts", negotiation_body(contract_.id, total_size, duration), "application/json");
    log::StructuredLogger::instance().debug("host.contract.negotiated",
                                            {{"host", address_},
                                             {"contract", contract_id_to_string(contract_.id)},
                                             {"size", std::to_string(total_size)},
                                             {"duration", std::to_string(duration)}});
}

HttpHostSession::~HttpHostSession() = default;

void HttpHostSession::perform(std::string_view method,
                              const std::string& path,
                              std::string_view body,
                              std::string_view content_type) {
    auto* curl = static_cast<CURL*>(curl_.get());
    curl_easy_reset(curl);

    const std::string url = "http://" + address_ + path;
    const std::string method_copy(method);
    const std::string header = "Content-Type: " + std::string(content_type);
    std::string response;

    curl_slist* headers = curl_slist_append(nullptr, header.c_str());
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method_copy.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.data());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options_.connect_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(options_.transfer_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, collect_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);

    const CURLcode rc = curl_easy_perform(curl);
    curl_slist_free_all(headers);
    if (rc != CURLE_OK) {
        throw TransportError(method_copy + " " + url + " failed: " + curl_easy_strerror(rc));
    }

    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300) {
        std::string message = method_copy + " " + url + " returned HTTP status " + std::to_string(status);
        if (!response.empty()) {
            message += ": " + response.substr(0, 200);
        }
        throw ProtocolError(message);
    }
}

void HttpHostSession::add_piece(const upload::UploadPiece& piece) {
    const auto sealed = cipher_.seal(piece.chunk_index, piece.piece_index, piece.data);
    const auto root = crypto::MerkleTree::segment_root(sealed);

    std::uint64_t offset = 0;
    {
        std::scoped_lock lock(mutex_);
        offset = next_offset_;
    }

    const auto path = "/contracts/" + contract_id_to_string(contract_.id) +
                      "/pieces?chunk=" + std::to_string(piece.chunk_index) +
                      "&piece=" + std::to_string(piece.piece_index) +
                      "&offset=" + std::to_string(offset);
    const std::string_view body(reinterpret_cast<const char*>(sealed.data()), sealed.size());
    perform("PUT", path, body, "application/octet-stream");

    std::scoped_lock lock(mutex_);
    contract_.pieces.push_back(upload::PieceRecord{piece.chunk_index, piece.piece_index, offset, sealed.size(), root});
    next_offset_ = offset + sealed.size();
}

upload::FileContract HttpHostSession::file_contract() const {
    std::scoped_lock lock(mutex_);
    return contract_;
}

HttpSessionFactory::HttpSessionFactory(HttpSessionOptions options)
    : options_(std::move(options)) {}

std::unique_ptr<upload::HostUploader> HttpSessionFactory::connect(const renter::HostEntry& host,
                                                                  std::uint64_t total_size,
                                                                  BlockHeight duration,
                                                                  const crypto::Key& master_key) {
    return std::make_unique<HttpHostSession>(host.address, total_size, duration, master_key, options_);
}

}  // namespace shardrent::hosts
