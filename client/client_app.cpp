// ============================================================
// client_app.cpp -- meshcp client implementation
// ============================================================

#include "client_app.hpp"
#include "../common/json_codec.hpp"
#include "../common/protocol_io.hpp"
#include "../common/file_io.hpp"
#include "../common/compress.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <iostream>
#include <fstream>
#include <sstream>
#include <thread>
#include <chrono>
#include <algorithm>

// Whole-file restarts of an upload the agent rejected
static constexpr int UPLOAD_PASSES = 3;

ClientApp::ClientApp(ClientOptions opts)
    : opts_(std::move(opts))
{}

void ClientApp::stop() {
    stop_.store(true);
}

std::string ClientApp::url(const std::string& endpoint) const {
    return utils::join_url(opts_.agent, endpoint);
}

int ClientApp::run() {
    const std::string& c = opts_.command;
    if (c == "status")   return cmd_status();
    if (c == "agents")   return cmd_query("/agents");
    if (c == "files")    return cmd_query("/files");
    if (c == "tfc")      return cmd_query("/tfc");
    if (c == "dump")     return cmd_query("/dump");
    if (c == "request")  return cmd_request();
    if (c == "add")      return cmd_add();
    if (c == "upload")   return cmd_upload();
    if (c == "protocol") return cmd_protocol();
    LOG_ERROR("Unknown command: " + c);
    return 1;
}

// ---------------------------------------------------------------
// call_with_retry
// ---------------------------------------------------------------

HttpResponse ClientApp::call_with_retry(const std::string& method,
                                        const std::string& target,
                                        const std::string& body,
                                        const std::string& content_type)
{
    using clock = std::chrono::steady_clock;
    auto deadline = clock::now() +
                    std::chrono::seconds(opts_.retry_secs > 0 ? opts_.retry_secs : 1);

    int delay_ms = 500;
    const int max_delay_ms = 8000;

    for (;;) {
        std::string problem;
        try {
            HttpResponse res = http_client::request(method, target, body, content_type,
                                                    opts_.timeout_ms);
            if (res.status != 503) return res;
            problem = "agent busy";
        } catch (const HttpError& e) {
            problem = e.what();
        }

        if (stop_.load() || clock::now() >= deadline) {
            throw HttpError(method + " " + target + " gave up: " + problem);
        }
        std::cerr << "[meshcp] " << problem << ", retry in " << delay_ms / 1000.0 << "s\n";
        std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        delay_ms = std::min(delay_ms * 2, max_delay_ms);
    }
}

int ClientApp::print_response(const HttpResponse& res) const {
    if (res.content_type.find("json") != std::string::npos && !res.body.empty()) {
        try {
            std::cout << json_codec::write(json_codec::parse(res.body), "  ") << "\n";
        } catch (const std::invalid_argument&) {
            std::cout << res.body << "\n";
        }
    } else {
        std::cout << res.body;
        if (!res.body.empty() && res.body.back() != '\n') std::cout << "\n";
    }
    if (!res.ok()) {
        std::cerr << "[meshcp] agent answered " << res.status << "\n";
        return 1;
    }
    return 0;
}

// ---------------------------------------------------------------
// Commands
// ---------------------------------------------------------------

int ClientApp::cmd_status() {
    utils::QueryParams q{{"job", opts_.job}};
    return print_response(call_with_retry("GET", url("/status") + utils::build_query(q), "", ""));
}

int ClientApp::cmd_query(const std::string& endpoint) {
    utils::QueryParams q{{"dataset", opts_.dataset},
                         {"block",   opts_.block},
                         {"lfn",     opts_.lfn}};
    return print_response(call_with_retry("GET", url(endpoint) + utils::build_query(q), "", ""));
}

int ClientApp::cmd_request() {
    TransferRequest req;
    req.dataset   = opts_.dataset;
    req.block     = opts_.block;
    req.file      = opts_.lfn;
    req.src_alias = opts_.src_alias;
    req.dst_alias = opts_.dst_alias;
    if (req.src_alias.empty()) {
        LOG_ERROR("request needs --src");
        return 1;
    }
    LOG_INFO("Submitting " + req.to_string());
    return print_response(call_with_retry("POST", url("/request"),
                                          json_codec::write(json_codec::to_json(req)),
                                          "application/json"));
}

// Register entries from a JSON file (array or single object) in the agent catalog
int ClientApp::cmd_add() {
    std::ifstream f(opts_.path);
    if (!f) {
        LOG_ERROR("Cannot read " + opts_.path);
        return 1;
    }
    std::stringstream ss;
    ss << f.rdbuf();

    std::vector<CatalogEntry> entries;
    try {
        entries = json_codec::entries_from_json(json_codec::parse(ss.str()));
    } catch (const std::invalid_argument& e) {
        LOG_ERROR(opts_.path + ": " + e.what());
        return 1;
    }
    return print_response(call_with_retry("POST", url("/tfc"),
                                          json_codec::write(json_codec::to_json(entries)),
                                          "application/json"));
}

int ClientApp::cmd_upload() {
    if (opts_.lfn.empty() || opts_.dataset.empty() || opts_.block.empty()) {
        LOG_ERROR("upload needs --lfn, --dataset and --block");
        return 1;
    }
    u64 size = file_io::get_file_size(opts_.path);
    std::string hash = file_io::sha256_file(opts_.path);

    utils::QueryParams q{{"lfn",     opts_.lfn},
                         {"dataset", opts_.dataset},
                         {"block",   opts_.block},
                         {"bytes",   std::to_string(size)},
                         {"hash",    hash}};
    std::string base_url = url("/upload") + utils::build_query(q);

    LOG_INFO("Uploading " + opts_.path + " (" + utils::format_bytes(size) + ") as " + opts_.lfn);
    for (int pass = 1; pass <= UPLOAD_PASSES && !stop_.load(); ++pass) {
        if (upload_once(base_url, size, hash)) {
            LOG_INFO("Upload complete: " + opts_.lfn + " hash=" + hash);
            return 0;
        }
        LOG_WARN("Upload pass " + std::to_string(pass) + "/" + std::to_string(UPLOAD_PASSES) +
                 " rejected, restarting");
    }
    LOG_ERROR("Upload of " + opts_.path + " failed");
    return 1;
}

bool ClientApp::upload_once(const std::string& base_url, u64 size, const std::string& hash) {
    file_io::MmapReader reader(opts_.path);
    if (reader.size() != size) {
        throw std::runtime_error(opts_.path + " changed size while uploading");
    }
    bool allow_compress = compress::should_compress(opts_.path);

    u64 offset = 0;
    for (;;) {
        if (stop_.load()) return false;
        u64 len   = reader.chunk_len(offset, TRANSFER_CHUNK_SIZE);
        bool last = offset + len >= size;
        std::string frame = proto::encode_chunk(offset, reader.chunk_ptr(offset), (u32)len,
                                                allow_compress, last);

        HttpResponse res = call_with_retry("POST", base_url, frame, "application/octet-stream");
        if (res.status == 422) {
            LOG_WARN("Agent rejected chunk at offset " + std::to_string(offset) + ": " + res.body);
            return false;
        }
        if (!res.ok()) {
            throw HttpError("Upload refused: " + res.body, res.status);
        }
        offset += len;
        LOG_DEBUG("Uploaded " + utils::format_bytes(offset) + " of " + utils::format_bytes(size) +
                  " (sha256 " + hash.substr(0, 12) + ")");
        if (last) return true;
    }
}

int ClientApp::cmd_protocol() {
    if (opts_.protocol.protocol.empty()) {
        LOG_ERROR("protocol needs --protocol");
        return 1;
    }
    return print_response(call_with_retry("POST", url("/protocol"),
                                          json_codec::write(json_codec::to_json(opts_.protocol)),
                                          "application/json"));
}
