/**
 * @file datalake_upload_example.cpp
 * @brief Sender lifecycle against an in-memory data lake
 *
 * This example demonstrates:
 * - Building a datalake_sender from a local file
 * - Running prologue before scheduling chunk appends
 * - Cancelling a transfer and letting cleanup delete the partial file
 *
 * Usage: datalake_upload_example <file> [--cancel]
 */

#include <hns_transfer/sender/datalake_sender.h>
#include <hns_transfer/sender/local_file_info_provider.h>
#include <hns_transfer/sender/token_bucket_pacer.h>
#include <hns_transfer/sender/transfer_tracker.h>

#include <cstring>
#include <iostream>
#include <map>
#include <mutex>
#include <string>

using namespace hns_transfer;

namespace {

/**
 * @brief Path service keeping created paths in a map
 */
class in_memory_datalake : public path_service {
public:
    auto create(const operation_context& /*ctx*/,
                const destination_url& url,
                entity_type kind,
                const path_http_headers& headers,
                uint64_t expected_length) -> result<void> override {
        std::lock_guard<std::mutex> lock(mutex_);
        path_properties props;
        props.content_length = kind == entity_type::file ? expected_length : 0;
        props.headers = headers;
        props.resource = kind;
        paths_[url.to_string()] = props;
        return {};
    }

    auto remove(const operation_context& /*ctx*/,
                const destination_url& url,
                entity_type /*kind*/) -> result<void> override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (paths_.erase(url.to_string()) == 0) {
            return unexpected(error{error_code::object_not_found, url.to_string()});
        }
        return {};
    }

    auto get_properties(const operation_context& /*ctx*/,
                        const destination_url& url) -> result<path_properties> override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = paths_.find(url.to_string());
        if (it == paths_.end()) {
            return unexpected(error{error_code::object_not_found, url.to_string()});
        }
        return it->second;
    }

private:
    std::mutex mutex_;
    std::map<std::string, path_properties> paths_;
};

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <file> [--cancel]\n";
        return 1;
    }
    bool cancel = argc > 2 && std::strcmp(argv[2], "--cancel") == 0;

    get_logger().initialize();
    get_logger().set_level(log_level::debug);

    local_file_info_provider source(argv[1]);
    auto props = source.properties();
    if (!props) {
        std::cerr << "Error: " << props.error().message << "\n";
        return 1;
    }

    transfer_info info;
    info.transfer_id = "example-1";
    info.source = argv[1];
    info.destination = "https://example.dfs.core.windows.net/fs/uploads/" +
                       source.path().filename().string();
    info.source_size = props.value().size.value_or(0);
    info.block_size = 4 * 1024 * 1024;

    auto lake = std::make_shared<in_memory_datalake>();
    auto tracker = std::make_shared<transfer_tracker>(info);
    auto rate_limiter = std::make_shared<token_bucket_pacer>(50 * 1024 * 1024);

    auto sender = datalake_sender::create(tracker, source, lake, rate_limiter);
    if (!sender) {
        std::cerr << "Error: " << sender.error().message << "\n";
        return 1;
    }
    auto& s = *sender.value();

    std::cout << "Destination: " << s.target().to_string() << "\n";
    std::cout << "Chunks:      " << s.num_chunks() << " x " << s.chunk_size() << " bytes\n";

    auto outcome = s.prologue();
    if (outcome.error) {
        std::cerr << "Prologue failed: " << outcome.error->message << "\n";
    } else {
        std::cout << "Flush every " << s.flush_threshold().value() << " bytes\n";
    }

    auto exists = s.remote_file_exists();
    std::cout << "Created:     " << (exists && exists.value() ? "yes" : "no") << "\n";

    if (cancel) {
        tracker->cancel();
    } else if (!outcome.error) {
        tracker->mark_succeeded();
    }

    s.cleanup();

    exists = s.remote_file_exists();
    std::cout << "State:       " << to_string(s.state()) << "\n";
    std::cout << "Remains:     " << (exists && exists.value() ? "yes" : "no") << "\n";

    get_logger().shutdown();
    return 0;
}
