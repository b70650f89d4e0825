/**
 * @file test_mocks.h
 * @brief Hand-written collaborators shared by the unit tests
 */

#ifndef HNS_TRANSFER_TESTS_UNIT_TEST_MOCKS_H
#define HNS_TRANSFER_TESTS_UNIT_TEST_MOCKS_H

#include <hns_transfer/remote/path_service.h>
#include <hns_transfer/sender/pacer.h>
#include <hns_transfer/sender/source_info_provider.h>
#include <hns_transfer/sender/transfer_context.h>

#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace hns_transfer::test {

/**
 * @brief Path service that records every call and returns scripted results
 */
class recording_path_service : public path_service {
public:
    struct create_call {
        operation_context ctx;
        std::string url;
        entity_type kind;
        path_http_headers headers;
        uint64_t expected_length;
    };

    struct remove_call {
        operation_context ctx;
        std::string url;
        entity_type kind;
    };

    auto create(const operation_context& ctx,
                const destination_url& url,
                entity_type kind,
                const path_http_headers& headers,
                uint64_t expected_length) -> result<void> override {
        std::lock_guard<std::mutex> lock(mutex_);
        creates_.push_back({ctx, url.to_string(), kind, headers, expected_length});
        return create_result_;
    }

    auto remove(const operation_context& ctx,
                const destination_url& url,
                entity_type kind) -> result<void> override {
        std::lock_guard<std::mutex> lock(mutex_);
        removes_.push_back({ctx, url.to_string(), kind});
        return remove_result_;
    }

    auto get_properties(const operation_context& ctx,
                        const destination_url& /*url*/) -> result<path_properties> override {
        std::lock_guard<std::mutex> lock(mutex_);
        property_contexts_.push_back(ctx);
        return properties_result_;
    }

    void fail_create(error err) {
        std::lock_guard<std::mutex> lock(mutex_);
        create_result_ = unexpected(std::move(err));
    }

    void fail_remove(error err) {
        std::lock_guard<std::mutex> lock(mutex_);
        remove_result_ = unexpected(std::move(err));
    }

    void set_properties(result<path_properties> props) {
        std::lock_guard<std::mutex> lock(mutex_);
        properties_result_ = std::move(props);
    }

    [[nodiscard]] auto creates() const -> std::vector<create_call> {
        std::lock_guard<std::mutex> lock(mutex_);
        return creates_;
    }

    [[nodiscard]] auto removes() const -> std::vector<remove_call> {
        std::lock_guard<std::mutex> lock(mutex_);
        return removes_;
    }

    [[nodiscard]] auto property_calls() const -> std::size_t {
        std::lock_guard<std::mutex> lock(mutex_);
        return property_contexts_.size();
    }

private:
    mutable std::mutex mutex_;
    result<void> create_result_;
    result<void> remove_result_;
    result<path_properties> properties_result_{path_properties{}};
    std::vector<create_call> creates_;
    std::vector<remove_call> removes_;
    std::vector<operation_context> property_contexts_;
};

/**
 * @brief Transfer context whose status is driven by the test
 */
class scripted_transfer_context : public transfer_context {
public:
    struct failure {
        std::string stage;
        error err;
    };

    struct log_line {
        log_level level;
        std::string message;
    };

    explicit scripted_transfer_context(transfer_info info) : info_(std::move(info)) {}

    auto info() const -> const transfer_info& override { return info_; }
    auto context() const -> operation_context override { return cancel_.context(); }

    auto status() const -> transfer_status override {
        std::lock_guard<std::mutex> lock(mutex_);
        return status_;
    }

    auto is_dead_inflight() const -> bool override {
        return is_dead_inflight_status(status());
    }

    void fail_active_upload(std::string_view stage, const error& err) override {
        std::lock_guard<std::mutex> lock(mutex_);
        failures_.push_back({std::string(stage), err});
        status_ = transfer_status::failed;
        cancel_.cancel();
    }

    void log(log_level level, std::string_view message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        logs_.push_back({level, std::string(message)});
    }

    void set_status(transfer_status status) {
        std::lock_guard<std::mutex> lock(mutex_);
        status_ = status;
        if (status == transfer_status::cancelled) {
            cancel_.cancel();
        }
    }

    [[nodiscard]] auto failures() const -> std::vector<failure> {
        std::lock_guard<std::mutex> lock(mutex_);
        return failures_;
    }

    [[nodiscard]] auto logs() const -> std::vector<log_line> {
        std::lock_guard<std::mutex> lock(mutex_);
        return logs_;
    }

private:
    transfer_info info_;
    cancellation_source cancel_;
    mutable std::mutex mutex_;
    transfer_status status_ = transfer_status::started;
    std::vector<failure> failures_;
    std::vector<log_line> logs_;
};

/**
 * @brief Source provider returning fixed properties
 */
class static_source_provider : public source_info_provider {
public:
    explicit static_source_provider(result<source_properties> props)
        : props_(std::move(props)) {}

    auto properties() const -> result<source_properties> override { return props_; }

private:
    result<source_properties> props_;
};

/**
 * @brief Pacer that never waits
 */
class unlimited_pacer : public pacer {
public:
    auto request(const operation_context& ctx, std::size_t /*bytes*/) -> result<void> override {
        return ctx.check();
    }

    auto bytes_per_second() const -> uint64_t override { return 0; }
};

}  // namespace hns_transfer::test

#endif  // HNS_TRANSFER_TESTS_UNIT_TEST_MOCKS_H
