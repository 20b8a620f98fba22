/**
 * @file components.hpp
 * @brief Ready-made subscribers for upload progress events
 *
 * EXAMPLE:
 * EventBus bus;
 * UploadLoggerComponent logger(bus);
 * UploadMetricsComponent metrics(bus);
 * auto uploader = ChunkedUploader::create(tx, endpoint, settings, &bus);
 */

#pragma once

#include "lfs/events/event_bus.hpp"
#include "lfs/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <vector>

namespace lfs::events {

/**
 * @brief Keeps handler ids and drops them when the component goes away
 *
 * Components are usually shorter-lived than the bus they listen on.
 */
class ScopedSubscriptions {
public:
    explicit ScopedSubscriptions(EventBus& bus) : bus_(bus) {}

    ScopedSubscriptions(const ScopedSubscriptions&) = delete;
    ScopedSubscriptions& operator=(const ScopedSubscriptions&) = delete;

    ~ScopedSubscriptions() {
        for (auto& release : releases_) {
            release();
        }
    }

    template<typename EventType>
    void add(std::function<void(const EventType&)> handler) {
        const size_t id = bus_.subscribe<EventType>(std::move(handler));
        releases_.push_back([this, id] { bus_.unsubscribe<EventType>(id); });
    }

private:
    EventBus& bus_;
    std::vector<std::function<void()>> releases_;
};

/**
 * @brief Logs upload progress through spdlog
 *
 * Per-chunk progress goes to debug; header, retries, failures and
 * completion go to info/warn/error.
 */
class UploadLoggerComponent {
public:
    explicit UploadLoggerComponent(EventBus& bus) : subscriptions_(bus) {
        subscriptions_.add<TransactionHeaderPostedEvent>([](const TransactionHeaderPostedEvent& e) {
            spdlog::info("[HeaderPosted] tx={} chunks={} inline_body={}",
                         e.transaction_id, e.total_chunks, e.body_included);
        });

        subscriptions_.add<ChunkUploadedEvent>([](const ChunkUploadedEvent& e) {
            spdlog::debug("[ChunkUploaded] tx={} offset={} progress={}/{} ({}%)",
                          e.transaction_id, e.chunk_offset, e.uploaded_chunks, e.total_chunks, e.pct_complete);
        });

        subscriptions_.add<UploadRetryEvent>([](const UploadRetryEvent& e) {
            spdlog::warn("[UploadRetry] tx={} {} error={} errors_so_far={} delay={}ms",
                         e.transaction_id, upload::request_label(e.phase, e.chunk_offset),
                         e.error_code, e.total_errors, e.delay.count());
        });

        subscriptions_.add<UploadFailedEvent>([](const UploadFailedEvent& e) {
            spdlog::error("[UploadFailed] tx={} {}", e.transaction_id, e.failure.describe());
        });

        subscriptions_.add<UploadCompletedEvent>([](const UploadCompletedEvent& e) {
            spdlog::info("[UploadCompleted] tx={} chunks={} errors={} duration={}ms",
                         e.transaction_id, e.total_chunks, e.total_errors, e.duration.count());
        });
    }

private:
    ScopedSubscriptions subscriptions_;
};

/**
 * @brief Counts upload outcomes across every uploader sharing the bus
 */
class UploadMetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> headers_posted{0};
        std::atomic<uint64_t> chunks_uploaded{0};
        std::atomic<uint64_t> retries{0};
        std::atomic<uint64_t> uploads_completed{0};
        std::atomic<uint64_t> uploads_failed{0};
        std::atomic<uint64_t> fatal_failures{0};
    };

    explicit UploadMetricsComponent(EventBus& bus) : subscriptions_(bus) {
        subscriptions_.add<TransactionHeaderPostedEvent>([this](const TransactionHeaderPostedEvent& e) {
            stats_.headers_posted++;
            if (e.body_included) {
                stats_.chunks_uploaded += e.total_chunks;
            }
        });

        subscriptions_.add<ChunkUploadedEvent>([this](const ChunkUploadedEvent&) {
            stats_.chunks_uploaded++;
        });

        subscriptions_.add<UploadRetryEvent>([this](const UploadRetryEvent&) {
            stats_.retries++;
        });

        subscriptions_.add<UploadFailedEvent>([this](const UploadFailedEvent& e) {
            stats_.uploads_failed++;
            if (e.failure.kind == ErrorKind::FatalProtocol) {
                stats_.fatal_failures++;
            }
        });

        subscriptions_.add<UploadCompletedEvent>([this](const UploadCompletedEvent&) {
            stats_.uploads_completed++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("Upload statistics:");
        spdlog::info("  Headers posted:    {}", stats_.headers_posted.load());
        spdlog::info("  Chunks uploaded:   {}", stats_.chunks_uploaded.load());
        spdlog::info("  Retries:           {}", stats_.retries.load());
        spdlog::info("  Uploads completed: {}", stats_.uploads_completed.load());
        spdlog::info("  Uploads failed:    {} ({} fatal)", stats_.uploads_failed.load(), stats_.fatal_failures.load());
    }

private:
    Stats stats_;
    ScopedSubscriptions subscriptions_;
};

} // namespace lfs::events
