#pragma once

#include <atomic>
#include <cstddef>
#include <deque>
#include <memory>
#include <vector>

#include "rangecat/core/errors.hpp"
#include "rangecat/core/models.hpp"
#include "rangecat/storage/object_client.hpp"
#include "rangecat/stream/ranged_reader.hpp"

namespace rangecat::stream {

    struct StreamOptions {
        u64 chunk_size{kDefaultChunkSize};        // FetchRange split size
        u32 sub_chunk_size{kDefaultSubChunkSize}; // OutputChunk size bound
        u32 max_in_flight{1};                     // 1 = no read-ahead
    };

    [[nodiscard]] rangecat::core::Status validate_stream_options(const StreamOptions& options) noexcept;

    // Presents a planned manifest window as one ordered, pull-driven sequence of
    // OutputChunks. Output order is always plan order (file, fetch, sub-chunk).
    //
    // With max_in_flight == 1 every fetch is read on the caller's thread inside
    // next(). With K > 1 the due fetch and up to K - 1 later fetches are read by
    // worker threads; chunks of later fetches wait until every earlier fetch has
    // been handed out.
    //
    // Failures are delivered by next() at the point they occur and are sticky.
    // cancel() stops new fetches from starting; the destructor cancels and joins.
    class MultiFileStreamAssembler {
    public:
        MultiFileStreamAssembler(rangecat::storage::ObjectClientPtr client, StreamOptions options) noexcept;
        ~MultiFileStreamAssembler();

        MultiFileStreamAssembler(const MultiFileStreamAssembler&) = delete;
        MultiFileStreamAssembler& operator=(const MultiFileStreamAssembler&) = delete;

        // Plans the window. No fetch is issued. May be called once.
        [[nodiscard]] rangecat::core::Status open(const std::vector<rangecat::core::FileEntry>& files,
            const rangecat::core::LogicalRange& range) noexcept;

        // Ok + !*done: 'out' holds the next chunk. Ok + *done: sequence finished.
        [[nodiscard]] rangecat::core::Status next(rangecat::core::OutputChunk* out, bool* done) noexcept;

        // Callable from any thread.
        void cancel() noexcept;

        [[nodiscard]] const std::vector<rangecat::core::FilePlan>& plan() const noexcept { return plan_; }
        [[nodiscard]] const StreamOptions& options() const noexcept { return options_; }
        [[nodiscard]] std::size_t fetch_count() const noexcept { return fetches_.size(); }
        [[nodiscard]] std::size_t fetches_started() const noexcept { return fetches_started_; }
        [[nodiscard]] u64 total_bytes() const noexcept { return total_bytes_; }
        [[nodiscard]] u64 bytes_emitted() const noexcept { return bytes_emitted_; }
        [[nodiscard]] bool cancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

    private:
        struct Prefetch;

        [[nodiscard]] rangecat::core::Status next_sequential(rangecat::core::OutputChunk* out, bool* done) noexcept;
        [[nodiscard]] rangecat::core::Status next_prefetched(rangecat::core::OutputChunk* out, bool* done) noexcept;
        [[nodiscard]] rangecat::core::Status launch_next() noexcept;
        [[nodiscard]] rangecat::core::Status fail(rangecat::core::Status s) noexcept;
        void stop_workers() noexcept;

        rangecat::storage::ObjectClientPtr client_;
        StreamOptions options_;

        std::vector<rangecat::core::FilePlan> plan_;
        std::vector<rangecat::core::FetchRange> fetches_; // plan flattened in output order
        u64 total_bytes_{0};

        bool opened_{false};
        bool finished_{false};
        rangecat::core::Status failure_{};
        std::atomic<bool> cancelled_{false};
        std::atomic<bool> stop_{false};

        std::size_t cursor_{0};       // next fetch to hand out
        std::size_t next_launch_{0};  // next fetch to start (prefetch mode)
        std::size_t fetches_started_{0};
        u64 bytes_emitted_{0};

        std::unique_ptr<RangedObjectReader> current_; // sequential mode
        std::deque<std::unique_ptr<Prefetch>> window_; // prefetch mode, plan order
    };

} // namespace rangecat::stream
