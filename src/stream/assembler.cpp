#include "rangecat/stream/assembler.hpp"

#include <condition_variable>
#include <mutex>
#include <new>
#include <system_error>
#include <thread>

#include <boost/log/trivial.hpp>

#include "rangecat/plan/range_planner.hpp"

namespace rangecat::stream {

using namespace rangecat::core;
using rangecat::storage::ObjectClientPtr;

namespace {

[[nodiscard]] Status stream_status(StatusCode code, u32 aux = 0) noexcept {
    return make_status(StatusDomain::Stream, code, aux);
}

} // namespace

Status validate_stream_options(const StreamOptions& options) noexcept {
    if (options.chunk_size == 0 || options.sub_chunk_size == 0 || options.max_in_flight == 0) {
        return stream_status(StatusCode::Invalid);
    }
    return ok_status();
}

// ========================================================================
// Prefetch slot
// ========================================================================

// One fetch read by a worker thread. Chunks queue up in 'ready' until the
// consumer reaches this slot; the queue never exceeds the fetch length.
struct MultiFileStreamAssembler::Prefetch {
    std::thread worker;
    std::mutex mu;
    std::condition_variable cv;
    std::deque<OutputChunk> ready;
    bool finished{false};
    Status status{};

    void run(ObjectClientPtr client, FetchRange range, u32 sub_chunk_size, const std::atomic<bool>* stop) noexcept {
        RangedObjectReader reader(*client, std::move(range), sub_chunk_size);
        Status result{};
        for (;;) {
            if (stop->load(std::memory_order_acquire)) {
                result = stream_status(StatusCode::Cancelled);
                break;
            }
            OutputChunk chunk;
            bool done = false;
            Status s = reader.next(&chunk, &done);
            if (!is_ok(s)) {
                result = s;
                break;
            }
            if (done) {
                break;
            }
            std::lock_guard<std::mutex> lock(mu);
            try {
                ready.push_back(std::move(chunk));
            } catch (const std::bad_alloc&) {
                result = stream_status(StatusCode::OutOfMemory);
                break;
            }
            cv.notify_one();
        }

        std::lock_guard<std::mutex> lock(mu);
        status = result;
        finished = true;
        cv.notify_one();
    }
};

// ========================================================================
// MultiFileStreamAssembler
// ========================================================================

MultiFileStreamAssembler::MultiFileStreamAssembler(ObjectClientPtr client, StreamOptions options) noexcept
    : client_(std::move(client)), options_(options) {}

MultiFileStreamAssembler::~MultiFileStreamAssembler() {
    stop_workers();
}

void MultiFileStreamAssembler::cancel() noexcept {
    stop_.store(true, std::memory_order_release);
    if (!cancelled_.exchange(true, std::memory_order_acq_rel)) {
        BOOST_LOG_TRIVIAL(warning) << "stream cancelled";
    }
}

void MultiFileStreamAssembler::stop_workers() noexcept {
    stop_.store(true, std::memory_order_release);
    for (auto& slot : window_) {
        if (slot->worker.joinable()) {
            slot->worker.join();
        }
    }
    window_.clear();
    current_.reset();
}

Status MultiFileStreamAssembler::fail(Status s) noexcept {
    failure_ = s;
    stop_workers();
    return s;
}

Status MultiFileStreamAssembler::open(const std::vector<FileEntry>& files, const LogicalRange& range) noexcept {
    if (opened_ || client_ == nullptr) {
        return stream_status(StatusCode::Invalid);
    }
    Status s = validate_stream_options(options_);
    if (!is_ok(s)) {
        return s;
    }

    s = rangecat::plan::plan_ranges(files, range, options_.chunk_size, &plan_);
    if (!is_ok(s)) {
        return s;
    }

    try {
        fetches_.clear();
        fetches_.reserve(rangecat::plan::plan_fetch_count(plan_));
        for (const auto& fp : plan_) {
            fetches_.insert(fetches_.end(), fp.ranges.begin(), fp.ranges.end());
        }
    } catch (const std::bad_alloc&) {
        return stream_status(StatusCode::OutOfMemory);
    }
    total_bytes_ = rangecat::plan::plan_total_bytes(plan_);
    opened_ = true;

    BOOST_LOG_TRIVIAL(info) << "planned " << plan_.size() << " of " << files.size() << " files, "
                            << fetches_.size() << " fetches, " << total_bytes_ << " bytes (chunk "
                            << options_.chunk_size << ", sub-chunk " << options_.sub_chunk_size << ", in-flight "
                            << options_.max_in_flight << ")";
    return ok_status();
}

Status MultiFileStreamAssembler::next(OutputChunk* out, bool* done) noexcept {
    if (out == nullptr || done == nullptr) {
        return stream_status(StatusCode::Invalid);
    }
    out->bytes.clear();
    *done = false;

    if (!opened_) {
        return stream_status(StatusCode::Invalid);
    }
    if (!is_ok(failure_)) {
        return failure_;
    }
    if (finished_) {
        *done = true;
        return ok_status();
    }
    if (cancelled_.load(std::memory_order_acquire)) {
        return fail(stream_status(StatusCode::Cancelled));
    }

    Status s = options_.max_in_flight == 1 ? next_sequential(out, done) : next_prefetched(out, done);
    if (is_ok(s)) {
        if (*done) {
            finished_ = true;
            BOOST_LOG_TRIVIAL(debug) << "stream finished, " << bytes_emitted_ << " bytes";
        } else {
            bytes_emitted_ += out->bytes.size();
        }
    }
    return s;
}

Status MultiFileStreamAssembler::next_sequential(OutputChunk* out, bool* done) noexcept {
    for (;;) {
        if (current_ == nullptr) {
            if (cursor_ == fetches_.size()) {
                *done = true;
                return ok_status();
            }
            if (cancelled_.load(std::memory_order_acquire)) {
                return fail(stream_status(StatusCode::Cancelled));
            }
            try {
                current_ = std::make_unique<RangedObjectReader>(*client_, fetches_[cursor_], options_.sub_chunk_size);
            } catch (const std::bad_alloc&) {
                return fail(stream_status(StatusCode::OutOfMemory));
            }
            ++fetches_started_;
            BOOST_LOG_TRIVIAL(debug) << "fetch " << cursor_ << " " << fetches_[cursor_].container_id << "/"
                                     << fetches_[cursor_].object_key << " [" << fetches_[cursor_].start << "-"
                                     << fetches_[cursor_].end << "]";
        }

        bool reader_done = false;
        Status s = current_->next(out, &reader_done);
        if (!is_ok(s)) {
            return fail(s);
        }
        if (!reader_done) {
            return ok_status();
        }
        current_.reset();
        ++cursor_;
    }
}

Status MultiFileStreamAssembler::launch_next() noexcept {
    std::unique_ptr<Prefetch> slot;
    FetchRange range;
    try {
        slot = std::make_unique<Prefetch>();
        range = fetches_[next_launch_];
    } catch (const std::bad_alloc&) {
        return stream_status(StatusCode::OutOfMemory);
    }

    Prefetch* raw = slot.get();
    try {
        window_.push_back(std::move(slot));
    } catch (const std::bad_alloc&) {
        return stream_status(StatusCode::OutOfMemory);
    }

    BOOST_LOG_TRIVIAL(debug) << "prefetch " << next_launch_ << " " << range.container_id << "/" << range.object_key
                             << " [" << range.start << "-" << range.end << "]";
    try {
        raw->worker = std::thread(&Prefetch::run, raw, client_, std::move(range), options_.sub_chunk_size, &stop_);
    } catch (const std::system_error& e) {
        window_.pop_back();
        BOOST_LOG_TRIVIAL(error) << "cannot start fetch worker: " << e.what();
        return stream_status(StatusCode::Unavailable, static_cast<u32>(e.code().value()));
    } catch (const std::bad_alloc&) {
        window_.pop_back();
        return stream_status(StatusCode::OutOfMemory);
    }
    ++next_launch_;
    ++fetches_started_;
    return ok_status();
}

Status MultiFileStreamAssembler::next_prefetched(OutputChunk* out, bool* done) noexcept {
    for (;;) {
        while (window_.size() < options_.max_in_flight && next_launch_ < fetches_.size()) {
            if (cancelled_.load(std::memory_order_acquire)) {
                return fail(stream_status(StatusCode::Cancelled));
            }
            Status s = launch_next();
            if (!is_ok(s)) {
                return fail(s);
            }
        }
        if (window_.empty()) {
            *done = true;
            return ok_status();
        }

        Prefetch& due = *window_.front();
        Status result{};
        bool have_chunk = false;
        {
            std::unique_lock<std::mutex> lock(due.mu);
            due.cv.wait(lock, [&due] { return !due.ready.empty() || due.finished; });
            if (!due.ready.empty()) {
                *out = std::move(due.ready.front());
                due.ready.pop_front();
                have_chunk = true;
            } else {
                result = due.status;
            }
        }

        if (have_chunk) {
            return ok_status();
        }
        if (!is_ok(result)) {
            if (cancelled_.load(std::memory_order_acquire)) {
                return fail(stream_status(StatusCode::Cancelled));
            }
            return fail(result);
        }

        due.worker.join();
        window_.pop_front();
        ++cursor_;
    }
}

} // namespace rangecat::stream
