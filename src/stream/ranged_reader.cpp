#include "rangecat/stream/ranged_reader.hpp"

#include <new>

#include <boost/log/trivial.hpp>

namespace rangecat::stream {

using namespace rangecat::core;
using rangecat::storage::BufferMut;
using rangecat::storage::ObjectClient;

namespace {

[[nodiscard]] Status stream_status(StatusCode code, u32 aux = 0) noexcept {
    return make_status(StatusDomain::Stream, code, aux);
}

} // namespace

// ========================================================================
// RangedObjectReader
// ========================================================================

RangedObjectReader::RangedObjectReader(const ObjectClient& client, FetchRange range, u32 sub_chunk_size) noexcept
    : client_(client), range_(std::move(range)), sub_chunk_size_(sub_chunk_size) {}

Status RangedObjectReader::fail(Status s) noexcept {
    error_ = s;
    body_.reset();
    return s;
}

Status RangedObjectReader::next(OutputChunk* out, bool* done) noexcept {
    if (out == nullptr || done == nullptr) {
        return stream_status(StatusCode::Invalid);
    }
    out->bytes.clear();
    *done = false;

    if (!is_ok(error_)) {
        return error_;
    }
    if (done_) {
        *done = true;
        return ok_status();
    }
    if (sub_chunk_size_ == 0 || range_.end < range_.start) {
        return fail(stream_status(StatusCode::Invalid));
    }

    if (!opened_) {
        opened_ = true;
        Status s = client_.open_range(range_, &body_);
        if (!is_ok(s)) {
            BOOST_LOG_TRIVIAL(error) << "ranged read " << range_.container_id << "/" << range_.object_key << " ["
                                     << range_.start << "-" << range_.end << "] failed: " << status_code_name(s.code)
                                     << "/" << status_domain_name(s.domain) << " aux=" << s.aux;
            return fail(s);
        }
        if (body_ == nullptr) {
            return fail(stream_status(StatusCode::Unknown));
        }
    }

    if (eof_) {
        done_ = true;
        body_.reset();
        *done = true;
        return ok_status();
    }

    try {
        out->bytes.resize(sub_chunk_size_);
    } catch (const std::bad_alloc&) {
        return fail(stream_status(StatusCode::OutOfMemory));
    }

    u32 filled = 0;
    while (filled < sub_chunk_size_) {
        u32 n = 0;
        Status s = body_->read(BufferMut{out->bytes.data() + filled, sub_chunk_size_ - filled}, &n);
        if (!is_ok(s)) {
            out->bytes.clear();
            BOOST_LOG_TRIVIAL(error) << "ranged read " << range_.container_id << "/" << range_.object_key
                                     << " broke after " << bytes_read_ + filled << " bytes: "
                                     << status_code_name(s.code) << " aux=" << s.aux;
            return fail(s);
        }
        if (n == 0) {
            eof_ = true;
            break;
        }
        filled += n;
    }

    bytes_read_ += filled;
    if (bytes_read_ > range_.length()) {
        out->bytes.clear();
        return fail(stream_status(StatusCode::Protocol));
    }
    out->bytes.resize(filled);

    if (filled == 0) {
        done_ = true;
        body_.reset();
        *done = true;
    }
    return ok_status();
}

// ========================================================================
// Whole-range helper
// ========================================================================

Status fetch_range_all(const ObjectClient& client, const FetchRange& range, u32 sub_chunk_size,
    std::vector<u8>* out) noexcept {
    if (out == nullptr) {
        return stream_status(StatusCode::Invalid);
    }
    out->clear();

    FetchRange copy;
    try {
        copy = range;
    } catch (const std::bad_alloc&) {
        return stream_status(StatusCode::OutOfMemory);
    }

    RangedObjectReader reader(client, std::move(copy), sub_chunk_size);
    OutputChunk chunk;
    for (;;) {
        bool done = false;
        Status s = reader.next(&chunk, &done);
        if (!is_ok(s)) {
            return s;
        }
        if (done) {
            return ok_status();
        }
        try {
            out->insert(out->end(), chunk.bytes.begin(), chunk.bytes.end());
        } catch (const std::bad_alloc&) {
            return stream_status(StatusCode::OutOfMemory);
        }
    }
}

} // namespace rangecat::stream
