#pragma once

#include <memory>
#include <vector>

#include "rangecat/core/errors.hpp"
#include "rangecat/core/models.hpp"
#include "rangecat/core/types.hpp"
#include "rangecat/storage/object_client.hpp"

namespace rangecat::stream {
    using u32 = rangecat::core::u32;
    using u64 = rangecat::core::u64;

    inline constexpr u64 kDefaultChunkSize = 8ull * 1024 * 1024;
    inline constexpr u32 kDefaultSubChunkSize = 64 * 1024;

    // Drains one ranged read into buffers of exactly sub_chunk_size bytes; only
    // the last one may be shorter. At most one sub-chunk is held at a time.
    // The request is issued on the first next() call. Not restartable: after an
    // error every further next() returns the same status.
    class RangedObjectReader {
    public:
        RangedObjectReader(const rangecat::storage::ObjectClient& client,
            rangecat::core::FetchRange range,
            u32 sub_chunk_size) noexcept;

        RangedObjectReader(const RangedObjectReader&) = delete;
        RangedObjectReader& operator=(const RangedObjectReader&) = delete;

        // On Ok with *done == false, 'out' holds 1..sub_chunk_size bytes.
        // On Ok with *done == true, 'out' is empty and the response is closed.
        [[nodiscard]] rangecat::core::Status next(rangecat::core::OutputChunk* out, bool* done) noexcept;

        [[nodiscard]] const rangecat::core::FetchRange& range() const noexcept { return range_; }
        [[nodiscard]] u64 bytes_read() const noexcept { return bytes_read_; }

    private:
        [[nodiscard]] rangecat::core::Status fail(rangecat::core::Status s) noexcept;

        const rangecat::storage::ObjectClient& client_;
        rangecat::core::FetchRange range_;
        u32 sub_chunk_size_{0};
        std::unique_ptr<rangecat::storage::RangeBody> body_;
        u64 bytes_read_{0};
        bool opened_{false};
        bool eof_{false};
        bool done_{false};
        rangecat::core::Status error_{};
    };

    // Reads a whole (small) range into 'out'. Used for archive metadata.
    [[nodiscard]] rangecat::core::Status fetch_range_all(const rangecat::storage::ObjectClient& client,
        const rangecat::core::FetchRange& range,
        u32 sub_chunk_size,
        std::vector<rangecat::core::u8>* out) noexcept;

} // namespace rangecat::stream
