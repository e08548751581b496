#include "rangecat/plan/range_planner.hpp"

#include <algorithm>
#include <new>

namespace rangecat::plan {
    using rangecat::core::FetchRange;
    using rangecat::core::FileEntry;
    using rangecat::core::FilePlan;
    using rangecat::core::LogicalRange;
    using rangecat::core::Status;
    using rangecat::core::StatusCode;
    using rangecat::core::StatusDomain;

    namespace {
        [[nodiscard]] constexpr Status plan_status(StatusCode code) noexcept {
            return rangecat::core::make_status(StatusDomain::Plan, code);
        }
    } // namespace

    Status plan_file_ranges(const FileEntry& file, const LogicalRange& range, u64 chunk_size,
        std::vector<FetchRange>* out) noexcept {
        if (out == nullptr || chunk_size == 0) {
            return plan_status(StatusCode::Invalid);
        }
        out->clear();

        if (file.size == 0) {
            return rangecat::core::ok_status();
        }

        u64 file_limit = 0;
        if (!rangecat::core::checked_add(file.logical_offset, file.size, &file_limit)) {
            return plan_status(StatusCode::Invalid);
        }
        const u64 file_end = file_limit - 1;

        if (range.start && file_end < *range.start) {
            return rangecat::core::ok_status();
        }
        if (range.end && file.logical_offset > *range.end) {
            return rangecat::core::ok_status();
        }

        u64 local_start = 0;
        u64 local_end = file.size - 1;
        if (range.start) {
            local_start = std::max<u64>(local_start, rangecat::core::saturating_sub(*range.start, file.logical_offset));
        }
        if (range.end) {
            local_end = std::min<u64>(local_end, rangecat::core::saturating_sub(*range.end, file.logical_offset));
        }
        if (local_end < local_start) {
            return rangecat::core::ok_status();
        }

        u64 abs_start = 0;
        u64 abs_end = 0;
        if (!rangecat::core::checked_add(local_start, file.data_offset, &abs_start) ||
            !rangecat::core::checked_add(local_end, file.data_offset, &abs_end)) {
            return plan_status(StatusCode::Invalid);
        }

        try {
            u64 chunk_start = abs_start;
            for (;;) {
                // abs_end - chunk_start cannot wrap: chunk_start <= abs_end holds here.
                const u64 chunk_end = (abs_end - chunk_start < chunk_size) ? abs_end : chunk_start + chunk_size - 1;
                out->push_back(FetchRange{file.object_key, file.container_id, chunk_start, chunk_end});
                if (chunk_end == abs_end) {
                    break;
                }
                chunk_start = chunk_end + 1;
            }
        } catch (const std::bad_alloc&) {
            out->clear();
            return plan_status(StatusCode::OutOfMemory);
        }
        return rangecat::core::ok_status();
    }

    Status plan_ranges(const std::vector<FileEntry>& files, const LogicalRange& range, u64 chunk_size,
        std::vector<FilePlan>* out) noexcept {
        if (out == nullptr || chunk_size == 0) {
            return plan_status(StatusCode::Invalid);
        }
        out->clear();

        try {
            std::vector<FetchRange> ranges;
            for (std::size_t i = 0; i < files.size(); ++i) {
                const Status s = plan_file_ranges(files[i], range, chunk_size, &ranges);
                if (!rangecat::core::is_ok(s)) {
                    out->clear();
                    return s;
                }
                if (ranges.empty()) {
                    continue;
                }
                out->push_back(FilePlan{i, files[i], std::move(ranges)});
                ranges = {};
            }
        } catch (const std::bad_alloc&) {
            out->clear();
            return plan_status(StatusCode::OutOfMemory);
        }
        return rangecat::core::ok_status();
    }

    u64 plan_total_bytes(const std::vector<FilePlan>& plan) noexcept {
        u64 total = 0;
        for (const FilePlan& fp : plan) {
            for (const FetchRange& r : fp.ranges) {
                total += r.length();
            }
        }
        return total;
    }

    std::size_t plan_fetch_count(const std::vector<FilePlan>& plan) noexcept {
        std::size_t n = 0;
        for (const FilePlan& fp : plan) {
            n += fp.ranges.size();
        }
        return n;
    }

} // namespace rangecat::plan
