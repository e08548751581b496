#pragma once

#include <vector>

#include "rangecat/core/errors.hpp"
#include "rangecat/core/models.hpp"
#include "rangecat/core/types.hpp"

namespace rangecat::plan {
    using u64 = rangecat::core::u64;

    // Computes the ranged reads one file needs for 'range', split into pieces of at
    // most chunk_size bytes, in increasing offset order.
    // - Files outside the window, empty files and degenerate clipped spans leave
    //   'out' empty; that is not an error.
    // - Invalid: chunk_size == 0, or offset arithmetic would overflow u64.
    // No I/O.
    [[nodiscard]] rangecat::core::Status plan_file_ranges(const rangecat::core::FileEntry& file,
        const rangecat::core::LogicalRange& range,
        u64 chunk_size,
        std::vector<rangecat::core::FetchRange>* out) noexcept;

    // Plans the whole manifest. Only contributing files appear in 'out', in
    // manifest order. Identical inputs always give an identical plan.
    [[nodiscard]] rangecat::core::Status plan_ranges(const std::vector<rangecat::core::FileEntry>& files,
        const rangecat::core::LogicalRange& range,
        u64 chunk_size,
        std::vector<rangecat::core::FilePlan>* out) noexcept;

    [[nodiscard]] u64 plan_total_bytes(const std::vector<rangecat::core::FilePlan>& plan) noexcept;
    [[nodiscard]] std::size_t plan_fetch_count(const std::vector<rangecat::core::FilePlan>& plan) noexcept;

} // namespace rangecat::plan
