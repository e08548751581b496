#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "rangecat/core/errors.hpp"
#include "rangecat/core/models.hpp"
#include "rangecat/core/types.hpp"
#include "rangecat/storage/object_client.hpp"

namespace rangecat::plan {
    using u64 = rangecat::core::u64;

    // "container/key", "s3://container/key" or "zip+s3://container/archive.zip!member".
    // A bare "container/archive.zip!member" also names an archive member.
    struct ObjectRef {
        std::string container_id;
        std::string object_key;
        std::optional<std::string> nested_path;

        friend bool operator==(const ObjectRef&, const ObjectRef&) = default;
    };

    [[nodiscard]] rangecat::core::Status parse_object_ref(std::string_view text, ObjectRef* out) noexcept;

    // Assigns logical_offset so the files sit back to back from 0, in order.
    [[nodiscard]] rangecat::core::Status layout_manifest(std::vector<rangecat::core::FileEntry>* files) noexcept;

    // Checks logical_offset[i + 1] == logical_offset[i] + size[i].
    // On failure aux is the index of the first offending entry.
    [[nodiscard]] rangecat::core::Status validate_manifest(const std::vector<rangecat::core::FileEntry>& files) noexcept;

    // Sum of all sizes. Invalid on overflow.
    [[nodiscard]] rangecat::core::Status manifest_extent(const std::vector<rangecat::core::FileEntry>& files,
        u64* out) noexcept;

    // Accepts "bytes=A-B", "bytes=A-", "bytes=-N" and the same forms without the
    // "bytes=" prefix. A suffix range needs a non-zero extent; extent == 0 skips
    // the upper bound check for the other forms.
    [[nodiscard]] rangecat::core::Status parse_byte_range(std::string_view text,
        u64 extent,
        rangecat::core::LogicalRange* out) noexcept;

    // Stats every plain object and locates every archive member, then lays the
    // result out with layout_manifest(). Any storage failure is returned as-is.
    [[nodiscard]] rangecat::core::Status resolve_manifest(const rangecat::storage::ObjectClient& client,
        const std::vector<ObjectRef>& refs,
        std::vector<rangecat::core::FileEntry>* out) noexcept;

} // namespace rangecat::plan
