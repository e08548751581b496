#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "rangecat/core/types.hpp"

namespace rangecat::core {

    // One element of the virtual concatenation. Files are laid out back to back in
    // manifest order: logical_offset[i + 1] == logical_offset[i] + size[i].
    struct FileEntry {
        u64 size{0};
        std::string object_key;
        std::string container_id;
        u64 logical_offset{0};
        u64 data_offset{0};                     // where the content starts inside the remote object
        std::optional<std::string> nested_path; // archive member path, passed through untouched

        friend bool operator==(const FileEntry&, const FileEntry&) = default;
    };

    // Inclusive bounds into the concatenation; an empty side is unbounded.
    struct LogicalRange {
        std::optional<u64> start;
        std::optional<u64> end;

        [[nodiscard]] static LogicalRange all() noexcept { return LogicalRange{}; }
        [[nodiscard]] bool unbounded() const noexcept { return !start && !end; }

        friend bool operator==(const LogicalRange&, const LogicalRange&) = default;
    };

    // Inclusive absolute byte offsets within one remote object.
    struct FetchRange {
        std::string object_key;
        std::string container_id;
        u64 start{0};
        u64 end{0};

        [[nodiscard]] u64 length() const noexcept { return end - start + 1; }

        friend bool operator==(const FetchRange&, const FetchRange&) = default;
    };

    struct FilePlan {
        std::size_t file_index{0}; // position in the manifest
        FileEntry file;
        std::vector<FetchRange> ranges;
    };

    struct OutputChunk {
        std::vector<u8> bytes;

        [[nodiscard]] std::size_t size() const noexcept { return bytes.size(); }
        [[nodiscard]] bool empty() const noexcept { return bytes.empty(); }
    };

} // namespace rangecat::core
