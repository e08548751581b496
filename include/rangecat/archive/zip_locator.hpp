#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "rangecat/core/errors.hpp"
#include "rangecat/core/types.hpp"
#include "rangecat/storage/buffer.hpp"
#include "rangecat/storage/object_client.hpp"

namespace rangecat::archive {
    using u16 = rangecat::core::u16;
    using u32 = rangecat::core::u32;
    using u64 = rangecat::core::u64;
    using BufferView = rangecat::storage::BufferView;

    // All zip structures are little-endian.
    inline constexpr u32 kZipEocdSignature = 0x06054b50;
    inline constexpr u32 kZipCentralSignature = 0x02014b50;
    inline constexpr u32 kZipLocalSignature = 0x04034b50;

    // EOCD: 0..3 sig, 4..5 disk, 6..7 cd disk, 8..9 entries on disk,
    // 10..11 entries total, 12..15 cd size, 16..19 cd offset, 20..21 comment len.
    inline constexpr u32 kZipEocdBytes = 22;
    inline constexpr u32 kZipMaxCommentBytes = 0xFFFF;
    inline constexpr u32 kZipCentralHeaderBytes = 46;
    inline constexpr u32 kZipLocalHeaderBytes = 30;

    inline constexpr u16 kZipMethodStored = 0;

    struct ZipEndOfCentralDirectory {
        u16 entry_count{0};
        u32 cd_size{0};
        u32 cd_offset{0};
    };

    struct ZipEntry {
        std::string name;
        u16 method{0};
        u16 flags{0};
        u32 crc32{0};
        u32 compressed_size{0};
        u32 uncompressed_size{0};
        u32 local_header_offset{0};

        [[nodiscard]] bool is_directory() const noexcept { return !name.empty() && name.back() == '/'; }
    };

    // Where a stored entry's bytes sit inside the archive object.
    struct ZipEntryLocation {
        u64 data_offset{0};
        u64 size{0};
    };

    // Scans 'tail' (the last bytes of the archive) backwards for the EOCD record.
    // A missing or truncated record is Corrupt. ZIP64 markers are Unsupported.
    [[nodiscard]] rangecat::core::Status zip_parse_eocd(BufferView tail, ZipEndOfCentralDirectory* out) noexcept;

    // Parses 'expected' consecutive central directory headers.
    [[nodiscard]] rangecat::core::Status zip_parse_central_directory(BufferView cd,
        u16 expected,
        std::vector<ZipEntry>* out) noexcept;

    // Returns the length of the local header including its name and extra field.
    [[nodiscard]] rangecat::core::Status zip_parse_local_header(BufferView header, u32* header_len) noexcept;

    // Lists the archive stored as container/key using ranged reads only.
    [[nodiscard]] rangecat::core::Status zip_list_entries(const rangecat::storage::ObjectClient& client,
        std::string_view container_id,
        std::string_view object_key,
        std::vector<ZipEntry>* out) noexcept;

    // Locates a stored (uncompressed) member. Compressed members are Unsupported.
    [[nodiscard]] rangecat::core::Status zip_locate_entry(const rangecat::storage::ObjectClient& client,
        std::string_view container_id,
        std::string_view object_key,
        std::string_view entry_name,
        ZipEntryLocation* out) noexcept;

} // namespace rangecat::archive
