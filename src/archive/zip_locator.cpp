#include "rangecat/archive/zip_locator.hpp"

#include <algorithm>
#include <new>

#include <boost/log/trivial.hpp>

#include "rangecat/stream/ranged_reader.hpp"

namespace rangecat::archive {

using namespace rangecat::core;
using rangecat::storage::ObjectClient;

namespace {

constexpr u16 kZip64Marker16 = 0xFFFF;
constexpr u32 kZip64Marker32 = 0xFFFFFFFF;

[[nodiscard]] Status archive_status(StatusCode code, u32 aux = 0) noexcept {
    return make_status(StatusDomain::Archive, code, aux);
}

[[nodiscard]] u16 get_u16_le(const u8* p) noexcept {
    return static_cast<u16>(static_cast<u16>(p[0]) | (static_cast<u16>(p[1]) << 8));
}

[[nodiscard]] u32 get_u32_le(const u8* p) noexcept {
    return (static_cast<u32>(p[0]) << 0) |
           (static_cast<u32>(p[1]) << 8) |
           (static_cast<u32>(p[2]) << 16) |
           (static_cast<u32>(p[3]) << 24);
}

[[nodiscard]] Status fetch_bytes(const ObjectClient& client, std::string_view container_id,
    std::string_view object_key, u64 start, u64 len, std::vector<u8>* out) noexcept {
    FetchRange range;
    try {
        range.container_id.assign(container_id);
        range.object_key.assign(object_key);
    } catch (const std::bad_alloc&) {
        return archive_status(StatusCode::OutOfMemory);
    }
    range.start = start;
    range.end = start + len - 1;

    Status s = rangecat::stream::fetch_range_all(client, range, rangecat::stream::kDefaultSubChunkSize, out);
    if (!is_ok(s)) {
        return s;
    }
    if (out->size() != len) {
        return archive_status(StatusCode::Corrupt);
    }
    return ok_status();
}

// Reads the EOCD and the central directory of container/key.
[[nodiscard]] Status load_directory(const ObjectClient& client, std::string_view container_id,
    std::string_view object_key, std::vector<ZipEntry>* entries, ZipEndOfCentralDirectory* eocd) noexcept {
    u64 size = 0;
    Status s = client.object_size(container_id, object_key, &size);
    if (!is_ok(s)) {
        return s;
    }
    if (size < kZipEocdBytes) {
        return archive_status(StatusCode::Corrupt);
    }

    const u64 tail_len = std::min<u64>(size, kZipEocdBytes + kZipMaxCommentBytes);
    std::vector<u8> tail;
    s = fetch_bytes(client, container_id, object_key, size - tail_len, tail_len, &tail);
    if (!is_ok(s)) {
        return s;
    }
    s = zip_parse_eocd(BufferView{tail.data(), static_cast<u32>(tail.size())}, eocd);
    if (!is_ok(s)) {
        return s;
    }

    entries->clear();
    if (eocd->entry_count == 0) {
        return ok_status();
    }
    if (eocd->cd_size < kZipCentralHeaderBytes ||
        static_cast<u64>(eocd->cd_offset) + eocd->cd_size > size) {
        return archive_status(StatusCode::Corrupt);
    }

    std::vector<u8> cd;
    s = fetch_bytes(client, container_id, object_key, eocd->cd_offset, eocd->cd_size, &cd);
    if (!is_ok(s)) {
        return s;
    }
    s = zip_parse_central_directory(BufferView{cd.data(), static_cast<u32>(cd.size())}, eocd->entry_count, entries);
    if (!is_ok(s)) {
        return s;
    }

    BOOST_LOG_TRIVIAL(debug) << "found " << entries->size() << " entries in " << container_id << "/" << object_key;
    return ok_status();
}

} // namespace

// ========================================================================
// Record parsers
// ========================================================================

Status zip_parse_eocd(BufferView tail, ZipEndOfCentralDirectory* out) noexcept {
    if (out == nullptr) {
        return archive_status(StatusCode::Invalid);
    }
    if (tail.data == nullptr || tail.len < kZipEocdBytes) {
        return archive_status(StatusCode::Corrupt);
    }

    for (u32 i = tail.len - kZipEocdBytes + 1; i-- > 0;) {
        const u8* p = tail.data + i;
        if (get_u32_le(p) != kZipEocdSignature) {
            continue;
        }
        const u16 comment_len = get_u16_le(p + 20);
        if (static_cast<u64>(i) + kZipEocdBytes + comment_len > tail.len) {
            continue;
        }

        const u16 disk = get_u16_le(p + 4);
        const u16 cd_disk = get_u16_le(p + 6);
        const u16 entries_total = get_u16_le(p + 10);
        const u32 cd_size = get_u32_le(p + 12);
        const u32 cd_offset = get_u32_le(p + 16);

        if (entries_total == kZip64Marker16 || cd_size == kZip64Marker32 || cd_offset == kZip64Marker32) {
            return archive_status(StatusCode::Unsupported);
        }
        if (disk != 0 || cd_disk != 0) {
            return archive_status(StatusCode::Unsupported); // multi-volume
        }

        ZipEndOfCentralDirectory e{};
        e.entry_count = entries_total;
        e.cd_size = cd_size;
        e.cd_offset = cd_offset;
        *out = e;
        return ok_status();
    }
    return archive_status(StatusCode::Corrupt);
}

Status zip_parse_central_directory(BufferView cd, u16 expected, std::vector<ZipEntry>* out) noexcept {
    if (out == nullptr) {
        return archive_status(StatusCode::Invalid);
    }
    out->clear();
    if (expected > 0 && cd.data == nullptr) {
        return archive_status(StatusCode::Corrupt);
    }

    try {
        out->reserve(expected);
        u64 pos = 0;
        for (u16 n = 0; n < expected; ++n) {
            if (pos + kZipCentralHeaderBytes > cd.len) {
                return archive_status(StatusCode::Corrupt);
            }
            const u8* p = cd.data + pos;
            if (get_u32_le(p) != kZipCentralSignature) {
                return archive_status(StatusCode::Corrupt);
            }

            const u16 name_len = get_u16_le(p + 28);
            const u16 extra_len = get_u16_le(p + 30);
            const u16 comment_len = get_u16_le(p + 32);
            const u64 record_len = static_cast<u64>(kZipCentralHeaderBytes) + name_len + extra_len + comment_len;
            if (pos + record_len > cd.len) {
                return archive_status(StatusCode::Corrupt);
            }

            ZipEntry e{};
            e.flags = get_u16_le(p + 8);
            e.method = get_u16_le(p + 10);
            e.crc32 = get_u32_le(p + 16);
            e.compressed_size = get_u32_le(p + 20);
            e.uncompressed_size = get_u32_le(p + 24);
            e.local_header_offset = get_u32_le(p + 42);
            if (e.compressed_size == kZip64Marker32 || e.uncompressed_size == kZip64Marker32 ||
                e.local_header_offset == kZip64Marker32) {
                return archive_status(StatusCode::Unsupported);
            }
            e.name.assign(reinterpret_cast<const char*>(p + kZipCentralHeaderBytes), name_len);

            out->push_back(std::move(e));
            pos += record_len;
        }
    } catch (const std::bad_alloc&) {
        return archive_status(StatusCode::OutOfMemory);
    }
    return ok_status();
}

Status zip_parse_local_header(BufferView header, u32* header_len) noexcept {
    if (header_len == nullptr) {
        return archive_status(StatusCode::Invalid);
    }
    if (header.data == nullptr || header.len < kZipLocalHeaderBytes) {
        return archive_status(StatusCode::Corrupt);
    }
    if (get_u32_le(header.data) != kZipLocalSignature) {
        return archive_status(StatusCode::Corrupt);
    }
    const u16 name_len = get_u16_le(header.data + 26);
    const u16 extra_len = get_u16_le(header.data + 28);
    *header_len = kZipLocalHeaderBytes + name_len + extra_len;
    return ok_status();
}

// ========================================================================
// Remote archive access
// ========================================================================

Status zip_list_entries(const ObjectClient& client, std::string_view container_id, std::string_view object_key,
    std::vector<ZipEntry>* out) noexcept {
    if (out == nullptr) {
        return archive_status(StatusCode::Invalid);
    }
    ZipEndOfCentralDirectory eocd{};
    return load_directory(client, container_id, object_key, out, &eocd);
}

Status zip_locate_entry(const ObjectClient& client, std::string_view container_id, std::string_view object_key,
    std::string_view entry_name, ZipEntryLocation* out) noexcept {
    if (out == nullptr || entry_name.empty()) {
        return archive_status(StatusCode::Invalid);
    }

    std::vector<ZipEntry> entries;
    ZipEndOfCentralDirectory eocd{};
    Status s = load_directory(client, container_id, object_key, &entries, &eocd);
    if (!is_ok(s)) {
        return s;
    }

    const auto it = std::find_if(entries.begin(), entries.end(),
        [entry_name](const ZipEntry& e) { return e.name == entry_name; });
    if (it == entries.end()) {
        return archive_status(StatusCode::NotFound);
    }
    if (it->method != kZipMethodStored) {
        BOOST_LOG_TRIVIAL(error) << "zip entry " << entry_name << " uses compression method " << it->method;
        return archive_status(StatusCode::Unsupported, it->method);
    }

    std::vector<u8> local;
    s = fetch_bytes(client, container_id, object_key, it->local_header_offset, kZipLocalHeaderBytes, &local);
    if (!is_ok(s)) {
        return s;
    }
    u32 header_len = 0;
    s = zip_parse_local_header(BufferView{local.data(), static_cast<u32>(local.size())}, &header_len);
    if (!is_ok(s)) {
        return s;
    }

    const u64 data_offset = static_cast<u64>(it->local_header_offset) + header_len;
    if (data_offset + it->uncompressed_size > eocd.cd_offset) {
        return archive_status(StatusCode::Corrupt);
    }

    ZipEntryLocation loc{};
    loc.data_offset = data_offset;
    loc.size = it->uncompressed_size;
    *out = loc;
    return ok_status();
}

} // namespace rangecat::archive
