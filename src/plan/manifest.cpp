#include "rangecat/plan/manifest.hpp"

#include <charconv>
#include <new>

#include <boost/log/trivial.hpp>

#include "rangecat/archive/zip_locator.hpp"

namespace rangecat::plan {
    using rangecat::core::FileEntry;
    using rangecat::core::LogicalRange;
    using rangecat::core::Status;
    using rangecat::core::StatusCode;
    using rangecat::core::StatusDomain;

    namespace {
        constexpr std::string_view kS3Scheme = "s3://";
        constexpr std::string_view kZipS3Scheme = "zip+s3://";
        constexpr std::string_view kBytesUnit = "bytes=";

        [[nodiscard]] constexpr Status plan_status(StatusCode code, rangecat::core::u32 aux = 0) noexcept {
            return rangecat::core::make_status(StatusDomain::Plan, code, aux);
        }

        [[nodiscard]] bool starts_with(std::string_view s, std::string_view prefix) noexcept {
            return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
        }

        [[nodiscard]] bool parse_u64(std::string_view s, u64* out) noexcept {
            if (s.empty()) {
                return false;
            }
            u64 v{};
            const auto r = std::from_chars(s.data(), s.data() + s.size(), v, 10);
            if (r.ec != std::errc() || r.ptr != s.data() + s.size()) {
                return false;
            }
            *out = v;
            return true;
        }
    } // namespace

    Status parse_object_ref(std::string_view text, ObjectRef* out) noexcept {
        if (out == nullptr) {
            return plan_status(StatusCode::Invalid);
        }

        bool zip_scheme = false;
        if (starts_with(text, kZipS3Scheme)) {
            text.remove_prefix(kZipS3Scheme.size());
            zip_scheme = true;
        } else if (starts_with(text, kS3Scheme)) {
            text.remove_prefix(kS3Scheme.size());
        }

        const std::size_t slash = text.find('/');
        if (slash == std::string_view::npos || slash == 0) {
            return plan_status(StatusCode::Invalid);
        }
        const std::string_view container = text.substr(0, slash);
        std::string_view key = text.substr(slash + 1);

        std::optional<std::string_view> nested;
        const std::size_t bang = key.find('!');
        if (bang != std::string_view::npos) {
            nested = key.substr(bang + 1);
            key = key.substr(0, bang);
            if (nested->empty()) {
                return plan_status(StatusCode::Invalid);
            }
        } else if (zip_scheme) {
            return plan_status(StatusCode::Invalid);
        }
        if (key.empty()) {
            return plan_status(StatusCode::Invalid);
        }

        try {
            ObjectRef ref{};
            ref.container_id.assign(container);
            ref.object_key.assign(key);
            if (nested) {
                ref.nested_path.emplace(*nested);
            }
            *out = std::move(ref);
        } catch (const std::bad_alloc&) {
            return plan_status(StatusCode::OutOfMemory);
        }
        return rangecat::core::ok_status();
    }

    Status layout_manifest(std::vector<FileEntry>* files) noexcept {
        if (files == nullptr) {
            return plan_status(StatusCode::Invalid);
        }
        u64 offset = 0;
        for (std::size_t i = 0; i < files->size(); ++i) {
            FileEntry& f = (*files)[i];
            f.logical_offset = offset;
            if (!rangecat::core::checked_add(offset, f.size, &offset)) {
                return plan_status(StatusCode::Invalid, static_cast<rangecat::core::u32>(i));
            }
        }
        return rangecat::core::ok_status();
    }

    Status validate_manifest(const std::vector<FileEntry>& files) noexcept {
        for (std::size_t i = 0; i < files.size(); ++i) {
            u64 next = 0;
            if (!rangecat::core::checked_add(files[i].logical_offset, files[i].size, &next)) {
                return plan_status(StatusCode::Invalid, static_cast<rangecat::core::u32>(i));
            }
            if (i + 1 < files.size() && files[i + 1].logical_offset != next) {
                return plan_status(StatusCode::Invalid, static_cast<rangecat::core::u32>(i + 1));
            }
        }
        return rangecat::core::ok_status();
    }

    Status manifest_extent(const std::vector<FileEntry>& files, u64* out) noexcept {
        if (out == nullptr) {
            return plan_status(StatusCode::Invalid);
        }
        u64 total = 0;
        for (const auto& f : files) {
            if (!rangecat::core::checked_add(total, f.size, &total)) {
                return plan_status(StatusCode::Invalid);
            }
        }
        *out = total;
        return rangecat::core::ok_status();
    }

    Status parse_byte_range(std::string_view text, u64 extent, LogicalRange* out) noexcept {
        if (out == nullptr) {
            return plan_status(StatusCode::Invalid);
        }
        if (starts_with(text, kBytesUnit)) {
            text.remove_prefix(kBytesUnit.size());
        }
        const std::size_t dash = text.find('-');
        if (dash == std::string_view::npos || text.find('-', dash + 1) != std::string_view::npos) {
            return plan_status(StatusCode::Invalid);
        }
        const std::string_view first = text.substr(0, dash);
        const std::string_view last = text.substr(dash + 1);

        LogicalRange r{};
        if (first.empty()) {
            // Suffix form: the last N bytes.
            u64 n = 0;
            if (!parse_u64(last, &n) || n == 0 || extent == 0) {
                return plan_status(StatusCode::Invalid);
            }
            r.start = rangecat::core::saturating_sub(extent, n);
            r.end = extent - 1;
            *out = r;
            return rangecat::core::ok_status();
        }

        u64 a = 0;
        if (!parse_u64(first, &a)) {
            return plan_status(StatusCode::Invalid);
        }
        if (extent != 0 && a >= extent) {
            return plan_status(StatusCode::Invalid);
        }
        r.start = a;
        if (!last.empty()) {
            u64 b = 0;
            if (!parse_u64(last, &b) || b < a) {
                return plan_status(StatusCode::Invalid);
            }
            r.end = b;
        }
        *out = r;
        return rangecat::core::ok_status();
    }

    Status resolve_manifest(const rangecat::storage::ObjectClient& client, const std::vector<ObjectRef>& refs,
        std::vector<FileEntry>* out) noexcept {
        if (out == nullptr) {
            return plan_status(StatusCode::Invalid);
        }
        out->clear();

        try {
            out->reserve(refs.size());
            for (const auto& ref : refs) {
                FileEntry f{};
                f.container_id = ref.container_id;
                f.object_key = ref.object_key;
                f.nested_path = ref.nested_path;

                Status s{};
                if (ref.nested_path) {
                    rangecat::archive::ZipEntryLocation loc{};
                    s = rangecat::archive::zip_locate_entry(client, ref.container_id, ref.object_key,
                        *ref.nested_path, &loc);
                    f.size = loc.size;
                    f.data_offset = loc.data_offset;
                } else {
                    s = client.object_size(ref.container_id, ref.object_key, &f.size);
                }
                if (!rangecat::core::is_ok(s)) {
                    BOOST_LOG_TRIVIAL(error) << "cannot resolve " << ref.container_id << "/" << ref.object_key
                                             << (ref.nested_path ? "!" + *ref.nested_path : std::string())
                                             << ": " << rangecat::core::status_code_name(s.code);
                    return s;
                }
                out->push_back(std::move(f));
            }
        } catch (const std::bad_alloc&) {
            return plan_status(StatusCode::OutOfMemory);
        }

        return layout_manifest(out);
    }

} // namespace rangecat::plan
