#include "rangecat/storage/local_client.hpp"

#include <algorithm>
#include <cerrno>
#include <new>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <boost/log/trivial.hpp>

namespace rangecat::storage {

using namespace rangecat::core;

// ========================================================================
// Internal Helpers
// ========================================================================

namespace {

[[nodiscard]] Status storage_status(StatusCode code, u32 aux = 0) noexcept {
    return make_status(StatusDomain::Storage, code, aux);
}

[[nodiscard]] Status errno_status(int err) noexcept {
    switch (err) {
    case ENOENT:
    case ENOTDIR:
        return storage_status(StatusCode::NotFound, static_cast<u32>(err));
    case EACCES:
    case EPERM:
        return storage_status(StatusCode::PermissionDenied, static_cast<u32>(err));
    default:
        return storage_status(StatusCode::Io, static_cast<u32>(err));
    }
}

// A path component must not climb out of the root.
[[nodiscard]] bool safe_relative_path(std::string_view p) noexcept {
    if (p.empty() || p.front() == '/') {
        return false;
    }
    std::size_t pos = 0;
    while (pos <= p.size()) {
        const std::size_t slash = p.find('/', pos);
        const std::size_t end = slash == std::string_view::npos ? p.size() : slash;
        const std::string_view seg = p.substr(pos, end - pos);
        if (seg == "..") {
            return false;
        }
        if (slash == std::string_view::npos) {
            break;
        }
        pos = slash + 1;
    }
    return true;
}

class FileDescriptor {
public:
    explicit FileDescriptor(int fd) noexcept : fd_(fd) {}
    ~FileDescriptor() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    [[nodiscard]] int get() const noexcept { return fd_; }

    [[nodiscard]] int release() noexcept {
        const int fd = fd_;
        fd_ = -1;
        return fd;
    }

private:
    int fd_{-1};
};

class LocalRangeBody final : public RangeBody {
public:
    LocalRangeBody(int fd, u64 offset, u64 remaining) noexcept
        : fd_(fd), offset_(offset), remaining_(remaining) {}

    Status read(BufferMut out, u32* n) noexcept override {
        if (n == nullptr || (out.data == nullptr && out.len > 0)) {
            return storage_status(StatusCode::Invalid);
        }
        *n = 0;
        if (remaining_ == 0 || out.len == 0) {
            return ok_status();
        }

        const std::size_t want = static_cast<std::size_t>(std::min<u64>(out.len, remaining_));
        for (;;) {
            const ssize_t got = ::pread(fd_.get(), out.data, want, static_cast<off_t>(offset_));
            if (got < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return storage_status(StatusCode::Io, static_cast<u32>(errno));
            }
            if (got == 0) {
                // Object shrank underneath us.
                return storage_status(StatusCode::Io);
            }
            offset_ += static_cast<u64>(got);
            remaining_ -= static_cast<u64>(got);
            *n = static_cast<u32>(got);
            return ok_status();
        }
    }

private:
    FileDescriptor fd_;
    u64 offset_{0};
    u64 remaining_{0};
};

} // namespace

// ========================================================================
// LocalObjectClient
// ========================================================================

LocalObjectClient::LocalObjectClient(std::string root) noexcept : root_(std::move(root)) {}

Status LocalObjectClient::create(const std::string& root, ObjectClientPtr* out) noexcept {
    if (out == nullptr || root.empty()) {
        return make_status(StatusDomain::Config, StatusCode::Invalid);
    }

    struct stat st {};
    if (::stat(root.c_str(), &st) != 0) {
        return make_status(StatusDomain::Config, StatusCode::NotFound, static_cast<u32>(errno));
    }
    if (!S_ISDIR(st.st_mode)) {
        return make_status(StatusDomain::Config, StatusCode::Invalid, static_cast<u32>(ENOTDIR));
    }
    if (::access(root.c_str(), R_OK | X_OK) != 0) {
        return make_status(StatusDomain::Config, StatusCode::PermissionDenied, static_cast<u32>(errno));
    }

    try {
        *out = std::make_shared<LocalObjectClient>(root);
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Config, StatusCode::OutOfMemory);
    }
    BOOST_LOG_TRIVIAL(debug) << "local object store at " << root;
    return ok_status();
}

Status LocalObjectClient::object_path(std::string_view container_id, std::string_view object_key,
    std::string* out) const noexcept {
    if (container_id.find('/') != std::string_view::npos || !safe_relative_path(container_id) ||
        !safe_relative_path(object_key)) {
        return storage_status(StatusCode::PermissionDenied);
    }
    try {
        out->clear();
        out->reserve(root_.size() + container_id.size() + object_key.size() + 2);
        out->append(root_);
        if (out->back() != '/') {
            out->push_back('/');
        }
        out->append(container_id);
        out->push_back('/');
        out->append(object_key);
    } catch (const std::bad_alloc&) {
        return storage_status(StatusCode::OutOfMemory);
    }
    return ok_status();
}

Status LocalObjectClient::open_range(const FetchRange& range, std::unique_ptr<RangeBody>* out) const noexcept {
    if (out == nullptr || range.end < range.start) {
        return storage_status(StatusCode::Invalid);
    }

    std::string path;
    Status s = object_path(range.container_id, range.object_key, &path);
    if (!is_ok(s)) {
        return s;
    }

    int fd = -1;
    do {
        fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    } while (fd < 0 && errno == EINTR);
    if (fd < 0) {
        return errno_status(errno);
    }
    FileDescriptor guard(fd);

    struct stat st {};
    if (::fstat(fd, &st) != 0) {
        return storage_status(StatusCode::Io, static_cast<u32>(errno));
    }
    if (!S_ISREG(st.st_mode)) {
        return storage_status(StatusCode::NotFound);
    }

    const u64 object_size = static_cast<u64>(st.st_size);
    // Not satisfiable, as HTTP 416.
    if (range.start >= object_size) {
        return storage_status(StatusCode::Protocol);
    }
    const u64 last = std::min<u64>(range.end, object_size - 1);

    try {
        *out = std::make_unique<LocalRangeBody>(fd, range.start, last - range.start + 1);
    } catch (const std::bad_alloc&) {
        return storage_status(StatusCode::OutOfMemory);
    }
    (void)guard.release();
    return ok_status();
}

Status LocalObjectClient::object_size(std::string_view container_id, std::string_view object_key,
    u64* out) const noexcept {
    if (out == nullptr) {
        return storage_status(StatusCode::Invalid);
    }
    std::string path;
    Status s = object_path(container_id, object_key, &path);
    if (!is_ok(s)) {
        return s;
    }

    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        return errno_status(errno);
    }
    if (!S_ISREG(st.st_mode)) {
        return storage_status(StatusCode::NotFound);
    }
    *out = static_cast<u64>(st.st_size);
    return ok_status();
}

} // namespace rangecat::storage
