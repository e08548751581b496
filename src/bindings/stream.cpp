#include "rangecat/bindings/stream.hpp"

#include <new>

#include <boost/log/trivial.hpp>

namespace rangecat::bindings {

using namespace rangecat::core;
using rangecat::storage::ObjectClientPtr;
using rangecat::stream::MultiFileStreamAssembler;
using rangecat::stream::StreamOptions;

Status open_stream_with_client(ObjectClientPtr client, const std::vector<FileEntry>& files, const LogicalRange& range,
    const StreamOptions& options, std::unique_ptr<MultiFileStreamAssembler>* out) noexcept {
    if (out == nullptr || client == nullptr) {
        return make_status(StatusDomain::Bindings, StatusCode::Invalid);
    }

    std::unique_ptr<MultiFileStreamAssembler> stream;
    try {
        stream = std::make_unique<MultiFileStreamAssembler>(std::move(client), options);
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Bindings, StatusCode::OutOfMemory);
    }

    Status s = stream->open(files, range);
    if (!is_ok(s)) {
        return s;
    }
    *out = std::move(stream);
    return ok_status();
}

Status open_stream(const StreamRequest& req, std::unique_ptr<MultiFileStreamAssembler>* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Bindings, StatusCode::Invalid);
    }

    Status s = rangecat::stream::validate_stream_options(req.options);
    if (!is_ok(s)) {
        return s;
    }

    ObjectClientPtr client;
    s = rangecat::storage::make_object_client(req.endpoint, req.client, &client);
    if (!is_ok(s)) {
        BOOST_LOG_TRIVIAL(error) << "cannot build storage client for '" << req.endpoint
                                 << "': " << status_code_name(s.code);
        return s;
    }

    return open_stream_with_client(std::move(client), req.files, req.range, req.options, out);
}

} // namespace rangecat::bindings
