#pragma once

#include <memory>
#include <string>
#include <vector>

#include "rangecat/core/errors.hpp"
#include "rangecat/core/models.hpp"
#include "rangecat/storage/object_client.hpp"
#include "rangecat/stream/assembler.hpp"

namespace rangecat::bindings {

    struct StreamRequest {
        std::vector<rangecat::core::FileEntry> files;
        rangecat::core::LogicalRange range;
        std::string endpoint; // region name, http(s)://host[:port] or file:///dir
        rangecat::stream::StreamOptions options;
        rangecat::storage::ClientOptions client;
    };

    // Host entry point. Builds the storage client and plans the window before
    // returning; a bad endpoint fails here with a Config status and no fetch is
    // made. The caller pulls with next(); destroying the stream cancels it.
    [[nodiscard]] rangecat::core::Status open_stream(const StreamRequest& req,
        std::unique_ptr<rangecat::stream::MultiFileStreamAssembler>* out) noexcept;

    // Same, over an already built client.
    [[nodiscard]] rangecat::core::Status open_stream_with_client(rangecat::storage::ObjectClientPtr client,
        const std::vector<rangecat::core::FileEntry>& files,
        const rangecat::core::LogicalRange& range,
        const rangecat::stream::StreamOptions& options,
        std::unique_ptr<rangecat::stream::MultiFileStreamAssembler>* out) noexcept;

} // namespace rangecat::bindings
