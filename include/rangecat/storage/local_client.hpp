#pragma once

#include <string>

#include "rangecat/storage/object_client.hpp"

namespace rangecat::storage {

    // Serves objects from a directory tree: {root}/{container_id}/{object_key}.
    // Ranges ending past the object are clipped; ranges starting past it are Protocol.
    class LocalObjectClient final : public ObjectClient {
    public:
        explicit LocalObjectClient(std::string root) noexcept;

        // Fails with a Config status if the root is not a readable directory.
        [[nodiscard]] static rangecat::core::Status create(const std::string& root, ObjectClientPtr* out) noexcept;

        [[nodiscard]] rangecat::core::Status open_range(const rangecat::core::FetchRange& range,
            std::unique_ptr<RangeBody>* out) const noexcept override;

        [[nodiscard]] rangecat::core::Status object_size(std::string_view container_id,
            std::string_view object_key,
            u64* out) const noexcept override;

        [[nodiscard]] const std::string& root() const noexcept { return root_; }

    private:
        [[nodiscard]] rangecat::core::Status object_path(std::string_view container_id,
            std::string_view object_key,
            std::string* out) const noexcept;

        std::string root_;
    };

} // namespace rangecat::storage
