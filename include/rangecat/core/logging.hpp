#pragma once

#include <string_view>

#include <boost/log/trivial.hpp>

namespace rangecat::core {

    // Maps "debug" | "info" | "warning" | "error"; anything else is error.
    [[nodiscard]] boost::log::trivial::severity_level parse_log_severity(std::string_view name) noexcept;

    // Installs a single stderr console sink and the severity filter.
    // Safe to call more than once; later calls only move the filter.
    void init_logging(std::string_view severity);

} // namespace rangecat::core
