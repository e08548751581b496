#include "rangecat/core/logging.hpp"

#include <iostream>
#include <mutex>

#include <boost/date_time/posix_time/posix_time_io.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/log/attributes/named_scope.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>

namespace rangecat::core {

    boost::log::trivial::severity_level parse_log_severity(std::string_view name) noexcept {
        using boost::log::trivial::severity_level;
        if (name == "debug") {
            return severity_level::debug;
        }
        if (name == "info") {
            return severity_level::info;
        }
        if (name == "warning") {
            return severity_level::warning;
        }
        return severity_level::error;
    }

    void init_logging(std::string_view severity) {
        using namespace boost::log;

        static std::once_flag sink_once;
        std::call_once(sink_once, [] {
            add_common_attributes();
            boost::log::core::get()->add_global_attribute("Scope", attributes::named_scope());

            // stdout may be carrying object bytes, so records go to stderr.
            add_console_log(
                std::clog,
                keywords::format =
                    (expressions::stream
                     << "[" << expressions::attr<boost::posix_time::ptime>("TimeStamp")
                     << "] [" << expressions::attr<trivial::severity_level>("Severity")
                     << "] ["
                     << expressions::format_named_scope("Scope",
                                                        keywords::format = "%n",
                                                        keywords::depth  = 1)
                     << "] " << expressions::smessage));
        });

        boost::log::core::get()->set_filter(trivial::severity >= parse_log_severity(severity));
    }

} // namespace rangecat::core
