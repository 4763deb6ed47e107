#pragma once

#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <ostream>
#include <string>

namespace cabinet::core {

    enum class severity_level {
        trace,
        debug,
        info,
        warning,
        error,
    };

    const char* to_string(severity_level level) noexcept;
    std::ostream& operator<<(std::ostream& strm, severity_level level);

    // Accepts trace/debug/info/warning/warn/error.
    [[nodiscard]] bool parse_severity(const char* s, severity_level* out) noexcept;

    using logger_type = boost::log::sources::severity_logger_mt<severity_level>;

    BOOST_LOG_GLOBAL_LOGGER(global_logger, ::cabinet::core::logger_type)

    // Empty log_file sends records to stderr.
    void init_logging(const std::string& log_file = "",
                      severity_level min_level = severity_level::info);

    void set_log_level(severity_level min_level);

} // namespace cabinet::core

#define CABINET_LOG_TRACE BOOST_LOG_SEV(cabinet::core::global_logger::get(), cabinet::core::severity_level::trace)
#define CABINET_LOG_DEBUG BOOST_LOG_SEV(cabinet::core::global_logger::get(), cabinet::core::severity_level::debug)
#define CABINET_LOG_INFO BOOST_LOG_SEV(cabinet::core::global_logger::get(), cabinet::core::severity_level::info)
#define CABINET_LOG_WARN BOOST_LOG_SEV(cabinet::core::global_logger::get(), cabinet::core::severity_level::warning)
#define CABINET_LOG_ERROR BOOST_LOG_SEV(cabinet::core::global_logger::get(), cabinet::core::severity_level::error)
