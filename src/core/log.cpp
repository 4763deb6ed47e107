#include "cabinet/core/log.hpp"

#include <boost/core/null_deleter.hpp>
#include <boost/log/attributes/clock.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <cstring>
#include <filesystem>
#include <iostream>

namespace cabinet::core {

namespace {
    BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", severity_level)

    template <typename Sink>
    void set_format(Sink& sink) {
        namespace expr = boost::log::expressions;
        sink->set_formatter(
            expr::stream
                << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
                << " [" << severity << "] "
                << expr::smessage);
    }
} // namespace

const char* to_string(severity_level level) noexcept {
    switch (level) {
        case severity_level::trace:   return "TRACE";
        case severity_level::debug:   return "DEBUG";
        case severity_level::info:    return "INFO";
        case severity_level::warning: return "WARNING";
        case severity_level::error:   return "ERROR";
    }
    return "UNKNOWN";
}

std::ostream& operator<<(std::ostream& strm, severity_level level) {
    strm << to_string(level);
    return strm;
}

bool parse_severity(const char* s, severity_level* out) noexcept {
    if (s == nullptr || out == nullptr) {
        return false;
    }
    if (std::strcmp(s, "trace") == 0) { *out = severity_level::trace; return true; }
    if (std::strcmp(s, "debug") == 0) { *out = severity_level::debug; return true; }
    if (std::strcmp(s, "info") == 0) { *out = severity_level::info; return true; }
    if (std::strcmp(s, "warning") == 0 || std::strcmp(s, "warn") == 0) {
        *out = severity_level::warning;
        return true;
    }
    if (std::strcmp(s, "error") == 0) { *out = severity_level::error; return true; }
    return false;
}

BOOST_LOG_GLOBAL_LOGGER_INIT(global_logger, logger_type) {
    logger_type logger;
    logger.add_attribute("ThreadID", boost::log::attributes::current_thread_id());
    return logger;
}

void init_logging(const std::string& log_file, severity_level min_level) {
    auto core = boost::log::core::get();
    core->remove_all_sinks();

    if (log_file.empty()) {
        auto backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
        backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
        backend->auto_flush(true);

        using text_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>;
        auto sink = boost::make_shared<text_sink>(backend);
        set_format(sink);
        core->add_sink(sink);
    } else {
        auto backend = boost::make_shared<boost::log::sinks::text_file_backend>();
        backend->set_file_name_pattern(std::filesystem::absolute(log_file).string());
        backend->set_open_mode(std::ios::out | std::ios::app);
        backend->auto_flush(true);

        using file_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>;
        auto sink = boost::make_shared<file_sink>(backend);
        set_format(sink);
        core->add_sink(sink);
    }

    boost::log::add_common_attributes();
    set_log_level(min_level);
    core->set_logging_enabled(true);
}

void set_log_level(severity_level min_level) {
    boost::log::core::get()->set_filter(severity >= min_level);
}

} // namespace cabinet::core
