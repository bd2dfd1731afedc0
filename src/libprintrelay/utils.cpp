#include "Utils.hpp"
#include "libprintrelay.h"

#include <algorithm>
#include <cctype>
#include <mutex>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/filesystem.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/file.hpp>

namespace PrintRelay {

using file_sink_t = boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>;
static boost::shared_ptr<file_sink_t> g_log_sink;
static std::mutex                     g_log_sink_mutex;

static boost::log::trivial::severity_level level_to_boost(unsigned level)
{
    switch (level) {
    // Report fatal errors only.
    case 0: return boost::log::trivial::fatal;
    // Report fatal errors and errors.
    case 1: return boost::log::trivial::error;
    // Report fatal errors, errors and warnings.
    case 2: return boost::log::trivial::warning;
    // Report all errors, warnings and infos.
    case 3: return boost::log::trivial::info;
    // Report all errors, warnings, infos and debugging.
    case 4: return boost::log::trivial::debug;
    // Report everything including fine level tracing information.
    default: return boost::log::trivial::trace;
    }
}

void set_logging_level(unsigned int level)
{
    boost::log::core::get()->set_filter
    (
        boost::log::trivial::severity >= level_to_boost(level)
    );
}

int parse_logging_level(const std::string &level)
{
    std::string value = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(level));
    if (value.size() == 1 && std::isdigit(static_cast<unsigned char>(value.front())))
        return std::min(value.front() - '0', 5);
    if (value == "fatal")
        return 0;
    if (value == "error")
        return 1;
    if (value == "warning" || value == "warn")
        return 2;
    if (value == "info")
        return 3;
    if (value == "debug")
        return 4;
    if (value == "trace")
        return 5;
    return -1;
}

bool add_file_log(const std::string &log_dir)
{
    namespace fs       = boost::filesystem;
    namespace expr     = boost::log::expressions;
    namespace keywords = boost::log::keywords;

    std::lock_guard<std::mutex> lock(g_log_sink_mutex);
    if (g_log_sink)
        return true;

    boost::system::error_code ec;
    fs::path log_folder(log_dir);
    if (!fs::exists(log_folder, ec) && !fs::create_directories(log_folder, ec)) {
        BOOST_LOG_TRIVIAL(error) << "add_file_log: cannot create log directory " << log_dir << ": " << ec.message();
        return false;
    }

    g_log_sink = boost::log::add_file_log(
        keywords::file_name = (log_folder / (std::string(PRINTRELAY_APP_KEY) + "_%N.log")).generic_string(),
        keywords::rotation_size = 10 * 1024 * 1024,
        keywords::open_mode = std::ios_base::app,
        keywords::format =
        (
            expr::stream
            << "[" << expr::format_date_time< boost::posix_time::ptime >("TimeStamp", "%Y-%m-%d %H:%M:%S.%f") << "]"
            << "[" << boost::log::trivial::severity << "]"
            << "[Thread " << expr::attr<boost::log::attributes::current_thread_id::value_type>("ThreadID") << "]"
            << ":" << expr::smessage
        )
    );

    boost::log::add_common_attributes();
    g_log_sink->locked_backend()->auto_flush(true);
    return true;
}

void flush_logs()
{
    std::lock_guard<std::mutex> lock(g_log_sink_mutex);
    if (g_log_sink)
        g_log_sink->flush();
}

} // namespace PrintRelay
