#include <cstddef>
#include <string>
#include <ostream>
#include <iomanip>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/attributes.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/attributes/clock.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/sinks.hpp>
#include <boost/core/null_deleter.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

#include "logging.hpp"

namespace sinks = boost::log::sinks;
namespace expr = boost::log::expressions;
namespace attrs = boost::log::attributes;

namespace mypv {

BOOST_LOG_ATTRIBUTE_KEYWORD(log_severity, "Severity", Log::severity)
BOOST_LOG_ATTRIBUTE_KEYWORD(log_thread_id, "ThreadID", attrs::current_thread_id::value_type)

std::ostream& operator<< (std::ostream& strm, Log::severity level)
{
    static const char* strings[] =
    {
        "CRITICAL",
        "ERROR",
        "WARNING",
        "INFO",
        "DEBUG",
        "TRACE"
    };

    if (static_cast< std::size_t >(level) < sizeof(strings) / sizeof(*strings))
        strm << strings[level];
    else
        strm << static_cast< int >(level);

    return strm;
}

bool
Log::fromVerbosity(int verbosity, severity& level) {
    if (verbosity <= 0)
        return false;
    if (verbosity > trace + 1)
        verbosity = trace + 1;
    level = static_cast<severity>(verbosity - 1);
    return true;
}

void Log::init_logging(severity level, bool disabled) {
    boost::shared_ptr< boost::log::core > core = boost::log::core::get();

    if (disabled) {
        core->set_logging_enabled(false);
        return;
    }

    typedef sinks::synchronous_sink< sinks::text_ostream_backend > text_sink;
    boost::shared_ptr< text_sink > sink = boost::make_shared< text_sink >();

    boost::shared_ptr< std::ostream > stream(&std::clog, boost::null_deleter());
    sink->locked_backend()->add_stream(stream);
    sink->locked_backend()->auto_flush(true);

    sink->set_formatter
    (
        expr::stream
            << expr::attr<boost::posix_time::ptime>("TimeStamp")
            << " [" << log_thread_id << "]"
            << ": [" << log_severity << "]\t"
            << expr::smessage
    );

    sink->set_filter(log_severity <= level);

    core->add_sink(sink);
    core->add_global_attribute("TimeStamp", attrs::local_clock());
    core->add_global_attribute("ThreadID", attrs::current_thread_id());
}

}
