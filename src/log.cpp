#include <usbmon/log.hpp>

#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/file.hpp>

#include <boost/program_options/value_semantic.hpp>

#include <string>

namespace po = boost::program_options;
namespace expr = boost::log::expressions;
namespace keywords = boost::log::keywords;

namespace usbmon { namespace log {

namespace {

void setLevel (Severity level) {
    boost::log::core::get()->set_filter(boost::log::trivial::severity >= level);
}

void addFileSink (const std::string& path) {
    boost::log::add_common_attributes();
    boost::log::add_file_log(
        keywords::file_name = path,
        keywords::auto_flush = true,
        keywords::format = (
            expr::stream
                << "[" << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%H:%M:%S.%f")
                << "] [" << expr::attr<boost::log::attributes::current_thread_id::value_type>("ThreadID")
                << "] [" << boost::log::trivial::severity
                << "] " << expr::smessage
        )
    );
}

} // <anonymous>

po::options_description optionsDescription () {
    auto desc = po::options_description{"Log options"};
    desc.add_options()
        ("log-level", po::value<Severity>()->default_value(info, "info")->notifier(setLevel),
            "minimum severity to log: trace, debug, info, warning, error or fatal")
        ("log-file", po::value<std::string>()->notifier(addFileSink),
            "also write log records to this file")
        ;
    return desc;
}

}} // usbmon::log
