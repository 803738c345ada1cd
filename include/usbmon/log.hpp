#ifndef USBMON_LOG_HPP
#define USBMON_LOG_HPP

#include <boost/log/common.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>

#include <boost/program_options/options_description.hpp>

namespace usbmon { namespace log {

using Severity = boost::log::trivial::severity_level;
using Logger = boost::log::sources::severity_logger_mt<Severity>;

using boost::log::trivial::trace;
using boost::log::trivial::debug;
using boost::log::trivial::info;
using boost::log::trivial::warning;
using boost::log::trivial::error;
using boost::log::trivial::fatal;

boost::program_options::options_description optionsDescription ();
// Options `--log-level` and `--log-file`. Their notifiers configure the Boost.Log core, so running
// boost::program_options::notify() on the parsed options is all the setup a program needs.

}} // usbmon::log

#endif
