#include <usbmon/linux/udevadm.hpp>
#include <usbmon/log.hpp>

#include <boost/spirit/include/phoenix_operator.hpp>
#include <boost/spirit/include/phoenix_fusion.hpp>
#include <boost/spirit/include/phoenix_stl.hpp>
#include <boost/spirit/include/qi.hpp>

#include <boost/fusion/adapted.hpp>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/finder.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <boost/regex.hpp>

#include <map>
#include <string>

namespace usbmon { namespace udev {

namespace {
namespace qi = boost::spirit::qi;

template <class Iter>
struct UdevadmGrammar : qi::grammar<Iter, Properties()> {
    qi::rule<Iter, Properties()> start;
    qi::rule<Iter> nonProperty;
    qi::rule<Iter, std::pair<std::string, std::string>()> property;
    qi::rule<Iter, std::string()> key;
    qi::rule<Iter, std::string()> value;

    UdevadmGrammar () : UdevadmGrammar::base_type(start, "udevadm") {
        using qi::_1;
        using qi::_val;
        using boost::phoenix::at_c;
        using boost::phoenix::insert;

        start.name("start");
        start = *(property[insert(_val, _1)] | nonProperty)
            >> *qi::eol
            > qi::eoi;

        // "P: /devices/...", "N: bus/usb/001/002", or the "UDEV  [...] add ..." event header.
        nonProperty.name("nonProperty");
        nonProperty = +(qi::char_ - qi::eol) >> (qi::eol | qi::eoi);

        // `udevadm info --export-db` prefixes properties with "E: ", `udevadm monitor` does not.
        property.name("property");
        property %= -qi::lit("E: ") >> key >> '=' >> value >> (qi::eol | qi::eoi);

        key.name("key");
        key %= +(qi::char_ - qi::eol - '=' - ' ');

        value.name("value");
        value %= *(qi::char_ - qi::eol);

        using ErrorHandlerArgs = boost::fusion::vector<
            Iter&, const Iter&, const Iter&, const qi::info&>;

        auto logError = [](ErrorHandlerArgs args, auto&, qi::error_handler_result&) {
            log::Logger lg;
            BOOST_LOG_SEV(lg, log::warning) << "Expected '" << at_c<3>(args) << "' here: '"
                << std::string(at_c<2>(args), at_c<1>(args)) << "'";
        };

        qi::on_error<qi::fail>(start, logError);
    }
};

const std::string& propertyValue (const Properties& properties, const std::string& key) {
    static const std::string empty;
    auto it = properties.find(key);
    return it == properties.end() ? empty : it->second;
}

} // <anonymous>

bool parseUdevadm (const std::string& paragraph, Properties& properties) {
    auto begin = paragraph.cbegin();
    auto end = paragraph.cend();
    UdevadmGrammar<decltype(begin)> grammar;
    return qi::parse(begin, end, grammar, properties);
}

std::vector<Properties> parseUdevadmDatabase (const std::string& output) {
    auto paragraphs = std::vector<std::string>{};
    boost::algorithm::iter_split(paragraphs, output, boost::algorithm::first_finder("\n\n"));

    auto records = std::vector<Properties>{};
    for (auto& paragraph : paragraphs) {
        boost::algorithm::trim_left_if(paragraph, boost::algorithm::is_any_of("\n"));
        if (paragraph.empty()) {
            continue;
        }
        auto properties = Properties{};
        if (parseUdevadm(paragraph, properties)) {
            records.push_back(std::move(properties));
        }
    }
    return records;
}

bool isUsbDevice (const Properties& properties) {
    return propertyValue(properties, "SUBSYSTEM") == "usb"
        && propertyValue(properties, attr::kDevType) == "usb_device"
        && !propertyValue(properties, attr::kDevName).empty();
}

bool isRootHub (const Properties& properties) {
    static const auto rootHub = boost::regex{R"(/usb[0-9]+$)"};
    return boost::regex_search(propertyValue(properties, "DEVPATH"), rootHub);
}

Snapshot snapshotFromDatabase (const std::string& output) {
    auto devices = Snapshot{};
    for (const auto& properties : parseUdevadmDatabase(output)) {
        if (isUsbDevice(properties)
                && !propertyValue(properties, attr::kVendorId).empty()
                && !isRootHub(properties)) {
            devices[propertyValue(properties, attr::kDevName)] = makeRecord(properties);
        }
    }
    return devices;
}

bool parseUdevadm (const std::string& paragraph, DeviceEvent& event) {
    auto properties = Properties{};
    auto success = parseUdevadm(paragraph, properties);

    if (!success || !properties.size() || !isUsbDevice(properties) || isRootHub(properties)) {
        return false;
    }

    const auto& action = propertyValue(properties, "ACTION");
    if (action == "add") {
        if (propertyValue(properties, attr::kVendorId).empty()) {
            // Enumeration skips these too.
            return false;
        }
        event.type = DeviceEvent::ADD;
    }
    else if (action == "remove") {
        event.type = DeviceEvent::REMOVE;
    }
    else {
        return false;
    }

    event.id = propertyValue(properties, attr::kDevName);
    event.record = makeRecord(properties);
    return true;
}

}} // usbmon::udev
