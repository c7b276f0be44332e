// SPDX-License-Identifier: GPL-2.0-or-later

/**
 * @file
 * @brief metar-decode: decode METAR reports given on the command line or
 *        read one per line from standard input.
 */

#include <metgear_config.h>

#include <cstdlib>
#include <iostream>
#include <ctime>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include <metgear/debug/BufferedLogCallback.hxx>
#include <metgear/debug/logstream.hxx>
#include <metgear/environment/metar.hxx>
#include <metgear/environment/metar_report.hxx>
#include <metgear/structure/exception.hxx>

using std::string;

namespace {

struct Options
{
    mgDebugClass logClass = MG_ALL;
    mgDebugPriority logLevel = MG_ALERT;
    int width = 30;
    std::optional<time_t> observed;
    std::optional<time_t> now;
    bool list = false;
    bool verbose = false;
    bool help = false;
    bool version = false;
    std::vector<string> reports;
};

namespace po = boost::program_options;

void describeOptions(po::options_description& desc, Options& o,
                     string& logLevel, string& logClass)
{
    desc.add_options()
        ("help,h", po::bool_switch(&o.help), "print this text and exit")
        ("version,V", po::bool_switch(&o.version), "print the version and exit")
        ("verbose,v", po::bool_switch(&o.verbose), "print decoder messages after each report")
        ("list", po::bool_switch(&o.list), "list all properties instead of the padded report")
        ("width", po::value(&o.width)->default_value(30), "column width of the padded output")
        ("observed", po::value<time_t>(), "observation time of the reports (UNIX time)")
        ("now", po::value<time_t>(), "reference time for the observation age (UNIX time)")
        ("log-level", po::value(&logLevel), "bulk, debug, info, warn or alert (default alert)")
        ("log-class", po::value(&logClass), "general, environment, io or all (default all)")
        ("report", po::value(&o.reports), "METAR report, read one per line from stdin if none");
}

void usage(std::ostream& out, const po::options_description& desc)
{
    out << "usage: metar-decode [options] [report ...]\n"
        << "Decodes METAR reports given as arguments, or one per line from stdin.\n\n"
        << desc << "\n";
}

// throws po::error or mg_format_exception on bad input
void parseOptions(int argc, char** argv, const po::options_description& desc,
                  Options& o, const string& logLevel, const string& logClass)
{
    po::positional_options_description p;
    p.add("report", -1);

    po::variables_map vm;
    po::store(po::command_line_parser(argc, argv).options(desc).positional(p).run(), vm);
    po::notify(vm);

    if (vm.count("observed"))
        o.observed = vm["observed"].as<time_t>();
    if (vm.count("now"))
        o.now = vm["now"].as<time_t>();
    if (vm.count("log-level"))
        o.logLevel = metgear::logstream::priorityFromString(logLevel);
    if (vm.count("log-class"))
        o.logClass = metgear::logstream::classFromString(logClass);
}

bool decodeReport(const string& text, const Options& o, metgear::BufferedLogCallback* buffer)
{
    bool ok = true;
    try {
        MGMetar metar(text, o.observed);
        MGMetarReport report(metar.getObservation(), o.now);

        std::cout << "Weather @ " << metar.getId() << "\n";
        if (o.list) {
            std::cout << "metar => " << metar.getData() << "\n";
            std::cout << report.listProperties();
        } else {
            std::cout << report.getDescription(o.width);
        }
    } catch (const mg_exception& e) {
        std::cout << e.getMessage() << "\n";
        ok = false;
    }

    if (buffer) {
        metgear::BufferedLogCallback::string_list messages;
        buffer->threadsafeCopy(messages);
        for (const auto& msg : messages)
            std::cout << "  # " << msg << "\n";
        buffer->clear();
    }
    std::cout << std::endl;
    return ok;
}

} // of anonymous namespace

int main(int argc, char** argv)
{
    Options o;
    string logLevel, logClass;
    po::options_description desc("Allowed options");
    describeOptions(desc, o, logLevel, logClass);
    try {
        parseOptions(argc, argv, desc, o, logLevel, logClass);
    } catch (const po::error& e) {
        MG_LOG(MG_GENERAL, MG_ALERT, e.what());
        usage(std::cerr, desc);
        return EXIT_FAILURE;
    } catch (const mg_format_exception& e) {
        MG_LOG(MG_GENERAL, MG_ALERT, e.getFormattedMessage());
        usage(std::cerr, desc);
        return EXIT_FAILURE;
    }

    if (o.help) {
        usage(std::cout, desc);
        return EXIT_SUCCESS;
    }
    if (o.version) {
        std::cout << "metar-decode " << METGEAR_VERSION << std::endl;
        return EXIT_SUCCESS;
    }

    metgear::logstream& log = metgear::mglog();
    log.setStderrPriority(o.logLevel);
    log.setLogLevels(o.logClass, o.logLevel);

    std::unique_ptr<metgear::BufferedLogCallback> buffer;
    if (o.verbose) {
        buffer = std::make_unique<metgear::BufferedLogCallback>(MG_ENVIRONMENT, MG_DEBUG);
        log.addCallback(buffer.get());
        if (log.get_log_priority() > MG_DEBUG)
            log.setLogLevels(static_cast<mgDebugClass>(o.logClass | MG_ENVIRONMENT), MG_DEBUG);
    }

    bool ok = true;
    try {
        if (!o.reports.empty()) {
            for (const auto& r : o.reports)
                ok = decodeReport(r, o, buffer.get()) && ok;
        } else {
            string line;
            while (std::getline(std::cin, line))
                ok = decodeReport(line, o, buffer.get()) && ok;
            if (std::cin.bad())
                throw mg_io_exception("Failed reading reports", mg_location("<stdin>"));
        }
    } catch (const mg_io_exception& e) {
        MG_LOG(MG_IO, MG_ALERT, e.getFormattedMessage());
        ok = false;
    }

    if (buffer)
        log.removeCallback(buffer.get());

    return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
