#include "l2db/utils/inspect/arg-options.h"

#include <boost/program_options.hpp>
#include <sstream>
#include <string>

namespace po = boost::program_options;
namespace l2db::utils::inspect {

CommandLineOptions
parse_argv(int argc, char* argv[])
{
    CommandLineOptions options;

    po::options_description desc("Allowed options");
    desc.add_options()("help,h", "Display this help message")(
        "input-file", po::value<std::string>(), "Path to the l2db file")(
        "dump,d", po::bool_switch(), "Print every key with its type and value")(
        "stats,s", po::bool_switch(), "Print live and dead value bytes")(
        "cleanup,c",
        po::bool_switch(),
        "Repair corrupted entries, compact the value block and clear DIRTY")(
        "discard-corrupted",
        po::bool_switch(),
        "Run cleanup, dropping corrupted entries instead of repairing them")(
        "clear-dirty",
        po::bool_switch(),
        "Clear the DIRTY flag without validating anything")(
        "unbuffered,u",
        po::bool_switch(),
        "Access the file directly instead of loading it into memory")(
        "non-strict",
        po::bool_switch(),
        "Open files with a bad magic or index length")(
        "log-level,l",
        po::value<std::string>()->default_value("error"),
        "Log level (error, warn, info, debug)");

    po::positional_options_description pos_desc;
    pos_desc.add("input-file", 1);

    std::ostringstream help_stream;
    help_stream << "l2db Inspect Tool" << std::endl
                << "-----------------" << std::endl
                << "Prints the header of an l2db database and optionally its "
                   "entries,"
                << std::endl
                << "space usage, or repairs it." << std::endl
                << std::endl
                << "Usage: " << (argc > 0 ? argv[0] : "l2db-inspect")
                << " [options] <l2db_file>" << std::endl
                << desc << std::endl
                << "Exit status:" << std::endl
                << "  0  success" << std::endl
                << "  1  usage error" << std::endl
                << "  2  the database could not be read or written" << std::endl
                << "  3  the database is still dirty" << std::endl;
    options.help_text = help_stream.str();

    try
    {
        po::variables_map vm;
        po::store(
            po::command_line_parser(argc, argv)
                .options(desc)
                .positional(pos_desc)
                .run(),
            vm);
        po::notify(vm);

        if (vm.count("help"))
        {
            options.show_help = true;
            return options;
        }

        if (vm.count("input-file"))
        {
            options.input_file = vm["input-file"].as<std::string>();
        }
        else
        {
            options.valid = false;
            options.error_message = "No input file specified";
            return options;
        }

        options.dump = vm["dump"].as<bool>();
        options.stats = vm["stats"].as<bool>();
        options.cleanup = vm["cleanup"].as<bool>();
        options.discard_corrupted = vm["discard-corrupted"].as<bool>();
        options.clear_dirty = vm["clear-dirty"].as<bool>();
        options.unbuffered = vm["unbuffered"].as<bool>();
        options.non_strict = vm["non-strict"].as<bool>();
        options.log_level = vm["log-level"].as<std::string>();

        if (options.clear_dirty && (options.cleanup || options.discard_corrupted))
        {
            options.valid = false;
            options.error_message =
                "--clear-dirty cannot be combined with --cleanup or "
                "--discard-corrupted";
            return options;
        }
    }
    catch (const po::error& e)
    {
        options.valid = false;
        options.error_message = e.what();
    }
    catch (const std::exception& e)
    {
        options.valid = false;
        options.error_message = std::string("Unexpected error: ") + e.what();
    }

    return options;
}

}  // namespace l2db::utils::inspect
