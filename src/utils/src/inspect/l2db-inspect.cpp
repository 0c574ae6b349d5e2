#include "l2db/core/logger.h"
#include "l2db/format/l2db-errors.h"
#include "l2db/session/session.h"
#include "l2db/utils/inspect/arg-options.h"
#include <iostream>
#include <string>

using namespace l2db;
using namespace l2db::utils::inspect;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_USAGE = 1;
constexpr int EXIT_DATABASE_ERROR = 2;
constexpr int EXIT_STILL_DIRTY = 3;

std::string
describe_flags(const Header& header)
{
    std::string out;
    auto add = [&](bool on, const char* name) {
        if (!on)
            return;
        if (!out.empty())
            out += ",";
        out += name;
    };
    add(header.wide_index(), "WIDE_INDEX");
    add(header.dirty(), "DIRTY");
    add(header.locked(), "LOCKED");
    return out.empty() ? "none" : out;
}

void
print_header(const std::string& path, const Header& header)
{
    std::cout << "File: " << path << std::endl;
    std::cout << "  Format version: " << header.version.to_string() << std::endl;
    std::cout << "  Index length: " << header.index_len << " bytes"
              << std::endl;
    std::cout << "  Flags: " << describe_flags(header) << std::endl;
}

void
print_stats(Session& session)
{
    SessionStats stats = session.stats();
    std::cout << "Entries: " << stats.entry_count << std::endl;
    std::cout << "Value block: " << stats.value_size << " bytes ("
              << stats.live_bytes << " live, " << stats.dead_bytes << " dead)"
              << std::endl;
}

void
print_entries(Session& session)
{
    // Walk the index rather than dump() so the stored tag is shown
    for (const auto& key : session.keys())
    {
        IndexEntry entry = session.entry(key);
        std::cout << key << " [" << tag_code(entry.tag) << "] "
                  << to_display_string(session.read(key)) << std::endl;
    }
}

}  // namespace

int
main(int argc, char* argv[])
{
    CommandLineOptions options = parse_argv(argc, argv);

    if (options.show_help || !options.valid)
    {
        if (!options.valid && options.error_message)
        {
            std::cerr << "Error: " << *options.error_message << std::endl
                      << std::endl;
        }
        std::cout << options.help_text << std::endl;
        return options.valid ? EXIT_OK : EXIT_USAGE;
    }

    if (!Logger::set_level(options.log_level))
    {
        std::cerr << "Unrecognized log level: " << options.log_level
                  << std::endl;
        return EXIT_USAGE;
    }

    try
    {
        SessionOptions session_options;
        session_options.mode = OpenMode::READ;
        if (options.writes())
        {
            session_options.mode = session_options.mode | OpenMode::WRITE;
        }
        if (options.unbuffered)
        {
            session_options.mode = session_options.mode | OpenMode::UNBUFFERED;
        }
        session_options.strict = !options.non_strict;
        session_options.create_if_missing = false;

        auto session = Session::for_file(*options.input_file, session_options);
        print_header(*options.input_file, session->header());

        if (options.stats)
        {
            print_stats(*session);
        }
        if (options.dump)
        {
            print_entries(*session);
        }

        if (options.clear_dirty)
        {
            session->cleanup(true);
            std::cout << "DIRTY flag cleared" << std::endl;
        }
        else if (options.cleanup || options.discard_corrupted)
        {
            CleanupReport report =
                session->cleanup(false, options.discard_corrupted);
            std::cout << "Cleanup: kept " << report.kept << ", repaired "
                      << report.repaired << ", discarded " << report.discarded
                      << ", reclaimed " << report.reclaimed_bytes << " bytes"
                      << std::endl;
        }

        if (options.writes())
        {
            session->flush();
        }

        bool still_dirty = session->dirty();
        session->close();

        if (still_dirty)
        {
            std::cerr << "Database is dirty; run with --cleanup to repair it"
                      << std::endl;
            return EXIT_STILL_DIRTY;
        }
        return EXIT_OK;
    }
    catch (const L2dbError& e)
    {
        LOGE("l2db error: ", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_DATABASE_ERROR;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return EXIT_DATABASE_ERROR;
    }
}
