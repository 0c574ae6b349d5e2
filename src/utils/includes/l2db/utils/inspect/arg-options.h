#pragma once

#include <optional>
#include <string>

namespace l2db::utils::inspect {

/**
 * Type-safe structure for command line options
 */
struct CommandLineOptions
{
    /** Path to the database file */
    std::optional<std::string> input_file;

    /** Print every entry */
    bool dump = false;

    /** Print space accounting for the value block */
    bool stats = false;

    /** Validate, repair and compact the database */
    bool cleanup = false;

    /** During cleanup, drop corrupted entries instead of repairing them */
    bool discard_corrupted = false;

    /** Only clear the DIRTY flag */
    bool clear_dirty = false;

    /** Work on the file directly instead of loading it into memory */
    bool unbuffered = false;

    /** Tolerate a bad magic or index length */
    bool non_strict = false;

    /** Log level (error, warn, info, debug) */
    std::string log_level = "error";

    /** Whether to display help information */
    bool show_help = false;

    /** Whether parsing completed successfully */
    bool valid = true;

    /** Any error message to display */
    std::optional<std::string> error_message;

    /** Pre-formatted help text */
    std::string help_text;

    bool
    writes() const
    {
        return cleanup || discard_corrupted || clear_dirty;
    }
};

/**
 * Parse command line arguments into a structured options object
 *
 * @param argc Argument count from main
 * @param argv Argument values from main
 * @return A populated CommandLineOptions structure
 */
CommandLineOptions
parse_argv(int argc, char* argv[]);

}  // namespace l2db::utils::inspect
