#include "l2db/session/session-options.h"
#include "l2db/format/l2db-errors.h"

namespace l2db {

OpenMode
parse_open_mode(std::string_view letters)
{
    OpenMode mode = OpenMode::NONE;
    for (char c : letters)
    {
        switch (c)
        {
            case 'r':
                mode = mode | OpenMode::READ;
                break;
            case 'w':
                mode = mode | OpenMode::WRITE;
                break;
            case 'u':
                mode = mode | OpenMode::UNBUFFERED;
                break;
            default:
                throw L2dbError(
                    "Unknown open mode '" + std::string(1, c) + "' in \"" +
                    std::string(letters) + "\"");
        }
    }
    return mode;
}

std::string
to_string(OpenMode mode)
{
    std::string out;
    if (has_mode(mode, OpenMode::READ))
        out += 'r';
    if (has_mode(mode, OpenMode::WRITE))
        out += 'w';
    if (has_mode(mode, OpenMode::UNBUFFERED))
        out += 'u';
    return out;
}

}  // namespace l2db
