#pragma once

#include "l2db/format/l2db-structs.h"
#include "l2db/format/l2db-type-tag.h"
#include <stdexcept>
#include <string>

namespace l2db {

// Base exception for all l2db errors
class L2dbError : public std::runtime_error
{
public:
    explicit L2dbError(const std::string& msg) : std::runtime_error(msg)
    {
    }
};

// Malformed file structure (bad magic, truncated header or index)
class L2dbSyntaxError : public L2dbError
{
public:
    explicit L2dbSyntaxError(const std::string& msg) : L2dbError(msg)
    {
    }
};

// The file's major format version differs from the engine's
class L2dbVersionMismatchError : public L2dbError
{
public:
    L2dbVersionMismatchError(FormatVersion expected, FormatVersion actual)
        : L2dbError(
              "The database follows format version " + actual.to_string() +
              " but the engine implements format version " +
              expected.to_string())
        , expected_(expected)
        , actual_(actual)
    {
    }

    const FormatVersion&
    expected() const
    {
        return expected_;
    }
    const FormatVersion&
    actual() const
    {
        return actual_;
    }

private:
    FormatVersion expected_;
    FormatVersion actual_;
};

class L2dbKeyNotFoundError : public L2dbError
{
public:
    explicit L2dbKeyNotFoundError(const std::string& key)
        : L2dbError("Key '" + key + "' could not be found"), key_(key)
    {
    }

    const std::string&
    key() const
    {
        return key_;
    }

private:
    std::string key_;
};

// A value cannot be produced as, or coerced to, the requested type
class L2dbTypeConversionError : public L2dbError
{
public:
    L2dbTypeConversionError(TypeTag target, const std::string& detail)
        : L2dbError(
              "Could not convert to type '" + std::string(tag_code(target)) +
              "': " + detail)
        , target_(target)
    {
    }

    TypeTag
    target() const
    {
        return target_;
    }

private:
    TypeTag target_;
};

// A structural mutation was attempted while the DIRTY flag is set
class L2dbDirtyDatabaseError : public L2dbError
{
public:
    explicit L2dbDirtyDatabaseError(const std::string& msg) : L2dbError(msg)
    {
    }
};

class L2dbReadOnlyError : public L2dbError
{
public:
    explicit L2dbReadOnlyError(const std::string& msg) : L2dbError(msg)
    {
    }
};

class L2dbWriteOnlyError : public L2dbError
{
public:
    explicit L2dbWriteOnlyError(const std::string& msg) : L2dbError(msg)
    {
    }
};

// Underlying storage access failed
class L2dbIOError : public L2dbError
{
public:
    explicit L2dbIOError(const std::string& msg) : L2dbError(msg)
    {
    }
};

// Key names must be non-empty and free of 0x00 bytes
class L2dbInvalidKeyError : public L2dbError
{
public:
    explicit L2dbInvalidKeyError(const std::string& msg) : L2dbError(msg)
    {
    }
};

class L2dbClosedError : public L2dbError
{
public:
    explicit L2dbClosedError(const std::string& msg) : L2dbError(msg)
    {
    }
};

}  // namespace l2db
