#pragma once

#include <boost/filesystem.hpp>
#include <cstdint>
#include <gtest/gtest.h>
#include <string>
#include <vector>

// Convert hex string to byte vector
std::vector<uint8_t>
hex_to_vector(const std::string& hex_string);

// Bytes of a string, without a terminator
std::vector<uint8_t>
bytes_of(const std::string& text);

// Replace `path` with exactly `data`
void
write_file(const boost::filesystem::path& path, const std::vector<uint8_t>& data);

std::vector<uint8_t>
read_file(const boost::filesystem::path& path);

/**
 * Fixture owning a scratch directory under the system temp directory,
 * removed again after every test
 */
class TempDirTest : public ::testing::Test
{
protected:
    void
    SetUp() override;

    void
    TearDown() override;

    boost::filesystem::path
    path_for(const std::string& name) const
    {
        return test_dir_ / name;
    }

    boost::filesystem::path test_dir_;
};
