#include "srcfmt/io/file_system.hpp"
#include "srcfmt/errors.hpp"
#include <unistd.h>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace srcfmt {

auto FileSystem::read_file(const std::string& path) -> std::string {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw IoError("Cannot open file: " + path);
    }

    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw IoError("Cannot read file: " + path);
    }
    return content;
}

auto FileSystem::write_file(const std::string& path, const std::string& content) -> void {
    // Write to temporary file first for atomic replacement
    std::string temp_path = path + ".tmp";

    try {
        {
            std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
            if (!file.is_open()) {
                throw IoError("Cannot write to file: " + path);
            }

            file << content;
            file.flush();
            if (file.fail()) {
                throw IoError("Cannot write to file: " + path);
            }
        } // File automatically closed here

        // Keep the original file's permission bits
        std::error_code status_ec;
        auto original = std::filesystem::status(path, status_ec);
        if (!status_ec && std::filesystem::exists(original)) {
            std::filesystem::permissions(temp_path, original.permissions());
        }
        std::filesystem::rename(temp_path, path);

    } catch (const IoError&) {
        std::error_code ec;
        std::filesystem::remove(temp_path, ec);
        throw;
    } catch (const std::filesystem::filesystem_error& e) {
        std::error_code ec;
        std::filesystem::remove(temp_path, ec);
        throw IoError("Cannot replace file " + path + ": " + e.what());
    }
}

auto FileSystem::file_exists(const std::string& path) -> bool {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

auto FileSystem::is_writable(const std::string& path) -> bool {
    if (access(path.c_str(), W_OK) != 0) {
        return false;
    }

    // A file without any write bit is read-only even for privileged users
    std::error_code ec;
    auto mode = std::filesystem::status(path, ec).permissions();
    if (ec) {
        return false;
    }
    using std::filesystem::perms;
    return (mode & (perms::owner_write | perms::group_write | perms::others_write)) != perms::none;
}

} // namespace srcfmt
