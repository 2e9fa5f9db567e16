#pragma once

#include "srcfmt/interfaces.hpp"
#include <string>

namespace srcfmt {

class FileSystem : public IFileSystem {
public:
    auto read_file(const std::string& path) -> std::string override;
    auto write_file(const std::string& path, const std::string& content) -> void override;
    auto file_exists(const std::string& path) -> bool override;
    auto is_writable(const std::string& path) -> bool override;
};

} // namespace srcfmt
