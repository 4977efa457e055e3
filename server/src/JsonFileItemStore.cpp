#include "JsonFileItemStore.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <fcntl.h>
#include <unistd.h>

namespace catalog {

JsonFileItemStore::JsonFileItemStore(const std::string& path)
    : path_(path) {
}

ItemCollection JsonFileItemStore::load() const {
    std::ifstream file(path_);
    if (!file) {
        // no file yet: first save creates it
        return {};
    }

    std::ostringstream contents;
    contents << file.rdbuf();

    nlohmann::json doc = nlohmann::json::parse(contents.str(), nullptr, false);
    if (doc.is_discarded() || !doc.is_array()) {
        std::cerr << "Data file " << path_ << " is not a JSON array, treating it as empty" << std::endl;
        return {};
    }

    try {
        return doc.get<ItemCollection>();
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Data file " << path_ << " has a malformed item (" << e.what()
                  << "), treating it as empty" << std::endl;
        return {};
    }
}

bool JsonFileItemStore::save(const ItemCollection& items) {
    std::string data = nlohmann::json(items).dump(2);
    data.push_back('\n');

    std::string tmpPath = path_ + ".tmp";
    if (!writeFile(tmpPath, data)) {
        ::unlink(tmpPath.c_str());
        return false;
    }

    if (std::rename(tmpPath.c_str(), path_.c_str()) != 0) {
        std::cerr << "Failed to replace " << path_ << ": " << std::strerror(errno) << std::endl;
        ::unlink(tmpPath.c_str());
        return false;
    }

    return true;
}

bool JsonFileItemStore::writeFile(const std::string& path, const std::string& data) const {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        std::cerr << "Failed to open " << path << ": " << std::strerror(errno) << std::endl;
        return false;
    }

    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            std::cerr << "Failed to write " << path << ": " << std::strerror(errno) << std::endl;
            ::close(fd);
            return false;
        }
        written += static_cast<size_t>(n);
    }

    // the rename must not become visible before the data is on disk
    if (::fsync(fd) != 0) {
        std::cerr << "Failed to sync " << path << ": " << std::strerror(errno) << std::endl;
        ::close(fd);
        return false;
    }

    if (::close(fd) != 0) {
        std::cerr << "Failed to close " << path << ": " << std::strerror(errno) << std::endl;
        return false;
    }

    return true;
}

} // namespace catalog
