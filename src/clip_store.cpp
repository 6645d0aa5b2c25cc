#include "diarclip/clip_store.hpp"

#include "diarclip/log.hpp"

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>

namespace diarclip {

namespace fs = std::filesystem;

bool is_safe_name(const std::string &name) {
    if (name.empty() || name == "." || name == "..")
        return false;
    return name.find('/') == std::string::npos &&
           name.find('\\') == std::string::npos &&
           name.find('\0') == std::string::npos;
}

FileClipStore::FileClipStore(fs::path dir, std::string url_base)
    : dir_(std::move(dir)), url_base_(std::move(url_base)) {
    while (!url_base_.empty() && url_base_.back() == '/')
        url_base_.pop_back();
}

fs::path FileClipStore::path_for(const std::string &name) const {
    if (!is_safe_name(name)) {
        throw std::invalid_argument("Invalid clip name: " + name);
    }
    return dir_ / name;
}

std::string FileClipStore::store(const std::string &name,
                                 const std::vector<uint8_t> &bytes) {
    auto path = path_for(name);

    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        throw std::runtime_error("Cannot create clip directory " +
                                 dir_.string() + ": " + ec.message());
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw std::runtime_error("Cannot open clip file for writing: " +
                                 path.string());
    }
    file.write(reinterpret_cast<const char *>(bytes.data()),
               static_cast<std::streamsize>(bytes.size()));
    file.close();
    if (!file) {
        // A short write must not leave a truncated clip behind
        fs::remove(path, ec);
        throw std::runtime_error("Failed to write clip file: " + path.string());
    }

    return url_base_.empty() ? path.string() : url_base_ + "/" + name;
}

void FileClipStore::remove(const std::string &name) {
    std::error_code ec;
    fs::remove(path_for(name), ec);
    if (ec) {
        log_warn("Could not remove clip " + name + ": " + ec.message());
    }
}

std::optional<std::vector<uint8_t>>
FileClipStore::load(const std::string &name) const {
    auto path = path_for(name);
    std::ifstream file(path, std::ios::binary);
    if (!file)
        return std::nullopt;
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(file),
                                std::istreambuf_iterator<char>());
}

} // namespace diarclip
