#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace diarclip {

// Storage collaborator for persisted clips: bytes in under a name, a
// retrievable reference out.
class ClipStore {
  public:
    virtual ~ClipStore() = default;

    // Store `bytes` under `name` and return a reference resolvable to the
    // same bytes. Throws std::runtime_error on failure.
    virtual std::string store(const std::string &name,
                              const std::vector<uint8_t> &bytes) = 0;

    // Best-effort delete used to roll back a partially stored clip set.
    virtual void remove(const std::string &name) = 0;
};

// Clips as files under one directory. References are
// `url_base + "/" + name`, or the file path when url_base is empty.
class FileClipStore : public ClipStore {
  public:
    FileClipStore(std::filesystem::path dir, std::string url_base = "");

    std::string store(const std::string &name,
                      const std::vector<uint8_t> &bytes) override;
    void remove(const std::string &name) override;

    // Read a stored clip back ("serve by name"); nullopt if absent.
    std::optional<std::vector<uint8_t>> load(const std::string &name) const;

    const std::filesystem::path &dir() const { return dir_; }

  private:
    std::filesystem::path dir_;
    std::string url_base_;

    std::filesystem::path path_for(const std::string &name) const;
};

// Plain file name: no separators, not "." or "..", not empty.
bool is_safe_name(const std::string &name);

} // namespace diarclip
