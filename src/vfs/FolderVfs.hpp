#pragma once
#include "IVfs.hpp"
#include <filesystem>

// IVfs backed by a directory on the host. Every host path it touches is
// checked to stay under the root directory.
class FolderVfs : public IVfs {
public:
    // Creates the root if needed; throws FatalError if it is unusable.
    explicit FolderVfs(std::filesystem::path root);

    bool exists(const std::filesystem::path& path) const override;
    bool isDirectory(const std::filesystem::path& path) const override;
    bool isFile(const std::filesystem::path& path) const override;

    std::vector<DirEntry> list(const std::filesystem::path& path) const override;
    void touch(const std::filesystem::path& path) override;
    void mkdir(const std::filesystem::path& path, bool recursive) override;
    void remove(const std::filesystem::path& path, bool recursive) override;
    void copy(const std::filesystem::path& src, const std::filesystem::path& dst) override;
    void move(const std::filesystem::path& src, const std::filesystem::path& dst) override;
    void symlink(const std::filesystem::path& target, const std::filesystem::path& link) override;
    void hardlink(const std::filesystem::path& src, const std::filesystem::path& dst) override;
    std::string readlink(const std::filesystem::path& path) const override;
    std::filesystem::path canonical(const std::filesystem::path& path) const override;
    void truncate(const std::filesystem::path& path, uintmax_t size) override;
    void chmod(const std::filesystem::path& path, unsigned mode) override;
    void chown(const std::filesystem::path& path, unsigned uid, unsigned gid) override;
    StatInfo stat(const std::filesystem::path& path) const override;

    std::string readFile(const std::filesystem::path& path) const override;
    void readChunks(const std::filesystem::path& path, std::size_t chunk,
                    const std::function<void(const char*, std::size_t)>& sink) const override;
    void writeFile(const std::filesystem::path& path, const std::string& data, bool append) override;
    std::filesystem::path createTemp(const std::filesystem::path& dir, const std::string& prefix) override;

    uintmax_t diskUsage(const std::filesystem::path& path) const override;
    SpaceInfo space() const override;

    const std::filesystem::path& root() const override { return root_; }

    // Host path for a virtual one. With follow_last=false the final
    // component is not resolved, so the link itself is addressed.
    std::filesystem::path host(const std::filesystem::path& vpath, bool follow_last = true) const;
    // Virtual path for a host path under the root; throws IoError otherwise.
    std::filesystem::path toVirtual(const std::filesystem::path& host) const;

private:
    std::filesystem::path root_;
    bool within_root(const std::filesystem::path& host) const;
};
