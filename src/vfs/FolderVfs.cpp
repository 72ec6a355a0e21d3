#include "FolderVfs.hpp"
#include "../core/Errors.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <random>
#include <system_error>
#include <sys/stat.h>
#include <unistd.h>

using namespace std::filesystem;

static path canonical_or_weak(const path& p) {
    std::error_code ec;
    auto r = weakly_canonical(p, ec);
    if (ec) return p.lexically_normal();
    return r;
}

static std::string quoted(const path& vpath) {
    return "'" + vpath.generic_string() + "'";
}

static std::string cause(const std::error_code& ec) {
    return ec.message();
}

FolderVfs::FolderVfs(std::filesystem::path root) {
    std::error_code ec;
    create_directories(root, ec);
    if (ec) throw FatalError("cannot create root " + root.string() + ": " + ec.message());
    if (!is_directory(root, ec)) throw FatalError("root is not a directory: " + root.string());
    root_ = std::filesystem::canonical(root, ec);
    if (ec) throw FatalError("cannot resolve root " + root.string() + ": " + ec.message());
}

bool FolderVfs::within_root(const std::filesystem::path& host) const {
    auto rel = host.lexically_relative(root_);
    if (rel.empty()) return false;
    return *rel.begin() != "..";
}

std::filesystem::path FolderVfs::host(const std::filesystem::path& vpath, bool follow_last) const {
    path rel = vpath.lexically_normal().relative_path();
    if (rel.empty() || rel == ".") return root_;
    path joined = (root_ / rel).lexically_normal();
    path resolved;
    if (follow_last || !joined.has_filename()) {
        resolved = canonical_or_weak(joined);
    } else {
        resolved = canonical_or_weak(joined.parent_path()) / joined.filename();
    }
    // ensure within root
    if (!within_root(resolved)) {
        throw IoError("path escapes root: " + vpath.generic_string());
    }
    return resolved;
}

std::filesystem::path FolderVfs::toVirtual(const std::filesystem::path& host) const {
    auto rel = host.lexically_normal().lexically_relative(root_);
    if (rel.empty() || *rel.begin() == "..") {
        throw IoError("path escapes root: " + host.string());
    }
    if (rel == ".") return path("/");
    return path("/") / rel;
}

bool FolderVfs::exists(const std::filesystem::path& vpath) const {
    std::error_code ec;
    return std::filesystem::exists(symlink_status(host(vpath, false), ec));
}

bool FolderVfs::isDirectory(const std::filesystem::path& vpath) const {
    std::error_code ec;
    return is_directory(host(vpath), ec);
}

bool FolderVfs::isFile(const std::filesystem::path& vpath) const {
    std::error_code ec;
    return is_regular_file(host(vpath), ec);
}

std::vector<DirEntry> FolderVfs::list(const std::filesystem::path& vpath) const {
    auto dir = host(vpath);
    std::error_code ec;
    if (!is_directory(dir, ec)) throw NotFoundError("no such directory: " + quoted(vpath));
    std::vector<DirEntry> out;
    for (auto& de : directory_iterator(dir, ec)) {
        DirEntry e;
        e.name = de.path().filename().string();
        std::error_code ec2;
        e.is_symlink = de.is_symlink(ec2);
        e.is_dir = de.is_directory(ec2);
        e.size = (e.is_dir || !de.is_regular_file(ec2)) ? 0 : de.file_size(ec2);
        out.push_back(std::move(e));
    }
    if (ec) throw IoError("cannot list " + quoted(vpath) + ": " + cause(ec));
    std::sort(out.begin(), out.end(), [](const DirEntry& a, const DirEntry& b) { return a.name < b.name; });
    return out;
}

void FolderVfs::touch(const std::filesystem::path& vpath) {
    auto p = host(vpath);
    std::error_code ec;
    if (!std::filesystem::exists(p, ec)) {
        if (!is_directory(p.parent_path(), ec)) throw NotFoundError("no such directory: " + quoted(vpath.parent_path()));
        std::ofstream ofs(p, std::ios::binary);
        if (!ofs) throw IoError("cannot create file " + quoted(vpath));
    } else {
        last_write_time(p, file_time_type::clock::now(), ec);
        if (ec) throw IoError("cannot update " + quoted(vpath) + ": " + cause(ec));
    }
}

void FolderVfs::mkdir(const std::filesystem::path& vpath, bool recursive) {
    auto p = host(vpath);
    std::error_code ec;
    if (std::filesystem::exists(p, ec)) {
        if (recursive && is_directory(p, ec)) return;
        throw IoError("cannot create directory " + quoted(vpath) + ": File exists");
    }
    if (recursive) create_directories(p, ec); else create_directory(p, ec);
    if (ec) throw IoError("cannot create directory " + quoted(vpath) + ": " + cause(ec));
}

void FolderVfs::remove(const std::filesystem::path& vpath, bool recursive) {
    auto p = host(vpath, false);
    if (p == root_) throw IoError("refusing to remove the root directory");
    std::error_code ec;
    auto st = symlink_status(p, ec);
    if (!std::filesystem::exists(st)) throw NotFoundError("cannot remove " + quoted(vpath) + ": No such file or directory");
    if (is_directory(st) && !recursive) throw IoError("cannot remove " + quoted(vpath) + ": Is a directory");
    if (recursive) {
        remove_all(p, ec);
    } else {
        std::filesystem::remove(p, ec);
    }
    if (ec) throw IoError("cannot remove " + quoted(vpath) + ": " + cause(ec));
}

void FolderVfs::copy(const std::filesystem::path& src, const std::filesystem::path& dst) {
    auto from = host(src);
    auto to = host(dst);
    std::error_code ec;
    if (!std::filesystem::exists(from, ec)) throw NotFoundError("cannot stat " + quoted(src) + ": No such file or directory");
    if (is_directory(to, ec)) to /= from.filename();
    if (from == to) throw IoError(quoted(src) + " and " + quoted(dst) + " are the same file");
    copy_options opts = copy_options::overwrite_existing;
    if (is_directory(from, ec)) opts |= copy_options::recursive;
    std::filesystem::copy(from, to, opts, ec);
    if (ec) throw IoError("cannot copy " + quoted(src) + " to " + quoted(dst) + ": " + cause(ec));
}

void FolderVfs::move(const std::filesystem::path& src, const std::filesystem::path& dst) {
    auto from = host(src, false);
    auto to = host(dst);
    std::error_code ec;
    if (!std::filesystem::exists(symlink_status(from, ec))) throw NotFoundError("cannot stat " + quoted(src) + ": No such file or directory");
    if (is_directory(to, ec)) to /= from.filename();
    std::filesystem::rename(from, to, ec);
    if (ec) throw IoError("cannot move " + quoted(src) + " to " + quoted(dst) + ": " + cause(ec));
}

void FolderVfs::symlink(const std::filesystem::path& target, const std::filesystem::path& link) {
    auto to = host(target);
    auto at = host(link, false);
    std::error_code ec;
    create_symlink(to, at, ec);
    if (ec) throw IoError("cannot create symbolic link " + quoted(link) + ": " + cause(ec));
}

void FolderVfs::hardlink(const std::filesystem::path& src, const std::filesystem::path& dst) {
    auto from = host(src);
    auto at = host(dst, false);
    std::error_code ec;
    if (!is_regular_file(from, ec)) throw NotFoundError("cannot link " + quoted(src) + ": No such file");
    create_hard_link(from, at, ec);
    if (ec) throw IoError("cannot create link " + quoted(dst) + ": " + cause(ec));
}

std::string FolderVfs::readlink(const std::filesystem::path& vpath) const {
    auto p = host(vpath, false);
    std::error_code ec;
    if (!is_symlink(symlink_status(p, ec))) throw IoError(quoted(vpath) + " is not a symbolic link");
    auto target = read_symlink(p, ec);
    if (ec) throw IoError("cannot read link " + quoted(vpath) + ": " + cause(ec));
    if (target.is_absolute() && within_root(target.lexically_normal())) {
        return toVirtual(target).generic_string();
    }
    return target.generic_string();
}

std::filesystem::path FolderVfs::canonical(const std::filesystem::path& vpath) const {
    auto p = host(vpath);
    std::error_code ec;
    if (!std::filesystem::exists(p, ec)) throw NotFoundError(quoted(vpath) + ": No such file or directory");
    return toVirtual(p);
}

void FolderVfs::truncate(const std::filesystem::path& vpath, uintmax_t size) {
    auto p = host(vpath);
    std::error_code ec;
    if (!is_regular_file(p, ec)) throw NotFoundError("cannot open " + quoted(vpath) + ": No such file");
    resize_file(p, size, ec);
    if (ec) throw IoError("cannot truncate " + quoted(vpath) + ": " + cause(ec));
}

void FolderVfs::chmod(const std::filesystem::path& vpath, unsigned mode) {
    auto p = host(vpath);
    std::error_code ec;
    if (!std::filesystem::exists(p, ec)) throw NotFoundError("cannot access " + quoted(vpath) + ": No such file or directory");
    permissions(p, static_cast<perms>(mode & 07777), perm_options::replace, ec);
    if (ec) throw IoError("cannot change mode of " + quoted(vpath) + ": " + cause(ec));
}

void FolderVfs::chown(const std::filesystem::path& vpath, unsigned uid, unsigned gid) {
    auto p = host(vpath);
    std::error_code ec;
    if (!std::filesystem::exists(p, ec)) throw NotFoundError("cannot access " + quoted(vpath) + ": No such file or directory");
    if (::chown(p.c_str(), static_cast<uid_t>(uid), static_cast<gid_t>(gid)) != 0) {
        throw IoError("cannot change owner of " + quoted(vpath) + ": " + std::strerror(errno));
    }
}

StatInfo FolderVfs::stat(const std::filesystem::path& vpath) const {
    auto p = host(vpath);
    struct ::stat st{};
    if (::stat(p.c_str(), &st) != 0) {
        if (errno == ENOENT) throw NotFoundError("cannot stat " + quoted(vpath) + ": No such file or directory");
        throw IoError("cannot stat " + quoted(vpath) + ": " + std::strerror(errno));
    }
    std::error_code ec;
    StatInfo s;
    s.name = vpath.filename().empty() ? std::string("/") : vpath.filename().string();
    s.is_dir = S_ISDIR(st.st_mode);
    s.is_symlink = is_symlink(symlink_status(host(vpath, false), ec));
    s.size = s.is_dir ? 0 : static_cast<uintmax_t>(st.st_size);
    s.mode = st.st_mode & 07777;
    s.uid = st.st_uid;
    s.gid = st.st_gid;
    s.links = st.st_nlink;
    s.atime = st.st_atime;
    s.mtime = st.st_mtime;
    s.ctime = st.st_ctime;
    return s;
}

std::string FolderVfs::readFile(const std::filesystem::path& vpath) const {
    auto p = host(vpath);
    std::error_code ec;
    if (is_directory(p, ec)) throw IoError(quoted(vpath) + ": Is a directory");
    if (!is_regular_file(p, ec)) throw NotFoundError(quoted(vpath) + ": No such file or directory");
    std::ifstream ifs(p, std::ios::binary);
    if (!ifs) throw IoError("cannot open " + quoted(vpath) + ": " + std::strerror(errno));
    std::string data((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    return data;
}

void FolderVfs::readChunks(const std::filesystem::path& vpath, std::size_t chunk,
                           const std::function<void(const char*, std::size_t)>& sink) const {
    auto p = host(vpath);
    std::error_code ec;
    if (is_directory(p, ec)) throw IoError(quoted(vpath) + ": Is a directory");
    if (!is_regular_file(p, ec)) throw NotFoundError(quoted(vpath) + ": No such file or directory");
    std::ifstream ifs(p, std::ios::binary);
    if (!ifs) throw IoError("cannot open " + quoted(vpath) + ": " + std::strerror(errno));
    std::vector<char> buf(chunk == 0 ? 4096 : chunk);
    while (ifs) {
        ifs.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        auto got = static_cast<std::size_t>(ifs.gcount());
        if (got > 0) sink(buf.data(), got);
    }
    if (ifs.bad()) throw IoError("error reading " + quoted(vpath));
}

void FolderVfs::writeFile(const std::filesystem::path& vpath, const std::string& data, bool append) {
    auto p = host(vpath);
    std::error_code ec;
    if (is_directory(p, ec)) throw IoError(quoted(vpath) + ": Is a directory");
    create_directories(p.parent_path(), ec);
    std::ofstream ofs(p, std::ios::binary | (append ? std::ios::app : std::ios::trunc));
    if (!ofs) throw IoError("cannot write " + quoted(vpath) + ": " + std::strerror(errno));
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!ofs) throw IoError("error writing " + quoted(vpath));
}

std::filesystem::path FolderVfs::createTemp(const std::filesystem::path& dir, const std::string& prefix) {
    static const char alphabet[] = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
    std::random_device rd;
    std::mt19937 rng(rd());
    std::uniform_int_distribution<std::size_t> pick(0, sizeof(alphabet) - 2);
    mkdir(dir, true);
    for (int attempt = 0; attempt < 100; ++attempt) {
        std::string name = prefix;
        for (int i = 0; i < 6; ++i) name.push_back(alphabet[pick(rng)]);
        auto vpath = dir / name;
        auto p = host(vpath);
        std::error_code ec;
        if (std::filesystem::exists(p, ec)) continue;
        std::ofstream ofs(p, std::ios::binary);
        if (!ofs) throw IoError("cannot create temporary file in " + quoted(dir));
        return vpath;
    }
    throw IoError("cannot create temporary file in " + quoted(dir) + ": names exhausted");
}

uintmax_t FolderVfs::diskUsage(const std::filesystem::path& vpath) const {
    auto p = host(vpath);
    std::error_code ec;
    if (!std::filesystem::exists(p, ec)) throw NotFoundError("cannot access " + quoted(vpath) + ": No such file or directory");
    if (!is_directory(p, ec)) return file_size(p, ec);
    uintmax_t total = 0;
    for (recursive_directory_iterator it(p, directory_options::skip_permission_denied, ec), end; it != end; it.increment(ec)) {
        if (ec) break;
        std::error_code ec2;
        if (it->is_regular_file(ec2) && !it->is_symlink(ec2)) total += it->file_size(ec2);
    }
    return total;
}

SpaceInfo FolderVfs::space() const {
    std::error_code ec;
    auto info = std::filesystem::space(root_, ec);
    if (ec) throw IoError("cannot query filesystem: " + cause(ec));
    return SpaceInfo{info.capacity, info.free, info.available};
}
