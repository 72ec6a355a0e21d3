#include "VirtualPath.hpp"
#include "IVfs.hpp"
#include "../core/Errors.hpp"

#include <vector>

std::filesystem::path VirtualPath::resolve(const std::string& input) const {
    return resolve(cwd_, input);
}

std::filesystem::path VirtualPath::resolve(const std::filesystem::path& base, const std::string& input) {
    std::vector<std::string> parts;
    std::string rest = input;
    bool absolute = !rest.empty() && rest[0] == '/';
    // "~" and "~/x" are relative to the root
    if (rest == "~" || rest.rfind("~/", 0) == 0) {
        absolute = true;
        rest = rest.substr(1);
    }
    if (!absolute) {
        for (const auto& seg : base.lexically_normal()) {
            auto s = seg.string();
            if (s.empty() || s == "/" || s == ".") continue;
            if (s == "..") { if (!parts.empty()) parts.pop_back(); continue; }
            parts.push_back(s);
        }
    }
    std::size_t pos = 0;
    while (pos <= rest.size()) {
        std::size_t end = rest.find('/', pos);
        if (end == std::string::npos) end = rest.size();
        std::string seg = rest.substr(pos, end - pos);
        pos = end + 1;
        if (seg.empty() || seg == ".") continue;
        if (seg == "..") {
            if (!parts.empty()) parts.pop_back();
            continue;
        }
        parts.push_back(seg);
    }
    std::filesystem::path out("/");
    for (const auto& p : parts) out /= p;
    return out;
}

void VirtualPath::change_directory(const std::string& input, const IVfs& vfs) {
    auto target = resolve(input);
    if (!vfs.isDirectory(target)) {
        throw NotFoundError("directory not found: " + input);
    }
    cwd_ = target;
}
