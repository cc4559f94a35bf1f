#include "update_source.h"

#include "fs_util.h"

namespace fwupd {

const char* source_kind_name(SourceKind k)
{
    switch (k) {
        case SourceKind::NETWORK: return "network";
        case SourceKind::LOCAL:   return "local";
    }
    return "unknown";
}

bool is_safe_manifest_path(const std::string& path)
{
    if (path.empty() || path[0] == '/') return false;
    for (char c : path) {
        const unsigned char u = (unsigned char)c;
        if (c == '\\' || u < 0x20 || u == 0x7f) return false;
    }

    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string::npos) end = path.size();
        const std::string seg = path.substr(start, end - start);
        if (seg.empty() || seg == "." || seg == "..") return false;
        start = end + 1;
    }
    return true;
}

bool is_protected_path(const FirmwareLayout& layout, const std::string& path)
{
    const std::string p = fs::to_lower(path);
    const std::string backup = fs::to_lower(layout.backup_dir);
    if (fs::basename(p) == fs::to_lower(layout.secrets_file)) return true;
    if (p == fs::to_lower(layout.version_file)) return true;
    if (p == backup) return true;
    if (p.compare(0, backup.size() + 1, backup + "/") == 0) return true;
    return false;
}

} // namespace fwupd
