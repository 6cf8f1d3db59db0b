//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of Netboot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <hal_posix/file_path.h>
#include <cerrno>
#include <sys/stat.h>
#include <vector>

static const char PATH_SEP = '/';

std::string netboot::util::clean_path(const char* path)
{
    std::vector<std::string> parts;
    std::string token;
    if (!path) return std::string();

    // Split on separators, resolving each token as it is completed.
    // ".." at the root stays at the root.
    for (const char* ptr = path ; ; ++ptr) {
        if (*ptr && *ptr != PATH_SEP) {
            token.push_back(*ptr);
            continue;
        }
        if (token == "..") {
            if (!parts.empty()) parts.pop_back();
        } else if (!token.empty() && token != ".") {
            parts.push_back(token);
        }
        token.clear();
        if (!*ptr) break;
    }

    std::string result;
    for (auto it = parts.begin() ; it != parts.end() ; ++it) {
        if (!result.empty()) result.push_back(PATH_SEP);
        result += *it;
    }
    return result;
}

std::string netboot::util::join_path(
    const std::string& root, const std::string& rel)
{
    if (rel.empty()) return root;
    if (root.empty()) return rel;
    if (root[root.size()-1] == PATH_SEP) return root + rel;
    return root + PATH_SEP + rel;
}

std::string netboot::util::parent_dir(const std::string& path)
{
    // Ignore trailing separators, then cut at the last one.
    std::size_t end = path.find_last_not_of(PATH_SEP);
    if (end == std::string::npos)
        return path.empty() ? std::string(".") : std::string(1, PATH_SEP);
    std::size_t sep = path.find_last_of(PATH_SEP, end);
    if (sep == std::string::npos) return std::string(".");
    std::size_t last = path.find_last_not_of(PATH_SEP, sep);
    if (last == std::string::npos) return std::string(1, PATH_SEP);
    return path.substr(0, last + 1);
}

bool netboot::util::make_dirs(const std::string& path, mode_t mode)
{
    struct stat info;
    if (path.empty()) return false;
    if (stat(path.c_str(), &info) == 0) return S_ISDIR(info.st_mode);

    // Create parents first, stopping at the filesystem root.
    std::string parent = parent_dir(path);
    if (parent != path && parent != "." && parent != "/") {
        if (!make_dirs(parent, mode)) return false;
    }

    // Another process may have created the same directory.
    if (mkdir(path.c_str(), mode) == 0) return true;
    return (errno == EEXIST)
        && (stat(path.c_str(), &info) == 0)
        && S_ISDIR(info.st_mode);
}
