#include "storage/virtual_path.hpp"

#include <algorithm>
#include <cctype>

namespace TierFS::Storage
{

namespace
{

std::vector<std::string_view> SplitSegments(std::string_view path)
{
    std::vector<std::string_view> segments;
    size_t pos = 0;
    while (pos <= path.size()) {
        const size_t next = path.find('/', pos);
        const size_t end  = next == std::string_view::npos ? path.size() : next;
        if (end > pos) {
            segments.push_back(path.substr(pos, end - pos));
        }
        if (next == std::string_view::npos) {
            break;
        }
        pos = next + 1;
    }
    return segments;
}

std::string JoinSegments(const std::vector<std::string_view> &segments)
{
    if (segments.empty()) {
        return "/";
    }
    std::string out;
    for (const auto &segment : segments) {
        out += '/';
        out += segment;
    }
    return out;
}

std::string Lowercase(std::string_view text)
{
    std::string out(text);
    std::ranges::transform(out, out.begin(), [](unsigned char c) {
        return std::tolower(c);
    });
    return out;
}

}  // namespace

std::string NormalizeVirtualPath(std::string_view path)
{
    std::vector<std::string_view> stack;
    for (const auto segment : SplitSegments(path)) {
        if (segment == ".") {
            continue;
        }
        if (segment == "..") {
            if (!stack.empty()) {
                stack.pop_back();
            }
            continue;
        }
        stack.push_back(segment);
    }
    return JoinSegments(stack);
}

StorageResult<std::string> ResolveVirtualPath(std::string_view path)
{
    if (path.find('\0') != std::string_view::npos) {
        return std::unexpected(make_error_code(StorageErrc::InvalidPath));
    }
    std::vector<std::string_view> stack;
    for (const auto segment : SplitSegments(path)) {
        if (segment == ".") {
            continue;
        }
        if (segment == "..") {
            if (stack.empty()) {
                return std::unexpected(make_error_code(StorageErrc::InvalidPath));
            }
            stack.pop_back();
            continue;
        }
        stack.push_back(segment);
    }
    return JoinSegments(stack);
}

std::string VirtualFileName(std::string_view path)
{
    const std::string normalized = NormalizeVirtualPath(path);
    if (normalized == "/") {
        return "/";
    }
    return normalized.substr(normalized.rfind('/') + 1);
}

std::string VirtualParent(std::string_view path)
{
    const std::string normalized = NormalizeVirtualPath(path);
    const auto slash             = normalized.rfind('/');
    if (slash == 0 || slash == std::string::npos) {
        return "/";
    }
    return normalized.substr(0, slash);
}

std::string JoinVirtualPath(std::string_view base, std::string_view name)
{
    std::string joined(base);
    joined += '/';
    joined += name;
    return NormalizeVirtualPath(joined);
}

std::string VirtualPathToKey(std::string_view path)
{
    const std::string normalized = NormalizeVirtualPath(path);
    return normalized == "/" ? std::string{} : normalized.substr(1);
}

bool IsVirtualRoot(std::string_view path) { return NormalizeVirtualPath(path) == "/"; }

bool IsWithinVirtualPath(std::string_view path, std::string_view ancestor)
{
    const std::string p = NormalizeVirtualPath(path);
    const std::string a = NormalizeVirtualPath(ancestor);
    if (a == "/") {
        return true;
    }
    return p == a || (p.size() > a.size() && p.compare(0, a.size(), a) == 0 && p[a.size()] == '/');
}

bool ListingOrderLess(const VirtualFile &lhs, const VirtualFile &rhs)
{
    if (lhs.is_directory != rhs.is_directory) {
        return lhs.is_directory;
    }
    const std::string l = Lowercase(lhs.name);
    const std::string r = Lowercase(rhs.name);
    if (l != r) {
        return l < r;
    }
    return lhs.name < rhs.name;
}

void SortDirectoryListing(std::vector<VirtualFile> &entries)
{
    std::ranges::sort(entries, ListingOrderLess);
}

}  // namespace TierFS::Storage
