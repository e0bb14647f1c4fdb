#include "path/GlobWalker.hpp"

#include "log/TaggedLogger.hpp"
#include "path/GlobName.hpp"

#include <set>
#include <string>

namespace fs = std::filesystem;

namespace {

using RP::GlobName;

struct Collector {
    std::vector<fs::path> found;
    std::set<std::string> seen;

    auto add(fs::path const& path) -> void {
        if (seen.insert(path.native()).second) {
            found.push_back(path);
        }
    }
};

// The empty base stands for the current directory when talking to the platform.
auto iteration_dir(fs::path const& dir) -> fs::path {
    return dir.empty() ? fs::path{"."} : dir;
}

auto is_literal(std::string_view component) -> bool {
    return !GlobName{component}.isGlob() && component.find('\\') == std::string_view::npos;
}

auto is_real_directory(fs::directory_entry const& entry) -> bool {
    std::error_code ec;
    auto const      status = entry.symlink_status(ec);
    return !ec && fs::is_directory(status);
}

auto walk(fs::path const& dir, std::vector<std::string_view> const& pattern, std::size_t index, Collector& out) -> void;

auto walk_recursive(fs::path const& dir, std::vector<std::string_view> const& pattern, std::size_t index, Collector& out)
    -> void {
    walk(dir, pattern, index + 1, out);

    auto const      root = iteration_dir(dir);
    std::error_code ec;
    fs::recursive_directory_iterator it{root, fs::directory_options::skip_permission_denied, ec};
    if (ec) {
        rp_log("Cannot enter " + root.string() + ": " + ec.message(), "Glob");
        return;
    }
    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            rp_log("Stopped walking " + root.string() + ": " + ec.message(), "Glob");
            break;
        }
        if (!is_real_directory(*it)) {
            continue;
        }
        walk(dir / it->path().lexically_relative(root), pattern, index + 1, out);
    }
}

auto walk(fs::path const& dir, std::vector<std::string_view> const& pattern, std::size_t index, Collector& out) -> void {
    if (index == pattern.size()) {
        out.add(dir);
        return;
    }

    auto const    component = pattern[index];
    bool const    last      = index + 1 == pattern.size();
    GlobName const glob{component};

    if (glob.isRecursive()) {
        walk_recursive(dir, pattern, index, out);
        return;
    }

    if (is_literal(component)) {
        auto const      candidate = dir / fs::path{component};
        std::error_code ec;
        bool const      keep = last ? fs::exists(fs::symlink_status(candidate, ec)) : fs::is_directory(candidate, ec);
        if (keep) {
            walk(candidate, pattern, index + 1, out);
        }
        return;
    }

    auto const      root = iteration_dir(dir);
    std::error_code ec;
    fs::directory_iterator it{root, fs::directory_options::skip_permission_denied, ec};
    if (ec) {
        rp_log("Cannot list " + root.string() + ": " + ec.message(), "Glob");
        return;
    }
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            rp_log("Stopped listing " + root.string() + ": " + ec.message(), "Glob");
            break;
        }
        auto const name = it->path().filename().string();
        if (!glob.match(name)) {
            continue;
        }
        if (!last) {
            std::error_code typeEc;
            if (!it->is_directory(typeEc)) {
                continue;
            }
        }
        walk(dir / name, pattern, index + 1, out);
    }
}

} // namespace

namespace RP {

auto glob_walk(fs::path const& base, std::vector<std::string_view> const& pattern) -> std::vector<fs::path> {
    Collector collector;
    if (pattern.empty()) {
        return collector.found;
    }
    walk(base, pattern, 0, collector);
    return collector.found;
}

} // namespace RP
