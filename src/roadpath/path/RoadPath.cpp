#include "path/RoadPath.hpp"

#include "log/TaggedLogger.hpp"
#include "path/GlobName.hpp"
#include "path/GlobWalker.hpp"
#include "path/LexicalPath.hpp"
#include "path/UserDirectory.hpp"

#include <ostream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace {

using RP::Error;
using RP::Expected;
using RP::LexicalPathView;
using RP::RoadPath;

auto single_quoted(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size() + 2);
    out.push_back('\'');
    out.append(text);
    out.push_back('\'');
    return out;
}

auto name_error(Error::Code code, std::string message) -> Error {
    return Error{code, std::move(message)};
}

// Missing entries are an expected answer for the predicates, anything else is logged.
auto is_missing(std::error_code const& ec) -> bool {
    return ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory;
}

auto query_status(fs::path const& path, bool followSymlinks) -> fs::file_status {
    std::error_code ec;
    auto const      status = followSymlinks ? fs::status(path, ec) : fs::symlink_status(path, ec);
    if (ec && !is_missing(ec)) {
        rp_log("Cannot stat " + path.string() + ": " + ec.message(), "ERROR");
    }
    return status;
}

} // namespace

namespace RP {

RoadPath::RoadPath(std::string_view path)
    : path(path) {}

RoadPath::RoadPath(char const* path)
    : path(path == nullptr ? std::string_view{} : std::string_view{path}) {}

RoadPath::RoadPath(std::string const& path)
    : path(path) {}

RoadPath::RoadPath(fs::path path)
    : path(std::move(path)) {}

auto RoadPath::cwd() -> Expected<RoadPath> {
    std::error_code ec;
    auto            current = fs::current_path(ec);
    if (ec) {
        return std::unexpected(fromErrorCode(ec, "cannot read the current directory"));
    }
    return RoadPath{std::move(current)};
}

auto RoadPath::home() -> Expected<RoadPath> {
    auto directory = user_home_directory();
    if (!directory) {
        return std::unexpected(Error{Error::Code::NotFound, "no home directory for the current user"});
    }
    return RoadPath{*directory};
}

auto RoadPath::temp() -> Expected<RoadPath> {
    std::error_code ec;
    auto            directory = fs::temp_directory_path(ec);
    if (ec) {
        return std::unexpected(fromErrorCode(ec, "cannot locate the temporary directory"));
    }
    return RoadPath{std::move(directory)};
}

auto RoadPath::string() const -> std::string {
    return LexicalPathView{this->path.native()}.render();
}

auto RoadPath::raw() const noexcept -> std::string const& {
    return this->path.native();
}

auto RoadPath::native() const noexcept -> fs::path const& {
    return this->path;
}

auto RoadPath::repr() const -> std::string {
    return "RoadPath(" + single_quoted(this->string()) + ")";
}

auto RoadPath::name() const -> std::string {
    auto const components = LexicalPathView{this->path.native()}.components();
    if (components.empty()) {
        return {};
    }
    return std::string{components.back()};
}

auto RoadPath::stem() const -> std::string {
    auto const fullName = this->name();
    auto const ext      = suffix_of(fullName);
    return fullName.substr(0, fullName.size() - ext.size());
}

auto RoadPath::suffix() const -> std::string {
    return std::string{suffix_of(this->name())};
}

auto RoadPath::suffixes() const -> std::vector<std::string> {
    std::vector<std::string> result;
    auto const               fullName = this->name();
    if (fullName.empty() || fullName.back() == '.') {
        return result;
    }

    std::string_view trimmed{fullName};
    while (!trimmed.empty() && trimmed.front() == '.') {
        trimmed.remove_prefix(1);
    }

    auto dot = trimmed.find('.');
    while (dot != std::string_view::npos) {
        auto const next = trimmed.find('.', dot + 1);
        auto const len  = (next == std::string_view::npos) ? std::string_view::npos : next - dot;
        result.emplace_back(trimmed.substr(dot, len));
        dot = next;
    }
    return result;
}

auto RoadPath::parent() const -> RoadPath {
    LexicalPathView const view{this->path.native()};
    auto                  components = view.components();
    if (components.empty()) {
        return RoadPath{view.render()};
    }
    components.pop_back();
    return RoadPath{render_components(view.is_absolute(), components)};
}

auto RoadPath::parents() const -> std::vector<RoadPath> {
    std::vector<RoadPath> result;
    auto                  current = *this;
    auto                  next    = current.parent();
    while (next != current) {
        result.push_back(next);
        current = next;
        next    = current.parent();
    }
    return result;
}

auto RoadPath::parts() const -> std::vector<std::string> {
    LexicalPathView const    view{this->path.native()};
    std::vector<std::string> result;
    if (view.is_absolute()) {
        result.emplace_back("/");
    }
    for (auto const& component : view.components()) {
        result.emplace_back(component);
    }
    return result;
}

auto RoadPath::parse() const -> PathParts {
    LexicalPathView const view{this->path.native()};
    return PathParts{.drive    = {},
                     .root     = view.is_absolute() ? "/" : "",
                     .parts    = this->parts(),
                     .name     = this->name(),
                     .stem     = this->stem(),
                     .suffix   = this->suffix(),
                     .suffixes = this->suffixes(),
                     .parent   = this->parent().string()};
}

auto RoadPath::operator/(std::string_view segment) const -> RoadPath {
    return RoadPath{this->path / fs::path{segment}};
}

auto RoadPath::operator/(char const* segment) const -> RoadPath {
    return *this / std::string_view{segment == nullptr ? "" : segment};
}

auto RoadPath::operator/(std::string const& segment) const -> RoadPath {
    return *this / std::string_view{segment};
}

auto RoadPath::operator/(RoadPath const& segment) const -> RoadPath {
    return RoadPath{this->path / segment.path};
}

auto RoadPath::join(std::span<std::string const> segments) const -> RoadPath {
    auto joined = this->path;
    for (auto const& segment : segments) {
        joined /= segment;
    }
    return RoadPath{std::move(joined)};
}

auto RoadPath::absolute() const -> Expected<RoadPath> {
    if (this->is_absolute()) {
        return *this;
    }
    auto current = RoadPath::cwd();
    if (!current) {
        return std::unexpected(current.error());
    }
    if (LexicalPathView{this->path.native()}.components().empty()) {
        return *current;
    }
    return RoadPath{current->path / fs::path{this->string()}};
}

auto RoadPath::resolve() const -> Expected<RoadPath> {
    auto absolutePath = this->absolute();
    if (!absolutePath) {
        return std::unexpected(absolutePath.error());
    }

    std::error_code ec;
    auto            canonical = fs::weakly_canonical(absolutePath->path, ec);
    if (ec) {
        rp_log("resolve failed for " + this->string() + ": " + ec.message(), "ERROR");
        return std::unexpected(fromErrorCode(ec, "cannot resolve " + single_quoted(this->string())));
    }
    return RoadPath{std::move(canonical)};
}

auto RoadPath::normalize() const -> RoadPath {
    return RoadPath{LexicalPathView{this->path.native()}.normalized()};
}

auto RoadPath::relative_to(RoadPath const& base) const -> Expected<RoadPath> {
    LexicalPathView const self{this->path.native()};
    LexicalPathView const other{base.path.native()};

    auto const selfComponents = self.components();
    auto const baseComponents = other.components();

    bool descendant = self.is_absolute() == other.is_absolute() && baseComponents.size() <= selfComponents.size();
    for (std::size_t idx = 0; descendant && idx < baseComponents.size(); ++idx) {
        descendant = baseComponents[idx] == selfComponents[idx];
    }
    if (!descendant) {
        return std::unexpected(name_error(Error::Code::NotRelative,
                                          single_quoted(this->string()) + " is not in the subpath of " + single_quoted(base.string())));
    }

    std::vector<std::string_view> const remaining(selfComponents.begin() + static_cast<std::ptrdiff_t>(baseComponents.size()),
                                                  selfComponents.end());
    return RoadPath{render_components(false, remaining)};
}

auto RoadPath::with_name(std::string_view newName) const -> Expected<RoadPath> {
    LexicalPathView const view{this->path.native()};
    auto                  components = view.components();
    if (components.empty()) {
        return std::unexpected(name_error(Error::Code::EmptyName, single_quoted(this->string()) + " has an empty name"));
    }
    if (newName.empty() || newName == "." || newName.find('/') != std::string_view::npos) {
        return std::unexpected(name_error(Error::Code::InvalidName, "invalid name " + single_quoted(newName)));
    }
    components.back() = newName;
    return RoadPath{render_components(view.is_absolute(), components)};
}

auto RoadPath::with_stem(std::string_view newStem) const -> Expected<RoadPath> {
    if (this->name().empty()) {
        return std::unexpected(name_error(Error::Code::EmptyName, single_quoted(this->string()) + " has an empty name"));
    }
    std::string newName{newStem};
    newName.append(this->suffix());
    return this->with_name(newName);
}

auto RoadPath::with_suffix(std::string_view newSuffix) const -> Expected<RoadPath> {
    if (newSuffix.find('/') != std::string_view::npos || newSuffix == "."
        || (!newSuffix.empty() && newSuffix.front() != '.')) {
        return std::unexpected(name_error(Error::Code::InvalidSuffix, "invalid suffix " + single_quoted(newSuffix)));
    }
    auto const fullName = this->name();
    if (fullName.empty()) {
        return std::unexpected(name_error(Error::Code::EmptyName, single_quoted(this->string()) + " has an empty name"));
    }
    auto const oldSuffix = suffix_of(fullName);
    std::string newName  = fullName.substr(0, fullName.size() - oldSuffix.size());
    newName.append(newSuffix);
    return this->with_name(newName);
}

auto RoadPath::match(std::string_view pattern) const -> bool {
    if (pattern.empty()) {
        return false;
    }
    LexicalPathView const patternView{pattern};
    LexicalPathView const self{this->path.native()};

    auto const patternComponents = patternView.components();
    auto const selfComponents    = self.components();

    if (patternView.is_absolute()) {
        if (!self.is_absolute() || patternComponents.size() != selfComponents.size()) {
            return false;
        }
    } else if (patternComponents.empty() || patternComponents.size() > selfComponents.size()) {
        return false;
    }

    auto const offset = selfComponents.size() - patternComponents.size();
    for (std::size_t idx = 0; idx < patternComponents.size(); ++idx) {
        if (!GlobName{patternComponents[idx]}.match(selfComponents[offset + idx])) {
            return false;
        }
    }
    return true;
}

auto RoadPath::exists() const -> bool {
    return fs::exists(query_status(this->effective(), true));
}

auto RoadPath::is_file() const -> bool {
    return fs::is_regular_file(query_status(this->effective(), true));
}

auto RoadPath::is_dir() const -> bool {
    return fs::is_directory(query_status(this->effective(), true));
}

auto RoadPath::is_symlink() const -> bool {
    return fs::is_symlink(query_status(this->effective(), false));
}

auto RoadPath::is_absolute() const -> bool {
    return this->path.is_absolute();
}

auto RoadPath::glob(std::string_view pattern) const -> std::vector<RoadPath> {
    std::vector<RoadPath> result;
    LexicalPathView const patternView{pattern};
    if (patternView.is_absolute()) {
        rp_log("glob does not accept absolute patterns: " + std::string{pattern}, "ERROR");
        return result;
    }

    auto const components = patternView.components();
    for (auto& found : glob_walk(this->path, components)) {
        result.emplace_back(std::move(found));
    }
    rp_log("glob " + single_quoted(pattern) + " under " + single_quoted(this->string()) + " matched "
               + std::to_string(result.size()) + " entries",
           "Glob");
    return result;
}

auto RoadPath::rglob(std::string_view pattern) const -> std::vector<RoadPath> {
    if (pattern.empty()) {
        return {};
    }
    std::string recursive{"**/"};
    recursive.append(pattern);
    return this->glob(recursive);
}

auto RoadPath::operator==(RoadPath const& other) const -> bool {
    LexicalPathView const self{this->path.native()};
    LexicalPathView const rhs{other.path.native()};
    return self.is_absolute() == rhs.is_absolute() && self.components() == rhs.components();
}

auto RoadPath::operator<=>(RoadPath const& other) const -> std::strong_ordering {
    return this->parts() <=> other.parts();
}

auto RoadPath::effective() const -> fs::path {
    if (this->path.empty()) {
        return fs::path{"."};
    }
    return this->path;
}

auto operator<<(std::ostream& os, RoadPath const& path) -> std::ostream& {
    return os << path.string();
}

} // namespace RP
