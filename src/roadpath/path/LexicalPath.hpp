#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace RP {

/**
 * Read-only view of a raw path string with the purely lexical helpers shared
 * by RoadPath, the free functions and the glob walker. Nothing here touches
 * the filesystem.
 */
class LexicalPathView {
public:
    explicit LexicalPathView(std::string_view raw) noexcept;

    auto is_absolute() const noexcept -> bool { return !raw_.empty() && raw_.front() == '/'; }

    // Components without the root, skipping empty and '.' tokens.
    auto components() const -> std::vector<std::string_view>;

    // Root followed by components joined with '/', or "." when nothing is left.
    auto render() const -> std::string;

    // POSIX normpath: collapses '.', '..' and repeated separators.
    auto normalized() const -> std::string;

private:
    std::string_view raw_;
};

auto render_components(bool absolute, std::span<std::string_view const> components) -> std::string;

auto suffix_of(std::string_view name) -> std::string_view;

} // namespace RP
