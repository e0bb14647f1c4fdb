#include "path/LexicalPath.hpp"

#include <filesystem>

namespace RP {

LexicalPathView::LexicalPathView(std::string_view raw) noexcept
    : raw_(raw) {}

auto LexicalPathView::components() const -> std::vector<std::string_view> {
    std::vector<std::string_view> components;
    std::size_t                   pos  = 0;
    auto const                    size = raw_.size();

    while (pos < size) {
        auto next = raw_.find('/', pos);
        auto end  = (next == std::string_view::npos) ? size : next;

        auto token = raw_.substr(pos, end - pos);
        if (!token.empty() && token != ".") {
            components.push_back(token);
        }

        if (next == std::string_view::npos) {
            break;
        }
        pos = next + 1;
    }

    return components;
}

auto LexicalPathView::render() const -> std::string {
    auto const components = this->components();
    return render_components(this->is_absolute(), components);
}

auto LexicalPathView::normalized() const -> std::string {
    if (raw_.empty()) {
        return ".";
    }
    auto normal = std::filesystem::path{raw_}.lexically_normal().string();
    while (normal.size() > 1 && normal.back() == '/') {
        normal.pop_back();
    }
    if (normal.empty()) {
        return ".";
    }
    return normal;
}

auto render_components(bool absolute, std::span<std::string_view const> components) -> std::string {
    std::string result;
    std::size_t required = absolute ? 1 : 0;
    for (auto const& comp : components) {
        required += comp.size() + 1;
    }
    result.reserve(required);

    if (absolute) {
        result.push_back('/');
    }
    for (std::size_t i = 0; i < components.size(); ++i) {
        if (i > 0) {
            result.push_back('/');
        }
        result.append(components[i]);
    }
    if (result.empty()) {
        result.push_back('.');
    }
    return result;
}

auto suffix_of(std::string_view name) -> std::string_view {
    auto const dot = name.rfind('.');
    if (dot == std::string_view::npos || dot == 0 || dot + 1 == name.size()) {
        return {};
    }
    return name.substr(dot);
}

} // namespace RP
