#include "path/PathBuilder.hpp"

#include <filesystem>
#include <ostream>

namespace RP {

PathBuilder::PathBuilder(std::string_view base) {
    if (!base.empty()) {
        this->parts.emplace_back(base);
    }
}

auto PathBuilder::append(std::string_view segment) -> void {
    this->parts.emplace_back(segment);
}

auto PathBuilder::parent() -> PathBuilder& {
    this->parts.emplace_back("..");
    return *this;
}

auto PathBuilder::build() const -> RoadPath {
    std::filesystem::path joined;
    for (auto const& segment : this->parts) {
        joined /= segment;
    }
    return RoadPath{std::move(joined)};
}

auto PathBuilder::segments() const noexcept -> std::vector<std::string> const& {
    return this->parts;
}

auto PathBuilder::string() const -> std::string {
    return this->build().string();
}

auto builder(std::string_view base) -> PathBuilder {
    return PathBuilder{base};
}

auto operator<<(std::ostream& os, PathBuilder const& builder) -> std::ostream& {
    return os << builder.string();
}

} // namespace RP
