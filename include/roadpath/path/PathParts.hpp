#pragma once
#include <string>
#include <vector>

namespace RP {

// Decomposition of one RoadPath, produced by RoadPath::parse().
struct PathParts {
    std::string              drive;
    std::string              root;
    std::vector<std::string> parts;
    std::string              name;
    std::string              stem;
    std::string              suffix;
    std::vector<std::string> suffixes;
    std::string              parent;

    auto operator==(PathParts const&) const -> bool = default;
};

} // namespace RP
