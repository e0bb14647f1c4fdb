#pragma once

#include "core/Error.hpp"
#include "path/PathParts.hpp"
#include "path/RoadPath.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace RP {

void to_json(nlohmann::json& json, PathParts const& parts);
void from_json(nlohmann::json const& json, PathParts& parts);

void to_json(nlohmann::json& json, Error const& error);

struct PathJsonOptions {
    bool includeFilesystem = true;
};

// Parsed parts of path plus, when requested, the filesystem predicates.
auto describePath(RoadPath const& path, PathJsonOptions const& options = {}) -> nlohmann::json;

// Serializes json; bytes that are not valid UTF-8 (legal in POSIX paths) become U+FFFD.
auto dumpJson(nlohmann::json const& json, int indent = -1) -> std::string;

} // namespace RP
