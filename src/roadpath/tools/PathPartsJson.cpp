#include "tools/PathPartsJson.hpp"

namespace RP {

void to_json(nlohmann::json& json, PathParts const& parts) {
    json = nlohmann::json{
        {"drive", parts.drive},
        {"root", parts.root},
        {"parts", parts.parts},
        {"name", parts.name},
        {"stem", parts.stem},
        {"suffix", parts.suffix},
        {"suffixes", parts.suffixes},
        {"parent", parts.parent},
    };
}

void from_json(nlohmann::json const& json, PathParts& parts) {
    parts.drive    = json.value("drive", std::string{});
    parts.root     = json.value("root", std::string{});
    parts.parts    = json.value("parts", std::vector<std::string>{});
    parts.name     = json.value("name", std::string{});
    parts.stem     = json.value("stem", std::string{});
    parts.suffix   = json.value("suffix", std::string{});
    parts.suffixes = json.value("suffixes", std::vector<std::string>{});
    parts.parent   = json.value("parent", std::string{});
}

void to_json(nlohmann::json& json, Error const& error) {
    json = nlohmann::json{{"code", std::string{errorCodeToString(error.code)}}};
    if (error.message) {
        json["message"] = *error.message;
    }
    if (error.cause) {
        json["errno"] = error.cause.value();
    }
}

auto describePath(RoadPath const& path, PathJsonOptions const& options) -> nlohmann::json {
    nlohmann::json json = path.parse();
    json["path"]        = path.string();
    json["is_absolute"] = path.is_absolute();
    if (options.includeFilesystem) {
        json["exists"]     = path.exists();
        json["is_file"]    = path.is_file();
        json["is_dir"]     = path.is_dir();
        json["is_symlink"] = path.is_symlink();
    }
    return json;
}

auto dumpJson(nlohmann::json const& json, int indent) -> std::string {
    return json.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace RP
