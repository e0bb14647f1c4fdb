#include "tools/PathPartsJson.hpp"

#include <doctest/doctest.h>

#include <nlohmann/json.hpp>

#include <string>
#include <system_error>
#include <vector>

using namespace RP;

TEST_SUITE_BEGIN("tools.json");

TEST_CASE("PathParts serializes every field") {
    nlohmann::json const json = RoadPath{"/srv/www/index.html"}.parse();

    CHECK(json.at("drive") == "");
    CHECK(json.at("root") == "/");
    CHECK(json.at("parts") == nlohmann::json::array({"/", "srv", "www", "index.html"}));
    CHECK(json.at("name") == "index.html");
    CHECK(json.at("stem") == "index");
    CHECK(json.at("suffix") == ".html");
    CHECK(json.at("suffixes") == nlohmann::json::array({".html"}));
    CHECK(json.at("parent") == "/srv/www");
}

TEST_CASE("PathParts with non UTF-8 bytes still serializes") {
    nlohmann::json const json = RoadPath{"a/\xff.txt"}.parse();
    CHECK(json.at("suffix") == ".txt");

    std::string text;
    REQUIRE_NOTHROW(text = dumpJson(json));
    CHECK(text.find("\"name\":\"\xEF\xBF\xBD.txt\"") != std::string::npos);
    CHECK(text.find("\"stem\":\"\xEF\xBF\xBD\"") != std::string::npos);
    CHECK(dumpJson(nlohmann::json{{"k", 1}}, 2) == "{\n  \"k\": 1\n}");
}

TEST_CASE("PathParts reads back with missing fields defaulted") {
    auto const parsed = nlohmann::json::parse(R"({"root": "/", "name": "x.tar.gz", "suffixes": [".tar", ".gz"]})")
                                .get<PathParts>();
    CHECK(parsed.root == "/");
    CHECK(parsed.name == "x.tar.gz");
    CHECK(parsed.suffixes == std::vector<std::string>{".tar", ".gz"});
    CHECK(parsed.drive.empty());
    CHECK(parsed.parts.empty());
    CHECK(parsed.parent.empty());

    auto const original = RoadPath{"rel/file.txt"}.parse();
    CHECK(nlohmann::json(original).get<PathParts>() == original);
}

TEST_CASE("Error serializes code, message and errno") {
    nlohmann::json const lexical = Error{Error::Code::InvalidSuffix, "invalid suffix 'txt'"};
    CHECK(lexical.at("code") == "invalid_suffix");
    CHECK(lexical.at("message") == "invalid suffix 'txt'");
    CHECK_FALSE(lexical.contains("errno"));

    nlohmann::json const platform = fromErrorCode(std::make_error_code(std::errc::permission_denied), "/root");
    CHECK(platform.at("code") == "invalid_permissions");
    CHECK(platform.at("errno") == static_cast<int>(std::errc::permission_denied));
}

TEST_CASE("describePath adds the lexical form and predicates") {
    auto const lexicalOnly = describePath(RoadPath{"a//b/./c.d/"}, {.includeFilesystem = false});
    CHECK(lexicalOnly.at("path") == "a/b/c.d");
    CHECK(lexicalOnly.at("is_absolute") == false);
    CHECK(lexicalOnly.at("suffix") == ".d");
    CHECK_FALSE(lexicalOnly.contains("exists"));

    auto const withFs = describePath(RoadPath{"/roadpath/definitely/missing"});
    CHECK(withFs.at("path") == "/roadpath/definitely/missing");
    CHECK(withFs.at("is_absolute") == true);
    CHECK(withFs.at("exists") == false);
    CHECK(withFs.at("is_file") == false);
    CHECK(withFs.at("is_dir") == false);
    CHECK(withFs.at("is_symlink") == false);

    auto const root = describePath(RoadPath{"/"});
    CHECK(root.at("exists") == true);
    CHECK(root.at("is_dir") == true);
    CHECK(root.at("name") == "");
}

TEST_SUITE_END();
