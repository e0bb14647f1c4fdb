#include "path/PathFunctions.hpp"
#include "path/RoadPath.hpp"
#include "../TestEnvironment.hpp"

#include <doctest/doctest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <unistd.h>

using namespace RP;
namespace fs = std::filesystem;

namespace {

// Scratch directory tree, removed again when the fixture goes away:
//   a.txt  b.log  .hidden  sub/c.txt  sub/deep/d.txt
//   link -> sub   filelink -> a.txt   dangling -> nowhere
struct TempTree {
    TempTree() {
        static std::atomic<int> counter{0};
        auto const stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        root             = fs::temp_directory_path() / ("roadpath-test-" + std::to_string(::getpid()) + "-"
                                            + std::to_string(stamp) + "-" + std::to_string(counter++));
        fs::create_directories(root / "sub" / "deep");
        touch("a.txt");
        touch("b.log");
        touch(".hidden");
        touch("sub/c.txt");
        touch("sub/deep/d.txt");
        fs::create_directory_symlink(root / "sub", root / "link");
        fs::create_symlink(root / "a.txt", root / "filelink");
        fs::create_symlink(root / "nowhere", root / "dangling");
    }

    TempTree(TempTree const&)            = delete;
    TempTree& operator=(TempTree const&) = delete;

    ~TempTree() {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    auto path(std::string const& relative = {}) const -> RoadPath {
        return relative.empty() ? RoadPath{root} : RoadPath{root / relative};
    }

    auto names(std::vector<RoadPath> const& found) const -> std::vector<std::string> {
        std::vector<std::string> result;
        for (auto const& entry : found) {
            auto relative = entry.relative_to(this->path());
            REQUIRE(relative.has_value());
            result.push_back(relative->string());
        }
        std::sort(result.begin(), result.end());
        return result;
    }

    fs::path root;

private:
    void touch(std::string const& relative) const {
        std::ofstream out(root / relative);
        out << relative << '\n';
    }
};

} // namespace

TEST_SUITE("path.roadpath.fs") {
    TEST_CASE("Filesystem predicates") {
        TempTree tree;

        CHECK(tree.path().exists());
        CHECK(tree.path().is_dir());
        CHECK_FALSE(tree.path().is_file());

        CHECK(tree.path("a.txt").is_file());
        CHECK_FALSE(tree.path("a.txt").is_dir());
        CHECK_FALSE(tree.path("a.txt").is_symlink());

        SUBCASE("Symlinks") {
            CHECK(tree.path("link").is_symlink());
            CHECK(tree.path("link").is_dir());
            CHECK(tree.path("filelink").is_symlink());
            CHECK(tree.path("filelink").is_file());
        }

        SUBCASE("Dangling symlink") {
            CHECK(tree.path("dangling").is_symlink());
            CHECK_FALSE(tree.path("dangling").exists());
            CHECK_FALSE(tree.path("dangling").is_file());
        }

        SUBCASE("Missing entries answer false") {
            auto const missing = tree.path("missing/deeper");
            CHECK_FALSE(missing.exists());
            CHECK_FALSE(missing.is_file());
            CHECK_FALSE(missing.is_dir());
            CHECK_FALSE(missing.is_symlink());
            // A file used as a directory is not an error either
            CHECK_FALSE(tree.path("a.txt/inner").exists());
        }

        SUBCASE("Empty path is the current directory") {
            CHECK(RoadPath{""}.exists());
            CHECK(RoadPath{""}.is_dir());
        }
    }

    TEST_CASE("glob") {
        TempTree tree;
        auto const root = tree.path();

        CHECK(tree.names(root.glob("*.txt")) == std::vector<std::string>{"a.txt"});
        CHECK(tree.names(root.glob("sub/*.txt")) == std::vector<std::string>{"sub/c.txt"});
        CHECK(tree.names(root.glob("*/c.txt")) == std::vector<std::string>{"link/c.txt", "sub/c.txt"});
        CHECK(tree.names(root.glob("?.log")) == std::vector<std::string>{"b.log"});
        CHECK(tree.names(root.glob("*")) == std::vector<std::string>{".hidden", "a.txt", "b.log", "dangling",
                                                                     "filelink", "link", "sub"});

        SUBCASE("Literal components must exist") {
            CHECK(tree.names(root.glob("sub/deep/d.txt")) == std::vector<std::string>{"sub/deep/d.txt"});
            CHECK(root.glob("sub/nothing.txt").empty());
            CHECK(root.glob("missing/*").empty());
            CHECK(tree.names(root.glob("dangling")) == std::vector<std::string>{"dangling"});
        }

        SUBCASE("Recursive wildcard") {
            CHECK(tree.names(root.glob("**")) == std::vector<std::string>{".", "sub", "sub/deep"});
            CHECK(tree.names(root.glob("**/*.txt"))
                  == std::vector<std::string>{"a.txt", "sub/c.txt", "sub/deep/d.txt"});
            CHECK(tree.names(root.glob("sub/**/d.txt")) == std::vector<std::string>{"sub/deep/d.txt"});
        }

        SUBCASE("rglob prefixes the recursive wildcard") {
            CHECK(tree.names(root.rglob("*.txt")) == tree.names(root.glob("**/*.txt")));
            CHECK(tree.names(root.rglob("d.txt")) == std::vector<std::string>{"sub/deep/d.txt"});
            CHECK(root.rglob("").empty());
        }

        SUBCASE("Results are unique") {
            auto const found = root.glob("**/**/*.txt");
            CHECK(tree.names(found) == std::vector<std::string>{"a.txt", "sub/c.txt", "sub/deep/d.txt"});
        }

        SUBCASE("Absolute patterns match nothing") {
            CHECK(root.glob((tree.root / "*.txt").string()).empty());
        }

        SUBCASE("Globbing below a file matches nothing") {
            CHECK(tree.path("a.txt").glob("*").empty());
        }
    }

    TEST_CASE("resolve and absolute") {
        TempTree   tree;
        auto const canonicalRoot = RoadPath{fs::canonical(tree.root)};

        auto const viaParent = tree.path("sub/../a.txt").resolve();
        REQUIRE(viaParent.has_value());
        CHECK(*viaParent == canonicalRoot / "a.txt");

        auto const viaLink = tree.path("link/c.txt").resolve();
        REQUIRE(viaLink.has_value());
        CHECK(*viaLink == canonicalRoot / "sub" / "c.txt");

        auto const missingTail = tree.path("missing/x").resolve();
        REQUIRE(missingTail.has_value());
        CHECK(*missingTail == canonicalRoot / "missing" / "x");

        auto const absolute = RoadPath{"relative/child"}.absolute();
        REQUIRE(absolute.has_value());
        CHECK(absolute->is_absolute());
        CHECK(*absolute == RoadPath{fs::current_path() / "relative/child"});

        auto const current = RoadPath{""}.absolute();
        REQUIRE(current.has_value());
        CHECK(*current == RoadPath{fs::current_path()});

        auto const resolvedString = path::resolve((tree.root / "sub" / "deep" / "..").string());
        REQUIRE(resolvedString.has_value());
        CHECK(*resolvedString == (canonicalRoot / "sub").string());
    }

    TEST_CASE("samefile") {
        TempTree tree;
        auto const file = (tree.root / "a.txt").string();

        auto const itself = path::samefile(file, file);
        REQUIRE(itself.has_value());
        CHECK(*itself);

        auto const viaLink = path::samefile(file, (tree.root / "filelink").string());
        REQUIRE(viaLink.has_value());
        CHECK(*viaLink);

        auto const different = path::samefile(file, (tree.root / "b.log").string());
        REQUIRE(different.has_value());
        CHECK_FALSE(*different);

        auto const missing = path::samefile(file, (tree.root / "missing").string());
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error().code == Error::Code::NoSuchPath);
        CHECK(missing.error().cause == std::errc::no_such_file_or_directory);
    }

    TEST_CASE("Well-known directories") {
        auto const cwd = RoadPath::cwd();
        REQUIRE(cwd.has_value());
        CHECK(cwd->is_absolute());
        CHECK(cwd->is_dir());

        auto const temp = RoadPath::temp();
        REQUIRE(temp.has_value());
        CHECK(temp->is_dir());

        RP::Test::EnvGuard homeVar("HOME", "/home/roadpath-test");
        auto const         home = RoadPath::home();
        REQUIRE(home.has_value());
        CHECK(*home == RoadPath{"/home/roadpath-test"});
    }
}
