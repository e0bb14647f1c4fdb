#include "path/PathBuilder.hpp"

#include <doctest/doctest.h>

#include <sstream>
#include <string>
#include <vector>

using namespace RP;

TEST_SUITE("path.builder") {
    TEST_CASE("PathBuilder accumulates segments") {
        auto built = builder("/tmp").add("app").parent().add("data").build();
        CHECK(built.raw() == "/tmp/app/../data");
        CHECK(built.string() == "/tmp/app/../data");
        CHECK(built.normalize() == RoadPath{"/tmp/data"});
        CHECK(built.normalize().raw() == "/tmp/data");
    }

    TEST_CASE("PathBuilder add takes several segments of any string type") {
        std::string const     owned = "b";
        std::string_view const view = "c";
        PathBuilder           pb{"a"};
        pb.add(owned, view, "d");
        CHECK(pb.segments() == std::vector<std::string>{"a", "b", "c", "d"});
        CHECK(pb.string() == "a/b/c/d");
    }

    TEST_CASE("PathBuilder build does not reset the builder") {
        PathBuilder pb{"/srv"};
        pb.add("www");
        auto const first = pb.build();
        pb.add("site");
        auto const second = pb.build();

        CHECK(first == RoadPath{"/srv/www"});
        CHECK(second == RoadPath{"/srv/www/site"});
        CHECK(pb.build() == second);
    }

    TEST_CASE("PathBuilder follows join rules") {
        CHECK(builder("/base").add("/etc", "hosts").build() == RoadPath{"/etc/hosts"});
        CHECK(builder().add("rel").build().string() == "rel");
        CHECK(builder().build().string() == ".");
        CHECK(builder().segments().empty());
        CHECK(builder().parent().parent().build().raw() == "../..");
    }

    TEST_CASE("PathBuilder copies are independent") {
        PathBuilder base{"/opt"};
        PathBuilder copy = base;
        copy.add("tool");
        CHECK(base.string() == "/opt");
        CHECK(copy.string() == "/opt/tool");

        std::ostringstream oss;
        oss << copy;
        CHECK(oss.str() == "/opt/tool");
    }
}
