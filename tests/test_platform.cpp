#include <catch2/catch.hpp>
#include <depman/platform.hpp>

using namespace depman;

TEST_CASE("platform names", "[platform]") {
    for (Platform p : kAllPlatforms) {
        auto r = parse_platform(platform_name(p));
        REQUIRE(r.is_ok());
        REQUIRE(r.value() == p);
    }
}

TEST_CASE("platform aliases", "[platform]") {
    REQUIRE(parse_platform("macos").value() == Platform::Darwin);
    REQUIRE(parse_platform("Linux").value() == Platform::Linux);
}

TEST_CASE("unknown platform", "[platform]") {
    auto r = parse_platform("solaris");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == DepmanError::InvalidArg);
}

TEST_CASE("path separators", "[platform]") {
    REQUIRE(path_list_separator(Platform::Windows) == ';');
    REQUIRE(path_list_separator(Platform::Linux) == ':');
    REQUIRE(path_list_separator(Platform::Darwin) == ':');
}

TEST_CASE("host platform matches the build target", "[platform]") {
#if defined(__linux__)
    REQUIRE(host_platform() == Platform::Linux);
#elif defined(__APPLE__)
    REQUIRE(host_platform() == Platform::Darwin);
#endif
}
