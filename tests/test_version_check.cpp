#include <catch2/catch.hpp>
#include <depman/version_check.hpp>

using namespace depman;

// ===== classify_version =====

TEST_CASE("absent version is not installed", "[version_check]") {
    auto c = classify_version(std::nullopt, "1.2.3", "^1.0.0");
    REQUIRE_FALSE(c.compatible);
    REQUIRE(c.update == UpdateKind::NotInstalled);
    REQUIRE_FALSE(c.error.has_value());
}

TEST_CASE("exact match without constraint is compatible", "[version_check]") {
    for (const char* ver : {"0.0.1", "1.2.3", "10.20.30", "3.11.4"}) {
        auto c = classify_version(std::string(ver), ver, "");
        INFO(ver);
        REQUIRE(c.compatible);
        REQUIRE(c.update == UpdateKind::NoUpdate);
    }
}

TEST_CASE("patch-only difference is a patch update", "[version_check]") {
    auto c = classify_version(std::string("1.2.3"), "1.2.7", "");
    REQUIRE_FALSE(c.compatible);
    REQUIRE(c.update == UpdateKind::PatchUpdate);

    c = classify_version(std::string("0.0.0"), "0.0.1", "");
    REQUIRE(c.update == UpdateKind::PatchUpdate);
}

TEST_CASE("major difference wins when all components differ", "[version_check]") {
    auto c = classify_version(std::string("1.2.3"), "2.0.0", "");
    REQUIRE_FALSE(c.compatible);
    REQUIRE(c.update == UpdateKind::MajorUpdate);
}

TEST_CASE("minor difference", "[version_check]") {
    auto c = classify_version(std::string("3.10.9"), "3.11.4", "");
    REQUIRE(c.update == UpdateKind::MinorUpdate);
}

TEST_CASE("constraint decides compatibility, required decides update", "[version_check]") {
    auto c = classify_version(std::string("3.11.2"), "3.11.4", "^3.11.0");
    REQUIRE(c.compatible);
    REQUIRE(c.update == UpdateKind::PatchUpdate);

    c = classify_version(std::string("3.10.0"), "3.11.4", "^3.11.0");
    REQUIRE_FALSE(c.compatible);
    REQUIRE(c.update == UpdateKind::MinorUpdate);
}

TEST_CASE("newer than required is still an update kind", "[version_check]") {
    auto c = classify_version(std::string("4.0.0"), "3.11.4", ">=3.0.0");
    REQUIRE(c.compatible);
    REQUIRE(c.update == UpdateKind::MajorUpdate);
}

TEST_CASE("prerelease of installed tool ignored for release requirement", "[version_check]") {
    auto c = classify_version(std::string("1.2.3-rc1"), "1.2.3", "");
    REQUIRE(c.compatible);
    REQUIRE(c.update == UpdateKind::NoUpdate);

    c = classify_version(std::string("1.2.3-rc1"), "1.2.3-rc2", "");
    REQUIRE_FALSE(c.compatible);
    REQUIRE(c.update == UpdateKind::PatchUpdate);
}

TEST_CASE("unparsable installed version", "[version_check]") {
    auto c = classify_version(std::string("banana"), "1.2.3", "");
    REQUIRE_FALSE(c.compatible);
    REQUIRE(c.update == UpdateKind::MajorUpdate);
    REQUIRE(c.error.has_value());
    REQUIRE(c.error->code == DepmanError::InvalidVersionFormat);
}

TEST_CASE("invalid required version", "[version_check]") {
    auto c = classify_version(std::string("1.2.3"), "latest", "");
    REQUIRE_FALSE(c.compatible);
    REQUIRE(c.error.has_value());
    REQUIRE(c.error->code == DepmanError::InvalidVersionFormat);
}

TEST_CASE("invalid constraint", "[version_check]") {
    auto c = classify_version(std::string("1.2.3"), "1.2.3", "~>1.2");
    REQUIRE_FALSE(c.compatible);
    REQUIRE(c.error.has_value());
    REQUIRE(c.error->code == DepmanError::InvalidVersionFormat);
}

TEST_CASE("classification is deterministic", "[version_check]") {
    auto a = classify_version(std::string("2.1.0"), "2.3.1", "^2.0.0");
    auto b = classify_version(std::string("2.1.0"), "2.3.1", "^2.0.0");
    REQUIRE(a.compatible == b.compatible);
    REQUIRE(a.update == b.update);
}

// ===== extract_version =====

TEST_CASE("extract version from tool output", "[version_check]") {
    REQUIRE(extract_version("Python 3.11.4\n") == std::optional<std::string>("3.11.4"));
    REQUIRE(extract_version("git version 2.43.0") == std::optional<std::string>("2.43.0"));
    REQUIRE(extract_version("v18.19.0") == std::optional<std::string>("18.19.0"));
    REQUIRE(extract_version("go version go1.21 linux/amd64") ==
            std::optional<std::string>("1.21.0"));
    REQUIRE(extract_version("tool 1.0.0-beta.2 (abc)") ==
            std::optional<std::string>("1.0.0-beta.2"));
}

TEST_CASE("extract version finds nothing", "[version_check]") {
    REQUIRE_FALSE(extract_version("").has_value());
    REQUIRE_FALSE(extract_version("command ok").has_value());
}

TEST_CASE("update kind names", "[version_check]") {
    REQUIRE(std::string(update_kind_name(UpdateKind::NoUpdate)) == "none");
    REQUIRE(std::string(update_kind_name(UpdateKind::MajorUpdate)) == "major update");
}
