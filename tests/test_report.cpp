#include <catch2/catch.hpp>
#include <depman/report.hpp>

using namespace depman;

static DependencyStatus status(DependencyState state, bool installed = false,
                               const std::string& version = "") {
    DependencyStatus st;
    st.state = state;
    st.installed = installed;
    st.current_version = version;
    st.compatible = state == DependencyState::Satisfied || state == DependencyState::Installed;
    return st;
}

TEST_CASE("describe terminal states", "[report]") {
    REQUIRE(describe_status(status(DependencyState::Satisfied, true, "2.43.0")) ==
            "satisfied (2.43.0)");
    REQUIRE(describe_status(status(DependencyState::Installed, true, "1.7.1")) ==
            "installed (1.7.1)");
    REQUIRE(describe_status(status(DependencyState::Cancelled)) == "cancelled");
}

TEST_CASE("describe pending work", "[report]") {
    REQUIRE(describe_status(status(DependencyState::NeedsInstall)) == "not installed");

    auto st = status(DependencyState::NeedsInstall, true, "3.10.2");
    st.required_update = UpdateKind::MinorUpdate;
    REQUIRE(describe_status(st) == "3.10.2 installed, minor update needed");
}

TEST_CASE("describe failure includes the error", "[report]") {
    auto st = status(DependencyState::Failed);
    st.error = DepmanError{DepmanError::PrerequisiteFailed, "blocked by 'b'"};
    REQUIRE(describe_status(st) == "failed: error[PrerequisiteFailed]: blocked by 'b'");
}

TEST_CASE("attention needed unless satisfied or installed", "[report]") {
    REQUIRE_FALSE(needs_attention(status(DependencyState::Satisfied)));
    REQUIRE_FALSE(needs_attention(status(DependencyState::Installed)));
    REQUIRE(needs_attention(status(DependencyState::NeedsInstall)));
    REQUIRE(needs_attention(status(DependencyState::Failed)));
    REQUIRE(needs_attention(status(DependencyState::Cancelled)));
}

TEST_CASE("report follows the given order", "[report]") {
    RunReport report;
    report.order = {"b", "a", "missing"};
    report.statuses["b"] = status(DependencyState::Satisfied, true, "1.0.0");
    report.statuses["a"] = status(DependencyState::NeedsInstall);
    REQUIRE(format_report(report) ==
            "- b: satisfied (1.0.0)\n- a: not installed\n");
}
