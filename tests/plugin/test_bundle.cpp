// vessel_plugin bundle resolution tests

#include <catch2/catch.hpp>
#include <vessel/plugin/bundle.hpp>

#include "bundle_fixture.hpp"

#include <filesystem>
#include <fstream>

using namespace vessel_plugin;
using namespace vessel_core;
namespace fs = std::filesystem;

namespace {

bool is_invalid_path(const Result<fs::path>& result) {
    if (result.is_ok()) {
        return false;
    }
    const auto* err = result.error().as<PluginError>();
    return err && err->kind == PluginError::Kind::InvalidExecutablePath;
}

} // anonymous namespace

TEST_CASE("resolve_executable accepts paths inside the bundle", "[plugin][bundle]") {
    vessel_test::TempBundle bundle("demo");
    fs::path root = fs::canonical(bundle.root());

    SECTION("plain relative path") {
        auto result = resolve_executable(bundle.descriptor("server/dist/plugin.exe"));
        REQUIRE(result.is_ok());
        REQUIRE(result.value() == root / "server/dist/plugin.exe");
    }

    SECTION("executable need not exist") {
        auto result = resolve_executable(bundle.descriptor("missing.exe"));
        REQUIRE(result.is_ok());
        REQUIRE_FALSE(fs::exists(result.value()));
    }

    SECTION("dot-dot that stays inside") {
        auto result = resolve_executable(bundle.descriptor("server/../backend.exe"));
        REQUIRE(result.is_ok());
        REQUIRE(result.value() == root / "backend.exe");
    }

    SECTION("absolute path is taken relative to the root") {
        auto result = resolve_executable(bundle.descriptor("/server/plugin.exe"));
        REQUIRE(result.is_ok());
        REQUIRE(result.value() == root / "server/plugin.exe");
    }
}

TEST_CASE("resolve_executable rejects escapes", "[plugin][bundle]") {
    vessel_test::TempBundle bundle("demo");

    SECTION("parent directory") {
        REQUIRE(is_invalid_path(resolve_executable(bundle.descriptor("../outside.exe"))));
    }

    SECTION("deep escape") {
        REQUIRE(is_invalid_path(resolve_executable(bundle.descriptor("a/b/../../../outside.exe"))));
    }

    SECTION("absolute path climbing out") {
        REQUIRE(is_invalid_path(resolve_executable(bundle.descriptor("/foo/../../outside.exe"))));
    }

    SECTION("the root itself") {
        REQUIRE(is_invalid_path(resolve_executable(bundle.descriptor("."))));
    }

    SECTION("empty path") {
        REQUIRE(is_invalid_path(resolve_executable(bundle.descriptor(""))));
    }

    SECTION("symlink pointing outside") {
        vessel_test::TempBundle outside("outside");
        fs::create_directory_symlink(outside.root(), bundle.root() / "linked");
        REQUIRE(is_invalid_path(resolve_executable(bundle.descriptor("linked/plugin.exe"))));
    }
}

TEST_CASE("load_bundle reads plugin.json", "[plugin][bundle]") {
    vessel_test::TempBundle bundle("ignored");

    SECTION("valid manifest") {
        bundle.write_manifest({{"id", "com.example.demo"}, {"backend", {{"executable", "server/plugin.exe"}}}});

        auto result = load_bundle(bundle.root());
        REQUIRE(result.is_ok());
        REQUIRE(result.value().id == "com.example.demo");
        REQUIRE(result.value().root_dir == bundle.root());
        REQUIRE(result.value().executable == "server/plugin.exe");
    }

    SECTION("missing manifest") {
        auto result = load_bundle(bundle.root());
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::NotFound);
    }

    SECTION("malformed JSON") {
        std::ofstream(bundle.root() / "plugin.json") << "{ not json";
        auto result = load_bundle(bundle.root());
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ParseError);
    }

    SECTION("no backend") {
        bundle.write_manifest({{"id", "com.example.webapp-only"}});
        auto result = load_bundle(bundle.root());
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ParseError);
    }
}
