/// @file bundle.cpp
/// @brief Bundle executable resolution and manifest reading

#include <vessel/plugin/bundle.hpp>

#include <fstream>

namespace vessel_plugin {

namespace fs = std::filesystem;

vessel_core::Result<fs::path> resolve_executable(const BundleDescriptor& bundle) {
    using ResultType = vessel_core::Result<fs::path>;

    auto invalid = [&bundle]() {
        return ResultType(vessel_core::Error(
            vessel_core::PluginError::invalid_executable_path(bundle.id, bundle.executable)));
    };

    if (bundle.executable.empty() || bundle.root_dir.empty()) {
        return invalid();
    }

    std::error_code ec;
    fs::path root = fs::absolute(bundle.root_dir, ec);
    if (ec) {
        return invalid();
    }
    root = fs::weakly_canonical(root, ec);
    if (ec) {
        return invalid();
    }

    // "/foo/bar" is interpreted inside the bundle, as "foo/bar"
    fs::path relative = fs::path(bundle.executable).relative_path();
    fs::path candidate = (root / relative).lexically_normal();

    fs::path resolved = fs::weakly_canonical(candidate, ec);
    if (ec) {
        return invalid();
    }

    fs::path inside = resolved.lexically_relative(root);
    if (inside.empty() || inside == "." || *inside.begin() == "..") {
        return invalid();
    }

    return ResultType(resolved);
}

vessel_core::Result<BundleDescriptor> load_bundle(const fs::path& dir) {
    using ResultType = vessel_core::Result<BundleDescriptor>;

    fs::path manifest_path = dir / "plugin.json";
    std::ifstream file(manifest_path);
    if (!file) {
        return ResultType(vessel_core::Error(vessel_core::ErrorCode::NotFound,
            "Cannot open " + manifest_path.string()));
    }

    auto manifest = nlohmann::json::parse(file, nullptr, false);
    if (manifest.is_discarded() || !manifest.is_object()) {
        return ResultType(vessel_core::Error(vessel_core::ErrorCode::ParseError,
            "Invalid JSON in " + manifest_path.string()));
    }

    auto id = manifest.find("id");
    if (id == manifest.end() || !id->is_string()) {
        return ResultType(vessel_core::Error(vessel_core::ErrorCode::ParseError,
            "Manifest missing 'id': " + manifest_path.string()));
    }

    BundleDescriptor bundle;
    bundle.id = id->get<std::string>();
    bundle.root_dir = dir;

    auto backend = manifest.find("backend");
    if (backend != manifest.end() && backend->is_object()) {
        auto executable = backend->find("executable");
        if (executable != backend->end() && executable->is_string()) {
            bundle.executable = executable->get<std::string>();
        }
    }

    if (bundle.executable.empty()) {
        return ResultType(vessel_core::Error(vessel_core::ErrorCode::ParseError,
            "Manifest for '" + bundle.id + "' has no backend executable"));
    }

    return ResultType(std::move(bundle));
}

} // namespace vessel_plugin
