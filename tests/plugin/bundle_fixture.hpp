// Temporary plugin bundles for the plugin tests

#pragma once

#include <vessel/plugin/types.hpp>

#include <nlohmann/json.hpp>

#include <stdlib.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace vessel_test {

/// Paths of the test backends, injected by the build
inline const char* k_echo_backend = VESSEL_TEST_ECHO_BACKEND;
inline const char* k_spin_backend = VESSEL_TEST_SPIN_BACKEND;
inline const char* k_exit_backend = VESSEL_TEST_EXIT_BACKEND;

/// A bundle directory under the system temp dir, removed on destruction.
/// The backend (if any) is copied in as "backend.exe".
class TempBundle {
public:
    explicit TempBundle(std::string id, const std::filesystem::path& backend = {})
        : m_id(std::move(id)) {
        std::string pattern = (std::filesystem::temp_directory_path() / "vessel-bundle-XXXXXX").string();
        if (::mkdtemp(pattern.data()) == nullptr) {
            throw std::runtime_error("mkdtemp failed for " + pattern);
        }
        m_root = pattern;

        if (!backend.empty()) {
            auto target = m_root / "backend.exe";
            std::filesystem::copy_file(backend, target);
            std::filesystem::permissions(target, std::filesystem::perms::owner_all,
                std::filesystem::perm_options::add);
        }
    }

    ~TempBundle() {
        std::error_code ec;
        std::filesystem::remove_all(m_root, ec);
    }

    TempBundle(const TempBundle&) = delete;
    TempBundle& operator=(const TempBundle&) = delete;

    [[nodiscard]] const std::filesystem::path& root() const { return m_root; }

    [[nodiscard]] vessel_plugin::BundleDescriptor descriptor(const std::string& executable = "backend.exe") const {
        return vessel_plugin::BundleDescriptor{m_id, m_root, executable};
    }

    void write_manifest(const nlohmann::json& manifest) const {
        std::ofstream out(m_root / "plugin.json");
        out << manifest.dump(2);
    }

private:
    std::string m_id;
    std::filesystem::path m_root;
};

} // namespace vessel_test
