#pragma once

#include "kit/result.hpp"
#include "kit/types.hpp"

#include <string>
#include <vector>

namespace kit {

// ============================================================================
// Installer Configuration
// ============================================================================

struct InstallerConfig {
    std::string python = "python3";  // pip backend runs "<python> -m pip"
    std::string npm = "npm";
    long timeout_ms = 900000;
    size_t output_limit = 1 << 20;
};

// argv for installing `target` with the given backend
std::vector<std::string> build_install_command(Ecosystem ecosystem,
                                               const std::string& target,
                                               const InstallerConfig& config);

// argv that exits 0 when `target` is already installed
std::vector<std::string> build_show_command(Ecosystem ecosystem,
                                            const std::string& target,
                                            const InstallerConfig& config);

// Executable each backend needs on this host
std::string installer_executable(Ecosystem ecosystem, const InstallerConfig& config);

// ============================================================================
// Installer Router
// ============================================================================

class InstallerRouter {
public:
    explicit InstallerRouter(InstallerConfig config = {});

    const InstallerConfig& config() const { return config_; }

    /// Map the record's ecosystem tag to a backend.
    /// Fails with UNSUPPORTED_ECOSYSTEM for tags outside the closed set.
    Result<Ecosystem> resolve(const PackageRecord& record) const;

    /// Run the installer for the record and capture its outcome.
    /// A non-zero exit is a successful call with InstallResult::success == false.
    /// Fails with UNSUPPORTED_ECOSYSTEM (nothing spawned) or
    /// INSTALLER_UNAVAILABLE (the process could not be started).
    Result<InstallResult> install(const PackageRecord& record) const;

    /// Ask the backend whether the record's target is already installed.
    /// Same failure codes as install().
    Result<bool> isInstalled(const PackageRecord& record) const;

private:
    InstallerConfig config_;
};

} // namespace kit
