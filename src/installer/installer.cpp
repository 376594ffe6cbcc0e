#include "kit/installer.hpp"
#include "kit/platform.hpp"
#include "kit/process.hpp"

#include <spdlog/spdlog.h>

namespace kit {

namespace {

constexpr long SHOW_TIMEOUT_MS = 60000;

} // namespace

std::vector<std::string> build_install_command(Ecosystem ecosystem,
                                               const std::string& target,
                                               const InstallerConfig& config) {
    switch (ecosystem) {
        case Ecosystem::Pip:
            return {config.python, "-m", "pip", "install", target, "-q"};
        case Ecosystem::Npm:
            return {config.npm, "install", target};
    }
    return {};
}

std::vector<std::string> build_show_command(Ecosystem ecosystem,
                                            const std::string& target,
                                            const InstallerConfig& config) {
    switch (ecosystem) {
        case Ecosystem::Pip:
            return {config.python, "-m", "pip", "show", target};
        case Ecosystem::Npm:
            return {config.npm, "ls", target, "--depth=0"};
    }
    return {};
}

std::string installer_executable(Ecosystem ecosystem, const InstallerConfig& config) {
    switch (ecosystem) {
        case Ecosystem::Pip: return config.python;
        case Ecosystem::Npm: return config.npm;
    }
    return "";
}

InstallerRouter::InstallerRouter(InstallerConfig config) : config_(std::move(config)) {}

Result<Ecosystem> InstallerRouter::resolve(const PackageRecord& record) const {
    auto ecosystem = parse_ecosystem(record.ecosystem);
    if (!ecosystem) {
        std::string tag = record.ecosystem.empty() ? "<none>" : record.ecosystem;
        return Result<Ecosystem>::err(Error(ErrorCode::UNSUPPORTED_ECOSYSTEM,
                                            "unsupported ecosystem: " + tag));
    }
    return Result<Ecosystem>::ok(*ecosystem);
}

Result<InstallResult> InstallerRouter::install(const PackageRecord& record) const {
    auto ecosystem = resolve(record);
    if (ecosystem.isErr()) {
        return Result<InstallResult>::err(ecosystem.error());
    }

    InstallResult result;
    result.package = record.name;
    result.installer = ecosystem_to_string(ecosystem.value());
    result.command = build_install_command(ecosystem.value(), record.target, config_);

    ProcessOptions options;
    options.argv = result.command;
    options.timeout_ms = config_.timeout_ms;
    options.output_limit = config_.output_limit;

    spdlog::info("installing {} via {} ({})", record.name, result.installer, record.target);
    auto proc = run_process(options);
    result.timestamp = get_current_timestamp();

    if (!proc.spawned) {
        return Result<InstallResult>::err(Error(ErrorCode::INSTALLER_UNAVAILABLE, proc.error));
    }

    result.exit_code = proc.exit_code;
    result.output = std::move(proc.output);
    result.timed_out = proc.timed_out;
    result.success = !proc.timed_out && proc.exit_code == 0;

    if (result.success) {
        spdlog::info("{} installed", record.name);
    } else if (result.timed_out) {
        spdlog::error("{} install timed out after {} ms", record.name, config_.timeout_ms);
    } else {
        spdlog::error("{} install exited with {}", record.name, result.exit_code);
    }

    return Result<InstallResult>::ok(std::move(result));
}

Result<bool> InstallerRouter::isInstalled(const PackageRecord& record) const {
    auto ecosystem = resolve(record);
    if (ecosystem.isErr()) {
        return Result<bool>::err(ecosystem.error());
    }

    ProcessOptions options;
    options.argv = build_show_command(ecosystem.value(), record.target, config_);
    options.timeout_ms = config_.timeout_ms > 0 && config_.timeout_ms < SHOW_TIMEOUT_MS
                             ? config_.timeout_ms
                             : SHOW_TIMEOUT_MS;
    options.output_limit = 64 * 1024;

    auto proc = run_process(options);
    if (!proc.spawned) {
        return Result<bool>::err(Error(ErrorCode::INSTALLER_UNAVAILABLE, proc.error));
    }
    spdlog::debug("{} show exited with {}", record.name, proc.exit_code);
    return Result<bool>::ok(!proc.timed_out && proc.exit_code == 0);
}

} // namespace kit
