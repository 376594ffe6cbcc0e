#include "kit/registry.hpp"
#include "kit/platform.hpp"

#include <spdlog/spdlog.h>

namespace kit {

namespace {

std::optional<Registry> try_load_file(const std::string& path, const char* origin,
                                      std::vector<std::string>& warnings) {
    if (path.empty() || !is_regular_file(path)) return std::nullopt;

    auto content = read_file(path);
    if (!content) {
        warnings.push_back(std::string(origin) + " registry unreadable: " + path);
        return std::nullopt;
    }

    auto parsed = parse_registry(*content, path);
    if (!parsed.ok) {
        warnings.push_back(std::string(origin) + " registry invalid (" + path + "): " + parsed.error);
        return std::nullopt;
    }
    for (auto& w : parsed.warnings) {
        warnings.push_back(std::move(w));
    }
    return std::move(parsed.registry);
}

Result<std::string> fetch_remote(const RegistrySourceOptions& options) {
    HttpTransport transport = options.transport ? options.transport : default_http_transport();

    HttpRequest request;
    request.url = options.url;
    request.timeout_ms = options.timeout_ms;

    auto response = transport(request);
    if (!response.ok) {
        return Result<std::string>::err(Error(ErrorCode::NETWORK_ERROR, response.error));
    }
    if (!response.success()) {
        return Result<std::string>::err(Error(ErrorCode::NETWORK_ERROR,
            "registry download returned HTTP " + std::to_string(response.status)));
    }
    return Result<std::string>::ok(std::move(response.body));
}

} // namespace

RegistryLoadResult load_registry(const RegistrySourceOptions& options) {
    RegistryLoadResult result;

    if (auto reg = try_load_file(options.cache_path, "cached", result.warnings)) {
        result.registry = std::move(*reg);
        result.origin = "cache";
        spdlog::debug("loaded {} packages from cache {}", result.registry.size(), options.cache_path);
        return result;
    }

    if (auto reg = try_load_file(options.bundled_path, "bundled", result.warnings)) {
        result.registry = std::move(*reg);
        result.origin = "bundled";
        spdlog::debug("loaded {} packages from bundled {}", result.registry.size(), options.bundled_path);
        return result;
    }

    if (!options.url.empty()) {
        auto body = fetch_remote(options);
        if (body.isOk()) {
            auto parsed = parse_registry(body.value(), options.url);
            if (parsed.ok) {
                for (auto& w : parsed.warnings) result.warnings.push_back(std::move(w));
                result.registry = std::move(parsed.registry);
                result.origin = "remote";
                spdlog::debug("loaded {} packages from {}", result.registry.size(), options.url);
                return result;
            }
            result.warnings.push_back("remote registry invalid: " + parsed.error);
        } else {
            result.warnings.push_back("remote registry unavailable: " + body.error().message());
        }
    }

    result.origin = "none";
    result.warnings.push_back("no package registry available");
    return result;
}

Result<Registry> update_registry(const RegistrySourceOptions& options) {
    if (options.url.empty()) {
        return Result<Registry>::err(Error(ErrorCode::CONFIG_INVALID,
                                           "no registry URL configured"));
    }
    if (options.cache_path.empty()) {
        return Result<Registry>::err(Error(ErrorCode::CONFIG_INVALID,
                                           "no registry cache path configured"));
    }

    auto body = fetch_remote(options);
    if (body.isErr()) {
        return Result<Registry>::err(body.error());
    }

    auto parsed = parse_registry(body.value(), options.cache_path);
    if (!parsed.ok) {
        return Result<Registry>::err(Error(ErrorCode::PARSE_ERROR,
                                           "remote registry invalid: " + parsed.error));
    }
    for (const auto& w : parsed.warnings) {
        spdlog::warn("registry: {}", w);
    }

    std::string dir = get_parent_directory(options.cache_path);
    if (!dir.empty() && !create_directories(dir)) {
        return Result<Registry>::err(Error(ErrorCode::IO_ERROR,
                                           "cannot create directory: " + dir));
    }

    auto written = atomic_write_file(options.cache_path, body.value());
    if (!written.ok) {
        return Result<Registry>::err(Error(ErrorCode::IO_ERROR, written.error));
    }

    spdlog::info("registry updated: {} packages written to {}",
                 parsed.registry.size(), options.cache_path);
    return Result<Registry>::ok(std::move(parsed.registry));
}

} // namespace kit
