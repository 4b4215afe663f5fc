/*
 * fanout - Dual-path Inference Dispatch
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "fanout/types.hpp"

namespace fanout {

struct ServiceDescriptor {
    std::string name;
    std::string address;   // http://host:port of the service's gateway
    Capability capability = Capability::Predict;
};

/**
 * Immutable name -> descriptor table, loaded once at startup.
 *
 * Shared as std::shared_ptr<const ServiceRegistry>; a reload builds a new
 * instance and swaps the pointer, so readers never see a partial update.
 */
class ServiceRegistry final {
public:
    explicit ServiceRegistry(std::vector<ServiceDescriptor> services);

    ServiceRegistry(const ServiceRegistry&) = delete;
    ServiceRegistry& operator=(const ServiceRegistry&) = delete;

    // Parses the registry file; nullptr with error filled on failure.
    [[nodiscard]] static std::shared_ptr<const ServiceRegistry> load(const std::filesystem::path& path, std::string& error);
    [[nodiscard]] static std::shared_ptr<const ServiceRegistry> parse(const std::string& text, std::string& error);

    [[nodiscard]] std::optional<ServiceDescriptor> resolve(const std::string& name) const;
    [[nodiscard]] bool contains(const std::string& name) const noexcept { return services_.count(name) > 0; }
    [[nodiscard]] std::vector<ServiceDescriptor> list() const;
    [[nodiscard]] std::size_t size() const noexcept { return services_.size(); }

    // Names double as queue directory names.
    [[nodiscard]] static bool isValidName(const std::string& name) noexcept;

private:
    std::unordered_map<std::string, ServiceDescriptor> services_;
};

using RegistryPtr = std::shared_ptr<const ServiceRegistry>;

}
