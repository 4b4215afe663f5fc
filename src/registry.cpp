/*
 * fanout - Dual-path Inference Dispatch
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "fanout/registry.hpp"
#include "fanout/logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>

#include <nlohmann/json.hpp>

namespace fanout {

ServiceRegistry::ServiceRegistry(std::vector<ServiceDescriptor> services) {
    services_.reserve(services.size());
    for (auto& service : services) {
        std::string name = service.name;
        services_.emplace(std::move(name), std::move(service));
    }
}

std::shared_ptr<const ServiceRegistry> ServiceRegistry::load(const std::filesystem::path& path, std::string& error) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        error = "Cannot open registry file: " + path.string();
        return nullptr;
    }
    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    auto registry = parse(text, error);
    if (registry) {
        LOG_INFO("Loaded " + std::to_string(registry->size()) + " service(s) from " + path.string());
    }
    return registry;
}

std::shared_ptr<const ServiceRegistry> ServiceRegistry::parse(const std::string& text, std::string& error) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        error = std::string("Registry is not valid JSON: ") + e.what();
        return nullptr;
    }

    if (!doc.is_object() || !doc.contains("services") || !doc["services"].is_array()) {
        error = "Registry must be an object with a \"services\" array";
        return nullptr;
    }

    std::vector<ServiceDescriptor> services;
    std::unordered_map<std::string, bool> seen;
    for (const auto& entry : doc["services"]) {
        if (!entry.is_object()) {
            error = "Registry entries must be objects";
            return nullptr;
        }
        if (!entry.contains("name") || !entry["name"].is_string() ||
            !entry.contains("address") || !entry["address"].is_string()) {
            error = "Registry entry requires string \"name\" and \"address\"";
            return nullptr;
        }

        ServiceDescriptor d;
        d.name = entry["name"].get<std::string>();
        d.address = entry["address"].get<std::string>();

        if (!isValidName(d.name)) {
            error = "Invalid service name: '" + d.name + "'";
            return nullptr;
        }
        if (seen.count(d.name)) {
            error = "Duplicate service name: " + d.name;
            return nullptr;
        }
        if (d.address.rfind("http://", 0) != 0 || d.address.size() <= 7) {
            error = "Service " + d.name + " address must be an http:// URI: " + d.address;
            return nullptr;
        }
        while (!d.address.empty() && d.address.back() == '/') {
            d.address.pop_back();
        }

        std::string capability = "predict";
        if (entry.contains("capability")) {
            if (!entry["capability"].is_string()) {
                error = "Service " + d.name + " capability must be a string";
                return nullptr;
            }
            capability = entry["capability"].get<std::string>();
        }
        auto parsed = parseCapability(capability);
        if (!parsed) {
            error = "Service " + d.name + " has unknown capability: " + capability;
            return nullptr;
        }
        d.capability = *parsed;

        seen[d.name] = true;
        services.push_back(std::move(d));
    }

    return std::make_shared<const ServiceRegistry>(std::move(services));
}

std::optional<ServiceDescriptor> ServiceRegistry::resolve(const std::string& name) const {
    auto it = services_.find(name);
    if (it == services_.end()) {
        LOG_DEBUG("Registry lookup miss: " + name);
        return std::nullopt;
    }
    return it->second;
}

std::vector<ServiceDescriptor> ServiceRegistry::list() const {
    std::vector<ServiceDescriptor> out;
    out.reserve(services_.size());
    for (const auto& [name, descriptor] : services_) {
        out.push_back(descriptor);
    }
    std::sort(out.begin(), out.end(), [](const ServiceDescriptor& a, const ServiceDescriptor& b) {
        return a.name < b.name;
    });
    return out;
}

bool ServiceRegistry::isValidName(const std::string& name) noexcept {
    if (name.empty() || name.size() > 128) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-';
    });
}

}
