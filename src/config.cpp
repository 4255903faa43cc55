#include "wormhole/config.hpp"
#include "wormhole/errors.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace Wormhole {

namespace {

std::chrono::seconds parse_seconds(const std::string& field, const std::string& value) {
    size_t consumed = 0;
    long long seconds = -1;
    try {
        seconds = std::stoll(value, &consumed);
    } catch (const std::logic_error&) {
        consumed = 0;
    }
    if (consumed != value.size() || seconds < 0) {
        throw InvalidArgument(field + " must be a non-negative number of seconds.");
    }
    return std::chrono::seconds(seconds);
}

void require_relay_url(const std::string& field, const std::string& value) {
    if (value.rfind("ws://", 0) != 0 && value.rfind("wss://", 0) != 0) {
        throw InvalidArgument(field + " must be a ws:// or wss:// URL.");
    }
}

} // namespace

std::string Config::default_path() {
    std::filesystem::path base;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        base = xdg;
    } else if (const char* home = std::getenv("HOME"); home && *home) {
        base = std::filesystem::path(home) / ".config";
    } else {
        base = ".";
    }
    return (base / "wormhole" / "config.json").string();
}

const std::vector<std::string>& Config::field_names() {
    static const std::vector<std::string> names = {
        "app_id",
        "rendezvous_relay",
        "transit_relay",
        "downloads_dir",
        "code_timeout",
        "key_timeout",
        "message_timeout",
        "transit_timeout",
    };
    return names;
}

std::string Config::get(const std::string& field) const {
    if (field == "app_id") return app_id;
    if (field == "rendezvous_relay") return rendezvous_relay;
    if (field == "transit_relay") return transit_relay;
    if (field == "downloads_dir") return downloads_dir;
    if (field == "code_timeout") return std::to_string(code_timeout.count());
    if (field == "key_timeout") return std::to_string(key_timeout.count());
    if (field == "message_timeout") return std::to_string(message_timeout.count());
    if (field == "transit_timeout") return std::to_string(transit_timeout.count());
    throw InvalidArgument("Unknown config field: " + field);
}

void Config::set(const std::string& field, const std::string& value) {
    if (field == "app_id") {
        if (value.empty()) {
            throw InvalidArgument("app_id must not be empty.");
        }
        app_id = value;
    } else if (field == "rendezvous_relay") {
        require_relay_url(field, value);
        rendezvous_relay = value;
    } else if (field == "transit_relay") {
        require_relay_url(field, value);
        transit_relay = value;
    } else if (field == "downloads_dir") {
        downloads_dir = value;
    } else if (field == "code_timeout") {
        code_timeout = parse_seconds(field, value);
    } else if (field == "key_timeout") {
        key_timeout = parse_seconds(field, value);
    } else if (field == "message_timeout") {
        message_timeout = parse_seconds(field, value);
    } else if (field == "transit_timeout") {
        transit_timeout = parse_seconds(field, value);
    } else {
        throw InvalidArgument("Unknown config field: " + field);
    }
}

void Config::reset(const std::string& field) {
    const Config defaults;
    set(field, defaults.get(field));
}

Config Config::load(const std::string& path) {
    Config config;

    std::ifstream in(path);
    if (!in) {
        return config;
    }

    nlohmann::json j = nlohmann::json::parse(in, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        throw RuntimeError("Could not parse config file " + path);
    }

    auto section = j.find(CONFIG_SECTION);
    if (section == j.end()) {
        return config;
    }
    if (!section->is_object()) {
        throw RuntimeError("Could not parse config file " + path);
    }

    for (const auto& field : field_names()) {
        auto value = section->find(field);
        if (value == section->end()) {
            continue;
        }
        if (value->is_string()) {
            config.set(field, value->get<std::string>());
        } else if (value->is_number_unsigned()) {
            config.set(field, std::to_string(value->get<uint64_t>()));
        } else {
            throw InvalidArgument("Invalid value for config field " + field);
        }
    }
    return config;
}

void Config::save(const std::string& path) const {
    nlohmann::json section = nlohmann::json::object();
    section["app_id"] = app_id;
    section["rendezvous_relay"] = rendezvous_relay;
    section["transit_relay"] = transit_relay;
    section["downloads_dir"] = downloads_dir;
    section["code_timeout"] = code_timeout.count();
    section["key_timeout"] = key_timeout.count();
    section["message_timeout"] = message_timeout.count();
    section["transit_timeout"] = transit_timeout.count();

    // Keep any sections written by other tools.
    nlohmann::json j = nlohmann::json::object();
    {
        std::ifstream in(path);
        if (in) {
            nlohmann::json existing = nlohmann::json::parse(in, nullptr, false);
            if (!existing.is_discarded() && existing.is_object()) {
                j = std::move(existing);
            }
        }
    }
    j[CONFIG_SECTION] = section;

    std::error_code ec;
    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw RuntimeError("Could not create " + parent.string() + ": " + ec.message());
        }
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        throw RuntimeError("Could not write config file " + path);
    }
    out << j.dump(4) << std::endl;
}

} // namespace Wormhole
