/*
 * persistent_cache.cpp
 *
 * Copyright (C) 2024 weave contributors
 */

#include "persistent_cache.hpp"

#include <cstdint>
#include <fstream>
#include <system_error>

namespace weave::cache {

namespace {
auto nowMillis() -> std::int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

auto resolveDirectory(std::filesystem::path directory)
    -> std::filesystem::path {
    if (!directory.empty()) {
        return directory;
    }
    std::error_code ec;
    auto temp = std::filesystem::temp_directory_path(ec);
    if (ec) {
        spdlog::warn("No temp directory available ({}), using cwd",
                     ec.message());
        return std::filesystem::path{"."};
    }
    return temp;
}
}  // namespace

JsonFileStore::JsonFileStore(std::filesystem::path directory,
                             const std::string& ns)
    : file_(resolveDirectory(std::move(directory)) / (ns + ".json")) {
    spdlog::debug("Persistent cache namespace {} stored in {}", ns,
                  file_.string());
}

auto JsonFileStore::get(const std::string& key)
    -> std::optional<nlohmann::json> {
    std::lock_guard lock(mutex_);
    auto document = load();
    auto it = document.find(key);
    if (it == document.end()) {
        return std::nullopt;
    }

    try {
        auto expires_at = it->value("expiresAt", std::int64_t{0});
        if (nowMillis() > expires_at || !it->contains("value")) {
            document.erase(it);
            save(document);
            return std::nullopt;
        }
        return it->at("value");
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Malformed cache entry {} in {}: {}", key,
                     file_.string(), e.what());
        return std::nullopt;
    }
}

void JsonFileStore::set(const std::string& key, const nlohmann::json& value,
                        std::chrono::milliseconds ttl) {
    std::lock_guard lock(mutex_);
    auto document = load();
    document[key] = {{"value", value},
                     {"expiresAt", nowMillis() + ttl.count()}};
    save(document);
}

void JsonFileStore::remove(const std::string& key) {
    std::lock_guard lock(mutex_);
    auto document = load();
    if (document.erase(key) > 0) {
        save(document);
    }
}

void JsonFileStore::clear() {
    std::lock_guard lock(mutex_);
    std::error_code ec;
    std::filesystem::remove(file_, ec);
    if (ec) {
        spdlog::warn("Failed to remove {}: {}", file_.string(), ec.message());
    }
}

auto JsonFileStore::load() const -> nlohmann::json {
    std::ifstream in(file_);
    if (!in) {
        return nlohmann::json::object();
    }
    auto document = nlohmann::json::parse(in, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        spdlog::warn("Ignoring corrupt cache file {}", file_.string());
        return nlohmann::json::object();
    }
    return document;
}

void JsonFileStore::save(const nlohmann::json& document) const {
    auto temp = file_;
    temp += ".tmp";
    {
        std::ofstream out(temp, std::ios::trunc);
        if (!out) {
            spdlog::warn("Cannot write cache file {}", temp.string());
            return;
        }
        try {
            out << document.dump();
        } catch (const nlohmann::json::exception& e) {
            spdlog::warn("Cannot serialize cache file {}: {}", file_.string(),
                         e.what());
            return;
        }
        if (!out) {
            spdlog::warn("Short write to cache file {}", temp.string());
            return;
        }
    }
    std::error_code ec;
    std::filesystem::rename(temp, file_, ec);
    if (ec) {
        spdlog::warn("Failed to replace {}: {}", file_.string(), ec.message());
        std::filesystem::remove(temp, ec);
    }
}

}  // namespace weave::cache
