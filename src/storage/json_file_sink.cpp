#include "json_file_sink.hpp"
#include <ctime>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include "../core/logger/logger.hpp"

namespace Spoor {
namespace Storage {

using namespace Spoor::Core;

namespace {

std::string iso_timestamp() {
    std::time_t now = std::time(nullptr);
    std::tm     utc{};
    gmtime_r(&now, &utc);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buffer;
}

}  // namespace

JsonFileSink::JsonFileSink(std::string path, bool merge_existing)
    : path_(std::move(path)), merge_existing_(merge_existing) {
}

DedupStore JsonFileSink::load(const std::string& path) {
    DedupStore store;
    if (!std::filesystem::exists(path))
        return store;

    std::ifstream file(path);
    auto          data = nlohmann::json::parse(file, nullptr, false);
    if (data.is_discarded() || !data.is_object() || !data.contains("sites")
        || !data["sites"].is_array()) {
        Logger::warn("Ignoring unreadable existing output: " + path);
        return store;
    }

    for (const auto& site : data["sites"]) {
        if (!site.is_object() || !site.contains("key") || !site["key"].is_string())
            continue;
        std::string key = site["key"].get<std::string>();
        std::string url = site.value("url", "");
        store.insert(CanonicalEntity{std::move(key), std::move(url)});
    }
    return store;
}

bool JsonFileSink::write(const std::vector<CanonicalEntity>& entities) {
    DedupStore store;
    for (const auto& entity : entities)
        store.insert(entity);

    if (merge_existing_) {
        DedupStore previous = load(path_);
        if (!previous.empty())
            Logger::info("Merging with " + std::to_string(previous.size()) + " existing sites");
        store = previous.merge(store);
    }

    nlohmann::json sites = nlohmann::json::array();
    for (const auto& entity : store.entities())
        sites.push_back({{"key", entity.key}, {"url", entity.uri}});

    nlohmann::json out;
    out["date_export"] = iso_timestamp();
    out["total_sites"] = sites.size();
    out["sites"]       = std::move(sites);

    if (!prepare_output_path(path_))
        return false;

    std::ofstream file(path_, std::ios::trunc);
    if (!file.is_open()) {
        Logger::error("Write Error: " + path_);
        return false;
    }
    file << out.dump(2) << '\n';
    if (!file) {
        Logger::error("Write Error: " + path_);
        return false;
    }

    Logger::success("Saved " + std::to_string(store.size()) + " sites: " + path_);
    return true;
}

}  // namespace Storage
}  // namespace Spoor
