#include "util/config_json_utils.hpp"

#include "worldfetch/transfer.hpp"

#include <fstream>

namespace worldfetch::config::detail {

namespace {

// Each getter: false with `err` set on a type error, true otherwise. `found`
// tells whether the key was present.
bool GetString(const nlohmann::json& j, const char* key, std::string& out, bool& found, std::string& err) {
    found = false;
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return true;
    if (!it->is_string()) {
        err = std::string("'") + key + "' must be a string";
        return false;
    }
    out = it->get<std::string>();
    found = true;
    return true;
}

bool GetInt(const nlohmann::json& j, const char* key, long long& out, bool& found, std::string& err) {
    found = false;
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return true;
    if (!(it->is_number_unsigned() || it->is_number_integer())) {
        err = std::string("'") + key + "' must be an integer";
        return false;
    }
    out = it->get<long long>();
    found = true;
    return true;
}

bool GetWorlds(const nlohmann::json& j, std::vector<std::string>& out, std::string& err) {
    auto it = j.find("worlds");
    if (it == j.end() || it->is_null()) return true;
    if (!it->is_array() || it->empty()) {
        err = "'worlds' must be a non-empty array of strings";
        return false;
    }
    std::vector<std::string> worlds;
    for (const auto& w : *it) {
        if (!w.is_string() || w.get<std::string>().empty()) {
            err = "'worlds' entries must be non-empty strings";
            return false;
        }
        worlds.push_back(w.get<std::string>());
    }
    out = std::move(worlds);
    return true;
}

bool FillDownload(const nlohmann::json& d, FetchConfig& cfg, std::string& err) {
    if (!d.is_object()) {
        err = "'download' must be an object";
        return false;
    }

    std::string mode;
    bool found = false;
    if (!GetString(d, "mode", mode, found, err)) return false;
    if (found) {
        auto m = ParseDownloadMode(mode);
        if (!m) {
            err = "unknown download mode '" + mode + "' (expected auto, parallel or single)";
            return false;
        }
        cfg.mode = *m;
    }

    long long conns = 0;
    if (!GetInt(d, "connections", conns, found, err)) return false;
    if (found) {
        if (conns < 0 || conns > kMaxConnections) {
            err = "'connections' must be between 0 and " + std::to_string(kMaxConnections);
            return false;
        }
        cfg.connections = static_cast<int>(conns);
    }
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool ParseJsonObject(const std::string& text, nlohmann::json& out, std::string& err) {
    try {
        out = nlohmann::json::parse(text);
    } catch (const std::exception& e) {
        err = std::string("invalid JSON: ") + e.what();
        return false;
    }
    if (!out.is_object()) {
        err = "root must be JSON object";
        return false;
    }
    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, FetchConfig& cfg, std::string& err) {
    bool found = false;
    if (!GetString(j, "url", cfg.url, found, err)) return false;
    if (!GetString(j, "output_dir", cfg.output_dir, found, err)) return false;
    if (!GetWorlds(j, cfg.worlds, err)) return false;

    if (auto it = j.find("download"); it != j.end() && !it->is_null()) {
        if (!FillDownload(*it, cfg, err)) return false;
    }

    std::string level;
    if (!GetString(j, "log_level", level, found, err)) return false;
    if (found) {
        auto lvl = ParseLogLevel(level);
        if (!lvl) {
            err = "unknown log_level '" + level + "'";
            return false;
        }
        cfg.log_level = *lvl;
    }

    return true;
}

} // namespace worldfetch::config::detail
