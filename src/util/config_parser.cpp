#include "util/config_parser.hpp"

#include "util/config_json_utils.hpp"

namespace worldfetch::config {

void FetchConfig::Reset() {
    url.clear();
    output_dir.clear();
    worlds.clear();
    mode.reset();
    connections.reset();
    log_level.reset();
}

Result FetchConfig::LoadFile(const std::string& path) {
    Reset();

    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        return Result::Fail(-1, "config: " + err);
    }

    if (!detail::FillConfigFromJson(json, *this, err)) {
        return Result::Fail(-1, "config: " + err + " in " + path);
    }

    return Result::Ok();
}

Result FetchConfig::LoadString(const std::string& json_text) {
    Reset();

    nlohmann::json json;
    std::string err;
    if (!detail::ParseJsonObject(json_text, json, err) || !detail::FillConfigFromJson(json, *this, err)) {
        return Result::Fail(-1, "config: " + err);
    }
    return Result::Ok();
}

} // namespace worldfetch::config
