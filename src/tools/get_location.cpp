#include "get_location.hpp"
#include "tool_util.hpp"
#include "../plugin.hpp"
#include "../util.hpp"
#include <cmath>
#include <cstdlib>

static toolgate::ToolRegistrar reg_get_location("get_location",
    [](const toolgate::Config& config) {
        return std::make_unique<toolgate::GetLocationTool>(config.tools.location);
    });

namespace toolgate {

static bool parse_double(const std::string& s, double& out) {
    std::string t = trim(s);
    if (t.empty()) return false;
    char* end = nullptr;
    out = std::strtod(t.c_str(), &end);
    return end && *end == '\0' && std::isfinite(out);
}

std::optional<Coordinates> parse_coordinates(const std::string& text) {
    auto fields = split(text, ',');
    if (fields.size() != 2 && fields.size() != 3) return std::nullopt;

    Coordinates c;
    if (!parse_double(fields[0], c.latitude) || !parse_double(fields[1], c.longitude))
        return std::nullopt;
    if (fields.size() == 3 && !parse_double(fields[2], c.accuracy)) return std::nullopt;

    if (c.latitude < -90.0 || c.latitude > 90.0) return std::nullopt;
    if (c.longitude < -180.0 || c.longitude > 180.0) return std::nullopt;
    if (c.accuracy < 0.0) return std::nullopt;
    return c;
}

ToolResult GetLocationTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_tool_json(args_json, args)) return *err;

    if (location_.empty()) {
        return ToolResult{false, "Location is not available (tools.location is not set)"};
    }
    auto coords = parse_coordinates(location_);
    if (!coords) {
        return ToolResult{false, "Invalid configured location: " + location_};
    }

    nlohmann::json result = {
        {"latitude", coords->latitude},
        {"longitude", coords->longitude},
        {"accuracy", coords->accuracy},
        {"timestamp", epoch_millis()}
    };
    return ToolResult{true, result.dump()};
}

std::string GetLocationTool::description() const {
    return "Get the user's current location";
}

std::string GetLocationTool::parameters_json() const {
    return R"({"type":"object","properties":{}})";
}

} // namespace toolgate
