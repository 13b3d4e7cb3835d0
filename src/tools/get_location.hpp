#pragma once
#include "../tool.hpp"
#include <optional>

namespace toolgate {

struct Coordinates {
    double latitude = 0.0;
    double longitude = 0.0;
    double accuracy = 0.0;  // meters
};

// Parses "lat,lon" or "lat,lon,accuracy". Returns nullopt when malformed or
// out of range.
std::optional<Coordinates> parse_coordinates(const std::string& text);

// Reports the position configured under tools.location. The backend asks
// for approval before this runs.
class GetLocationTool : public Tool {
public:
    explicit GetLocationTool(std::string location) : location_(std::move(location)) {}

    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return "get_location"; }
    std::string description() const override;
    std::string parameters_json() const override;
    bool requires_approval() const override { return true; }

private:
    std::string location_;
};

} // namespace toolgate
