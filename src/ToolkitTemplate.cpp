#include "ToolkitTemplate.h"

#include <set>
#include <string>

#include "Errors.h"

namespace kitcheck {

void ToolkitTemplate::validateForAnalysis() const
{
    if (referenceSize.width < 0 || referenceSize.height < 0) {
        throw ConfigurationError("Template '" + templateId + "' has negative reference dimensions");
    }

    std::set<std::string> seen;
    std::set<int> slots;
    for (const ToolDefinition &tool : tools) {
        if (!tool.region) {
            throw ConfigurationError("Template '" + templateId + "': tool '" + tool.toolId +
                                     "' has no region defined");
        }
        if (!isWellFormed(*tool.region)) {
            throw ConfigurationError("Template '" + templateId + "': tool '" + tool.toolId +
                                     "' has a degenerate region");
        }
        if (!seen.insert(tool.toolId).second) {
            throw ConfigurationError("Template '" + templateId + "': duplicate tool id '" + tool.toolId + "'");
        }
        if (tool.slotIndex <= 0) {
            throw ConfigurationError("Template '" + templateId + "': tool '" + tool.toolId +
                                     "' has invalid slot index " + std::to_string(tool.slotIndex));
        }
        if (!slots.insert(tool.slotIndex).second) {
            throw ConfigurationError("Template '" + templateId + "': slot " + std::to_string(tool.slotIndex) +
                                     " is used by more than one tool");
        }
    }
}

std::string toString(FoamColor color)
{
    switch (color) {
    case FoamColor::DarkGrey:
        return "dark_grey";
    case FoamColor::Black:
        return "black";
    case FoamColor::Yellow:
        return "yellow";
    case FoamColor::Red:
        return "red";
    case FoamColor::Blue:
        return "blue";
    }
    return "dark_grey";
}

FoamColor foamColorFromString(const std::string &value, FoamColor fallback)
{
    if (value == "dark_grey") {
        return FoamColor::DarkGrey;
    }
    if (value == "black") {
        return FoamColor::Black;
    }
    if (value == "yellow") {
        return FoamColor::Yellow;
    }
    if (value == "red") {
        return FoamColor::Red;
    }
    if (value == "blue") {
        return FoamColor::Blue;
    }
    return fallback;
}

} // namespace kitcheck
