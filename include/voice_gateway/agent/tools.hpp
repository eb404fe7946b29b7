#pragma once

#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace voice_gateway {
namespace agent {
namespace tools {

struct CheckAvailability {
    std::string day = "tomorrow";
};

struct BookMeeting {
    std::string day;
    std::string time;
    std::string contact_name;
    std::string contact_email;
};

struct RequestCallback {
    std::string day;
    std::string time;
    std::string reason;
};

struct SendBookingLink {
    std::string day;
    std::string time;
    std::string contact_name;
};

struct TransferCall {
    std::string target;
    std::string reason;
};

struct AddNote {
    std::string note;
};

struct EndCall {
    std::string outcome;
    std::string notes;
};

using Tool = std::variant<CheckAvailability,
                          BookMeeting,
                          RequestCallback,
                          SendBookingLink,
                          TransferCall,
                          AddNote,
                          EndCall>;

// Builds the typed tool for a call from the agent. Throws ToolError for an unknown
// name or missing/mistyped arguments.
Tool parse_tool(const std::string& name, const nlohmann::json& arguments);

std::string tool_name(const Tool& tool);
std::vector<std::string> tool_names();

}
}
}
