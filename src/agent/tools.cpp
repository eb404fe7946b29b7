#include "voice_gateway/agent/tools.hpp"

#include <functional>
#include <unordered_map>

#include "voice_gateway/errors.hpp"

namespace voice_gateway::agent::tools {

namespace {

using Parser = std::function<Tool(const nlohmann::json&)>;

std::string required_arg(const nlohmann::json& args, const char* key) {
    const auto it = args.find(key);
    if (it == args.end() || it->is_null()) {
        throw ToolError(std::string("missing argument '") + key + "'");
    }
    if (!it->is_string()) {
        throw ToolError(std::string("argument '") + key + "' must be a string");
    }
    if (it->get<std::string>().empty()) {
        throw ToolError(std::string("argument '") + key + "' must not be empty");
    }
    return it->get<std::string>();
}

std::string optional_arg(const nlohmann::json& args, const char* key, const std::string& fallback = "") {
    const auto it = args.find(key);
    if (it == args.end() || it->is_null()) {
        return fallback;
    }
    if (!it->is_string()) {
        throw ToolError(std::string("argument '") + key + "' must be a string");
    }
    return it->get<std::string>();
}

const std::unordered_map<std::string, Parser>& parsers() {
    static const std::unordered_map<std::string, Parser> table = {
        {"check_availability", [](const nlohmann::json& args) -> Tool {
             return CheckAvailability{optional_arg(args, "day", "tomorrow")};
         }},
        {"book_meeting", [](const nlohmann::json& args) -> Tool {
             return BookMeeting{required_arg(args, "day"), required_arg(args, "time"),
                                required_arg(args, "contact_name"), required_arg(args, "contact_email")};
         }},
        {"request_callback", [](const nlohmann::json& args) -> Tool {
             return RequestCallback{required_arg(args, "day"), required_arg(args, "time"),
                                    optional_arg(args, "reason")};
         }},
        {"send_booking_link", [](const nlohmann::json& args) -> Tool {
             return SendBookingLink{required_arg(args, "day"), required_arg(args, "time"),
                                    required_arg(args, "contact_name")};
         }},
        {"transfer_call", [](const nlohmann::json& args) -> Tool {
             return TransferCall{optional_arg(args, "target"), optional_arg(args, "reason")};
         }},
        {"add_note", [](const nlohmann::json& args) -> Tool {
             return AddNote{required_arg(args, "note")};
         }},
        {"end_call", [](const nlohmann::json& args) -> Tool {
             return EndCall{required_arg(args, "outcome"), optional_arg(args, "notes")};
         }},
    };
    return table;
}

struct NameVisitor {
    std::string operator()(const CheckAvailability&) const { return "check_availability"; }
    std::string operator()(const BookMeeting&) const { return "book_meeting"; }
    std::string operator()(const RequestCallback&) const { return "request_callback"; }
    std::string operator()(const SendBookingLink&) const { return "send_booking_link"; }
    std::string operator()(const TransferCall&) const { return "transfer_call"; }
    std::string operator()(const AddNote&) const { return "add_note"; }
    std::string operator()(const EndCall&) const { return "end_call"; }
};

}

Tool parse_tool(const std::string& name, const nlohmann::json& arguments) {
    const auto& table = parsers();
    const auto it = table.find(name);
    if (it == table.end()) {
        throw ToolError("unknown tool '" + name + "'");
    }
    if (!arguments.is_object() && !arguments.is_null()) {
        throw ToolError("arguments for '" + name + "' must be an object");
    }
    try {
        return it->second(arguments.is_null() ? nlohmann::json::object() : arguments);
    } catch (const ToolError& ex) {
        throw ToolError(name + ": " + ex.what());
    }
}

std::string tool_name(const Tool& tool) {
    return std::visit(NameVisitor{}, tool);
}

std::vector<std::string> tool_names() {
    std::vector<std::string> names;
    for (const auto& entry : parsers()) {
        names.push_back(entry.first);
    }
    return names;
}

}
