#include "voice_gateway/telephony/twilio_client.hpp"

#include <sstream>
#include <utility>

#include "voice_gateway/errors.hpp"
#include "voice_gateway/logging.hpp"
#include "voice_gateway/utils/http.hpp"

namespace voice_gateway::telephony {

TwilioClient::TwilioClient(std::string account_sid,
                           std::string auth_token,
                           std::string api_url,
                           std::optional<std::string> from_number,
                           HttpRequestOptions options)
    : account_sid_(std::move(account_sid)),
      auth_token_(std::move(auth_token)),
      api_url_(std::move(api_url)),
      from_number_(std::move(from_number)),
      options_(options) {}

void TwilioClient::hangup_call(const std::string& call_sid) {
    if (call_sid.empty()) {
        throw TransportError("Cannot hang up: call sid is empty");
    }
    post("Calls/" + utils::url_encode(call_sid) + ".json", {{"Status", "completed"}});
    logging::info("Call hangup requested", {kv("call_sid", call_sid)});
}

void TwilioClient::transfer_call(const std::string& call_sid, const std::string& target) {
    if (call_sid.empty()) {
        throw TransportError("Cannot transfer: call sid is empty");
    }
    post("Calls/" + utils::url_encode(call_sid) + ".json", {{"Twiml", build_dial_twiml(target)}});
    logging::info("Call transfer requested", {kv("call_sid", call_sid), kv("target", target)});
}

std::string TwilioClient::send_sms(const std::string& to, const std::string& body) {
    if (!from_number_ || from_number_->empty()) {
        throw TransportError("TWILIO_FROM_NUMBER is not configured");
    }
    const auto response = post("Messages.json", {{"To", to}, {"From", *from_number_}, {"Body", body}});
    const auto sid = response.value("sid", std::string());
    logging::info("SMS sent", {kv("to", to), kv("message_sid", sid)});
    return sid;
}

nlohmann::json TwilioClient::post(const std::string& resource, const httplib::Params& params) const {
    HttpClient client(api_url_, options_);
    client.set_basic_auth(account_sid_, auth_token_);
    const auto path = "/2010-04-01/Accounts/" + utils::url_encode(account_sid_) + "/" + resource;
    try {
        return client.post_form(path, params);
    } catch (const HttpError& ex) {
        throw TransportError("Twilio request failed: " + std::string(ex.what()));
    }
}

std::string build_connect_twiml(const std::string& stream_url,
                                const std::map<std::string, std::string>& parameters) {
    std::ostringstream out;
    out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
        << "<Response><Connect><Stream url=\"" << utils::xml_escape(stream_url) << "\">";
    for (const auto& [name, value] : parameters) {
        out << "<Parameter name=\"" << utils::xml_escape(name) << "\" value=\""
            << utils::xml_escape(value) << "\"/>";
    }
    out << "</Stream></Connect></Response>";
    return out.str();
}

std::string build_dial_twiml(const std::string& target) {
    return "<Response><Dial>" + utils::xml_escape(target) + "</Dial></Response>";
}

}
