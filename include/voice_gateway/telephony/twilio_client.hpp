#pragma once

#include <map>
#include <optional>
#include <string>

#include "voice_gateway/http/client.hpp"

namespace voice_gateway {
namespace telephony {

// Call control by provider call id, independent of the media path.
class TelephonyService {
public:
    virtual ~TelephonyService() = default;

    virtual void hangup_call(const std::string& call_sid) = 0;
    virtual void transfer_call(const std::string& call_sid, const std::string& target) = 0;
};

class MessagingService {
public:
    virtual ~MessagingService() = default;

    // Returns the provider message id.
    virtual std::string send_sms(const std::string& to, const std::string& body) = 0;
};

// Twilio REST API, 2010-04-01 version. Every call creates its own HTTP client,
// so one instance can be shared across sessions.
class TwilioClient : public TelephonyService, public MessagingService {
public:
    TwilioClient(std::string account_sid,
                 std::string auth_token,
                 std::string api_url,
                 std::optional<std::string> from_number,
                 HttpRequestOptions options = {});

    void hangup_call(const std::string& call_sid) override;
    void transfer_call(const std::string& call_sid, const std::string& target) override;
    std::string send_sms(const std::string& to, const std::string& body) override;

private:
    nlohmann::json post(const std::string& resource, const httplib::Params& params) const;

    std::string account_sid_;
    std::string auth_token_;
    std::string api_url_;
    std::optional<std::string> from_number_;
    HttpRequestOptions options_;
};

// TwiML that connects an answered call to a bidirectional media stream.
std::string build_connect_twiml(const std::string& stream_url,
                                const std::map<std::string, std::string>& parameters);

std::string build_dial_twiml(const std::string& target);

}
}
