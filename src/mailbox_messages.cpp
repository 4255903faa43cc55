#include "wormhole/mailbox_messages.hpp"
#include "wormhole/crypto.hpp"
#include "wormhole/errors.hpp"

#include <nlohmann/json.hpp>

namespace Wormhole {

namespace {

std::string optional_string(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) {
        return std::string();
    }
    if (!it->is_string()) {
        throw MalformedMessage(std::string("Invalid mailbox frame: ") + key + " is not a string.");
    }
    return it->get<std::string>();
}

} // namespace

MailboxFrame MailboxFrame::bind(const std::string& app_id, const std::string& side) {
    MailboxFrame frame;
    frame.type = "bind";
    frame.app_id = app_id;
    frame.side = side;
    return frame;
}

MailboxFrame MailboxFrame::allocate() {
    MailboxFrame frame;
    frame.type = "allocate";
    return frame;
}

MailboxFrame MailboxFrame::claim(const std::string& nameplate) {
    MailboxFrame frame;
    frame.type = "claim";
    frame.nameplate = nameplate;
    return frame;
}

MailboxFrame MailboxFrame::add(const std::string& phase, const byte_vector& body) {
    MailboxFrame frame;
    frame.type = "add";
    frame.phase = phase;
    frame.body = body;
    return frame;
}

MailboxFrame MailboxFrame::close() {
    MailboxFrame frame;
    frame.type = "close";
    return frame;
}

std::string MailboxFrame::serialize() const {
    nlohmann::json j;
    j["type"] = type;
    if (!app_id.empty()) j["appid"] = app_id;
    if (!side.empty()) j["side"] = side;
    if (!nameplate.empty()) j["nameplate"] = nameplate;
    if (!phase.empty()) j["phase"] = phase;
    if (!body.empty()) j["body"] = Crypto::to_hex(body);
    if (!error.empty()) j["error"] = error;
    return j.dump();
}

MailboxFrame MailboxFrame::deserialize(const std::string& text) {
    nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        throw MalformedMessage("Invalid mailbox frame: not a JSON object.");
    }

    MailboxFrame frame;
    frame.type = optional_string(j, "type");
    if (frame.type.empty()) {
        throw MalformedMessage("Invalid mailbox frame: missing type.");
    }
    frame.app_id = optional_string(j, "appid");
    frame.side = optional_string(j, "side");
    frame.nameplate = optional_string(j, "nameplate");
    frame.phase = optional_string(j, "phase");
    frame.error = optional_string(j, "error");

    std::string body = optional_string(j, "body");
    if (!body.empty()) {
        try {
            frame.body = Crypto::from_hex(body);
        } catch (const InvalidArgument&) {
            throw MalformedMessage("Invalid mailbox frame: body is not hex.");
        }
    }
    return frame;
}

} // namespace Wormhole
