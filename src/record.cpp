#include "wormhole/record.hpp"
#include "wormhole/errors.hpp"

#include <nlohmann/json.hpp>

namespace Wormhole {

byte_vector AckRecord::encode() const {
    nlohmann::json j;
    j["ack"] = ack;
    if (sha256) {
        j["sha256"] = *sha256;
    }
    std::string text = j.dump();
    return byte_vector(text.begin(), text.end());
}

AckRecord AckRecord::decode(const byte_vector& data) {
    nlohmann::json j = nlohmann::json::parse(data.begin(), data.end(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        throw MalformedMessage("bad acknowledgement came from the other side");
    }

    auto ack = j.find("ack");
    if (ack == j.end() || !ack->is_string()) {
        throw MalformedMessage("bad acknowledgement came from the other side");
    }

    AckRecord record;
    record.ack = ack->get<std::string>();

    // A missing or empty digest means the other end did not compute one.
    auto digest = j.find("sha256");
    if (digest != j.end() && digest->is_string() && !digest->get<std::string>().empty()) {
        record.sha256 = digest->get<std::string>();
    }
    return record;
}

} // namespace Wormhole
