#include "wormhole/control_message.hpp"
#include "wormhole/errors.hpp"

#include <array>
#include <utility>

namespace Wormhole {

namespace {

constexpr char TRANSIT_KEY[] = "transit";
constexpr char OFFER_KEY[] = "offer";
constexpr char ANSWER_KEY[] = "answer";
constexpr char ERROR_KEY[] = "error";

constexpr std::array<const char*, 4> RECOGNIZED_KEYS = {TRANSIT_KEY, OFFER_KEY, ANSWER_KEY, ERROR_KEY};

TransitInfo parse_transit(const nlohmann::json& value) {
    if (!value.is_object()) {
        throw MalformedMessage("bad transit message came from the other side");
    }
    auto abilities = value.find("abilities-v1");
    auto hints = value.find("hints-v1");
    if (abilities == value.end() || !abilities->is_array() || hints == value.end() || !hints->is_array()) {
        throw MalformedMessage("bad transit message came from the other side");
    }

    TransitInfo info;
    info.abilities = *abilities;
    info.hints = *hints;
    return info;
}

FileOffer parse_offer(const nlohmann::json& value) {
    if (!value.is_object()) {
        throw MalformedMessage("bad offer came from the other side");
    }
    auto file = value.find("file");
    if (file == value.end() || !file->is_object()) {
        throw MalformedMessage("bad offer came from the other side");
    }
    auto filename = file->find("filename");
    auto filesize = file->find("filesize");
    if (filename == file->end() || !filename->is_string() || filesize == file->end() ||
        !filesize->is_number_unsigned()) {
        throw MalformedMessage("bad offer came from the other side");
    }

    FileOffer offer;
    offer.filename = filename->get<std::string>();
    offer.filesize = filesize->get<uint64_t>();
    return offer;
}

} // namespace

// --- Answer ---

bool Answer::accepted() const {
    if (!body.is_object()) {
        return false;
    }
    auto ack = body.find("file_ack");
    return ack != body.end() && ack->is_string() && ack->get<std::string>() == "ok";
}

// --- ControlMessage ---

ControlMessage ControlMessage::make_transit(TransitInfo info) {
    ControlMessage message;
    message.kind = Kind::TRANSIT;
    message.transit = std::move(info);
    return message;
}

ControlMessage ControlMessage::make_offer(FileOffer offer) {
    ControlMessage message;
    message.kind = Kind::OFFER;
    message.offer = std::move(offer);
    return message;
}

ControlMessage ControlMessage::make_answer(const std::string& file_ack) {
    ControlMessage message;
    message.kind = Kind::ANSWER;
    message.answer.body = {{"file_ack", file_ack}};
    return message;
}

ControlMessage ControlMessage::make_error(std::string text) {
    ControlMessage message;
    message.kind = Kind::ERROR;
    message.error = std::move(text);
    return message;
}

byte_vector ControlMessage::encode() const {
    nlohmann::json j;
    switch (kind) {
        case Kind::TRANSIT:
            j[TRANSIT_KEY] = {{"abilities-v1", transit.abilities}, {"hints-v1", transit.hints}};
            break;
        case Kind::OFFER:
            j[OFFER_KEY] = {{"file", {{"filename", offer.filename}, {"filesize", offer.filesize}}}};
            break;
        case Kind::ANSWER:
            j[ANSWER_KEY] = answer.body;
            break;
        case Kind::ERROR:
            j[ERROR_KEY] = error;
            break;
    }
    std::string text = j.dump();
    return byte_vector(text.begin(), text.end());
}

std::optional<ControlMessage> ControlMessage::try_decode(const byte_vector& data) {
    nlohmann::json j = nlohmann::json::parse(data.begin(), data.end(), nullptr, false);
    if (j.is_discarded()) {
        throw MalformedMessage("bad message came from the other side");
    }
    if (!j.is_object()) {
        throw MalformedMessage("bad message came from the other side");
    }

    const char* found = nullptr;
    for (const char* key : RECOGNIZED_KEYS) {
        if (j.contains(key)) {
            if (found) {
                throw MalformedMessage("bad message came from the other side");
            }
            found = key;
        }
    }
    if (!found) {
        return std::nullopt;
    }

    const nlohmann::json& value = j.at(found);
    ControlMessage message;
    if (found == TRANSIT_KEY) {
        message = make_transit(parse_transit(value));
    } else if (found == OFFER_KEY) {
        message = make_offer(parse_offer(value));
    } else if (found == ANSWER_KEY) {
        message.kind = Kind::ANSWER;
        message.answer.body = value;
    } else {
        message = make_error(value.is_string() ? value.get<std::string>() : value.dump());
    }
    return message;
}

ControlMessage ControlMessage::decode(const byte_vector& data) {
    std::optional<ControlMessage> message = try_decode(data);
    if (!message) {
        throw MalformedMessage("bad message came from the other side");
    }
    return std::move(*message);
}

bool ControlMessage::operator==(const ControlMessage& other) const {
    if (kind != other.kind) {
        return false;
    }
    switch (kind) {
        case Kind::TRANSIT:
            return transit == other.transit;
        case Kind::OFFER:
            return offer == other.offer;
        case Kind::ANSWER:
            return answer == other.answer;
        case Kind::ERROR:
            return error == other.error;
    }
    return false;
}

} // namespace Wormhole
