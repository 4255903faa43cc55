#include "wormhole/codes.hpp"

#include <sodium.h>

#include <array>
#include <cctype>
#include <sstream>

#include "wormhole/errors.hpp"

namespace Wormhole {

namespace {

constexpr std::array<const char*, 128> WORDS = {
    "acrobat",   "adrift",    "almanac",   "amber",     "anchor",    "apollo",    "archive",   "aurora",
    "backpack",  "badger",    "balloon",   "banjo",     "beacon",    "bicycle",   "blizzard",  "bramble",
    "cactus",    "canary",    "caravan",   "cascade",   "celery",    "chimney",   "cobalt",    "compass",
    "crayon",    "cricket",   "dandelion", "decibel",   "dolphin",   "domino",    "dragon",    "drizzle",
    "eclipse",   "elephant",  "ember",     "emerald",   "equator",   "escape",    "falcon",    "fennel",
    "fiddle",    "firefly",   "flamingo",  "fossil",    "gadget",    "galaxy",    "garnet",    "geyser",
    "ginger",    "glacier",   "gondola",   "guitarist", "hammock",   "harbor",    "harvest",   "hazel",
    "hedgehog",  "horizon",   "iceberg",   "igloo",     "indigo",    "island",    "ivory",     "jackal",
    "jasmine",   "jigsaw",    "journal",   "juniper",   "kayak",     "kernel",    "kettle",    "kiwi",
    "lantern",   "lemonade",  "lighthouse", "lobster",  "locket",    "lunar",     "magnet",    "mammoth",
    "marble",    "meadow",    "meteor",    "mosaic",    "nectar",    "nebula",    "noodle",    "nutmeg",
    "oasis",     "octopus",   "olive",     "orbit",     "orchid",    "paddle",    "panda",     "parsley",
    "pebble",    "pelican",   "pepper",    "pinecone",  "quartz",    "quiver",    "rainbow",   "raven",
    "revenue",   "ribbon",    "rocket",    "saffron",   "sailboat",  "sapphire",  "scarecrow", "sequoia",
    "tadpole",   "tangerine", "teapot",    "thimble",   "tornado",   "trumpet",   "tulip",     "umbrella",
    "velvet",    "violin",    "volcano",   "walrus",    "whistle",   "willow",    "yogurt",    "zeppelin",
};

} // namespace

std::string make_code(const std::string& nameplate, size_t word_count) {
    std::string code = nameplate;
    for (size_t i = 0; i < word_count; ++i) {
        code += '-';
        code += WORDS[randombytes_uniform(static_cast<uint32_t>(WORDS.size()))];
    }
    return code;
}

std::string normalize_code(const std::string& text) {
    std::istringstream fields(text);
    std::string field;
    std::string code;
    while (fields >> field) {
        if (!code.empty()) {
            code += '-';
        }
        code += field;
    }
    return code;
}

std::string nameplate_of(const std::string& code) {
    size_t dash = code.find('-');
    if (dash == 0 || dash == std::string::npos || dash + 1 == code.size()) {
        throw InvalidArgument("Codes look like 7-guitarist-revenue.");
    }
    for (size_t i = 0; i < dash; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(code[i]))) {
            throw InvalidArgument("Codes look like 7-guitarist-revenue.");
        }
    }
    return code.substr(0, dash);
}

} // namespace Wormhole
