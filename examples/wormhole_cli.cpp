#include <cstdio>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "wormhole/codes.hpp"
#include "wormhole/config.hpp"
#include "wormhole/crypto.hpp"
#include "wormhole/errors.hpp"
#include "wormhole/session.hpp"
#include "wormhole/ws_rendezvous.hpp"
#include "wormhole/ws_transit.hpp"

namespace {

struct Arguments {
    std::vector<std::string> positional;
    std::map<std::string, std::string> values;
    std::set<std::string> flags;
};

const std::set<std::string> VALUE_OPTIONS = {"--relay", "--transit-relay", "--output-dir"};
const std::set<std::string> FLAG_OPTIONS = {"--yes"};

void print_usage() {
    std::cerr << "Usage:\n"
              << "  wormhole send <file> [--relay URL] [--transit-relay URL]\n"
              << "  wormhole receive [<code>] [--output-dir DIR] [--yes] [--relay URL] [--transit-relay URL]\n"
              << "  wormhole config [show | set <field> <value> | reset <field>]\n";
}

Arguments parse_arguments(int argc, char* argv[], int first) {
    Arguments args;
    for (int i = first; i < argc; ++i) {
        std::string arg = argv[i];
        if (VALUE_OPTIONS.count(arg)) {
            if (i + 1 >= argc) {
                throw Wormhole::InvalidArgument(arg + " needs a value");
            }
            args.values[arg] = argv[++i];
        } else if (FLAG_OPTIONS.count(arg)) {
            args.flags.insert(arg);
        } else if (arg.rfind("--", 0) == 0) {
            throw Wormhole::InvalidArgument("unknown option " + arg);
        } else {
            args.positional.push_back(arg);
        }
    }
    return args;
}

// Decimal units, e.g. "1 Byte", "16 Bytes", "16.4 kB".
std::string natural_size(uint64_t bytes) {
    if (bytes == 1) {
        return "1 Byte";
    }
    if (bytes < 1000) {
        return std::to_string(bytes) + " Bytes";
    }

    static const char* const UNITS[] = {"kB", "MB", "GB", "TB", "PB"};
    double value = static_cast<double>(bytes);
    size_t unit = 0;
    value /= 1000.0;
    while (value >= 1000.0 && unit + 1 < sizeof(UNITS) / sizeof(UNITS[0])) {
        value /= 1000.0;
        ++unit;
    }

    char text[32];
    std::snprintf(text, sizeof(text), "%.1f %s", value, UNITS[unit]);
    return text;
}

Wormhole::ProgressCallback progress_printer(const std::string& verb, uint64_t total) {
    auto done = std::make_shared<uint64_t>(0);
    return [verb, total, done](size_t count) {
        *done += count;
        std::cout << "\r" << verb << " " << natural_size(*done) << " of " << natural_size(total) << std::flush;
        if (*done >= total) {
            std::cout << std::endl;
        }
    };
}

void apply_relay_options(Wormhole::Config& config, const Arguments& args) {
    auto relay = args.values.find("--relay");
    if (relay != args.values.end()) {
        config.set("rendezvous_relay", relay->second);
    }
    auto transit_relay = args.values.find("--transit-relay");
    if (transit_relay != args.values.end()) {
        config.set("transit_relay", transit_relay->second);
    }
}

std::unique_ptr<Wormhole::Session> open_session(const Wormhole::Config& config) {
    return std::make_unique<Wormhole::Session>(
        config,
        std::make_unique<Wormhole::net::WsRendezvousClient>(config.app_id, config.rendezvous_relay),
        Wormhole::net::make_transit_factory());
}

int run_send(Wormhole::Config config, const Arguments& args) {
    if (args.positional.size() != 1) {
        print_usage();
        return 2;
    }
    apply_relay_options(config, args);

    const std::string& path = args.positional[0];
    if (!std::filesystem::is_regular_file(path)) {
        std::cerr << "ERROR: " << path << " is not a file" << std::endl;
        return 1;
    }
    uint64_t filesize = std::filesystem::file_size(path);

    auto session = open_session(config);
    std::string code = session->generate_code(config.code_timeout);
    std::cout << "Sending " << natural_size(filesize) << " file named '"
              << std::filesystem::path(path).filename().string() << "'" << std::endl;
    std::cout << "Wormhole code is: " << code << std::endl;
    std::cout << "On the other computer, please run:\n\n    wormhole receive " << code << "\n" << std::endl;

    Wormhole::Verifier verifier = session->exchange_keys(config.key_timeout);
    std::cout << "Verifier " << Wormhole::Crypto::to_hex(verifier) << std::endl;

    std::string hex_digest = session->send_file(path, progress_printer("Sent", filesize));
    std::cout << "File sent, sha256 " << hex_digest << std::endl;
    session->close();
    return 0;
}

int run_receive(Wormhole::Config config, const Arguments& args) {
    if (args.positional.size() > 1) {
        print_usage();
        return 2;
    }
    apply_relay_options(config, args);
    auto output_dir = args.values.find("--output-dir");
    if (output_dir != args.values.end()) {
        config.downloads_dir = output_dir->second;
    }

    std::string code;
    if (args.positional.empty()) {
        std::cout << "Enter receive wormhole code: " << std::flush;
        std::getline(std::cin, code);
    } else {
        code = args.positional[0];
    }
    code = Wormhole::normalize_code(code);

    auto session = open_session(config);
    session->connect(code, config.code_timeout);
    Wormhole::Verifier verifier = session->exchange_keys(config.key_timeout);
    std::cout << "Verifier " << Wormhole::Crypto::to_hex(verifier) << std::endl;

    Wormhole::FileOffer offer = session->await_offer();
    std::filesystem::path directory = config.downloads_dir.empty() ? std::filesystem::current_path()
                                                                   : std::filesystem::path(config.downloads_dir);
    std::filesystem::path destination = directory / Wormhole::safe_filename(offer.filename);

    std::cout << "Receiving file (" << natural_size(offer.filesize) << ") into: " << destination.string()
              << std::endl;

    if (std::filesystem::exists(destination)) {
        std::cerr << "ERROR: refusing to overwrite existing '" << destination.string() << "'" << std::endl;
        session->send_control(Wormhole::ControlMessage::make_error("file already exists"));
        session->close();
        return 1;
    }

    if (!args.flags.count("--yes")) {
        std::cout << "ok? (y/N): " << std::flush;
        std::string answer;
        std::getline(std::cin, answer);
        if (answer != "y" && answer != "Y" && answer != "yes") {
            std::cout << "transfer rejected" << std::endl;
            session->send_control(Wormhole::ControlMessage::make_error("transfer rejected"));
            session->close();
            return 1;
        }
    }

    std::string hex_digest = session->accept_offer(destination.string(), progress_printer("Received", offer.filesize));
    std::cout << "Received file written to " << destination.string() << ", sha256 " << hex_digest << std::endl;
    session->close();
    return 0;
}

int run_config(const Arguments& args) {
    std::string path = Wormhole::Config::default_path();
    Wormhole::Config config = Wormhole::Config::load(path);

    const std::vector<std::string>& words = args.positional;
    if (words.empty() || (words.size() == 1 && words[0] == "show")) {
        for (const auto& field : Wormhole::Config::field_names()) {
            std::cout << field << " = " << config.get(field) << std::endl;
        }
        return 0;
    }
    if (words.size() == 3 && words[0] == "set") {
        config.set(words[1], words[2]);
        config.save(path);
        return 0;
    }
    if (words.size() == 2 && words[0] == "reset") {
        config.reset(words[1]);
        config.save(path);
        return 0;
    }

    print_usage();
    return 2;
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 2;
    }

    if (Wormhole::Crypto::init() != 0) {
        std::cerr << "Failed to initialize crypto library!" << std::endl;
        return 1;
    }

    std::string command = argv[1];
    try {
        Arguments args = parse_arguments(argc, argv, 2);
        if (command == "config") {
            return run_config(args);
        }

        Wormhole::Config config = Wormhole::Config::load(Wormhole::Config::default_path());
        if (command == "send") {
            return run_send(config, args);
        }
        if (command == "receive") {
            return run_receive(config, args);
        }
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }

    print_usage();
    return 2;
}
