#ifndef WORMHOLE_CONFIG_HPP
#define WORMHOLE_CONFIG_HPP

#include <chrono>
#include <string>
#include <vector>

namespace Wormhole {

    // Namespaces the protocol on the rendezvous server.
    constexpr char DEFAULT_APP_ID[] = "lothar.com/wormhole/text-or-file-xfer";
    constexpr char DEFAULT_RENDEZVOUS_RELAY[] = "ws://localhost:4000/v1";
    constexpr char DEFAULT_TRANSIT_RELAY[] = "ws://localhost:4000/transit";

    // Section of the config file holding our settings.
    constexpr char CONFIG_SECTION[] = "wormhole";

    struct Config {
        std::string app_id = DEFAULT_APP_ID;
        std::string rendezvous_relay = DEFAULT_RENDEZVOUS_RELAY;
        std::string transit_relay = DEFAULT_TRANSIT_RELAY;
        // Where received files go; empty means the working directory.
        std::string downloads_dir;

        std::chrono::seconds code_timeout{10};
        std::chrono::seconds key_timeout{600};
        std::chrono::seconds message_timeout{600};
        std::chrono::seconds transit_timeout{600};

        /**
         * @brief $XDG_CONFIG_HOME/wormhole/config.json, or ~/.config/wormhole/config.json.
         */
        static std::string default_path();

        /**
         * @brief Loads the config, falling back to defaults for missing fields.
         * A missing file yields the defaults.
         * @throws RuntimeError if the file exists but cannot be parsed.
         * @throws InvalidArgument if a field has an invalid value.
         */
        static Config load(const std::string& path);

        /**
         * @brief Writes the config, creating parent directories as needed.
         * @throws RuntimeError if the file cannot be written.
         */
        void save(const std::string& path) const;

        static const std::vector<std::string>& field_names();

        /**
         * @throws InvalidArgument for unknown fields.
         */
        std::string get(const std::string& field) const;

        /**
         * @throws InvalidArgument for unknown fields or invalid values.
         */
        void set(const std::string& field, const std::string& value);

        /**
         * @brief Restores a field to its default value.
         * @throws InvalidArgument for unknown fields.
         */
        void reset(const std::string& field);
    };

} // namespace Wormhole

#endif // WORMHOLE_CONFIG_HPP
