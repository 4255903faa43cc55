#include "wormhole/config.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <string>

#include "fakes.hpp"
#include "wormhole/errors.hpp"

TEST(ConfigTest, Defaults) {
    Wormhole::Config config;

    ASSERT_EQ(config.app_id, "lothar.com/wormhole/text-or-file-xfer");
    ASSERT_EQ(config.rendezvous_relay, Wormhole::DEFAULT_RENDEZVOUS_RELAY);
    ASSERT_EQ(config.transit_relay, Wormhole::DEFAULT_TRANSIT_RELAY);
    ASSERT_TRUE(config.downloads_dir.empty());
    ASSERT_EQ(config.code_timeout.count(), 10);
    ASSERT_EQ(config.message_timeout.count(), 600);
}

TEST(ConfigTest, SetGetAndReset) {
    Wormhole::Config config;

    config.set("transit_relay", "wss://relay.example.org/transit");
    config.set("key_timeout", "30");
    config.set("downloads_dir", "/tmp/incoming");
    ASSERT_EQ(config.get("transit_relay"), "wss://relay.example.org/transit");
    ASSERT_EQ(config.key_timeout.count(), 30);
    ASSERT_EQ(config.get("downloads_dir"), "/tmp/incoming");

    config.reset("key_timeout");
    config.reset("transit_relay");
    ASSERT_EQ(config.key_timeout.count(), 600);
    ASSERT_EQ(config.transit_relay, Wormhole::DEFAULT_TRANSIT_RELAY);
}

TEST(ConfigTest, SetRejectsInvalidValues) {
    Wormhole::Config config;

    ASSERT_THROW(config.set("no_such_field", "1"), Wormhole::InvalidArgument);
    ASSERT_THROW(config.get("no_such_field"), Wormhole::InvalidArgument);
    ASSERT_THROW(config.set("rendezvous_relay", "http://example.org"), Wormhole::InvalidArgument);
    ASSERT_THROW(config.set("code_timeout", "-1"), Wormhole::InvalidArgument);
    ASSERT_THROW(config.set("code_timeout", "10s"), Wormhole::InvalidArgument);
    ASSERT_THROW(config.set("app_id", ""), Wormhole::InvalidArgument);

    // Failed updates leave the value alone.
    ASSERT_EQ(config.code_timeout.count(), 10);
}

TEST(ConfigTest, SaveAndLoad) {
    fakes::TempDir dir;
    std::string path = dir.file("nested/config.json");

    Wormhole::Config config;
    config.set("rendezvous_relay", "ws://mailbox.example.org:4000/v1");
    config.set("transit_timeout", "5");
    config.save(path);

    Wormhole::Config loaded = Wormhole::Config::load(path);
    for (const auto& field : Wormhole::Config::field_names()) {
        ASSERT_EQ(loaded.get(field), config.get(field)) << field;
    }
}

TEST(ConfigTest, SaveKeepsOtherSections) {
    fakes::TempDir dir;
    std::string path = dir.file("config.json");
    fakes::write_file(path, R"({"other-tool": {"color": "blue"}, "wormhole": {"app_id": "old"}})");

    Wormhole::Config config = Wormhole::Config::load(path);
    ASSERT_EQ(config.app_id, "old");
    config.set("app_id", "new");
    config.save(path);

    nlohmann::json saved = nlohmann::json::parse(fakes::read_file(path));
    ASSERT_EQ(saved["other-tool"]["color"], "blue");
    ASSERT_EQ(saved["wormhole"]["app_id"], "new");
}

TEST(ConfigTest, LoadMissingFileGivesDefaults) {
    fakes::TempDir dir;
    Wormhole::Config config = Wormhole::Config::load(dir.file("absent.json"));
    ASSERT_EQ(config.app_id, Wormhole::DEFAULT_APP_ID);
}

TEST(ConfigTest, LoadRejectsBrokenFiles) {
    fakes::TempDir dir;

    fakes::write_file(dir.file("broken.json"), "{ not json");
    ASSERT_THROW(Wormhole::Config::load(dir.file("broken.json")), Wormhole::RuntimeError);

    fakes::write_file(dir.file("bad_value.json"), R"({"wormhole": {"code_timeout": -5}})");
    ASSERT_THROW(Wormhole::Config::load(dir.file("bad_value.json")), Wormhole::InvalidArgument);
}

TEST(ConfigTest, DefaultPathFollowsXdg) {
    const char* previous = std::getenv("XDG_CONFIG_HOME");
    std::string saved = previous ? previous : "";

    setenv("XDG_CONFIG_HOME", "/tmp/xdg-test", 1);
    ASSERT_EQ(Wormhole::Config::default_path(), "/tmp/xdg-test/wormhole/config.json");

    if (previous) {
        setenv("XDG_CONFIG_HOME", saved.c_str(), 1);
    } else {
        unsetenv("XDG_CONFIG_HOME");
    }
}
