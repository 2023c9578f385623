#include "ClientConfig.hpp"
#include "FakeHotlineServer.hpp"

using namespace hl;

TEST_CASE("Defaults", "[ClientConfig]") {
  ClientConfig config;
  REQUIRE(config.port == HOTLINE_DEFAULT_PORT);
  REQUIRE(config.login == "guest");
  REQUIRE(config.nickname == "unnamed");
  REQUIRE(config.iconId == HOTLINE_DEFAULT_ICON);
  REQUIRE(config.workers == 4);
  REQUIRE_FALSE(config.resume);
  REQUIRE(config.verbose == 0);
  REQUIRE_FALSE(config.downloadDir.empty());
  REQUIRE_THROWS_AS(config.getEndpoint(), HotlineError);
}

TEST_CASE("Config files overlay the defaults", "[ClientConfig]") {
  TemporaryDirectory dir;
  fs::path file = dir.path / "hlclient.ini";
  writeFile(file,
            "[Server]\n"
            "host = hotline.example.org\n"
            "port = 5600\n"
            "login = admin\n"
            "password = hunter2\n"
            "nick = Operator\n"
            "\n"
            "[Transfers]\n"
            "download_dir = /tmp/hotline\n"
            "workers = 2\n"
            "resume = Yes\n"
            "\n"
            "[Debug]\n"
            "verbose = 3\n");

  ClientConfig config;
  config.loadFile(file.string());
  REQUIRE(config.host == "hotline.example.org");
  REQUIRE(config.port == 5600);
  REQUIRE(config.workers == 2);
  REQUIRE(config.resume);
  REQUIRE(config.verbose == 3);
  REQUIRE(config.downloadDir == "/tmp/hotline");
  // Not in the file
  REQUIRE(config.iconId == HOTLINE_DEFAULT_ICON);

  SocketEndpoint endpoint = config.getEndpoint();
  REQUIRE(endpoint.getName() == "hotline.example.org");
  REQUIRE(endpoint.getPort() == 5600);
  REQUIRE(endpoint.transferEndpoint().getPort() == 5601);

  Credentials credentials = config.getCredentials();
  REQUIRE(credentials.login == "admin");
  REQUIRE(credentials.password == "hunter2");
  REQUIRE(credentials.nickname == "Operator");
}

TEST_CASE("Bad config values are rejected", "[ClientConfig]") {
  TemporaryDirectory dir;
  fs::path file = dir.path / "bad.ini";
  ClientConfig config;

  SECTION("Missing file") {
    REQUIRE_THROWS_AS(config.loadFile((dir.path / "none.ini").string()),
                      HotlineError);
  }
  SECTION("Port out of range") {
    writeFile(file, "[Server]\nport = 70000\n");
    REQUIRE_THROWS_AS(config.loadFile(file.string()), HotlineError);
  }
  SECTION("Port is not a number") {
    writeFile(file, "[Server]\nport = 55x\n");
    REQUIRE_THROWS_AS(config.loadFile(file.string()), HotlineError);
  }
  SECTION("No workers") {
    writeFile(file, "[Transfers]\nworkers = 0\n");
    REQUIRE_THROWS_AS(config.loadFile(file.string()), HotlineError);
  }
}

TEST_CASE("Boolean spellings", "[ClientConfig]") {
  for (auto value : {"1", "true", "TRUE", "yes", "On"}) {
    REQUIRE(parseConfigBool(value));
  }
  for (auto value : {"0", "false", "no", "off", "", "\xC3\xA9", "\xFFyes"}) {
    REQUIRE_FALSE(parseConfigBool(value));
  }
}

TEST_CASE("Server addresses", "[SocketEndpoint]") {
  SocketEndpoint plain = SocketEndpoint::parse("hotline.example.org");
  REQUIRE(plain.getPort() == HOTLINE_DEFAULT_PORT);

  SocketEndpoint withPort = SocketEndpoint::parse("10.0.0.2:5600");
  REQUIRE(withPort.getName() == "10.0.0.2");
  REQUIRE(withPort.getPort() == 5600);

  SocketEndpoint v6 = SocketEndpoint::parse("[::1]:5501");
  REQUIRE(v6.getName() == "::1");
  REQUIRE(v6.getPort() == 5501);

  REQUIRE_THROWS(SocketEndpoint::parse("host:notaport"));
  REQUIRE_THROWS(SocketEndpoint::parse(":5500"));
  REQUIRE_THROWS(SocketEndpoint::parse("host:0"));
}
