#include "settings_manager.hpp"
#include "connect_engine.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <thread>

int main() {
  namespace fs = std::filesystem;

  auto base = fs::temp_directory_path() / "connect_engine_sample";
  std::error_code ec;
  fs::remove_all(base, ec);
  fs::create_directories(base / "peerA" / "pack" / "mods", ec);
  fs::create_directories(base / "peerB", ec);
  std::ofstream(base / "peerA" / "pack" / "mods" / "sample.jar") << "sample";

  auto configure = [](const std::shared_ptr<SettingsManager>& settings,
                      const std::string& key,
                      const std::string& value){
    std::string error;
    if(!settings->set_from_string(key, value, error)) {
      throw std::runtime_error("Failed to set setting " + key + ": " + error);
    }
  };

  auto make_settings = [&](const std::string& peer, const std::string& port){
    auto settings = std::make_shared<SettingsManager>();
    settings->set_settings_path(base / peer / ".config" / "settings.json");
    configure(settings, "enabled", "true");
    configure(settings, "visibility", "everyone");
    configure(settings, "nickname", peer);
    configure(settings, "discovery_port", port);
    return settings;
  };

  auto make_options = [&](const std::string& peer, unsigned short target){
    ConnectEngine::Options options;
    options.data_dir = base / peer;
    options.start_cli_thread = false;
    options.discovery.bind_address = "127.0.0.1";
    options.discovery.broadcast_targets = {
      asio::ip::udp::endpoint(asio::ip::make_address("127.0.0.1"), target)
    };
    options.discovery.broadcast_interval = std::chrono::milliseconds(200);
    options.sync.bind_address = "127.0.0.1";
    return options;
  };

  ConnectEngine engine_a(make_settings("peerA", "29847"), make_options("peerA", 29947));
  engine_a.start();
  engine_a.start_background();

  ConnectEngine engine_b(make_settings("peerB", "29947"), make_options("peerB", 29847));
  engine_b.start();
  engine_b.start_background();

  std::this_thread::sleep_for(std::chrono::milliseconds(750));

  engine_a.execute_command("watch add pack " + (base / "peerA" / "pack").string());
  engine_a.execute_command("peers");
  engine_a.execute_command("invite create pack Sample 1.20.1 fabric 127.0.0.1:25565 1 5");
  engine_a.execute_command("invite list");
  engine_a.execute_command("sync pack");

  std::this_thread::sleep_for(std::chrono::milliseconds(500));
  engine_a.execute_command("history");
  engine_b.execute_command("updates");

  engine_b.stop();
  engine_a.stop();

  fs::remove_all(base, ec);
  return 0;
}
