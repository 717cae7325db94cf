#include <cstdlib>
#include <fstream>

#include "discord/bot.hpp"

using namespace relay;

json::value read_json_file(const char* file, boost::system::error_code& error) {
  std::ifstream is{ file };
  if (!is) {
    error = std::make_error_code(std::errc::no_such_file_or_directory);
    return nullptr;
  }

  json::stream_parser p;
  std::string line;

  while (std::getline(is, line)) {
    p.write(line, error);
    if (error)
      return nullptr;
  }
  p.finish(error);
  if (error)
    return nullptr;
  return p.release();
}

int main(int argc, char* argv[]) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <config>\n";
    return EXIT_FAILURE;
  }

  boost::system::error_code error;
  auto config = read_json_file(argv[1], error);
  if (error) {
    std::cerr << "Failed to read config: " << error.message() << '\n';
    return EXIT_FAILURE;
  }

  discord::Settings settings;
  try {
    settings = json::value_to<discord::Settings>(config.at("discord"));
  } catch (const std::exception& e) {
    std::cerr << "Invalid config: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  if (!settings.enabled) {
    std::cout << "[Discord] Disabled in config\n";
    return EXIT_SUCCESS;
  }

  ssl::context ctx{ ssl::context::tlsv12_client };
  ctx.set_default_verify_paths();
  ctx.set_verify_mode(ssl::verify_peer);

  asio::io_context io;
  discord::Bot bot{ io, ctx, settings };

  asio::signal_set signals{ io, SIGINT, SIGTERM };
  signals.async_wait([&](const beast::error_code& ec, int) {
    if (ec)
      return;

    std::cout << "Caught signal, stopping bot...\n";
    bot.stop();
  });

  int status = EXIT_SUCCESS;
  bot.onFailure([&](const beast::error_code&) {
    status = EXIT_FAILURE;
    signals.cancel();
    bot.stop();
  });

  bot.on("READY", [](const json::value& data) {
    const auto& user = data.at("user");
    std::cout << "[Discord] Logged in as " << user.at("username").as_string() << '\n';
  });

  bot.on("MESSAGE_CREATE", [&](const json::value& data) {
    const auto& content = data.at("content");
    if (!content.is_string() || content.as_string() != "!ping")
      return;

    bot.createMessage(json::value_to<std::string>(data.at("channel_id")), "pong");
  });

  bot.run();
  io.run();

  std::cout << "Disconnected.\n";

  return status;
}
