#include "../client/tcp_client.hpp"
#include "common/errors.hpp"
#include <iostream>
#include <string>
#include <vector>

static int usage(const char *program) {
  std::cerr << "Usage: " << program
            << " [--host <addr>] [--port <port>] [command [args...]]\n";
  return 2;
}

int main(int argc, char **argv) {
  std::string address = "127.0.0.1";
  int port = 6380;
  std::string one_shot;

  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if ((arg == "--host" || arg == "-h") && i + 1 < argc) {
      address = argv[++i];
    } else if ((arg == "--port" || arg == "-p") && i + 1 < argc) {
      try {
        port = std::stoi(argv[++i]);
      } catch (const std::exception &) {
        return usage(argv[0]);
      }
    } else if (arg.rfind("--", 0) == 0) {
      return usage(argv[0]);
    } else {
      // remaining words form a single command; quote them so spaces survive
      for (; i < argc; i++) {
        std::string word = argv[i];
        std::string quoted = "\"";
        for (char c : word) {
          if (c == '"' || c == '\\')
            quoted.push_back('\\');
          quoted.push_back(c);
        }
        one_shot += (one_shot.empty() ? "" : " ") + quoted + "\"";
      }
    }
  }

  MiniKV::TCPClient client;
  try {
    client.connect_to_server(address, port);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  if (!one_shot.empty()) {
    try {
      MiniKV::RESP reply = client.execute(one_shot);
      std::cout << MiniKV::format_reply(reply) << "\n";
      return reply.resp_type == MiniKV::RESP::type::ERROR ? 1 : 0;
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << "\n";
      return 1;
    }
  }

  std::string prompt = address + ":" + std::to_string(port) + "> ";
  std::string input;
  while (true) {
    std::cout << prompt << std::flush;
    if (!std::getline(std::cin, input) || input == "exit")
      break;

    std::vector<std::string> words;
    try {
      words = MiniKV::split_command_line(input);
      if (words.empty())
        continue;
      MiniKV::RESP reply = client.execute(input);
      std::cout << MiniKV::format_reply(reply) << "\n";
    } catch (const MiniKV::ProtocolError &e) {
      std::cout << "(error) " << e.what() << "\n";
      continue;
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << "\n";
      return 1;
    }

    if (words[0] == "quit" || words[0] == "QUIT")
      break;
  }
  return 0;
}
