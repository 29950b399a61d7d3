#include <picstash/server/server.hpp>
#include <picstash/server/config.hpp>

#include <iostream>
#include <exception>

int main(int argc, char** argv) {
  try {
    // Parse configuration from command line (and optionally config file)
    auto config = picstash::server::Config::LoadFromArgs(argc, argv);

    // Create and run server
    picstash::server::Server server(config);
    server.Run();

    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
