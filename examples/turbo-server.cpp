#include <cstddef>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <span>
#include <stdexcept>

#include "turbo/server-cli.hpp"

int main(int argc, char** argv) {
  try {
    const auto options =
        turbo::ParseServerArgs(std::span<const char* const>(argv + 1, static_cast<std::size_t>(argc - 1)));
    if (options.help) {
      std::cout << turbo::kServerUsage;
      return EXIT_SUCCESS;
    }
    return turbo::RunServer(options);
  } catch (const std::invalid_argument& ex) {
    std::cerr << "Error: " << ex.what() << "\n\n" << turbo::kServerUsage;
    return EXIT_FAILURE;
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << '\n';
    return EXIT_FAILURE;
  }
}
