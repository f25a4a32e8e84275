#include "src/main_functions/main_functions.hpp"

#include <fmt/core.h>

#include <exception>
#include <iostream>
#include <string>

int main(int argc, char * argv[])
{
  if (argc != 3) {
    std::cerr << "Usage: " << argv[0] << " render_test_scene <config.yaml>" << std::endl;
    std::cerr << "argc = " << argc << std::endl;
    return 1;
  }

  const std::string command = argv[1];
  const std::string conf_path = argv[2];
  try {
    if (command == "render_test_scene") {
      nerf_rays::render_test_scene(conf_path);
    } else {
      std::cerr << "Invalid command line argument : " << command << std::endl;
      return 1;
    }
  } catch (const std::exception & e) {
    std::cerr << fmt::format("{} failed: {}", command, e.what()) << std::endl;
    return 1;
  }
  return 0;
}
