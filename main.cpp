#include "src/main_functions/fit_manager.hpp"
#include "src/main_functions/main_functions.hpp"

#include <torch/torch.h>

#include <iostream>
#include <memory>

int main(int argc, char * argv[])
{
  torch::manual_seed(2022);

  if (argc != 3) {
    std::cerr << "Usage: " << argv[0] << " <query|fit|slice> <config.yaml>" << std::endl;
    std::cerr << "argc = " << argc << std::endl;
    return 1;
  }

  const std::string command = argv[1];
  const std::string conf_path = argv[2];
  try {
    if (command == "query") {
      query_fields(conf_path);
    } else if (command == "fit") {
      auto fit_manager = std::make_unique<FitManager>(conf_path);
      fit_manager->fit();
    } else if (command == "slice") {
      render_slice(conf_path);
    } else {
      std::cerr << "Invalid command line argument : " << command << std::endl;
      return 1;
    }
  } catch (const std::exception & e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
