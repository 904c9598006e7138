#include <cstdlib>
#include <iostream>

#include "docrag_cli/cli_handler.hpp"
#include "docrag_cli/config.hpp"

int main(int argc, char *argv[])
{
  try
  {
    std::string config_path = docrag_cli::find_config_path(argc, argv);
    if (config_path.empty())
    {
      const char *env_path = std::getenv("DOCRAG_CONFIG");
      config_path = env_path ? env_path : "";
    }
    Config config = config_path.empty() ? Config::from_json(nlohmann::json::object())
                                         : Config::from_file(config_path);

    docrag_cli::CliHandler handler(config);
    docrag_cli::CliOptions options = handler.parse_arguments(argc, argv);
    handler.execute_command(options);
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
