#include <memory>
#include <fstream>
#include <sstream>
#include <iostream>
#include <filesystem>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <snipbox/errors.h>
#include <snipbox/logger.h>
#include <snipbox/paths.h>
#include <snipbox/runner.h>
#include <snipbox/utils.h>
#include <snipbox/local_engine.h>
#include <snipbox/container_engine.h>

namespace {

LocalEngineOptions local_opt;
ContainerEngineOptions container_opt;

std::vector<std::string> SplitPackages(const std::string& str) {
  std::vector<std::string> ret;
  std::stringstream ss(str);
  for (std::string item; std::getline(ss, item, ',');) {
    if (item.size()) ret.push_back(item);
  }
  return ret;
}

bool ParseConfig(const fs::path& conf_path) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  std::string env_dir = ini[""]["env_dir"] | "";
  std::string env_creator = ini[""]["env_creator"] | "";
  std::string packages = ini[""]["packages"] | "";
  std::string run_root = ini[""]["run_root"] | "";
  std::string recipe_dir = ini[""]["recipe_dir"] | "";
  if (env_dir.size()) local_opt.env_dir = env_dir;
  if (env_creator.size() && !ParseEnvCreator(env_creator, local_opt.creator)) {
    spdlog::warn("Unknown env_creator {}; using {}", env_creator, EnvCreatorName(local_opt.creator));
  }
  if (packages.size()) local_opt.packages = container_opt.packages = SplitPackages(packages);
  if (run_root.size()) kRunRoot = run_root;
  if (recipe_dir.size()) container_opt.recipe_dir = recipe_dir;
  container_opt.image = ini[""]["image"] | container_opt.image;
  container_opt.default_image = ini[""]["default_image"] | container_opt.default_image;
  container_opt.env_namespace = ini[""]["env_namespace"] | container_opt.env_namespace;
  container_opt.pool_size = ini[""]["pool_size"] | container_opt.pool_size;
  container_opt.max_runs = ini[""]["max_runs"] | container_opt.max_runs;
  container_opt.ttl_seconds = ini[""]["ttl_seconds"] | container_opt.ttl_seconds;
  container_opt.target.context = ini[""]["docker_context"] | container_opt.target.context;
  container_opt.target.host = ini[""]["docker_host"] | container_opt.target.host;
  container_opt.target.ssh_host = ini[""]["ssh_host"] | container_opt.target.ssh_host;
  container_opt.target.ssh_user = ini[""]["ssh_user"] | container_opt.target.ssh_user;
  container_opt.target.ssh_port = ini[""]["ssh_port"] | container_opt.target.ssh_port;
  container_opt.target.ssh_key_path = ini[""]["ssh_key_path"] | container_opt.target.ssh_key_path;
  return true;
}

void AddTargetArguments(argparse::ArgumentParser& parser) {
  parser.add_argument("--docker-context").help("Docker context to use");
  parser.add_argument("--docker-host").help("Docker daemon address (DOCKER_HOST)");
  parser.add_argument("--ssh-host").help("Reach the daemon over SSH on this host");
  parser.add_argument("--ssh-user").help("SSH user");
  parser.add_argument("--ssh-port").scan<'d', int>().help("SSH port");
  parser.add_argument("--ssh-key-path").help("SSH identity file");
}

void ApplyTargetArguments(const argparse::ArgumentParser& parser) {
  if (auto val = parser.present("--docker-context")) container_opt.target.context = *val;
  if (auto val = parser.present("--docker-host")) container_opt.target.host = *val;
  if (auto val = parser.present("--ssh-host")) container_opt.target.ssh_host = *val;
  if (auto val = parser.present("--ssh-user")) container_opt.target.ssh_user = *val;
  if (auto val = parser.present<int>("--ssh-port")) container_opt.target.ssh_port = *val;
  if (auto val = parser.present("--ssh-key-path")) container_opt.target.ssh_key_path = *val;
}

std::string ReadSource(const argparse::ArgumentParser& cmd) {
  if (auto code = cmd.present("-e")) return *code;
  std::string file = cmd.get<std::string>("file");
  std::stringstream ss;
  if (file == "-") {
    ss << std::cin.rdbuf();
  } else {
    std::ifstream fin(file);
    if (!fin) throw ConfigError("Cannot read " + file);
    ss << fin.rdbuf();
  }
  return ss.str();
}

int Run(const argparse::ArgumentParser& cmd) {
  std::string engine_name = cmd.get<std::string>("--engine");
  if (auto val = cmd.present("--env-dir")) local_opt.env_dir = *val;
  if (auto val = cmd.present("--image")) container_opt.image = *val;
  if (auto val = cmd.present<std::vector<std::string>>("--package")) {
    local_opt.packages = container_opt.packages = *val;
  }
  nlohmann::json input = nlohmann::json::object();
  if (auto val = cmd.present("--input")) {
    input = nlohmann::json::parse(*val, nullptr, false);
    if (input.is_discarded() || !input.is_object()) {
      throw ConfigError("--input must be a JSON object");
    }
  }
  std::optional<fs::path> policy_file;
  if (auto val = cmd.present("--policy-file")) policy_file = *val;
  std::string code = ReadSource(cmd);

  std::unique_ptr<ExecutionEngine> engine;
  if (engine_name == "local") {
    engine = std::make_unique<LocalEngine>(local_opt);
  } else if (engine_name == "docker") {
    engine = std::make_unique<ContainerEngine>(container_opt);
  } else {
    throw ConfigError("--engine must be local or docker");
  }
  ExecutionResult result = RunCode(code, *engine, input, std::nullopt, policy_file);
  if (auto container = dynamic_cast<ContainerEngine*>(engine.get())) container->Shutdown();
  std::cout << result.ToJson().dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
            << std::endl;
  return result.ok ? 0 : 1;
}

int List(const argparse::ArgumentParser& cmd) {
  ContainerEngine engine(container_opt);
  std::string what = cmd.get<std::string>("what");
  nlohmann::json out = nlohmann::json::array();
  if (what == "containers") {
    for (auto& i : engine.ListContainers(cmd.get<bool>("--all"))) {
      out.push_back({
        {"id", i.id}, {"name", i.name}, {"image", i.image}, {"state", ContainerStateName(i.state)},
        {"daemon_state", i.daemon_state}, {"status", i.status}, {"created_at", i.created_at},
        {"run_count", i.run_count < 0 ? nlohmann::json() : nlohmann::json(i.run_count)},
      });
    }
  } else if (what == "images") {
    for (auto& i : engine.ListImages()) {
      out.push_back({{"id", i.id}, {"ref", i.Ref()}, {"created", i.created_since},
                     {"size", i.size}});
    }
  } else {
    throw ConfigError("list takes containers or images");
  }
  std::cout << out.dump(2) << std::endl;
  return 0;
}

int Stop(const argparse::ArgumentParser& cmd) {
  ContainerEngine engine(container_opt);
  engine.StopContainer(cmd.get<std::string>("container"), cmd.get<int>("--timeout-seconds"));
  return 0;
}

int Kill(const argparse::ArgumentParser& cmd) {
  ContainerEngine engine(container_opt);
  engine.KillContainer(cmd.get<std::string>("container"));
  return 0;
}

int Cleanup(const argparse::ArgumentParser& cmd) {
  ContainerEngine engine(container_opt);
  CleanupSummary summary = engine.CleanupStale(cmd.get<bool>("--images"));
  std::cout << nlohmann::json{{"removed_containers", summary.removed_containers},
                              {"removed_images", summary.removed_images}}.dump(2) << std::endl;
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  InitLogger();
  local_opt.env_dir = "/var/lib/snipbox/env";

  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "snipbox");
  parser.add_argument("-c", "--config")
    .default_value(std::string("/etc/snipbox.conf"))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  AddTargetArguments(parser);

  argparse::ArgumentParser run_cmd("run");
  run_cmd.add_description("Execute a snippet and print the result as JSON");
  run_cmd.add_argument("file").default_value(std::string("-")).help("Source file, - for stdin");
  run_cmd.add_argument("-e").help("Code to run instead of a file");
  run_cmd.add_argument("--engine").default_value(std::string("local")).help("local or docker");
  run_cmd.add_argument("--input").help("JSON object exposed as input_data");
  run_cmd.add_argument("--policy-file").help("INI policy file");
  run_cmd.add_argument("--env-dir").help("Environment directory of the local engine");
  run_cmd.add_argument("--package").append().help("Pinned package (name==version)");
  run_cmd.add_argument("--image").help("Container image to run in");

  argparse::ArgumentParser list_cmd("list");
  list_cmd.add_description("List managed containers or images");
  list_cmd.add_argument("what").help("containers or images");
  list_cmd.add_argument("--all").default_value(false).implicit_value(true)
    .help("Include stopped containers");

  argparse::ArgumentParser stop_cmd("stop");
  stop_cmd.add_description("Stop a managed container");
  stop_cmd.add_argument("container");
  stop_cmd.add_argument("--timeout-seconds").scan<'d', int>().default_value(10);

  argparse::ArgumentParser kill_cmd("kill");
  kill_cmd.add_description("Kill a managed container");
  kill_cmd.add_argument("container");

  argparse::ArgumentParser cleanup_cmd("cleanup");
  cleanup_cmd.add_description("Remove stale managed containers");
  cleanup_cmd.add_argument("--images").default_value(false).implicit_value(true)
    .help("Also remove managed images");

  parser.add_subparser(run_cmd);
  parser.add_subparser(list_cmd);
  parser.add_subparser(stop_cmd);
  parser.add_subparser(kill_cmd);
  parser.add_subparser(cleanup_cmd);

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    return 2;
  }

  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }
  fs::path config_file = parser.get<std::string>("--config");
  if (!ParseConfig(config_file)) {
    spdlog::info("No configuration file at {}; using defaults", config_file.string());
  }
  ApplyTargetArguments(parser);

  try {
    if (parser.is_subcommand_used(run_cmd)) return Run(run_cmd);
    if (parser.is_subcommand_used(list_cmd)) return List(list_cmd);
    if (parser.is_subcommand_used(stop_cmd)) return Stop(stop_cmd);
    if (parser.is_subcommand_used(kill_cmd)) return Kill(kill_cmd);
    if (parser.is_subcommand_used(cleanup_cmd)) return Cleanup(cleanup_cmd);
  } catch (const ConfigError& err) {
    spdlog::error("Invalid configuration: {}", err.what());
    return 2;
  } catch (const ContainerError& err) {
    spdlog::error("{}", err.what());
    return 1;
  }
  std::cerr << parser;
  return 2;
}
