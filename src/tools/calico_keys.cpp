#include <boost/program_options.hpp>
#include <calico/common/critical.hpp>
#include <calico/common/overloaded.hpp>
#include <calico/datamodel/intern_pool.hpp>
#include <calico/datamodel/v1/keys.hpp>
#include <calico/datamodel/v1/parse.hpp>
#include <calico/datamodel/v1/paths.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <variant>

namespace {

namespace po = boost::program_options;
namespace v1 = calico::datamodel::v1;

std::string get_required(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    calico::common::critical("missing required argument --" + name);
  }
  auto value = vm[name].as<std::string>();
  if (value.empty() || value.find('/') != std::string::npos) {
    spdlog::warn("--{} '{}' is not a valid key segment", name, value);
  }
  return value;
}

std::string build_key(const po::variables_map& vm) {
  auto kind = vm["kind"].as<std::string>();
  if (kind == "ready") {
    return std::string{v1::kReadyKey};
  }
  if (kind == "neutron-election") {
    return std::string{v1::kNeutronElectionKey};
  }
  if (kind == "config") {
    return v1::make_config_key(get_required(vm, "config-name"));
  }
  if (kind == "host-dir") {
    return v1::make_host_dir(get_required(vm, "host"));
  }
  if (kind == "host-config-dir") {
    return v1::make_host_config_dir(get_required(vm, "host"));
  }
  if (kind == "host-config") {
    return v1::make_host_config_key(get_required(vm, "host"),
                                    get_required(vm, "config-name"));
  }
  if (kind == "host-ip") {
    return v1::make_host_ip_key(get_required(vm, "host"));
  }
  if (kind == "status-dir") {
    return v1::make_status_dir(get_required(vm, "host"));
  }
  if (kind == "status") {
    return v1::make_status_key(get_required(vm, "host"));
  }
  if (kind == "last-status") {
    return v1::make_last_status_key(get_required(vm, "host"));
  }
  if (kind == "endpoint") {
    return v1::make_endpoint_key(
        get_required(vm, "host"), get_required(vm, "orchestrator"),
        get_required(vm, "workload-id"), get_required(vm, "endpoint-id"));
  }
  if (kind == "endpoint-status") {
    return v1::make_endpoint_status_key(
        get_required(vm, "host"), get_required(vm, "orchestrator"),
        get_required(vm, "workload-id"), get_required(vm, "endpoint-id"));
  }
  if (kind == "profile") {
    return v1::make_profile_key(get_required(vm, "profile-id"));
  }
  if (kind == "profile-rules") {
    return v1::make_profile_rules_key(get_required(vm, "profile-id"));
  }
  if (kind == "profile-tags") {
    return v1::make_profile_tags_key(get_required(vm, "profile-id"));
  }
  if (kind == "ipam-v4-pool") {
    return v1::make_ipam_v4_pool_key(get_required(vm, "encoded-cidr"));
  }
  calico::common::critical("unsupported key kind " + kind);
}

std::string_view profile_kind(const v1::profile_resource_t resource) {
  switch (resource) {
    case v1::profile_resource_t::rules:
      return "profile-rules";
    case v1::profile_resource_t::tags:
      return "profile-tags";
    case v1::profile_resource_t::directory:
      break;
  }
  return "profile";
}

std::string describe(const v1::parsed_key_t& parsed) {
  return std::visit(
      calico::common::overloaded{
          [](const v1::endpoint_id& arg) {
            return "endpoint host=" + arg.host() +
                   " orchestrator=" + arg.orchestrator() +
                   " workload=" + arg.workload() +
                   " endpoint=" + arg.endpoint();
          },
          [](const v1::profile_key& arg) {
            return std::string{profile_kind(arg.resource)} +
                   " profile=" + arg.profile_id;
          },
          [](const v1::host_key& arg) {
            return "host-dir host=" + arg.hostname;
          },
          [](const v1::host_ip_key& arg) {
            return "host-ip host=" + arg.hostname;
          },
          [](const v1::config_key& arg) {
            if (arg.hostname) {
              return "host-config host=" + *arg.hostname + " name=" + arg.name;
            }
            return "config name=" + arg.name;
          },
          [](const v1::ipam_v4_pool_key& arg) {
            return "ipam-v4-pool cidr=" + arg.encoded_cidr;
          },
          [](const v1::status_key& arg) {
            return "status host=" + arg.hostname;
          },
          [](const v1::ready_key&) { return std::string{"ready"}; },
          [](const v1::neutron_election_key&) {
            return std::string{"neutron-election"};
          }},
      parsed);
}

void configure_logging(const po::variables_map& vm) {
  auto logger = std::make_shared<spdlog::logger>(
      "calico_keys", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto level = spdlog::level::from_str(vm["log-level"].as<std::string>());
  if (vm.contains("verbose")) {
    level = spdlog::level::debug;
  }
  spdlog::set_level(level);
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  calico_keys key --kind <kind> [identifier options]\n"
            << "  calico_keys parse --key <key>\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"calico_keys options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command), "key|parse")(
      "kind", po::value<std::string>(),
      "ready|neutron-election|config|host-dir|host-config-dir|host-config|"
      "host-ip|status-dir|status|last-status|endpoint|endpoint-status|"
      "profile|profile-rules|profile-tags|ipam-v4-pool")(
      "key", po::value<std::string>(), "raw key to classify")(
      "host", po::value<std::string>(), "hostname")(
      "orchestrator", po::value<std::string>(), "orchestrator name")(
      "workload-id", po::value<std::string>(), "workload id")(
      "endpoint-id", po::value<std::string>(), "endpoint id")(
      "profile-id", po::value<std::string>(), "profile id")(
      "config-name", po::value<std::string>(), "configuration name")(
      "encoded-cidr", po::value<std::string>(), "encoded IPv4 pool CIDR")(
      "log-level", po::value<std::string>()->default_value("warn"),
      "trace|debug|info|warn|err|critical|off")("verbose,v",
                                                "log at debug level");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << '\n';
    print_help(options);
    return 2;
  }

  configure_logging(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "key") {
    if (!vm.contains("kind")) {
      calico::common::critical("key mode requires --kind");
    }
    std::cout << build_key(vm) << '\n';
    return 0;
  }

  if (command == "parse") {
    if (!vm.contains("key")) {
      calico::common::critical("parse mode requires --key");
    }
    auto pool = calico::datamodel::intern_pool{};
    auto parsed = v1::parse_key(pool, vm["key"].as<std::string>());
    if (!parsed) {
      std::cout << "unknown\n";
      return 0;
    }
    std::cout << describe(*parsed) << '\n';
    return 0;
  }

  calico::common::critical("command must be key|parse");
}
