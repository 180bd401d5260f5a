#include <boost/program_options.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <registrar/fingerprint/codec.hpp>
#include <registrar/registry/registry.hpp>
#include <registrar/storage/rocksdb/storage.hpp>

#include <chrono>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

namespace {

namespace po = boost::program_options;

using registry_t =
    registrar::registry::registry<registrar::storage::rocksdb_storage_tag>;

constexpr auto kExitOk = 0;
constexpr auto kExitNotFound = 1;
constexpr auto kExitFailure = 2;

void configure_logging(const std::string& level, const bool verbose) {
  // Logs go to stderr; stdout carries command output only.
  auto logger = spdlog::stderr_color_mt("registrar");
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(verbose ? spdlog::level::debug
                            : spdlog::level::from_str(level));
}

/// Command arguments, checked before the database is opened.
struct request_t final {
  std::string kind;
  std::string record_id;
  int64_t nonce{};
  std::optional<registrar::schema::signer_id_t> signer;
};

bool needs_operation(const std::string& command) {
  return command == "fingerprint" || command == "submit" ||
         command == "signer-of";
}

bool needs_signer(const std::string& command) {
  return command == "submit" || command == "history";
}

std::optional<request_t> make_request(const std::string& command,
                                      const po::variables_map& vm) {
  auto request = request_t{.nonce = vm["nonce"].as<int64_t>()};
  if (needs_operation(command)) {
    for (const auto* name : {"kind", "record-id"}) {
      if (!vm.contains(name)) {
        std::cerr << "missing required option --" << name << '\n';
        return std::nullopt;
      }
    }
    request.kind = vm["kind"].as<std::string>();
    request.record_id = vm["record-id"].as<std::string>();
  }
  if (needs_signer(command)) {
    if (!vm.contains("signer")) {
      std::cerr << "missing required option --signer\n";
      return std::nullopt;
    }
    request.signer =
        registrar::schema::try_parse_signer(vm["signer"].as<std::string>());
    if (!request.signer) {
      std::cerr << "invalid --signer value\n";
      return std::nullopt;
    }
  }
  return request;
}

registrar::registry::registry_options make_options(
    const po::variables_map& vm) {
  auto options = registrar::registry::registry_options{};
  if (vm.contains("timeout-ms")) {
    options.wait_timeout =
        std::chrono::milliseconds{vm["timeout-ms"].as<uint64_t>()};
  }
  return options;
}

int run_fingerprint(const request_t& request) {
  auto error = std::string{};
  auto fingerprint = registrar::fingerprint::codec::encode(
      request.kind, request.record_id, request.nonce, error);
  if (!fingerprint) {
    std::cout << "encoding_error: " << error << '\n';
    return kExitFailure;
  }
  std::cout << registrar::schema::to_hex(*fingerprint) << '\n';
  return kExitOk;
}

int run_submit(registry_t& registry, const request_t& request) {
  auto result = registry.submit(request.kind, request.record_id,
                                request.nonce, *request.signer);
  if (result.accepted()) {
    std::cout << "accepted " << result.sequence << '\n';
    return kExitOk;
  }
  if (result.rejected()) {
    std::cout << "rejected " << result.sequence << '\n';
    return kExitOk;
  }
  std::cout << registrar::schema::to_string(result.code) << ": " << result.log
            << '\n';
  return kExitFailure;
}

int run_signer_of(const registry_t& registry, const request_t& request) {
  auto signer =
      registry.signer_of(request.kind, request.record_id, request.nonce);
  if (!signer) {
    std::cout << "not found\n";
    return kExitNotFound;
  }
  std::cout << registrar::schema::to_string(*signer) << '\n';
  return kExitOk;
}

int run_history(const registry_t& registry, const request_t& request) {
  for (const auto& event : registry.history_of(*request.signer)) {
    std::cout << event.sequence << ' '
              << registrar::schema::to_hex(event.fingerprint) << ' '
              << event.nonce << '\n';
  }
  return kExitOk;
}

int run_state(const registry_t& registry) {
  for (const auto& entry : registry.entries()) {
    std::cout << entry.sequence << ' '
              << registrar::schema::to_hex(entry.fingerprint) << ' '
              << registrar::schema::to_string(entry.signer) << ' '
              << entry.nonce << '\n';
  }
  return kExitOk;
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  registrar_cli fingerprint --kind K --record-id R --nonce N\n"
            << "  registrar_cli submit --kind K --record-id R --nonce N "
               "--signer S\n"
            << "  registrar_cli signer-of --kind K --record-id R --nonce N\n"
            << "  registrar_cli history --signer S\n"
            << "  registrar_cli state\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto db_path = std::string{};
  auto log_level = std::string{};
  auto options = po::options_description{"registrar_cli options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "fingerprint|submit|signer-of|history|state")(
      "db", po::value<std::string>(&db_path)->default_value("registrar.db"),
      "RocksDB directory holding the ledger")(
      "kind", po::value<std::string>(), "operation kind (Create, Update, ...)")(
      "record-id", po::value<std::string>(), "target record identifier")(
      "nonce", po::value<int64_t>()->default_value(0),
      "caller-chosen uniqueness axis, usually a timestamp")(
      "signer", po::value<std::string>(),
      "signer name, ed25519:<hex> or secp256k1:<hex>")(
      "timeout-ms", po::value<uint64_t>(),
      "bound on waiting for a coalesced in-flight submission")(
      "log-level", po::value<std::string>(&log_level)->default_value("warn"),
      "trace|debug|info|warn|error|critical|off")("verbose,v",
                                                  "enable debug logging");

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
    return kExitFailure;
  }

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return kExitOk;
  }

  if (command != "fingerprint" && command != "submit" &&
      command != "signer-of" && command != "history" && command != "state") {
    std::cerr << "command must be fingerprint|submit|signer-of|history|state\n";
    return kExitFailure;
  }
  auto request = make_request(command, vm);
  if (!request) {
    return kExitFailure;
  }

  configure_logging(log_level, vm.contains("verbose"));

  if (command == "fingerprint") {
    auto exit_code = run_fingerprint(*request);
    spdlog::shutdown();
    return exit_code;
  }

  auto exit_code = kExitFailure;
  {
    auto storage =
        registrar::storage::make_storage<registrar::storage::rocksdb_storage_tag>(
            db_path);
    auto registry = registry_t{storage, make_options(vm)};
    if (command == "submit") {
      exit_code = run_submit(registry, *request);
    } else if (command == "signer-of") {
      exit_code = run_signer_of(registry, *request);
    } else if (command == "history") {
      exit_code = run_history(registry, *request);
    } else {
      exit_code = run_state(registry);
    }
  }

  spdlog::shutdown();
  return exit_code;
}
