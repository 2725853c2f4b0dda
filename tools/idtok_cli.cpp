#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "identifier_service.h"
#include "random_source.h"
#include "scrambled_table.h"
#include "session_payload.h"

namespace {

struct Options {
  std::string config_path;
  std::string command;
  std::vector<std::string> args;
  bool show_help{false};
};

void PrintUsage() {
  std::cout
      << "Usage: idtok_cli [-c CONFIG] <command> [args]\n"
         "  issue <userId> <clientUUID>   Print a new identifier\n"
         "  open <userId> <identifier>    Verify an identifier and print its "
         "payload\n"
         "  scramble <secret>             Print a fresh scrambled table for "
         "a secret\n"
         "  -c, --config CONFIG           INI config (default: built-in "
         "secrets)\n";
}

bool ParseArgs(int argc, char** argv, Options& out, std::string& error) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (out.command.empty() && (arg == "--help" || arg == "-h")) {
      out.show_help = true;
      return true;
    }
    if (out.command.empty() && (arg == "--config" || arg == "-c")) {
      if (i + 1 >= argc) {
        error = arg + " requires a value";
        return false;
      }
      out.config_path = argv[++i];
      continue;
    }
    if (out.command.empty()) {
      out.command = arg;
      continue;
    }
    out.args.push_back(arg);
  }
  if (out.command.empty()) {
    error = "missing command";
    return false;
  }
  const std::size_t want = out.command == "scramble" ? 1u : 2u;
  if (out.command != "issue" && out.command != "open" &&
      out.command != "scramble") {
    error = "unknown command: " + out.command;
    return false;
  }
  if (out.args.size() != want) {
    error = out.command + " expects " + std::to_string(want) + " argument(s)";
    return false;
  }
  return true;
}

void PrintList(const char* name, const std::vector<std::uint16_t>& values) {
  std::cout << name << " = {";
  for (std::size_t i = 0; i < values.size(); ++i) {
    std::cout << (i == 0 ? "" : ", ") << values[i];
  }
  std::cout << "}\n";
}

int RunScramble(const std::string& secret) {
  idtok::core::OsRandomSource random;
  std::vector<std::uint16_t> permutation;
  std::string error;
  if (!idtok::core::MakeRandomPermutation(
          idtok::core::ScrambledLength(secret.size()), &random, permutation,
          error)) {
    std::cerr << "[idtok_cli] " << error << "\n";
    return 1;
  }
  idtok::core::ScrambledTable table;
  if (!idtok::core::Scramble(secret, permutation, table, error)) {
    std::cerr << "[idtok_cli] " << error << "\n";
    return 1;
  }
  PrintList("values", std::vector<std::uint16_t>(table.values.begin(),
                                                 table.values.end()));
  PrintList("permutation", table.permutation);
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  Options opt;
  std::string error;
  if (!ParseArgs(argc, argv, opt, error)) {
    std::cerr << "[idtok_cli] " << error << "\n";
    PrintUsage();
    return 1;
  }
  if (opt.show_help) {
    PrintUsage();
    return 0;
  }
  if (opt.command == "scramble") {
    return RunScramble(opt.args[0]);
  }

  idtok::core::IdentifierService service;
  idtok::core::TokenError token_error;
  const bool ready =
      opt.config_path.empty()
          ? service.Init(idtok::core::IdentifierConfig{}, token_error)
          : service.Init(opt.config_path, token_error);
  if (!ready) {
    std::cerr << "[idtok_cli] "
              << idtok::core::TokenErrorKindName(token_error.kind)
              << " error: " << token_error.message << "\n";
    return 1;
  }

  if (opt.command == "issue") {
    std::string identifier;
    if (!service.Issue(opt.args[0], opt.args[1], identifier, token_error)) {
      std::cerr << "[idtok_cli] " << token_error.message << "\n";
      return 1;
    }
    std::cout << identifier << "\n";
    return 0;
  }

  idtok::core::SessionPayload payload;
  if (!service.Open(opt.args[1], opt.args[0], payload, token_error)) {
    std::cerr << "[idtok_cli] " << token_error.message << "\n";
    return 2;
  }
  // The credential is not echoed; only its presence is reported.
  std::cout << "userId=" << payload.user_id << "\n"
            << "clientUUID=" << payload.client_uuid << "\n"
            << "apiKey=" << (payload.api_key.empty() ? "missing" : "present")
            << "\n";
  idtok::core::WipePayload(payload);
  return 0;
}
