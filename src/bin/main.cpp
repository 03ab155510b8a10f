#include <kairos/decimal.hpp>
#include <kairos/duration.hpp>
#include <kairos/json.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

static constexpr int exit_success = 0;
static constexpr int exit_usage = 1;
static constexpr int exit_parse = 3;

struct cli_options {
  std::string command;
  std::vector<std::string> operands;
  std::string pattern;
  bool json = false;
  bool show_help = false;
  bool show_version = false;
};

struct command_info {
  const char* name;
  std::size_t operands;
};

static constexpr command_info commands[] = {
    {"format", 1}, {"parse", 1}, {"add", 2}, {"sub", 2}, {"mul", 2},
    {"div", 2},    {"ratio", 2}, {"mod", 2}, {"cmp", 2},
};

static void
print_usage(std::ostream& os) {
  os << "Usage: kairos [options] <command> <operand>...\n"
     << "\n"
     << "Commands:\n"
     << "  format <duration>        Rewrite a duration using --pattern\n"
     << "  parse <duration>         Show the canonical fields of a duration\n"
     << "  add <a> <b>              a + b\n"
     << "  sub <a> <b>              a - b\n"
     << "  mul <a> <scalar>         a * scalar\n"
     << "  div <a> <scalar>         a / scalar\n"
     << "  ratio <a> <b>            a / b as a number\n"
     << "  mod <a> <b>              a % b\n"
     << "  cmp <a> <b>              Print -1, 0 or 1\n"
     << "\n"
     << "Options:\n"
     << "  -p, --pattern <pattern>  Output format pattern (default: G)\n"
     << "  --json                   Write results as JSON\n"
     << "  --                       Treat the remaining arguments as operands\n"
     << "  -h, --help               Show this help message\n"
     << "  --version                Show version information\n";
}

static void
print_version(std::ostream& os) {
  os << "kairos " << KAIROS_VERSION << "\n";
}

static cli_options
parse_args(int argc, char* argv[]) {
  cli_options opts;
  bool operands_only = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (!operands_only && !arg.empty() && arg[0] == '-') {
      if (arg == "-h" || arg == "--help") {
        opts.show_help = true;
        return opts;
      }

      if (arg == "--version") {
        opts.show_version = true;
        return opts;
      }

      if (arg == "--json") {
        opts.json = true;
        continue;
      }

      if (arg == "-p" || arg == "--pattern") {
        if (i + 1 >= argc) {
          std::cerr << "kairos: " << arg << " requires an argument\n";
          std::exit(exit_usage);
        }
        opts.pattern = argv[++i];
        continue;
      }

      if (arg == "--") {
        operands_only = true;
        continue;
      }

      std::cerr << "kairos: unknown option: " << arg << "\n";
      std::exit(exit_usage);
    }

    if (opts.command.empty()) {
      opts.command = arg;
    } else {
      opts.operands.push_back(arg);
    }
  }

  return opts;
}

static const command_info*
find_command(const std::string& name) {
  for (const auto& command : commands) {
    if (name == command.name) { return &command; }
  }
  return nullptr;
}

static kairos::decimal
parse_scalar(const std::string& text) {
  auto value = kairos::decimal::try_parse(text);
  if (!value) {
    throw std::invalid_argument("not a number: '" + text + "'");
  }
  return *value;
}

static void
print_duration(const cli_options& opts, const kairos::duration& d) {
  if (opts.json) {
    std::cout << nlohmann::json(d).dump() << "\n";
  } else {
    std::cout << d.to_string(opts.pattern) << "\n";
  }
}

static void
print_fields(const cli_options& opts, const kairos::duration& d) {
  nlohmann::json fields = {
      {"negative", d.is_negative()},
      {"perpetual", d.is_perpetual()},
      {"aeons", d.aeons().to_string()},
      {"years", d.years()},
      {"total_nanoseconds", d.total_nanoseconds()},
      {"total_yoctoseconds", d.total_yoctoseconds()},
      {"planck_time", d.planck_time().to_string()},
  };

  if (opts.json) {
    std::cout << fields.dump() << "\n";
    return;
  }
  for (const auto& [key, value] : fields.items()) {
    std::cout << key << ": "
              << (value.is_string() ? value.get<std::string>() : value.dump())
              << "\n";
  }
}

static int
run(const cli_options& opts) {
  using kairos::duration;

  const auto& args = opts.operands;
  const std::string& command = opts.command;

  if (command == "format") {
    print_duration(opts, duration::parse(args[0]));
  } else if (command == "parse") {
    print_fields(opts, duration::parse(args[0]));
  } else if (command == "add") {
    print_duration(opts, duration::parse(args[0]) + duration::parse(args[1]));
  } else if (command == "sub") {
    print_duration(opts, duration::parse(args[0]) - duration::parse(args[1]));
  } else if (command == "mul") {
    print_duration(opts, duration::parse(args[0]) * parse_scalar(args[1]));
  } else if (command == "div") {
    print_duration(opts, duration::parse(args[0]) / parse_scalar(args[1]));
  } else if (command == "ratio") {
    double ratio = duration::parse(args[0]) / duration::parse(args[1]);
    if (opts.json) {
      std::cout << nlohmann::json(ratio).dump() << "\n";
    } else {
      std::cout << ratio << "\n";
    }
  } else if (command == "mod") {
    print_duration(opts, duration::parse(args[0]) % duration::parse(args[1]));
  } else if (command == "cmp") {
    auto order = duration::parse(args[0]) <=> duration::parse(args[1]);
    std::cout << (order < 0 ? -1 : order > 0 ? 1 : 0) << "\n";
  }
  return exit_success;
}

int
main(int argc, char* argv[]) {
  cli_options opts = parse_args(argc, argv);

  if (opts.show_help) {
    print_usage(std::cerr);
    return exit_success;
  }

  if (opts.show_version) {
    print_version(std::cerr);
    return exit_success;
  }

  if (opts.command.empty()) {
    std::cerr << "kairos: no command\n";
    print_usage(std::cerr);
    return exit_usage;
  }

  const command_info* command = find_command(opts.command);
  if (!command) {
    std::cerr << "kairos: unknown command: " << opts.command << "\n";
    print_usage(std::cerr);
    return exit_usage;
  }

  if (opts.operands.size() != command->operands) {
    std::cerr << "kairos " << opts.command << ": expected "
              << command->operands << " operand(s)\n";
    return exit_usage;
  }

  try {
    return run(opts);
  } catch (const std::exception& e) {
    std::cerr << "kairos " << opts.command << ": " << e.what() << "\n";
    return exit_parse;
  }
}
