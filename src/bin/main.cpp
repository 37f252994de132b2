#include <ddl/error.hpp>
#include <ddl/expat_reader.hpp>
#include <ddl/grammar.hpp>
#include <ddl/recognizer.hpp>
#include <ddl/report.hpp>
#include <ddl/stack_automaton.hpp>
#include <ddl/terminal_mapper.hpp>
#include <ddl/tokenizer.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

static constexpr int exit_success = 0;
static constexpr int exit_usage = 1;
static constexpr int exit_io = 2;
static constexpr int exit_grammar = 3;
static constexpr int exit_lexical = 4;
static constexpr int exit_rejected = 5;

struct cli_options {
  std::string statement;
  std::string statement_file;
  std::string grammar_file;
  bool has_statement = false;
  bool print_tokens = false;
  bool print_terminals = false;
  bool print_trace = false;
  bool quiet = false;
  bool show_help = false;
  bool show_version = false;
};

static void
print_usage(std::ostream& os) {
  os << "Usage: ddl [options] [statement]\n"
     << "\n"
     << "Checks a statement against the ALTER TABLE ... DROP COLUMN ...\n"
     << "grammar. Reads standard input when no statement is given.\n"
     << "\n"
     << "Options:\n"
     << "  -f <file>         Read the statement from a file\n"
     << "  -g <file>         Grammar file (XML) replacing the built-in one\n"
     << "  --tokens          Print the symbol table\n"
     << "  --terminals       Print the terminal sequence\n"
     << "  --trace           Print the automaton trace\n"
     << "  -q, --quiet       Print nothing, report through the exit code\n"
     << "  -h, --help        Show this help message\n"
     << "  --version         Show version information\n";
}

static void
print_version(std::ostream& os) {
  os << "ddl " << DDL_VERSION << "\n";
}

static cli_options
parse_args(int argc, char* argv[]) {
  cli_options opts;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      opts.show_help = true;
      return opts;
    }

    if (arg == "--version") {
      opts.show_version = true;
      return opts;
    }

    if (arg == "--tokens") {
      opts.print_tokens = true;
      continue;
    }

    if (arg == "--terminals") {
      opts.print_terminals = true;
      continue;
    }

    if (arg == "--trace") {
      opts.print_trace = true;
      continue;
    }

    if (arg == "-q" || arg == "--quiet") {
      opts.quiet = true;
      continue;
    }

    if (arg == "-f") {
      if (i + 1 >= argc) {
        std::cerr << "ddl: -f requires an argument\n";
        std::exit(exit_usage);
      }
      opts.statement_file = argv[++i];
      continue;
    }

    if (arg == "-g") {
      if (i + 1 >= argc) {
        std::cerr << "ddl: -g requires an argument\n";
        std::exit(exit_usage);
      }
      opts.grammar_file = argv[++i];
      continue;
    }

    if (arg.size() > 1 && arg[0] == '-') {
      std::cerr << "ddl: unknown option: " << arg << "\n";
      std::exit(exit_usage);
    }

    if (opts.has_statement) {
      std::cerr << "ddl: more than one statement given; quote the "
                   "statement as a single argument\n";
      std::exit(exit_usage);
    }
    opts.statement = arg;
    opts.has_statement = true;
  }

  if (opts.has_statement && !opts.statement_file.empty()) {
    std::cerr << "ddl: -f and a statement argument are mutually exclusive\n";
    std::exit(exit_usage);
  }

  return opts;
}

static std::string
read_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    std::cerr << "ddl: cannot open file: " << path << "\n";
    std::exit(exit_io);
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

// Statements are single lines; a trailing newline from a file or a pipe is
// not part of them.
static std::string
strip_trailing_newlines(std::string text) {
  while (!text.empty() && (text.back() == '\n' || text.back() == '\r'))
    text.pop_back();
  return text;
}

static int
run(const cli_options& opts) {
  auto g = ddl::grammar::defaults();
  if (!opts.grammar_file.empty()) {
    std::string xml = read_file(opts.grammar_file);
    try {
      ddl::expat_reader reader(xml);
      g = ddl::grammar::load(reader);
    } catch (const std::exception& e) {
      std::cerr << "ddl: error loading grammar " << opts.grammar_file << ": "
                << e.what() << "\n";
      return exit_grammar;
    }
  }

  std::string source;
  if (opts.has_statement)
    source = opts.statement;
  else if (!opts.statement_file.empty())
    source = strip_trailing_newlines(read_file(opts.statement_file));
  else
    source = strip_trailing_newlines(
        std::string(std::istreambuf_iterator<char>(std::cin),
                    std::istreambuf_iterator<char>()));

  bool verbose = !opts.quiet;

  // Lexical and mapping phase
  std::vector<ddl::terminal> terminals;
  try {
    auto symbols = ddl::tokenizer(g.patterns).tokenize(source);
    if (verbose && opts.print_tokens)
      ddl::write_symbol_table(std::cout, symbols);
    terminals = ddl::terminal_mapper(g.keywords).map(symbols);
  } catch (const ddl::error& e) {
    if (verbose) std::cerr << "ddl: " << e.what() << "\n";
    return exit_lexical;
  }

  if (verbose && opts.print_terminals)
    std::cout << ddl::to_string(terminals) << "\n";

  // Parse phase
  ddl::trace_fn trace;
  if (verbose && opts.print_trace) {
    trace = [](const ddl::trace_record& record) {
      ddl::write_trace_record(std::cout, record);
    };
  }

  try {
    ddl::stack_automaton(g.table).analyze(terminals, trace);
  } catch (const ddl::parse_error& e) {
    if (verbose) std::cerr << "ddl: rejected: " << e.what() << "\n";
    return exit_rejected;
  }

  if (verbose) std::cout << "accepted\n";
  return exit_success;
}

int
main(int argc, char* argv[]) {
  cli_options opts = parse_args(argc, argv);

  if (opts.show_help) {
    print_usage(std::cout);
    return exit_success;
  }

  if (opts.show_version) {
    print_version(std::cout);
    return exit_success;
  }

  return run(opts);
}
