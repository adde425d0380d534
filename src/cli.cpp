// ============================================================================
// cli.cpp - Command-line interface and main driver
// ============================================================================

#include "pmc/cli.hpp"
#include "pmc/ast.hpp"
#include "pmc/errors.hpp"
#include "pmc/example_models.hpp"
#include "pmc/formula_visitor.hpp"
#include "pmc/parser.hpp"
#include "pmc/probability_checker.hpp"
#include "pmc/test.hpp"
#include "pmc/utils.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace pmc {

// ── parse_args ──────────────────────────────────────────────────────────────

static std::string option_value(int argc, char* argv[], int& i, const std::string& what) {
    if (i + 1 >= argc) {
        throw std::runtime_error(std::string(argv[i]) + " requires " + what);
    }
    return argv[++i];
}

Options parse_args(int argc, char* argv[]) {
    Options opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--selftest") {
            opts.selftest = true;
        } else if (arg == "--stats") {
            opts.show_stats = true;
        } else if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--list-models") {
            opts.list_models = true;
        } else if (arg == "--no-forward") {
            opts.no_forward = true;
        } else if (arg == "--model") {
            opts.model = option_value(argc, argv, i, "a model name");
        } else if (arg == "--dot") {
            opts.dot_path = option_value(argc, argv, i, "a file argument");
        } else if (arg == "--json") {
            opts.json_path = option_value(argc, argv, i, "a file argument");
        } else if (arg == "--threads" || arg == "-j") {
            opts.num_threads = std::stoi(option_value(argc, argv, i, "a number argument"));
            if (opts.num_threads < 0) {
                throw std::runtime_error("--threads must be >= 0");
            }
        } else if (arg == "--epsilon") {
            opts.epsilon = std::stod(option_value(argc, argv, i, "a number argument"));
            if (!(opts.epsilon > 0.0)) {
                throw std::runtime_error("--epsilon must be > 0");
            }
        } else if (arg == "--max-states") {
            opts.max_states = std::stoll(option_value(argc, argv, i, "a number argument"));
            if (opts.max_states < 1) {
                throw std::runtime_error("--max-states must be >= 1");
            }
        } else if (arg.starts_with("-")) {
            throw std::runtime_error("unknown option: " + arg);
        } else {
            if (!opts.input.empty()) {
                throw std::runtime_error("multiple inputs not supported");
            }
            opts.input = arg;
        }
    }

    if (!opts.selftest && !opts.help && !opts.list_models && opts.model.empty()) {
        throw std::runtime_error("no model specified (use --list-models)");
    }

    return opts;
}

// ── print_usage ─────────────────────────────────────────────────────────────

void print_usage(const char* program_name) {
    std::cerr
        << "Usage: " << program_name << " --model NAME [OPTIONS] [<formula> | <input.txt>]\n"
        << "       " << program_name << " --selftest\n"
        << "\n"
        << "Probabilistic state-space construction and model checking.\n"
        << "\n"
        << "Options:\n"
        << "  <formula> | <input.txt>  Formula, or file with one formula per line\n"
        << "  --model NAME       Built-in model to explore\n"
        << "  --list-models      List the built-in models\n"
        << "  --selftest         Run built-in tests\n"
        << "  --stats            Show exploration progress and statistics\n"
        << "  --dot FILE         Write the nested MDP as Graphviz DOT\n"
        << "  --json FILE        Write the nested MDP as JSON\n"
        << "  --threads N, -j N  Number of exploration threads (0 = auto, default)\n"
        << "  --epsilon X        Value iteration convergence threshold (default 1e-9)\n"
        << "  --max-states N     State storage capacity (default 16777216)\n"
        << "  --no-forward       Disable the forward optimisation\n"
        << "  --help, -h         Show this message\n"
        << "\n"
        << "Formulas:\n"
        << "  P=? [F a]   Pmin=? [a U<=5 b]   Pmax=? [G !a]   P>=0.5 [X a]\n"
        << "  R{reward}=? [C<=10]   Rmin{reward}=? [C<=10]   a & !b\n"
        << "\n"
        << "Input format:\n"
        << "  - One formula per line\n"
        << "  - Empty lines and lines starting with # are ignored\n"
        << "  - Inline comments: everything after # is ignored\n";
}

// ── run ─────────────────────────────────────────────────────────────────────
// Every formula is registered before the probability matrix is built, so
// a single exploration serves the whole input.

namespace {

struct Query {
    std::uint32_t         line = 0;
    std::string           text;
    FormulaType           type = FormulaType::Invalid;
    ProbabilityCalculator probability;
    FormulaCalculator     formula;
    RewardCalculator      reward;
};

}  // namespace

int run(const Options& opts) {
    // ── Handle --selftest / --list-models ───────────────────────────────
    if (opts.selftest) {
        return run_selftests();
    }
    if (opts.list_models) {
        for (const auto& m : example_models()) {
            std::cout << "  " << m.name << "  " << m.description << "\n";
        }
        return 0;
    }

    // ── Read input ──────────────────────────────────────────────────────
    std::vector<std::string> lines;
    if (opts.input.ends_with(".txt")) {
        try {
            lines = read_lines(opts.input);
        } catch (const std::exception& e) {
            std::cerr << "ERROR: " << e.what() << "\n";
            return 1;
        }
    } else if (!opts.input.empty()) {
        lines.push_back(opts.input);
    }

    AnalysisConfiguration config;
    config.num_threads              = opts.num_threads;
    config.use_forward_optimization = !opts.no_forward;
    config.state_capacity           = opts.max_states;
    config.value_iteration_epsilon  = opts.epsilon;
    config.progress_reports         = opts.show_stats;

    auto model = make_example_model(opts.model);
    FormulaFactory factory;
    ProbabilityChecker checker(*model, factory, config);
    bool had_errors = false;

    // ── Register each line ──────────────────────────────────────────────
    std::vector<Query> queries;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        const auto line_num = static_cast<std::uint32_t>(i + 1);
        if (is_blank_or_comment(lines[i])) continue;
        const std::string content = strip_comment(lines[i]);

        try {
            FormulaId parsed = parse_formula(content, factory, line_num);

            Query q;
            q.line = line_num;
            q.text = factory.to_string(parsed);
            q.type = classify_formula(parsed, factory);
            switch (q.type) {
                case FormulaType::Probability: q.probability = checker.calculate_probability(parsed); break;
                case FormulaType::Boolean:     q.formula = checker.calculate_formula(parsed); break;
                case FormulaType::Reward:      q.reward = checker.calculate_reward(parsed); break;
                case FormulaType::Invalid:
                    throw FormulaTypeError(std::to_string(line_num) +
                                           ": ERROR: formula is neither a probability, "
                                           "boolean nor reward formula: " + q.text);
            }
            queries.push_back(std::move(q));
        } catch (const std::exception& e) {
            // Parse errors already include line/column.
            std::cerr << e.what() << "\n";
            had_errors = true;
        }
    }

    // ── Build ───────────────────────────────────────────────────────────
    checker.create_probability_matrix();
    const NestedMdp& nmdp = checker.nested_mdp();
    std::cout << "Model '" << model->name() << "': " << nmdp.state_count() << " states, "
              << checker.compact_probability_matrix().entry_count() << " transitions\n";

    if (opts.show_stats) {
        std::cout << "Exploration:\n" << checker.exploration_stats().to_string();
    }
    if (!opts.dot_path.empty()) {
        write_file(opts.dot_path, nmdp.to_dot());
        std::cout << "  NMDP DOT  : " << opts.dot_path << "\n";
    }
    if (!opts.json_path.empty()) {
        write_file(opts.json_path, nmdp.to_json());
        std::cout << "  NMDP JSON : " << opts.json_path << "\n";
    }

    // ── Evaluate ────────────────────────────────────────────────────────
    for (const auto& q : queries) {
        try {
            std::cout << q.line << ": " << q.text;
            switch (q.type) {
                case FormulaType::Probability:
                    std::cout << " = " << q.probability.calculate() << "\n";
                    break;
                case FormulaType::Boolean:
                    std::cout << " : " << (q.formula.calculate() ? "true" : "false") << "\n";
                    break;
                case FormulaType::Reward:
                    std::cout << " = " << q.reward.calculate().to_string() << "\n";
                    break;
                case FormulaType::Invalid:
                    break;
            }
        } catch (const std::exception& e) {
            std::cout << "\n";
            std::cerr << q.line << ": ERROR: " << e.what() << "\n";
            had_errors = true;
        }
    }

    return had_errors ? 1 : 0;
}

}  // namespace pmc
