// ============================================================================
// test.cpp - Self-test suite for the pmc engine
// ============================================================================
//
// Contains tests covering:
//   - Choice resolver (odometer order, replay consistency, forwards)
//   - Step graphs, the LTMDP arena and concurrent dense numbering
//   - LTMDP to NMDP conversion (forward reuse, dedup, ordering faults)
//   - NMDP validation, enumeration and export; the compact matrix
//   - Lexer, parser, normalisation and formula kinds
//   - ProbabilityChecker ordering, one-shot build and numeric results
//   - Thread-count independence of exploration
//
// ============================================================================

#include "pmc/test.hpp"
#include "pmc/ast.hpp"
#include "pmc/choice_resolver.hpp"
#include "pmc/compact_mdp.hpp"
#include "pmc/errors.hpp"
#include "pmc/example_models.hpp"
#include "pmc/formula_visitor.hpp"
#include "pmc/lexer.hpp"
#include "pmc/ltmdp.hpp"
#include "pmc/ltmdp_choice_resolver.hpp"
#include "pmc/ltmdp_generator.hpp"
#include "pmc/ltmdp_to_nmdp.hpp"
#include "pmc/model.hpp"
#include "pmc/model_checker.hpp"
#include "pmc/nmdp.hpp"
#include "pmc/normalization.hpp"
#include "pmc/parser.hpp"
#include "pmc/probability_checker.hpp"
#include "pmc/state_storage.hpp"
#include "pmc/utils.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <memory>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace pmc {

// ── TestContext ──────────────────────────────────────────────────────────────

void TestContext::check(bool condition, const std::string& description) {
    ++total_;
    if (!condition) {
        ++failed_;
        std::cerr << "  FAIL: " << description << "\n";
    }
}

void TestContext::check_eq(const std::string& actual,
                           const std::string& expected,
                           const std::string& description) {
    ++total_;
    if (actual != expected) {
        ++failed_;
        std::cerr << "  FAIL: " << description << "\n"
                  << "    expected: " << expected << "\n"
                  << "    actual:   " << actual << "\n";
    }
}

void TestContext::check_near(double actual, double expected, double tolerance,
                             const std::string& description) {
    ++total_;
    if (!(std::fabs(actual - expected) <= tolerance)) {
        ++failed_;
        std::cerr << "  FAIL: " << description << "\n"
                  << std::setprecision(12)
                  << "    expected: " << expected << " (+/- " << tolerance << ")\n"
                  << "    actual:   " << actual << "\n";
    }
}

// ── TestRunner ──────────────────────────────────────────────────────────────

void TestRunner::run(const std::string& name, TestFunc func) {
    ++tests_run_;
    TestContext ctx;
    ctx.current_test_ = name;

    std::cerr << "TEST: " << name << "\n";
    try {
        func(ctx);
    } catch (const std::exception& e) {
        std::cerr << "  EXCEPTION: " << e.what() << "\n";
        ++ctx.failed_;
    }

    checks_total_ += ctx.total();
    checks_failed_ += ctx.failed();
    if (ctx.failed() > 0) {
        ++tests_failed_;
    } else {
        std::cerr << "  OK (" << ctx.total() << " checks)\n";
    }
}

int TestRunner::summarise() const {
    std::cerr << "\n=== Test Summary ===\n"
              << "Tests:  " << tests_run_ << " run, "
              << (tests_run_ - tests_failed_) << " passed, "
              << tests_failed_ << " failed\n"
              << "Checks: " << checks_total_ << " total, "
              << (checks_total_ - checks_failed_) << " passed, "
              << checks_failed_ << " failed\n";

    if (tests_failed_ == 0) {
        std::cerr << "ALL TESTS PASSED\n";
        return 0;
    } else {
        std::cerr << "SOME TESTS FAILED\n";
        return 1;
    }
}

// ============================================================================
// Helpers
// ============================================================================

static std::string pp(const std::string& input) {
    FormulaFactory f;
    FormulaId id = parse_formula(input, f);
    return f.to_string(id);
}

static std::string pp_norm(const std::string& input) {
    FormulaFactory f;
    FormulaId id = parse_formula(input, f);
    FormulaId nid = normalize(id, f);
    return f.to_string(nid);
}

static bool parse_fails(const std::string& input) {
    try {
        FormulaFactory f;
        parse_formula(input, f);
        return false;
    } catch (const std::exception&) {
        return true;
    }
}

// True iff fn() throws an Exception.  Any other exception counts as a miss.
template <typename Exception, typename Fn>
static bool throws(Fn&& fn) {
    try {
        fn();
    } catch (const Exception&) {
        return true;
    } catch (const std::exception& e) {
        std::cerr << "    unexpected exception: " << e.what() << "\n";
        return false;
    }
    return false;
}

static AnalysisConfiguration quiet_config(int threads = 0) {
    AnalysisConfiguration config;
    config.num_threads      = threads;
    config.progress_reports = false;
    return config;
}

// Canonical text of an NMDP's relation.  States are named by their
// labeling so that two numberings of the same model compare equal.
static std::string canonical_relation(const NestedMdp& nmdp) {
    auto name = [&nmdp](std::int64_t s) { return nmdp.state_labeling(s).to_string(); };

    std::vector<std::string> rows;
    auto distributions = [&](NmdpEnumerator& e, const std::string& source) {
        while (e.move_next_distribution()) {
            std::vector<std::string> entries;
            while (e.move_next_transition()) {
                const auto& t = e.current_transition();
                std::ostringstream oss;
                oss << name(t.target_state) << ":" << std::setprecision(6) << t.probability;
                entries.push_back(oss.str());
            }
            std::sort(entries.begin(), entries.end());
            std::string row = source + " ->";
            for (const auto& x : entries) row += " " + x;
            rows.push_back(row);
        }
    };

    NmdpEnumerator e(nmdp);
    while (e.move_next_state()) distributions(e, name(e.current_state()));
    if (e.select_initial_state()) distributions(e, "init");

    std::sort(rows.begin(), rows.end());
    std::string out;
    for (const auto& r : rows) out += r + "\n";
    return out;
}

// Explore and convert a model with the given atoms, without a checker.
struct Construction {
    std::int64_t               ltmdp_size = 0;
    ExplorationStats           stats;
    std::unique_ptr<NestedMdp> nmdp;
};

static Construction construct(const SteppableModel& model,
                              const std::vector<std::string>& atoms,
                              AnalysisConfiguration config = quiet_config()) {
    Construction c;
    SerializedModel serialized = serialize_model(model, atoms, {});
    LtmdpGenerator generator(serialized, config);
    auto ltmdp = generator.generate();
    c.ltmdp_size = ltmdp->continuation_graph_size();
    c.stats = generator.stats();

    LtmdpToNmdp converter(std::move(ltmdp));
    c.nmdp = converter.convert();
    c.nmdp->validate();
    return c;
}

// ── Test models ─────────────────────────────────────────────────────────────

// start: nondeterministic choice between two branches; the untaken branch
// is forwarded to the taken one, which splits {one: 0.2, two: 0.3,
// three: 0.5}.  The outcome states are absorbing.
class ForwardScenarioModel : public SteppableModel {
public:
    std::unique_ptr<SteppableModel> clone() const override {
        return std::make_unique<ForwardScenarioModel>(*this);
    }
    std::string name() const override { return "forward-scenario"; }

    void initial_step(ChoiceResolver&) override { location_ = 0; }
    void load_state(const StateVector& s) override { location_ = s.at(0); }
    StateVector save_state() const override { return {location_}; }

    void step(ChoiceResolver& r) override {
        if (location_ != 0) return;
        r.handle_choice(2);
        r.forward_untaken_choices_at_index(r.last_choice_index());
        location_ = 1 + r.handle_probabilistic_choice(std::vector<double>{0.2, 0.3, 0.5});
    }

    std::vector<std::string> proposition_names() const override {
        return {"start", "one", "two", "three"};
    }
    bool evaluate_proposition(std::size_t index) const override {
        return location_ == static_cast<std::int32_t>(index);
    }

private:
    std::int32_t location_ = 0;
};

// Resolves a choice only on every other call of step(): replays of the same
// state disagree about the number of choices.
class InconsistentModel : public SteppableModel {
public:
    std::unique_ptr<SteppableModel> clone() const override {
        return std::make_unique<InconsistentModel>(*this);
    }
    std::string name() const override { return "inconsistent"; }

    void initial_step(ChoiceResolver&) override { value_ = 0; }
    void load_state(const StateVector& s) override { value_ = s.at(0); }
    StateVector save_state() const override { return {value_}; }

    void step(ChoiceResolver& r) override {
        if (calls_++ % 2 == 0) value_ = r.handle_choice(2);
    }

    std::vector<std::string> proposition_names() const override { return {"zero"}; }
    bool evaluate_proposition(std::size_t) const override { return value_ == 0; }

private:
    std::int32_t value_ = 0;
    int          calls_ = 0;
};

// Delegates to a ValueIterationChecker and counts the calls.
class CountingChecker : public ProbabilisticModelChecker {
public:
    explicit CountingChecker(ProbabilityChecker& checker)
        : ProbabilisticModelChecker(checker), inner_(checker) {}

    Probability calculate_probability(FormulaId f) override {
        ++calls;
        return inner_.calculate_probability(f);
    }
    bool calculate_formula(FormulaId f) override {
        ++calls;
        return inner_.calculate_formula(f);
    }
    RewardResult calculate_reward(FormulaId f) override {
        ++calls;
        return inner_.calculate_reward(f);
    }

    int calls = 0;

private:
    ValueIterationChecker inner_;
};

// ============================================================================
// Choice Resolver Tests
// ============================================================================

static void test_resolver_odometer_order(TestContext& ctx) {
    ChoiceResolver r;
    r.prepare_next_state();

    std::vector<std::pair<int, int>> paths;
    while (r.prepare_next_path()) {
        int a = r.handle_choice(2);
        int b = r.handle_choice(3);
        paths.emplace_back(a, b);
    }

    const std::vector<std::pair<int, int>> expected = {
        {0, 0}, {0, 1}, {0, 2}, {1, 0}, {1, 1}, {1, 2}};
    ctx.check(paths.size() == 6, "2x3 choices yield 6 paths");
    ctx.check(paths == expected, "paths in odometer order, last choice fastest");

    std::set<std::pair<int, int>> unique(paths.begin(), paths.end());
    ctx.check(unique.size() == 6, "no path repeated");
}

static void test_resolver_state_without_choices(TestContext& ctx) {
    ChoiceResolver r;
    r.prepare_next_state();
    int paths = 0;
    while (r.prepare_next_path()) ++paths;
    ctx.check(paths == 1, "a state without choices has exactly one path");

    r.prepare_next_state();
    ctx.check(r.prepare_next_path(), "next state starts again");
    ctx.check(r.handle_choice(1) == 0, "single-valued choice returns 0");
    ctx.check(!r.prepare_next_path(), "single-valued choice has one path");
}

static void test_resolver_dependent_choices(TestContext& ctx) {
    // The second choice only exists on the first branch.
    ChoiceResolver r;
    r.prepare_next_state();
    std::vector<std::string> paths;
    while (r.prepare_next_path()) {
        int a = r.handle_choice(2);
        std::string p = std::to_string(a);
        if (a == 0) p += std::to_string(r.handle_probabilistic_choice(0.5, 0.5));
        paths.push_back(p);
    }
    ctx.check(paths == std::vector<std::string>{"00", "01", "1"}, "branch-dependent choices");
}

static void test_resolver_nondeterminism_detected(TestContext& ctx) {
    ctx.check(throws<NondeterminismError>([] {
                  ChoiceResolver r;
                  r.prepare_next_state();
                  r.prepare_next_path();
                  r.handle_choice(2);
                  r.handle_choice(3);
                  r.prepare_next_path();
                  r.handle_choice(2);
                  r.prepare_next_path();   // one choice instead of two
              }),
              "fewer choices on replay");

    ctx.check(throws<NondeterminismError>([] {
                  ChoiceResolver r;
                  r.prepare_next_state();
                  r.prepare_next_path();
                  r.handle_choice(2);
                  r.handle_choice(3);
                  r.prepare_next_path();
                  r.handle_choice(4);      // recorded with 2 values
              }),
              "different value count on replay");

    ctx.check(throws<std::invalid_argument>([] {
                  ChoiceResolver r;
                  r.prepare_next_state();
                  r.prepare_next_path();
                  r.handle_choice(0);
              }),
              "choice without values");
}

static void test_resolver_forward(TestContext& ctx) {
    auto count_paths = [](bool forward) {
        ChoiceResolver r(forward);
        r.prepare_next_state();
        int paths = 0;
        while (r.prepare_next_path()) {
            r.handle_choice(3);
            r.forward_untaken_choices_at_index(0);
            r.handle_choice(2);
            ++paths;
        }
        return paths;
    };
    ctx.check(count_paths(true) == 2, "forwarded choice is never advanced");
    ctx.check(count_paths(false) == 6, "forward is a no-op when disabled");

    ctx.check(throws<NondeterminismError>([] {
                  ChoiceResolver r;
                  r.prepare_next_state();
                  r.prepare_next_path();
                  r.handle_choice(2);
                  r.prepare_next_path();
                  r.handle_choice(2);      // now at value 1
                  r.forward_untaken_choices_at_index(0);
              }),
              "forward of a non-zero value");

    ctx.check(throws<std::out_of_range>([] {
                  ChoiceResolver r;
                  r.prepare_next_state();
                  r.prepare_next_path();
                  r.forward_untaken_choices_at_index(0);
              }),
              "forward of a missing choice");
}

static void test_resolver_set_choices(TestContext& ctx) {
    ChoiceResolver r;
    r.set_choices({1, 2});
    r.prepare_next_state();
    ctx.check(r.prepare_next_path(), "seeded path is produced");
    ctx.check(r.handle_choice(2) == 1, "first seeded value replayed");
    ctx.check(r.handle_choice(3) == 2, "second seeded value replayed");
    ctx.check(r.choices() == std::vector<int>{1, 2}, "choices() reports the path");
    ctx.check(r.last_choice_index() == 1, "last choice index");
    ctx.check(!r.prepare_next_path(), "seeded choices are not advanced");

    r.clear();
    ctx.check(r.choices().empty(), "clear drops the stack");
}

// ============================================================================
// Continuation Graph Tests
// ============================================================================

static void test_step_graph_split(TestContext& ctx) {
    LtmdpStepGraph g;
    ctx.check(g.size() == 1 && g.element(0).is_placeholder(), "fresh graph is a root placeholder");

    const double p[2] = {0.6, 0.4};
    Cid first = g.split(g.root(), ChoiceKind::Probabilistic, 2, p);
    ctx.check(first == 1, "children follow the root");
    ctx.check(g.element(0).kind == ChoiceKind::Probabilistic && g.element(0).from == 1 &&
              g.element(0).to == 2, "root references its child block");
    ctx.check(g.element(1).probability == 0.6 && g.element(2).probability == 0.4,
              "child probabilities");

    g.set_target(1, 0);
    g.set_target(2, 1);
    ctx.check(g.leaf_count() == 2, "two leaves");

    ctx.check(throws<NondeterminismError>([&] { g.split(g.root(), ChoiceKind::Nondeterministic, 2, nullptr); }),
              "only a placeholder can be split");

    LtmdpStepGraph bad;
    const double q[2] = {0.5, 0.4};
    ctx.check(throws<std::invalid_argument>([&] { bad.split(bad.root(), ChoiceKind::Probabilistic, 2, q); }),
              "probabilities must sum to 1");
}

static void test_ltmdp_resolver_records(TestContext& ctx) {
    LtmdpStepGraph g;
    LtmdpChoiceResolver r(g);
    r.prepare_next_state();

    std::int64_t target = 0;
    while (r.prepare_next_path()) {
        if (r.handle_choice(2) == 0) r.handle_probabilistic_choice(0.25, 0.75);
        g.set_target(r.current_continuation(), target++);
    }

    ctx.check(target == 3, "three paths");
    ctx.check(g.size() == 5, "root + 2 nondeterministic + 2 probabilistic nodes");
    ctx.check(g.element(0).kind == ChoiceKind::Nondeterministic, "root is the nondeterministic split");
    ctx.check(g.element(1).kind == ChoiceKind::Probabilistic, "first branch splits again");
    ctx.check(g.element(2).is_leaf() && g.element(2).to == 2, "second branch is a leaf");
    ctx.check(g.element(4).probability == 0.75, "probabilities recorded");
}

static void test_ltmdp_rebasing(TestContext& ctx) {
    LabeledTransitionMdp ltmdp({"a"}, {});

    TransitionTarget ta{Labeling{1}, 5};
    TransitionTarget tb{Labeling{0}, 6};

    LtmdpStepGraph g1;
    g1.split(g1.root(), ChoiceKind::Nondeterministic, 2, nullptr);
    g1.set_target(1, 0);
    g1.set_target(2, 1);
    Cid r1 = ltmdp.add_state_graph(0, g1, {ta, tb}, {});

    LtmdpStepGraph g2;
    g2.set_target(0, 0);
    Cid r2 = ltmdp.add_state_graph(1, g2, {ta}, {});

    ctx.check(r1 == 0 && r2 == 3, "second graph appended after the first");
    ctx.check(ltmdp.continuation_graph_element(0).from == 1 &&
              ltmdp.continuation_graph_element(0).to == 2, "split rebased");
    ctx.check(ltmdp.continuation_graph_element(3).to == ltmdp.continuation_graph_element(1).to,
              "equal targets share one global id");
    ctx.check(ltmdp.transition_target_count() == 2, "two distinct targets");
    ctx.check(ltmdp.transition_count() == 3, "three leaves");
    ctx.check(ltmdp.continuation_graph_size_of_state(0) == 3, "graph size of state 0");
    ctx.check(throws<OrderingError>([&] { ltmdp.root_of_state(7); }), "unknown state");
    ctx.check(throws<std::logic_error>([&] { ltmdp.add_state_graph(0, g2, {ta}, {}); }),
              "a state is explored once");

    LtmdpStepGraph open;
    open.split(open.root(), ChoiceKind::Nondeterministic, 2, nullptr);
    open.set_target(1, 0);
    ctx.check(throws<NondeterminismError>([&] { ltmdp.add_state_graph(2, open, {ta}, {}); }),
              "unresolved placeholder");
}

static void test_striped_index_concurrent(TestContext& ctx) {
    StateStorage storage(1000);
    std::atomic<int> inserted{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&storage, &inserted] {
            for (std::int32_t i = 0; i < 100; ++i) {
                if (storage.insert(StateVector{i, i * 7}).second) ++inserted;
            }
        });
    }
    for (auto& th : threads) th.join();

    ctx.check(storage.size() == 100, "100 distinct keys");
    ctx.check(inserted.load() == 100, "first insert wins exactly once per key");

    bool stable = true;
    for (std::int32_t i = 0; i < 100; ++i) {
        auto id = storage.find(StateVector{i, i * 7});
        if (id < 0 || storage.key(id) != StateVector{i, i * 7}) stable = false;
    }
    ctx.check(stable, "ids map back to their keys");
    ctx.check(storage.find(StateVector{-1}) == -1, "missing key");

    StateStorage small(2);
    small.insert(StateVector{1});
    small.insert(StateVector{2});
    ctx.check(small.insert(StateVector{1}).first == 0, "existing key at capacity");
    ctx.check(throws<CapacityError>([&] { small.insert(StateVector{3}); }), "capacity exceeded");
    ctx.check(small.size() == 2 && small.capacity() == 2, "failed insert leaves no entry");
}

// ============================================================================
// Conversion Tests
// ============================================================================

static void test_convert_forward_scenario(TestContext& ctx) {
    ForwardScenarioModel model;
    Construction c = construct(model, {"start", "one", "two", "three"});

    ctx.check(c.nmdp->state_count() == 4, "start and three outcomes");
    ctx.check(c.ltmdp_size == 10, "LTMDP: initial 1 + start 6 + outcomes 3");
    ctx.check(c.nmdp->continuation_graph_size() == c.ltmdp_size,
              "converted node count equals LTMDP node count");
    ctx.check(c.nmdp->capacity().states == 4 &&
                  c.nmdp->capacity().continuation_graph_size == c.ltmdp_size,
              "arena sized by the state count and average fanout");
    ctx.check(c.stats.transitions == 7, "initial + 3 paths from start + 3 outcome self loops");

    const NestedMdp& n = *c.nmdp;
    const auto& root = n.continuation_graph_element(n.root_of_state(0));
    ctx.check(root.kind == ChoiceKind::Nondeterministic && root.to - root.from == 1,
              "start: nondeterministic root with two children");
    const auto& fwd = n.continuation_graph_element(root.to);
    ctx.check(fwd.kind == ChoiceKind::Forward && fwd.from == root.from,
              "second branch forwards to the first");

    // Both branches yield the same distribution.
    NmdpEnumerator e(n);
    e.move_next_state();
    int distributions = 0;
    bool same = true;
    while (e.move_next_distribution()) {
        ++distributions;
        double sum = 0.0;
        std::vector<double> ps;
        while (e.move_next_transition()) {
            sum += e.current_transition().probability;
            ps.push_back(e.current_transition().probability);
        }
        std::sort(ps.begin(), ps.end());
        if (ps.size() != 3 || std::fabs(ps[0] - 0.2) > 1e-12 || std::fabs(ps[2] - 0.5) > 1e-12 ||
            std::fabs(sum - 1.0) > 1e-12) {
            same = false;
        }
    }
    ctx.check(distributions == 2, "one distribution per nondeterministic branch");
    ctx.check(same, "forwarded branch has the probabilities of its target");

    AnalysisConfiguration no_forward = quiet_config();
    no_forward.use_forward_optimization = false;
    Construction d = construct(model, {"start", "one", "two", "three"}, no_forward);
    ctx.check(d.ltmdp_size == 13, "without forwards both branches split");
    ctx.check_eq(canonical_relation(*d.nmdp), canonical_relation(n),
                 "forwarding does not change the relation");
}

// Hand-built LTMDP: targets A (bit 0, storage 0) and B (bit 1, storage 1);
// initial -> A, A -> {A: 0.6, B: 0.4}, B -> B.  `reversed` inserts the
// targets and graphs in the opposite order.
static std::unique_ptr<LabeledTransitionMdp> two_state_ltmdp(bool reversed) {
    auto ltmdp = std::make_unique<LabeledTransitionMdp>(std::vector<std::string>{"a", "b"},
                                                        std::vector<std::string>{});
    const TransitionTarget ta{Labeling{1}, 0};
    const TransitionTarget tb{Labeling{2}, 1};

    LtmdpStepGraph split;
    if (!reversed) {
        const double p[2] = {0.6, 0.4};
        split.split(split.root(), ChoiceKind::Probabilistic, 2, p);
    } else {
        const double p[2] = {0.4, 0.6};
        split.split(split.root(), ChoiceKind::Probabilistic, 2, p);
    }
    split.set_target(1, 0);
    split.set_target(2, 1);
    const std::vector<TransitionTarget> split_targets =
        reversed ? std::vector<TransitionTarget>{tb, ta} : std::vector<TransitionTarget>{ta, tb};

    LtmdpStepGraph self;
    self.set_target(0, 0);

    if (!reversed) {
        ltmdp->set_initial_state_graph(self, {ta});
        ltmdp->add_state_graph(0, split, split_targets, {});
        ltmdp->add_state_graph(1, self, {tb}, {});
    } else {
        ltmdp->add_transition_target(tb);
        ltmdp->add_state_graph(1, self, {tb}, {});
        ltmdp->add_state_graph(0, split, split_targets, {});
        ltmdp->set_initial_state_graph(self, {ta});
    }
    return ltmdp;
}

static void test_convert_dedup_idempotence(TestContext& ctx) {
    LtmdpToNmdp c1(two_state_ltmdp(false));
    LtmdpToNmdp c2(two_state_ltmdp(true));
    auto n1 = c1.convert();
    auto n2 = c2.convert();
    n1->validate();
    n2->validate();

    ctx.check(n1->state_count() == 2 && n2->state_count() == 2, "two states each");
    ctx.check(n1->state_labeling(0) != n2->state_labeling(0), "numbering differs");
    ctx.check_eq(canonical_relation(*n2), canonical_relation(*n1),
                 "isomorphic up to renumbering");
    ctx.check(c1.mdp_state_of_target() == std::vector<std::int64_t>{0, 1} &&
              c2.mdp_state_of_target() == std::vector<std::int64_t>{0, 1},
              "targets numbered in first-seen order");
    ctx.check(c1.ltmdp_retired() && c2.ltmdp_retired(), "LTMDPs released");
    ctx.check(throws<OrderingError>([&] { c1.convert(); }), "conversion runs once");
}

static void test_convert_ordering_faults(TestContext& ctx) {
    ctx.check(throws<OrderingError>([] { LtmdpToNmdp(nullptr).convert(); }),
              "conversion before exploration");

    ctx.check(throws<OrderingError>([] {
                  auto ltmdp = std::make_unique<LabeledTransitionMdp>(
                      std::vector<std::string>{}, std::vector<std::string>{});
                  LtmdpToNmdp(std::move(ltmdp)).convert();
              }),
              "missing initial distribution");

    // c1 forwards to c3, which is only buffered once c2 has been expanded.
    ctx.check(throws<OrderingError>([] {
                  auto ltmdp = std::make_unique<LabeledTransitionMdp>(
                      std::vector<std::string>{}, std::vector<std::string>{});
                  LtmdpStepGraph g;
                  g.split(g.root(), ChoiceKind::Nondeterministic, 2, nullptr);
                  const double p[2] = {0.5, 0.5};
                  g.split(2, ChoiceKind::Probabilistic, 2, p);
                  g.forward(1, 3);
                  g.set_target(3, 0);
                  g.set_target(4, 0);
                  const TransitionTarget t{Labeling{}, 0};
                  ltmdp->set_initial_state_graph(g, {t});
                  ltmdp->add_state_graph(0, g, {t}, {});
                  LtmdpToNmdp(std::move(ltmdp)).convert();
              }),
              "forward to an unbuffered node");
}

// ============================================================================
// NMDP Tests
// ============================================================================

// s0 -> nondeterministic { {s0: 0.5, s1: 0.5}, {s1: 1} }, s1 -> s1, init -> s0
static std::unique_ptr<NestedMdp> small_nmdp() {
    ModelCapacity cap;
    cap.states = 2;
    cap.continuation_graph_size = 7;
    auto n = std::make_unique<NestedMdp>(cap, std::vector<std::string>{"goal"},
                                         std::vector<std::string>{"cost"});
    n->set_state_count(2);

    Cid init = n->get_place_for_new_continuation_graph_elements(1);
    n->add_continuation_graph_leaf(init, 0, 1.0);
    n->set_root_continuation_graph_location_of_initial_state(init);

    Cid root0 = n->get_place_for_new_continuation_graph_elements(1);
    Cid branches = n->get_place_for_new_continuation_graph_elements(2);
    Cid outcomes = n->get_place_for_new_continuation_graph_elements(2);
    n->add_continuation_graph_inner_node(root0, ChoiceKind::Nondeterministic,
                                         branches, branches + 1, 1.0);
    n->add_continuation_graph_inner_node(branches, ChoiceKind::Probabilistic,
                                         outcomes, outcomes + 1, 1.0);
    n->add_continuation_graph_leaf(branches + 1, 1, 1.0);
    n->add_continuation_graph_leaf(outcomes, 0, 0.5);
    n->add_continuation_graph_leaf(outcomes + 1, 1, 0.5);
    n->set_root_continuation_graph_location_of_state(0, root0);

    Cid root1 = n->get_place_for_new_continuation_graph_elements(1);
    n->add_continuation_graph_leaf(root1, 1, 1.0);
    n->set_root_continuation_graph_location_of_state(1, root1);

    n->set_state_labeling(1, Labeling{1});
    n->set_state_rewards(0, {2.0});
    n->set_state_rewards(1, {0.0});
    return n;
}

static void test_nmdp_validate(TestContext& ctx) {
    auto n = small_nmdp();
    bool valid = true;
    try {
        n->validate();
    } catch (const std::logic_error& e) {
        std::cerr << "    " << e.what() << "\n";
        valid = false;
    }
    ctx.check(valid, "hand-built NMDP is valid");
    ctx.check(n->capacity().states == 2 && n->continuation_graph_size() == 7, "arena filled exactly");

    const ModelCapacity estimate = ModelCapacity::by_model_size(10, 2.5);
    ctx.check(estimate.states == 10 && estimate.continuation_graph_size == 28,
              "estimate: (states + initial) * fanout, rounded up");
    ctx.check(throws<std::invalid_argument>([] { ModelCapacity::by_model_size(-1, 1.0); }),
              "negative estimate");
    ctx.check(throws<CapacityError>([&] { n->get_place_for_new_continuation_graph_elements(1); }),
              "continuation graph capacity");
    ctx.check(throws<CapacityError>([&] { n->set_state_count(3); }), "state capacity");
    ctx.check(throws<std::invalid_argument>([&] { n->set_state_rewards(0, {1.0, 2.0}); }),
              "reward vector size");

    ModelCapacity cap;
    cap.states = 1;
    cap.continuation_graph_size = 3;
    NestedMdp bad(cap, {}, {});
    bad.set_state_count(1);
    Cid root = bad.get_place_for_new_continuation_graph_elements(1);
    Cid kids = bad.get_place_for_new_continuation_graph_elements(2);
    bad.add_continuation_graph_inner_node(root, ChoiceKind::Probabilistic, kids, kids + 1, 1.0);
    bad.add_continuation_graph_leaf(kids, 0, 0.5);
    bad.set_root_continuation_graph_location_of_state(0, root);
    bad.set_root_continuation_graph_location_of_initial_state(root);
    ctx.check(throws<std::logic_error>([&] { bad.validate(); }), "unfilled location");

    bad.add_continuation_graph_leaf(kids + 1, 0, 0.4);
    ctx.check(throws<std::logic_error>([&] { bad.validate(); }), "probabilities sum to 0.9");
    ctx.check(throws<std::logic_error>([&] { bad.add_continuation_graph_leaf(kids, 0, 0.5); }),
              "location filled twice");

    // root -> {forward back to root, leaf}
    NestedMdp looping(cap, {}, {});
    looping.set_state_count(1);
    Cid top = looping.get_place_for_new_continuation_graph_elements(1);
    Cid pair = looping.get_place_for_new_continuation_graph_elements(2);
    looping.add_continuation_graph_inner_node(top, ChoiceKind::Nondeterministic, pair, pair + 1, 1.0);
    looping.add_continuation_graph_inner_node(pair, ChoiceKind::Forward, top, top, 1.0);
    looping.add_continuation_graph_leaf(pair + 1, 0, 1.0);
    looping.set_root_continuation_graph_location_of_state(0, top);
    looping.set_root_continuation_graph_location_of_initial_state(top);
    ctx.check(throws<std::logic_error>([&] { looping.validate(); }), "forward to an ancestor");
}

static void test_nmdp_enumerator(TestContext& ctx) {
    auto n = small_nmdp();
    NmdpEnumerator e(*n);

    ctx.check(throws<OrderingError>([&] { e.current_transition(); }), "no transition selected");

    std::vector<std::string> relation;
    double total0 = 0.0;
    bool sums_to_one = true;
    while (e.move_next_state()) {
        int d = 0;
        while (e.move_next_distribution()) {
            double sum = 0.0;
            while (e.move_next_transition()) {
                const auto& t = e.current_transition();
                sum += t.probability;
                std::ostringstream oss;
                oss << e.current_state() << "/" << d << "->" << t.target_state << ":" << t.probability;
                relation.push_back(oss.str());
            }
            if (std::fabs(sum - 1.0) > 1e-9) sums_to_one = false;
            if (e.current_state() == 0) total0 += sum;
            ++d;
        }
    }

    const std::vector<std::string> expected = {
        "0/0->0:0.5", "0/0->1:0.5", "0/1->1:1", "1/0->1:1"};
    ctx.check(relation == expected, "enumeration reproduces the relation");
    ctx.check(sums_to_one, "every distribution sums to 1");
    ctx.check_near(total0, 2.0, 1e-12, "s0 has two distributions");

    ctx.check(e.select_initial_state() && e.is_initial_state() && e.current_state() == -1,
              "initial distribution selected");
    ctx.check(e.move_next_distribution() && e.move_next_transition() &&
              e.current_transition().target_state == 0, "initial -> s0");
    ctx.check(!e.move_next_transition() && !e.move_next_distribution(), "single initial transition");

    e.reset();
    ctx.check(e.move_next_state() && e.current_state() == 0, "reset restarts enumeration");
}

static void test_nmdp_export(TestContext& ctx) {
    auto n = small_nmdp();
    const std::string text = n->to_string();
    ctx.check(text.find("2 state(s)") != std::string::npos, "to_string header");
    ctx.check(text.find("s1: {goal}") != std::string::npos, "to_string labels");
    ctx.check(text.find("cost=2") != std::string::npos, "to_string rewards");

    const std::string dot = n->to_dot();
    ctx.check(dot.rfind("digraph NestedMdp {", 0) == 0, "DOT header");
    ctx.check(dot.find("shape=diamond") != std::string::npos, "nondeterministic node drawn");

    const std::string json = n->to_json();
    ctx.check(json.find("\"continuation_graph\"") != std::string::npos, "JSON graph");
    ctx.check(json.find("\"kind\": \"Nondeterministic\"") != std::string::npos, "JSON kinds");
}

static void test_compact_matrix(TestContext& ctx) {
    auto n = small_nmdp();
    CompactMdp m = CompactMdp::derive(*n);

    ctx.check(m.state_count() == 2, "two states");
    ctx.check(m.initial_state() == 2, "initial pseudo-state after the states");
    ctx.check(m.distribution_end(0) - m.distribution_begin(0) == 2, "s0: two distributions");
    ctx.check(m.distribution_count() == 4, "2 + 1 + initial");
    ctx.check(m.entry_count() == 5, "five entries");
    ctx.check(m.labeling(1).test(0) && !m.labeling(0).test(0), "labelings carried");
    ctx.check(m.reward(0, m.reward_index("cost")) == 2.0, "rewards carried");
    ctx.check(m.label_index("nope") == -1, "unknown label");

    // Two leaves of one distribution reaching the same state are merged.
    ModelCapacity cap;
    cap.states = 1;
    cap.continuation_graph_size = 4;
    NestedMdp dup(cap, {}, {});
    dup.set_state_count(1);
    Cid root = dup.get_place_for_new_continuation_graph_elements(1);
    Cid kids = dup.get_place_for_new_continuation_graph_elements(2);
    dup.add_continuation_graph_inner_node(root, ChoiceKind::Probabilistic, kids, kids + 1, 1.0);
    dup.add_continuation_graph_leaf(kids, 0, 0.3);
    dup.add_continuation_graph_leaf(kids + 1, 0, 0.7);
    dup.set_root_continuation_graph_location_of_state(0, root);
    Cid init = dup.get_place_for_new_continuation_graph_elements(1);
    dup.add_continuation_graph_leaf(init, 0, 1.0);
    dup.set_root_continuation_graph_location_of_initial_state(init);
    dup.validate();

    CompactMdp merged = CompactMdp::derive(dup);
    const auto d = merged.distribution_begin(0);
    ctx.check(merged.entry_end(d) - merged.entry_begin(d) == 1, "duplicate targets merged");
    ctx.check_near(merged.value(merged.entry_begin(d)), 1.0, 1e-12, "merged probability");
}

// ============================================================================
// Formula Front End Tests
// ============================================================================

static void test_lexer_tokens(TestContext& ctx) {
    auto toks = tokenise("Pmin=? [F<=5 a]");
    ctx.check(toks.size() == 9, "token count incl. Eof");
    ctx.check(toks[0].kind == TokenKind::KwPmin, "Pmin keyword");
    ctx.check(toks[1].kind == TokenKind::Query, "=? operator");
    ctx.check(toks[2].kind == TokenKind::LBracket, "[ bracket");
    ctx.check(toks[3].kind == TokenKind::KwF, "F keyword");
    ctx.check(toks[4].kind == TokenKind::LessEq, "<= operator");
    ctx.check(toks[5].kind == TokenKind::IntLiteral && toks[5].text == "5", "integer 5");
    ctx.check(toks[6].kind == TokenKind::Identifier && toks[6].text == "a", "identifier a");
    ctx.check(toks[7].kind == TokenKind::RBracket, "] bracket");
    ctx.check(toks[8].kind == TokenKind::Eof, "Eof");

    auto toks2 = tokenise("R{cost} P>=0.25 -> <->");
    ctx.check(toks2[0].kind == TokenKind::KwR, "R keyword");
    ctx.check(toks2[1].kind == TokenKind::LBrace, "{ brace");
    ctx.check(toks2[3].kind == TokenKind::RBrace, "} brace");
    ctx.check(toks2[5].kind == TokenKind::GreaterEq, ">= operator");
    ctx.check(toks2[6].kind == TokenKind::RealLiteral && toks2[6].text == "0.25", "real literal");
    ctx.check(toks2[7].kind == TokenKind::Arrow, "-> operator");
    ctx.check(toks2[8].kind == TokenKind::DoubleArrow, "<-> operator");
}

static void test_parse_formulas(TestContext& ctx) {
    ctx.check_eq(pp("p"), "p", "atom");
    ctx.check_eq(pp("!a & b"), "((!a) & b)", "negation binds tighter");
    ctx.check_eq(pp("a | b & c"), "(a | (b & c))", "and binds tighter than or");
    ctx.check_eq(pp("a -> b -> c"), "(a -> (b -> c))", "implication is right associative");
    ctx.check_eq(pp("F<=5 p"), "F<=5 p", "bounded finally");
    ctx.check_eq(pp("G !p"), "G (!p)", "globally");
    ctx.check_eq(pp("P=? [F a]"), "P=? [F a]", "probability query");
    ctx.check_eq(pp("Pmin=? [a U<=3 b]"), "Pmin=? [(a U<=3 b)]", "bounded until");
    ctx.check_eq(pp("Pmax=? [X a]"), "Pmax=? [X a]", "next");
    ctx.check_eq(pp("P>=0.5 [F a]"), "P>=0.5 [F a]", "probability bound");
    ctx.check_eq(pp("R{cost}=? [C<=10]"), "R{cost}=? [C<=10]", "reward query");
    ctx.check_eq(pp("Rmax{cost}=? [C<=10]"), "Rmax{cost}=? [C<=10]", "max reward query");
}

static void test_parse_errors(TestContext& ctx) {
    ctx.check(parse_fails("Pmin>=0.5 [F a]"), "optimum with a bound");
    ctx.check(parse_fails("P>=1.5 [F a]"), "threshold above 1");

    FormulaFactory huge;
    ctx.check(throws<std::runtime_error>([&] {
                  parse_formula("P<=" + std::string(400, '9') + " [F a]", huge);
              }),
              "out-of-range threshold is a parse error");
    try {
        parse_formula("P<=" + std::string(400, '9') + " [F a]", huge);
    } catch (const std::runtime_error& e) {
        ctx.check(std::string(e.what()).find("out of range at column 4") != std::string::npos,
                  "out-of-range threshold reports its column");
    }
    ctx.check(parse_fails("R{cost}=? [F a]"), "reward needs C<=k");
    ctx.check(parse_fails("a U b U c"), "until is not associative");
    ctx.check(parse_fails("P=? [F a"), "missing ]");
    ctx.check(parse_fails("(a & b"), "missing )");
    ctx.check(parse_fails("a b"), "trailing input");

    std::string msg;
    try {
        FormulaFactory f;
        parse_formula("a &", f, 3);
    } catch (const std::runtime_error& e) {
        msg = e.what();
    }
    ctx.check(msg.rfind("3: ERROR:", 0) == 0, "error carries the line number");
    ctx.check(msg.find("at column") != std::string::npos, "error carries the column");
}

static void test_normalization(TestContext& ctx) {
    ctx.check_eq(pp_norm("a -> b"), "((!a) | b)", "implication eliminated");
    ctx.check_eq(pp_norm("a <-> b"), "(((!a) | b) & (a | (!b)))", "equivalence eliminated");
    ctx.check_eq(pp_norm("!!a"), "a", "double negation");
    ctx.check_eq(pp_norm("!true"), "false", "negated constant");
    ctx.check_eq(pp_norm("P=? [F (a -> b)]"), "P=? [F ((!a) | b)]", "below a query");

    FormulaFactory f;
    FormulaId a = parse_formula("a & b", f);
    FormulaId b = parse_formula("a & b", f);
    ctx.check(a == b, "interning gives equal ids");
}

static void test_formula_kinds(TestContext& ctx) {
    auto kind = [](const std::string& s) {
        FormulaFactory f;
        return classify_formula(parse_formula(s, f), f);
    };
    ctx.check(kind("a & !b") == FormulaType::Boolean, "state formula");
    ctx.check(kind("P>=0.5 [F a]") == FormulaType::Boolean, "probability bound");
    ctx.check(kind("P=? [F a]") == FormulaType::Probability, "probability query");
    ctx.check(kind("F a") == FormulaType::Probability, "bare path formula");
    ctx.check(kind("X P>=0.5 [F a]") == FormulaType::Probability, "nested bound under X");
    ctx.check(kind("R{r}=? [C<=3]") == FormulaType::Reward, "reward query");
    ctx.check(kind("P=? [F a] & b") == FormulaType::Invalid, "query below a connective");
    ctx.check(kind("F F a") == FormulaType::Invalid, "path formula below a path operator");

    FormulaFactory f;
    ctx.check(is_path_formula(parse_formula("a U<=2 b", f), f), "bounded until is a path formula");
    ctx.check(!is_path_formula(parse_formula("P=? [X a]", f), f), "query is not a path formula");

    FormulaId id = parse_formula("P>=0.5 [a U b] & (c | a)", f);
    ctx.check(collect_atoms(id, f) == std::vector<std::string>{"a", "b", "c"}, "atoms collected");
    ctx.check(collect_reward_names(parse_formula("Rmin{z}=? [C<=1]", f), f) ==
              std::vector<std::string>{"z"}, "reward names collected");
}

// ============================================================================
// Checker Orchestrator Tests
// ============================================================================

static void test_checker_coin(TestContext& ctx) {
    auto model = make_example_model("coin");
    FormulaFactory f;
    ProbabilityChecker checker(*model, f, quiet_config());

    auto reach_a   = checker.calculate_probability(parse_formula("P=? [F A]", f));
    auto bare      = checker.calculate_probability(parse_formula("F B", f));
    auto bound_yes = checker.calculate_formula(parse_formula("P>=0.5 [F A]", f));
    auto bound_no  = checker.calculate_formula(parse_formula("P>0.7 [F A]", f));
    auto start     = checker.calculate_formula(parse_formula("start & !A", f));
    auto flips     = checker.calculate_reward(parse_formula("R{flips}=? [C<=5]", f));

    checker.create_probability_matrix();

    ctx.check_near(reach_a.calculate(), 0.6, 1e-9, "P[F A] = 0.6");
    ctx.check_near(bare.calculate(), 0.4, 1e-9, "bare F B = 0.4");
    ctx.check(bound_yes.calculate(), "P>=0.5 [F A] holds");
    ctx.check(!bound_no.calculate(), "P>0.7 [F A] does not hold");
    ctx.check(start.calculate(), "initially in start");
    ctx.check_near(flips.calculate().value, 1.0, 1e-12, "one flip");
    ctx.check(checker.nested_mdp().state_count() == 3, "three states");
    ctx.check(checker.build_count() == 1, "built once");
}

static void test_checker_dice(TestContext& ctx) {
    auto model = make_example_model("dice");
    FormulaFactory f;
    ProbabilityChecker checker(*model, f, quiet_config());

    auto six     = checker.calculate_probability(parse_formula("P=? [F six]", f));
    auto within3 = checker.calculate_probability(parse_formula("P=? [F<=3 done]", f));
    auto never   = checker.calculate_probability(parse_formula("P=? [G !done]", f));
    auto flips   = checker.calculate_reward(parse_formula("R{flips}=? [C<=200]", f));
    checker.create_probability_matrix();

    ctx.check_near(six.calculate(), 1.0 / 6.0, 1e-6, "P[F six] = 1/6");
    ctx.check_near(within3.calculate(), 0.75, 1e-12, "P[F<=3 done] = 3/4");
    ctx.check_near(never.calculate(), 0.0, 1e-6, "P[G !done] = 0");
    ctx.check_near(flips.calculate().value, 11.0 / 3.0, 1e-6, "expected flips = 11/3");
    ctx.check(checker.nested_mdp().state_count() == 13, "7 coin states + 6 die values");

    ValueIterationChecker direct(checker);
    ctx.check_near(direct.calculate_probability(f.make_probability_query(
                       parse_formula("F six", f), Optimum::Default)),
                   1.0 / 6.0, 1e-6, "direct checker on a normalised query");
    ctx.check(direct.last_iteration_count() > 1, "unbounded query iterated until convergence");
}

static void test_checker_pump_min_max(TestContext& ctx) {
    auto run = [&ctx](bool forward) {
        auto model = make_example_model("pump");
        FormulaFactory f;
        AnalysisConfiguration config = quiet_config();
        config.use_forward_optimization = forward;
        ProbabilityChecker checker(*model, f, config);

        auto pmax = checker.calculate_probability(parse_formula("Pmax=? [F<=3 overflow]", f));
        auto pmin = checker.calculate_probability(parse_formula("Pmin=? [F<=3 overflow]", f));
        auto pdef = checker.calculate_probability(parse_formula("P=? [F<=3 overflow]", f));
        auto safe = checker.calculate_probability(parse_formula("Pmin=? [G<=3 !overflow]", f));
        auto low  = checker.calculate_formula(parse_formula("P<0.03 [F<=3 overflow]", f));
        auto high = checker.calculate_formula(parse_formula("P>0.001 [F<=3 overflow]", f));
        auto wet  = checker.calculate_reward(parse_formula("Rmin{flooded}=? [C<=4]", f));
        checker.create_probability_matrix();

        const std::string tag = forward ? " (forward)" : " (no forward)";
        ctx.check_near(pmax.calculate(), 0.027, 1e-12, "Pmax[F<=3 overflow]" + tag);
        ctx.check_near(pmin.calculate(), 0.0027, 1e-12, "Pmin[F<=3 overflow]" + tag);
        ctx.check_near(pdef.calculate(), 0.027, 1e-12, "P=? means Pmax" + tag);
        ctx.check_near(safe.calculate(), 0.973, 1e-12, "Pmin[G<=3 !overflow]" + tag);
        ctx.check(low.calculate(), "upper bound uses Pmax" + tag);
        ctx.check(high.calculate(), "lower bound uses Pmin" + tag);

        const RewardResult r = wet.calculate();
        ctx.check(r.value == r.minimum && r.minimum <= r.maximum, "reward min/max" + tag);
        ctx.check_near(r.maximum, 0.027, 1e-12, "flooded once at most in 4 steps" + tag);
        return checker.nested_mdp().state_count();
    };

    const auto with = run(true);
    const auto without = run(false);
    ctx.check(with == 8 && with == without, "forward optimisation keeps the state space");
}

static void test_checker_kind_mismatch(TestContext& ctx) {
    auto model = make_example_model("coin");
    FormulaFactory f;
    ProbabilityChecker checker(*model, f, quiet_config());

    ctx.check(throws<FormulaTypeError>([&] { checker.calculate_probability(parse_formula("A", f)); }),
              "boolean formula as probability");
    ctx.check(throws<FormulaTypeError>([&] { checker.calculate_formula(parse_formula("P=? [F A]", f)); }),
              "probability formula as boolean");
    ctx.check(throws<FormulaTypeError>([&] { checker.calculate_reward(parse_formula("F A", f)); }),
              "path formula as reward");
    ctx.check(throws<FormulaTypeError>([&] { checker.calculate_formula(parse_formula("P=? [F A] & B", f)); }),
              "invalid formula");
    ctx.check(throws<std::invalid_argument>([&] { checker.calculate_probability(parse_formula("F nope", f)); }),
              "unknown atom");
    ctx.check(throws<std::invalid_argument>([&] { checker.calculate_reward(parse_formula("R{nope}=? [C<=1]", f)); }),
              "unknown reward");
}

static void test_checker_ordering(TestContext& ctx) {
    auto model = make_example_model("coin");
    FormulaFactory f;
    ProbabilityChecker checker(*model, f, quiet_config());

    auto calc = checker.calculate_probability(parse_formula("P=? [F A]", f));
    ctx.check(throws<OrderingError>([&] { calc.calculate(); }), "query before build");
    ctx.check(throws<OrderingError>([&] { checker.compact_probability_matrix(); }), "matrix before build");
    ctx.check(!checker.probability_matrix_was_created(), "not created yet");

    checker.create_probability_matrix();
    ctx.check(throws<OrderingError>([&] { checker.calculate_probability(parse_formula("P=? [F B]", f)); }),
              "register after build");
    checker.create_probability_matrix();
    ctx.check(checker.build_count() == 1, "second call does not rebuild");
    ctx.check_near(calc.calculate(), 0.6, 1e-9, "registered query still answered");
}

static void test_checker_concurrent_build(TestContext& ctx) {
    auto model = make_example_model("dice");
    FormulaFactory f;
    ProbabilityChecker checker(*model, f, quiet_config(1));
    auto six = checker.calculate_probability(parse_formula("P=? [F six]", f));

    std::thread t1([&checker] { checker.create_probability_matrix(); });
    std::thread t2([&checker] { checker.create_probability_matrix(); });
    t1.join();
    t2.join();

    ctx.check(checker.build_count() == 1, "exactly one build");
    ctx.check(checker.probability_matrix_was_created(), "matrix published");
    ctx.check_near(six.calculate(), 1.0 / 6.0, 1e-6, "result after concurrent build");
}

static void test_checker_concurrent_queries(TestContext& ctx) {
    auto model = make_example_model("dice");
    FormulaFactory f;
    ProbabilityChecker checker(*model, f, quiet_config());
    auto six = checker.calculate_probability(parse_formula("P=? [F six]", f));
    checker.create_probability_matrix();

    Probability first = 0.0;
    Probability second = 0.0;
    std::thread t1([&] { first = six.calculate(); });
    std::thread t2([&] { second = six.calculate(); });
    std::thread t3([&checker] {
        checker.set_default_checker(std::make_unique<ValueIterationChecker>(checker));
    });
    t1.join();
    t2.join();
    t3.join();

    ctx.check_near(first, 1.0 / 6.0, 1e-6, "first thread");
    ctx.check_near(second, 1.0 / 6.0, 1e-6, "second thread");
    ctx.check_near(six.calculate(), 1.0 / 6.0, 1e-6, "replacement checker");
}

static void test_checker_custom_checker(TestContext& ctx) {
    auto model = make_example_model("coin");
    FormulaFactory f;
    ProbabilityChecker checker(*model, f, quiet_config());
    auto calc = checker.calculate_probability(parse_formula("P=? [F A]", f));
    auto holds = checker.calculate_formula(parse_formula("P>=0.6 [F A]", f));
    checker.create_probability_matrix();

    CountingChecker custom(checker);
    ctx.check_near(calc.calculate_with_checker(custom), 0.6, 1e-9, "custom checker result");
    ctx.check(custom.calls == 1, "custom checker used");

    auto owned = std::make_unique<CountingChecker>(checker);
    CountingChecker* raw = owned.get();
    checker.set_default_checker(std::move(owned));
    ctx.check(holds.calculate(), "default checker replaced");
    ctx.check(raw->calls == 1, "replacement used by calculate()");

    FormulaFactory g;
    ProbabilityChecker other(*model, g, quiet_config());
    CountingChecker foreign(other);
    ctx.check(throws<std::invalid_argument>([&] { calc.calculate_with_checker(foreign); }),
              "checker bound to another ProbabilityChecker");
}

static void test_checker_output(TestContext& ctx) {
    auto model = make_example_model("coin");
    FormulaFactory f;
    AnalysisConfiguration config = quiet_config();
    config.progress_reports = true;
    ProbabilityChecker checker(*model, f, config);

    std::vector<std::string> lines;
    checker.set_output([&lines](const std::string& m) { lines.push_back(m); });
    checker.calculate_probability(parse_formula("P=? [F A]", f));
    checker.create_probability_matrix();

    auto has = [&lines](const std::string& prefix) {
        return std::any_of(lines.begin(), lines.end(), [&](const std::string& l) {
            return l.rfind(prefix, 0) == 0;
        });
    };
    ctx.check(has("Explored level 1"), "exploration progress");
    ctx.check(has("Creating nested Markov decision process"), "conversion progress");
    ctx.check(has("States: 3"), "statistics block");
}

static void test_exploration_faults(TestContext& ctx) {
    InconsistentModel inconsistent;
    ctx.check(throws<NondeterminismError>([&] { construct(inconsistent, {"zero"}); }),
              "replay with a different number of choices");

    auto dice = make_example_model("dice");
    AnalysisConfiguration config = quiet_config();
    config.state_capacity = 3;
    ctx.check(throws<CapacityError>([&] { construct(*dice, {"six"}, config); }),
              "state capacity");

    SerializedModel serialized = serialize_model(*dice, {"six"}, {});
    LtmdpGenerator generator(serialized, quiet_config());
    generator.generate();
    ctx.check(generator.state_storage().size() == 13, "dice storage holds 13 states");
    ctx.check(throws<OrderingError>([&] { generator.generate(); }), "exploration runs once");

    ctx.check(throws<std::invalid_argument>([&] { serialize_model(*dice, {"seven"}, {}); }),
              "unknown proposition");
    ctx.check(throws<std::invalid_argument>([] { make_example_model("nope"); }), "unknown model");
}

// ============================================================================
// Parallel Equivalence
// ============================================================================

static void test_parallel_equivalence(TestContext& ctx) {
    for (const std::string name : {"dice", "pump"}) {
        auto model = make_example_model(name);
        const std::vector<std::string> atoms = model->proposition_names();

        std::string reference;
        std::int64_t states = -1;
        std::int64_t transitions = -1;
        for (int threads : {1, 2, 4}) {
            Construction c = construct(*model, atoms, quiet_config(threads));
            const std::string relation = canonical_relation(*c.nmdp);

            bool sums = true;
            for (Cid cid = 0; cid < c.nmdp->continuation_graph_size(); ++cid) {
                const auto& e = c.nmdp->continuation_graph_element(cid);
                if (e.kind != ChoiceKind::Probabilistic) continue;
                double sum = 0.0;
                for (Cid child = e.from; child <= e.to; ++child) {
                    sum += c.nmdp->continuation_graph_element(child).probability;
                }
                if (std::fabs(sum - 1.0) > 1e-9) sums = false;
            }
            ctx.check(sums, name + ": probabilistic children sum to 1");
            if (reference.empty()) {
                reference = relation;
                states = c.stats.states;
                transitions = c.stats.transitions;
                continue;
            }
            const std::string tag = name + " with " + std::to_string(threads) + " threads";
            ctx.check(c.stats.states == states, tag + ": state count");
            ctx.check(c.stats.transitions == transitions, tag + ": transition count");
            ctx.check_eq(relation, reference, tag + ": relation");
        }
    }
}

// ============================================================================
// Test Entry Point
// ============================================================================

int run_selftests() {
    TestRunner runner;

    // ── Choice resolver ─────────────────────────────────────────────────
    runner.run("resolver_odometer_order",        test_resolver_odometer_order);
    runner.run("resolver_state_without_choices", test_resolver_state_without_choices);
    runner.run("resolver_dependent_choices",     test_resolver_dependent_choices);
    runner.run("resolver_nondeterminism",        test_resolver_nondeterminism_detected);
    runner.run("resolver_forward",               test_resolver_forward);
    runner.run("resolver_set_choices",           test_resolver_set_choices);

    // ── Continuation graphs / LTMDP ─────────────────────────────────────
    runner.run("step_graph_split",               test_step_graph_split);
    runner.run("ltmdp_resolver_records",         test_ltmdp_resolver_records);
    runner.run("ltmdp_rebasing",                 test_ltmdp_rebasing);
    runner.run("striped_index_concurrent",       test_striped_index_concurrent);

    // ── Conversion ──────────────────────────────────────────────────────
    runner.run("convert_forward_scenario",       test_convert_forward_scenario);
    runner.run("convert_dedup_idempotence",      test_convert_dedup_idempotence);
    runner.run("convert_ordering_faults",        test_convert_ordering_faults);

    // ── NMDP / compact matrix ───────────────────────────────────────────
    runner.run("nmdp_validate",                  test_nmdp_validate);
    runner.run("nmdp_enumerator",                test_nmdp_enumerator);
    runner.run("nmdp_export",                    test_nmdp_export);
    runner.run("compact_matrix",                 test_compact_matrix);

    // ── Formula front end ───────────────────────────────────────────────
    runner.run("lexer_tokens",                   test_lexer_tokens);
    runner.run("parse_formulas",                 test_parse_formulas);
    runner.run("parse_errors",                   test_parse_errors);
    runner.run("normalization",                  test_normalization);
    runner.run("formula_kinds",                  test_formula_kinds);

    // ── Checker orchestrator ────────────────────────────────────────────
    runner.run("checker_coin",                   test_checker_coin);
    runner.run("checker_dice",                   test_checker_dice);
    runner.run("checker_pump_min_max",           test_checker_pump_min_max);
    runner.run("checker_kind_mismatch",          test_checker_kind_mismatch);
    runner.run("checker_ordering",               test_checker_ordering);
    runner.run("checker_concurrent_build",       test_checker_concurrent_build);
    runner.run("checker_concurrent_queries",     test_checker_concurrent_queries);
    runner.run("checker_custom_checker",         test_checker_custom_checker);
    runner.run("checker_output",                 test_checker_output);
    runner.run("exploration_faults",             test_exploration_faults);

    // ── Parallel equivalence ────────────────────────────────────────────
    runner.run("parallel_equivalence",           test_parallel_equivalence);

    return runner.summarise();
}

}  // namespace pmc
