// ============================================================================
// nmdp.cpp - Result model storage, validation, enumeration and export
// ============================================================================

#include "pmc/nmdp.hpp"
#include "pmc/errors.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace pmc {

// ── ModelCapacity ───────────────────────────────────────────────────────────

ModelCapacity ModelCapacity::by_model_size(std::int64_t states, double average_fanout) {
    if (states < 0 || average_fanout < 0.0) {
        throw std::invalid_argument("by_model_size: negative model size");
    }
    ModelCapacity c;
    c.states = states;
    // One root per state plus the initial distribution's graph.
    c.continuation_graph_size =
        static_cast<std::int64_t>(std::ceil(static_cast<double>(states + 1) *
                                            std::max(1.0, average_fanout)));
    return c;
}

// ============================================================================
// NestedMdp - construction
// ============================================================================

NestedMdp::NestedMdp(ModelCapacity capacity,
                     std::vector<std::string> state_formula_labels,
                     std::vector<std::string> reward_labels)
    : capacity_(capacity),
      state_formula_labels_(std::move(state_formula_labels)),
      reward_labels_(std::move(reward_labels)) {
    if (state_formula_labels_.size() > kMaxStateLabels) {
        throw CapacityError("at most " + std::to_string(kMaxStateLabels) +
                            " state formula labels are supported");
    }
    elements_.reserve(static_cast<std::size_t>(capacity_.continuation_graph_size));
}

void NestedMdp::set_state_count(std::int64_t count) {
    if (count < 0) throw std::invalid_argument("set_state_count: negative count");
    if (count > capacity_.states) {
        throw CapacityError("model has " + std::to_string(count) +
                            " states, capacity is " + std::to_string(capacity_.states));
    }
    state_count_ = count;
    const auto n = static_cast<std::size_t>(count);
    state_roots_.assign(n, kNoCid);
    state_labelings_.assign(n, Labeling{});
    state_rewards_.assign(n, std::vector<double>(reward_labels_.size(), 0.0));
}

Cid NestedMdp::get_place_for_new_continuation_graph_elements(std::int64_t count) {
    if (count < 1) {
        throw std::invalid_argument("cannot reserve " + std::to_string(count) + " locations");
    }
    const auto first = static_cast<Cid>(elements_.size());
    if (first + count > capacity_.continuation_graph_size) {
        throw CapacityError("continuation graph capacity of " +
                            std::to_string(capacity_.continuation_graph_size) +
                            " elements exceeded");
    }
    elements_.resize(static_cast<std::size_t>(first + count));
    return first;
}

ContinuationGraphElement& NestedMdp::slot(Cid location, const char* operation) {
    if (location < 0 || location >= continuation_graph_size()) {
        throw std::out_of_range(std::string(operation) + ": location " +
                                std::to_string(location) + " was not reserved");
    }
    auto& e = elements_[static_cast<std::size_t>(location)];
    if (!e.is_placeholder()) {
        throw std::logic_error(std::string(operation) + ": location " +
                               std::to_string(location) + " is already filled");
    }
    return e;
}

void NestedMdp::add_continuation_graph_leaf(Cid location, std::int64_t target_state,
                                            double probability) {
    if (target_state < 0) {
        throw std::invalid_argument("add_continuation_graph_leaf: negative target state");
    }
    auto& e = slot(location, "add_continuation_graph_leaf");
    e.kind        = ChoiceKind::Leaf;
    e.from        = target_state;
    e.to          = target_state;
    e.probability = probability;
}

void NestedMdp::add_continuation_graph_inner_node(Cid location, ChoiceKind kind,
                                                  Cid from, Cid to, double probability) {
    if (kind == ChoiceKind::Leaf) {
        throw std::invalid_argument("add_continuation_graph_inner_node: leaf kind");
    }
    if (from < 0 || to < from || (kind == ChoiceKind::Forward && from != to)) {
        throw std::invalid_argument("add_continuation_graph_inner_node: bad child range [" +
                                    std::to_string(from) + ", " + std::to_string(to) + "]");
    }
    auto& e = slot(location, "add_continuation_graph_inner_node");
    e.kind        = kind;
    e.from        = from;
    e.to          = to;
    e.probability = probability;
}

void NestedMdp::check_state(std::int64_t state, const char* operation) const {
    if (state < 0 || state >= state_count_) {
        throw std::out_of_range(std::string(operation) + ": state " +
                                std::to_string(state) + " out of range");
    }
}

void NestedMdp::set_root_continuation_graph_location_of_state(std::int64_t state, Cid location) {
    check_state(state, "set_root_continuation_graph_location_of_state");
    state_roots_[static_cast<std::size_t>(state)] = location;
}

void NestedMdp::set_root_continuation_graph_location_of_initial_state(Cid location) {
    initial_root_ = location;
}

void NestedMdp::set_state_labeling(std::int64_t state, Labeling labeling) {
    check_state(state, "set_state_labeling");
    state_labelings_[static_cast<std::size_t>(state)] = labeling;
}

void NestedMdp::set_state_rewards(std::int64_t state, std::vector<double> rewards) {
    check_state(state, "set_state_rewards");
    if (rewards.size() != reward_labels_.size()) {
        throw std::invalid_argument("set_state_rewards: expected " +
                                    std::to_string(reward_labels_.size()) + " values");
    }
    state_rewards_[static_cast<std::size_t>(state)] = std::move(rewards);
}

// ── validate ────────────────────────────────────────────────────────────────

void NestedMdp::validate() const {
    auto fail = [](const std::string& msg) {
        throw std::logic_error("invalid NMDP: " + msg);
    };
    const auto size = continuation_graph_size();

    for (std::int64_t s = 0; s < state_count_; ++s) {
        Cid root = state_roots_[static_cast<std::size_t>(s)];
        if (root < 0 || root >= size) fail("state " + std::to_string(s) + " has no root");
    }
    if (initial_root_ < 0 || initial_root_ >= size) fail("no initial distribution");

    for (Cid c = 0; c < size; ++c) {
        const auto& e = elements_[static_cast<std::size_t>(c)];
        const std::string where = "location " + std::to_string(c);

        if (e.is_placeholder()) fail(where + " was reserved but never filled");
        if (e.probability < 0.0 || e.probability > 1.0 + kProbabilityTolerance) {
            fail(where + " has probability " + std::to_string(e.probability));
        }
        if (e.is_leaf()) {
            if (e.to >= state_count_) fail(where + " targets unknown state " + std::to_string(e.to));
            continue;
        }
        if (e.from < 0 || e.to >= size || e.from > e.to) fail(where + " has a bad child range");

        if (e.kind == ChoiceKind::Probabilistic) {
            double sum = 0.0;
            for (Cid child = e.from; child <= e.to; ++child) {
                sum += elements_[static_cast<std::size_t>(child)].probability;
            }
            if (std::fabs(sum - 1.0) > kProbabilityTolerance) {
                fail(where + ": probabilities sum to " + std::to_string(sum));
            }
        }
    }

    // Forwards may point anywhere, so the graph must be checked for cycles
    // before an enumerator walks it.
    enum : char { Unvisited, OnPath, Done };
    std::vector<char> mark(static_cast<std::size_t>(size), Unvisited);
    struct Frame {
        Cid location;
        Cid next_child;
    };
    std::vector<Frame> path;
    for (Cid start = 0; start < size; ++start) {
        if (mark[static_cast<std::size_t>(start)] != Unvisited) continue;
        mark[static_cast<std::size_t>(start)] = OnPath;
        path.push_back({start, elements_[static_cast<std::size_t>(start)].from});

        while (!path.empty()) {
            Frame& top = path.back();
            const auto& e = elements_[static_cast<std::size_t>(top.location)];
            if (e.is_leaf() || top.next_child > e.to) {
                mark[static_cast<std::size_t>(top.location)] = Done;
                path.pop_back();
                continue;
            }
            const Cid child = top.next_child++;
            const char state = mark[static_cast<std::size_t>(child)];
            if (state == OnPath) {
                fail("location " + std::to_string(top.location) + " reaches its ancestor " +
                     std::to_string(child));
            }
            if (state == Unvisited) {
                mark[static_cast<std::size_t>(child)] = OnPath;
                path.push_back({child, elements_[static_cast<std::size_t>(child)].from});
            }
        }
    }
}

// ── Accessors ───────────────────────────────────────────────────────────────

Cid NestedMdp::root_of_state(std::int64_t state) const {
    check_state(state, "root_of_state");
    return state_roots_[static_cast<std::size_t>(state)];
}

Cid NestedMdp::root_of_initial_state() const {
    if (!has_initial_state()) throw OrderingError("NMDP has no initial distribution");
    return initial_root_;
}

const ContinuationGraphElement& NestedMdp::continuation_graph_element(Cid location) const {
    if (location < 0 || location >= continuation_graph_size()) {
        throw std::out_of_range("location " + std::to_string(location) + " out of range");
    }
    return elements_[static_cast<std::size_t>(location)];
}

const Labeling& NestedMdp::state_labeling(std::int64_t state) const {
    check_state(state, "state_labeling");
    return state_labelings_[static_cast<std::size_t>(state)];
}

const std::vector<double>& NestedMdp::state_rewards(std::int64_t state) const {
    check_state(state, "state_rewards");
    return state_rewards_[static_cast<std::size_t>(state)];
}

int NestedMdp::label_index(const std::string& label) const noexcept {
    auto it = std::find(state_formula_labels_.begin(), state_formula_labels_.end(), label);
    return it == state_formula_labels_.end()
               ? -1 : static_cast<int>(it - state_formula_labels_.begin());
}

int NestedMdp::reward_index(const std::string& label) const noexcept {
    auto it = std::find(reward_labels_.begin(), reward_labels_.end(), label);
    return it == reward_labels_.end() ? -1 : static_cast<int>(it - reward_labels_.begin());
}

// ============================================================================
// Export
// ============================================================================

static std::string labels_of(const Labeling& l, const std::vector<std::string>& names) {
    std::string out;
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (!l.test(i)) continue;
        if (!out.empty()) out += ", ";
        out += names[i];
    }
    return out;
}

std::string NestedMdp::to_string() const {
    std::ostringstream oss;
    oss << "NMDP with " << state_count_ << " state(s), "
        << elements_.size() << " continuation graph element(s):\n";
    oss << "  Initial distribution: @" << initial_root_ << "\n";

    for (std::int64_t s = 0; s < state_count_; ++s) {
        const auto i = static_cast<std::size_t>(s);
        oss << "  s" << s << ": {" << labels_of(state_labelings_[i], state_formula_labels_)
            << "} root @" << state_roots_[i];
        if (!reward_labels_.empty()) {
            oss << " rewards [";
            for (std::size_t r = 0; r < reward_labels_.size(); ++r) {
                if (r > 0) oss << ", ";
                oss << reward_labels_[r] << "=" << state_rewards_[i][r];
            }
            oss << "]";
        }
        oss << "\n";
    }

    oss << "  Continuation graph:\n";
    for (std::size_t c = 0; c < elements_.size(); ++c) {
        const auto& e = elements_[c];
        oss << "    @" << c << ": " << choice_kind_name(e.kind);
        if (e.is_leaf()) {
            oss << " -> s" << e.to;
        } else if (e.kind == ChoiceKind::Forward) {
            oss << " -> @" << e.from;
        } else {
            oss << " [@" << e.from << ", @" << e.to << "]";
        }
        oss << " p=" << e.probability << "\n";
    }
    return oss.str();
}

std::string NestedMdp::to_dot() const {
    std::ostringstream oss;
    oss << "digraph NestedMdp {\n";
    oss << "  rankdir=LR;\n";
    oss << "  node [shape=circle fontname=\"Helvetica\"];\n";
    oss << "  __init [shape=none label=\"\"];\n";
    if (has_initial_state()) oss << "  __init -> c" << initial_root_ << ";\n";

    for (std::int64_t s = 0; s < state_count_; ++s) {
        const auto i = static_cast<std::size_t>(s);
        oss << "  s" << s << " [label=\"s" << s << "\\n{"
            << labels_of(state_labelings_[i], state_formula_labels_) << "}\"];\n";
        oss << "  s" << s << " -> c" << state_roots_[i] << ";\n";
    }

    for (std::size_t c = 0; c < elements_.size(); ++c) {
        const auto& e = elements_[c];
        const char* shape = e.kind == ChoiceKind::Nondeterministic ? "diamond" : "point";
        oss << "  c" << c << " [shape=" << shape << " label=\"\"];\n";
        if (e.is_leaf()) {
            oss << "  c" << c << " -> s" << e.to << " [label=\"" << e.probability << "\"];\n";
        } else if (e.kind == ChoiceKind::Forward) {
            oss << "  c" << c << " -> c" << e.from << " [style=dashed label=\""
                << e.probability << "\"];\n";
        } else {
            for (Cid child = e.from; child <= e.to; ++child) {
                oss << "  c" << c << " -> c" << child << " [label=\""
                    << elements_[static_cast<std::size_t>(child)].probability << "\"];\n";
            }
        }
    }
    oss << "}\n";
    return oss.str();
}

std::string NestedMdp::to_json() const {
    std::ostringstream oss;
    oss << "{\n";
    oss << "  \"initial_root\": " << initial_root_ << ",\n";
    oss << "  \"labels\": [";
    for (std::size_t i = 0; i < state_formula_labels_.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << "\"" << state_formula_labels_[i] << "\"";
    }
    oss << "],\n";
    oss << "  \"states\": [\n";
    for (std::int64_t s = 0; s < state_count_; ++s) {
        const auto i = static_cast<std::size_t>(s);
        oss << "    {\"id\": " << s << ", \"root\": " << state_roots_[i]
            << ", \"labeling\": \"" << state_labelings_[i].to_ullong() << "\", \"rewards\": [";
        for (std::size_t r = 0; r < state_rewards_[i].size(); ++r) {
            if (r > 0) oss << ", ";
            oss << state_rewards_[i][r];
        }
        oss << "]}";
        if (s + 1 < state_count_) oss << ",";
        oss << "\n";
    }
    oss << "  ],\n";
    oss << "  \"continuation_graph\": [\n";
    for (std::size_t c = 0; c < elements_.size(); ++c) {
        const auto& e = elements_[c];
        oss << "    {\"kind\": \"" << choice_kind_name(e.kind) << "\", \"from\": " << e.from
            << ", \"to\": " << e.to << ", \"probability\": " << e.probability << "}";
        if (c + 1 < elements_.size()) oss << ",";
        oss << "\n";
    }
    oss << "  ]\n";
    oss << "}\n";
    return oss.str();
}

// ============================================================================
// NmdpEnumerator
// ============================================================================

NmdpEnumerator::NmdpEnumerator(const NestedMdp& nmdp)
    : nmdp_(nmdp), resolver_(false) {}

void NmdpEnumerator::reset() {
    state_    = -1;
    initial_  = false;
    root_     = kNoCid;
    has_root_ = false;
    transitions_.clear();
    transition_index_ = -1;
}

void NmdpEnumerator::begin_root(Cid root) {
    resolver_.clear();
    resolver_.prepare_next_state();
    root_     = root;
    has_root_ = true;
    transitions_.clear();
    transition_index_ = -1;
}

bool NmdpEnumerator::move_next_state() {
    if (state_ + 1 >= nmdp_.state_count()) {
        has_root_ = false;
        return false;
    }
    ++state_;
    initial_ = false;
    begin_root(nmdp_.root_of_state(state_));
    return true;
}

bool NmdpEnumerator::select_initial_state() {
    if (!nmdp_.has_initial_state()) return false;
    state_   = -1;
    initial_ = true;
    begin_root(nmdp_.root_of_initial_state());
    return true;
}

bool NmdpEnumerator::move_next_distribution() {
    if (!has_root_) return false;
    if (!resolver_.prepare_next_path()) return false;
    collect_transitions();
    return true;
}

bool NmdpEnumerator::move_next_transition() {
    if (transition_index_ + 1 >= static_cast<std::int64_t>(transitions_.size())) return false;
    ++transition_index_;
    return true;
}

const NmdpTransition& NmdpEnumerator::current_transition() const {
    if (transition_index_ < 0 ||
        transition_index_ >= static_cast<std::int64_t>(transitions_.size())) {
        throw OrderingError("current_transition: no transition selected");
    }
    return transitions_[static_cast<std::size_t>(transition_index_)];
}

void NmdpEnumerator::collect_transitions() {
    struct Frame {
        Cid    location;
        double factor;
        bool   content_only;   // reached through a forward: skip own probability
    };

    transitions_.clear();
    transition_index_ = -1;

    std::vector<Frame> stack;
    stack.push_back({root_, 1.0, false});
    while (!stack.empty()) {
        Frame f = stack.back();
        stack.pop_back();

        const auto& e = nmdp_.continuation_graph_element(f.location);
        const double p = f.content_only ? f.factor : f.factor * e.probability;

        switch (e.kind) {
            case ChoiceKind::Leaf:
                transitions_.push_back({e.to, p});
                break;
            case ChoiceKind::Forward:
                stack.push_back({e.from, p, true});
                break;
            case ChoiceKind::Probabilistic:
                for (Cid child = e.to; child >= e.from; --child) {
                    stack.push_back({child, p, false});
                }
                break;
            case ChoiceKind::Nondeterministic: {
                const int value = resolver_.handle_choice(static_cast<int>(e.to - e.from + 1));
                stack.push_back({e.from + value, p, false});
                break;
            }
        }
    }
}

}  // namespace pmc
