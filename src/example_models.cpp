// ============================================================================
// example_models.cpp - coin, dice and pump
// ============================================================================

#include "pmc/example_models.hpp"

#include <algorithm>
#include <stdexcept>

namespace pmc {

namespace {

// ── coin ────────────────────────────────────────────────────────────────────

class CoinModel : public SteppableModel {
public:
    enum Location : std::int32_t { Start = 0, A = 1, B = 2 };

    std::unique_ptr<SteppableModel> clone() const override {
        return std::make_unique<CoinModel>(*this);
    }
    std::string name() const override { return "coin"; }

    void initial_step(ChoiceResolver&) override { location_ = Start; }
    void load_state(const StateVector& state) override { location_ = state.at(0); }
    StateVector save_state() const override { return {location_}; }

    void step(ChoiceResolver& resolver) override {
        if (location_ != Start) return;
        location_ = resolver.handle_probabilistic_choice(0.6, 0.4) == 0 ? A : B;
    }

    std::vector<std::string> proposition_names() const override { return {"start", "A", "B"}; }
    bool evaluate_proposition(std::size_t index) const override {
        return location_ == static_cast<std::int32_t>(index);
    }

    std::vector<std::string> reward_names() const override { return {"flips"}; }
    double evaluate_reward(std::size_t) const override { return location_ == Start ? 1.0 : 0.0; }

private:
    std::int32_t location_ = Start;
};

// ── dice ────────────────────────────────────────────────────────────────────
// Coin states s0..s6; a die value d in 1..6 ends the game.

class DiceModel : public SteppableModel {
public:
    std::unique_ptr<SteppableModel> clone() const override {
        return std::make_unique<DiceModel>(*this);
    }
    std::string name() const override { return "dice"; }

    void initial_step(ChoiceResolver&) override {
        coin_  = 0;
        value_ = 0;
    }
    void load_state(const StateVector& state) override {
        coin_  = state.at(0);
        value_ = state.at(1);
    }
    StateVector save_state() const override { return {coin_, value_}; }

    void step(ChoiceResolver& resolver) override {
        if (value_ != 0) return;
        const bool heads = resolver.handle_probabilistic_choice(0.5, 0.5) == 0;
        switch (coin_) {
            case 0: coin_ = heads ? 1 : 2; break;
            case 1: coin_ = heads ? 3 : 4; break;
            case 2: coin_ = heads ? 5 : 6; break;
            case 3: if (heads) coin_ = 1; else value_ = 1; break;
            case 4: value_ = heads ? 2 : 3; break;
            case 5: value_ = heads ? 4 : 5; break;
            case 6: if (heads) value_ = 6; else coin_ = 2; break;
            default: break;
        }
        if (value_ != 0) coin_ = 7;
    }

    std::vector<std::string> proposition_names() const override {
        return {"one", "two", "three", "four", "five", "six", "done"};
    }
    bool evaluate_proposition(std::size_t index) const override {
        if (index == 6) return value_ != 0;
        return value_ == static_cast<std::int32_t>(index) + 1;
    }

    std::vector<std::string> reward_names() const override { return {"flips"}; }
    double evaluate_reward(std::size_t) const override { return value_ == 0 ? 1.0 : 0.0; }

private:
    std::int32_t coin_  = 0;
    std::int32_t value_ = 0;
};

// ── pump ────────────────────────────────────────────────────────────────────
// Per step: the pump fails with 0.1 (once failed, the failure choice no
// longer matters and is forwarded), the controller switches a working pump
// on or off, and it rains with 0.3.  Rain raises the level by one, a running
// pump lowers it by one; the level stays within 0..3.

class PumpModel : public SteppableModel {
public:
    static constexpr std::int32_t kMaxLevel = 3;

    std::unique_ptr<SteppableModel> clone() const override {
        return std::make_unique<PumpModel>(*this);
    }
    std::string name() const override { return "pump"; }

    void initial_step(ChoiceResolver&) override {
        level_  = 0;
        broken_ = 0;
    }
    void load_state(const StateVector& state) override {
        level_  = state.at(0);
        broken_ = state.at(1);
    }
    StateVector save_state() const override { return {level_, broken_}; }

    void step(ChoiceResolver& resolver) override {
        const bool fails = resolver.handle_probabilistic_choice(0.1, 0.9) == 0;
        if (broken_) {
            resolver.forward_untaken_choices_at_index(resolver.last_choice_index());
        } else if (fails) {
            broken_ = 1;
        }

        bool pumping = false;
        if (!broken_) pumping = resolver.handle_choice(2) == 0;

        const bool rain = resolver.handle_probabilistic_choice(0.3, 0.7) == 0;
        level_ += (rain ? 1 : 0) - (pumping ? 1 : 0);
        level_ = std::max<std::int32_t>(0, std::min(level_, kMaxLevel));
    }

    std::vector<std::string> proposition_names() const override {
        return {"empty", "overflow", "broken"};
    }
    bool evaluate_proposition(std::size_t index) const override {
        switch (index) {
            case 0:  return level_ == 0;
            case 1:  return level_ == kMaxLevel;
            default: return broken_ != 0;
        }
    }

    std::vector<std::string> reward_names() const override { return {"flooded"}; }
    double evaluate_reward(std::size_t) const override { return level_ == kMaxLevel ? 1.0 : 0.0; }

private:
    std::int32_t level_  = 0;
    std::int32_t broken_ = 0;
};

}  // namespace

const std::vector<ExampleModelInfo>& example_models() {
    static const std::vector<ExampleModelInfo> models = {
        {"coin", "one biased coin flip: A with 0.6, B with 0.4"},
        {"dice", "Knuth-Yao die from fair coin flips"},
        {"pump", "water tank with a failing pump and a nondeterministic controller"},
    };
    return models;
}

std::unique_ptr<SteppableModel> make_example_model(const std::string& name) {
    if (name == "coin") return std::make_unique<CoinModel>();
    if (name == "dice") return std::make_unique<DiceModel>();
    if (name == "pump") return std::make_unique<PumpModel>();
    throw std::invalid_argument("unknown model '" + name + "' (see --list-models)");
}

}  // namespace pmc
