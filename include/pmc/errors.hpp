// ============================================================================
// pmc/errors.hpp - Fault taxonomy of the state-space construction engine
// ============================================================================
//
// Every fault is an eager local precondition check.  None of them is ever
// retried: exploration and conversion are deterministic functions of the
// input model, so a failure means the whole run has to be repeated.
//
//   OrderingError        operation invoked before its precondition
//                        (query before build, conversion before exploration)
//   NondeterminismError  a replayed path did not reproduce the choices that
//                        were recorded for it
//   CapacityError        an id or buffer position exceeds its storage width
//   FormulaTypeError     a formula of the wrong semantic kind was passed
//
// ============================================================================

#ifndef PMC_ERRORS_HPP
#define PMC_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace pmc {

class OrderingError : public std::logic_error {
public:
    explicit OrderingError(const std::string& what) : std::logic_error(what) {}
};

class NondeterminismError : public std::runtime_error {
public:
    NondeterminismError()
        : std::runtime_error(
              "the model did not make the same choices when a path was replayed; "
              "its step function must be deterministic apart from the choices it "
              "resolves through the choice resolver") {}
    explicit NondeterminismError(const std::string& what) : std::runtime_error(what) {}
};

class CapacityError : public std::length_error {
public:
    explicit CapacityError(const std::string& what) : std::length_error(what) {}
};

class FormulaTypeError : public std::invalid_argument {
public:
    explicit FormulaTypeError(const std::string& what) : std::invalid_argument(what) {}
};

}  // namespace pmc

#endif  // PMC_ERRORS_HPP
