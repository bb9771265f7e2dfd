#pragma once

/// @file evaluation.hpp
/// @brief Per-call evaluation context: cycle and depth guard, statistics, tracing
///
/// An Evaluation lives for exactly one outer evaluate() call. It keeps the
/// stack of elements currently being resolved so that a feedback loop is
/// reported as an EvaluationError instead of recursing without bound.
/// Nothing is memoized: an element reached through two different paths is
/// resolved twice.

#include "simulation/signal.hpp"

#include <cstddef>
#include <cstdio>
#include <string>
#include <unordered_set>
#include <vector>

namespace wirelogic {

class Element; // Forward declaration

/// Maximum number of nested element resolutions before evaluation gives up
constexpr std::size_t DEFAULT_MAX_DEPTH = 4096;

/// Elements kept from each end of the path attached to a depth error
constexpr std::size_t DEPTH_ERROR_PATH_EDGE = 8;

/// Tunables for a single evaluation pass
struct EvaluationOptions {
    std::size_t max_depth = DEFAULT_MAX_DEPTH;
    /// When set, every element resolution is written here, one line each
    std::FILE* trace = nullptr;
};

class Evaluation {
  public:
    /// RAII marker for an element on the active stack
    class Frame {
      public:
        ~Frame();

        Frame(const Frame&) = delete;
        Frame& operator=(const Frame&) = delete;
        Frame(Frame&&) = delete;
        Frame& operator=(Frame&&) = delete;

      private:
        friend class Evaluation;
        explicit Frame(Evaluation& evaluation) : evaluation_(evaluation) {}

        Evaluation& evaluation_;
    };

    /// @throws std::invalid_argument if options.max_depth is zero
    explicit Evaluation(EvaluationOptions options = {});

    Evaluation(const Evaluation&) = delete;
    Evaluation& operator=(const Evaluation&) = delete;

    /// Pushes an element onto the active stack.
    /// @throws EvaluationError if the element is already active (cycle) or the
    ///         depth limit would be exceeded. A depth error carries the outermost
    ///         and innermost DEPTH_ERROR_PATH_EDGE elements, separated by "...".
    [[nodiscard]] Frame enter(const Element& element);

    /// Records a completed resolution and writes it to the trace sink
    void record(const Element& element, const std::vector<Signal>& outputs);

    /// Records a resolution of one output; multi-output elements are traced
    /// as "KIND#id[output] -> bit"
    void record(const Element& element, std::size_t output, Signal value);

    [[nodiscard]] const EvaluationOptions& options() const { return options_; }

    /// Number of elements currently being resolved
    [[nodiscard]] std::size_t depth() const { return stack_.size(); }

    /// Deepest active stack seen so far
    [[nodiscard]] std::size_t deepest() const { return deepest_; }

    /// Total element resolutions completed
    [[nodiscard]] std::size_t resolutions() const { return resolutions_; }

    /// Descriptions of the active elements, outermost first
    [[nodiscard]] std::vector<std::string> active_path() const;

  private:
    void leave();
    void write_trace(const std::string& subject, const std::string& bits) const;

    EvaluationOptions options_;
    std::vector<const Element*> stack_;
    std::unordered_set<const Element*> active_;
    std::size_t deepest_ = 0;
    std::size_t resolutions_ = 0;
};

} // namespace wirelogic
