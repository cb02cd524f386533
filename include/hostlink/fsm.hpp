/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file fsm.hpp
 * @brief Flat finite state machine driven by an explicit transition table.
 *
 * States carry a name and an optional entry action. Transitions map an event
 * ID and a set of source states to one destination state. Fire() looks up
 * the transition for the current state, switches state, notifies the
 * transition hook and then runs the destination's entry action.
 *
 * Not thread-safe: callers serialize Fire() (hostlink runs it on a strand).
 */

#ifndef HOSTLINK_FSM_HPP_
#define HOSTLINK_FSM_HPP_

#include "hostlink/platform.hpp"
#include "hostlink/vocabulary.hpp"

#include <cstdint>

namespace hostlink {

enum class FsmError : uint8_t {
  kInvalidTransition = 0,  ///< No transition for (current state, event).
  kNotStarted,             ///< Fire() before Start().
};

inline const char* FsmErrorToString(FsmError err) noexcept {
  switch (err) {
    case FsmError::kInvalidTransition: return "invalid transition";
    case FsmError::kNotStarted:        return "not started";
  }
  return "unknown";
}

// ============================================================================
// Table Entries
// ============================================================================

template <typename Context>
struct FsmState {
  using EntryFn = void (*)(Context& ctx);

  const char* name;  ///< Static lifetime.
  EntryFn on_entry;  ///< nullptr if none.
};

struct FsmTransition {
  uint32_t event;
  uint32_t source_mask;  ///< Bit i set = state i is a valid source.
  int32_t target;
};

// ============================================================================
// StateMachine
// ============================================================================

/**
 * @brief Table-driven state machine.
 *
 * @tparam Context        User context passed to entry actions and the hook.
 * @tparam MaxStates      Maximum number of states (at most 32).
 * @tparam MaxTransitions Maximum number of table rows.
 *
 * @code
 *   hostlink::StateMachine<Ctx, 4, 4> sm(ctx);
 *   int32_t idle = sm.AddState({"idle", nullptr});
 *   int32_t run  = sm.AddState({"run", &OnRun});
 *   sm.AddTransition(kEvGo, sm.StateBit(idle), run);
 *   sm.SetInitialState(idle);
 *   sm.Start();
 *   auto r = sm.Fire(kEvGo);
 * @endcode
 */
template <typename Context, uint32_t MaxStates = 8, uint32_t MaxTransitions = 16>
class StateMachine final {
  static_assert(MaxStates <= 32, "source_mask holds at most 32 states");

 public:
  static constexpr int32_t kNoState = -1;

  /// Called after the state changes and before the entry action runs.
  using TransitionHook = void (*)(Context& ctx, int32_t from, int32_t to,
                                  uint32_t event);

  explicit StateMachine(Context& ctx) noexcept : ctx_(ctx) {}

  StateMachine(const StateMachine&) = delete;
  StateMachine& operator=(const StateMachine&) = delete;

  // --- Build Phase ---

  /** @return Index of the new state, or kNoState if the table is full. */
  int32_t AddState(const FsmState<Context>& state) noexcept {
    HOSTLINK_ASSERT(!started_);
    if (state_count_ >= MaxStates) {
      return kNoState;
    }
    states_[state_count_] = state;
    return static_cast<int32_t>(state_count_++);
  }

  /** @return false if the table is full or the target is unknown. */
  bool AddTransition(uint32_t event, uint32_t source_mask,
                     int32_t target) noexcept {
    HOSTLINK_ASSERT(!started_);
    if (transition_count_ >= MaxTransitions || target < 0 ||
        static_cast<uint32_t>(target) >= state_count_) {
      return false;
    }
    transitions_[transition_count_++] = FsmTransition{event, source_mask,
                                                      target};
    return true;
  }

  static constexpr uint32_t StateBit(int32_t index) noexcept {
    return 1U << static_cast<uint32_t>(index);
  }

  void SetInitialState(int32_t index) noexcept {
    HOSTLINK_ASSERT(!started_);
    HOSTLINK_ASSERT(index >= 0 && static_cast<uint32_t>(index) < state_count_);
    initial_state_ = index;
  }

  void SetTransitionHook(TransitionHook hook) noexcept { hook_ = hook; }

  /** @brief Enter the initial state and run its entry action. */
  void Start() noexcept {
    HOSTLINK_ASSERT(!started_);
    HOSTLINK_ASSERT(initial_state_ >= 0);
    started_ = true;
    current_state_ = initial_state_;
    if (states_[current_state_].on_entry != nullptr) {
      states_[current_state_].on_entry(ctx_);
    }
  }

  // --- Runtime ---

  /**
   * @brief Apply the transition matching @p event from the current state.
   *
   * On success the state is updated before the entry action runs, so an
   * entry action may itself call Fire().
   */
  expected<void, FsmError> Fire(uint32_t event) noexcept {
    if (!started_) {
      return expected<void, FsmError>::error(FsmError::kNotStarted);
    }
    const FsmTransition* row = Find(event);
    if (row == nullptr) {
      return expected<void, FsmError>::error(FsmError::kInvalidTransition);
    }
    const int32_t from = current_state_;
    current_state_ = row->target;
    if (hook_ != nullptr) {
      hook_(ctx_, from, current_state_, event);
    }
    if (states_[current_state_].on_entry != nullptr) {
      states_[current_state_].on_entry(ctx_);
    }
    return expected<void, FsmError>::success();
  }

  /** @brief True if @p event would be accepted in the current state. */
  bool Can(uint32_t event) const noexcept {
    return started_ && Find(event) != nullptr;
  }

  // --- Query ---

  int32_t CurrentState() const noexcept { return current_state_; }

  const char* CurrentStateName() const noexcept {
    return StateName(current_state_);
  }

  const char* StateName(int32_t index) const noexcept {
    if (index < 0 || static_cast<uint32_t>(index) >= state_count_) {
      return "";
    }
    return states_[index].name;
  }

  bool IsInState(int32_t index) const noexcept {
    return current_state_ == index;
  }

  bool IsStarted() const noexcept { return started_; }
  uint32_t StateCount() const noexcept { return state_count_; }

 private:
  const FsmTransition* Find(uint32_t event) const noexcept {
    const uint32_t bit = StateBit(current_state_);
    for (uint32_t i = 0; i < transition_count_; ++i) {
      if (transitions_[i].event == event &&
          (transitions_[i].source_mask & bit) != 0U) {
        return &transitions_[i];
      }
    }
    return nullptr;
  }

  Context& ctx_;
  FsmState<Context> states_[MaxStates] = {};
  FsmTransition transitions_[MaxTransitions] = {};
  uint32_t state_count_ = 0;
  uint32_t transition_count_ = 0;
  int32_t current_state_ = kNoState;
  int32_t initial_state_ = kNoState;
  TransitionHook hook_ = nullptr;
  bool started_ = false;
};

}  // namespace hostlink

#endif  // HOSTLINK_FSM_HPP_
