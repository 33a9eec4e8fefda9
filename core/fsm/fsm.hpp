/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <map>
#include <set>
#include <stdexcept>
#include <utility>
#include <vector>

#include <boost/optional.hpp>

#include "common/outcome.hpp"
#include "fsm/error.hpp"

namespace ps::fsm {

  /**
   * Transitions caused by a single event.
   * Built by chained from()/fromMany() and to() calls, a malformed chain
   * throws std::runtime_error when the table is constructed.
   * @tparam Event - enum class of events
   * @tparam State - enum class of states
   */
  template <typename Event, typename State>
  class Transition final {
   public:
    /// Called with event, source and destination state
    using Action = std::function<void(Event, State, State)>;

    explicit Transition(Event event) : event_{event} {}

    Transition &from(State state) {
      return fromMany(state);
    }

    template <typename... States>
    Transition &fromMany(States... states) {
      if (!pending_.empty()) {
        throw std::runtime_error("fsm: previous sources have no destination");
      }
      (pending_.insert(states), ...);
      return *this;
    }

    Transition &to(State state) {
      if (pending_.empty()) {
        throw std::runtime_error("fsm: destination without source");
      }
      for (const auto source : pending_) {
        if (!targets_.emplace(source, state).second) {
          throw std::runtime_error("fsm: source state is already mapped");
        }
      }
      pending_.clear();
      return *this;
    }

    Transition &action(Action callback) {
      if (action_) {
        throw std::runtime_error("fsm: transition action is already set");
      }
      action_ = std::move(callback);
      return *this;
    }

    Event event() const {
      return event_;
    }

    /// Destination for the source state, runs action when found
    boost::optional<State> dispatch(State source) const {
      const auto it{targets_.find(source)};
      if (it == targets_.end()) {
        return boost::none;
      }
      if (action_) {
        action_(event_, source, it->second);
      }
      return it->second;
    }

   private:
    Event event_;
    std::map<State, State> targets_;
    std::set<State> pending_;
    Action action_;
  };

  /**
   * State of a single entity moved by events in the caller's thread.
   * Not thread-safe, owner serializes events.
   */
  template <typename Event, typename State>
  class FSM {
   public:
    using TransitionRule = Transition<Event, State>;

    /**
     * @param rules - one rule per event
     * @param initial - state before any event
     * @param final_states - states which accept no more events
     */
    FSM(const std::vector<TransitionRule> &rules,
        State initial,
        std::set<State> final_states)
        : state_{initial}, final_states_{std::move(final_states)} {
      for (const auto &rule : rules) {
        rules_.emplace(rule.event(), rule);
      }
    }

    /**
     * Apply event to the current state
     * @return new state
     */
    outcome::result<State> send(Event event) {
      if (isFinal()) {
        return FsmError::kTerminalState;
      }
      const auto rule{rules_.find(event)};
      if (rule == rules_.end()) {
        return FsmError::kNoTransition;
      }
      const auto next{rule->second.dispatch(state_)};
      if (!next) {
        return FsmError::kNoTransition;
      }
      state_ = *next;
      return state_;
    }

    State get() const {
      return state_;
    }

    bool isFinal() const {
      return final_states_.count(state_) != 0;
    }

   private:
    State state_;
    std::set<State> final_states_;
    std::map<Event, TransitionRule> rules_;
  };

}  // namespace ps::fsm
