/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/optional.hpp>
#include <set>
#include <stdexcept>
#include <unordered_map>
#include <vector>

#include "fsm/type_hashers.hpp"

namespace vegam::fsm {
  using common::EnumClassHash;

  /**
   * Source and destination states of a single event.
   * Built with fromMany(...).to(...) pairs, malformed hardcoded rules throw.
   * @tparam EventEnumType - enum class with events listed
   * @tparam StateEnumType - enum class with states listed
   */
  template <typename EventEnumType, typename StateEnumType>
  class Transition final {
   public:
    explicit Transition(EventEnumType event) : event_{event} {}

    /// Source states of the next to() call
    template <typename... States>
    Transition &fromMany(States... states) {
      if (!pending_.empty()) {
        throw std::runtime_error("Transition destination state was not set.");
      }
      (pending_.insert(states), ...);
      return *this;
    }

    Transition &to(StateEnumType to_state) {
      if (pending_.empty()) {
        throw std::runtime_error("Transition source states are not set.");
      }
      for (auto from : pending_) {
        if (!destinations_.emplace(from, to_state).second) {
          throw std::runtime_error("Transition source state redefinition.");
        }
      }
      pending_.clear();
      return *this;
    }

    EventEnumType event() const {
      return event_;
    }

    /// @return destination state or none if event is not allowed in state
    boost::optional<StateEnumType> dispatch(StateEnumType from_state) const {
      auto it{destinations_.find(from_state)};
      if (it == destinations_.end()) {
        return boost::none;
      }
      return it->second;
    }

   private:
    EventEnumType event_;
    std::unordered_map<StateEnumType, StateEnumType, EnumClassHash>
        destinations_;
    std::set<StateEnumType> pending_;
  };

  /**
   * Immutable set of transition rules, one rule per event.
   * Answers which state an entity moves to, the entity state itself is kept
   * by the owner.
   */
  template <typename EventEnumType, typename StateEnumType>
  class TransitionTable final {
   public:
    using TransitionRule = Transition<EventEnumType, StateEnumType>;

    explicit TransitionTable(std::vector<TransitionRule> rules) {
      for (auto &rule : rules) {
        auto event{rule.event()};
        if (!rules_.emplace(event, std::move(rule)).second) {
          throw std::runtime_error("Transition rule redefinition.");
        }
      }
    }

    /// @return destination state or none if the event is not allowed
    boost::optional<StateEnumType> dispatch(EventEnumType event,
                                            StateEnumType from_state) const {
      auto rule{rules_.find(event)};
      if (rule == rules_.end()) {
        return boost::none;
      }
      return rule->second.dispatch(from_state);
    }

   private:
    std::unordered_map<EventEnumType, TransitionRule, EnumClassHash> rules_;
  };
}  // namespace vegam::fsm
