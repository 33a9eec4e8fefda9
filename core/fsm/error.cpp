/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "fsm/error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(ps::fsm, FsmError, e) {
  using ps::fsm::FsmError;
  switch (e) {
    case FsmError::kNoTransition:
      return "FsmError: event is not expected in current state";
    case FsmError::kTerminalState:
      return "FsmError: machine is in a terminal state";
  }
  return "FsmError: unknown error";
}
