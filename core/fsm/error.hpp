/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace ps::fsm {

  enum class FsmError {
    kNoTransition = 1,
    kTerminalState,
  };
}  // namespace ps::fsm

OUTCOME_HPP_DECLARE_ERROR(ps::fsm, FsmError);
