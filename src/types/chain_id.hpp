/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include <qtils/outcome.hpp>
#include <sszpp/lists.hpp>

#include "types/constants.hpp"
#include "types/validation_error.hpp"

namespace light {

  /// Chain identifier as it is carried by headers and votes
  using ChainId = ssz::list<uint8_t, MAX_CHAIN_ID_LENGTH>;

  inline ChainId toChainId(std::string_view str) {
    ChainId chain_id;
    chain_id.data().assign(str.begin(), str.end());
    return chain_id;
  }

  inline std::string chainIdToString(const ChainId &chain_id) {
    return {chain_id.data().begin(), chain_id.data().end()};
  }

  inline outcome::result<void> validateChainId(const ChainId &chain_id) {
    if (chain_id.size() == 0) {
      return ValidationError::EMPTY_CHAIN_ID;
    }
    if (chain_id.size() > MAX_CHAIN_ID_LENGTH) {
      return ValidationError::CHAIN_ID_TOO_LONG;
    }
    return outcome::success();
  }

}  // namespace light
