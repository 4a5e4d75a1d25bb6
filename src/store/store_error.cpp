/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "store/store_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(prefs, StoreError, e) {
  using E = prefs::StoreError;
  switch (e) {
    case E::EMPTY_KEY:
      return "key must not be empty";
    case E::STORE_GONE:
      return "store instance has already been destroyed";
  }
  return "unknown StoreError";
}
