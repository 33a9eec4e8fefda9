/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/secp256k1/secp256k1_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(ps::crypto::secp256k1, Secp256k1Error, e) {
  using ps::crypto::secp256k1::Secp256k1Error;
  switch (e) {
    case Secp256k1Error::kKeyGenerationFailed:
      return "Secp256k1Error: key generation failed";
    case Secp256k1Error::kSignatureParseError:
      return "Secp256k1Error: signature parsing error";
    case Secp256k1Error::kSignatureSerializationError:
      return "Secp256k1Error: signature serialization error";
    case Secp256k1Error::kCannotSignError:
      return "Secp256k1Error: error when signing";
    case Secp256k1Error::kPubkeyParseError:
      return "Secp256k1Error: public key parse error";
    case Secp256k1Error::kPubkeySerializationError:
      return "Secp256k1Error: public key serialization error";
    case Secp256k1Error::kInvalidLength:
      return "Secp256k1Error: key or signature has wrong length";
  }
  return "Secp256k1Error: unknown error";
}
