#pragma once

#include <cstddef>
#include <cstdint>

#include "hill_core/alphabet.hpp"
#include "hill_core/config.hpp"
#include "hill_core/error.hpp"
#include "hill_core/explanation.hpp"
#include "hill_core/matrix.hpp"

namespace hill_core {

// block level hill cipher. plain.len must be a multiple of the key size n
// (DimensionMismatch otherwise) and every value must be below m
// (InvalidSymbol with the offending index in err.pos). m in [2, kMaxModulus]
//
// each block v becomes (K v) mod m, blocks stay in order.
// when opts.enable==true there is one explanation step per block:
//   K v == c (mod m)
Error op_encode_blocks(In MatrixView key,
        In std::int64_t m,
        In const BlockSeq& plain,
        Out BlockSeq* out,
        Out Explanation* expl,
        In const ExplainOptions& opts) noexcept;

// applies K^{-1} mod m block wise. the key is checked before the input:
// a key failing op_key_valid gives NotInvertible whatever the blocks are
Error op_decode_blocks(In MatrixView key, In std::int64_t m, In const BlockSeq& cipher, Out BlockSeq* out) noexcept;

struct EncodedMessage {
		PreparedMessage plain;
		BlockSeq cipher;
		char text[kMaxMessageLen + 1]{}; // cipher blocks through the alphabet
};

// prepare_message + op_encode_blocks + blocks_to_text, with cfg.modulus as m
// and cfg.key_dim enforced (DimensionMismatch)
Error op_encode(In const char* text, In MatrixView key, In const CipherConfig& cfg, Out EncodedMessage* out) noexcept;

// decodes alphabet text produced by op_encode. the result is the padded
// plaintext (spaces stripped by op_encode are not known here)
Error op_decode(In const char* cipher_text, In MatrixView key, In const CipherConfig& cfg, Out char* out, In std::size_t cap) noexcept;

} // namespace hill_core
