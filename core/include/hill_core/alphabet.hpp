#pragma once

#include <cstddef>
#include <cstdint>

#include "hill_core/config.hpp"
#include "hill_core/error.hpp"

namespace hill_core {

// symbol at index v of the alphabet has value v. immutable once built,
// every text operation takes it by const reference
struct CipherConfig {
		const char* alphabet = nullptr;
		std::int64_t modulus = 0; // must equal the alphabet length
		char pad = '\0';          // filler for the last block, must be in the alphabet
		bool strip_spaces = false; // drop spaces that are not alphabet symbols, restored on output
		std::uint8_t key_dim = 0;  // 0 accepts any key size
};

inline constexpr char kLatinAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ";
inline constexpr char kSpacedAlphabet[] = " ABCDEFGHIJKLMNOPQRSTUVWXYZ";

inline constexpr CipherConfig kLatinConfig = {
        .alphabet = kLatinAlphabet,
        .modulus = 26,
        .pad = 'A',
        .strip_spaces = true,
        .key_dim = 0,
};

inline constexpr CipherConfig kSpacedConfig = {
        .alphabet = kSpacedAlphabet,
        .modulus = 27,
        .pad = ' ',
        .strip_spaces = false,
        .key_dim = 0,
};

struct BlockSeq {
		std::uint16_t len = 0;
		std::uint16_t values[kMaxMessageLen]{};
};

// positions (in the input text) of the spaces removed by prepare_message
struct SpaceMap {
		std::uint16_t count = 0;
		std::uint16_t pos[kMaxMessageLen]{};
};

struct PreparedMessage {
		BlockSeq symbols;               // padded to a multiple of the key size
		std::uint16_t unpadded_len = 0; // symbols before padding
		SpaceMap spaces;
};

// InvalidConfig: missing alphabet, duplicate symbols, lowercase letters in
//   the alphabet, pad outside the alphabet, alphabet length != modulus,
//   key_dim > kMaxDim
// InvalidModulus: modulus outside [2, kMaxModulus]
Error config_validate(In const CipherConfig& cfg) noexcept;

// value of ch in the alphabet, InvalidSymbol when absent
ErrorCode symbol_value(In const CipherConfig& cfg, In char ch, Out std::uint16_t* out) noexcept;

// uppercases text, maps it through the alphabet and pads with cfg.pad to a
// multiple of n.
//
// InvalidSymbol (with position and character) for characters outside the
// alphabet. spaces outside the alphabet are removed and recorded when
// cfg.strip_spaces is set. Overflow when the text or the padded result
// exceeds kMaxMessageLen
Error prepare_message(In const char* text, In const CipherConfig& cfg, In std::uint8_t n, Out PreparedMessage* out) noexcept;

// every value mapped back through the alphabet, padding included
ErrorCode blocks_to_text(In const BlockSeq& values, In const CipherConfig& cfg, Out char* out, In std::size_t cap) noexcept;

// inverse of prepare_message for decoded values: drops the padding tail and
// reinserts the recorded spaces
ErrorCode restore_text(
        In const PreparedMessage& layout, In const BlockSeq& values, In const CipherConfig& cfg, Out char* out, In std::size_t cap) noexcept;

} // namespace hill_core
