#pragma once

#include <cstddef>
#include <cstdint>

#include "hill_core/alphabet.hpp"
#include "hill_core/arena.hpp"
#include "hill_core/cipher.hpp"
#include "hill_core/config.hpp"
#include "hill_core/error.hpp"
#include "hill_core/matrix.hpp"

namespace hill_core {

constexpr std::size_t kRationaleCap = 768;

enum class KeyVerdict : std::uint8_t {
		Valid,
		SingularOverReals, // det(K) == 0
		NotCoprime,        // det(K) != 0 but gcd(det mod m, m) > 1
};

struct DiagnosticReport {
		std::uint8_t n = 0;
		std::int64_t modulus = 0;
		bool det_exact = false; // det fits int64, det holds the exact value
		std::int64_t det = 0;
		std::int64_t det_mod = 0;
		std::int64_t gcd = 0;
		std::uint8_t rank = 0;
		std::uint8_t nullity = 0;
		bool singular = false;
		bool key_valid = false;
		KeyVerdict verdict = KeyVerdict::Valid;
		std::int64_t det_inverse = 0; // valid keys only
		bool has_witness = false;
		std::uint16_t witness[kMaxDim]{}; // nonzero w with K w == 0 (mod m)
		char rationale[kRationaleCap]{};
};

// determinant, rank, nullity, verdict and a readable rationale for a key.
// side effect free apart from scratch, which is cleared.
// the witness is filled for invalid keys when m <= kMaxModulus and the
// witness feature is built in
Error op_explain(In MatrixView key, In std::int64_t m, InOut Arena& scratch, Out DiagnosticReport* out) noexcept;

enum class DecryptStatus : std::uint8_t {
		Recovered,
		Impossible,
};

struct EncryptionResult {
		EncodedMessage encoded;
		DiagnosticReport report;
		DecryptStatus status = DecryptStatus::Impossible;
		Error decrypt_error{};     // NotInvertible when status == Impossible
		BlockSeq decoded;          // status == Recovered only
		char padded_text[kMaxMessageLen + 1]{};  // decoded blocks, padding included
		char decoded_text[kMaxMessageLen + 1]{}; // padding dropped, stripped spaces restored
};

// encode, diagnose, then try to decode. a key that cannot decrypt is
// reported through status and decrypt_error; the call itself only fails on
// bad input (config, key shape, symbols)
Error op_encrypt(
        In const char* message, In MatrixView key, In const CipherConfig& cfg, InOut Arena& scratch, Out EncryptionResult* out) noexcept;

} // namespace hill_core
