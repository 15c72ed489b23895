#include "hill_core/alphabet.hpp"

#include "hill_core/detail/debug.hpp"
#include "hill_core/writer.hpp"

namespace hill_core {
namespace {

constexpr char to_upper(char ch) noexcept {
		return (ch >= 'a' && ch <= 'z') ? static_cast<char>(ch - 'a' + 'A') : ch;
}

std::size_t alphabet_len(const char* alphabet) noexcept {
		std::size_t n = 0;
		while (alphabet[n] != '\0')
				n++;
		return n;
}

ErrorCode symbol_at(const CipherConfig& cfg, std::uint16_t value, char* out) noexcept {
		if (static_cast<std::int64_t>(value) >= cfg.modulus)
				return ErrorCode::InvalidSymbol;
		*out = cfg.alphabet[value];
		return ErrorCode::Ok;
}

} // namespace

Error config_validate(const CipherConfig& cfg) noexcept {
		if (!cfg.alphabet)
				return err_code(ErrorCode::InvalidConfig);
		if (cfg.modulus < 2 || cfg.modulus > kMaxModulus)
				return err_invalid_modulus(cfg.modulus);
		if (static_cast<std::int64_t>(alphabet_len(cfg.alphabet)) != cfg.modulus)
				return err_code(ErrorCode::InvalidConfig);
		if (cfg.key_dim > kMaxDim)
				return err_code(ErrorCode::InvalidConfig);

		for (std::int64_t i = 0; i < cfg.modulus; i++) {
				// messages are uppercased first, a lowercase symbol never matches
				if (to_upper(cfg.alphabet[i]) != cfg.alphabet[i])
						return err_code(ErrorCode::InvalidConfig);
				for (std::int64_t j = i + 1; j < cfg.modulus; j++) {
						if (cfg.alphabet[i] == cfg.alphabet[j])
								return err_code(ErrorCode::InvalidConfig);
				}
		}

		std::uint16_t pad_value = 0;
		if (!is_ok(symbol_value(cfg, cfg.pad, &pad_value)))
				return err_code(ErrorCode::InvalidConfig);
		return {};
}

ErrorCode symbol_value(const CipherConfig& cfg, char ch, std::uint16_t* out) noexcept {
		if (!out || !cfg.alphabet)
				return ErrorCode::Internal;
		for (std::int64_t i = 0; i < cfg.modulus && cfg.alphabet[i] != '\0'; i++) {
				if (cfg.alphabet[i] == ch) {
						*out = static_cast<std::uint16_t>(i);
						return ErrorCode::Ok;
				}
		}
		return ErrorCode::InvalidSymbol;
}

Error prepare_message(const char* text, const CipherConfig& cfg, std::uint8_t n, PreparedMessage* out) noexcept {
		if (!text || !out)
				return err_code(ErrorCode::Internal);
		if (n == 0 || n > kMaxDim)
				return err_invalid_dim(Dim{n, n});
		Error err = config_validate(cfg);
		if (!is_ok(err))
				return err;

		PreparedMessage msg;
		for (std::size_t i = 0; text[i] != '\0'; i++) {
				if (i >= kMaxMessageLen)
						return err_overflow();

				const char ch = to_upper(text[i]);
				std::uint16_t v = 0;
				if (is_ok(symbol_value(cfg, ch, &v))) {
						msg.symbols.values[msg.symbols.len++] = v;
						continue;
				}
				if (ch == ' ' && cfg.strip_spaces) {
						msg.spaces.pos[msg.spaces.count++] = static_cast<std::uint16_t>(i);
						continue;
				}
				HILL_DBG("[hill] invalid symbol 0x%02x at %u\n", static_cast<unsigned>(static_cast<unsigned char>(text[i])), static_cast<unsigned>(i));
				return err_invalid_symbol(static_cast<std::uint16_t>(i), text[i]);
		}

		msg.unpadded_len = msg.symbols.len;
		std::uint16_t pad_value = 0;
		ErrorCode ec = symbol_value(cfg, cfg.pad, &pad_value);
		if (!is_ok(ec))
				return err_code(ErrorCode::InvalidConfig);
		while (msg.symbols.len % n != 0) {
				if (msg.symbols.len >= kMaxMessageLen)
						return err_overflow();
				msg.symbols.values[msg.symbols.len++] = pad_value;
		}

		*out = msg;
		return err;
}

ErrorCode blocks_to_text(const BlockSeq& values, const CipherConfig& cfg, char* out, std::size_t cap) noexcept {
		if (!cfg.alphabet)
				return ErrorCode::Internal;
		Writer w{out, cap, 0};
		if (w.data && w.cap)
				w.data[0] = '\0';
		for (std::uint16_t i = 0; i < values.len; i++) {
				char ch = '\0';
				ErrorCode ec = symbol_at(cfg, values.values[i], &ch);
				if (!is_ok(ec))
						return ec;
				ec = w.put(ch);
				if (!is_ok(ec))
						return ec;
		}
		return ErrorCode::Ok;
}

ErrorCode restore_text(const PreparedMessage& layout, const BlockSeq& values, const CipherConfig& cfg, char* out, std::size_t cap) noexcept {
		if (!cfg.alphabet)
				return ErrorCode::Internal;
		if (values.len < layout.unpadded_len)
				return ErrorCode::DimensionMismatch;

		Writer w{out, cap, 0};
		if (w.data && w.cap)
				w.data[0] = '\0';

		const std::size_t total = static_cast<std::size_t>(layout.unpadded_len) + layout.spaces.count;
		std::uint16_t next_value = 0;
		std::uint16_t next_space = 0;
		for (std::size_t i = 0; i < total; i++) {
				ErrorCode ec = ErrorCode::Ok;
				if (next_space < layout.spaces.count && layout.spaces.pos[next_space] == i) {
						next_space++;
						ec = w.put(' ');
				} else {
						char ch = '\0';
						ec = symbol_at(cfg, values.values[next_value++], &ch);
						if (!is_ok(ec))
								return ec;
						ec = w.put(ch);
				}
				if (!is_ok(ec))
						return ec;
		}
		return ErrorCode::Ok;
}

} // namespace hill_core
