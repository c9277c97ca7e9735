#include "index/key_encoder.h"
#include <fmt/format.h>
#include <limits>

namespace kvindex {

namespace {
constexpr char32_t REPLACEMENT_CHAR = 0xFFFD;
constexpr char BASE32_HEX_ALPHABET[] = "0123456789ABCDEFGHIJKLMNOPQRSTUV";

inline bool isContinuation(unsigned char b) {
	return (b & 0xC0) == 0x80;
}
} // namespace

std::vector<char32_t> KeyEncoder::decodeUtf8(std::string_view s) {
	std::vector<char32_t> out;
	out.reserve(s.size());
	size_t i = 0;
	while (i < s.size()) {
		const unsigned char b0 = static_cast<unsigned char>(s[i]);
		if (b0 < 0x80) {
			out.push_back(b0);
			++i;
			continue;
		}
		size_t len = 0;
		char32_t cp = 0;
		char32_t minCp = 0;
		if ((b0 & 0xE0) == 0xC0) { len = 2; cp = b0 & 0x1F; minCp = 0x80; }
		else if ((b0 & 0xF0) == 0xE0) { len = 3; cp = b0 & 0x0F; minCp = 0x800; }
		else if ((b0 & 0xF8) == 0xF0) { len = 4; cp = b0 & 0x07; minCp = 0x10000; }

		bool valid = len > 0 && i + len <= s.size();
		for (size_t k = 1; valid && k < len; ++k) {
			const unsigned char b = static_cast<unsigned char>(s[i + k]);
			if (!isContinuation(b)) { valid = false; break; }
			cp = (cp << 6) | (b & 0x3F);
		}
		if (valid && (cp < minCp || cp > MAX_CODEPOINT || (cp >= 0xD800 && cp <= 0xDFFF))) {
			valid = false;
		}
		if (!valid) {
			// Wie beim Iterieren über ungültiges UTF-8 üblich: ein Byte, ein U+FFFD
			out.push_back(REPLACEMENT_CHAR);
			++i;
			continue;
		}
		out.push_back(cp);
		i += len;
	}
	return out;
}

void KeyEncoder::appendUtf8(std::string& out, char32_t cp) {
	// Surrogates werden roh (3 Bytes) geschrieben, damit die Bytefolge monoton im Codepoint bleibt
	if (cp < 0x80) {
		out.push_back(static_cast<char>(cp));
	} else if (cp < 0x800) {
		out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
		out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
	} else if (cp < 0x10000) {
		out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
		out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
		out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
	} else {
		out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
		out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
		out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
		out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
	}
}

std::string KeyEncoder::base32HexEncode(std::string_view bytes) {
	std::string out;
	out.reserve(((bytes.size() + 4) / 5) * 8);

	uint32_t buffer = 0;
	int bits = 0;
	for (unsigned char c : bytes) {
		buffer = (buffer << 8) | c;
		bits += 8;
		while (bits >= 5) {
			out.push_back(BASE32_HEX_ALPHABET[(buffer >> (bits - 5)) & 0x1F]);
			bits -= 5;
		}
		buffer &= (1u << bits) - 1;
	}
	if (bits > 0) {
		out.push_back(BASE32_HEX_ALPHABET[(buffer << (5 - bits)) & 0x1F]);
	}
	// '=' liegt zwischen '9' und 'A'; ersetzt durch ein Zeichen unterhalb des Alphabets
	while (out.size() % 8 != 0) {
		out.push_back(ARMOR_PAD_CHAR);
	}
	return out;
}

std::string KeyEncoder::encodeOrderedString(const Index& index, std::string_view value) {
	const bool desc = index.order.type == OrderType::DESCENDING;
	std::vector<char32_t> runes = decodeUtf8(value);
	if (desc) {
		for (auto& r : runes) r = MAX_CODEPOINT - r;
	}

	const size_t padLen = index.string_order_pad_length > 0
		? static_cast<size_t>(index.string_order_pad_length) : 0;
	if (runes.size() < padLen) {
		runes.resize(padLen, desc ? MAX_CODEPOINT : MIN_PRINTABLE);
	}

	std::string bytes;
	bytes.reserve(runes.size() * (desc ? 4 : 1));
	for (char32_t r : runes) appendUtf8(bytes, r);

	if (desc && index.base32_encode) {
		return base32HexEncode(bytes);
	}
	return bytes;
}

std::pair<Status, std::string> KeyEncoder::encodeInteger(int64_t value, OrderType order) {
	if (order == OrderType::DESCENDING) {
		if (value < 0) {
			return {Status::Error(ErrorCode::UnsupportedEncoding,
				"negative integer " + std::to_string(value) + " cannot be encoded in descending order"), {}};
		}
		return {Status::OK(), fmt::format("{:0{}d}", std::numeric_limits<int64_t>::max() - value, INT_KEY_WIDTH)};
	}
	// Negative Werte: Vorzeichen + Nullen; Gleichheit funktioniert, Sortierung unter Negativen nicht
	return {Status::OK(), fmt::format("{:0{}d}", value, INT_KEY_WIDTH)};
}

std::string KeyEncoder::encodeDouble(double value, OrderType order) {
	if (order == OrderType::DESCENDING) {
		return fmt::format("{}", std::numeric_limits<double>::max() - value);
	}
	return fmt::format("{}", value);
}

std::pair<Status, std::string> KeyEncoder::encodeOrderValue(const Index& index,
															std::string_view field,
															const Value& value) {
	const OrderType order = index.order.type;
	return std::visit([&](auto&& arg) -> std::pair<Status, std::string> {
		using T = std::decay_t<decltype(arg)>;
		if constexpr (std::is_same_v<T, std::string>) {
			if (order == OrderType::UNORDERED) return {Status::OK(), arg};
			return {Status::OK(), encodeOrderedString(index, arg)};
		} else if constexpr (std::is_same_v<T, int64_t>) {
			auto [st, enc] = encodeInteger(arg, order);
			if (!st.ok) {
				return {Status::Error(st.code, "field '" + std::string(field) + "': " + st.message), {}};
			}
			return {Status::OK(), std::move(enc)};
		} else if constexpr (std::is_same_v<T, double>) {
			return {Status::OK(), encodeDouble(arg, order)};
		} else if constexpr (std::is_same_v<T, bool>) {
			return {Status::OK(), arg ? "true" : "false"};
		} else {
			return {Status::Error(ErrorCode::UnsupportedEncoding,
				"field '" + std::string(field) + "' has unsupported type null"), {}};
		}
	}, value);
}

} // namespace kvindex
