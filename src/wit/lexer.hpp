#pragma once

#include <cstdint>
#include <iostream>
#include <string>
#include <variant>
#include <vector>

namespace wit {
	enum class operator_type_t : uint8_t {
		Assign, // :=
		Plus, // +
		Minus, // -
		Asterisk, // *
		Slash, // /
		Percent, // %
		ShiftLeft, // <<
		ShiftRight, // >>
		Ampersand, // &
		Unknown
	};
	enum class punctuation_type_t : uint8_t {
		LeftParen, // (
		RightParen, // )
		LeftBracket, // [
		RightBracket, // ]
		Comma, // ,
		Colon, // :
		Unknown
	};
	struct lexer_token {
		enum class type_t {
			Identifier,
			Keyword,
			Integer,
			Character,
			Operator,
			Punctuation,
			EndOfFile
		} type;
		std::variant<
			std::string, // For Identifier, Keyword and Integer (digits with optional 'l' suffix)
			char, // For Character
			operator_type_t, // For Operator
			punctuation_type_t, // For Punctuation
			std::monostate // For EndOfFile
		> value;
		uint32_t line = 0;
		uint32_t column = 0;

		[[nodiscard]] bool is_keyword(const std::string& keyword) const {
			return type == type_t::Keyword && std::get<std::string>(value) == keyword;
		}
		[[nodiscard]] bool is_operator(operator_type_t op) const {
			return type == type_t::Operator && std::get<operator_type_t>(value) == op;
		}
		[[nodiscard]] bool is_punctuation(punctuation_type_t punc) const {
			return type == type_t::Punctuation && std::get<punctuation_type_t>(value) == punc;
		}
		friend std::ostream& operator<<(std::ostream& os, const lexer_token& tok);
	};

	// source spelling of the operator or punctuation, e.g. ":=" or "["
	std::ostream& operator<<(std::ostream& os, const operator_type_t& op);
	std::ostream& operator<<(std::ostream& os, const punctuation_type_t& punc);

	operator_type_t lexer_parse_operator_type(const std::string& op_str);
	punctuation_type_t lexer_parse_punctuation_type(char punc);

	/**
	 * Splits the source into tokens, skipping whitespace and comments.
	 * The result always ends with an EndOfFile token.
	 * @throws compile_error on a character that starts no token or an unterminated comment
	 */
	std::vector<lexer_token> run_lexer(const std::string& source);
} // wit
