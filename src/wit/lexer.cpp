#include "lexer.hpp"

#include <algorithm>
#include <optional>
#include <span>
#include <utility>

#include "errors.hpp"
#include "../combinator.hpp"

namespace wit {
	using combinator::Parser;
	using combinator::satisfy;
	using combinator::symbol;
	using combinator::symbol_range;
	using combinator::symbols;
	using combinator::token;
	using combinator::tokens;

	namespace {
		const std::vector<std::pair<operator_type_t, std::string>> operator_spellings = {
			{operator_type_t::Assign, ":="},
			{operator_type_t::Plus, "+"},
			{operator_type_t::Minus, "-"},
			{operator_type_t::Asterisk, "*"},
			{operator_type_t::Slash, "/"},
			{operator_type_t::Percent, "%"},
			{operator_type_t::ShiftLeft, "<<"},
			{operator_type_t::ShiftRight, ">>"},
			{operator_type_t::Ampersand, "&"}
		};
		const std::vector<std::pair<punctuation_type_t, char>> punctuation_spellings = {
			{punctuation_type_t::LeftParen, '('},
			{punctuation_type_t::RightParen, ')'},
			{punctuation_type_t::LeftBracket, '['},
			{punctuation_type_t::RightBracket, ']'},
			{punctuation_type_t::Comma, ','},
			{punctuation_type_t::Colon, ':'}
		};
	}

	operator_type_t lexer_parse_operator_type(const std::string& op_str) {
		const auto it = std::ranges::find(operator_spellings, op_str, &std::pair<operator_type_t, std::string>::second);
		return it != operator_spellings.end() ? it->first : operator_type_t::Unknown;
	}
	punctuation_type_t lexer_parse_punctuation_type(char punc) {
		const auto it = std::ranges::find(punctuation_spellings, punc, &std::pair<punctuation_type_t, char>::second);
		return it != punctuation_spellings.end() ? it->first : punctuation_type_t::Unknown;
	}

	std::ostream& operator<<(std::ostream& os, const operator_type_t& op) {
		const auto it = std::ranges::find(operator_spellings, op, &std::pair<operator_type_t, std::string>::first);
		return os << (it != operator_spellings.end() ? it->second : "UnknownOperator");
	}
	std::ostream& operator<<(std::ostream& os, const punctuation_type_t& punc) {
		const auto it = std::ranges::find(punctuation_spellings, punc, &std::pair<punctuation_type_t, char>::first);
		if (it == punctuation_spellings.end()) {
			return os << "UnknownPunctuation";
		}
		return os << it->second;
	}

	namespace {
		const std::vector<std::string> keyword_strings = {
			"var",
			"begin",
			"end",
			"export",
			"as"
		};

		const Parser<char, size_t> sl_comment_lexer = (token("//") > *satisfy<char>([](char c) { return c != '\n'; },
				"not-newline"))
			.map<size_t>([](const std::vector<char>& comment_chars) {
				return comment_chars.size();
			}, "single-line-comment");
		const Parser<char, size_t> ml_comment_lexer = (token("/*") > Parser<char, size_t>(
				[](std::span<const char> input, std::vector<std::pair<size_t, size_t>>& output) {
					for (size_t pos = 0; pos + 1 < input.size(); ++pos) {
						if (input[pos] == '*' && input[pos + 1] == '/') {
							output.emplace_back(pos, pos);
							return;
						}
					}
					// no closing */, the comment is unterminated
				}, "comment-body") < token("*/"));
		const Parser<char, size_t> whitespace_lexer = (+symbols(std::vector<char>{' ', '\t', '\n', '\r'},
				"whitespace"))
			.map<size_t>([](const std::vector<char>& chars) {
				return chars.size();
			}, "whitespace");
		const Parser<char, size_t> trivia_lexer = whitespace_lexer || sl_comment_lexer || ml_comment_lexer;

		const Parser<char, lexer_token> identifier_lexer = ((symbol_range('a', 'z') | symbol_range('A', 'Z') |
				symbol('_')) +
			*(symbol_range('a', 'z') | symbol_range('A', 'Z') | symbol_range('0', '9') | symbol('_')))
			.map<lexer_token>([](const std::pair<char, std::vector<char>>& p) {
				std::string id_str;
				id_str.push_back(p.first);
				id_str.append(p.second.begin(), p.second.end());
				if (std::ranges::find(keyword_strings, id_str) != keyword_strings.end()) {
					return lexer_token{lexer_token::type_t::Keyword, id_str};
				}
				return lexer_token{lexer_token::type_t::Identifier, id_str};
			}, "identifier");
		// the digits are converted by the parser, which knows the position for range errors
		const Parser<char, lexer_token> integer_lexer = ((+symbol_range('0', '9')) + ~symbol('l'))
			.map<lexer_token>([](const std::pair<std::vector<char>, std::optional<char>>& p) {
				std::string digits(p.first.begin(), p.first.end());
				if (p.second.has_value()) {
					digits.push_back('l');
				}
				return lexer_token{lexer_token::type_t::Integer, digits};
			}, "integer");
		const Parser<char, lexer_token> char_lexer = (symbol('\'') >
				(
					(symbol('\\') + satisfy<char>([](char) { return true; }, "any")).map<char>(
						[](const std::pair<char, char>& p) {
							switch (p.second) {
								case 'n': return '\n';
								case 'r': return '\r';
								case 't': return '\t';
								case '0': return '\0';
								case '\\': return '\\';
								case '\'': return '\'';
								default: return p.second; // Unknown escape, just return the char itself
							}
						}, "escape") ||
					satisfy<char>([](char c) { return c != '\'' && c != '\\' && c != '\n'; }, "non-quote")
				) < symbol('\''))
			.map<lexer_token>([](char c) {
				return lexer_token{lexer_token::type_t::Character, c};
			}, "char");
		const Parser<char, lexer_token> operator_lexer = tokens({":=", "<<", ">>", "+", "-", "*", "/", "%", "&"},
				"operators")
			.map<lexer_token>([](const std::string& op) {
				return lexer_token{lexer_token::type_t::Operator, lexer_parse_operator_type(op)};
			}, "operator");
		const Parser<char, lexer_token> punctuation_lexer = symbols(std::vector<char>{'(', ')', '[', ']', ',', ':'},
				"punctuation")
			.map<lexer_token>([](char punc) {
				return lexer_token{lexer_token::type_t::Punctuation, lexer_parse_punctuation_type(punc)};
			}, "punctuation");

		// all alternatives run, the longest match wins (so ":=" beats ":")
		const Parser<char, lexer_token> any_lexer =
			identifier_lexer |
			integer_lexer |
			char_lexer |
			operator_lexer |
			punctuation_lexer;

		template<typename U>
		const std::pair<U, size_t>& longest(const std::vector<std::pair<U, size_t>>& output) {
			return *std::ranges::max_element(output,
				[](const auto& a, const auto& b) {
					return a.second < b.second;
				});
		}
	}

	std::vector<lexer_token> run_lexer(const std::string& source) {
		const std::span<const char> input(source.data(), source.size());
		std::vector<lexer_token> result;
		size_t pos = 0;
		uint32_t line = 1;
		uint32_t column = 1;
		auto advance = [&](size_t count) {
			for (size_t i = 0; i < count; ++i, ++pos) {
				if (source[pos] == '\n') {
					line++;
					column = 1;
				}
				else {
					column++;
				}
			}
		};

		while (true) {
			const auto trivia = trivia_lexer.parse(input.subspan(pos));
			if (!trivia.empty() && longest(trivia).second > 0) {
				advance(longest(trivia).second);
				continue;
			}
			if (pos >= source.size()) {
				break;
			}
			if (source.compare(pos, 2, "/*") == 0) {
				throw compile_error(line, column, "unterminated comment");
			}
			const auto output = any_lexer.parse(input.subspan(pos));
			if (output.empty()) {
				throw compile_error(line, column, std::string("unexpected character '") + source[pos] + "'");
			}
			const auto& [tok, length] = longest(output);
			lexer_token located = tok;
			located.line = line;
			located.column = column;
			result.push_back(located);
			advance(length);
		}
		result.push_back(lexer_token{lexer_token::type_t::EndOfFile, std::monostate{}, line, column});
		return result;
	}

	std::ostream& operator<<(std::ostream& os, const lexer_token& tok) {
		os << "Token(Type: ";
		switch (tok.type) {
			case lexer_token::type_t::Identifier:
				os << "Identifier, Value: " << std::get<std::string>(tok.value);
				break;
			case lexer_token::type_t::Keyword:
				os << "Keyword, Value: " << std::get<std::string>(tok.value);
				break;
			case lexer_token::type_t::Integer:
				os << "Integer, Value: " << std::get<std::string>(tok.value);
				break;
			case lexer_token::type_t::Character:
				os << "Character, Value: " << static_cast<int>(std::get<char>(tok.value));
				break;
			case lexer_token::type_t::Operator:
				os << "Operator, Value: '" << std::get<operator_type_t>(tok.value) << "'";
				break;
			case lexer_token::type_t::Punctuation:
				os << "Punctuation, Value: '" << std::get<punctuation_type_t>(tok.value) << "'";
				break;
			case lexer_token::type_t::EndOfFile:
				os << "EndOfFile";
				break;
		}
		os << ", Line: " << tok.line << ", Column: " << tok.column << ")";
		return os;
	}
} // wit
