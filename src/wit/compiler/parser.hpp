#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "generator.hpp"
#include "../lexer.hpp"
#include "../analysis/items.hpp"
#include "../analysis/symbols.hpp"
#include "../analysis/types.hpp"

namespace wit::compiler {
	// binary operator denoted by the token operator, if it is one
	std::optional<analysis::types::binary_operator> to_binary_operator(operator_type_t op);
	// shifts bind weakest, then additive, then multiplicative operators
	int binary_precedence(analysis::types::binary_operator op);
	// truncates a constant to the given byte width, narrower values are kept unsigned
	int64_t normalize_constant(int64_t value, uint32_t size);
	/**
	 * Evaluates lhs op rhs at compile time with the wrapping unsigned semantics of the generated code.
	 * @return nullopt on division or modulo by zero
	 */
	std::optional<int64_t> fold_constant(int64_t lhs, int64_t rhs, analysis::types::binary_operator op, uint32_t size);

	/**
	 * Single pass recursive descent parser. Code is generated as soon as a construct is recognized,
	 * nothing is revisited afterwards.
	 *
	 * program   := ["var" vardecls] "begin" ["var" vardecls] {statement} "end"
	 * vardecls  := ["export"] id ":" type {"," ["export"] id ":" type}
	 * type      := id {"[" expr "]" | "*"}
	 * statement := id ":=" expr | id index {index} ":=" expr | call
	 * expr      := unary ["as" type] {binop expr}
	 */
	class Parser {
		std::vector<lexer_token> m_tokens;
		size_t m_position = 0;
		analysis::symbols::scope_stack& m_scopes;
		code_generator& m_generator;
		// declarations are global until the program body starts
		bool m_global = true;

		[[nodiscard]] const lexer_token& current() const {
			return m_tokens[m_position];
		}
		void next() {
			if (m_position + 1 < m_tokens.size()) {
				m_position++;
			}
		}
		[[noreturn]] void error(const std::string& message) const {
			error(message, current());
		}
		[[noreturn]] static void error(const std::string& message, const lexer_token& at);
		void expect(lexer_token::type_t type) const;
		void expect_keyword(const std::string& keyword) const;
		void expect_punctuation(punctuation_type_t punc) const;

		const analysis::symbols::entity& lookup(const lexer_token& name) const;
		std::shared_ptr<analysis::symbols::variable> lookup_variable(const lexer_token& name) const;
		analysis::types::type_node lookup_type(const lexer_token& name) const;
		analysis::symbols::procedure lookup_procedure(const lexer_token& name) const;
		analysis::items::item variable_item(const lexer_token& name) const;

		analysis::items::item parse_integer();
		analysis::items::item parse_assignment(const analysis::items::item& target);
		analysis::items::item apply_cast(const analysis::items::item& it, const analysis::types::type_node& type,
			const lexer_token& at);
		analysis::items::item combine(const analysis::items::item& lhs, const analysis::items::item& rhs,
			analysis::types::binary_operator op, const lexer_token& at);

	public:
		Parser(std::vector<lexer_token> tokens, analysis::symbols::scope_stack& scopes, code_generator& generator);

		void parse_program();
		void parse_vardecls();
		analysis::types::type_node parse_declared_type();
		analysis::items::item parse_expr(int min_precedence = 0);
		analysis::items::item parse_unary();
		analysis::items::item parse_prim();
		analysis::items::item parse_call(const lexer_token& name);
		analysis::items::item parse_index(const analysis::items::item& base);
		// bare allows a plain variable or index expression, otherwise only assignments and calls are accepted
		analysis::items::item parse_assign_or_call(bool bare = false);
		void parse_block();

		// switches to local declarations, as done when the program body starts
		void set_global(bool global) {
			m_global = global;
		}
		[[nodiscard]] bool at_end() const {
			return current().type == lexer_token::type_t::EndOfFile;
		}
	};
} // wit::compiler
