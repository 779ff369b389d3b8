#include "parser.hpp"

#include <charconv>
#include <limits>
#include <sstream>
#include <tuple>

#include "../errors.hpp"

namespace wit::compiler {
	using analysis::items::item;
	using analysis::symbols::entity;
	using analysis::symbols::procedure;
	using analysis::symbols::variable;
	using analysis::types::binary_operator;
	using analysis::types::builtin_type;
	using analysis::types::type_node;

	namespace {
		std::string describe(const lexer_token& tok) {
			std::ostringstream oss;
			switch (tok.type) {
				case lexer_token::type_t::Identifier:
					oss << "identifier '" << std::get<std::string>(tok.value) << "'";
					break;
				case lexer_token::type_t::Keyword:
					oss << "'" << std::get<std::string>(tok.value) << "'";
					break;
				case lexer_token::type_t::Integer:
					oss << "integer " << std::get<std::string>(tok.value);
					break;
				case lexer_token::type_t::Character:
					oss << "character literal";
					break;
				case lexer_token::type_t::Operator:
					oss << "'" << std::get<operator_type_t>(tok.value) << "'";
					break;
				case lexer_token::type_t::Punctuation:
					oss << "'" << std::get<punctuation_type_t>(tok.value) << "'";
					break;
				case lexer_token::type_t::EndOfFile:
					oss << "end of input";
					break;
			}
			return oss.str();
		}

		std::string describe(lexer_token::type_t type) {
			switch (type) {
				case lexer_token::type_t::Identifier: return "identifier";
				case lexer_token::type_t::Keyword: return "keyword";
				case lexer_token::type_t::Integer: return "integer";
				case lexer_token::type_t::Character: return "character literal";
				case lexer_token::type_t::Operator: return "operator";
				case lexer_token::type_t::Punctuation: return "punctuation";
				case lexer_token::type_t::EndOfFile: return "end of input";
			}
			return "token";
		}

		const std::string& name_of(const lexer_token& tok) {
			return std::get<std::string>(tok.value);
		}
	} // namespace

	std::optional<binary_operator> to_binary_operator(operator_type_t op) {
		switch (op) {
			case operator_type_t::Plus: return binary_operator::ADD;
			case operator_type_t::Minus: return binary_operator::SUB;
			case operator_type_t::Asterisk: return binary_operator::MUL;
			case operator_type_t::Slash: return binary_operator::DIV;
			case operator_type_t::Percent: return binary_operator::MOD;
			case operator_type_t::ShiftLeft: return binary_operator::SHIFT_LEFT;
			case operator_type_t::ShiftRight: return binary_operator::SHIFT_RIGHT;
			default: return std::nullopt;
		}
	}

	int binary_precedence(binary_operator op) {
		switch (op) {
			case binary_operator::SHIFT_LEFT:
			case binary_operator::SHIFT_RIGHT:
				return 0;
			case binary_operator::ADD:
			case binary_operator::SUB:
				return 1;
			case binary_operator::MUL:
			case binary_operator::DIV:
			case binary_operator::MOD:
				return 2;
		}
		throw internal_error("unknown binary operator");
	}

	int64_t normalize_constant(int64_t value, uint32_t size) {
		switch (size) {
			case 1: return static_cast<uint8_t>(value);
			case 2: return static_cast<uint16_t>(value);
			case 4: return static_cast<uint32_t>(value);
			default: return value;
		}
	}

	std::optional<int64_t> fold_constant(int64_t lhs, int64_t rhs, binary_operator op, uint32_t size) {
		const auto a = static_cast<uint64_t>(normalize_constant(lhs, size));
		const auto b = static_cast<uint64_t>(normalize_constant(rhs, size));
		uint64_t result;
		switch (op) {
			case binary_operator::ADD:
				result = a + b;
				break;
			case binary_operator::SUB:
				result = a - b;
				break;
			case binary_operator::MUL:
				result = a * b;
				break;
			case binary_operator::DIV:
				if (b == 0)
					return std::nullopt;
				result = a / b;
				break;
			case binary_operator::MOD:
				if (b == 0)
					return std::nullopt;
				result = a % b;
				break;
			case binary_operator::SHIFT_LEFT:
				result = a << (b & (size == 8 ? 63 : 31));
				break;
			case binary_operator::SHIFT_RIGHT:
				result = a >> (b & (size == 8 ? 63 : 31));
				break;
			default:
				throw internal_error("unknown binary operator");
		}
		return normalize_constant(static_cast<int64_t>(result), size);
	}

	Parser::Parser(std::vector<lexer_token> tokens, analysis::symbols::scope_stack& scopes,
		code_generator& generator)
		: m_tokens(std::move(tokens)), m_scopes(scopes), m_generator(generator) {
		if (m_tokens.empty() || m_tokens.back().type != lexer_token::type_t::EndOfFile) {
			lexer_token eof{lexer_token::type_t::EndOfFile, std::monostate{}};
			if (!m_tokens.empty()) {
				eof.line = m_tokens.back().line;
				eof.column = m_tokens.back().column;
			}
			m_tokens.push_back(eof);
		}
	}

	void Parser::error(const std::string& message, const lexer_token& at) {
		throw compile_error(at.line, at.column, message);
	}

	void Parser::expect(lexer_token::type_t type) const {
		if (current().type != type)
			error("expected " + describe(type) + ", got " + describe(current()));
	}
	void Parser::expect_keyword(const std::string& keyword) const {
		if (!current().is_keyword(keyword))
			error("expected '" + keyword + "', got " + describe(current()));
	}
	void Parser::expect_punctuation(punctuation_type_t punc) const {
		if (!current().is_punctuation(punc)) {
			std::ostringstream oss;
			oss << "expected '" << punc << "', got " << describe(current());
			error(oss.str());
		}
	}

	const entity& Parser::lookup(const lexer_token& name) const {
		const entity* ent = m_scopes.lookup(name_of(name));
		if (!ent)
			error("undeclared identifier " + name_of(name), name);
		return *ent;
	}

	std::shared_ptr<variable> Parser::lookup_variable(const lexer_token& name) const {
		const entity& ent = lookup(name);
		if (ent.kind != entity::kind_t::VARIABLE)
			error(name_of(name) + " is not a variable", name);
		return ent.as_variable();
	}

	type_node Parser::lookup_type(const lexer_token& name) const {
		const entity* ent = m_scopes.lookup(name_of(name));
		if (!ent)
			error("undeclared type " + name_of(name), name);
		if (ent->kind != entity::kind_t::TYPE)
			error(name_of(name) + " is not a type", name);
		return ent->as_type();
	}

	procedure Parser::lookup_procedure(const lexer_token& name) const {
		const entity* ent = m_scopes.lookup(name_of(name));
		if (!ent)
			error("undeclared procedure " + name_of(name), name);
		if (ent->kind != entity::kind_t::PROCEDURE)
			error(name_of(name) + " is not a procedure", name);
		return ent->as_procedure();
	}

	item Parser::variable_item(const lexer_token& name) const {
		const auto var = lookup_variable(name);
		// storage is assigned once the whole declaration list is read
		if (!var->location)
			error(name_of(name) + " is used within its own declaration list", name);
		return m_generator.variable_item(*var);
	}

	void Parser::parse_program() {
		m_generator.emit_program_prolog();
		m_generator.emit_data_section();
		m_global = true;
		if (current().is_keyword("var"))
			parse_vardecls();
		m_generator.emit_text_section();

		expect_keyword("begin");
		next();
		m_global = false;
		m_scopes.push();
		m_generator.enter_main_frame();
		if (current().is_keyword("var"))
			parse_vardecls();
		parse_block();
		expect_keyword("end");
		m_generator.leave_main_frame();
		m_scopes.pop();
		next();

		if (!at_end())
			error("expected end of input, got " + describe(current()));
	}

	void Parser::parse_vardecls() {
		expect_keyword("var");
		next();
		std::vector<std::shared_ptr<variable>> vars;
		while (true) {
			bool exported = false;
			if (current().is_keyword("export")) {
				if (!m_global)
					error("only global variables can be exported");
				exported = true;
				next();
			}
			expect(lexer_token::type_t::Identifier);
			const lexer_token name = current();
			next();
			expect_punctuation(punctuation_type_t::Colon);
			next();
			// exported globals keep their name as their label
			if (exported && is_reserved_label(name_of(name)))
				error("cannot export " + name_of(name) + ", the name is reserved in the assembly output", name);
			auto var = std::make_shared<variable>(name_of(name), parse_declared_type(), exported);
			if (!m_scopes.declare(var->name, entity(var)))
				error("redeclaration of " + var->name, name);
			vars.push_back(var);

			if (!current().is_punctuation(punctuation_type_t::Comma))
				break;
			next();
		}
		if (m_global)
			m_generator.declare_globals(vars);
		else
			m_generator.declare_locals(vars);
	}

	type_node Parser::parse_declared_type() {
		expect(lexer_token::type_t::Identifier);
		type_node type = lookup_type(current());
		next();
		while (true) {
			if (current().is_operator(operator_type_t::Asterisk)) {
				next();
				type = type_node::pointer_to(type);
				continue;
			}
			if (!current().is_punctuation(punctuation_type_t::LeftBracket))
				break;
			next();
			if (current().is_punctuation(punctuation_type_t::RightBracket))
				error("variable-length arrays are not supported");
			const lexer_token bound_token = current();
			const item bound = parse_expr();
			if (!bound.is_constant())
				error("array size must be a constant expression", bound_token);
			if (bound.constant() <= 0)
				error("array size must be positive", bound_token);
			const auto count = static_cast<uint64_t>(bound.constant());
			if (count > std::numeric_limits<uint32_t>::max() / type.size())
				error("array is too large", bound_token);
			expect_punctuation(punctuation_type_t::RightBracket);
			next();
			type = type_node::array_of(type, static_cast<uint32_t>(count));
		}
		return type;
	}

	item Parser::apply_cast(const item& it, const type_node& type, const lexer_token& at) {
		if (it.type.is_array() || type.is_array())
			error("cannot cast " + it.type.to_string() + " to " + type.to_string(), at);
		if (it.is_constant())
			return item(type, normalize_constant(it.constant(), type.size()));
		return m_generator.cast(it, type);
	}

	item Parser::combine(const item& lhs, const item& rhs, binary_operator op, const lexer_token& at) {
		std::ostringstream oss;
		if (!lhs.type.supports(op)) {
			oss << "type " << lhs.type << " does not support operator " << op;
			error(oss.str(), at);
		}
		if (!rhs.type.supports(op)) {
			oss << "type " << rhs.type << " does not support operator " << op;
			error(oss.str(), at);
		}
		if (!lhs.type.supports_with(op, rhs.type)) {
			oss << "incompatible types " << lhs.type << " and " << rhs.type << " for operator " << op;
			error(oss.str(), at);
		}

		if (lhs.is_constant() && rhs.is_constant()) {
			const type_node& type = rhs.type.size() > lhs.type.size() ? rhs.type : lhs.type;
			const auto value = fold_constant(lhs.constant(), rhs.constant(), op, type.size());
			if (!value)
				error(op == binary_operator::MOD ? "modulo by zero" : "division by zero", at);
			return item(type, *value);
		}

		item left = lhs;
		item right = rhs;
		if (left.type.size() != right.type.size())
			std::tie(left, right) = m_generator.equalize_types(left, right);
		return m_generator.binary_operation(left, right, op);
	}

	item Parser::parse_expr(int min_precedence) {
		const lexer_token start = current();
		item result = parse_prim();
		if (result.is_void())
			error("a Void value cannot be used in an expression", start);

		if (current().is_keyword("as")) {
			const lexer_token as_token = current();
			next();
			const type_node type = parse_declared_type();
			result = apply_cast(result, type, as_token);
		}

		while (current().type == lexer_token::type_t::Operator) {
			const auto op = to_binary_operator(std::get<operator_type_t>(current().value));
			if (!op)
				break;
			const int precedence = binary_precedence(*op);
			if (precedence < min_precedence)
				break;
			const lexer_token op_token = current();
			next();
			const item rhs = parse_expr(precedence + 1);
			result = combine(result, rhs, *op, op_token);
		}
		return result;
	}

	item Parser::parse_unary() {
		const lexer_token op_token = current();
		next();
		const lexer_token start = current();
		const item operand = parse_prim();
		if (operand.is_void())
			error("a Void value cannot be used in an expression", start);

		if (op_token.is_operator(operator_type_t::Ampersand)) {
			if (!operand.is_addressable())
				error("cannot take the address of a non-addressable value", op_token);
			return m_generator.address(operand);
		}
		if (!operand.type.is_builtin())
			error("cannot negate a value of type " + operand.type.to_string(), op_token);
		if (operand.is_constant())
			return item(operand.type, normalize_constant(
				static_cast<int64_t>(0 - static_cast<uint64_t>(operand.constant())), operand.type.size()));
		return m_generator.negate(operand);
	}

	item Parser::parse_integer() {
		const lexer_token& tok = current();
		std::string digits = name_of(tok);
		const bool is_long = !digits.empty() && digits.back() == 'l';
		if (is_long)
			digits.pop_back();
		uint64_t value = 0;
		const auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
		if (ec != std::errc() || end != digits.data() + digits.size())
			error("integer literal " + name_of(tok) + " is out of range");
		if (!is_long && value > std::numeric_limits<uint32_t>::max())
			error("integer literal " + name_of(tok) + " does not fit in Int, use the 'l' suffix");
		next();
		return item(is_long ? builtin_type::LONG : builtin_type::INT, static_cast<int64_t>(value));
	}

	item Parser::parse_prim() {
		const lexer_token& tok = current();
		switch (tok.type) {
			case lexer_token::type_t::Integer:
				return parse_integer();
			case lexer_token::type_t::Character: {
				const auto value = static_cast<uint8_t>(std::get<char>(tok.value));
				next();
				return item(builtin_type::CHAR, value);
			}
			case lexer_token::type_t::Identifier:
				return parse_assign_or_call(true);
			case lexer_token::type_t::Punctuation:
				if (tok.is_punctuation(punctuation_type_t::LeftParen)) {
					next();
					item result = parse_expr();
					expect_punctuation(punctuation_type_t::RightParen);
					next();
					return result;
				}
				break;
			case lexer_token::type_t::Operator:
				if (tok.is_operator(operator_type_t::Minus) || tok.is_operator(operator_type_t::Ampersand))
					return parse_unary();
				break;
			default:
				break;
		}
		error("expected expression, got " + describe(tok));
	}

	item Parser::parse_call(const lexer_token& name) {
		const procedure proc = lookup_procedure(name);
		std::vector<item> args;
		if (current().is_punctuation(punctuation_type_t::LeftParen)) {
			next();
			if (!current().is_punctuation(punctuation_type_t::RightParen)) {
				while (true) {
					args.push_back(parse_expr());
					if (!current().is_punctuation(punctuation_type_t::Comma))
						break;
					next();
				}
			}
			expect_punctuation(punctuation_type_t::RightParen);
			next();
		}

		if (args.size() != proc.parameters.size()) {
			error("procedure " + proc.name + " expects " + std::to_string(proc.parameters.size())
				+ " argument(s), got " + std::to_string(args.size()), name);
		}
		for (size_t i = 0; i < args.size(); i++) {
			if (!(args[i].type == proc.parameters[i])) {
				error("argument " + std::to_string(i + 1) + " to procedure " + proc.name + " expected type "
					+ proc.parameters[i].to_string() + ", got " + args[i].type.to_string(), name);
			}
		}
		return m_generator.call(proc, args);
	}

	item Parser::parse_index(const item& base) {
		item result = base;
		while (current().is_punctuation(punctuation_type_t::LeftBracket)) {
			const lexer_token open = current();
			if (!result.type.indexes())
				error("type " + result.type.to_string() + " cannot be indexed", open);
			next();
			const item idx = parse_expr();
			if (!result.type.indexes_with(idx.type)) {
				error("type " + result.type.to_string() + " cannot be indexed with " + idx.type.to_string(),
					open);
			}
			if (idx.is_constant() && !constant_index_displacement(result, idx.constant()))
				error("constant index " + std::to_string(idx.constant()) + " is out of range", open);
			expect_punctuation(punctuation_type_t::RightBracket);
			next();
			result = m_generator.index(result, idx);
		}
		return result;
	}

	item Parser::parse_assignment(const item& target) {
		const lexer_token assign_token = current();
		next();
		if (target.type.is_array())
			error("cannot assign to a value of array type " + target.type.to_string(), assign_token);
		const item source = parse_expr();
		if (!(target.type == source.type)) {
			error("incompatible types " + target.type.to_string() + " and " + source.type.to_string()
				+ " in assignment", assign_token);
		}
		return m_generator.assign(target, source);
	}

	item Parser::parse_assign_or_call(bool bare) {
		expect(lexer_token::type_t::Identifier);
		const lexer_token name = current();
		next();

		if (current().is_punctuation(punctuation_type_t::LeftParen))
			return parse_call(name);
		if (current().is_operator(operator_type_t::Assign))
			return parse_assignment(variable_item(name));
		if (current().is_punctuation(punctuation_type_t::LeftBracket)) {
			const item target = parse_index(variable_item(name));
			if (current().is_operator(operator_type_t::Assign))
				return parse_assignment(target);
			if (!bare)
				error("expected assignment or procedure call", name);
			return target;
		}

		if (lookup(name).kind == entity::kind_t::PROCEDURE)
			return parse_call(name);
		if (!bare)
			error("expected assignment or procedure call", name);
		return variable_item(name);
	}

	void Parser::parse_block() {
		while (!current().is_keyword("end")) {
			if (at_end())
				error("expected 'end', got end of input");
			if (current().type != lexer_token::type_t::Identifier)
				error("expected statement, got " + describe(current()));
			const item result = parse_assign_or_call(false);
			m_generator.release(result);
			if (!m_generator.registers().empty())
				throw internal_error("registers still in use after a statement");
		}
	}
} // wit::compiler
