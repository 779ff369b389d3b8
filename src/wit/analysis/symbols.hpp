#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "types.hpp"
#include "../../assembly/assembly.hpp"

namespace wit::analysis::symbols {
	// where a variable lives, assigned once its declaration is emitted
	struct storage_location {
		bool global;
		// data label for globals, empty for locals
		std::string label;
		// globals: 0, locals: distance below the frame base
		uint32_t offset;
		uint32_t size;

		[[nodiscard]] assembly::assembly_memory memory() const;
	};

	struct variable {
		std::string name;
		types::type_node type;
		bool exported;
		std::optional<storage_location> location;

		variable(std::string name, types::type_node type, bool exported = false)
			: name(std::move(name)), type(std::move(type)), exported(exported) {
		}
	};

	enum class builtin_procedure_t : uint8_t {
		// writes a newline to standard output
		WRITE_ELN,
		// converts a decimal digit character to its value
		D2I
	};
	struct procedure {
		std::string name;
		builtin_procedure_t symbol;
		std::optional<types::type_node> return_type;
		std::vector<types::type_node> parameters;
	};

	// what a name in scope resolves to
	struct entity {
		enum class kind_t : uint8_t {
			VARIABLE,
			TYPE,
			PROCEDURE
		} kind;
		std::variant<
			std::shared_ptr<variable>, // VARIABLE
			types::type_node, // TYPE
			procedure // PROCEDURE
		> value;

		explicit entity(std::shared_ptr<variable> var)
			: kind(kind_t::VARIABLE), value(std::move(var)) {
		}
		explicit entity(const types::type_node& type)
			: kind(kind_t::TYPE), value(type) {
		}
		explicit entity(const procedure& proc)
			: kind(kind_t::PROCEDURE), value(proc) {
		}

		[[nodiscard]] const std::shared_ptr<variable>& as_variable() const {
			return std::get<std::shared_ptr<variable>>(value);
		}
		[[nodiscard]] const types::type_node& as_type() const {
			return std::get<types::type_node>(value);
		}
		[[nodiscard]] const procedure& as_procedure() const {
			return std::get<procedure>(value);
		}
	};

	/**
	 * Nested lexical scopes, innermost last.
	 * The global scope at index 0 holds the builtin types and procedures and is never removed.
	 */
	class scope_stack {
		std::vector<std::unordered_map<std::string, entity>> m_scopes;

	public:
		scope_stack();

		void push();
		// @throws internal_error when only the global scope is left
		void pop();
		[[nodiscard]] size_t depth() const {
			return m_scopes.size();
		}
		[[nodiscard]] bool is_global() const {
			return m_scopes.size() == 1;
		}

		// adds the name to the innermost scope, returns false if it is already declared there
		bool declare(const std::string& name, const entity& ent);
		// innermost declaration of the name, if any
		[[nodiscard]] const entity* lookup(const std::string& name) const;
	};
} // wit::analysis::symbols
