#include "symbols.hpp"

#include "../errors.hpp"

namespace wit::analysis::symbols {
	assembly::assembly_memory storage_location::memory() const {
		if (global) {
			return assembly::assembly_memory(label);
		}
		return assembly::assembly_memory(machine::register_id::rbp, -static_cast<int64_t>(offset));
	}

	scope_stack::scope_stack() {
		m_scopes.emplace_back();
		auto& global = m_scopes.front();
		global.emplace("Byte", entity(types::type_node(types::builtin_type::BYTE)));
		global.emplace("Char", entity(types::type_node(types::builtin_type::CHAR)));
		global.emplace("Int", entity(types::type_node(types::builtin_type::INT)));
		global.emplace("Long", entity(types::type_node(types::builtin_type::LONG)));
		global.emplace("write_eln", entity(procedure{
			"write_eln", builtin_procedure_t::WRITE_ELN, std::nullopt, {}
		}));
		global.emplace("d2i", entity(procedure{
			"d2i", builtin_procedure_t::D2I, types::type_node(types::builtin_type::BYTE),
			{types::type_node(types::builtin_type::CHAR)}
		}));
	}

	void scope_stack::push() {
		m_scopes.emplace_back();
	}
	void scope_stack::pop() {
		if (m_scopes.size() <= 1) {
			throw internal_error("cannot pop the global scope");
		}
		m_scopes.pop_back();
	}

	bool scope_stack::declare(const std::string& name, const entity& ent) {
		return m_scopes.back().emplace(name, ent).second;
	}
	const entity* scope_stack::lookup(const std::string& name) const {
		for (auto it = m_scopes.rbegin(); it != m_scopes.rend(); ++it) {
			if (const auto found = it->find(name); found != it->end()) {
				return &found->second;
			}
		}
		return nullptr;
	}
} // wit::analysis::symbols
