#include "registers.hpp"

#include "../errors.hpp"

namespace wit::compiler {
	size_t regmask::count() const {
		size_t result = 0;
		for (uint8_t i = 0; i < machine::REGISTER_COUNT; ++i) {
			result += (raw >> i) & 1;
		}
		return result;
	}
	std::vector<machine::register_id> regmask::registers() const {
		std::vector<machine::register_id> result;
		for (uint8_t i = 0; i < machine::REGISTER_COUNT; ++i) {
			if ((raw >> i) & 1) {
				result.push_back(static_cast<machine::register_id>(i));
			}
		}
		return result;
	}

	machine::register_id register_allocator::acquire(regmask ban) {
		for (const auto reg : USABLE_REGISTERS) {
			if (!m_used.get(reg) && !ban.get(reg)) {
				m_used.set(reg, true);
				return reg;
			}
		}
		throw internal_error("register pool exhausted, expression is too complex");
	}
	void register_allocator::release(machine::register_id reg) {
		m_used.set(reg, false);
	}
	void register_allocator::release(const std::vector<machine::register_id>& regs) {
		for (const auto reg : regs) {
			release(reg);
		}
	}
} // wit::compiler
