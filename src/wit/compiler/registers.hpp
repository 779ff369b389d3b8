#pragma once

#include <array>
#include <cstdint>
#include <initializer_list>
#include <vector>

#include "../../assembly/assembly.hpp"
#include "../../machine/register.hpp"

namespace wit::compiler {
	// a set of registers, one bit per register id
	struct regmask {
		uint16_t raw = 0;

		regmask() = default;
		regmask(std::initializer_list<machine::register_id> regs) {
			for (const auto reg : regs) {
				set(reg, true);
			}
		}
		void set(machine::register_id r, bool used) {
			const auto bit = static_cast<uint16_t>(1u << static_cast<uint8_t>(r));
			if (used) {
				raw |= bit;
			}
			else {
				raw &= static_cast<uint16_t>(~bit);
			}
		}
		[[nodiscard]] bool get(machine::register_id r) const {
			return (raw >> static_cast<uint8_t>(r)) & 1;
		}
		[[nodiscard]] bool empty() const {
			return raw == 0;
		}
		[[nodiscard]] size_t count() const;
		// contained registers in ascending id order
		[[nodiscard]] std::vector<machine::register_id> registers() const;

		regmask operator|(const regmask& other) const {
			regmask result;
			result.raw = raw | other.raw;
			return result;
		}
		regmask& operator|=(const regmask& other) {
			raw |= other.raw;
			return *this;
		}
		regmask operator&(const regmask& other) const {
			regmask result;
			result.raw = raw & other.raw;
			return result;
		}
		regmask& operator&=(const regmask& other) {
			raw &= other.raw;
			return *this;
		}
		regmask operator~() const {
			regmask result;
			result.raw = static_cast<uint16_t>(~raw);
			return result;
		}
		bool operator==(const regmask& other) const {
			return raw == other.raw;
		}
	};

	/**
	 * Hands out registers of a fixed pool for temporaries.
	 *
	 * A register is in use exactly while some live value references it. There is no spilling: running out of
	 * registers is an internal error, which limits how deeply expressions can nest.
	 */
	class register_allocator {
		regmask m_used;

	public:
		// allocation order, rax is kept out as the fixed accumulator of mul/div, rbp/rsp hold the frame
		static constexpr std::array<machine::register_id, 9> USABLE_REGISTERS = {
			machine::register_id::r8,
			machine::register_id::r9,
			machine::register_id::r10,
			machine::register_id::r11,
			machine::register_id::rdx,
			machine::register_id::rbx,
			machine::register_id::rcx,
			machine::register_id::rsi,
			machine::register_id::rdi
		};

		/**
		 * Marks the first free pool register that is not banned as used.
		 * @throws internal_error when no such register is left
		 */
		machine::register_id acquire(regmask ban = {});
		// releasing a free register does nothing
		void release(machine::register_id reg);
		void release(const std::vector<machine::register_id>& regs);

		[[nodiscard]] regmask used() const {
			return m_used;
		}
		[[nodiscard]] bool is_used(machine::register_id reg) const {
			return m_used.get(reg);
		}
		[[nodiscard]] bool empty() const {
			return m_used.empty();
		}

		// a register owned until the end of the enclosing block
		class temporary {
			register_allocator& m_allocator;
			machine::register_id m_reg;

		public:
			temporary(register_allocator& allocator, regmask ban)
				: m_allocator(allocator), m_reg(allocator.acquire(ban)) {
			}
			~temporary() {
				m_allocator.release(m_reg);
			}
			temporary(const temporary&) = delete;
			temporary& operator=(const temporary&) = delete;

			[[nodiscard]] machine::register_id reg() const {
				return m_reg;
			}
		};

		// runs body with a fresh register that is released on every exit path
		template<typename F>
		decltype(auto) with_temporary(F&& body, regmask ban = {}) {
			temporary tmp(*this, ban);
			return body(tmp.reg());
		}

		/**
		 * Runs body, which may clobber the given registers. Every one of them that currently holds a live
		 * value is pushed before and popped after body, in reverse order.
		 */
		template<typename F>
		void reserve_for(regmask regs, assembly::assembly_program_t& program, F&& body) {
			std::vector<machine::register_id> saved;
			for (const auto reg : regs.registers()) {
				if (m_used.get(reg)) {
					program.emplace_back(assembly::assembly_instruction(assembly::operation::PUSH,
						assembly::assembly_operand(machine::register_t(reg))));
					saved.push_back(reg);
				}
			}
			body();
			for (auto it = saved.rbegin(); it != saved.rend(); ++it) {
				program.emplace_back(assembly::assembly_instruction(assembly::operation::POP,
					assembly::assembly_operand(machine::register_t(*it))));
			}
		}
	};
} // wit::compiler
