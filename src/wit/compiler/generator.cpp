#include "generator.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <sstream>

#include <cmrc/cmrc.hpp>

#include "../errors.hpp"

CMRC_DECLARE(builtin);

namespace wit::compiler {
	using analysis::items::item;
	using analysis::types::binary_operator;
	using analysis::types::builtin_type;
	using analysis::types::type_node;
	using assembly::assembly_instruction;
	using assembly::assembly_literal;
	using assembly::assembly_memory;
	using assembly::assembly_memory_pointer;
	using assembly::assembly_operand;
	using assembly::operation;
	using machine::data_size_t;
	using machine::register_id;
	using machine::register_t;

	namespace {
		assembly_operand reg_operand(register_id reg, data_size_t size = data_size_t::QWORD) {
			return assembly_operand(register_t(reg, size));
		}
		assembly_operand imm_operand(int64_t value) {
			return assembly_operand(assembly_literal(value));
		}
		assembly_operand mem_operand(data_size_t size, const assembly_memory& mem) {
			return assembly_operand(assembly_memory_pointer(size, mem));
		}
		// 64-bit operations only take sign-extended 32-bit immediates
		bool fits_imm32(int64_t value) {
			return value >= std::numeric_limits<int32_t>::min() && value <= std::numeric_limits<int32_t>::max();
		}
		template<typename T>
		std::string stream_text(const T& value) {
			std::ostringstream oss;
			oss << value;
			return oss.str();
		}
		void replace_all(std::string& text, const std::string& placeholder, const std::string& replacement) {
			for (size_t pos = text.find(placeholder); pos != std::string::npos;
			     pos = text.find(placeholder, pos + replacement.size())) {
				text.replace(pos, placeholder.size(), replacement);
			}
		}
	}

	void code_generator::emit_program_prolog() {
		m_program.emplace_back(assembly::assembly_directive{"global _start", false});
		m_program.emplace_back(assembly::assembly_directive{"", false});
	}
	void code_generator::emit_data_section() {
		m_program.emplace_back(assembly::assembly_directive{"section .data", false});
		m_program.emplace_back(assembly::assembly_data{NEWLINE_LABEL, data_size_t::BYTE, 1, 10});
	}
	void code_generator::emit_text_section() {
		m_program.emplace_back(assembly::assembly_directive{"section .text", false});
	}

	void code_generator::declare_globals(const std::vector<std::shared_ptr<analysis::symbols::variable>>& vars) {
		for (const auto& var : vars) {
			const std::string label = var->exported ? var->name : GLOBAL_LABEL_PREFIX + var->name;
			if (var->exported) {
				m_program.emplace_back(assembly::assembly_directive{"global " + var->name, true});
			}
			const uint32_t size = var->type.size();
			// arrays are reserved in units of their innermost element
			const auto& unit = var->type.innermost();
			m_program.emplace_back(assembly::assembly_data{label, unit.data_size(), size / unit.size(), 0});
			var->location = analysis::symbols::storage_location{true, label, 0, size};
		}
	}

	void code_generator::enter_main_frame() {
		m_program.push_back(assembly::assembly_component::label("_start"));
		m_frame_totals.push_back(0);
	}
	void code_generator::declare_locals(const std::vector<std::shared_ptr<analysis::symbols::variable>>& vars) {
		if (m_frame_totals.empty()) {
			throw internal_error("locals declared outside of a frame");
		}
		uint32_t& total = m_frame_totals.back();
		const uint32_t before = total;
		for (const auto& var : vars) {
			const uint32_t size = var->type.size();
			total += size;
			var->location = analysis::symbols::storage_location{false, "", total, size};
		}
		if (before == 0 && total != 0) {
			emit(assembly_instruction(operation::PUSH, reg_operand(register_id::rbp)));
			emit(assembly_instruction(operation::MOV, reg_operand(register_id::rbp), reg_operand(register_id::rsp)));
		}
		if (total != before) {
			emit(assembly_instruction(operation::SUB, reg_operand(register_id::rsp), imm_operand(total - before)));
		}
	}
	void code_generator::leave_main_frame() {
		if (m_frame_totals.empty()) {
			throw internal_error("no frame to leave");
		}
		if (m_frame_totals.back() != 0) {
			emit(assembly_instruction(operation::MOV, reg_operand(register_id::rsp), reg_operand(register_id::rbp)));
			emit(assembly_instruction(operation::POP, reg_operand(register_id::rbp)));
		}
		m_frame_totals.pop_back();
		// exit(0)
		emit(assembly_instruction(operation::MOV, reg_operand(register_id::rax), imm_operand(60)));
		emit(assembly_instruction(operation::XOR, reg_operand(register_id::rdi), reg_operand(register_id::rdi)));
		emit(assembly_instruction(operation::SYSCALL));
	}
	uint32_t code_generator::frame_total() const {
		if (m_frame_totals.empty()) {
			throw internal_error("no active frame");
		}
		return m_frame_totals.back();
	}

	item code_generator::variable_item(const analysis::symbols::variable& var) const {
		if (!var.location.has_value()) {
			throw internal_error("variable " + var.name + " has no storage location");
		}
		return item(var.type, var.location->memory());
	}

	item code_generator::load(const item& it, regmask ban) {
		switch (it.kind) {
			case item::kind_t::REGISTER: {
				if (!ban.get(it.reg())) {
					return it;
				}
				const register_id dst = m_registers.acquire(ban);
				emit(assembly_instruction(operation::MOV, reg_operand(dst), reg_operand(it.reg())));
				m_registers.release(it.reg());
				return item(it.type, dst);
			}
			case item::kind_t::CONSTANT: {
				const register_id dst = m_registers.acquire(ban);
				emit(assembly_instruction(operation::MOV, reg_operand(dst, it.type.data_size()), it.operand()));
				return item(it.type, dst);
			}
			case item::kind_t::MEMORY: {
				release(it);
				const register_id dst = m_registers.acquire(ban);
				emit(assembly_instruction(operation::MOV, reg_operand(dst, it.type.data_size()), it.operand()));
				return item(it.type, dst);
			}
			case item::kind_t::VOID:
				break;
		}
		throw internal_error("cannot load a void item");
	}

	item code_generator::address(const item& it) {
		if (!it.is_memory()) {
			throw internal_error("address of a non-memory item");
		}
		release(it);
		const register_id dst = m_registers.acquire();
		emit(assembly_instruction(operation::LEA, reg_operand(dst), assembly_operand(it.memory())));
		return item(type_node::pointer_to(it.type), dst);
	}

	item code_generator::negate(const item& it) {
		if (it.is_constant() || it.is_void()) {
			throw internal_error("negate called on a constant or void item");
		}
		const item dst = load(it);
		emit(assembly_instruction(operation::NEG, dst.operand()));
		return dst;
	}

	std::pair<item, item> code_generator::equalize_types(const item& lhs, const item& rhs) {
		const uint32_t lhs_size = lhs.type.size();
		const uint32_t rhs_size = rhs.type.size();
		if (lhs_size < rhs_size) {
			return {lhs.is_constant() ? lhs.retype(rhs.type) : cast(lhs, rhs.type), rhs};
		}
		if (rhs_size < lhs_size) {
			return {lhs, rhs.is_constant() ? rhs.retype(lhs.type) : cast(rhs, lhs.type)};
		}
		return {lhs, rhs};
	}

	item code_generator::binary_operation(const item& lhs, const item& rhs, binary_operator op) {
		if (lhs.is_void() || rhs.is_void()) {
			throw internal_error("void operand in binary operation");
		}
		if (lhs.type.size() != rhs.type.size()) {
			throw internal_error("operand sizes differ in binary operation, types must be equalized first");
		}
		switch (op) {
			case binary_operator::ADD:
			case binary_operator::SUB: {
				const auto opr = op == binary_operator::ADD ? operation::ADD : operation::SUB;
				const item dst = load(lhs);
				if (rhs.is_constant() && lhs.type.size() == 8 && !fits_imm32(rhs.constant())) {
					m_registers.with_temporary([&](register_id tmp) {
						emit(assembly_instruction(operation::MOV, reg_operand(tmp), rhs.operand()));
						emit(assembly_instruction(opr, dst.operand(), reg_operand(tmp)));
					});
				}
				else {
					emit(assembly_instruction(opr, dst.operand(), rhs.operand()));
				}
				release(rhs);
				return dst;
			}
			case binary_operator::SHIFT_LEFT:
			case binary_operator::SHIFT_RIGHT:
				return shift_operation(lhs, rhs, op);
			case binary_operator::MUL:
			case binary_operator::DIV:
			case binary_operator::MOD:
				return multiplicative_operation(lhs, rhs, op);
		}
		throw internal_error("unknown binary operator");
	}

	item code_generator::shift_operation(const item& lhs, const item& rhs, binary_operator op) {
		const auto opr = op == binary_operator::SHIFT_LEFT ? operation::SHL : operation::SHR;
		if (rhs.is_constant()) {
			const item dst = load(lhs);
			// the hardware masks the count the same way
			const int64_t mask = lhs.type.size() == 8 ? 63 : 31;
			emit(assembly_instruction(opr, dst.operand(), imm_operand(rhs.constant() & mask)));
			return dst;
		}
		// a variable count has to be in cl, so the shifted value must not live in rcx
		const item dst = load(lhs, {register_id::rcx});
		const assembly_operand count = reg_operand(register_id::rcx, data_size_t::BYTE);
		if (rhs.is_register() && rhs.reg() == register_id::rcx) {
			emit(assembly_instruction(opr, dst.operand(), count));
		}
		else {
			m_registers.reserve_for({register_id::rcx}, m_program, [&] {
				emit(assembly_instruction(operation::MOV, reg_operand(register_id::rcx, rhs.type.data_size()),
					rhs.operand()));
				emit(assembly_instruction(opr, dst.operand(), count));
			});
		}
		release(rhs);
		return dst;
	}

	item code_generator::multiplicative_operation(const item& lhs, const item& rhs, binary_operator op) {
		const data_size_t size = lhs.type.data_size();
		// the 8-bit forms work on ax alone, the wider ones use rdx:rax
		const bool wide = size != data_size_t::BYTE;
		// rdx receives the high half of the product and of the dividend
		const regmask clobbered = wide ? regmask{register_id::rdx} : regmask{};
		item divisor = rhs;
		if (divisor.is_constant() || (wide && divisor.references(register_id::rdx))) {
			// mul and div have no immediate form
			divisor = load(divisor, clobbered);
		}

		if (wide) {
			emit(assembly_instruction(operation::MOV, reg_operand(register_id::rax, size), lhs.operand()));
		}
		else if (lhs.is_constant()) {
			emit(assembly_instruction(operation::MOV, reg_operand(register_id::rax, data_size_t::DWORD),
				lhs.operand()));
		}
		else {
			emit(assembly_instruction(operation::MOVZX, reg_operand(register_id::rax, data_size_t::DWORD),
				lhs.operand()));
		}
		release(lhs);

		auto body = [&] {
			if (op == binary_operator::MUL) {
				emit(assembly_instruction(operation::MUL, divisor.operand()));
				return;
			}
			if (wide) {
				emit(assembly_instruction(operation::XOR, reg_operand(register_id::rdx, data_size_t::DWORD),
					reg_operand(register_id::rdx, data_size_t::DWORD)));
			}
			emit(assembly_instruction(operation::DIV, divisor.operand()));
			if (op == binary_operator::MOD) {
				if (wide) {
					emit(assembly_instruction(operation::MOV, reg_operand(register_id::rax, size),
						reg_operand(register_id::rdx, size)));
				}
				else {
					// remainder is in ah
					emit(assembly_instruction(operation::SHR, reg_operand(register_id::rax, data_size_t::DWORD),
						imm_operand(8)));
				}
			}
		};
		if (wide) {
			m_registers.reserve_for(clobbered, m_program, body);
		}
		else {
			body();
		}
		release(divisor);

		// rax is not part of the pool, the result is handed back in a pool register
		const register_id dst = m_registers.acquire();
		emit(assembly_instruction(operation::MOV, reg_operand(dst, size), reg_operand(register_id::rax, size)));
		return item(lhs.type, dst);
	}

	item code_generator::cast(const item& it, const type_node& type) {
		if (it.is_void() || it.is_constant()) {
			throw internal_error("cast called on a constant or void item");
		}
		const uint32_t from = it.type.size();
		const uint32_t to = type.size();
		if (from == to) {
			return it.retype(type);
		}
		const data_size_t to_size = machine::data_size_from_bytes(to);
		// writing a 32-bit register clears the upper half, so every widening to 8 bytes goes through 32 bits
		const data_size_t widened_size = to < 4 ? to_size : data_size_t::DWORD;
		if (it.is_register()) {
			const register_id reg = it.reg();
			if (to > from) {
				if (from < 4) {
					emit(assembly_instruction(operation::MOVZX, reg_operand(reg, widened_size), it.operand()));
				}
				else {
					emit(assembly_instruction(operation::MOV, reg_operand(reg, data_size_t::DWORD),
						reg_operand(reg, data_size_t::DWORD)));
				}
			}
			// narrowing just uses the lower part of the register
			return item(type, reg);
		}
		release(it);
		const register_id dst = m_registers.acquire();
		if (to > from) {
			if (from < 4) {
				emit(assembly_instruction(operation::MOVZX, reg_operand(dst, widened_size), it.operand()));
			}
			else {
				emit(assembly_instruction(operation::MOV, reg_operand(dst, data_size_t::DWORD), it.operand()));
			}
		}
		else {
			// little endian, the low bytes are at the same address
			emit(assembly_instruction(operation::MOV, reg_operand(dst, to_size), mem_operand(to_size, it.memory())));
		}
		return item(type, dst);
	}

	std::vector<std::string> code_generator::builtin_body(const std::string& path) {
		const auto fs = cmrc::builtin::get_filesystem();
		if (!fs.exists(path)) {
			throw internal_error("missing builtin routine " + path);
		}
		const auto file = fs.open(path);
		std::istringstream stream(std::string(file.begin(), file.end()));
		std::vector<std::string> lines;
		std::string line;
		while (std::getline(stream, line)) {
			if (!line.empty() && line.back() == '\r') {
				line.pop_back();
			}
			const size_t first = line.find_first_not_of(" \t");
			if (first == std::string::npos || line[first] == ';') {
				continue;
			}
			lines.push_back(line);
		}
		return lines;
	}

	item code_generator::call(const analysis::symbols::procedure& proc, const std::vector<item>& args) {
		switch (proc.symbol) {
			case analysis::symbols::builtin_procedure_t::WRITE_ELN: {
				for (const auto& arg : args) {
					release(arg);
				}
				// the syscall itself clobbers rcx and r11
				const auto body = builtin_body("builtin/write_eln.asm");
				m_registers.reserve_for({
					register_id::rdi, register_id::rsi, register_id::rdx, register_id::rcx, register_id::r11
				}, m_program, [&] {
					for (const auto& line : body) {
						m_program.push_back(assembly::assembly_component::raw(line));
					}
				});
				return item::void_item();
			}
			case analysis::symbols::builtin_procedure_t::D2I: {
				if (args.size() != 1 || !proc.return_type.has_value()) {
					throw internal_error("d2i takes exactly one argument and returns a value");
				}
				const item& arg = args.front();
				const std::string arg_text = stream_text(arg.operand());
				release(arg);
				const register_id dst = m_registers.acquire();
				const std::string dst_text = register_t(dst, data_size_t::BYTE).to_string();
				for (auto line : builtin_body("builtin/d2i.asm")) {
					replace_all(line, "{dst}", dst_text);
					replace_all(line, "{arg}", arg_text);
					m_program.push_back(assembly::assembly_component::raw(line));
				}
				return item(*proc.return_type, dst);
			}
		}
		throw internal_error("unknown builtin procedure " + proc.name);
	}

	bool is_reserved_label(const std::string& name) {
		static const std::vector<std::string> keywords = {
			"_start", "section", "segment", "global", "extern", "common", "bits", "default", "absolute", "org",
			"align", "alignb", "times", "equ", "incbin", "rel", "abs", "strict", "seg", "wrt", "nosplit",
			"tword", "oword", "yword", "zword", "resb", "resw", "resd", "resq", "ah", "bh", "ch", "dh", "rip",
			"cs", "ds", "es", "fs", "gs", "ss"
		};
		std::string lower = name;
		std::ranges::transform(lower, lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
		if (std::ranges::find(keywords, lower) != keywords.end()) {
			return true;
		}
		for (const auto size : {data_size_t::BYTE, data_size_t::WORD, data_size_t::DWORD, data_size_t::QWORD}) {
			if (lower == machine::data_definition(size) || lower == stream_text(size)) {
				return true;
			}
			for (uint8_t id = 0; id < machine::REGISTER_COUNT; id++) {
				if (lower == register_t(static_cast<register_id>(id), size).to_string()) {
					return true;
				}
			}
		}
		for (auto op = static_cast<uint8_t>(operation::MOV); op <= static_cast<uint8_t>(operation::SYSCALL); op++) {
			if (lower == stream_text(static_cast<operation>(op))) {
				return true;
			}
		}
		return false;
	}

	std::optional<int64_t> constant_index_displacement(const item& base, int64_t index) {
		// a loaded pointer starts a fresh address, an array continues its own
		const int64_t start = base.is_memory() && !base.type.is_pointer() ? base.memory().displacement : 0;
		if (!fits_imm32(index)) {
			return std::nullopt;
		}
		const int64_t displacement = start + index * static_cast<int64_t>(base.type.element().size());
		if (!fits_imm32(displacement)) {
			return std::nullopt;
		}
		return displacement;
	}

	item code_generator::index(const item& base, const item& idx) {
		if (!base.is_register() && !base.is_memory()) {
			throw internal_error("indexed item is neither in a register nor in memory");
		}
		if (!base.type.indexes() || !idx.type.is_index()) {
			throw internal_error("invalid operand types for indexing");
		}
		const type_node& element = base.type.element();
		const uint32_t element_size = element.size();

		assembly_memory mem = base.is_register() ? assembly_memory(base.reg()) : base.memory();
		if (base.is_memory() && base.type.is_pointer()) {
			// the pointer value has to be loaded, the variable only holds it
			release(base);
			const register_id reg = m_registers.acquire();
			emit(assembly_instruction(operation::MOV, reg_operand(reg), mem_operand(data_size_t::QWORD, base.memory())));
			mem = assembly_memory(reg);
		}

		if (idx.is_constant()) {
			const auto displacement = constant_index_displacement(base, idx.constant());
			if (!displacement) {
				throw internal_error("constant index out of the displacement range");
			}
			mem.displacement = *displacement;
			return item(element, mem);
		}

		if (mem.has_label_base() || mem.index.has_value()) {
			// no room for another index register in this address, compute it first
			m_registers.release(mem.registers());
			const register_id reg = m_registers.acquire();
			emit(assembly_instruction(operation::LEA, reg_operand(reg), assembly_operand(mem)));
			mem = assembly_memory(reg);
		}

		// the index register is used with its full 64 bits
		const type_node long_type(builtin_type::LONG);
		item wide_index = idx.type.size() < 8 ? cast(idx, long_type) : idx;
		if (!wide_index.is_register()) {
			wide_index = load(wide_index.retype(long_type));
		}
		uint8_t scale = 1;
		if (element_size == 1 || element_size == 2 || element_size == 4 || element_size == 8) {
			scale = static_cast<uint8_t>(element_size);
		}
		else {
			emit(assembly_instruction(operation::IMUL, reg_operand(wide_index.reg()), reg_operand(wide_index.reg()),
				imm_operand(element_size)));
		}
		return item(element,
			assembly_memory(std::get<register_id>(mem.base), wide_index.reg(), scale, mem.displacement));
	}

	item code_generator::assign(const item& target, const item& source) {
		if (!target.is_memory()) {
			throw internal_error("assignment target is not in memory");
		}
		if (source.is_void()) {
			throw internal_error("void value assigned");
		}
		if (target.type.size() != source.type.size()) {
			throw internal_error("assignment between items of different sizes");
		}
		const data_size_t size = target.type.data_size();
		switch (source.kind) {
			case item::kind_t::CONSTANT:
				if (size == data_size_t::QWORD && !fits_imm32(source.constant())) {
					m_registers.with_temporary([&](register_id tmp) {
						emit(assembly_instruction(operation::MOV, reg_operand(tmp), source.operand()));
						emit(assembly_instruction(operation::MOV, target.operand(), reg_operand(tmp)));
					});
				}
				else {
					emit(assembly_instruction(operation::MOV, target.operand(), source.operand()));
				}
				break;
			case item::kind_t::REGISTER:
				emit(assembly_instruction(operation::MOV, target.operand(), source.operand()));
				break;
			case item::kind_t::MEMORY:
				if (source.memory() == target.memory()) {
					// x := x
					break;
				}
				// no memory to memory moves
				m_registers.with_temporary([&](register_id tmp) {
					emit(assembly_instruction(operation::MOV, reg_operand(tmp, size), source.operand()));
					emit(assembly_instruction(operation::MOV, target.operand(), reg_operand(tmp, size)));
				});
				break;
			case item::kind_t::VOID:
				break;
		}
		release(source);
		return target;
	}
} // wit::compiler
