#include <limits>
#include <memory>
#include <optional>
#include <string>

#include <gtest/gtest.h>

#include "wit/errors.hpp"
#include "wit/compiler/generator.hpp"

using namespace wit::compiler;
using wit::analysis::items::item;
using wit::analysis::symbols::variable;
using wit::analysis::types::binary_operator;
using wit::analysis::types::builtin_type;
using wit::analysis::types::type_node;
using wit::machine::register_id;

namespace {
	std::shared_ptr<variable> make_variable(const std::string& name, const type_node& type, bool exported = false) {
		return std::make_shared<variable>(name, type, exported);
	}

	class GeneratorTest : public ::testing::Test {
	protected:
		code_generator generator;

		[[nodiscard]] std::string text() const {
			return wit::assembly::to_string(generator.program());
		}
		[[nodiscard]] bool emitted(const std::string& line) const {
			return text().find(line + "\n") != std::string::npos;
		}
	};
}

TEST_F(GeneratorTest, GlobalStorage) {
	const auto counter = make_variable("counter", builtin_type::INT);
	const auto total = make_variable("total", builtin_type::LONG, true);
	const auto buffer = make_variable("buffer", type_node::array_of(builtin_type::CHAR, 16));
	const auto grid = make_variable("grid", type_node::array_of(type_node::array_of(builtin_type::INT, 2), 3));
	generator.emit_data_section();
	generator.declare_globals({counter, total, buffer, grid});

	EXPECT_EQ(text(),
		"section .data\n"
		"  wit$newl: db 10\n"
		"  wit$global$counter: dd 0\n"
		"  global total\n"
		"  total: dq 0\n"
		"  wit$global$buffer: times 16 db 0\n"
		"  wit$global$grid: times 6 dd 0\n");
	ASSERT_TRUE(counter->location.has_value());
	EXPECT_TRUE(counter->location->global);
	EXPECT_EQ(counter->location->label, "wit$global$counter");
	EXPECT_EQ(total->location->label, "total");
	EXPECT_EQ(grid->location->size, 24u);
}

TEST_F(GeneratorTest, LocalFrame) {
	const auto a = make_variable("a", builtin_type::INT);
	const auto b = make_variable("b", builtin_type::LONG);
	const auto c = make_variable("c", type_node::array_of(builtin_type::BYTE, 3));
	generator.enter_main_frame();
	generator.declare_locals({a, b, c});

	// each offset includes the variable's own size
	EXPECT_EQ(a->location->offset, 4u);
	EXPECT_EQ(b->location->offset, 12u);
	EXPECT_EQ(c->location->offset, 15u);
	EXPECT_EQ(generator.frame_total(), 15u);
	EXPECT_EQ(generator.variable_item(*b).memory(), wit::assembly::assembly_memory(register_id::rbp, -12));

	generator.leave_main_frame();
	EXPECT_EQ(text(),
		"_start:\n"
		"  push rbp\n"
		"  mov rbp, rsp\n"
		"  sub rsp, 15\n"
		"  mov rsp, rbp\n"
		"  pop rbp\n"
		"  mov rax, 60\n"
		"  xor rdi, rdi\n"
		"  syscall\n");
}

TEST_F(GeneratorTest, EmptyFrameNeedsNoSetup) {
	generator.enter_main_frame();
	generator.declare_locals({});
	generator.leave_main_frame();
	EXPECT_EQ(text(),
		"_start:\n"
		"  mov rax, 60\n"
		"  xor rdi, rdi\n"
		"  syscall\n");
}

TEST_F(GeneratorTest, UndeclaredStorageIsAnInternalError) {
	const variable pending("pending", builtin_type::INT);
	EXPECT_THROW((void)generator.variable_item(pending), wit::internal_error);
}

TEST_F(GeneratorTest, AddReusesLeftRegister) {
	const item lhs(builtin_type::INT, generator.registers().acquire());
	const item result = generator.binary_operation(lhs, item(builtin_type::INT, 7), binary_operator::ADD);
	ASSERT_TRUE(result.is_register());
	EXPECT_EQ(result.reg(), register_id::r8);
	EXPECT_EQ(text(), "  add r8d, 7\n");
}

TEST_F(GeneratorTest, MismatchedSizesAreAnInternalError) {
	const item lhs(builtin_type::INT, wit::assembly::assembly_memory("x"));
	const item rhs(builtin_type::LONG, wit::assembly::assembly_memory("y"));
	EXPECT_THROW((void)generator.binary_operation(lhs, rhs, binary_operator::SUB), wit::internal_error);
}

TEST_F(GeneratorTest, DivisionGoesThroughRax) {
	const item lhs(builtin_type::INT, wit::assembly::assembly_memory("x"));
	const item result = generator.binary_operation(lhs, item(builtin_type::INT, 10), binary_operator::DIV);
	EXPECT_EQ(text(),
		"  mov r8d, 10\n"
		"  mov eax, dword [x]\n"
		"  xor edx, edx\n"
		"  div r8d\n"
		"  mov r8d, eax\n");
	ASSERT_TRUE(result.is_register());
	generator.release(result);
	EXPECT_TRUE(generator.registers().empty());
}

TEST_F(GeneratorTest, LiveRdxIsSavedAroundMultiply) {
	// r8 r9 r10 r11 rdx
	for (int i = 0; i < 5; ++i) {
		(void)generator.registers().acquire();
	}
	const item lhs(builtin_type::LONG, register_id::r8);
	const item rhs(builtin_type::LONG, register_id::r9);
	const item result = generator.binary_operation(lhs, rhs, binary_operator::MUL);
	EXPECT_EQ(text(),
		"  mov rax, r8\n"
		"  push rdx\n"
		"  mul r9\n"
		"  pop rdx\n"
		"  mov r8, rax\n");
	EXPECT_EQ(result.reg(), register_id::r8);
	EXPECT_TRUE(generator.registers().is_used(register_id::rdx));
}

TEST_F(GeneratorTest, ByteRemainderComesFromAh) {
	const item lhs(builtin_type::BYTE, wit::assembly::assembly_memory("b"));
	const item rhs(builtin_type::BYTE, wit::assembly::assembly_memory("c"));
	const item result = generator.binary_operation(lhs, rhs, binary_operator::MOD);
	EXPECT_EQ(text(),
		"  movzx eax, byte [b]\n"
		"  div byte [c]\n"
		"  shr eax, 8\n"
		"  mov r8b, al\n");
	EXPECT_EQ(result.type, type_node(builtin_type::BYTE));
}

TEST_F(GeneratorTest, VariableShiftCountUsesCl) {
	const item lhs(builtin_type::INT, wit::assembly::assembly_memory("x"));
	const item count(builtin_type::INT, wit::assembly::assembly_memory("n"));
	const item result = generator.binary_operation(lhs, count, binary_operator::SHIFT_LEFT);
	EXPECT_EQ(text(),
		"  mov r8d, dword [x]\n"
		"  mov ecx, dword [n]\n"
		"  shl r8d, cl\n");
	EXPECT_EQ(result.reg(), register_id::r8);
}

TEST_F(GeneratorTest, ShiftedValueIsMovedOutOfRcx) {
	// r8 r9 r10 r11 rdx rbx, then rcx holds the shifted value
	for (int i = 0; i < 7; ++i) {
		(void)generator.registers().acquire();
	}
	const item lhs(builtin_type::INT, register_id::rcx);
	const item count(builtin_type::INT, wit::assembly::assembly_memory("n"));
	const item result = generator.binary_operation(lhs, count, binary_operator::SHIFT_LEFT);
	EXPECT_EQ(text(),
		"  mov rsi, rcx\n"
		"  mov ecx, dword [n]\n"
		"  shl esi, cl\n");
	EXPECT_EQ(result.reg(), register_id::rsi);
	EXPECT_FALSE(generator.registers().is_used(register_id::rcx));
}

TEST_F(GeneratorTest, LiveRcxIsSavedAroundShift) {
	for (int i = 0; i < 7; ++i) {
		(void)generator.registers().acquire();
	}
	const item lhs(builtin_type::INT, wit::assembly::assembly_memory("x"));
	const item count(builtin_type::INT, wit::assembly::assembly_memory("n"));
	const item result = generator.binary_operation(lhs, count, binary_operator::SHIFT_RIGHT);
	EXPECT_EQ(text(),
		"  mov esi, dword [x]\n"
		"  push rcx\n"
		"  mov ecx, dword [n]\n"
		"  shr esi, cl\n"
		"  pop rcx\n");
	EXPECT_EQ(result.reg(), register_id::rsi);
	EXPECT_TRUE(generator.registers().is_used(register_id::rcx));
}

TEST_F(GeneratorTest, DivisorIsMovedOutOfRdx) {
	// r8 r9 r10 r11, then rdx holds the divisor
	for (int i = 0; i < 5; ++i) {
		(void)generator.registers().acquire();
	}
	const item lhs(builtin_type::LONG, wit::assembly::assembly_memory("x"));
	const item rhs(builtin_type::LONG, register_id::rdx);
	const item result = generator.binary_operation(lhs, rhs, binary_operator::DIV);
	EXPECT_EQ(text(),
		"  mov rbx, rdx\n"
		"  mov rax, qword [x]\n"
		"  xor edx, edx\n"
		"  div rbx\n"
		"  mov rdx, rax\n");
	EXPECT_EQ(result.reg(), register_id::rdx);
	EXPECT_FALSE(generator.registers().is_used(register_id::rbx));
}

TEST_F(GeneratorTest, ConstantShiftCountIsMasked) {
	const item lhs(builtin_type::INT, wit::assembly::assembly_memory("x"));
	(void)generator.binary_operation(lhs, item(builtin_type::INT, 33), binary_operator::SHIFT_RIGHT);
	EXPECT_EQ(text(),
		"  mov r8d, dword [x]\n"
		"  shr r8d, 1\n");
}

TEST_F(GeneratorTest, Casts) {
	const item byte_value(builtin_type::BYTE, wit::assembly::assembly_memory("b"));
	const item widened = generator.cast(byte_value, builtin_type::LONG);
	const item long_value(builtin_type::LONG, wit::assembly::assembly_memory("y"));
	const item narrowed = generator.cast(long_value, builtin_type::INT);
	EXPECT_EQ(text(),
		"  movzx r8d, byte [b]\n"
		"  mov r9d, dword [y]\n");
	EXPECT_EQ(widened.type, type_node(builtin_type::LONG));
	EXPECT_EQ(narrowed.type, type_node(builtin_type::INT));
	EXPECT_THROW((void)generator.cast(item(builtin_type::INT, 1), builtin_type::LONG), wit::internal_error);
}

TEST_F(GeneratorTest, IndexLaw) {
	const type_node array = type_node::array_of(builtin_type::INT, 4);
	const item base(array, wit::assembly::assembly_memory("a"));

	// a[3]: the constant index folds into the displacement
	const item fixed = generator.index(base, item(builtin_type::INT, 3));
	EXPECT_EQ(fixed.memory(), wit::assembly::assembly_memory("a", 12));
	EXPECT_TRUE(generator.program().empty());

	// a[i]
	const item dynamic = generator.index(base, item(builtin_type::INT, wit::assembly::assembly_memory("i")));
	EXPECT_EQ(text(),
		"  lea r8, [a]\n"
		"  mov r9d, dword [i]\n");
	EXPECT_EQ(dynamic.memory(), wit::assembly::assembly_memory(register_id::r8, register_id::r9, 4));
	EXPECT_EQ(dynamic.type, type_node(builtin_type::INT));
}

TEST_F(GeneratorTest, ConstantIndexMustFitTheDisplacement) {
	const type_node array = type_node::array_of(builtin_type::LONG, 4);
	const item local(array, wit::assembly::assembly_memory(register_id::rbp, -32));
	EXPECT_EQ(constant_index_displacement(local, 3), -8);
	EXPECT_EQ(constant_index_displacement(local, 4294967295), std::nullopt);
	EXPECT_EQ(constant_index_displacement(local, 268435460), std::nullopt);
	EXPECT_EQ(constant_index_displacement(local, std::numeric_limits<int64_t>::max()), std::nullopt);

	EXPECT_THROW((void)generator.index(local, item(builtin_type::INT, 4294967295)), wit::internal_error);
	EXPECT_TRUE(generator.registers().empty());
}

TEST_F(GeneratorTest, PointerIsLoadedBeforeIndexing) {
	const type_node pointer = type_node::pointer_to(builtin_type::LONG);
	const item base(pointer, wit::assembly::assembly_memory(register_id::rbp, -8));
	const item element = generator.index(base, item(builtin_type::INT, 2));
	EXPECT_EQ(text(), "  mov r8, qword [rbp-8]\n");
	EXPECT_EQ(element.memory(), wit::assembly::assembly_memory(register_id::r8, 16));
}

TEST_F(GeneratorTest, UnscalableElementUsesImul) {
	const type_node row = type_node::array_of(builtin_type::INT, 3);
	const item base(type_node::array_of(row, 2), wit::assembly::assembly_memory("m"));
	const item element = generator.index(base, item(builtin_type::LONG, wit::assembly::assembly_memory("j")));
	EXPECT_EQ(text(),
		"  lea r8, [m]\n"
		"  mov r9, qword [j]\n"
		"  imul r9, r9, 12\n");
	EXPECT_EQ(element.type, row);
}

TEST_F(GeneratorTest, Assignments) {
	const item x(builtin_type::INT, wit::assembly::assembly_memory("x"));
	const item y(builtin_type::INT, wit::assembly::assembly_memory("y"));
	const item big(builtin_type::LONG, wit::assembly::assembly_memory("big"));

	(void)generator.assign(x, item(builtin_type::INT, 3));
	(void)generator.assign(x, x);
	(void)generator.assign(x, y);
	(void)generator.assign(big, item(builtin_type::LONG, 0x100000000));
	EXPECT_EQ(text(),
		"  mov dword [x], 3\n"
		"  mov r8d, dword [y]\n"
		"  mov dword [x], r8d\n"
		"  mov r8, 4294967296\n"
		"  mov qword [big], r8\n");
	EXPECT_TRUE(generator.registers().empty());
	EXPECT_THROW((void)generator.assign(item(builtin_type::INT, 1), x), wit::internal_error);
}

TEST_F(GeneratorTest, DigitConversionIsInlined) {
	const wit::analysis::symbols::scope_stack scopes;
	const auto* d2i = scopes.lookup("d2i");
	ASSERT_NE(d2i, nullptr);
	const item result = generator.call(d2i->as_procedure(),
		{item(builtin_type::CHAR, wit::assembly::assembly_memory("c"))});
	EXPECT_EQ(text(),
		"  mov r8b, byte [c]\n"
		"  sub r8b, 48\n");
	EXPECT_EQ(result.type, type_node(builtin_type::BYTE));
	EXPECT_EQ(result.reg(), register_id::r8);
}

TEST_F(GeneratorTest, WriteElnSavesClobberedRegisters) {
	const wit::analysis::symbols::scope_stack scopes;
	// r8 r9 r10 r11
	for (int i = 0; i < 4; ++i) {
		(void)generator.registers().acquire();
	}
	const item result = generator.call(scopes.lookup("write_eln")->as_procedure(), {});
	EXPECT_TRUE(result.is_void());
	EXPECT_EQ(text(),
		"  push r11\n"
		"  mov rax, 1\n"
		"  mov rdi, 1\n"
		"  mov rsi, wit$newl\n"
		"  mov rdx, 1\n"
		"  syscall\n"
		"  pop r11\n");
}
