#include <string>

#include <gtest/gtest.h>

#include "wit/errors.hpp"
#include "wit/lexer.hpp"
#include "wit/compiler/parser.hpp"

using namespace wit::compiler;
using wit::compile_error;
using wit::analysis::items::item;
using wit::analysis::types::binary_operator;
using wit::analysis::types::builtin_type;
using wit::analysis::types::type_node;
using wit::machine::register_id;

namespace {
	class ParserTest : public ::testing::Test {
	protected:
		wit::analysis::symbols::scope_stack scopes;
		code_generator generator;

		void SetUp() override {
			Parser parser(wit::run_lexer(
				"var x: Int, y: Long, b: Byte, c: Char, p: Int*, q: Int*, a: Int[4], m: Int[2][3]"), scopes, generator);
			parser.parse_vardecls();
			m_declarations = generator.program().size();
		}

		item expr(const std::string& source) {
			Parser parser(wit::run_lexer(source), scopes, generator);
			item result = parser.parse_expr();
			EXPECT_TRUE(parser.at_end()) << "unparsed input in " << source;
			return result;
		}
		[[nodiscard]] int64_t constant(const std::string& source) {
			const item result = expr(source);
			EXPECT_TRUE(result.is_constant()) << source;
			return result.is_constant() ? result.constant() : -1;
		}
		// the code generated after the declarations
		[[nodiscard]] std::string code() const {
			const auto& program = generator.program();
			return wit::assembly::to_string(wit::assembly::assembly_program_t(program.begin() + m_declarations,
				program.end()));
		}
		[[nodiscard]] bool emitted(const std::string& line) const {
			return code().find(line + "\n") != std::string::npos;
		}

	private:
		size_t m_declarations = 0;
	};
}

TEST(ConstantFoldingTest, WrapsLikeTheHardware) {
	EXPECT_EQ(fold_constant(7, 2, binary_operator::DIV, 4), 3);
	EXPECT_EQ(fold_constant(0, 1, binary_operator::SUB, 4), 0xFFFFFFFF);
	EXPECT_EQ(fold_constant(0, 1, binary_operator::SUB, 8), -1);
	EXPECT_EQ(fold_constant(200, 100, binary_operator::ADD, 1), 44);
	EXPECT_EQ(fold_constant(1, 33, binary_operator::SHIFT_LEFT, 4), 2);
	EXPECT_EQ(fold_constant(1, 33, binary_operator::SHIFT_LEFT, 8), 0x200000000);
	EXPECT_FALSE(fold_constant(1, 0, binary_operator::DIV, 4).has_value());
	EXPECT_FALSE(fold_constant(1, 0, binary_operator::MOD, 8).has_value());
}

TEST(ConstantFoldingTest, Precedence) {
	EXPECT_LT(binary_precedence(binary_operator::SHIFT_LEFT), binary_precedence(binary_operator::ADD));
	EXPECT_LT(binary_precedence(binary_operator::SUB), binary_precedence(binary_operator::MOD));
	EXPECT_EQ(binary_precedence(binary_operator::MUL), binary_precedence(binary_operator::DIV));
	EXPECT_FALSE(to_binary_operator(wit::operator_type_t::Assign).has_value());
	EXPECT_EQ(to_binary_operator(wit::operator_type_t::Percent), binary_operator::MOD);
}

TEST_F(ParserTest, FoldsConstantExpressions) {
	EXPECT_EQ(constant("1 + 2 * 3"), 7);
	EXPECT_EQ(constant("1 << 3"), 8);
	EXPECT_EQ(constant("8 - 2 - 1"), 5);
	EXPECT_EQ(constant("(8 - 2) * 2"), 12);
	EXPECT_EQ(constant("1 << 2 + 1"), 8);
	EXPECT_EQ(constant("7 % 4 * 2"), 6);
	EXPECT_EQ(constant("64 >> 2 >> 1"), 8);
	EXPECT_EQ(constant("'7' - '0'"), 7);
	EXPECT_TRUE(code().empty());
}

TEST_F(ParserTest, FoldedTypeIsTheWiderOne) {
	const item sum = expr("1 + 2l");
	EXPECT_EQ(sum.type, type_node(builtin_type::LONG));
	EXPECT_EQ(sum.constant(), 3);
	EXPECT_EQ(expr("'a' + 1").type, type_node(builtin_type::INT));
	EXPECT_EQ(expr("'a' + 'b'").type, type_node(builtin_type::CHAR));
}

TEST_F(ParserTest, NegativeConstantsStayInTheirWidth) {
	EXPECT_EQ(constant("-1"), 0xFFFFFFFF);
	EXPECT_EQ(constant("-1l"), -1);
	EXPECT_EQ(constant("0 - 1"), 0xFFFFFFFF);
	EXPECT_EQ(constant("-'a'"), 0x9F);
}

TEST_F(ParserTest, CastingConstantsTruncates) {
	const item narrowed = expr("300 as Byte");
	EXPECT_EQ(narrowed.type, type_node(builtin_type::BYTE));
	EXPECT_EQ(narrowed.constant(), 44);
	EXPECT_EQ(expr("0 as Int*").type, type_node::pointer_to(builtin_type::INT));
	EXPECT_EQ(constant("4294967295 as Long + 1l"), 0x100000000);
}

TEST_F(ParserTest, LiteralRanges) {
	EXPECT_EQ(constant("4294967295"), 0xFFFFFFFF);
	EXPECT_EQ(constant("4294967296l"), 0x100000000);
	EXPECT_THROW((void)expr("4294967296"), compile_error);
	EXPECT_THROW((void)expr("99999999999999999999l"), compile_error);
	EXPECT_THROW((void)expr("1 / 0"), compile_error);
	EXPECT_THROW((void)expr("1 % (2 - 2)"), compile_error);
}

TEST_F(ParserTest, VariableArithmetic) {
	const item result = expr("x + 1");
	ASSERT_TRUE(result.is_register());
	EXPECT_EQ(result.type, type_node(builtin_type::INT));
	EXPECT_EQ(code(),
		"  mov r8d, dword [wit$global$x]\n"
		"  add r8d, 1\n");
	generator.release(result);
	EXPECT_TRUE(generator.registers().empty());
}

TEST_F(ParserTest, NarrowerOperandIsWidened) {
	const item result = expr("x + y");
	EXPECT_EQ(result.type, type_node(builtin_type::LONG));
	EXPECT_EQ(code(),
		"  mov r8d, dword [wit$global$x]\n"
		"  add r8, qword [wit$global$y]\n");

	generator.release(result);
	const item product = expr("b * 3");
	EXPECT_EQ(product.type, type_node(builtin_type::INT));
	EXPECT_TRUE(emitted("  movzx r8d, byte [wit$global$b]"));
	EXPECT_TRUE(emitted("  mul r9d"));
	EXPECT_TRUE(emitted("  mov r8d, eax"));
	generator.release(product);
	EXPECT_TRUE(generator.registers().empty());
}

TEST_F(ParserTest, MultiplicationBindsTighterThanAddition) {
	const item result = expr("x + x * 2");
	const std::string text = code();
	const auto mul = text.find("  mul ");
	const auto add = text.find("  add ");
	ASSERT_NE(mul, std::string::npos);
	ASSERT_NE(add, std::string::npos);
	EXPECT_LT(mul, add);
	generator.release(result);
	EXPECT_TRUE(generator.registers().empty());
}

TEST_F(ParserTest, ShiftByVariable) {
	const item result = expr("x << b");
	EXPECT_EQ(code(),
		"  movzx r8d, byte [wit$global$b]\n"
		"  mov r9d, dword [wit$global$x]\n"
		"  mov ecx, r8d\n"
		"  shl r9d, cl\n");
	EXPECT_EQ(result.reg(), register_id::r9);
	generator.release(result);
	EXPECT_TRUE(generator.registers().empty());
}

TEST_F(ParserTest, DivisionAndRemainder) {
	generator.release(expr("x / x"));
	EXPECT_EQ(code(),
		"  mov eax, dword [wit$global$x]\n"
		"  xor edx, edx\n"
		"  div dword [wit$global$x]\n"
		"  mov r8d, eax\n");
	generator.release(expr("x % x"));
	EXPECT_TRUE(emitted("  mov eax, edx"));
	EXPECT_TRUE(generator.registers().empty());
}

TEST_F(ParserTest, ConstantIndexFoldsIntoDisplacement) {
	const item element = expr("a[2]");
	ASSERT_TRUE(element.is_memory());
	EXPECT_EQ(element.memory(), wit::assembly::assembly_memory("wit$global$a", 8));
	EXPECT_EQ(element.type, type_node(builtin_type::INT));

	// Int[2][3] is three rows of two
	const item cell = expr("m[1][2]");
	EXPECT_EQ(cell.memory(), wit::assembly::assembly_memory("wit$global$m", 16));
	EXPECT_EQ(expr("m[2]").type, type_node::array_of(builtin_type::INT, 2));
	EXPECT_TRUE(code().empty());
}

TEST_F(ParserTest, RuntimeIndex) {
	const item element = expr("a[x]");
	EXPECT_EQ(code(),
		"  lea r8, [wit$global$a]\n"
		"  mov r9d, dword [wit$global$x]\n");
	EXPECT_EQ(element.memory(), wit::assembly::assembly_memory(register_id::r8, register_id::r9, 4));
	generator.release(element);
	EXPECT_TRUE(generator.registers().empty());
}

TEST_F(ParserTest, PointerIndex) {
	const item element = expr("p[1]");
	EXPECT_EQ(code(), "  mov r8, qword [wit$global$p]\n");
	EXPECT_EQ(element.memory(), wit::assembly::assembly_memory(register_id::r8, 4));
	generator.release(element);
}

TEST_F(ParserTest, AddressAndNegation) {
	const item address = expr("&x");
	EXPECT_EQ(address.type, type_node::pointer_to(builtin_type::INT));
	EXPECT_EQ(code(), "  lea r8, [wit$global$x]\n");
	generator.release(address);

	const item negated = expr("-y");
	EXPECT_TRUE(emitted("  mov r8, qword [wit$global$y]"));
	EXPECT_TRUE(emitted("  neg r8"));
	generator.release(negated);
	EXPECT_TRUE(generator.registers().empty());
}

TEST_F(ParserTest, PointerArithmetic) {
	const item moved = expr("p + 1");
	EXPECT_EQ(moved.type, type_node::pointer_to(builtin_type::INT));
	EXPECT_TRUE(emitted("  add r8, 1"));
	generator.release(moved);

	const item distance = expr("p - q");
	EXPECT_TRUE(emitted("  sub r8, qword [wit$global$q]"));
	generator.release(distance);

	EXPECT_THROW((void)expr("1 + p"), compile_error);
	EXPECT_THROW((void)expr("p * 2"), compile_error);
	EXPECT_THROW((void)expr("a + 1"), compile_error);
}

TEST_F(ParserTest, Casts) {
	const item widened = expr("x as Long");
	EXPECT_EQ(widened.type, type_node(builtin_type::LONG));
	EXPECT_EQ(code(), "  mov r8d, dword [wit$global$x]\n");
	generator.release(widened);

	const item reinterpreted = expr("y as Int*");
	EXPECT_TRUE(reinterpreted.is_memory());
	EXPECT_EQ(reinterpreted.type, type_node::pointer_to(builtin_type::INT));
	EXPECT_THROW((void)expr("x as Int[2]"), compile_error);
}

TEST_F(ParserTest, BuiltinCalls) {
	const item digit = expr("d2i('7')");
	EXPECT_EQ(digit.type, type_node(builtin_type::BYTE));
	EXPECT_EQ(code(),
		"  mov r8b, 55\n"
		"  sub r8b, 48\n");
	generator.release(digit);

	EXPECT_THROW((void)expr("d2i(1)"), compile_error);
	EXPECT_THROW((void)expr("d2i('1', '2')"), compile_error);
	EXPECT_THROW((void)expr("write_eln + 1"), compile_error);
}

TEST_F(ParserTest, TypeErrors) {
	EXPECT_THROW((void)expr("x[1]"), compile_error);
	EXPECT_THROW((void)expr("a[p]"), compile_error);
	EXPECT_THROW((void)expr("&1"), compile_error);
	EXPECT_THROW((void)expr("-p"), compile_error);
	EXPECT_THROW((void)expr("zz + 1"), compile_error);
	EXPECT_THROW((void)expr("Int + 1"), compile_error);
	EXPECT_THROW((void)expr("(1 + 2"), compile_error);
	EXPECT_THROW((void)expr("1 +"), compile_error);
}

TEST_F(ParserTest, RegisterPoolExhaustionIsAnInternalError) {
	// every parenthesized sum holds a register until the outermost addition
	std::string source = "x";
	for (int i = 0; i < 12; ++i) {
		source = "(x + x) + (" + source + ")";
	}
	EXPECT_THROW((void)expr(source), wit::internal_error);
}
