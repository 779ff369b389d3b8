#include <string>

#include <gtest/gtest.h>

#include "wit/errors.hpp"
#include "wit/lexer.hpp"

using namespace wit;

TEST(LexerTest, Declaration) {
	const auto tokens = run_lexer("var x: Int");
	ASSERT_EQ(tokens.size(), 5u);
	EXPECT_TRUE(tokens[0].is_keyword("var"));
	EXPECT_EQ(tokens[1].type, lexer_token::type_t::Identifier);
	EXPECT_EQ(std::get<std::string>(tokens[1].value), "x");
	EXPECT_TRUE(tokens[2].is_punctuation(punctuation_type_t::Colon));
	EXPECT_EQ(std::get<std::string>(tokens[3].value), "Int");
	EXPECT_EQ(tokens[4].type, lexer_token::type_t::EndOfFile);
}

TEST(LexerTest, LongestOperatorWins) {
	const auto tokens = run_lexer("x:=a<<b>>c");
	ASSERT_EQ(tokens.size(), 8u);
	EXPECT_TRUE(tokens[1].is_operator(operator_type_t::Assign));
	EXPECT_TRUE(tokens[3].is_operator(operator_type_t::ShiftLeft));
	EXPECT_TRUE(tokens[5].is_operator(operator_type_t::ShiftRight));
}

TEST(LexerTest, KeywordsNeedWholeWords) {
	const auto tokens = run_lexer("as assign ends end");
	EXPECT_TRUE(tokens[0].is_keyword("as"));
	EXPECT_EQ(tokens[1].type, lexer_token::type_t::Identifier);
	EXPECT_EQ(tokens[2].type, lexer_token::type_t::Identifier);
	EXPECT_TRUE(tokens[3].is_keyword("end"));
}

TEST(LexerTest, Literals) {
	const auto tokens = run_lexer("42 42l '7' '\\n' '\\''");
	ASSERT_EQ(tokens.size(), 6u);
	EXPECT_EQ(tokens[0].type, lexer_token::type_t::Integer);
	EXPECT_EQ(std::get<std::string>(tokens[0].value), "42");
	EXPECT_EQ(std::get<std::string>(tokens[1].value), "42l");
	EXPECT_EQ(tokens[2].type, lexer_token::type_t::Character);
	EXPECT_EQ(std::get<char>(tokens[2].value), '7');
	EXPECT_EQ(std::get<char>(tokens[3].value), '\n');
	EXPECT_EQ(std::get<char>(tokens[4].value), '\'');
}

TEST(LexerTest, CommentsAndPositions) {
	const auto tokens = run_lexer("a // first\n  b /* second\n */ c");
	ASSERT_EQ(tokens.size(), 4u);
	EXPECT_EQ(std::get<std::string>(tokens[0].value), "a");
	EXPECT_EQ(tokens[0].line, 1u);
	EXPECT_EQ(tokens[0].column, 1u);
	EXPECT_EQ(std::get<std::string>(tokens[1].value), "b");
	EXPECT_EQ(tokens[1].line, 2u);
	EXPECT_EQ(tokens[1].column, 3u);
	EXPECT_EQ(std::get<std::string>(tokens[2].value), "c");
	EXPECT_EQ(tokens[2].line, 3u);
	EXPECT_EQ(tokens[2].column, 5u);
}

TEST(LexerTest, LongCommentAndIdentifier) {
	const std::string name(100000, 'n');
	const auto tokens = run_lexer("// " + std::string(1 << 20, 'x') + "\n" + name + " b");
	ASSERT_EQ(tokens.size(), 3u);
	EXPECT_EQ(std::get<std::string>(tokens[0].value), name);
	EXPECT_EQ(tokens[0].line, 2u);
	EXPECT_EQ(tokens[1].column, 100002u);
}

TEST(LexerTest, Errors) {
	try {
		(void)run_lexer("x := 1 $ 2");
		FAIL() << "expected a compile_error";
	}
	catch (const compile_error& e) {
		EXPECT_EQ(e.line(), 1u);
		EXPECT_EQ(e.column(), 8u);
	}
	EXPECT_THROW((void)run_lexer("x /* never closed"), compile_error);
}

TEST(LexerTest, EmptySourceIsJustEndOfFile) {
	const auto tokens = run_lexer("  \n");
	ASSERT_EQ(tokens.size(), 1u);
	EXPECT_EQ(tokens[0].type, lexer_token::type_t::EndOfFile);
}
