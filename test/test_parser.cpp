#include <gtest/gtest.h>
#include <string>

#include <pdsl/parser/odl.h>

using namespace pdsl;
using odl::ParseError;
using odl::Options;

using Kind = ParseError::Kind;

namespace {

ParseError parse_failure(const std::string_view& input, const Options& options = {}) {
  std::optional<ParseError> error;
  auto label = odl::parse(options, input, error);
  EXPECT_FALSE(label.has_value());
  EXPECT_TRUE(error.has_value());
  return *error;
}

Value parse_value(const std::string& text) {
  auto label = odl::parse("X = " + text + "\nEND");
  return label.value("X");
}

} // namespace

TEST(Parser, EmptyInput) {
  auto error = parse_failure("");
  EXPECT_EQ(error.kind(), Kind::UNEXPECTED_END);
  EXPECT_THROW(odl::parse(""), ParseError);
}

TEST(Parser, MissingEquals) {
  auto error = parse_failure("blha blha blha");
  EXPECT_EQ(error.kind(), Kind::EXPECTED_TOKEN);
  EXPECT_EQ(error.lexeme(), "blha");
  EXPECT_EQ(error.offset(), 5);
}

TEST(Parser, ErrorContext) {
  auto error = parse_failure("A = 1\r\nB 2\r\nEND");
  EXPECT_EQ(error.kind(), Kind::EXPECTED_TOKEN);
  EXPECT_EQ(error.lexeme(), "2");
  std::string what = error.what();
  EXPECT_NE(what.find("line 2, column 3"), std::string::npos);
  EXPECT_NE(what.find("--^"), std::string::npos);
}

TEST(Parser, MissingEnd) {
  auto error = parse_failure("A = 1\r\n");
  EXPECT_EQ(error.kind(), Kind::UNEXPECTED_END);
}

TEST(Parser, MinimalLabel) {
  auto label = odl::parse("END");
  EXPECT_EQ(label.size(), 0);
  EXPECT_EQ(odl::parse("  end  ").size(), 0);
}

TEST(Parser, TrailingBytesIgnored) {
  std::string input = "A = 1\r\nEND\r\n";
  input += std::string("\x00\xff\xfe garbage = = (", 14);
  auto label = odl::parse(input);
  EXPECT_EQ(label.size(), 1);
  EXPECT_EQ(label.value("A").to_int(), 1);
}

TEST(Parser, Attributes) {
  auto label = odl::parse(R"(PDS_VERSION_ID = PDS3
RECORD_TYPE    = FIXED_LENGTH
^IMAGE         = 12
MRO:ORBIT      = 4
END
)");
  EXPECT_EQ(label.size(), 4);
  EXPECT_EQ(label.value("pds_version_id"), Value{Identifier{"PDS3"}});
  EXPECT_EQ(label.value("^image").to_int(), 12);
  EXPECT_EQ(label.value("mro:orbit").to_int(), 4);
  EXPECT_EQ(label.get(2).identifier().to_str(), "^IMAGE");
}

TEST(Parser, BlanksInsideIdentifiers) {
  auto label = odl::parse("^ IMAGE = 12\nMRO : ORBIT = 4\nNS\t:NAME = 5\nEND");
  EXPECT_EQ(label.size(), 3);
  EXPECT_EQ(label.get(0).identifier().to_str(), "^IMAGE");
  EXPECT_EQ(label.get(1).identifier().to_str(), "MRO:ORBIT");
  EXPECT_EQ(label.value("ns:name").to_int(), 5);
  EXPECT_EQ(parse_failure("^\nIMAGE = 12\nEND").kind(), Kind::INVALID_VALUE);
  EXPECT_EQ(parse_failure("NS :\nNAME = 12\nEND").kind(), Kind::INVALID_VALUE);
}

TEST(Parser, Integers) {
  EXPECT_EQ(parse_value("42"), Value{42});
  EXPECT_EQ(parse_value("-42"), Value{-42});
  EXPECT_EQ(parse_value("+42"), Value{42});
  EXPECT_EQ(parse_value("123456789012345678901234567890").as<Integer>().value().to_str(),
            "123456789012345678901234567890");
}

TEST(Parser, BasedIntegers) {
  auto hex = parse_value("16#4B#");
  auto bin = parse_value("2#1001011#");
  EXPECT_EQ(hex.to_int(), 75);
  EXPECT_EQ(bin.to_int(), 75);
  EXPECT_EQ(hex.as<BasedInteger>().radix(), 16);
  EXPECT_EQ(parse_value("8#113#").to_int(), 75);
  EXPECT_EQ(parse_value("16#-4b#").as<BasedInteger>().digits(), "-4b");
}

TEST(Parser, BasedIntegerBadDigit) {
  auto error = parse_failure("X = 2#102#\nEND");
  EXPECT_EQ(error.kind(), Kind::MALFORMED_LITERAL);
  EXPECT_EQ(error.lexeme(), "2#102#");
  EXPECT_EQ(parse_failure("X = 17#1#\nEND").kind(), Kind::MALFORMED_LITERAL);
  EXPECT_EQ(parse_failure("X = 16#4B\nEND").kind(), Kind::MALFORMED_LITERAL);
}

TEST(Parser, Reals) {
  EXPECT_EQ(parse_value("1.5").as<Real>().value(), 1.5);
  EXPECT_EQ(parse_value("-.5").as<Real>().value(), -0.5);
  EXPECT_EQ(parse_value("2.").as<Real>().value(), 2.0);
  EXPECT_EQ(parse_value("1e3").as<Real>().value(), 1000.0);
  EXPECT_EQ(parse_value("1.5E-3").as<Real>().value(), 0.0015);
  EXPECT_EQ(parse_failure("X = 1.5.5\nEND").kind(), Kind::MALFORMED_LITERAL);
  EXPECT_EQ(parse_failure("X = .\nEND").kind(), Kind::MALFORMED_LITERAL);
}

TEST(Parser, RealTooLargeForInt) {
  auto value = parse_value("1e300");
  EXPECT_EQ(value.to_float(), 1e300);
  EXPECT_THROW(value.to_int(), ValidationError);
}

TEST(Parser, Units) {
  auto value = parse_value("5 <km>");
  EXPECT_EQ(value.as<Integer>().units(), Units{"KM"});
  EXPECT_EQ(parse_value("2.5<m / s**2>").as<Real>().units(), Units{"M/S**2"});
  EXPECT_EQ(parse_value("16#FF# <DN>").as<BasedInteger>().units(), Units{"DN"});
  EXPECT_EQ(parse_failure("X = 5 <km/>\nEND").kind(), Kind::MALFORMED_LITERAL);
  EXPECT_EQ(parse_failure("X = 5 <km").kind(), Kind::UNEXPECTED_END);
}

TEST(Parser, Dates) {
  auto ymd = parse_value("2024-02-29").as<Date>();
  EXPECT_EQ(ymd.year(), 2024);
  EXPECT_EQ(ymd.month(), 2);
  EXPECT_EQ(ymd.day(), 29);

  auto doy = parse_value("2024-100").as<Date>();
  EXPECT_FALSE(doy.month().has_value());
  EXPECT_EQ(doy.day(), 100);

  auto error = parse_failure("X = 2023-02-29\nEND");
  EXPECT_EQ(error.kind(), Kind::INVALID_VALUE);
  EXPECT_EQ(error.lexeme(), "2023-02-29");
}

TEST(Parser, Times) {
  EXPECT_EQ(parse_value("12:30"), Value{Time(12, 30)});
  EXPECT_EQ(parse_value("12:30:15.5"), Value{Time(12, 30, 15.5)});
  EXPECT_EQ(parse_value("12:30:15Z"), Value{Time(12, 30, 15.0, true)});
  EXPECT_EQ(parse_value("12:30-07"), Value{Time(12, 30, std::nullopt, false, -7)});
  EXPECT_EQ(parse_value("12:30+05:30"), Value{Time(12, 30, std::nullopt, false, 5, 30)});
  EXPECT_EQ(parse_failure("X = 25:00\nEND").kind(), Kind::INVALID_VALUE);
  EXPECT_EQ(parse_failure("X = 12:\nEND").kind(), Kind::MALFORMED_LITERAL);
}

TEST(Parser, DateTimes) {
  auto dt = parse_value("2024-01-02T03:04:05.25Z").as<DateTime>();
  EXPECT_EQ(dt.date(), Date(2024, 1, 2));
  EXPECT_EQ(dt.time(), Time(3, 4, 5.25, true));
  EXPECT_EQ(parse_value("1997-245t12:00").as<DateTime>().date(), Date(1997, std::nullopt, 245));
  EXPECT_EQ(parse_failure("X = 2024-01-02T\nEND").kind(), Kind::MALFORMED_LITERAL);
}

TEST(Parser, Text) {
  auto value = parse_value("\"multi\r\n  line text\"");
  EXPECT_EQ(value.as<Text>().value(), "multi\r\n  line text");
  EXPECT_EQ(parse_value("\"\"").as<Text>().value(), "");
  EXPECT_EQ(parse_failure("X = \"open\nEND").kind(), Kind::UNEXPECTED_END);
  EXPECT_EQ(parse_failure("X = \"caf\xc3\xa9\"\nEND").kind(), Kind::INVALID_VALUE);
}

TEST(Parser, Symbol) {
  EXPECT_EQ(parse_value("'n/a'"), Value{Symbol{"N/A"}});
  EXPECT_EQ(parse_failure("X = ''\nEND").kind(), Kind::INVALID_VALUE);
  EXPECT_EQ(parse_failure("X = 'a\nb'\nEND").kind(), Kind::INVALID_VALUE);
  EXPECT_EQ(parse_failure("X = 'open").kind(), Kind::UNEXPECTED_END);
}

TEST(Parser, Sequences) {
  auto seq = parse_value("(1, 2.5, 'a', \"b\", c)").as<Sequence1D>();
  EXPECT_EQ(seq.size(), 5);
  EXPECT_EQ(seq.get(0), Scalar{1});
  EXPECT_EQ(seq.get(1), Scalar{2.5});
  EXPECT_EQ(seq.get(4), Scalar{Identifier{"C"}});

  auto seq2 = parse_value("((1, 2), (3, 4 <s>))").as<Sequence2D>();
  EXPECT_EQ(seq2.size(), 2);
  EXPECT_EQ(seq2.get(1).get(1), Scalar{Integer(4, Units{"S"})});

  auto multiline = parse_value("(1,\r\n   2 /* two */\r\n   , 3)").as<Sequence1D>();
  EXPECT_EQ(multiline.size(), 3);
}

TEST(Parser, MalformedSequences) {
  EXPECT_EQ(parse_failure("X = ()\nEND").kind(), Kind::EXPECTED_TOKEN);
  EXPECT_EQ(parse_failure("X = (1 2)\nEND").kind(), Kind::EXPECTED_TOKEN);
  EXPECT_EQ(parse_failure("X = ((1), 2)\nEND").kind(), Kind::EXPECTED_TOKEN);
  EXPECT_EQ(parse_failure("X = (1, {2})\nEND").kind(), Kind::EXPECTED_TOKEN);
  EXPECT_EQ(parse_failure("X = (1, 2").kind(), Kind::UNEXPECTED_END);
}

TEST(Parser, Sets) {
  auto set = parse_value("{1, 'a', 2}").as<Set>();
  EXPECT_EQ(set.size(), 3);
  EXPECT_TRUE(set.contains(Symbol{"A"}));
  EXPECT_EQ(parse_value("{}").as<Set>().size(), 0);
  EXPECT_EQ(parse_value("{1, 1}").as<Set>().size(), 1);
  EXPECT_EQ(parse_failure("X = {1.5}\nEND").kind(), Kind::INVALID_VALUE);
}

TEST(Parser, Groups) {
  auto label = odl::parse(R"(
GROUP = params
  gain   = 2
  offset = 1
END_GROUP = params
BEGIN_GROUP = other
  a = 1
END_GROUP
END)");
  EXPECT_EQ(label.size(), 2);
  auto& params = label.get("params").as<Group>();
  EXPECT_EQ(params.statements().size(), 2);
  EXPECT_EQ(params.statements().value("offset").to_int(), 1);
  EXPECT_TRUE(label.get("other").is_type<Group>());
}

TEST(Parser, Objects) {
  auto label = odl::parse(R"(
OBJECT = image
  LINES = 1024
  GROUP = window
    X = 0
  END_GROUP = window
  OBJECT = histogram
    ITEMS = 256
  END_OBJECT = histogram
END_OBJECT = image
END)");
  auto& image = label.get("image").as<Object>().statements();
  EXPECT_EQ(image.size(), 3);
  EXPECT_TRUE(image.get("window").is_type<Group>());
  EXPECT_EQ(image.get("histogram").as<Object>().statements().value("items").to_int(), 256);
}

TEST(Parser, MismatchedBlocks) {
  auto error = parse_failure("GROUP = a\nX = 1\nEND_GROUP = b\nEND");
  EXPECT_EQ(error.kind(), Kind::MISMATCHED_BLOCK);
  EXPECT_EQ(error.lexeme(), "B");
  EXPECT_EQ(parse_failure("GROUP = a\nX = 1\nEND_OBJECT = a\nEND").kind(), Kind::MISMATCHED_BLOCK);
  EXPECT_EQ(parse_failure("GROUP = a\nX = 1\nEND").kind(), Kind::MISMATCHED_BLOCK);
  EXPECT_EQ(parse_failure("X = 1\nEND_GROUP = a\nEND").kind(), Kind::MISMATCHED_BLOCK);
  EXPECT_EQ(parse_failure("GROUP = a\nX = 1\n").kind(), Kind::UNEXPECTED_END);
}

TEST(Parser, GroupCannotNest) {
  auto error = parse_failure("GROUP = a\nOBJECT = b\nEND_OBJECT\nEND_GROUP\nEND");
  EXPECT_EQ(error.kind(), Kind::INVALID_VALUE);
  EXPECT_EQ(parse_failure("GROUP = ^a\nEND_GROUP\nEND").kind(), Kind::INVALID_VALUE);
}

TEST(Parser, MaxDepth) {
  std::string input = "OBJECT = a\nOBJECT = b\nOBJECT = c\nEND_OBJECT\nEND_OBJECT\nEND_OBJECT\nEND";
  EXPECT_NO_THROW(odl::parse(input));
  EXPECT_NO_THROW(odl::parse(Options{3}, input));
  auto error = parse_failure(input, Options{2});
  EXPECT_EQ(error.kind(), Kind::INVALID_VALUE);
  EXPECT_NE(error.detail().find("nesting too deep"), std::string::npos);
}

TEST(Parser, Comments) {
  auto label = odl::parse(R"(/* leading comment */
A = 1 /* trailing comment */ ignored rest of line
/* another */
B = 2
END)");
  EXPECT_EQ(label.size(), 2);
  EXPECT_EQ(label.value("B").to_int(), 2);
  EXPECT_EQ(parse_failure("/* unterminated\nA = 1\nEND").kind(), Kind::MALFORMED_LITERAL);
}

TEST(Parser, InvalidIdentifier) {
  EXPECT_EQ(parse_failure("A__B = 1\nEND").kind(), Kind::INVALID_VALUE);
  EXPECT_EQ(parse_failure("= 1\nEND").kind(), Kind::EXPECTED_TOKEN);
  EXPECT_EQ(parse_failure("A = \nEND").kind(), Kind::INVALID_VALUE);
}

TEST(Parser, NonThrowingOverload) {
  std::optional<ParseError> error;
  auto label = odl::parse("A = 1\nEND", error);
  ASSERT_TRUE(label.has_value());
  EXPECT_FALSE(error.has_value());
  EXPECT_EQ(label->value("A").to_int(), 1);
}

TEST(Scanner, MatchAndTake) {
  pdsl::parse::Scanner scanner{"GROUP = ABC_1;"};
  EXPECT_FALSE(scanner.match("OBJECT"));
  EXPECT_TRUE(scanner.match("GROUP"));
  EXPECT_EQ(scanner.consumed(), 5u);
  EXPECT_TRUE(scanner.consume_whitespace());
  EXPECT_TRUE(scanner.match('='));
  EXPECT_TRUE(scanner.consume_whitespace());
  EXPECT_EQ(scanner.lexeme(), "ABC_1;");
  EXPECT_EQ(scanner.take_while(is_alnum), "ABC");
  EXPECT_EQ(scanner.peek(), '_');
  EXPECT_EQ(scanner.peek(1), '1');
  scanner.next(10);
  EXPECT_TRUE(scanner.done());
  EXPECT_EQ(scanner.peek(), 0);
}

TEST(Scanner, CommentSkipsRestOfLine) {
  pdsl::parse::Scanner scanner{"  /* note */ ignored\r\nA"};
  EXPECT_TRUE(scanner.consume_whitespace());
  EXPECT_EQ(scanner.peek(), 'A');
}

TEST(Scanner, UnterminatedComment) {
  pdsl::parse::Scanner scanner{" /* note\r\n */ A"};
  EXPECT_FALSE(scanner.consume_whitespace());
  EXPECT_EQ(scanner.consumed(), 1u);
}

TEST(Scanner, DelimiterLexeme) {
  pdsl::parse::Scanner scanner{"<KM>"};
  EXPECT_EQ(scanner.lexeme(), "<");
}
