#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "cook/lexer.hpp"
#include "cook/quantity_parser.hpp"

using namespace cook;

namespace {

struct QuantityResult {
    ast::Quantity quantity;
    std::optional<Span> separator;
    DiagnosticReport report;
};

// Parses the whole input as the inside of a quantity's braces.
QuantityResult parse_q(const std::string& input, Extensions ext = Extensions::All){
    std::vector<Token> tokens = tokenize(input);
    tokens.pop_back(); // eof
    DiagnosticQueue events;
    BlockParser bp(TokenSlice(tokens), input, events, ext);
    ParsedQuantity pq = parse_quantity(bp, TokenSlice(tokens));
    return QuantityResult{pq.quantity.value, pq.unit_separator, DiagnosticReport::from_queue(events)};
}

const Located<Value>& single(const QuantityResult& r){
    const auto* s = r.quantity.value.as_single();
    EXPECT_NE(s, nullptr);
    return s->value;
}

Value range(double a, double b){ return Value::range(Number(a), Number(b)); }

} // namespace

TEST(QuantityParser, UnitAfterSeparator){
    auto r = parse_q("100%ml");
    EXPECT_EQ(single(r), (Located<Value>{Value(100.0), Span(0, 3)}));
    ASSERT_TRUE(r.separator.has_value());
    EXPECT_EQ(*r.separator, Span(3, 4));
    ASSERT_TRUE(r.quantity.unit.has_value());
    EXPECT_EQ(r.quantity.unit->value, "ml");
    EXPECT_TRUE(r.report.empty());
}

TEST(QuantityParser, UnitWithoutSeparator){
    auto r = parse_q("100 ml");
    EXPECT_EQ(single(r), (Located<Value>{Value(100.0), Span(0, 3)}));
    EXPECT_FALSE(r.separator.has_value());
    EXPECT_EQ(r.quantity.unit->value, "ml");
    EXPECT_TRUE(r.report.empty());

    auto plain = parse_q("100 ml", Extensions::All ^ Extensions::AdvancedUnits);
    EXPECT_EQ(single(plain), (Located<Value>{Value::text("100 ml"), Span(0, 6)}));
    EXPECT_FALSE(plain.separator.has_value());
    EXPECT_FALSE(plain.quantity.unit.has_value());
    EXPECT_TRUE(plain.report.empty());
}

TEST(QuantityParser, RangeWithoutSeparator){
    auto r = parse_q("100-200 ml");
    EXPECT_EQ(single(r), (Located<Value>{range(100, 200), Span(0, 7)}));
    EXPECT_EQ(r.quantity.unit->value, "ml");
    EXPECT_TRUE(r.report.empty());

    auto mixed = parse_q("1 - 2 1 / 2 ml");
    EXPECT_EQ(single(mixed), (Located<Value>{Value::range(Number(1.0), Number::fraction(2, 1, 2)), Span(0, 11)}));
    EXPECT_EQ(mixed.quantity.unit->value, "ml");
    EXPECT_TRUE(mixed.report.empty());
}

TEST(QuantityParser, ManyValues){
    auto r = parse_q("100|200|300%ml");
    const auto* many = r.quantity.value.as_many();
    ASSERT_NE(many, nullptr);
    ASSERT_EQ(many->values.size(), 3u);
    EXPECT_EQ(many->values[0], (Located<Value>{Value(100.0), Span(0, 3)}));
    EXPECT_EQ(many->values[1], (Located<Value>{Value(200.0), Span(4, 7)}));
    EXPECT_EQ(many->values[2], (Located<Value>{Value(300.0), Span(8, 11)}));
    EXPECT_EQ(*r.separator, Span(11, 12));
    EXPECT_EQ(r.quantity.unit->value, "ml");
    EXPECT_EQ(r.quantity.unit->span, Span(12, 14));
    EXPECT_TRUE(r.report.empty());
}

TEST(QuantityParser, AutoScaleWithManyValuesIsOneError){
    auto r = parse_q("100|2-3|str*%ml");
    const auto* many = r.quantity.value.as_many();
    ASSERT_NE(many, nullptr);
    ASSERT_EQ(many->values.size(), 3u);
    EXPECT_EQ(many->values[1], (Located<Value>{range(2, 3), Span(4, 7)}));
    EXPECT_EQ(many->values[2], (Located<Value>{Value::text("str"), Span(8, 11)}));
    EXPECT_EQ(*r.separator, Span(12, 13));
    EXPECT_EQ(r.report.errors.size(), 1u);
    EXPECT_EQ(r.report.errors[0].code, "E0103");
    EXPECT_TRUE(r.report.warnings.empty());
}

TEST(QuantityParser, TrailingEmptyValue){
    auto r = parse_q("100|");
    const auto* many = r.quantity.value.as_many();
    ASSERT_NE(many, nullptr);
    ASSERT_EQ(many->values.size(), 2u);
    EXPECT_EQ(many->values[1], (Located<Value>{Value::text(""), Span(4, 4)}));
    ASSERT_EQ(r.report.errors.size(), 1u);
    EXPECT_EQ(r.report.errors[0].code, "E0102");
    EXPECT_TRUE(r.report.warnings.empty());
}

TEST(QuantityParser, AutoScaleSingle){
    auto r = parse_q("2*%cups");
    const auto* s = r.quantity.value.as_single();
    ASSERT_NE(s, nullptr);
    EXPECT_EQ(s->value.value, Value(2.0));
    ASSERT_TRUE(s->auto_scale.has_value());
    EXPECT_EQ(*s->auto_scale, Span(1, 2));
    EXPECT_EQ(r.quantity.unit->value, "cups");
}

TEST(QuantityParser, Ranges){
    EXPECT_EQ(single(parse_q("2-3")).value, range(2, 3));
    EXPECT_EQ(single(parse_q("2-3", Extensions::None)).value, Value::text("2-3"));
    EXPECT_EQ(single(parse_q("2 1/2-3")).value, Value::range(Number::fraction(2, 1, 2), Number(3.0)));
    EXPECT_EQ(single(parse_q("2-3 1/2")).value, Value::range(Number(2.0), Number::fraction(3, 1, 2)));
    EXPECT_FALSE(parse_q("2-3").quantity.unit.has_value());
}

TEST(QuantityParser, Fractions){
    EXPECT_EQ(single(parse_q("1/2")).value, Value(Number::fraction(0, 1, 2)));
    EXPECT_EQ(single(parse_q("0 1/2")).value, Value(Number::fraction(0, 1, 2)));
    EXPECT_EQ(single(parse_q("2 1/2")).value, Value(Number::fraction(2, 1, 2)));
    // leading zero numerator is not numeric
    EXPECT_TRUE(single(parse_q("01/2")).value.is_text());
    auto spaced = parse_q("3 / 4");
    const Fraction* f = single(spaced).value.as_number()->as_fraction();
    ASSERT_NE(f, nullptr);
    EXPECT_EQ(f->err, 0.0);
}

TEST(QuantityParser, SimpleNumbers){
    const std::pair<const char*, double> cases[] = {
        {"1", 1.0}, {"1.0", 1.0}, {"10", 10.0}, {"10.0000000", 10.0}, {"10.05", 10.05}, {".5", 0.5}};
    for(const auto& [input, expected] : cases){
        auto r = parse_q(input);
        const Number* n = single(r).value.as_number();
        ASSERT_NE(n, nullptr) << input;
        ASSERT_TRUE(n->is_regular()) << input;
        EXPECT_DOUBLE_EQ(*n->as_regular(), expected) << input;
        EXPECT_TRUE(r.report.empty()) << input;
    }
    EXPECT_TRUE(single(parse_q("01")).value.is_text());
    EXPECT_TRUE(single(parse_q("01.0")).value.is_text());
}

TEST(QuantityParser, LargeIntegersStayFloats){
    auto r = parse_q("123456789012345");
    EXPECT_DOUBLE_EQ(single(r).value.as_number()->value(), 123456789012345.0);
    EXPECT_TRUE(r.report.empty());
}

TEST(QuantityParser, DivisionByZeroRecovers){
    auto r = parse_q("1/0%cup");
    EXPECT_EQ(single(r).value, Value::recover());
    ASSERT_EQ(r.report.errors.size(), 1u);
    EXPECT_EQ(r.report.errors[0].code, "E0104");
    EXPECT_FALSE(r.report.errors[0].hints.empty());
    EXPECT_EQ(r.quantity.unit->value, "cup");
}

TEST(QuantityParser, EmptyUnitAfterSeparator){
    auto r = parse_q("100%");
    EXPECT_EQ(single(r).value, Value(100.0));
    ASSERT_EQ(r.report.errors.size(), 1u);
    EXPECT_EQ(r.report.errors[0].code, "E0101");
    EXPECT_EQ(r.report.errors[0].labels.size(), 2u);
    ASSERT_TRUE(r.quantity.unit.has_value());
    EXPECT_TRUE(r.quantity.unit->is_text_empty());
}

TEST(QuantityParser, TextSwallowsNonValueTail){
    // '*' not followed by '%' or the end: whole text becomes the value
    auto r = parse_q("a*b%g");
    EXPECT_EQ(single(r).value, Value::text("a*b"));
    EXPECT_EQ(r.quantity.unit->value, "g");
    EXPECT_TRUE(r.report.empty());
}

TEST(QuantityParser, TextWithUnit){
    auto r = parse_q("a pinch");
    EXPECT_EQ(single(r).value, Value::text("a pinch"));
    EXPECT_FALSE(r.quantity.unit.has_value());
}

TEST(QuantityParser, EmptyTokensThrow){
    std::string input;
    DiagnosticQueue events;
    BlockParser bp(TokenSlice{}, input, events, Extensions::All);
    EXPECT_THROW(parse_quantity(bp, TokenSlice{}), std::invalid_argument);
}
