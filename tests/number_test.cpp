#include <gtest/gtest.h>
#include "cook/convert.hpp"
#include "cook/quantity.hpp"

using namespace cook;

TEST(Number, FractionValueIncludesError){
    Number n = Number::fraction(1, 1, 2, 0.01);
    EXPECT_DOUBLE_EQ(n.value(), 1.51);
    EXPECT_THROW(Number::fraction(0, 1, 0), std::invalid_argument);
}

TEST(Number, SameDenominatorStaysExact){
    Number a = Number::fraction(0, 1, 2);
    Number b = Number::fraction(1, 1, 2);
    Number sum = a.add(b);
    ASSERT_TRUE(sum.is_fraction());
    EXPECT_EQ(*sum.as_fraction(), (Fraction{2, 0, 2, 0.0}));
    EXPECT_EQ(sum.to_string(), "2");
}

TEST(Number, SameDenominatorPastU32FallsBackToRegular){
    Number a = Number::fraction(4294967295u, 1, 2);
    Number b = Number::fraction(0, 1, 2);
    Number sum = a.add(b);
    ASSERT_TRUE(sum.is_regular());
    EXPECT_EQ(sum.value(), 4294967296.0);
}

TEST(Number, MixedAdditionApproximates){
    Number sum = Number::fraction(0, 1, 4).add(Number(0.5));
    ASSERT_TRUE(sum.is_fraction());
    EXPECT_EQ(*sum.as_fraction(), (Fraction{0, 3, 4, 0.0}));
    EXPECT_EQ(sum.to_string(), "3/4");

    Number approx = Number(1.1).add(Number::fraction(0, 1, 2));
    ASSERT_TRUE(approx.is_fraction());
    const Fraction& f = *approx.as_fraction();
    EXPECT_EQ(f.whole, 1u);
    EXPECT_EQ(f.num, 5u);
    EXPECT_EQ(f.den, 8u);
    EXPECT_NEAR(f.err, -0.025, 1e-9);
    EXPECT_NEAR(approx.value(), 1.6, 1e-9);
}

TEST(Number, FarFromSmallFractionsIsRegular){
    Number sum = Number::fraction(0, 1, 2).add(Number(0.07));
    // 0.57 is more than 5% away from 1/2 and 5/8
    EXPECT_TRUE(sum.is_regular());
    EXPECT_NEAR(sum.value(), 0.57, 1e-12);
}

TEST(Number, RegularAdditionStaysRegular){
    Number sum = Number(1.5).add(Number(2.0));
    ASSERT_TRUE(sum.is_regular());
    EXPECT_DOUBLE_EQ(*sum.as_regular(), 3.5);
}

TEST(Number, ScaleFraction){
    Number n = Number::fraction(0, 1, 2).scale(3.0);
    ASSERT_TRUE(n.is_fraction());
    EXPECT_EQ(n.to_string(), "1 1/2");
    Number r = Number::fraction(0, 1, 2).scale(1.5);
    ASSERT_TRUE(r.is_regular());
    EXPECT_DOUBLE_EQ(r.value(), 0.75);
}

TEST(Number, Display){
    EXPECT_EQ(Number(100.0).to_string(), "100");
    EXPECT_EQ(Number(1.1).to_string(), "1.1");
    EXPECT_EQ(Number(1.0 / 3.0).to_string(), "0.333");
    EXPECT_EQ(Number::fraction(0, 2, 3).to_string(), "2/3");
}

TEST(Value, RangeAddition){
    Value a = Value::range(Number(1.0), Number(2.0));
    EXPECT_EQ(a.try_add(Value(1.0)), Value::range(Number(2.0), Number(3.0)));
    EXPECT_EQ(Value(1.0).try_add(a), Value::range(Number(2.0), Number(3.0)));
    EXPECT_EQ(a.try_add(a), Value::range(Number(2.0), Number(4.0)));
    EXPECT_EQ(a.to_string(), "1-2");
}

TEST(Value, TextNeverAdds){
    try {
        (void)Value::text("some").try_add(Value(1.0));
        FAIL() << "expected quantity_add_error";
    } catch(const quantity_add_error& e){
        EXPECT_EQ(e.kind, quantity_add_error::Kind::TextValue);
    }
}

TEST(Value, ScaleLeavesTextAlone){
    EXPECT_EQ(Value::text("a bit").scale(2.0), Value::text("a bit"));
    EXPECT_EQ(Value::range(Number(1.0), Number(2.0)).scale(2.0), Value::range(Number(2.0), Number(4.0)));
}

TEST(Quantity, UnitAwareAddition){
    Converter conv = Converter::bundled();
    ScaledQuantity a{Value(1.0), std::string("kg")};
    ScaledQuantity b{Value(500.0), std::string("g")};
    ScaledQuantity sum = try_add(a, b, conv);
    EXPECT_EQ(*sum.unit, "kg");
    EXPECT_NEAR(sum.value.as_number()->value(), 1.5, 1e-9);

    ScaledQuantity ml{Value(1.0), std::string("ml")};
    EXPECT_THROW(try_add(a, ml, conv), quantity_add_error);
    ScaledQuantity none{Value(1.0), std::nullopt};
    EXPECT_THROW(try_add(a, none, conv), quantity_add_error);
    EXPECT_EQ(try_add(none, none, conv).value, Value(2.0));

    ScaledQuantity handful{Value(1.0), std::string("handful")};
    EXPECT_EQ(try_add(handful, handful, conv).value, Value(2.0));
    EXPECT_THROW(try_add(handful, a, conv), quantity_add_error);
    EXPECT_EQ(to_string(sum), "1.5 kg");
}
