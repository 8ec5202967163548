#include <gtest/gtest.h>
#include <string>
#include <type_traits>
#include <utility>
#include "cook/cook.hpp"

using namespace cook;

namespace {

template <typename R, typename = void>
struct can_scale : std::false_type {};
template <typename R>
struct can_scale<R, std::void_t<decltype(scale(std::declval<R>(), std::declval<ScaleTarget>()))>> : std::true_type {};

static_assert(can_scale<ScalableRecipe>::value, "scalable recipes scale");
static_assert(!can_scale<ScaledRecipe>::value, "a recipe is scaled once");

ScalableRecipe parse_ok(const std::string& src){
    auto r = RecipeParser().parse(src);
    EXPECT_TRUE(r.success);
    return r.recipe;
}

const char* kTiered = ">> servings: 2|4\nMix @flour{100|200%g}, @salt{1*%tsp} and @water{1%l}. Wait ~{10|15%min}.";

} // namespace

TEST(ScaleTarget, FromDeclaredServings){
    auto recipe = parse_ok(kTiered);
    ScaleTarget t = scale_target(recipe, 4);
    EXPECT_EQ(t.base, 2.0);
    EXPECT_EQ(t.target, 4.0);
    EXPECT_EQ(t.index, std::optional<size_t>(1));
    EXPECT_EQ(t.factor(), 2.0);

    ScaleTarget odd = scale_target(recipe, 3);
    EXPECT_FALSE(odd.index.has_value());

    auto plain = parse_ok("@egg{1*}");
    ScaleTarget p = scale_target(plain, 3);
    EXPECT_EQ(p.base, 1.0);
    EXPECT_EQ(p.factor(), 3.0);
}

TEST(Scale, DeclaredTier){
    ScaledRecipe s = scale_to_servings(parse_ok(kTiered), 4);
    ASSERT_EQ(s.ingredients.size(), 3u);
    EXPECT_EQ(s.ingredients[0].quantity->value, Value(200.0));
    EXPECT_EQ(s.ingredients[1].quantity->value, Value(2.0));
    EXPECT_EQ(s.ingredients[2].quantity->value, Value(1.0));
    EXPECT_EQ(s.data.ingredients, (std::vector<ScaleOutcome>{ScaleOutcome::Scaled, ScaleOutcome::Scaled, ScaleOutcome::Fixed}));
    EXPECT_EQ(s.timers[0].quantity->value, Value(15.0));
    EXPECT_EQ(s.data.timers, (std::vector<ScaleOutcome>{ScaleOutcome::Scaled}));
    EXPECT_EQ(s.data.kind, Scaled::Kind::Target);
    EXPECT_EQ(*s.metadata.get("servings"), "4");
}

TEST(Scale, UndeclaredTarget){
    ScaledRecipe s = scale_to_servings(parse_ok(kTiered), 3);
    EXPECT_EQ(s.ingredients[0].quantity->value, Value(100.0));
    EXPECT_EQ(s.data.ingredients[0], ScaleOutcome::InvalidTarget);
    EXPECT_EQ(s.ingredients[1].quantity->value, Value(1.5));
    EXPECT_EQ(s.data.timers[0], ScaleOutcome::InvalidTarget);
    EXPECT_EQ(*s.metadata.get("servings"), "3");
}

TEST(Scale, DefaultScaleUsesFirstTier){
    ScaledRecipe s = default_scale(parse_ok(kTiered));
    EXPECT_EQ(s.data.kind, Scaled::Kind::Default);
    EXPECT_EQ(s.data.target.factor(), 1.0);
    EXPECT_EQ(s.ingredients[0].quantity->value, Value(100.0));
    EXPECT_EQ(s.ingredients[1].quantity->value, Value(1.0));
    EXPECT_EQ(*s.metadata.get("servings"), "2|4");
}

TEST(Scale, OutcomesForTextAndMissingQuantities){
    ScaledRecipe s = scale_to_servings(parse_ok("Add @salt{a pinch*} and @pepper and #pan{2*}."), 2);
    EXPECT_EQ(s.data.ingredients, (std::vector<ScaleOutcome>{ScaleOutcome::TextValue, ScaleOutcome::NoQuantity}));
    EXPECT_EQ(s.ingredients[0].quantity->value, Value::text("a pinch"));
    EXPECT_EQ(s.cookware[0].quantity, std::optional<Value>(Value(4.0)));
    EXPECT_EQ(s.data.cookware[0], ScaleOutcome::Scaled);
}

TEST(Scale, FractionsStayExact){
    ScaledRecipe s = scale_to_servings(parse_ok("@sugar{1/2*%cup}"), 3);
    const Number* n = s.ingredients[0].quantity->value.as_number();
    ASSERT_NE(n, nullptr);
    ASSERT_TRUE(n->is_fraction());
    EXPECT_EQ(n->as_fraction()->whole, 1u);
    EXPECT_EQ(n->as_fraction()->num, 1u);
    EXPECT_EQ(n->as_fraction()->den, 2u);
}

TEST(Scale, ScaleValueLinearity){
    auto v = QuantityValue::single(Located<Value>(Value(10.0), Span{0, 2}), Span{2, 3});
    ScaleTarget t;
    t.target = 2.0;
    ScaleOutcome o = ScaleOutcome::NoQuantity;
    EXPECT_EQ(scale_value(v, t, true, o), Value(20.0));
    EXPECT_EQ(o, ScaleOutcome::Scaled);
    EXPECT_EQ(scale_value(v, t, false, o), Value(10.0));
    EXPECT_EQ(o, ScaleOutcome::Fixed);
}

TEST(ConvertRecipe, ToImperial){
    ScaledRecipe s = default_scale(parse_ok("Add @flour{500%g} and @milk{1%cup} and @x{2%blobs}. Bake at 180 C."));
    Converter conv = Converter::bundled();
    auto errors = convert_recipe(s, System::Imperial, conv);
    EXPECT_TRUE(errors.empty());
    EXPECT_EQ(*s.ingredients[0].quantity->unit, "lb");
    EXPECT_EQ(*s.ingredients[1].quantity->unit, "cup");
    EXPECT_EQ(*s.ingredients[2].quantity->unit, "blobs");
    EXPECT_EQ(*s.inline_quantities[0].unit, "F");
    EXPECT_NEAR(s.inline_quantities[0].value.as_number()->value(), 356.0, 1e-6);
}
