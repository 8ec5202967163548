#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>
#include "cook/lexer.hpp"
#include "cook/parser.hpp"

using namespace cook;

namespace {

struct Blocks {
    std::string input;
    std::vector<Token> tokens;
    DiagnosticQueue events;
    std::vector<ast::Block> blocks;
};

std::unique_ptr<Blocks> blocks_of(const std::string& src, Extensions ext = Extensions::All){
    auto b = std::make_unique<Blocks>();
    b->input = src;
    b->tokens = tokenize(b->input);
    b->blocks = parse_blocks(b->input, b->tokens, b->events, ext);
    return b;
}

std::vector<ast::StepItem> step_items(const std::string& src, Extensions ext = Extensions::All){
    auto b = blocks_of(src, ext);
    EXPECT_EQ(b->blocks.size(), 1u);
    const auto* step = std::get_if<ast::StepBlock>(&b->blocks.at(0));
    EXPECT_NE(step, nullptr);
    return step ? step->items : std::vector<ast::StepItem>{};
}

const ast::Component& component(const std::vector<ast::StepItem>& items, size_t i){
    return std::get<ast::Component>(items.at(i));
}

} // namespace

TEST(Blocks, LineKinds){
    auto b = blocks_of(">> servings: 2|4\n= Dough =\nMix @flour{500%g}\nwith @water.\n\n> Rest a bit.\n> Really.\nBake.");
    ASSERT_EQ(b->blocks.size(), 5u);
    const auto& meta = std::get<ast::MetadataBlock>(b->blocks[0]);
    EXPECT_EQ(meta.key.value, "servings");
    EXPECT_EQ(meta.value.value, "2|4");
    const auto& section = std::get<ast::SectionBlock>(b->blocks[1]);
    ASSERT_TRUE(section.name.has_value());
    EXPECT_EQ(section.name->value, "Dough");
    const auto& step = std::get<ast::StepBlock>(b->blocks[2]);
    ASSERT_EQ(step.items.size(), 5u);
    // line break inside a step becomes a space
    EXPECT_EQ(std::get<ast::Text>(step.items[2]).value, " with ");
    const auto& text = std::get<ast::TextBlock>(b->blocks[3]);
    EXPECT_EQ(text.text.value, "Rest a bit. Really.");
    EXPECT_TRUE(std::holds_alternative<ast::StepBlock>(b->blocks[4]));
    EXPECT_TRUE(b->events.empty());
}

TEST(Blocks, DisabledExtensionsFallBackToSteps){
    auto b = blocks_of("= Dough =\n\n> note", Extensions::None);
    ASSERT_EQ(b->blocks.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<ast::StepBlock>(b->blocks[0]));
    EXPECT_TRUE(std::holds_alternative<ast::StepBlock>(b->blocks[1]));
}

TEST(Blocks, SectionNames){
    auto b = blocks_of("== Sauce\n=\n=== ===");
    ASSERT_EQ(b->blocks.size(), 3u);
    EXPECT_EQ(std::get<ast::SectionBlock>(b->blocks[0]).name->value, "Sauce");
    EXPECT_FALSE(std::get<ast::SectionBlock>(b->blocks[1]).name.has_value());
    EXPECT_FALSE(std::get<ast::SectionBlock>(b->blocks[2]).name.has_value());
}

TEST(Blocks, MetadataProblems){
    auto b = blocks_of(">> : value\n>> key:\n>> nocolon");
    ASSERT_EQ(b->events.size(), 3u);
    EXPECT_EQ(b->events[0].code, "E0301");
    EXPECT_EQ(b->events[1].code, "W0301");
    EXPECT_FALSE(b->events[1].is_error());
    EXPECT_EQ(b->events[2].code, "E0303");
}

TEST(Blocks, CommentsAreBlankLines){
    auto b = blocks_of("Step one -- note\n-- only a comment\nStep [- inline -]two");
    ASSERT_EQ(b->blocks.size(), 2u);
    const auto& second = std::get<ast::StepBlock>(b->blocks[1]);
    EXPECT_EQ(std::get<ast::Text>(second.items[0]).value, "Step two");
}

TEST(Step, SingleWordAndBraced){
    auto items = step_items("Add @salt and @olive oil{2%tbsp}.");
    ASSERT_EQ(items.size(), 5u);
    EXPECT_EQ(std::get<ast::Text>(items[0]).value, "Add ");
    EXPECT_EQ(component(items, 1).name->value, "salt");
    EXPECT_FALSE(component(items, 1).quantity.has_value());
    const auto& oil = component(items, 3);
    EXPECT_EQ(oil.name->value, "olive oil");
    ASSERT_TRUE(oil.quantity.has_value());
    EXPECT_EQ(oil.quantity->value.unit->value, "tbsp");
    EXPECT_EQ(std::get<ast::Text>(items[4]).value, ".");
}

TEST(Step, ModifiersAliasAndNote){
    auto items = step_items("@?-flour|all-purpose flour{}(sifted) #+pot ~{10%min}");
    const auto& flour = component(items, 0);
    EXPECT_EQ(flour.modifiers, Modifiers::Opt | Modifiers::Hidden);
    EXPECT_EQ(flour.name->value, "flour");
    EXPECT_EQ(flour.alias->value, "all-purpose flour");
    EXPECT_EQ(flour.note->value, "sifted");
    const auto& pot = component(items, 2);
    EXPECT_EQ(pot.kind, ast::Component::Kind::Cookware);
    EXPECT_EQ(pot.modifiers, Modifiers::New);
    const auto& timer = component(items, 4);
    EXPECT_EQ(timer.kind, ast::Component::Kind::Timer);
    EXPECT_FALSE(timer.name.has_value());
    EXPECT_TRUE(timer.quantity.has_value());
}

TEST(Step, ModifierErrors){
    auto b = blocks_of("@&+egg #@pan @??salt");
    ASSERT_EQ(b->events.size(), 3u);
    EXPECT_EQ(b->events[0].code, "E0202");
    EXPECT_EQ(b->events[1].code, "E0203");
    EXPECT_EQ(b->events[2].code, "E0201");
}

TEST(Step, IntermediateReferences){
    auto items = step_items("@&(2)dough{} @&(~1)sauce{} @&(=1)base{}");
    EXPECT_EQ(component(items, 0).intermediate->kind, ast::IntermediateRef::Kind::Step);
    EXPECT_EQ(component(items, 0).intermediate->value, 2u);
    EXPECT_EQ(component(items, 2).intermediate->kind, ast::IntermediateRef::Kind::RelativeStep);
    EXPECT_EQ(component(items, 4).intermediate->kind, ast::IntermediateRef::Kind::Section);
    EXPECT_EQ(component(items, 4).name->value, "base");
}

TEST(Step, BadIntermediateReference){
    auto b = blocks_of("@&(two)dough{}");
    ASSERT_EQ(b->events.size(), 1u);
    EXPECT_EQ(b->events[0].code, "E0206");
}

TEST(Step, NotAComponentIsText){
    auto items = step_items("Email me @ home or use # 1");
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(std::get<ast::Text>(items[0]).value, "Email me @ home or use # 1");
}

TEST(Step, EscapedSigil){
    auto items = step_items("Price \\@ 3 or \\#tag");
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(std::get<ast::Text>(items[0]).value, "Price @ 3 or #tag");
}

TEST(Step, FailedComponentRollsBackDiagnostics){
    // bad intermediate reference, then no name: the whole thing is text
    auto b = blocks_of("@&(two) and more");
    EXPECT_TRUE(b->events.empty());
    const auto& step = std::get<ast::StepBlock>(b->blocks.at(0));
    ASSERT_EQ(step.items.size(), 1u);
    EXPECT_EQ(std::get<ast::Text>(step.items[0]).value, "@&(two) and more");
}

TEST(Step, MetadataNotAStep){
    auto b = blocks_of("Mix.\n>> time: 1h\nBake.");
    ASSERT_EQ(b->blocks.size(), 3u);
    EXPECT_TRUE(std::holds_alternative<ast::MetadataBlock>(b->blocks[1]));
}
