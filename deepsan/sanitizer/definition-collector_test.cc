// Copyright 2026 The Deep Sanitizer Authors.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "deepsan/sanitizer/definition-collector.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "deepsan/lang/grammars.h"
#include "deepsan/lang/language-registry.h"
#include "deepsan/lang/syntax-provider.h"
#include "deepsan/lang/syntax-tree.h"
#include "deepsan/lang/syntax-query.h"
#include "deepsan/sanitizer/category.h"
#include "deepsan/sanitizer/reserved-names.h"
#include "deepsan/sanitizer/sanitize-options.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "re2/re2.h"

namespace deepsan {
namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;

class DefinitionCollectorTest : public ::testing::Test {
 protected:
  // Collects definitions of "code" and renders them as "category:text".
  std::vector<std::string> Collect(absl::string_view code,
                                   absl::string_view language_id = "typescript") {
    const LanguageSupport *support =
        LanguageRegistry::Default().Find(language_id);
    EXPECT_NE(support, nullptr);
    auto provider = support->create_provider();
    EXPECT_TRUE(provider.ok());
    auto tree = (*provider)->Parse(code);
    EXPECT_TRUE(tree.ok());
    auto query = SyntaxQuery::Compile((*provider)->language(),
                                      support->definition_query);
    EXPECT_TRUE(query.ok()) << query.status();
    const ReservedSet reserved(options_.whitelist, options_.whitelist_mode);
    const auto definitions =
        CollectDefinitions(**tree, *query, options_, reserved);
    EXPECT_TRUE(definitions.ok()) << definitions.status();
    std::vector<std::string> result;
    for (const auto &definition : *definitions) {
      // Spans point at the name in the source.
      EXPECT_EQ(code.substr(definition.left, definition.right - definition.left),
                definition.text);
      result.push_back(absl::StrCat(CategoryName(definition.category), ":",
                                    definition.text));
    }
    return result;
  }

  SanitizeOptions options_;
};

TEST_F(DefinitionCollectorTest, SourceOrder) {
  EXPECT_THAT(Collect("class Cart {\n"
                      "  addItem(product) { this.total += product.price; }\n"
                      "}\n"
                      "const cart = new Cart();\n"),
              ElementsAre("class:Cart", "func:addItem", "var:product",
                          "var:cart"));
}

TEST_F(DefinitionCollectorTest, SingleCharacterNamesAreSkipped) {
  EXPECT_THAT(Collect("function add(a, b) { return a + b; }"),
              ElementsAre("func:add"));
  options_.min_name_length = 1;
  EXPECT_THAT(Collect("function add(a, b) { return a + b; }"),
              ElementsAre("func:add", "var:a", "var:b"));
}

TEST_F(DefinitionCollectorTest, UnderscoreNamesAreSkipped) {
  EXPECT_THAT(Collect("const _private = 1, __dunder = 2, visible = 3;"),
              ElementsAre("var:visible"));
}

TEST_F(DefinitionCollectorTest, ReservedNamesAreSkipped) {
  EXPECT_THAT(Collect("class Panel { constructor(title) {} render() {} }"),
              ElementsAre("class:Panel", "var:title"));
}

TEST_F(DefinitionCollectorTest, WhitelistAppend) {
  options_.whitelist = {"apiClient"};
  EXPECT_THAT(Collect("const apiClient = 1, useState = 2, other = 3;"),
              ElementsAre("var:other"));
}

TEST_F(DefinitionCollectorTest, WhitelistOverwrite) {
  options_.whitelist = {"apiClient"};
  options_.whitelist_mode = WhitelistMode::kOverwrite;
  EXPECT_THAT(Collect("const apiClient = 1, useState = 2, other = 3;"),
              ElementsAre("var:useState", "var:other"));
}

TEST_F(DefinitionCollectorTest, CategoryOptions) {
  const absl::string_view code =
      "interface Shape { area(): number }\n"
      "class Circle {}\n"
      "function draw(canvasRef) {}\n";
  options_.mask_classes = false;
  EXPECT_THAT(Collect(code), ElementsAre("func:draw", "var:canvasRef"));
  options_.mask_classes = true;
  options_.mask_funcs = false;
  EXPECT_THAT(Collect(code),
              ElementsAre("type:Shape", "class:Circle", "var:canvasRef"));
  options_.mask_funcs = true;
  options_.mask_vars = false;
  EXPECT_THAT(Collect(code),
              ElementsAre("type:Shape", "class:Circle", "func:draw"));
}

TEST_F(DefinitionCollectorTest, KeepPattern) {
  options_.keep_pattern = std::make_shared<re2::RE2>("^gl[A-Z]");
  EXPECT_THAT(Collect("const glContext = 1, context = 2;"),
              ElementsAre("var:context"));
}

TEST_F(DefinitionCollectorTest, MaskedLookingNamesAreSkipped) {
  EXPECT_THAT(Collect("function ACTION_1(VAR_1, VAR_2) { const MAX_SIZE = 3; }"),
              ElementsAre("var:MAX_SIZE"));
}

TEST_F(DefinitionCollectorTest, Python) {
  EXPECT_THAT(Collect("class Repo:\n"
                      "    def find(self, key_id):\n"
                      "        result = self.lookup(key_id)\n"
                      "        return result\n",
                      "python"),
              ElementsAre("class:Repo", "func:find", "var:key_id",
                          "var:result"));
}

TEST_F(DefinitionCollectorTest, DestructuringIsSkipped) {
  EXPECT_THAT(Collect("const { title, pages } = book;\n"
                      "const [first, rest] = pages;\n"
                      "function show(item = fallback) {}\n"),
              ElementsAre("func:show", "var:item"));
}

TEST_F(DefinitionCollectorTest, ScriptDefinitionKinds) {
  EXPECT_THAT(Collect("type Point = { x: number };\n"
                      "enum Color { Red }\n"
                      "const onClick = event => event.target;\n"
                      "function* ids() {}\n"
                      "const Widget = class WidgetImpl {};\n"),
              ElementsAre("type:Point", "type:Color", "var:onClick",
                          "var:event", "func:ids", "var:Widget",
                          "class:WidgetImpl"));
}

TEST_F(DefinitionCollectorTest, PythonParameterForms) {
  EXPECT_THAT(Collect("def build(name: str, size=3, *rest, depth: int = 1):\n"
                      "    for entry in rest:\n"
                      "        pass\n",
                      "python"),
              ElementsAre("func:build", "var:name", "var:size", "var:depth",
                          "var:entry"));
}

class FindDefinitionSitesTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto provider = TreeSitterProvider::Create(tree_sitter_typescript());
    ASSERT_TRUE(provider.ok()) << provider.status();
    provider_ = *std::move(provider);
  }

  std::unique_ptr<SyntaxTree> Parse(absl::string_view code) {
    auto tree = provider_->Parse(code);
    EXPECT_TRUE(tree.ok()) << tree.status();
    return *std::move(tree);
  }

  SyntaxQuery Compile(absl::string_view source) {
    auto query = SyntaxQuery::Compile(tree_sitter_typescript(), source);
    EXPECT_TRUE(query.ok()) << query.status();
    return *std::move(query);
  }

  std::unique_ptr<TreeSitterProvider> provider_;
};

TEST_F(FindDefinitionSitesTest, OneSitePerNode) {
  const SyntaxQuery query =
      Compile("(variable_declarator name: (identifier) @def.var)\n"
              "(variable_declarator name: (identifier) @def.func)\n");
  const auto tree = Parse("let x = 1;");
  const auto sites = FindDefinitionSites(*tree, query);
  ASSERT_TRUE(sites.ok()) << sites.status();
  ASSERT_EQ(sites->size(), 1u);
  EXPECT_EQ((*sites)[0].text, "x");
  EXPECT_EQ((*sites)[0].category, Category::kVariable);
  EXPECT_EQ((*sites)[0].left, 4);
  EXPECT_EQ((*sites)[0].right, 5);
}

TEST_F(FindDefinitionSitesTest, EarlierPatternWins) {
  const SyntaxQuery query =
      Compile("(function_declaration name: (identifier) @def.type)\n"
              "(identifier) @def.var\n");
  const auto tree = Parse("function run() { return total; }");
  const auto sites = FindDefinitionSites(*tree, query);
  ASSERT_TRUE(sites.ok()) << sites.status();
  ASSERT_EQ(sites->size(), 2u);
  EXPECT_EQ((*sites)[0].text, "run");
  EXPECT_EQ((*sites)[0].category, Category::kType);
  EXPECT_EQ((*sites)[1].text, "total");
  EXPECT_EQ((*sites)[1].category, Category::kVariable);
}

TEST_F(FindDefinitionSitesTest, UnknownCaptureIsError) {
  const SyntaxQuery query =
      Compile("(variable_declarator name: (identifier) @def.constant)");
  const auto tree = Parse("let x = 1;");
  EXPECT_EQ(FindDefinitionSites(*tree, query).status().code(),
            absl::StatusCode::kInvalidArgument);
}

TEST_F(FindDefinitionSitesTest, NoDefinitions) {
  const SyntaxQuery query =
      Compile("(variable_declarator name: (identifier) @def.var)");
  const auto tree = Parse("console.log(1);");
  const auto sites = FindDefinitionSites(*tree, query);
  ASSERT_TRUE(sites.ok());
  EXPECT_THAT(*sites, IsEmpty());
}

}  // namespace
}  // namespace deepsan
