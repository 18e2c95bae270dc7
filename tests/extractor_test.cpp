#include <gtest/gtest.h>
#include <numeric>
#include "code_atlas/code_parser.hpp"
#include "code_atlas/extractors/language.hpp"
#include "code_atlas/extractors/tree_walker.hpp"
#include "code_atlas/token_counter.hpp"

using namespace code_atlas;

namespace {

FileExtraction extract(const std::string& path, const std::string& source) {
    CodeParser parser;
    ParseResult result = parser.extract_source(path, source);
    EXPECT_TRUE(result.ok()) << path << ": " << result.failure.reason;
    return result.ok() ? *result.extraction : FileExtraction{};
}

const Entity* find_entity(const FileExtraction& fx, const std::string& qualified) {
    for (const auto& e : fx.entities) {
        if (e.kind != EntityKind::File && e.qualified_name == qualified) return &e;
    }
    return nullptr;
}

bool has_relation(const FileExtraction& fx, const std::string& from_qualified, const std::string& target,
                  RelationKind kind) {
    for (const auto& r : fx.relations) {
        if (r.from_local < fx.entities.size() && fx.entities[r.from_local].qualified_name == from_qualified &&
            r.target == target && r.kind == kind) {
            return true;
        }
    }
    return false;
}

} // namespace

TEST(LanguageTest, RegistryMapsExtensions) {
    EXPECT_EQ(language_from_path("a/b.py"), Language::Python);
    EXPECT_EQ(language_from_path("Main.JAVA"), Language::Java);
    EXPECT_EQ(language_from_path("x.mjs"), Language::JavaScript);
    EXPECT_EQ(language_from_path("view.tsx"), Language::TypeScript);
    EXPECT_EQ(language_from_path("list.h"), Language::C);
    EXPECT_EQ(language_from_path("list.hpp"), Language::Cpp);
    EXPECT_EQ(language_from_path("Order.cs"), Language::CSharp);
    EXPECT_EQ(language_from_path("index.php"), Language::Php);
    EXPECT_FALSE(language_from_path("README.md").has_value());
    EXPECT_FALSE(language_from_path("Makefile").has_value());
}

TEST(ExtractorTest, PythonEntitiesAndRelations) {
    const std::string source =
        "import os\n"
        "from .util import helper\n"
        "\n"
        "class Base:\n"
        "    pass\n"
        "\n"
        "class Widget(Base):\n"
        "    def draw(self, canvas, scale=1):\n"
        "        helper(canvas)\n"
        "        self.render()\n"
        "\n"
        "    def render(self):\n"
        "        pass\n"
        "\n"
        "def main():\n"
        "    w = Widget()\n"
        "    w.draw(None)\n";
    FileExtraction fx = extract("pkg/widget.py", source);

    ASSERT_EQ(fx.entities.size(), 6u);
    EXPECT_EQ(fx.entities[0].kind, EntityKind::File);
    EXPECT_EQ(fx.entities[0].id, "pkg/widget.py");
    EXPECT_EQ(fx.entities[0].name, "widget.py");

    const Entity* draw = find_entity(fx, "Widget.draw");
    ASSERT_NE(draw, nullptr);
    EXPECT_EQ(draw->id, "pkg/widget.py::Widget.draw");
    EXPECT_EQ(draw->name, "draw");
    EXPECT_EQ(draw->kind, EntityKind::Method);
    EXPECT_EQ(draw->parameters, (std::vector<std::string>{"self", "canvas", "scale=1"}));
    EXPECT_EQ(draw->span.start_line, 8u);

    ASSERT_NE(find_entity(fx, "Base"), nullptr);
    EXPECT_EQ(find_entity(fx, "Base")->kind, EntityKind::Class);
    ASSERT_NE(find_entity(fx, "main"), nullptr);
    EXPECT_EQ(find_entity(fx, "main")->kind, EntityKind::Function);

    EXPECT_TRUE(has_relation(fx, "", "os", RelationKind::Import));
    EXPECT_TRUE(has_relation(fx, "", ".util", RelationKind::Import));
    EXPECT_TRUE(has_relation(fx, "", ".util.helper", RelationKind::Import));
    EXPECT_TRUE(has_relation(fx, "Widget", "Base", RelationKind::Inherit));
    EXPECT_TRUE(has_relation(fx, "Widget.draw", "helper", RelationKind::Call));
    EXPECT_TRUE(has_relation(fx, "Widget.draw", "render", RelationKind::Call));
    EXPECT_TRUE(has_relation(fx, "main", "Widget", RelationKind::Call));
    EXPECT_TRUE(has_relation(fx, "main", "draw", RelationKind::Call));
}

TEST(ExtractorTest, PythonKeywordArgumentsAreNotBaseClasses) {
    const std::string source =
        "class Meta(type):\n"
        "    pass\n"
        "\n"
        "class Model(Base, orm.Mixin, Generic[T], metaclass=Meta, **options):\n"
        "    pass\n";
    FileExtraction fx = extract("pkg/model.py", source);

    EXPECT_TRUE(has_relation(fx, "Meta", "type", RelationKind::Inherit));
    EXPECT_TRUE(has_relation(fx, "Model", "Base", RelationKind::Inherit));
    EXPECT_TRUE(has_relation(fx, "Model", "orm.Mixin", RelationKind::Inherit));
    EXPECT_TRUE(has_relation(fx, "Model", "Generic", RelationKind::Inherit));
    EXPECT_FALSE(has_relation(fx, "Model", "T", RelationKind::Inherit));
    EXPECT_FALSE(has_relation(fx, "Model", "metaclass", RelationKind::Inherit));
    EXPECT_FALSE(has_relation(fx, "Model", "Meta", RelationKind::Inherit));
    EXPECT_FALSE(has_relation(fx, "Model", "options", RelationKind::Inherit));
    EXPECT_TRUE(has_relation(fx, "Model", "Meta", RelationKind::Reference));
}

TEST(ExtractorTest, TokenCountsExcludeNestedEntities) {
    const std::string source =
        "class Widget:\n"
        "    size = 10\n"
        "\n"
        "    def draw(self):\n"
        "        return self.size * 2\n";
    FileExtraction fx = extract("widget.py", source);

    const Entity* cls = find_entity(fx, "Widget");
    const Entity* draw = find_entity(fx, "Widget.draw");
    ASSERT_NE(cls, nullptr);
    ASSERT_NE(draw, nullptr);

    EXPECT_EQ(draw->token_count, estimate_tokens(draw->source_text));
    EXPECT_GT(cls->token_count, 0u);
    EXPECT_EQ(cls->token_count + draw->token_count, estimate_tokens(cls->source_text));
    EXPECT_NE(cls->source_text.find("def draw"), std::string::npos);
}

TEST(ExtractorTest, ExclusiveTokensCountEachSegmentOnce) {
    const std::string source = "aaaa ( bbbb ) cccc";
    std::vector<Entity> entities(2);
    entities[0].span = {0, static_cast<std::uint32_t>(source.size()), 1, 1};
    entities[1].span = {5, 13, 1, 1};
    extract::assign_exclusive_tokens(entities, {-1, 0}, source);

    EXPECT_EQ(entities[1].token_count, 3u);
    EXPECT_EQ(entities[0].token_count, 2u);
    EXPECT_EQ(entities[0].token_count + entities[1].token_count, estimate_tokens(source));
}

TEST(ExtractorTest, JavaClassesMethodsAndTypes) {
    const std::string source =
        "package com.acme.shapes;\n"
        "\n"
        "import java.util.List;\n"
        "import com.acme.util.Helper;\n"
        "\n"
        "public class Circle extends Shape implements Drawable {\n"
        "    private Point center;\n"
        "\n"
        "    public Circle(Point center) {\n"
        "        this.center = center;\n"
        "    }\n"
        "\n"
        "    public double area() {\n"
        "        return Helper.square(radius()) * 3.14;\n"
        "    }\n"
        "\n"
        "    double radius() { return 1.0; }\n"
        "}\n";
    FileExtraction fx = extract("src/com/acme/shapes/Circle.java", source);

    ASSERT_NE(find_entity(fx, "Circle"), nullptr);
    EXPECT_EQ(find_entity(fx, "Circle")->kind, EntityKind::Class);
    ASSERT_NE(find_entity(fx, "Circle.Circle"), nullptr);
    EXPECT_EQ(find_entity(fx, "Circle.area")->kind, EntityKind::Method);
    ASSERT_NE(find_entity(fx, "Circle.radius"), nullptr);

    EXPECT_TRUE(has_relation(fx, "", "java.util.List", RelationKind::Import));
    EXPECT_TRUE(has_relation(fx, "", "com.acme.util.Helper", RelationKind::Import));
    EXPECT_TRUE(has_relation(fx, "Circle", "Shape", RelationKind::Inherit));
    EXPECT_TRUE(has_relation(fx, "Circle", "Drawable", RelationKind::Inherit));
    EXPECT_TRUE(has_relation(fx, "Circle", "Point", RelationKind::Reference));
    EXPECT_TRUE(has_relation(fx, "Circle.area", "square", RelationKind::Call));
    EXPECT_TRUE(has_relation(fx, "Circle.area", "radius", RelationKind::Call));
    EXPECT_FALSE(has_relation(fx, "Circle", "Shape", RelationKind::Reference));
}

TEST(ExtractorTest, JavaScriptFunctionsImportsAndRequire) {
    const std::string source =
        "import { helper } from './util';\n"
        "const fs = require('fs');\n"
        "\n"
        "export class Store extends Base {\n"
        "  load(path) {\n"
        "    return helper(path);\n"
        "  }\n"
        "}\n"
        "\n"
        "export const compute = (a, b) => a + b;\n"
        "\n"
        "function main() {\n"
        "  const s = new Store();\n"
        "  s.load('x');\n"
        "  compute(1, 2);\n"
        "}\n";
    FileExtraction fx = extract("web/store.js", source);

    ASSERT_EQ(fx.entities.size(), 5u);
    EXPECT_EQ(find_entity(fx, "Store")->kind, EntityKind::Class);
    EXPECT_EQ(find_entity(fx, "Store.load")->kind, EntityKind::Method);
    const Entity* compute = find_entity(fx, "compute");
    ASSERT_NE(compute, nullptr);
    EXPECT_EQ(compute->kind, EntityKind::Function);
    EXPECT_EQ(compute->parameters, (std::vector<std::string>{"a", "b"}));

    EXPECT_TRUE(has_relation(fx, "", "./util", RelationKind::Import));
    EXPECT_TRUE(has_relation(fx, "", "fs", RelationKind::Import));
    EXPECT_TRUE(has_relation(fx, "Store", "Base", RelationKind::Inherit));
    EXPECT_TRUE(has_relation(fx, "Store.load", "helper", RelationKind::Call));
    EXPECT_TRUE(has_relation(fx, "main", "Store", RelationKind::Call));
    EXPECT_TRUE(has_relation(fx, "main", "load", RelationKind::Call));
    EXPECT_TRUE(has_relation(fx, "main", "compute", RelationKind::Call));
    EXPECT_FALSE(has_relation(fx, "", "require", RelationKind::Call));
}

TEST(ExtractorTest, TypeScriptInterfacesNamespacesAndTypeRefs) {
    const std::string source =
        "import { Logger } from \"./logger\";\n"
        "\n"
        "export interface Shape {\n"
        "  area(): number;\n"
        "}\n"
        "\n"
        "export class Square implements Shape {\n"
        "  constructor(private side: number, private log: Logger) {}\n"
        "  area(): number {\n"
        "    this.log.info(\"area\");\n"
        "    return this.side * this.side;\n"
        "  }\n"
        "}\n"
        "\n"
        "namespace Geometry {\n"
        "  export function unit(): Square {\n"
        "    return new Square(1, new Logger());\n"
        "  }\n"
        "}\n";
    FileExtraction fx = extract("src/shapes.ts", source);

    EXPECT_EQ(find_entity(fx, "Shape")->kind, EntityKind::Class);
    EXPECT_EQ(find_entity(fx, "Square")->kind, EntityKind::Class);
    ASSERT_NE(find_entity(fx, "Square.area"), nullptr);
    const Entity* unit = find_entity(fx, "Geometry.unit");
    ASSERT_NE(unit, nullptr);
    EXPECT_EQ(unit->id, "src/shapes.ts::Geometry.unit");

    EXPECT_TRUE(has_relation(fx, "", "./logger", RelationKind::Import));
    EXPECT_TRUE(has_relation(fx, "Square", "Shape", RelationKind::Inherit));
    EXPECT_TRUE(has_relation(fx, "Square.constructor", "Logger", RelationKind::Reference));
    EXPECT_TRUE(has_relation(fx, "Square.area", "info", RelationKind::Call));
    EXPECT_TRUE(has_relation(fx, "Geometry.unit", "Square", RelationKind::Call));
    EXPECT_TRUE(has_relation(fx, "Geometry.unit", "Square", RelationKind::Reference));
    EXPECT_FALSE(has_relation(fx, "Square", "Shape", RelationKind::Reference));
}

TEST(ExtractorTest, CFunctionsThroughPointerDeclarators) {
    const std::string source =
        "#include <stdio.h>\n"
        "#include \"util/list.h\"\n"
        "\n"
        "struct node {\n"
        "    int value;\n"
        "    struct node *next;\n"
        "};\n"
        "\n"
        "static int sum(struct node *head) {\n"
        "    int total = 0;\n"
        "    while (head) { total += head->value; head = head->next; }\n"
        "    return total;\n"
        "}\n"
        "\n"
        "int *make(int n, list_t *out) {\n"
        "    list_push(out, n);\n"
        "    return 0;\n"
        "}\n";
    FileExtraction fx = extract("src/list.c", source);

    ASSERT_EQ(fx.entities.size(), 4u);
    EXPECT_EQ(find_entity(fx, "node")->kind, EntityKind::Class);
    EXPECT_EQ(find_entity(fx, "sum")->kind, EntityKind::Function);
    const Entity* make = find_entity(fx, "make");
    ASSERT_NE(make, nullptr);
    EXPECT_EQ(make->parameters, (std::vector<std::string>{"int n", "list_t *out"}));

    EXPECT_TRUE(has_relation(fx, "", "stdio.h", RelationKind::Import));
    EXPECT_TRUE(has_relation(fx, "", "util/list.h", RelationKind::Import));
    EXPECT_TRUE(has_relation(fx, "make", "list_push", RelationKind::Call));
    EXPECT_TRUE(has_relation(fx, "make", "list_t", RelationKind::Reference));
}

TEST(ExtractorTest, CppNamespacesAndOutOfLineMethods) {
    const std::string source =
        "#include \"shape.hpp\"\n"
        "\n"
        "namespace geo {\n"
        "\n"
        "class Circle : public Shape {\n"
        "public:\n"
        "    double area() const override { return radius_ * radius_ * kPi; }\n"
        "private:\n"
        "    double radius_;\n"
        "};\n"
        "\n"
        "double Circle::perimeter() const {\n"
        "    return 2 * kPi * radius_;\n"
        "}\n"
        "\n"
        "double total(const std::vector<Circle>& items) {\n"
        "    double sum = 0;\n"
        "    for (const auto& c : items) sum += c.area();\n"
        "    return sum + helpers::scale(sum);\n"
        "}\n"
        "\n"
        "}\n";
    FileExtraction fx = extract("geo/circle.cpp", source);

    const Entity* circle = find_entity(fx, "geo.Circle");
    ASSERT_NE(circle, nullptr);
    EXPECT_EQ(circle->kind, EntityKind::Class);
    EXPECT_EQ(circle->id, "geo/circle.cpp::geo.Circle");
    EXPECT_EQ(find_entity(fx, "geo.Circle.area")->kind, EntityKind::Method);
    const Entity* perimeter = find_entity(fx, "geo.Circle.perimeter");
    ASSERT_NE(perimeter, nullptr);
    EXPECT_EQ(perimeter->kind, EntityKind::Method);
    EXPECT_EQ(perimeter->name, "perimeter");
    EXPECT_EQ(find_entity(fx, "geo.total")->kind, EntityKind::Function);

    EXPECT_TRUE(has_relation(fx, "", "shape.hpp", RelationKind::Import));
    EXPECT_TRUE(has_relation(fx, "geo.Circle", "Shape", RelationKind::Inherit));
    EXPECT_TRUE(has_relation(fx, "geo.total", "area", RelationKind::Call));
    EXPECT_TRUE(has_relation(fx, "geo.total", "helpers.scale", RelationKind::Call));
    EXPECT_TRUE(has_relation(fx, "geo.total", "Circle", RelationKind::Reference));
}

TEST(ExtractorTest, CSharpNamespacesAndBaseLists) {
    const std::string source =
        "using System;\n"
        "using App.Services;\n"
        "\n"
        "namespace App.Models\n"
        "{\n"
        "    public class Order : Entity, IValidatable\n"
        "    {\n"
        "        public Order(int id) { Id = id; }\n"
        "\n"
        "        public bool Validate()\n"
        "        {\n"
        "            var v = new Validator();\n"
        "            return v.Check(this) && Helpers.IsPositive(Id);\n"
        "        }\n"
        "    }\n"
        "}\n";
    FileExtraction fx = extract("Models/Order.cs", source);

    ASSERT_NE(find_entity(fx, "App.Models.Order"), nullptr);
    EXPECT_EQ(find_entity(fx, "App.Models.Order.Validate")->kind, EntityKind::Method);
    ASSERT_NE(find_entity(fx, "App.Models.Order.Order"), nullptr);

    EXPECT_TRUE(has_relation(fx, "", "System", RelationKind::Import));
    EXPECT_TRUE(has_relation(fx, "", "App.Services", RelationKind::Import));
    EXPECT_TRUE(has_relation(fx, "App.Models.Order", "Entity", RelationKind::Inherit));
    EXPECT_TRUE(has_relation(fx, "App.Models.Order", "IValidatable", RelationKind::Inherit));
    EXPECT_TRUE(has_relation(fx, "App.Models.Order.Validate", "Validator", RelationKind::Call));
    EXPECT_TRUE(has_relation(fx, "App.Models.Order.Validate", "Check", RelationKind::Call));
    EXPECT_TRUE(has_relation(fx, "App.Models.Order.Validate", "IsPositive", RelationKind::Call));
}

TEST(ExtractorTest, PhpUseIncludeAndCalls) {
    const std::string source =
        "<?php\n"
        "namespace App\\Http;\n"
        "\n"
        "use App\\Models\\User;\n"
        "require_once __DIR__ . '/helpers.php';\n"
        "\n"
        "class UserController extends Controller implements Responds\n"
        "{\n"
        "    public function show($id)\n"
        "    {\n"
        "        $user = User::find($id);\n"
        "        $view = new View();\n"
        "        return $this->render($view, format_user($user));\n"
        "    }\n"
        "}\n"
        "\n"
        "function format_user($user) {\n"
        "    return strtoupper($user->name);\n"
        "}\n";
    FileExtraction fx = extract("app/Http/UserController.php", source);

    EXPECT_EQ(find_entity(fx, "UserController")->kind, EntityKind::Class);
    const Entity* show = find_entity(fx, "UserController.show");
    ASSERT_NE(show, nullptr);
    EXPECT_EQ(show->kind, EntityKind::Method);
    EXPECT_EQ(show->parameters, (std::vector<std::string>{"$id"}));
    EXPECT_EQ(find_entity(fx, "format_user")->kind, EntityKind::Function);

    EXPECT_TRUE(has_relation(fx, "", "App\\Models\\User", RelationKind::Import));
    EXPECT_TRUE(has_relation(fx, "", "helpers.php", RelationKind::Import));
    EXPECT_TRUE(has_relation(fx, "UserController", "Controller", RelationKind::Inherit));
    EXPECT_TRUE(has_relation(fx, "UserController", "Responds", RelationKind::Inherit));
    EXPECT_TRUE(has_relation(fx, "UserController.show", "find", RelationKind::Call));
    EXPECT_TRUE(has_relation(fx, "UserController.show", "View", RelationKind::Call));
    EXPECT_TRUE(has_relation(fx, "UserController.show", "render", RelationKind::Call));
    EXPECT_TRUE(has_relation(fx, "UserController.show", "format_user", RelationKind::Call));
    EXPECT_TRUE(has_relation(fx, "format_user", "strtoupper", RelationKind::Call));
}

TEST(ExtractorTest, FailuresAreReportedNotThrown) {
    CodeParser lenient;
    CodeParser strict(true);

    ParseResult unsupported = lenient.extract_source("notes.txt", "hello");
    EXPECT_FALSE(unsupported.ok());
    EXPECT_EQ(unsupported.failure.path, "notes.txt");
    EXPECT_EQ(unsupported.failure.reason, "unsupported language");

    const std::string broken = "def broken(:\n    pass\n";
    EXPECT_TRUE(lenient.extract_source("broken.py", broken).ok());
    ParseResult rejected = strict.extract_source("broken.py", broken);
    EXPECT_FALSE(rejected.ok());
    EXPECT_EQ(rejected.failure.path, "broken.py");

    ParseResult missing = lenient.extract_file("/nonexistent/dir/a.py", "a.py");
    EXPECT_FALSE(missing.ok());
    EXPECT_EQ(missing.failure.reason, "cannot read file");
}

TEST(ExtractorTest, NormalizeSymbolUnifiesSeparators) {
    EXPECT_EQ(extract::normalize_symbol("ns::Widget::draw"), "ns.Widget.draw");
    EXPECT_EQ(extract::normalize_symbol("ptr->call"), "ptr.call");
    EXPECT_EQ(extract::normalize_symbol("\\App\\Models\\User"), "App.Models.User");
    EXPECT_EQ(extract::normalize_symbol(" ::global "), "global");
}
