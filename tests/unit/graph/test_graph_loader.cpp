// test_graph_loader.cpp - JSON graph loading and graph construction
//
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "typescan/graph/graph_loader.hpp"
#include "typescan/graph/type_utils.hpp"
#include "typescan/match/type_scanner.hpp"
#include "typescan/test_support/graph_helpers.hpp"

using namespace typescan;
using test_support::load_graph;
using test_support::named;

namespace
{

constexpr const char * k_basic_graph = R"json(
{
  "modules": [
    {
      "name": "App",
      "namespaces": [
        {
          "name": "App.Services",
          "types": [
            { "name": "IRepository", "kind": "interface", "type_parameters": ["T"] },
            { "name": "IUserRepository", "kind": "interface", "interfaces": ["IRepository<User>"] },
            { "name": "User" },
            { "name": "UserRepository", "interfaces": ["IUserRepository", "System.IDisposable"] },
            { "name": "CachedUserRepository", "base": "UserRepository" },
            { "name": "Point", "kind": "struct" },
            { "name": "Color", "kind": "enum" },
            { "name": "Base", "abstract": true },
            {
              "name": "Outer",
              "nested": [
                { "name": "Hidden" },
                { "name": "Visible", "accessibility": "public" }
              ]
            },
            {
              "name": "WithCtor",
              "constructors": [ { "parameters": 2 }, { "static": true } ]
            }
          ]
        }
      ]
    }
  ]
}
)json";

}  // namespace

// ============================================================================
// Structure
// ============================================================================

TEST(GraphLoader, RegistersModulesAndCoreLibrary)
{
  auto loaded = load_graph(k_basic_graph);
  ASSERT_TRUE(loaded.success());
  const TypeGraph & graph = *loaded.graph;

  EXPECT_EQ(graph.module_count(), 2U);
  const Module * app = graph.find_module("App");
  const Module * core = graph.find_module(k_core_library_name);
  ASSERT_NE(app, nullptr);
  ASSERT_NE(core, nullptr);
  EXPECT_TRUE(core->is_core_library);

  // Every module references the core library
  ASSERT_EQ(app->references.size(), 1U);
  EXPECT_EQ(app->references.front(), core);

  EXPECT_NE(graph.find_type("System.Object"), nullptr);
  EXPECT_NE(graph.find_type("string"), nullptr);
  EXPECT_EQ(graph.find_type("int"), graph.find_type("System.Int32"));
  EXPECT_NE(graph.find_type("System.Nullable", 1), nullptr);
}

TEST(GraphLoader, CoreLibraryCanBeDisabled)
{
  GraphOptions options;
  options.core_library = false;
  auto loaded = load_graph(R"json({"modules": [{"name": "Solo", "types": [{"name": "A", "kind": "interface"}]}]})json", options);
  ASSERT_TRUE(loaded.success());
  EXPECT_EQ(loaded.graph->module_count(), 1U);
  EXPECT_EQ(loaded.graph->find_type("System.Object"), nullptr);
}

TEST(GraphLoader, DeclarationDefaults)
{
  auto loaded = load_graph(k_basic_graph);
  ASSERT_TRUE(loaded.success());
  const TypeGraph & graph = *loaded.graph;

  const TypeDecl * user = graph.find_type("App.Services.User");
  ASSERT_NE(user, nullptr);
  EXPECT_EQ(user->kind, TypeKind::Class);
  EXPECT_EQ(user->accessibility, Accessibility::Public);
  ASSERT_TRUE(user->base.has_value());
  EXPECT_EQ(user->base->decl, graph.find_type("System.Object"));

  const TypeDecl * point = graph.find_type("App.Services.Point");
  ASSERT_NE(point, nullptr);
  EXPECT_TRUE(point->is_sealed);
  EXPECT_TRUE(point->is_value_type());
  EXPECT_EQ(point->base->decl, graph.find_type("System.ValueType"));

  const TypeDecl * color = graph.find_type("App.Services.Color");
  ASSERT_NE(color, nullptr);
  EXPECT_EQ(color->base->decl, graph.find_type("System.Enum"));

  const TypeDecl * repo = graph.find_type("App.Services.IRepository", 1);
  ASSERT_NE(repo, nullptr);
  EXPECT_TRUE(repo->is_abstract);
  EXPECT_FALSE(repo->base.has_value());

  // Nested types default to private
  const TypeDecl * hidden = graph.find_type("App.Services.Outer.Hidden");
  const TypeDecl * visible = graph.find_type("App.Services.Outer.Visible");
  ASSERT_NE(hidden, nullptr);
  ASSERT_NE(visible, nullptr);
  EXPECT_EQ(hidden->accessibility, Accessibility::Private);
  EXPECT_EQ(visible->accessibility, Accessibility::Public);
  EXPECT_EQ(hidden->containing, graph.find_type("App.Services.Outer"));
  EXPECT_EQ(hidden->namespace_name(), "App.Services");
}

TEST(GraphLoader, ImplicitConstructors)
{
  auto loaded = load_graph(k_basic_graph);
  ASSERT_TRUE(loaded.success());
  const TypeGraph & graph = *loaded.graph;

  EXPECT_TRUE(has_public_parameterless_constructor(named(graph, "App.Services.User")));
  EXPECT_TRUE(has_public_parameterless_constructor(named(graph, "App.Services.Point")));

  // Explicit constructors suppress the implicit one
  EXPECT_FALSE(has_public_parameterless_constructor(named(graph, "App.Services.WithCtor")));

  // Abstract classes get a protected one
  const TypeDecl * base = graph.find_type("App.Services.Base");
  ASSERT_EQ(base->constructors.size(), 1U);
  EXPECT_EQ(base->constructors.front().accessibility, Accessibility::Protected);
  EXPECT_TRUE(base->constructors.front().is_implicit);

  EXPECT_FALSE(has_public_parameterless_constructor(named(graph, "string")));
}

TEST(GraphLoader, InterfacesAreFlattened)
{
  auto loaded = load_graph(k_basic_graph);
  ASSERT_TRUE(loaded.success());
  const TypeGraph & graph = *loaded.graph;

  const TypeDecl * repo = graph.find_type("App.Services.UserRepository");
  ASSERT_NE(repo, nullptr);
  EXPECT_EQ(
    to_string(repo->all_interfaces),
    "App.Services.IUserRepository, App.Services.IRepository<App.Services.User>, "
    "System.IDisposable");

  // Inherited through the base class
  const TypeDecl * cached = graph.find_type("App.Services.CachedUserRepository");
  ASSERT_NE(cached, nullptr);
  EXPECT_EQ(cached->all_interfaces.size(), 3U);
  EXPECT_TRUE(contains_type(cached->all_interfaces, named(graph, "System.IDisposable")));
}

TEST(GraphLoader, GenericEdgesAreSubstituted)
{
  auto loaded = load_graph(R"json(
    {
      "modules": [
        {
          "name": "App",
          "types": [
            { "name": "IHandler", "kind": "interface", "type_parameters": ["T"] },
            { "name": "IQuery", "kind": "interface", "type_parameters": ["TIn", "TOut"], "interfaces": ["IHandler<TIn>"] },
            { "name": "HandlerBase", "abstract": true, "type_parameters": ["T"], "interfaces": ["IQuery<T, string>"] },
            { "name": "IntHandler", "base": "HandlerBase<int>" }
          ]
        }
      ]
    }
  )json");
  ASSERT_TRUE(loaded.success());
  const TypeGraph & graph = *loaded.graph;

  const TypeRef int_handler = named(graph, "IntHandler");
  EXPECT_EQ(to_string(graph.all_interfaces_of(int_handler)), "IQuery<System.Int32, System.String>, IHandler<System.Int32>");

  auto base = graph.base_of(int_handler);
  ASSERT_TRUE(base.has_value());
  EXPECT_EQ(to_string(*base), "HandlerBase<System.Int32>");

  // The declared edge keeps its type parameters
  const TypeDecl * handler_base = graph.find_type("HandlerBase", 1);
  EXPECT_EQ(to_string(handler_base->all_interfaces), "IQuery<T, System.String>, IHandler<T>");
}

TEST(GraphLoader, NamespacesMergeAcrossDeclarations)
{
  auto loaded = load_graph(R"json(
    {
      "modules": [
        {
          "name": "App",
          "namespaces": [
            { "name": "App", "types": [ { "name": "First" } ] },
            { "name": "App", "namespaces": [ { "name": "Inner", "types": [ { "name": "Second" } ] } ] },
            { "name": "App", "types": [ { "name": "Third" } ] }
          ],
          "types": [ { "name": "Global" } ]
        }
      ]
    }
  )json");
  ASSERT_TRUE(loaded.success());
  const TypeGraph & graph = *loaded.graph;

  const auto types = types_of(*graph.find_module("App"));
  ASSERT_EQ(types.size(), 4U);
  EXPECT_EQ(types[0]->qualified_name, "App.First");
  EXPECT_EQ(types[1]->qualified_name, "App.Inner.Second");
  EXPECT_EQ(types[2]->qualified_name, "App.Third");
  EXPECT_EQ(types[3]->qualified_name, "Global");
}

TEST(GraphLoader, LoadsFromFile)
{
  const auto path = std::filesystem::temp_directory_path() / "typescan_graph_loader_test.json";
  {
    std::ofstream out(path);
    out << k_basic_graph;
  }

  auto loaded = load_graph_file(path);
  std::filesystem::remove(path);

  ASSERT_TRUE(loaded.success());
  EXPECT_NE(loaded.graph->find_type("App.Services.User"), nullptr);
}

// ============================================================================
// Diagnostics
// ============================================================================

TEST(GraphLoaderDiagnostics, MissingFile)
{
  auto loaded = load_graph_file("/nonexistent/typescan/graph.json");
  EXPECT_FALSE(loaded.success());
  EXPECT_TRUE(loaded.diagnostics.has_code("G000"));
}

TEST(GraphLoaderDiagnostics, MalformedJson)
{
  auto loaded = load_graph(R"json({"modules": [)json");
  EXPECT_FALSE(loaded.success());
  EXPECT_TRUE(loaded.diagnostics.has_code("G000"));
}

TEST(GraphLoaderDiagnostics, SchemaErrors)
{
  {
    auto loaded = load_graph(R"json([])json");
    EXPECT_FALSE(loaded.success());
    EXPECT_TRUE(loaded.diagnostics.has_code("G010"));
  }
  {
    auto loaded = load_graph(R"json({"assemblies": []})json");
    EXPECT_FALSE(loaded.success());
    EXPECT_TRUE(loaded.diagnostics.has_code("G010"));
  }
  {
    auto loaded = load_graph(R"json({"modules": [{"types": []}]})json");
    EXPECT_FALSE(loaded.success());
    ASSERT_TRUE(loaded.diagnostics.has_code("G010"));
    EXPECT_EQ(loaded.diagnostics.all().front().location.pointer, "/modules/0");
  }
  {
    auto loaded = load_graph(R"json({"modules": [{"name": "A", "types": [{"name": "X", "kind": "record"}]}]})json");
    EXPECT_FALSE(loaded.success());
    ASSERT_TRUE(loaded.diagnostics.has_code("G010"));
    EXPECT_EQ(loaded.diagnostics.all().front().location.pointer, "/modules/0/types/0/kind");
  }
  {
    auto loaded = load_graph(R"json({"modules": [{"name": "A", "types": [{"name": "X", "abstract": "yes"}]}]})json");
    EXPECT_FALSE(loaded.success());
    EXPECT_TRUE(loaded.diagnostics.has_code("G010"));
  }
  {
    auto loaded = load_graph(R"json({"modules": [{"name": "A", "types": [{"name": "X", "constructors": [{"parameters": -1}]}]}]})json");
    EXPECT_FALSE(loaded.success());
    EXPECT_TRUE(loaded.diagnostics.has_code("G010"));
  }
}

TEST(GraphLoaderDiagnostics, DuplicateModuleAndType)
{
  auto modules = load_graph(R"json({"modules": [{"name": "A"}, {"name": "A"}]})json");
  EXPECT_FALSE(modules.success());
  EXPECT_TRUE(modules.diagnostics.has_code("G001"));

  auto types = load_graph(R"json(
    {"modules": [
      {"name": "A", "types": [{"name": "X"}]},
      {"name": "B", "types": [{"name": "X"}]}
    ]}
  )json");
  EXPECT_FALSE(types.success());
  ASSERT_TRUE(types.diagnostics.has_code("G002"));
  EXPECT_EQ(types.diagnostics.all().front().notes.size(), 1U);

  // Same name with a different arity is a different declaration
  auto arity = load_graph(R"json(
    {"modules": [{"name": "A", "types": [{"name": "X"}, {"name": "X", "type_parameters": ["T"]}]}]}
  )json");
  EXPECT_TRUE(arity.success());
}

TEST(GraphLoaderDiagnostics, UnknownModuleReference)
{
  auto loaded = load_graph(R"json({"modules": [{"name": "A", "references": ["Missing"]}]})json");
  EXPECT_FALSE(loaded.success());
  EXPECT_TRUE(loaded.diagnostics.has_code("G003"));
}

TEST(GraphLoaderDiagnostics, UnresolvedTypeWithArityHint)
{
  auto loaded = load_graph(R"json(
    {"modules": [{"name": "A", "types": [
      {"name": "IHandler", "kind": "interface", "type_parameters": ["T"]},
      {"name": "H", "interfaces": ["IHandler"]}
    ]}]}
  )json");
  EXPECT_FALSE(loaded.success());
  ASSERT_TRUE(loaded.diagnostics.has_code("G004"));
  const Diagnostic & d = loaded.diagnostics.all().front();
  ASSERT_TRUE(d.help.has_value());
  EXPECT_EQ(*d.help, "did you mean 'IHandler<>'?");
  EXPECT_EQ(d.location.pointer, "/modules/0/types/1/interfaces/0");
}

TEST(GraphLoaderDiagnostics, InvalidEdges)
{
  // Type parameter as base
  auto param = load_graph(R"json({"modules": [{"name": "A", "types": [{"name": "G", "type_parameters": ["T"], "base": "T"}]}]})json");
  EXPECT_TRUE(param.diagnostics.has_code("G005"));

  // Open generic as interface
  auto open = load_graph(R"json({"modules": [{"name": "A", "types": [
    {"name": "I", "kind": "interface", "type_parameters": ["T"]},
    {"name": "C", "interfaces": ["I<>"]}]}]})json");
  EXPECT_TRUE(open.diagnostics.has_code("G005"));

  // Interface as base, sealed base, struct with a base
  auto iface_base = load_graph(R"json({"modules": [{"name": "A", "types": [
    {"name": "I", "kind": "interface"}, {"name": "C", "base": "I"}]}]})json");
  EXPECT_TRUE(iface_base.diagnostics.has_code("G006"));

  auto sealed_base = load_graph(R"json({"modules": [{"name": "A", "types": [{"name": "C", "base": "string"}]}]})json");
  EXPECT_TRUE(sealed_base.diagnostics.has_code("G006"));

  auto struct_base = load_graph(R"json({"modules": [{"name": "A", "types": [
    {"name": "B"}, {"name": "S", "kind": "struct", "base": "B"}]}]})json");
  EXPECT_TRUE(struct_base.diagnostics.has_code("G006"));

  // Class listed as interface, interface used as attribute
  auto not_iface = load_graph(R"json({"modules": [{"name": "A", "types": [
    {"name": "B"}, {"name": "C", "interfaces": ["B"]}]}]})json");
  EXPECT_TRUE(not_iface.diagnostics.has_code("G007"));

  auto attr = load_graph(R"json({"modules": [{"name": "A", "types": [
    {"name": "I", "kind": "interface"}, {"name": "C", "attributes": ["I"]}]}]})json");
  EXPECT_TRUE(attr.diagnostics.has_code("G008"));
}

TEST(GraphLoaderDiagnostics, InheritanceCycles)
{
  auto classes = load_graph(R"json({"modules": [{"name": "A", "types": [
    {"name": "X", "base": "Y"}, {"name": "Y", "base": "X"}]}]})json");
  EXPECT_FALSE(classes.success());
  EXPECT_TRUE(classes.diagnostics.has_code("G009"));

  auto interfaces = load_graph(R"json({"modules": [{"name": "A", "types": [
    {"name": "IX", "kind": "interface", "interfaces": ["IY"]},
    {"name": "IY", "kind": "interface", "interfaces": ["IX"]}]}]})json");
  EXPECT_FALSE(interfaces.success());
  EXPECT_TRUE(interfaces.diagnostics.has_code("G009"));
}

TEST(GraphLoader, ParseKeywords)
{
  EXPECT_EQ(parse_type_kind("interface"), TypeKind::Interface);
  EXPECT_EQ(parse_type_kind("delegate"), TypeKind::Delegate);
  EXPECT_FALSE(parse_type_kind("record").has_value());

  EXPECT_EQ(parse_accessibility("protected internal"), Accessibility::ProtectedInternal);
  EXPECT_EQ(parse_accessibility("private protected"), Accessibility::PrivateProtected);
  EXPECT_FALSE(parse_accessibility("friend").has_value());
}
