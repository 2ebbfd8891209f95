// test_query_engine.cpp - Query evaluation over a loaded graph
//
#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "typescan/match/query_engine.hpp"
#include "typescan/test_support/graph_helpers.hpp"

using namespace typescan;
using test_support::binding_strings;
using test_support::type_names;

namespace
{

constexpr const char * k_graph = R"json(
{
  "modules": [
    {
      "name": "App",
      "references": ["Plugins"],
      "namespaces": [
        {
          "name": "App",
          "types": [
            { "name": "Registry", "static": true },

            { "name": "ICommand", "kind": "interface" },
            { "name": "ICommandHandler", "kind": "interface", "type_parameters": ["T"] },
            { "name": "CreateUser", "interfaces": ["ICommand"] },
            { "name": "DeleteUser", "interfaces": ["ICommand"] },
            { "name": "NotACommand" },
            { "name": "CreateUserHandler", "interfaces": ["ICommandHandler<CreateUser>"] },
            { "name": "AbstractHandler", "abstract": true, "interfaces": ["ICommandHandler<CreateUser>"] },
            { "name": "CommandHandlerDecorator", "type_parameters": ["T"], "interfaces": ["ICommandHandler<T>"] },
            { "name": "BadHandler", "interfaces": ["ICommandHandler<NotACommand>"] },
            { "name": "DeleteUserHandler", "interfaces": ["ICommandHandler<DeleteUser>"] },
            {
              "name": "CompositeHandler",
              "interfaces": ["ICommandHandler<CreateUser>", "ICommandHandler<DeleteUser>"]
            },

            { "name": "MarkerAttribute", "base": "System.Attribute" },
            { "name": "IgnoreAttribute", "base": "System.Attribute" },
            { "name": "IService", "kind": "interface" },
            { "name": "ServiceFirst", "interfaces": ["IService"], "attributes": ["MarkerAttribute"] },
            { "name": "ServiceSecond", "interfaces": ["IService"] },
            {
              "name": "ServiceThird",
              "interfaces": ["IService"],
              "attributes": ["MarkerAttribute", "IgnoreAttribute"]
            },
            { "name": "DerivedFirst", "base": "ServiceFirst" },
            {
              "name": "Container",
              "nested": [
                { "name": "PrivateService", "interfaces": ["IService"] },
                { "name": "PublicService", "accessibility": "public", "interfaces": ["IService"] }
              ]
            },

            { "name": "StaticSetup", "static": true },
            { "name": "InstanceSetup" }
          ]
        }
      ]
    },
    {
      "name": "Plugins",
      "namespaces": [
        {
          "name": "Plugins",
          "types": [
            { "name": "PublicPlugin", "interfaces": ["App.IService"] },
            { "name": "InternalPlugin", "accessibility": "internal", "interfaces": ["App.IService"] }
          ]
        }
      ]
    }
  ]
}
)json";

constexpr const char * k_queries = R"yaml(
queries:
  - name: handlers
    declared_in: App.Registry
    handler:
      name: Register
      type_parameters:
        - name: THandler
          constraints: [class, "ICommandHandler<TCommand>"]
        - name: TCommand
          constraints: [ICommand]

  - name: seeded_handlers
    declared_in: App.Registry
    assignable_to: ICommandHandler<>
    handler:
      name: Register
      type_parameters:
        - name: THandler
          constraints: ["ICommandHandler<TCommand>"]
        - TCommand

  - name: services
    declared_in: App.Registry
    assignable_to: IService

  - name: not_services
    declared_in: App.Registry
    exclude_assignable_to: IService
    type_name_filter: "App.*"

  - name: marked
    declared_in: App.Registry
    attribute_filter: MarkerAttribute

  - name: marked_not_ignored
    declared_in: App.Registry
    attribute_filter: MarkerAttribute
    exclude_by_attribute: IgnoreAttribute

  - name: first_or_second
    declared_in: App.Registry
    type_name_filter: "*First*,*Second*"

  - name: first_or_second_not_derived
    declared_in: App.Registry
    type_name_filter: "*First*,*Second*"
    exclude_by_type_name: "*Derived*"

  - name: setups
    declared_in: App.Registry
    type_name_filter: "*Setup"

  - name: setup_methods
    declared_in: App.Registry
    type_name_filter: "*Setup"
    handler:
      name: Configure
      kind: type_method

  - name: container_services
    declared_in: App.Container
    assignable_to: IService
    type_name_filter: "App.Container.*"

  - name: all_module_services
    declared_in: App.Registry
    assembly_name_filter: "*"
    assignable_to: IService

  - name: plugin_services
    declared_in: App.Registry
    assembly_of_type: Plugins.PublicPlugin
    assignable_to: IService
)yaml";

class QueryEngineTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    auto loaded = test_support::load_graph(k_graph);
    ASSERT_TRUE(loaded.success());
    graph_ = std::move(loaded.graph);

    queries_ = test_support::build_queries(*graph_, k_queries);
    ASSERT_TRUE(queries_.config_loaded);
    ASSERT_FALSE(queries_.diags.has_errors());
  }

  [[nodiscard]] std::vector<MatchRecord> run(const char * name) const
  {
    const Query * query = queries_.find(name);
    EXPECT_NE(query, nullptr) << name;
    if (!query) return {};
    return test_support::run(*graph_, *query);
  }

  std::optional<TypeGraph> graph_;
  test_support::TestQueries queries_;
};

using Strings = std::vector<std::string>;

}  // namespace

// ============================================================================
// Handler queries
// ============================================================================

TEST_F(QueryEngineTest, HandlerBindsEveryCommandHandler)
{
  const auto records = run("handlers");

  // AbstractHandler, CommandHandlerDecorator<T> and BadHandler are excluded
  EXPECT_EQ(
    type_names(records),
    (Strings{"App.CreateUserHandler", "App.DeleteUserHandler", "App.CompositeHandler",
             "App.CompositeHandler"}));
  EXPECT_EQ(
    binding_strings(records),
    (Strings{"App.CreateUserHandler, App.CreateUser", "App.DeleteUserHandler, App.DeleteUser",
             "App.CompositeHandler, App.CreateUser", "App.CompositeHandler, App.DeleteUser"}));

  for (const auto & record : records) {
    EXPECT_TRUE(record.generalizations.empty());
  }
}

TEST_F(QueryEngineTest, AssignableTargetSeedsEachBinding)
{
  const auto records = run("seeded_handlers");

  // Without the ICommand constraint BadHandler is accepted
  ASSERT_EQ(records.size(), 5U);
  EXPECT_EQ(records[1].type->display_name(), "App.BadHandler");

  const MatchRecord & create = records[3];
  const MatchRecord & remove = records[4];
  EXPECT_EQ(create.type->display_name(), "App.CompositeHandler");
  ASSERT_EQ(create.generalizations.size(), 1U);
  EXPECT_EQ(to_string(create.generalizations.front()), "App.ICommandHandler<App.CreateUser>");
  ASSERT_EQ(remove.generalizations.size(), 1U);
  EXPECT_EQ(to_string(remove.generalizations.front()), "App.ICommandHandler<App.DeleteUser>");
}

TEST_F(QueryEngineTest, StaticTypesOnlyForTypeMethods)
{
  EXPECT_EQ(type_names(run("setups")), Strings{"App.InstanceSetup"});

  const auto methods = run("setup_methods");
  EXPECT_EQ(type_names(methods), (Strings{"App.StaticSetup", "App.InstanceSetup"}));
  for (const auto & record : methods) {
    ASSERT_TRUE(record.binding.has_value());
    EXPECT_EQ(record.binding->size(), 0U);
  }
}

// ============================================================================
// Filters
// ============================================================================

TEST_F(QueryEngineTest, AssignableToKeepsGeneralizations)
{
  const auto records = run("services");

  // Interfaces, private nested types and other modules are not candidates
  EXPECT_EQ(
    type_names(records),
    (Strings{"App.ServiceFirst", "App.ServiceSecond", "App.ServiceThird", "App.DerivedFirst",
             "App.Container.PublicService"}));
  for (const auto & record : records) {
    EXPECT_FALSE(record.binding.has_value());
    EXPECT_EQ(to_string(record.generalizations), "App.IService");
  }
}

TEST_F(QueryEngineTest, ExcludeAssignableTo)
{
  const auto names = type_names(run("not_services"));
  EXPECT_EQ(std::count(names.begin(), names.end(), "App.ServiceFirst"), 0);
  EXPECT_EQ(std::count(names.begin(), names.end(), "App.DerivedFirst"), 0);
  EXPECT_EQ(std::count(names.begin(), names.end(), "App.CreateUser"), 1);
  EXPECT_EQ(std::count(names.begin(), names.end(), "App.InstanceSetup"), 1);
}

TEST_F(QueryEngineTest, AttributeFiltersAreNotInherited)
{
  EXPECT_EQ(type_names(run("marked")), (Strings{"App.ServiceFirst", "App.ServiceThird"}));
  EXPECT_EQ(type_names(run("marked_not_ignored")), Strings{"App.ServiceFirst"});
}

TEST_F(QueryEngineTest, TypeNameAlternatives)
{
  EXPECT_EQ(
    type_names(run("first_or_second")),
    (Strings{"App.ServiceFirst", "App.ServiceSecond", "App.DerivedFirst"}));
  EXPECT_EQ(
    type_names(run("first_or_second_not_derived")),
    (Strings{"App.ServiceFirst", "App.ServiceSecond"}));
}

// ============================================================================
// Visibility and module selection
// ============================================================================

TEST_F(QueryEngineTest, PrivateNestedTypesVisibleFromContainer)
{
  EXPECT_EQ(
    type_names(run("container_services")),
    (Strings{"App.Container.PrivateService", "App.Container.PublicService"}));
}

TEST_F(QueryEngineTest, InternalTypesOfOtherModulesAreHidden)
{
  const auto names = type_names(run("all_module_services"));
  EXPECT_EQ(std::count(names.begin(), names.end(), "Plugins.PublicPlugin"), 1);
  EXPECT_EQ(std::count(names.begin(), names.end(), "Plugins.InternalPlugin"), 0);
  EXPECT_EQ(names.back(), "Plugins.PublicPlugin");

  EXPECT_EQ(type_names(run("plugin_services")), Strings{"Plugins.PublicPlugin"});
}

// ============================================================================
// Evaluation
// ============================================================================

TEST_F(QueryEngineTest, EvaluationIsDeterministic)
{
  EXPECT_EQ(binding_strings(run("handlers")), binding_strings(run("handlers")));
  EXPECT_EQ(type_names(run("services")), type_names(run("services")));
}

TEST_F(QueryEngineTest, FilteringByMatchedNamesIsIdempotent)
{
  const auto first = type_names(run("services"));

  const Query * services = queries_.find("services");
  ASSERT_NE(services, nullptr);
  Query narrowed = *services;
  std::string pattern;
  for (const auto & name : first) {
    if (!pattern.empty()) pattern += ',';
    pattern += name;
  }
  narrowed.type_name_filter = pattern;

  EXPECT_EQ(type_names(test_support::run(*graph_, narrowed)), first);
}

TEST_F(QueryEngineTest, StreamYieldsRecordsOnDemand)
{
  const Query * query = queries_.find("handlers");
  ASSERT_NE(query, nullptr);

  const QueryEngine engine(*graph_);
  MatchStream stream = engine.evaluate(*query);

  auto first = stream.next();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->type->display_name(), "App.CreateUserHandler");

  auto rest = collect(stream);
  EXPECT_EQ(rest.size(), 3U);
  EXPECT_FALSE(stream.next().has_value());
}

TEST_F(QueryEngineTest, UnconstrainedHandlerParameterRejectsEverything)
{
  Query query;
  query.name = "unbound";
  query.declared_in = graph_->find_type("App.Registry");

  HandlerSignature handler;
  GenericParameter first;
  first.ordinal = 0;
  first.name = "T";
  GenericParameter second;
  second.ordinal = 1;
  second.name = "TOther";
  handler.parameters = {first, second};
  query.handler = handler;

  EXPECT_TRUE(test_support::run(*graph_, query).empty());
}

TEST_F(QueryEngineTest, RemovingNonMatchingTypeKeepsMatches)
{
  std::string reduced = k_graph;
  const std::string bad_handler =
    R"({ "name": "BadHandler", "interfaces": ["ICommandHandler<NotACommand>"] },)";
  const auto pos = reduced.find(bad_handler);
  ASSERT_NE(pos, std::string::npos);
  reduced.erase(pos, bad_handler.size());

  auto loaded = test_support::load_graph(reduced);
  ASSERT_TRUE(loaded.success());
  EXPECT_EQ(loaded.graph->find_type("App.BadHandler"), nullptr);

  auto queries = test_support::build_queries(*loaded.graph, k_queries);
  ASSERT_FALSE(queries.diags.has_errors());
  const Query * handlers = queries.find("handlers");
  ASSERT_NE(handlers, nullptr);

  EXPECT_EQ(
    binding_strings(test_support::run(*loaded.graph, *handlers)), binding_strings(run("handlers")));
}

// ============================================================================
// Command handler registration
// ============================================================================

TEST(QueryEngineScenario, OpenCommandHandlerRegistration)
{
  auto loaded = test_support::load_graph(R"json(
{
  "modules": [
    {
      "name": "App",
      "namespaces": [
        {
          "name": "App",
          "types": [
            { "name": "Startup", "static": true },
            { "name": "ICommandHandler", "kind": "interface", "type_parameters": ["TCommand"] },
            { "name": "SpecificHandler1", "interfaces": ["ICommandHandler<string>"] },
            { "name": "SpecificHandler2", "interfaces": ["ICommandHandler<long>"] },
            {
              "name": "CommandHandlerDecorator",
              "type_parameters": ["TCommand"],
              "interfaces": ["ICommandHandler<TCommand>"]
            }
          ]
        }
      ]
    }
  ]
}
)json");
  ASSERT_TRUE(loaded.success());
  const TypeGraph & graph = *loaded.graph;

  auto queries = test_support::build_queries(graph, R"yaml(
queries:
  - name: handlers
    declared_in: App.Startup
    assignable_to: ICommandHandler<>
    handler:
      name: AddHandler
      type_parameters:
        - name: THandler
          constraints: [class, "ICommandHandler<TCommand>"]
        - TCommand
)yaml");
  ASSERT_FALSE(queries.diags.has_errors());
  ASSERT_EQ(queries.queries.size(), 1U);

  const auto records = test_support::run(graph, queries.queries.front());
  EXPECT_EQ(type_names(records), (Strings{"App.SpecificHandler1", "App.SpecificHandler2"}));
  EXPECT_EQ(
    binding_strings(records),
    (Strings{"App.SpecificHandler1, System.String", "App.SpecificHandler2, System.Int64"}));
}
